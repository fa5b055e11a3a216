#include "rules.hpp"

#include <map>
#include <string>
#include <vector>

#include "internal/detection/rule_support.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/text.hpp"

namespace fraudit::detection {

using fraudit::observability::IntField;

namespace {

constexpr double kAddressConfidence = 0.85;

class EmployeeVendorRule final : public DetectionRule {
 public:
  std::string_view Name() const override {
    return "employee_vendor";
  }
  std::string_view DisplayName() const override {
    return "Employee-vendor matches";
  }

  std::vector<alerts::AlertRequest> Run(const RuleContext& context) const override {
    const auto employees = context.dataset.ListEntities(model::EntityKind::kEmployee);
    const auto vendors   = context.dataset.ListEntities(model::EntityKind::kVendor);
    const auto payments  = SummarizeVendorPayments(context.dataset.ListPayments());
    const auto agencies  = IndexById(context.dataset.ListEntities(model::EntityKind::kAgency));

    std::vector<alerts::AlertRequest> requests;
    if (employees.empty() || vendors.empty()) {
      return requests;
    }

    ByName(context, employees, vendors, payments, agencies, requests);
    ByAddress(context, employees, vendors, payments, agencies, requests);
    return requests;
  }

 private:
  static std::string AgencyName(const EntityIndex& agencies, const model::CanonicalEntity& employee) {
    if (employee.attributes.agency_id) {
      if (const auto* agency = Lookup(agencies, *employee.attributes.agency_id)) {
        return agency->display_name;
      }
    }
    return "Unknown";
  }

  static void FillEmployee(evidence::EmployeeVendorEvidence* ev, const model::CanonicalEntity& employee,
                           const model::CanonicalEntity& vendor, const PaymentSummary& summary) {
    *ev->mutable_employee() = MakeRef(employee);
    ev->set_employee_title(employee.attributes.job_title.value_or(""));
    ev->set_employee_agency(employee.attributes.agency_id.value_or(0));
    *ev->mutable_vendor() = MakeRef(vendor);
    ev->set_payment_count(summary.count);
    ev->set_total_payments(summary.total);
  }

  static void ByName(const RuleContext& context, const std::vector<model::CanonicalEntity>& employees,
                     const std::vector<model::CanonicalEntity>& vendors,
                     const std::unordered_map<model::EntityId, PaymentSummary>& payments, const EntityIndex& agencies,
                     std::vector<alerts::AlertRequest>& requests) {
    const double threshold = context.thresholds.Get("employee_vendor_name_similarity", 0.90);
    const auto   report    = context.matcher.Match(employees, &vendors, threshold, context.max_candidates_per_item);

    const auto employee_index = IndexById(employees);
    const auto vendor_index   = IndexById(vendors);

    std::vector<model::RelationshipEdge> edges;
    for (const auto& pair : report.pairs) {
      const auto* employee = Lookup(employee_index, pair.id_1);
      const auto* vendor   = Lookup(vendor_index, pair.id_2);
      if (!employee || !vendor) {
        continue;
      }

      evidence::RelationshipEvidence rel;
      rel.set_method(std::string(model::relation::kName));
      rel.set_name_1(employee->display_name);
      rel.set_name_2(vendor->display_name);
      rel.set_similarity(Round(pair.score, 4));
      edges.push_back(MakeEdge(model::EntityKind::kEmployee, employee->id, model::EntityKind::kVendor, vendor->id, model::relation::kName,
                               pair.score, rel));

      auto paid = payments.find(vendor->id);
      if (paid == payments.end() || paid->second.total <= 0.0) {
        continue;
      }
      const auto& summary = paid->second;

      alerts::AlertRequest request;
      request.alert_type = "employee_vendor_match";
      request.severity   = model::Severity::kMedium;
      if (pair.score >= 0.98 || (pair.score >= 0.95 && summary.total >= 100000)) {
        request.severity = model::Severity::kHigh;
      }
      request.entity_kind = model::EntityKind::kEmployee;
      request.entity_id   = employee->id;
      request.title       = "Employee-vendor name match: " + employee->display_name;
      request.description = "Employee '" + employee->display_name + "' (" + employee->attributes.job_title.value_or("Unknown") +
                            " at " + AgencyName(agencies, *employee) + ") has " + Percent(pair.score) +
                            " name similarity with vendor '" + vendor->display_name + "'. Vendor has received " +
                            util::FormatMoney(summary.total) + " in payments.";

      auto* ev = request.evidence.mutable_employee_vendor();
      FillEmployee(ev, *employee, *vendor, summary);
      ev->set_match_type(std::string(model::relation::kName));
      ev->set_similarity(Round(pair.score, 4));
      requests.push_back(std::move(request));
    }

    auto summary = context.relationships.UpsertAll(edges);
    FRAUDIT_LOG_DEBUG("employee-vendor name matches", {IntField("pairs", static_cast<std::int64_t>(report.pairs.size())),
                                                       IntField("inserted", static_cast<std::int64_t>(summary.inserted))});
  }

  static void ByAddress(const RuleContext& context, const std::vector<model::CanonicalEntity>& employees,
                        const std::vector<model::CanonicalEntity>& vendors,
                        const std::unordered_map<model::EntityId, PaymentSummary>& payments, const EntityIndex& agencies,
                        std::vector<alerts::AlertRequest>& requests) {
    std::map<std::string, std::vector<const model::CanonicalEntity*>> by_address;
    for (const auto& employee : employees) {
      if (employee.normalized_address) {
        by_address[*employee.normalized_address].push_back(&employee);
      }
    }
    if (by_address.empty()) {
      return;
    }

    std::vector<model::RelationshipEdge> edges;
    for (const auto& vendor : vendors) {
      if (!vendor.normalized_address) {
        continue;
      }
      auto it = by_address.find(*vendor.normalized_address);
      if (it == by_address.end()) {
        continue;
      }

      for (const auto* employee : it->second) {
        evidence::RelationshipEvidence rel;
        rel.set_method(std::string(model::relation::kAddress));
        rel.set_name_1(employee->display_name);
        rel.set_name_2(vendor.display_name);
        rel.set_address(it->first);
        edges.push_back(MakeEdge(model::EntityKind::kEmployee, employee->id, model::EntityKind::kVendor, vendor.id,
                                 model::relation::kAddress, kAddressConfidence, rel));

        auto paid = payments.find(vendor.id);
        if (paid == payments.end() || paid->second.total <= 0.0) {
          continue;
        }
        const auto& summary = paid->second;

        alerts::AlertRequest request;
        request.alert_type  = "employee_vendor_address_match";
        request.severity    = model::Severity::kHigh;
        request.entity_kind = model::EntityKind::kEmployee;
        request.entity_id   = employee->id;
        request.title       = "Employee-vendor address match: " + employee->display_name;
        request.description = "Employee '" + employee->display_name + "' at " + AgencyName(agencies, *employee) +
                              " shares address with vendor '" + vendor.display_name + "' (" + it->first + "). Vendor has received " +
                              util::FormatMoney(summary.total) + " in " + std::to_string(summary.count) + " payments.";

        auto* ev = request.evidence.mutable_employee_vendor();
        FillEmployee(ev, *employee, vendor, summary);
        ev->set_match_type(std::string(model::relation::kAddress));
        ev->set_similarity(kAddressConfidence);
        ev->set_shared_address(it->first);
        requests.push_back(std::move(request));
      }
    }

    context.relationships.UpsertAll(edges);
  }
};

} // namespace

std::unique_ptr<DetectionRule> MakeEmployeeVendorRule() {
  return std::make_unique<EmployeeVendorRule>();
}

} // namespace fraudit::detection
