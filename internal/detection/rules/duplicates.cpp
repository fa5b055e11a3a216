#include "rules.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "internal/detection/rule_support.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/text.hpp"

namespace fraudit::detection {

using fraudit::observability::IntField;

namespace {

constexpr double kExactMinAmount   = 100.0;
constexpr double kRelatedMinAmount = 1000.0;
constexpr int    kMaxWindowDays    = 3650;

using PaymentList = std::vector<const model::PaymentRecord*>;

// Amounts compare to the cent.
std::int64_t Cents(double amount) {
  return std::llround(amount * 100.0);
}

class DuplicatesRule final : public DetectionRule {
 public:
  std::string_view Name() const override {
    return "duplicates";
  }
  std::string_view DisplayName() const override {
    return "Duplicate payments";
  }

  std::vector<alerts::AlertRequest> Run(const RuleContext& context) const override {
    const auto window   = static_cast<int>(context.thresholds.GetCount("duplicate_payment_window_days", 30, kMaxWindowDays));
    const auto payments = context.dataset.ListPayments();
    const auto vendors  = IndexById(context.dataset.ListEntities(model::EntityKind::kVendor));
    const auto agencies = IndexById(context.dataset.ListEntities(model::EntityKind::kAgency));

    std::vector<alerts::AlertRequest> requests;
    Exact(payments, vendors, agencies, requests);
    Near(context, payments, window, vendors, agencies, requests);
    RelatedVendors(context, payments, window, vendors, agencies, requests);

    FRAUDIT_LOG_DEBUG("duplicate payment screen", {IntField("payments", static_cast<std::int64_t>(payments.size())),
                                                   IntField("alerts", static_cast<std::int64_t>(requests.size()))});
    return requests;
  }

 private:
  static void AddLines(evidence::DuplicatePaymentEvidence* ev, const PaymentList& list, const EntityIndex& agencies) {
    for (const auto* payment : list) {
      auto* line = ev->add_payments();
      line->set_id(payment->id);
      const auto* agency      = Lookup(agencies, payment->agency_id);
      *line->mutable_agency() = agency ? MakeRef(*agency) : MakeRef(payment->agency_id);
      line->set_date(util::FormatDate(payment->payment_date));
      line->set_amount(payment->amount);
    }
  }

  // Same vendor, same amount, same day.
  static void Exact(const std::vector<model::PaymentRecord>& payments, const EntityIndex& vendors, const EntityIndex& agencies,
                    std::vector<alerts::AlertRequest>& requests) {
    std::map<std::tuple<model::EntityId, std::int64_t, util::Date>, PaymentList> groups;
    for (const auto& payment : payments) {
      if (payment.vendor_id == 0 || payment.amount <= kExactMinAmount) {
        continue;
      }
      groups[{payment.vendor_id, Cents(payment.amount), payment.payment_date}].push_back(&payment);
    }

    for (const auto& [key, group] : groups) {
      if (group.size() < 2) {
        continue;
      }
      const auto* vendor = Lookup(vendors, std::get<0>(key));
      if (!vendor) {
        continue;
      }

      const double amount = group.front()->amount;
      const double total  = amount * static_cast<double>(group.size());
      const auto   date   = util::FormatDate(std::get<2>(key));

      alerts::AlertRequest request;
      request.alert_type = "duplicate_payment";
      request.severity   = model::Severity::kLow;
      if (group.size() >= 3 || amount >= 10000) {
        request.severity = model::Severity::kMedium;
      }
      if (group.size() >= 5 || amount >= 50000) {
        request.severity = model::Severity::kHigh;
      }
      request.entity_kind = model::EntityKind::kVendor;
      request.entity_id   = vendor->id;
      request.title       = "Exact duplicate payments: " + vendor->display_name;
      request.description = "Found " + std::to_string(group.size()) + " identical payments of " + util::FormatMoney(amount) + " to '" +
                            vendor->display_name + "' on " + date + ". Total duplicate amount: " + util::FormatMoney(total) + ".";

      auto* ev = request.evidence.mutable_duplicate_payment();
      *ev->mutable_vendor() = MakeRef(*vendor);
      ev->set_amount(amount);
      ev->set_payment_count(static_cast<std::uint32_t>(group.size()));
      ev->set_total_amount(total);
      ev->set_first_date(date);
      ev->set_last_date(date);
      AddLines(ev, group, agencies);
      requests.push_back(std::move(request));
    }
  }

  // Same vendor and amount, consecutive payments no more than window days apart.
  static void Near(const RuleContext& context, const std::vector<model::PaymentRecord>& payments, int window, const EntityIndex& vendors,
                   const EntityIndex& agencies, std::vector<alerts::AlertRequest>& requests) {
    const double min_amount = context.thresholds.Get("near_duplicate_min_amount", 5000);

    std::map<std::pair<model::EntityId, std::int64_t>, PaymentList> groups;
    for (const auto& payment : payments) {
      if (payment.vendor_id == 0 || payment.amount < min_amount) {
        continue;
      }
      groups[{payment.vendor_id, Cents(payment.amount)}].push_back(&payment);
    }

    for (auto& [key, group] : groups) {
      if (group.size() < 2) {
        continue;
      }
      const auto* vendor = Lookup(vendors, key.first);
      if (!vendor) {
        continue;
      }
      std::stable_sort(group.begin(), group.end(),
                       [](const auto* a, const auto* b) { return a->payment_date < b->payment_date; });

      PaymentList cluster{group.front()};
      for (std::size_t i = 1; i <= group.size(); ++i) {
        if (i < group.size() && util::DaysBetween(group[i - 1]->payment_date, group[i]->payment_date) <= window) {
          cluster.push_back(group[i]);
          continue;
        }
        EmitNear(*vendor, cluster, window, agencies, requests);
        if (i < group.size()) {
          cluster = {group[i]};
        }
      }
    }
  }

  static void EmitNear(const model::CanonicalEntity& vendor, const PaymentList& cluster, int window, const EntityIndex& agencies,
                       std::vector<alerts::AlertRequest>& requests) {
    if (cluster.size() < 2) {
      return;
    }
    // a single date is an exact duplicate, reported above
    const auto& first = cluster.front()->payment_date;
    const auto& last  = cluster.back()->payment_date;
    if (first == last) {
      return;
    }

    const double amount = cluster.front()->amount;
    const double total  = amount * static_cast<double>(cluster.size());
    const auto   from   = util::FormatDate(first);
    const auto   to     = util::FormatDate(last);

    alerts::AlertRequest request;
    request.alert_type = "near_duplicate_payment";
    request.severity   = model::Severity::kLow;
    if (cluster.size() >= 4) {
      request.severity = model::Severity::kMedium;
    }
    if (cluster.size() >= 6 || amount >= 25000) {
      request.severity = model::Severity::kHigh;
    }
    request.entity_kind = model::EntityKind::kVendor;
    request.entity_id   = vendor.id;
    request.title       = "Potential duplicate payments: " + vendor.display_name;
    request.description = "Found " + std::to_string(cluster.size()) + " payments of " + util::FormatMoney(amount) + " to '" +
                          vendor.display_name + "' within " + std::to_string(window) + " days (" + from + " to " + to +
                          "). Total: " + util::FormatMoney(total) + ".";

    auto* ev = request.evidence.mutable_duplicate_payment();
    *ev->mutable_vendor() = MakeRef(vendor);
    ev->set_amount(amount);
    ev->set_payment_count(static_cast<std::uint32_t>(cluster.size()));
    ev->set_total_amount(total);
    ev->set_first_date(from);
    ev->set_last_date(to);
    ev->set_window_days(static_cast<std::uint32_t>(window));
    AddLines(ev, cluster, agencies);
    requests.push_back(std::move(request));
  }

  // Same amount paid to two vendors recorded at one address, within the window.
  static void RelatedVendors(const RuleContext& context, const std::vector<model::PaymentRecord>& payments, int window,
                             const EntityIndex& vendors, const EntityIndex& agencies, std::vector<alerts::AlertRequest>& requests) {
    const auto pairs = context.relationships.QueryPairs(std::string(model::relation::kSameAddress));
    if (pairs.empty()) {
      return;
    }

    std::map<model::EntityId, PaymentList> by_vendor;
    for (const auto& payment : payments) {
      if (payment.vendor_id != 0 && payment.amount >= kRelatedMinAmount) {
        by_vendor[payment.vendor_id].push_back(&payment);
      }
    }

    for (const auto& edge : pairs) {
      if (edge.kind_1 != model::EntityKind::kVendor || edge.kind_2 != model::EntityKind::kVendor) {
        continue;
      }
      const auto* vendor_1 = Lookup(vendors, edge.id_1);
      const auto* vendor_2 = Lookup(vendors, edge.id_2);
      auto        paid_1   = by_vendor.find(edge.id_1);
      auto        paid_2   = by_vendor.find(edge.id_2);
      if (!vendor_1 || !vendor_2 || paid_1 == by_vendor.end() || paid_2 == by_vendor.end()) {
        continue;
      }

      std::multimap<std::int64_t, const model::PaymentRecord*> amounts_1;
      for (const auto* payment : paid_1->second) {
        amounts_1.emplace(Cents(payment->amount), payment);
      }

      std::set<std::int64_t> matched;
      PaymentList            lines;
      for (const auto* p2 : paid_2->second) {
        auto [begin, end] = amounts_1.equal_range(Cents(p2->amount));
        for (auto it = begin; it != end; ++it) {
          const auto* p1 = it->second;
          if (std::abs(util::DaysBetween(p1->payment_date, p2->payment_date)) > window) {
            continue;
          }
          if (matched.insert(it->first).second) {
            lines.push_back(p1);
            lines.push_back(p2);
          }
          break;
        }
      }
      if (matched.empty()) {
        continue;
      }

      std::vector<std::string> amount_text;
      for (const auto cents : matched) {
        amount_text.push_back(util::FormatMoney(static_cast<double>(cents) / 100.0));
      }
      const auto address = AddressOf(*vendor_1);

      alerts::AlertRequest request;
      request.alert_type  = "related_vendor_duplicate";
      request.severity    = model::Severity::kMedium;
      request.entity_kind = model::EntityKind::kVendor;
      request.entity_id   = vendor_1->id;
      request.title       = "Same payment to related vendors";
      request.description = "Found " + JoinStrings(amount_text, ", ") + " paid to both '" + vendor_1->display_name + "' and '" +
                            vendor_2->display_name + "' (same address: " + address +
                            "). This may indicate duplicate payments or fraudulent vendors.";

      auto* ev = request.evidence.mutable_related_vendor_duplicate();
      *ev->mutable_vendor_1() = MakeRef(*vendor_1);
      *ev->mutable_vendor_2() = MakeRef(*vendor_2);
      ev->set_shared_address(address);
      for (const auto cents : matched) {
        ev->add_amounts(static_cast<double>(cents) / 100.0);
      }
      for (const auto* payment : lines) {
        auto* line = ev->add_payments();
        line->set_id(payment->id);
        const auto* agency      = Lookup(agencies, payment->agency_id);
        *line->mutable_agency() = agency ? MakeRef(*agency) : MakeRef(payment->agency_id);
        line->set_date(util::FormatDate(payment->payment_date));
        line->set_amount(payment->amount);
      }
      requests.push_back(std::move(request));
    }
  }
};

} // namespace

std::unique_ptr<DetectionRule> MakeDuplicatesRule() {
  return std::make_unique<DuplicatesRule>();
}

} // namespace fraudit::detection
