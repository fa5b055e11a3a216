#include "rules.hpp"

#include <array>
#include <cmath>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "internal/detection/rule_support.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/text.hpp"

namespace fraudit::detection {

using fraudit::observability::IntField;

namespace {

constexpr std::array<double, 4> kRoundAmounts = {10000, 25000, 50000, 100000};

// Vendors first paid within this many days of as_of count as new.
constexpr int kNewVendorDays = 730;

class AnomaliesRule final : public DetectionRule {
 public:
  std::string_view Name() const override {
    return "anomalies";
  }
  std::string_view DisplayName() const override {
    return "Payment anomalies";
  }

  std::vector<alerts::AlertRequest> Run(const RuleContext& context) const override {
    const auto payments = context.dataset.ListPayments();
    const auto vendors  = IndexById(context.dataset.ListEntities(model::EntityKind::kVendor));
    const auto agencies = IndexById(context.dataset.ListEntities(model::EntityKind::kAgency));

    std::vector<alerts::AlertRequest> requests;
    RoundNumbers(context, payments, vendors, requests);
    LargeFirstPayments(context, payments, vendors, agencies, requests);
    OverContract(context, vendors, agencies, requests);

    FRAUDIT_LOG_DEBUG("payment anomaly screen", {IntField("payments", static_cast<std::int64_t>(payments.size())),
                                                 IntField("alerts", static_cast<std::int64_t>(requests.size()))});
    return requests;
  }

 private:
  static void RoundNumbers(const RuleContext& context, const std::vector<model::PaymentRecord>& payments, const EntityIndex& vendors,
                           std::vector<alerts::AlertRequest>& requests) {
    const auto   min_count = context.thresholds.GetCount("round_number_min_count", 5);
    const double min_share = context.thresholds.Get("round_number_min_share", 0.25);

    std::map<model::EntityId, std::uint64_t>                                        payment_counts;
    std::map<std::pair<model::EntityId, double>, std::pair<std::uint64_t, double>> round;
    for (const auto& payment : payments) {
      if (payment.vendor_id == 0) {
        continue;
      }
      ++payment_counts[payment.vendor_id];
      for (const double amount : kRoundAmounts) {
        if (std::llround(payment.amount * 100.0) == std::llround(amount * 100.0)) {
          auto& [count, total] = round[{payment.vendor_id, amount}];
          ++count;
          total += payment.amount;
        }
      }
    }

    for (const auto& [key, tally] : round) {
      const auto& [count, total] = tally;
      if (count < min_count) {
        continue;
      }
      const auto* vendor = Lookup(vendors, key.first);
      if (!vendor) {
        continue;
      }
      const auto   all   = payment_counts[key.first];
      const double share = static_cast<double>(count) / static_cast<double>(all);
      if (share < min_share) {
        continue;
      }

      alerts::AlertRequest request;
      request.alert_type  = "round_number_payments";
      request.severity    = (share >= 0.5 || total >= 500000) ? model::Severity::kMedium : model::Severity::kLow;
      request.entity_kind = model::EntityKind::kVendor;
      request.entity_id   = vendor->id;
      request.title       = "Unusual round-number payments: " + vendor->display_name;
      request.description = "Vendor '" + vendor->display_name + "' has " + std::to_string(count) + " payments of exactly " +
                            util::FormatMoney(key.second) + " (" + Percent(share, 1) + " of all payments). Total value: " +
                            util::FormatMoney(total) + ". Round-number payments may indicate estimation rather than actual invoicing.";

      auto* ev = request.evidence.mutable_round_number();
      *ev->mutable_vendor() = MakeRef(*vendor);
      ev->set_round_amount(key.second);
      ev->set_round_count(count);
      ev->set_total_payments(all);
      ev->set_round_percentage(Round(share * 100.0, 1));
      ev->set_total_round_value(total);
      requests.push_back(std::move(request));
    }
  }

  static void LargeFirstPayments(const RuleContext& context, const std::vector<model::PaymentRecord>& payments, const EntityIndex& vendors,
                                 const EntityIndex& agencies, std::vector<alerts::AlertRequest>& requests) {
    const double threshold = context.thresholds.Get("new_vendor_large_payment", 100000);
    const auto   cutoff    = util::AddDays(context.as_of, -kNewVendorDays);

    // earliest payment per vendor, largest on ties
    std::map<model::EntityId, const model::PaymentRecord*> first;
    for (const auto& payment : payments) {
      if (payment.vendor_id == 0) {
        continue;
      }
      auto [it, inserted] = first.try_emplace(payment.vendor_id, &payment);
      if (inserted) {
        continue;
      }
      const auto* current = it->second;
      if (payment.payment_date < current->payment_date ||
          (payment.payment_date == current->payment_date && payment.amount > current->amount)) {
        it->second = &payment;
      }
    }

    for (const auto& [vendor_id, payment] : first) {
      if (payment->amount < threshold || payment->payment_date < cutoff) {
        continue;
      }
      const auto* vendor = Lookup(vendors, vendor_id);
      if (!vendor) {
        continue;
      }
      const auto* agency = Lookup(agencies, payment->agency_id);
      const auto  date   = util::FormatDate(payment->payment_date);

      alerts::AlertRequest request;
      request.alert_type  = "large_first_payment";
      request.severity    = payment->amount >= 500000 ? model::Severity::kHigh : model::Severity::kMedium;
      request.entity_kind = model::EntityKind::kVendor;
      request.entity_id   = vendor->id;
      request.title       = "Large first payment to new vendor: " + vendor->display_name;
      request.description = "New vendor '" + vendor->display_name + "' received " + util::FormatMoney(payment->amount) +
                            " as their first payment on " + date +
                            ". Large initial payments to new vendors may warrant additional scrutiny.";

      auto* ev = request.evidence.mutable_large_first_payment();
      *ev->mutable_vendor() = MakeRef(*vendor);
      ev->set_first_payment_amount(payment->amount);
      ev->set_first_payment_date(date);
      ev->set_in_cmbl(vendor->attributes.registered.value_or(false));
      *ev->mutable_agency() = agency ? MakeRef(*agency) : MakeRef(payment->agency_id);
      requests.push_back(std::move(request));
    }
  }

  // Total paid by the contract's agency to its vendor against the contract value.
  static void OverContract(const RuleContext& context, const EntityIndex& vendors, const EntityIndex& agencies,
                           std::vector<alerts::AlertRequest>& requests) {
    std::map<std::pair<model::EntityId, model::EntityId>, double> paid;
    for (const auto& aggregate : context.dataset.AggregateVendorAgency()) {
      paid[{aggregate.vendor_id, aggregate.agency_id}] = aggregate.payment_total;
    }

    for (const auto& contract : context.dataset.ListContracts()) {
      if (contract.vendor_id == 0 || contract.value <= 0.0) {
        continue;
      }
      auto it = paid.find({contract.vendor_id, contract.agency_id});
      if (it == paid.end() || it->second <= contract.value) {
        continue;
      }
      const auto* vendor = Lookup(vendors, contract.vendor_id);
      if (!vendor) {
        continue;
      }
      const auto*  agency = Lookup(agencies, contract.agency_id);
      const double total  = it->second;
      const double excess = total - contract.value;
      const double share  = excess / contract.value;

      alerts::AlertRequest request;
      request.alert_type  = "over_contract_payment";
      request.severity    = (share >= 0.5 || excess >= 100000) ? model::Severity::kHigh : model::Severity::kMedium;
      request.entity_kind = model::EntityKind::kVendor;
      request.entity_id   = vendor->id;
      request.title       = "Payments exceed contract: " + contract.contract_number;
      request.description = "Contract " + contract.contract_number + " has value " + util::FormatMoney(contract.value) +
                            " but total payments are " + util::FormatMoney(total) + " (" + util::FormatMoney(excess) + " / " +
                            Percent(share, 1) + " over). Vendor: " + vendor->display_name + ".";

      auto* ev = request.evidence.mutable_over_contract();
      *ev->mutable_vendor() = MakeRef(*vendor);
      *ev->mutable_agency() = agency ? MakeRef(*agency) : MakeRef(contract.agency_id);
      auto* line            = ev->mutable_contract();
      line->set_id(contract.id);
      line->set_number(contract.contract_number);
      line->set_value(contract.value);
      line->set_start_date(util::FormatDate(contract.start_date));
      line->set_description(util::Truncate(contract.description, 100));
      ev->set_total_payments(total);
      ev->set_excess_amount(excess);
      ev->set_excess_percentage(Round(share * 100.0, 1));
      requests.push_back(std::move(request));
    }
  }
};

} // namespace

std::unique_ptr<DetectionRule> MakeAnomaliesRule() {
  return std::make_unique<AnomaliesRule>();
}

} // namespace fraudit::detection
