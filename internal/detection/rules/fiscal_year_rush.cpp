#include "rules.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "internal/detection/rule_support.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/fiscal_year.hpp"
#include "internal/util/text.hpp"

namespace fraudit::detection {

using fraudit::observability::DoubleField;

namespace {

constexpr int         kSpikeYears         = 5;
constexpr int         kConcentrationYears = 3;
constexpr std::size_t kListedVendors      = 10;

util::Date MakeDate(int year, unsigned month, unsigned day) {
  return util::Date{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
}

struct FiscalTotals {
  double        fy_total           = 0.0;
  double        final_months_total = 0.0;
  double        july_total         = 0.0;
  double        august_total       = 0.0;
  std::uint64_t payment_count      = 0;
  std::uint64_t final_months_count = 0;
};

class FiscalYearRushRule final : public DetectionRule {
 public:
  std::string_view Name() const override {
    return "fiscal_year_rush";
  }
  std::string_view DisplayName() const override {
    return "Fiscal year-end rush";
  }

  std::vector<alerts::AlertRequest> Run(const RuleContext& context) const override {
    const double multiplier = context.thresholds.Get("fy_end_spike_multiplier", 2.0);
    const double min_amount = context.thresholds.Get("fy_end_min_amount", 100000);
    const int    current_fy = util::StateFiscalYear(context.as_of);

    const auto payments = context.dataset.ListPayments();
    const auto vendors  = IndexById(context.dataset.ListEntities(model::EntityKind::kVendor));
    const auto agencies = IndexById(context.dataset.ListEntities(model::EntityKind::kAgency));

    FRAUDIT_LOG_DEBUG("checking fiscal year-end spending", {DoubleField("spike_multiplier", multiplier)});

    std::vector<alerts::AlertRequest> requests;
    for (int fy = current_fy - kSpikeYears; fy < current_fy; ++fy) {
      AgencySpikes(fy, payments, agencies, multiplier, min_amount, requests);
    }
    for (int fy = current_fy - kConcentrationYears; fy < current_fy; ++fy) {
      VendorConcentration(context, fy, payments, vendors, requests);
    }
    for (int fy = current_fy - kSpikeYears; fy < current_fy; ++fy) {
      FinalDayClusters(fy, payments, vendors, agencies, min_amount, requests);
    }
    return requests;
  }

 private:
  // Texas FY: Sep 1 (fy-1) through Aug 31 (fy); the final months are July and August.
  static std::map<model::EntityId, FiscalTotals> Totals(int fy, const std::vector<model::PaymentRecord>& payments, bool by_agency) {
    const auto start        = util::StateFiscalYearStart(fy);
    const auto end          = util::StateFiscalYearEnd(fy);
    const auto final_months = MakeDate(fy, 7, 1);
    const auto august       = MakeDate(fy, 8, 1);

    std::map<model::EntityId, FiscalTotals> totals;
    for (const auto& payment : payments) {
      const auto key = by_agency ? payment.agency_id : payment.vendor_id;
      if (key == 0 || payment.payment_date < start || payment.payment_date > end) {
        continue;
      }
      auto& t = totals[key];
      t.fy_total += payment.amount;
      ++t.payment_count;
      if (payment.payment_date >= final_months) {
        t.final_months_total += payment.amount;
        ++t.final_months_count;
        if (payment.payment_date >= august) {
          t.august_total += payment.amount;
        } else {
          t.july_total += payment.amount;
        }
      }
    }
    return totals;
  }

  static void AgencySpikes(int fy, const std::vector<model::PaymentRecord>& payments, const EntityIndex& agencies, double multiplier,
                           double min_amount, std::vector<alerts::AlertRequest>& requests) {
    for (const auto& [agency_id, t] : Totals(fy, payments, true)) {
      if (t.fy_total <= 0.0) {
        continue;
      }
      const double first_ten_months = t.fy_total - t.final_months_total;
      if (first_ten_months <= 0.0) {
        continue;
      }
      const double monthly_average = first_ten_months / 10.0;
      const double final_ratio     = t.final_months_total / monthly_average;
      const double august_ratio    = t.august_total / monthly_average;

      if ((final_ratio < multiplier && august_ratio < multiplier) || t.final_months_total < min_amount) {
        continue;
      }
      const auto* agency = Lookup(agencies, agency_id);
      if (!agency) {
        continue;
      }
      const double final_pct = t.final_months_total / t.fy_total * 100.0;

      alerts::AlertRequest request;
      request.alert_type  = "fiscal_year_spending_rush";
      request.severity    = (august_ratio >= multiplier * 1.5 || final_pct >= 35.0) ? model::Severity::kHigh : model::Severity::kMedium;
      request.entity_kind = model::EntityKind::kAgency;
      request.entity_id   = agency->id;
      request.title       = fmt::format("FY{} year-end spending spike: {}", fy, agency->display_name);
      request.description = fmt::format(
          "{} spent {} in the final two months of FY{} ({:.1f}% of annual total). This is {:.1f}x the monthly average of {}. "
          "August alone: {} ({:.1f}x average). This pattern may indicate 'use it or lose it' budget rushing.",
          agency->display_name, util::FormatMoney(t.final_months_total), fy, final_pct, final_ratio, util::FormatMoney(monthly_average),
          util::FormatMoney(t.august_total), august_ratio);

      auto* ev = request.evidence.mutable_fiscal_year_spike();
      ev->set_fiscal_year(static_cast<std::uint32_t>(fy));
      *ev->mutable_agency() = MakeRef(*agency);
      ev->set_fy_total(t.fy_total);
      ev->set_final_months_total(t.final_months_total);
      ev->set_final_months_percentage(Round(final_pct, 1));
      ev->set_monthly_average(monthly_average);
      ev->set_final_months_ratio(Round(final_ratio, 2));
      ev->set_july_total(t.july_total);
      ev->set_august_total(t.august_total);
      ev->set_august_ratio(Round(august_ratio, 2));
      ev->set_payment_count(t.payment_count);
      requests.push_back(std::move(request));
    }
  }

  static void VendorConcentration(const RuleContext& context, int fy, const std::vector<model::PaymentRecord>& payments,
                                  const EntityIndex& vendors, std::vector<alerts::AlertRequest>& requests) {
    const double min_total = context.thresholds.Get("fy_end_vendor_min_total", 50000);
    const double min_share = context.thresholds.Get("fy_end_vendor_concentration", 0.70);

    for (const auto& [vendor_id, t] : Totals(fy, payments, false)) {
      if (t.fy_total < min_total || t.fy_total <= 0.0) {
        continue;
      }
      const double share = t.final_months_total / t.fy_total;
      if (share < min_share) {
        continue;
      }
      const auto* vendor = Lookup(vendors, vendor_id);
      if (!vendor) {
        continue;
      }

      alerts::AlertRequest request;
      request.alert_type  = "vendor_fy_end_concentration";
      request.severity    = (share >= 0.90 || t.fy_total >= 500000) ? model::Severity::kHigh : model::Severity::kMedium;
      request.entity_kind = model::EntityKind::kVendor;
      request.entity_id   = vendor->id;
      request.title       = fmt::format("Vendor with FY{} year-end payment concentration: {}", fy, vendor->display_name);
      request.description = fmt::format(
          "Vendor '{}' received {} ({} of {}) of their FY{} payments in the final two months. This unusual concentration may "
          "indicate coordination with agencies to spend remaining budget allocations.",
          vendor->display_name, Percent(share), util::FormatMoney(t.final_months_total), util::FormatMoney(t.fy_total), fy);

      auto* ev = request.evidence.mutable_vendor_concentration();
      ev->set_fiscal_year(static_cast<std::uint32_t>(fy));
      *ev->mutable_vendor() = MakeRef(*vendor);
      ev->set_fy_total(t.fy_total);
      ev->set_final_months_total(t.final_months_total);
      ev->set_final_months_percentage(Round(share * 100.0, 1));
      ev->set_payment_count(t.payment_count);
      ev->set_final_months_count(t.final_months_count);
      requests.push_back(std::move(request));
    }
  }

  // Aug 27-31, the last five days of the fiscal year.
  static void FinalDayClusters(int fy, const std::vector<model::PaymentRecord>& payments, const EntityIndex& vendors,
                               const EntityIndex& agencies, double min_amount, std::vector<alerts::AlertRequest>& requests) {
    const auto start = MakeDate(fy, 8, 27);
    const auto end   = util::StateFiscalYearEnd(fy);

    struct Cluster {
      double                            total = 0.0;
      std::uint64_t                     count = 0;
      std::map<model::EntityId, double> by_vendor;
    };
    std::map<model::EntityId, Cluster> clusters;
    for (const auto& payment : payments) {
      if (payment.agency_id == 0 || payment.payment_date < start || payment.payment_date > end) {
        continue;
      }
      auto& cluster = clusters[payment.agency_id];
      cluster.total += payment.amount;
      ++cluster.count;
      if (payment.vendor_id != 0) {
        cluster.by_vendor[payment.vendor_id] += payment.amount;
      }
    }

    for (const auto& [agency_id, cluster] : clusters) {
      if (cluster.total < min_amount) {
        continue;
      }
      const auto* agency = Lookup(agencies, agency_id);
      if (!agency) {
        continue;
      }

      std::vector<std::pair<model::EntityId, double>> ranked(cluster.by_vendor.begin(), cluster.by_vendor.end());
      std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) { return a.second > b.second; });

      alerts::AlertRequest request;
      request.alert_type  = "fy_end_payment_cluster";
      request.severity    = (cluster.total >= 1000000 || cluster.count >= 50) ? model::Severity::kHigh : model::Severity::kMedium;
      request.entity_kind = model::EntityKind::kAgency;
      request.entity_id   = agency->id;
      request.title       = fmt::format("FY{} last-minute payment cluster: {}", fy, agency->display_name);
      request.description = fmt::format(
          "{} made {} payments totaling {} to {} vendors in the final 5 days of FY{} (Aug 27-31). This last-minute spending rush "
          "may indicate poor planning or intentional budget exhaustion.",
          agency->display_name, cluster.count, util::FormatMoney(cluster.total), cluster.by_vendor.size(), fy);

      auto* ev = request.evidence.mutable_payment_cluster();
      ev->set_fiscal_year(static_cast<std::uint32_t>(fy));
      *ev->mutable_agency() = MakeRef(*agency);
      ev->set_final_days_total(cluster.total);
      ev->set_payment_count(cluster.count);
      ev->set_vendor_count(cluster.by_vendor.size());
      ev->set_date_range(util::FormatDate(start) + " to " + util::FormatDate(end));
      for (std::size_t i = 0; i < ranked.size() && i < kListedVendors; ++i) {
        auto*       line   = ev->add_top_vendors();
        const auto* vendor = Lookup(vendors, ranked[i].first);
        *line->mutable_vendor() = vendor ? MakeRef(*vendor) : MakeRef(ranked[i].first);
        line->set_amount(ranked[i].second);
      }
      requests.push_back(std::move(request));
    }
  }
};

} // namespace

std::unique_ptr<DetectionRule> MakeFiscalYearRushRule() {
  return std::make_unique<FiscalYearRushRule>();
}

} // namespace fraudit::detection
