#pragma once

#include <memory>

#include "internal/detection/rule.hpp"

namespace fraudit::detection {

// Clustered contracts just below the LBB and ESBD reporting thresholds.
std::unique_ptr<DetectionRule> MakeContractSplittingRule();

// Shared addresses, near-identical names and consecutive vendor numbers.
std::unique_ptr<DetectionRule> MakeVendorClusteringRule();

// Hub vendors, isolated vendor clusters and exclusive agency relationships.
std::unique_ptr<DetectionRule> MakeNetworkRule();

// Employees whose names or addresses match paid vendors.
std::unique_ptr<DetectionRule> MakeEmployeeVendorRule();

// Related vendor networks, employee-vendor-contributor triangles and
// circular payment patterns.
std::unique_ptr<DetectionRule> MakeRelatedPartyRule();

// Paid vendors matching active exclusion records.
std::unique_ptr<DetectionRule> MakeDebarmentRule();

// Texas fiscal year-end spending spikes.
std::unique_ptr<DetectionRule> MakeFiscalYearRushRule();

// Unregistered vendors and incomplete or suspicious vendor addresses.
std::unique_ptr<DetectionRule> MakeGhostVendorsRule();

// Exact, near-window and related-vendor duplicate payments.
std::unique_ptr<DetectionRule> MakeDuplicatesRule();

// Round-number payments, large first payments to new vendors and payments
// beyond a contract's value.
std::unique_ptr<DetectionRule> MakeAnomaliesRule();

// Significant campaign contributors whose names match state vendors.
std::unique_ptr<DetectionRule> MakeCampaignVendorRule();

} // namespace fraudit::detection
