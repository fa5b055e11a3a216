#pragma once

#include <cstdint>
#include <string>

#include "internal/model/entity.hpp"
#include "internal/util/time.hpp"

namespace fraudit::model {

struct PaymentRecord {
  std::uint64_t id        = 0;
  EntityId      vendor_id = 0;
  EntityId      agency_id = 0;
  double        amount    = 0.0;
  util::Date    payment_date;
};

struct ContractRecord {
  std::uint64_t id        = 0;
  EntityId      vendor_id = 0;
  EntityId      agency_id = 0;
  std::string   contract_number;
  double        value = 0.0;
  util::Date    start_date;
  std::string   description;
};

// Aggregate of every payment and contract between one vendor and one agency.
struct VendorAgencyAggregate {
  EntityId      vendor_id      = 0;
  EntityId      agency_id      = 0;
  double        payment_total  = 0.0;
  std::uint64_t payment_count  = 0;
  double        contract_total = 0.0;
  std::uint64_t contract_count = 0;
};

} // namespace fraudit::model
