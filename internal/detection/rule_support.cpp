#include "rule_support.hpp"

#include <google/protobuf/util/json_util.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

#include "internal/util/errors.hpp"

namespace fraudit::detection {

EntityIndex IndexById(std::vector<model::CanonicalEntity> entities) {
  EntityIndex index;
  index.reserve(entities.size());
  for (auto& entity : entities) {
    const auto id = entity.id;
    index.emplace(id, std::move(entity));
  }
  return index;
}

const model::CanonicalEntity* Lookup(const EntityIndex& index, model::EntityId id) {
  auto it = index.find(id);
  return it == index.end() ? nullptr : &it->second;
}

evidence::EntityRef MakeRef(const model::CanonicalEntity& entity) {
  evidence::EntityRef ref;
  ref.set_id(entity.id);
  ref.set_name(entity.display_name);
  if (entity.attributes.external_id) {
    ref.set_external_id(*entity.attributes.external_id);
  }
  ref.set_address(AddressOf(entity));
  return ref;
}

evidence::EntityRef MakeRef(model::EntityId id) {
  evidence::EntityRef ref;
  ref.set_id(id);
  ref.set_name("Unknown");
  return ref;
}

std::string AddressOf(const model::CanonicalEntity& entity) {
  if (entity.normalized_address) {
    return *entity.normalized_address;
  }
  return entity.attributes.street.value_or("");
}

std::string NameOf(const model::CanonicalEntity& entity) {
  return entity.normalized_name.value_or(entity.display_name);
}

std::unordered_map<model::EntityId, PaymentSummary> SummarizeVendorPayments(const std::vector<model::PaymentRecord>& payments) {
  std::unordered_map<model::EntityId, PaymentSummary> summaries;
  for (const auto& payment : payments) {
    if (payment.vendor_id == 0) {
      continue;
    }
    auto& summary = summaries[payment.vendor_id];
    summary.total += payment.amount;
    ++summary.count;
    if (payment.agency_id != 0) {
      summary.agencies.insert(payment.agency_id);
    }
    if (!summary.first || payment.payment_date < *summary.first) {
      summary.first = payment.payment_date;
    }
    if (!summary.last || payment.payment_date > *summary.last) {
      summary.last = payment.payment_date;
    }
  }
  return summaries;
}

std::string RelationshipEvidenceJson(const evidence::RelationshipEvidence& evidence) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(evidence, &json, options);
  if (!status.ok()) {
    throw util::ComputeError("failed to serialize relationship evidence: " + std::string(status.message()));
  }
  return json;
}

model::RelationshipEdge MakeEdge(model::EntityKind kind_1, model::EntityId id_1, model::EntityKind kind_2, model::EntityId id_2,
                                 std::string_view relation_type, double confidence,
                                 const evidence::RelationshipEvidence& evidence) {
  model::RelationshipEdge edge;
  edge.kind_1        = kind_1;
  edge.id_1          = id_1;
  edge.kind_2        = kind_2;
  edge.id_2          = id_2;
  edge.relation_type = std::string(relation_type);
  edge.confidence    = std::clamp(confidence, 0.0, 1.0);
  edge.evidence      = RelationshipEvidenceJson(evidence);
  return edge;
}

double Mean(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (double v : values) {
    sum += v;
  }
  return sum / static_cast<double>(values.size());
}

double StdDev(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  const double mean = Mean(values);
  double       acc  = 0.0;
  for (double v : values) {
    acc += (v - mean) * (v - mean);
  }
  return std::sqrt(acc / static_cast<double>(values.size()));
}

double CoefficientOfVariation(const std::vector<double>& values) {
  const double mean = Mean(values);
  if (mean <= 0.0) {
    return 1.0;
  }
  return StdDev(values) / mean;
}

double Round(double value, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

std::string Percent(double ratio, int decimals) {
  return fmt::format("{:.{}f}%", ratio * 100.0, decimals);
}

std::string JoinStrings(const std::vector<std::string>& parts, std::string_view separator) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out.append(separator);
    }
    out += parts[i];
  }
  return out;
}

} // namespace fraudit::detection
