#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "evidence/evidence.pb.h"
#include "internal/model/entity.hpp"
#include "internal/model/relationship.hpp"
#include "internal/model/transaction.hpp"
#include "internal/util/time.hpp"

namespace fraudit::detection {

using EntityIndex = std::unordered_map<model::EntityId, model::CanonicalEntity>;

EntityIndex IndexById(std::vector<model::CanonicalEntity> entities);

const model::CanonicalEntity* Lookup(const EntityIndex& index, model::EntityId id);

evidence::EntityRef MakeRef(const model::CanonicalEntity& entity);

// Reference for an id missing from the dataset.
evidence::EntityRef MakeRef(model::EntityId id);

// Normalized address when known, raw street otherwise.
std::string AddressOf(const model::CanonicalEntity& entity);

// Normalized name when known, display name otherwise.
std::string NameOf(const model::CanonicalEntity& entity);

struct PaymentSummary {
  double                    total = 0.0;
  std::uint64_t             count = 0;
  std::set<model::EntityId> agencies;
  std::optional<util::Date> first;
  std::optional<util::Date> last;
};

std::unordered_map<model::EntityId, PaymentSummary> SummarizeVendorPayments(const std::vector<model::PaymentRecord>& payments);

// Throws util::ComputeError when protobuf refuses the message.
std::string RelationshipEvidenceJson(const evidence::RelationshipEvidence& evidence);

model::RelationshipEdge MakeEdge(model::EntityKind kind_1, model::EntityId id_1, model::EntityKind kind_2, model::EntityId id_2,
                                 std::string_view relation_type, double confidence,
                                 const evidence::RelationshipEvidence& evidence);

double Mean(const std::vector<double>& values);

// Population standard deviation.
double StdDev(const std::vector<double>& values);

// stddev / mean, 1.0 when the mean is not positive.
double CoefficientOfVariation(const std::vector<double>& values);

double Round(double value, int decimals);

// "85%" style, ratio in [0,1].
std::string Percent(double ratio, int decimals = 0);

std::string JoinStrings(const std::vector<std::string>& parts, std::string_view separator);

} // namespace fraudit::detection
