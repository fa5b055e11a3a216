#include <cassert>
#include <cmath>
#include <iostream>

#include "internal/match/similarity.hpp"

namespace {

using fraudit::match::LevenshteinDistance;
using fraudit::match::Similarity;
using fraudit::match::SimilarityAtLeast;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestDistance() {
  assert(LevenshteinDistance("KITTEN", "SITTING") == 3);
  assert(LevenshteinDistance("SITTING", "KITTEN") == 3);
  assert(LevenshteinDistance("", "ABC") == 3);
  assert(LevenshteinDistance("ACME", "ACME") == 0);
}

void TestSimilarity() {
  assert(Similarity("ACME CORP", "ACME CORP") == 1.0);
  assert(Similarity("", "") == 1.0);
  assert(Similarity("ABC", "") == 0.0);
  assert(Near(Similarity("KITTEN", "SITTING"), 1.0 - 3.0 / 7.0));
  assert(Near(Similarity("BRAVO LOGISTIC", "BRAVO LOGISTICS"), 1.0 - 1.0 / 15.0));
  assert(Similarity("A", "B") == Similarity("B", "A"));
}

void TestLengthPrefilter() {
  // a 9-byte gap over 10 bytes can never reach 0.5
  assert(!SimilarityAtLeast("A", "ABCDEFGHIJ", 0.5).has_value());

  auto score = SimilarityAtLeast("BRAVO LOGISTIC", "BRAVO LOGISTICS", 0.9);
  assert(score.has_value());
  assert(Near(*score, Similarity("BRAVO LOGISTIC", "BRAVO LOGISTICS")));

  assert(!SimilarityAtLeast("KITTEN", "SITTING", 0.9).has_value());
  assert(*SimilarityAtLeast("SAME", "SAME", 0.99) == 1.0);
}

} // namespace

int main() {
  TestDistance();
  TestSimilarity();
  TestLengthPrefilter();

  std::cout << "fraudit_unit_similarity: pass\n";
  return 0;
}
