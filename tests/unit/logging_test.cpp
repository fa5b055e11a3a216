#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using namespace fraudit::observability;

void TestFieldValues() {
  assert(DoubleField("seconds", 2.5).value == "2.5");
  assert(DoubleField("mean", 2.375).value == "2.375");
  assert(DoubleField("total", 60000).value == "60000");
  assert(IntField("alerts", -3).value == "-3");
  assert(BoolField("cancelled", true).value == "true");
}

void TestFieldsAreQuotedWhenNeeded() {
  assert(FormatFields({}) == "");
  assert(FormatFields({StringField("rule", "ghost_vendors"), IntField("alerts", 4)}) == "rule=ghost_vendors alerts=4");
  assert(FormatFields({StringField("vendor", "Acme Supply")}) == "vendor=\"Acme Supply\"");
  assert(FormatFields({StringField("error", "")}) == "error=\"\"");
  assert(FormatFields({StringField("title", "say \"hi\"")}) == "title=\"say \\\"hi\\\"\"");
  assert(FormatFields({StringField("expr", "a=b")}) == "expr=\"a=b\"");
}

void TestLevelNames() {
  assert(ParseLogLevel("debug") == spdlog::level::debug);
  assert(ParseLogLevel("warning") == spdlog::level::warn);
  assert(ParseLogLevel("error") == spdlog::level::err);
  assert(ParseLogLevel("off") == spdlog::level::off);

  bool threw = false;
  try {
    (void)ParseLogLevel("verbose");
  } catch (const fraudit::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFieldValues();
  TestFieldsAreQuotedWhenNeeded();
  TestLevelNames();
  std::cout << "fraudit_unit_logging: pass\n";
  return 0;
}
