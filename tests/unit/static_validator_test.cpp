#include <cassert>
#include <iostream>
#include <string>

#include "internal/validation/static_validator.hpp"

namespace {

using arena::core::v1::VALIDATION_ERROR_KIND_FORBIDDEN_CONSTRUCT;
using arena::core::v1::VALIDATION_ERROR_KIND_MISSING_ENTRY_POINT;
using arena::core::v1::VALIDATION_ERROR_KIND_SYNTAX_ERROR;
using arena::validation::StaticValidator;

const StaticValidator kValidator;

void TestAcceptsWellFormedStrategy() {
  const auto result = kValidator.Validate(R"(
    import math;
    fn pace(ctx, state) {
      return state.budget_remaining / ctx.initial_budget;
    }
    fn bidding_strategy(ctx, state) {
      if (state.budget_remaining <= 0) { return none; }
      return clamp(ctx.floor_price * (1 + pace(ctx, state)), 0, math.sqrt(100));
    }
  )");
  assert(result.accepted());
  assert(result.reason().empty());
}

void TestSyntaxErrorIsReportedWithLine() {
  const auto result = kValidator.Validate("fn bidding_strategy(ctx, state) {\n  return ctx.floor_price +;\n}");
  assert(!result.accepted());
  assert(result.error_kind() == VALIDATION_ERROR_KIND_SYNTAX_ERROR);
  assert(result.reason().rfind("SyntaxError: ", 0) == 0);
  assert(result.reason().find("line 2") != std::string::npos);
}

void TestForbiddenNamesAreRejected() {
  const char* cases[][2] = {
      {"fn bidding_strategy(ctx, state) { let f = open(\"x\"); return 1; }", "open"},
      {"fn bidding_strategy(ctx, state) { socket(); return 1; }", "socket"},
      {"fn bidding_strategy(ctx, state) { return system(\"ls\"); }", "system"},
      {"fn bidding_strategy(ctx, state) { return eval(\"1\"); }", "eval"},
      {"fn bidding_strategy(ctx, state) { return getattr(ctx, \"x\"); }", "getattr"},
      {"fn bidding_strategy(ctx, state) { return ctx.__class__; }", "__class__"},
      {"fn bidding_strategy(ctx, __env) { return 1; }", "__env"},
  };

  for (const auto& c : cases) {
    const auto result = kValidator.Validate(c[0]);
    assert(!result.accepted());
    assert(result.error_kind() == VALIDATION_ERROR_KIND_FORBIDDEN_CONSTRUCT);
    assert(result.detail() == c[1]);
    assert(result.reason() == std::string("ForbiddenConstruct: ") + c[1]);
  }
}

void TestOnlyMathMayBeImported() {
  const auto result = kValidator.Validate("import os_path; fn bidding_strategy(ctx, state) { return 1; }");
  assert(!result.accepted());
  assert(result.error_kind() == VALIDATION_ERROR_KIND_FORBIDDEN_CONSTRUCT);
  assert(result.detail() == "import:os_path");
}

void TestUnconditionalSelfRecursionIsRejected() {
  const auto rejected = kValidator.Validate(R"(
    fn loop(x) { let y = loop(x + 1); return y; }
    fn bidding_strategy(ctx, state) { return loop(1); }
  )");
  assert(!rejected.accepted());
  assert(rejected.detail() == "unbounded_recursion:loop");

  // Guarded recursion is allowed; the interpreter's depth budget bounds it.
  const auto accepted = kValidator.Validate(R"(
    fn fact(n) { if (n <= 1) { return 1; } return n * fact(n - 1); }
    fn bidding_strategy(ctx, state) { return fact(3); }
  )");
  assert(accepted.accepted());
}

void TestEntryPointIsRequired() {
  const auto missing = kValidator.Validate("fn bid(ctx, state) { return 1; }");
  assert(!missing.accepted());
  assert(missing.error_kind() == VALIDATION_ERROR_KIND_MISSING_ENTRY_POINT);
  assert(missing.reason().rfind("MissingEntryPoint: ", 0) == 0);

  const auto wrong_arity = kValidator.Validate("fn bidding_strategy(ctx) { return 1; }");
  assert(!wrong_arity.accepted());
  assert(wrong_arity.error_kind() == VALIDATION_ERROR_KIND_MISSING_ENTRY_POINT);
}

void TestSyntaxIsCheckedBeforeDenylist() {
  const auto result = kValidator.Validate("fn bidding_strategy(ctx, state) { open( }");
  assert(result.error_kind() == VALIDATION_ERROR_KIND_SYNTAX_ERROR);
}

void TestCodeFencesAreStripped() {
  const std::string fenced = "```bidscript\nfn bidding_strategy(ctx, state) { return 1; }\n```\n";
  const auto        body   = arena::validation::StripCodeFences(fenced);
  assert(body.find("```") == std::string::npos);
  assert(kValidator.Validate(body).accepted());

  const std::string plain = "fn bidding_strategy(ctx, state) { return 1; }";
  assert(arena::validation::StripCodeFences(plain) == plain);
}

} // namespace

int main() {
  TestAcceptsWellFormedStrategy();
  TestSyntaxErrorIsReportedWithLine();
  TestForbiddenNamesAreRejected();
  TestOnlyMathMayBeImported();
  TestUnconditionalSelfRecursionIsRejected();
  TestEntryPointIsRequired();
  TestSyntaxIsCheckedBeforeDenylist();
  TestCodeFencesAreStripped();

  std::cout << "arena_unit_static_validator: pass\n";
  return 0;
}
