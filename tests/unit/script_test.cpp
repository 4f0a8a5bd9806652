#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <variant>

#include "internal/script/interpreter.hpp"
#include "internal/script/parser.hpp"
#include "internal/script/script_error.hpp"

namespace {

using arena::script::Heap;
using arena::script::Interpreter;
using arena::script::Limits;
using arena::script::ScriptError;
using arena::script::Value;

Value Run(const std::string& source, Heap& heap, Limits limits = {}) {
  auto        program = std::make_shared<const arena::script::Program>(arena::script::Parse(source));
  Interpreter interpreter(program, limits);
  return interpreter.Call(heap, "main", {});
}

double RunNumber(const std::string& source) {
  Heap heap;
  auto value = Run(source, heap);
  assert(std::holds_alternative<double>(value));
  return std::get<double>(value);
}

ScriptError::Kind FailureKind(const std::string& source, Limits limits = {}) {
  Heap heap(4096);
  try {
    (void)Run(source, heap, limits);
  } catch (const ScriptError& e) {
    return e.kind();
  }
  assert(false && "script was expected to fail");
  return ScriptError::Kind::kRuntime;
}

void TestArithmeticPrecedence() {
  assert(RunNumber("fn main() { return 1 + 2 * 3 - 4 / 2; }") == 5.0);
  assert(RunNumber("fn main() { return (1 + 2) * 3 % 4; }") == 1.0);
  assert(RunNumber("fn main() { return -2 * -3; }") == 6.0);
}

void TestControlFlowAndLists() {
  const auto source = R"(
    fn main() {
      let xs = [];
      for i in range(10) {
        if (i % 2 == 0) { continue; }
        if (i > 7) { break; }
        push(xs, i);
      }
      let total = 0;
      let n = 0;
      while (n < len(xs)) {
        total = total + xs[n];
        n = n + 1;
      }
      return total;
    }
  )";
  assert(RunNumber(source) == 1.0 + 3.0 + 5.0 + 7.0);
}

void TestShortCircuitSkipsRightHandSide() {
  // The right-hand side would divide by zero if evaluated.
  assert(RunNumber("fn main() { if (false && 1 / 0 > 0) { return 1; } return 2; }") == 2.0);
  assert(RunNumber("fn main() { if (true or 1 / 0 > 0) { return 1; } return 2; }") == 1.0);
}

void TestBuiltinsAndMath() {
  assert(RunNumber("fn main() { return clamp(15, 0, 10) + min(3, 4) + max([1, 9, 2]); }") == 22.0);
  assert(RunNumber("fn main() { return round(2.5) + floor(1.7) + ceil(1.2) + abs(-1); }") == 7.0);
  assert(RunNumber("import math; fn main() { return math.sqrt(16) + math.pow(2, 3); }") == 12.0);
  assert(RunNumber("fn main() { return num(\"4.5\") + len(str(12)); }") == 6.5);
}

void TestHelperFunctionsAndNone() {
  const auto source = R"(
    fn helper(x) { if (x > 1) { return x; } return none; }
    fn main() {
      if (helper(0) == none) { return helper(5); }
      return 0;
    }
  )";
  assert(RunNumber(source) == 5.0);
}

void TestRuntimeErrors() {
  assert(FailureKind("fn main() { return 1 / 0; }") == ScriptError::Kind::kRuntime);
  assert(FailureKind("fn main() { return [1][3]; }") == ScriptError::Kind::kRuntime);
  assert(FailureKind("fn main() { x = 1; return x; }") == ScriptError::Kind::kRuntime);
  assert(FailureKind("fn main() { return \"a\" - 1; }") == ScriptError::Kind::kRuntime);
}

void TestStepBudgetStopsInfiniteLoop() {
  Limits limits;
  limits.max_steps = 10'000;
  assert(FailureKind("fn main() { while (true) { } return 0; }", limits) == ScriptError::Kind::kTimeout);
}

void TestCallDepthLimit() {
  Limits limits;
  limits.max_call_depth = 8;
  const auto source = "fn down(n) { if (n <= 0) { return 0; } return down(n - 1); } fn main() { return down(100); }";
  assert(FailureKind(source, limits) == ScriptError::Kind::kResourceExceeded);
}

void TestHeapBudget() {
  const auto source = "fn main() { let xs = []; for i in range(100000) { push(xs, i); } return len(xs); }";
  assert(FailureKind(source) == ScriptError::Kind::kResourceExceeded);
}

void TestStringCopiesShareTheirBytes() {
  const auto source = R"(
    fn main() {
      let s = "x";
      for i in range(16) { s = s + s; }
      let xs = [];
      for i in range(2000) { push(xs, s); }
      return xs;
    }
  )";
  Heap heap(1 << 20);
  auto value = Run(source, heap);
  auto list  = std::get<arena::script::List*>(value);
  assert(list->items.size() == 2000);
  const auto& first = std::get<arena::script::Text>(list->items.front());
  const auto& last  = std::get<arena::script::Text>(list->items.back());
  assert(first->size() == 65536);
  assert(first.get() == last.get());
  assert(heap.used() < (1u << 20));

  // Building the string itself is still charged in full.
  Heap small(1 << 20);
  bool threw = false;
  try {
    (void)Run("fn main() { let s = \"x\"; for i in range(21) { s = s + s; } return len(s); }", small);
  } catch (const ScriptError& e) {
    threw = e.kind() == ScriptError::Kind::kResourceExceeded;
  }
  assert(threw);
}

std::string RunText(const std::string& source) {
  Heap heap;
  auto value = Run(source, heap);
  assert(std::holds_alternative<arena::script::Text>(value));
  return *std::get<arena::script::Text>(value);
}

void TestStrOfSelfReferencingList() {
  assert(RunText("fn main() { let l = []; push(l, l); return str(l); }") == "[[...]]");
  assert(RunText("fn main() { let l = [1]; push(l, l); push(l, l); push(l, l); return str(l); }") ==
         "[1, [...], [...], [...]]");
  assert(RunText("fn main() { return str([1, \"a\", none, [true]]); }") == "[1, a, none, [true]]");
}

void TestStrIsChargedWhileRendering() {
  // Shared sublists expand exponentially when rendered.
  const auto source = "fn main() { let a = [1]; for i in range(20) { a = [a, a]; } return len(str(a)); }";
  assert(FailureKind(source) == ScriptError::Kind::kResourceExceeded);

  Limits limits;
  limits.max_steps = 5'000;
  Heap heap;
  bool timed_out = false;
  try {
    (void)Run(source, heap, limits);
  } catch (const ScriptError& e) {
    timed_out = e.kind() == ScriptError::Kind::kTimeout;
  }
  assert(timed_out);
}

void TestEqualityOnCyclicLists() {
  Heap heap;
  auto same = Run("fn main() { let l = []; push(l, l); push(l, l); push(l, l); return l == l; }", heap);
  assert(std::get<bool>(same));

  auto twins = Run("fn main() { let a = []; push(a, a); push(a, a); let b = []; push(b, b); push(b, b); return a == b; }",
                   heap);
  assert(std::get<bool>(twins));

  auto differ = Run("fn main() { let a = [1]; push(a, a); let b = [2]; push(b, b); return a == b; }", heap);
  assert(!std::get<bool>(differ));
}

void TestSyntaxErrorsCarryLine() {
  try {
    (void)arena::script::Parse("fn main() {\n  return 1 +;\n}");
    assert(false && "parse should fail");
  } catch (const ScriptError& e) {
    assert(e.kind() == ScriptError::Kind::kSyntax);
    assert(e.line() == 2);
  }

  bool threw = false;
  try {
    (void)arena::script::Parse("fn a() { return 1; } fn a() { return 2; }");
  } catch (const ScriptError& e) {
    threw = e.kind() == ScriptError::Kind::kSyntax;
  }
  assert(threw && "duplicate function names must be rejected");
}

void TestStepsAreReported() {
  auto program = std::make_shared<const arena::script::Program>(arena::script::Parse("fn main() { return 1 + 1; }"));
  Interpreter interpreter(program, Limits{});
  Heap        heap;
  (void)interpreter.Call(heap, "main", {});
  const auto first = interpreter.last_steps();
  assert(first > 0);
  (void)interpreter.Call(heap, "main", {});
  assert(interpreter.last_steps() == first);
}

} // namespace

int main() {
  TestArithmeticPrecedence();
  TestControlFlowAndLists();
  TestShortCircuitSkipsRightHandSide();
  TestBuiltinsAndMath();
  TestHelperFunctionsAndNone();
  TestRuntimeErrors();
  TestStepBudgetStopsInfiniteLoop();
  TestCallDepthLimit();
  TestHeapBudget();
  TestStringCopiesShareTheirBytes();
  TestStrOfSelfReferencingList();
  TestStrIsChargedWhileRendering();
  TestEqualityOnCyclicLists();
  TestSyntaxErrorsCarryLine();
  TestStepsAreReported();

  std::cout << "arena_unit_script: pass\n";
  return 0;
}
