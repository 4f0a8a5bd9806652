#include "interpreter.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <numbers>
#include <unordered_set>
#include <utility>

#include "script_error.hpp"

namespace arena::script {

namespace {

constexpr std::uint64_t kDeadlineCheckInterval = 256;
constexpr int           kMaxCompareDepth       = 16;

const std::unordered_set<std::string_view>& Builtins() {
  static const std::unordered_set<std::string_view> kBuiltins = {
      "min", "max", "abs", "floor", "ceil", "round", "clamp", "len", "range", "push", "has", "get", "str", "num",
  };
  return kBuiltins;
}

[[noreturn]] void RuntimeFail(const std::string& message, int line) {
  throw ScriptError(ScriptError::Kind::kRuntime, message, line);
}

enum class Flow {
  kNormal,
  kBreak,
  kContinue,
  kReturn,
};

struct Frame {
  std::vector<std::unordered_map<std::string, Value>> scopes;
  Value                                               result;
};

// Pushes a lexical scope for the lifetime of a block.
class ScopeGuard {
 public:
  explicit ScopeGuard(Frame& frame) : frame_(frame) {
    frame_.scopes.emplace_back();
  }
  ~ScopeGuard() {
    frame_.scopes.pop_back();
  }

  ScopeGuard(const ScopeGuard&)            = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;

 private:
  Frame& frame_;
};

double ExpectNumber(const Value& value, std::string_view what, int line) {
  if (const auto* d = std::get_if<double>(&value)) return *d;
  RuntimeFail(std::string(what) + " expects a number, got " + std::string(TypeName(value)), line);
}

long long ExpectInteger(const Value& value, std::string_view what, int line) {
  const double d = ExpectNumber(value, what, line);
  if (!std::isfinite(d) || d != std::floor(d) || std::fabs(d) > 9.0e15) {
    RuntimeFail(std::string(what) + " expects an integer", line);
  }
  return static_cast<long long>(d);
}

std::string MapKey(const Value& key, int line) {
  if (const auto* s = std::get_if<Text>(&key)) return **s;
  if (std::holds_alternative<double>(key)) return std::to_string(ExpectInteger(key, "map key", line));
  RuntimeFail("map keys must be strings or integers, got " + std::string(TypeName(key)), line);
}

std::size_t ResolveIndex(long long index, std::size_t size, int line) {
  const long long n = static_cast<long long>(size);
  if (index < 0) index += n;
  if (index < 0 || index >= n) {
    RuntimeFail("index out of range", line);
  }
  return static_cast<std::size_t>(index);
}

class Evaluator {
 public:
  Evaluator(const std::unordered_map<std::string, const FunctionDecl*>& functions,
            const Program&                                              program,
            const Limits&                                               limits,
            Heap&                                                       heap)
      : functions_(functions), program_(program), limits_(limits), heap_(heap) {
    if (limits_.timeout.count() > 0) {
      deadline_     = std::chrono::steady_clock::now() + limits_.timeout;
      has_deadline_ = true;
    }
  }

  Value Invoke(const FunctionDecl& fn, std::vector<Value> args, int line) {
    if (args.size() != fn.params.size()) {
      RuntimeFail(fn.name + "() takes " + std::to_string(fn.params.size()) + " arguments, got " + std::to_string(args.size()),
                  line);
    }
    if (depth_ >= limits_.max_call_depth) {
      throw ScriptError(ScriptError::Kind::kResourceExceeded,
                        "call depth limit of " + std::to_string(limits_.max_call_depth) + " exceeded", line);
    }

    ++depth_;
    Frame frame;
    frame.scopes.emplace_back();
    for (std::size_t i = 0; i < args.size(); ++i) {
      frame.scopes.back()[fn.params[i]] = std::move(args[i]);
    }
    ExecBody(fn.body, frame);
    --depth_;
    return std::move(frame.result);
  }

  std::uint64_t steps() const {
    return steps_;
  }

 private:
  void Step(int line, std::uint64_t cost = 1) {
    steps_ += cost;
    if (steps_ > limits_.max_steps) {
      throw ScriptError(ScriptError::Kind::kTimeout, "step budget of " + std::to_string(limits_.max_steps) + " exhausted",
                        line);
    }
    if (has_deadline_ && steps_ - last_deadline_check_ >= kDeadlineCheckInterval) {
      last_deadline_check_ = steps_;
      if (std::chrono::steady_clock::now() >= deadline_) {
        throw ScriptError(ScriptError::Kind::kTimeout, "deadline exceeded", line);
      }
    }
  }

  // Structural equality for lists, identity for maps. A pair of lists already
  // being compared further up the recursion counts as equal, so cyclic lists
  // terminate.
  bool Equal(const Value& a, const Value& b, int depth, int line) {
    Step(line);
    if (a.index() != b.index()) return false;
    switch (a.index()) {
      case 0: return true;
      case 1: return std::get<bool>(a) == std::get<bool>(b);
      case 2: return std::get<double>(a) == std::get<double>(b);
      case 3: return *std::get<Text>(a) == *std::get<Text>(b);
      case 4: {
        const List* x = std::get<List*>(a);
        const List* y = std::get<List*>(b);
        if (x == y) return true;
        if (depth > kMaxCompareDepth || x->items.size() != y->items.size()) return false;
        for (const auto& [seen_x, seen_y] : comparing_) {
          if (seen_x == x && seen_y == y) return true;
        }
        comparing_.emplace_back(x, y);
        bool equal = true;
        for (std::size_t i = 0; equal && i < x->items.size(); ++i) {
          equal = Equal(x->items[i], y->items[i], depth + 1, line);
        }
        comparing_.pop_back();
        return equal;
      }
      default: return std::get<const Map*>(a) == std::get<const Map*>(b);
    }
  }

  // Runs statements in the frame's current scope.
  Flow ExecBody(const std::vector<StmtPtr>& body, Frame& frame) {
    for (const auto& stmt : body) {
      Flow flow = Exec(*stmt, frame);
      if (flow != Flow::kNormal) return flow;
    }
    return Flow::kNormal;
  }

  Flow ExecBlock(const std::vector<StmtPtr>& body, Frame& frame) {
    ScopeGuard scope(frame);
    return ExecBody(body, frame);
  }

  Value* FindVariable(const std::string& name, Frame& frame) {
    for (auto it = frame.scopes.rbegin(); it != frame.scopes.rend(); ++it) {
      auto found = it->find(name);
      if (found != it->end()) return &found->second;
    }
    return nullptr;
  }

  bool IsModule(const std::string& name, Frame& frame) {
    if (FindVariable(name, frame) != nullptr) return false;
    for (const auto& import : program_.imports) {
      if (import.name == name) return true;
    }
    return false;
  }

  Flow Exec(const Stmt& stmt, Frame& frame) {
    Step(stmt.line);

    switch (stmt.kind) {
      case StmtKind::kLet: {
        Value value = Eval(*stmt.value, frame);
        heap_.Charge(kValueCost + stmt.name.size());
        frame.scopes.back()[stmt.name] = std::move(value);
        return Flow::kNormal;
      }
      case StmtKind::kAssign: {
        Value  value = Eval(*stmt.value, frame);
        Value* slot  = FindVariable(stmt.name, frame);
        if (slot == nullptr) {
          RuntimeFail("assignment to undeclared variable '" + stmt.name + "'", stmt.line);
        }
        *slot = std::move(value);
        return Flow::kNormal;
      }
      case StmtKind::kIndexAssign: {
        Value target = Eval(*stmt.target, frame);
        Value index  = Eval(*stmt.index, frame);
        Value value  = Eval(*stmt.value, frame);
        auto* list   = std::get_if<List*>(&target);
        if (list == nullptr) {
          if (std::holds_alternative<const Map*>(target)) RuntimeFail("maps are read-only", stmt.line);
          RuntimeFail("cannot assign into " + std::string(TypeName(target)), stmt.line);
        }
        const std::size_t at = ResolveIndex(ExpectInteger(index, "list index", stmt.line), (*list)->items.size(), stmt.line);
        (*list)->items[at]   = std::move(value);
        return Flow::kNormal;
      }
      case StmtKind::kIf: {
        if (Truthy(Eval(*stmt.value, frame))) return ExecBlock(stmt.body, frame);
        if (!stmt.else_body.empty()) return ExecBlock(stmt.else_body, frame);
        return Flow::kNormal;
      }
      case StmtKind::kWhile: {
        while (Truthy(Eval(*stmt.value, frame))) {
          Flow flow = ExecBlock(stmt.body, frame);
          if (flow == Flow::kBreak) break;
          if (flow == Flow::kReturn) return flow;
        }
        return Flow::kNormal;
      }
      case StmtKind::kFor:
        return ExecFor(stmt, frame);
      case StmtKind::kReturn:
        frame.result = stmt.value ? Eval(*stmt.value, frame) : Value{};
        return Flow::kReturn;
      case StmtKind::kBreak:
        return Flow::kBreak;
      case StmtKind::kContinue:
        return Flow::kContinue;
      case StmtKind::kExpr:
        Eval(*stmt.value, frame);
        return Flow::kNormal;
      case StmtKind::kBlock:
        return ExecBlock(stmt.body, frame);
    }
    return Flow::kNormal;
  }

  Flow ExecFor(const Stmt& stmt, Frame& frame) {
    Value iterable = Eval(*stmt.value, frame);

    auto run_body = [&](Value item) {
      ScopeGuard scope(frame);
      frame.scopes.back()[stmt.name] = std::move(item);
      return ExecBody(stmt.body, frame);
    };

    if (auto* list = std::get_if<List*>(&iterable)) {
      // Re-reads the size every pass: push() inside the loop extends it.
      for (std::size_t i = 0; i < (*list)->items.size(); ++i) {
        Flow flow = run_body((*list)->items[i]);
        if (flow == Flow::kBreak) break;
        if (flow == Flow::kReturn) return flow;
      }
      return Flow::kNormal;
    }
    if (auto* text = std::get_if<Text>(&iterable)) {
      for (char c : **text) {
        Flow flow = run_body(heap_.String(std::string(1, c)));
        if (flow == Flow::kBreak) break;
        if (flow == Flow::kReturn) return flow;
      }
      return Flow::kNormal;
    }
    if (auto* map = std::get_if<const Map*>(&iterable)) {
      for (const auto& entry : (*map)->entries) {
        Flow flow = run_body(heap_.String(entry.first));
        if (flow == Flow::kBreak) break;
        if (flow == Flow::kReturn) return flow;
      }
      return Flow::kNormal;
    }
    RuntimeFail("cannot iterate over " + std::string(TypeName(iterable)), stmt.line);
  }

  Value Eval(const Expr& expr, Frame& frame) {
    Step(expr.line);

    switch (expr.kind) {
      case ExprKind::kNumber:
        return expr.number;
      case ExprKind::kString:
        return heap_.String(expr.text);
      case ExprKind::kBool:
        return expr.boolean;
      case ExprKind::kNone:
        return Value{};
      case ExprKind::kIdentifier:
        return Lookup(expr, frame);
      case ExprKind::kList: {
        List* list = heap_.NewList();
        heap_.Charge(kValueCost * expr.args.size());
        list->items.reserve(expr.args.size());
        for (const auto& element : expr.args) {
          list->items.push_back(Eval(*element, frame));
        }
        return list;
      }
      case ExprKind::kUnary: {
        Value operand = Eval(*expr.lhs, frame);
        if (expr.op == TokenKind::kMinus) return -ExpectNumber(operand, "unary '-'", expr.line);
        return !Truthy(operand);
      }
      case ExprKind::kLogical: {
        Value lhs = Eval(*expr.lhs, frame);
        if (expr.op == TokenKind::kAnd) {
          if (!Truthy(lhs)) return lhs;
        } else if (Truthy(lhs)) {
          return lhs;
        }
        return Eval(*expr.rhs, frame);
      }
      case ExprKind::kBinary:
        return Binary(expr, Eval(*expr.lhs, frame), Eval(*expr.rhs, frame));
      case ExprKind::kCall:
        return EvalCall(expr, frame);
      case ExprKind::kMember:
        return EvalMember(expr, frame);
      case ExprKind::kIndex:
        return Index(Eval(*expr.lhs, frame), Eval(*expr.rhs, frame), expr.line);
    }
    return Value{};
  }

  Value Lookup(const Expr& expr, Frame& frame) {
    if (Value* slot = FindVariable(expr.text, frame)) return *slot;
    if (functions_.count(expr.text) != 0 || IsBuiltin(expr.text)) {
      RuntimeFail("function '" + expr.text + "' can only be called", expr.line);
    }
    if (IsModule(expr.text, frame)) {
      RuntimeFail("module '" + expr.text + "' can only be used through its members", expr.line);
    }
    RuntimeFail("undefined variable '" + expr.text + "'", expr.line);
  }

  Value Binary(const Expr& expr, const Value& lhs, const Value& rhs) {
    const int line = expr.line;
    switch (expr.op) {
      case TokenKind::kEq: return Equal(lhs, rhs, 0, line);
      case TokenKind::kNe: return !Equal(lhs, rhs, 0, line);
      case TokenKind::kPlus: {
        if (std::holds_alternative<Text>(lhs) && std::holds_alternative<Text>(rhs)) {
          return heap_.String(*std::get<Text>(lhs) + *std::get<Text>(rhs));
        }
        if (std::holds_alternative<List*>(lhs) && std::holds_alternative<List*>(rhs)) {
          const List* a   = std::get<List*>(lhs);
          const List* b   = std::get<List*>(rhs);
          List*       out = heap_.NewList();
          heap_.Charge(kValueCost * (a->items.size() + b->items.size()));
          Step(line, a->items.size() + b->items.size());
          out->items = a->items;
          out->items.insert(out->items.end(), b->items.begin(), b->items.end());
          return out;
        }
        return ExpectNumber(lhs, "'+'", line) + ExpectNumber(rhs, "'+'", line);
      }
      case TokenKind::kLt:
      case TokenKind::kLe:
      case TokenKind::kGt:
      case TokenKind::kGe: {
        int cmp = 0;
        if (std::holds_alternative<Text>(lhs) && std::holds_alternative<Text>(rhs)) {
          cmp = std::get<Text>(lhs)->compare(*std::get<Text>(rhs));
        } else {
          const double a = ExpectNumber(lhs, "comparison", line);
          const double b = ExpectNumber(rhs, "comparison", line);
          if (std::isnan(a) || std::isnan(b)) return false;
          cmp = a < b ? -1 : (a > b ? 1 : 0);
        }
        if (expr.op == TokenKind::kLt) return cmp < 0;
        if (expr.op == TokenKind::kLe) return cmp <= 0;
        if (expr.op == TokenKind::kGt) return cmp > 0;
        return cmp >= 0;
      }
      default:
        break;
    }

    const double a = ExpectNumber(lhs, "arithmetic", line);
    const double b = ExpectNumber(rhs, "arithmetic", line);
    switch (expr.op) {
      case TokenKind::kMinus: return a - b;
      case TokenKind::kStar: return a * b;
      case TokenKind::kSlash:
        if (b == 0.0) RuntimeFail("division by zero", line);
        return a / b;
      case TokenKind::kPercent: {
        if (b == 0.0) RuntimeFail("modulo by zero", line);
        // Result takes the sign of the divisor.
        double r = std::fmod(a, b);
        if (r != 0.0 && ((r < 0.0) != (b < 0.0))) r += b;
        return r;
      }
      default:
        RuntimeFail("unsupported operator " + std::string(TokenName(expr.op)), line);
    }
  }

  Value Index(const Value& target, const Value& index, int line) {
    if (const auto* list = std::get_if<List*>(&target)) {
      return (*list)->items[ResolveIndex(ExpectInteger(index, "list index", line), (*list)->items.size(), line)];
    }
    if (const auto* map = std::get_if<const Map*>(&target)) {
      const std::string key = MapKey(index, line);
      auto              it  = (*map)->entries.find(key);
      if (it == (*map)->entries.end()) RuntimeFail("key '" + key + "' not found", line);
      return it->second;
    }
    if (const auto* text = std::get_if<Text>(&target)) {
      const std::size_t at = ResolveIndex(ExpectInteger(index, "string index", line), (*text)->size(), line);
      return heap_.String(std::string(1, (**text)[at]));
    }
    RuntimeFail("cannot index into " + std::string(TypeName(target)), line);
  }

  Value EvalMember(const Expr& expr, Frame& frame) {
    if (expr.lhs->kind == ExprKind::kIdentifier && IsModule(expr.lhs->text, frame)) {
      return ModuleConstant(expr.lhs->text, expr.text, expr.line);
    }
    Value target = Eval(*expr.lhs, frame);
    if (const auto* map = std::get_if<const Map*>(&target)) {
      auto it = (*map)->entries.find(expr.text);
      if (it == (*map)->entries.end()) RuntimeFail("key '" + expr.text + "' not found", expr.line);
      return it->second;
    }
    RuntimeFail(std::string(TypeName(target)) + " has no member '" + expr.text + "'", expr.line);
  }

  std::vector<Value> EvalArgs(const Expr& expr, Frame& frame) {
    std::vector<Value> args;
    args.reserve(expr.args.size());
    for (const auto& arg : expr.args) {
      args.push_back(Eval(*arg, frame));
    }
    return args;
  }

  Value EvalCall(const Expr& expr, Frame& frame) {
    const Expr& callee = *expr.lhs;

    if (callee.kind == ExprKind::kIdentifier && FindVariable(callee.text, frame) == nullptr) {
      auto fn = functions_.find(callee.text);
      if (fn != functions_.end()) {
        return Invoke(*fn->second, EvalArgs(expr, frame), expr.line);
      }
      if (IsBuiltin(callee.text)) {
        std::vector<Value> args = EvalArgs(expr, frame);
        return CallBuiltin(callee.text, args, expr.line);
      }
      RuntimeFail("unknown function '" + callee.text + "'", expr.line);
    }

    if (callee.kind == ExprKind::kMember && callee.lhs->kind == ExprKind::kIdentifier && IsModule(callee.lhs->text, frame)) {
      std::vector<Value> args = EvalArgs(expr, frame);
      return CallModule(callee.lhs->text, callee.text, args, expr.line);
    }

    RuntimeFail("expression is not callable", expr.line);
  }

  static void Arity(std::string_view name, const std::vector<Value>& args, std::size_t min, std::size_t max, int line) {
    if (args.size() < min || args.size() > max) {
      std::string expected = min == max ? std::to_string(min) : std::to_string(min) + ".." + std::to_string(max);
      RuntimeFail(std::string(name) + "() takes " + expected + " arguments, got " + std::to_string(args.size()), line);
    }
  }

  Value Extremum(std::string_view name, std::vector<Value>& args, bool want_max, int line) {
    const std::vector<Value>* items = &args;
    if (args.size() == 1) {
      const auto* list = std::get_if<List*>(&args[0]);
      if (list == nullptr) RuntimeFail(std::string(name) + "() of a single argument expects a list", line);
      items = &(*list)->items;
    }
    if (items->empty()) RuntimeFail(std::string(name) + "() of an empty sequence", line);
    Step(line, items->size());

    double best = ExpectNumber((*items)[0], name, line);
    for (std::size_t i = 1; i < items->size(); ++i) {
      const double v = ExpectNumber((*items)[i], name, line);
      if (want_max ? v > best : v < best) best = v;
    }
    return best;
  }

  Value CallBuiltin(const std::string& name, std::vector<Value>& args, int line) {
    if (name == "min" || name == "max") {
      if (args.empty()) RuntimeFail(name + "() expects at least one argument", line);
      return Extremum(name, args, name == "max", line);
    }
    if (name == "abs") {
      Arity(name, args, 1, 1, line);
      return std::fabs(ExpectNumber(args[0], name, line));
    }
    if (name == "floor") {
      Arity(name, args, 1, 1, line);
      return std::floor(ExpectNumber(args[0], name, line));
    }
    if (name == "ceil") {
      Arity(name, args, 1, 1, line);
      return std::ceil(ExpectNumber(args[0], name, line));
    }
    if (name == "round") {
      Arity(name, args, 1, 2, line);
      const double x = ExpectNumber(args[0], name, line);
      if (args.size() == 1) return std::round(x);
      const long long digits = ExpectInteger(args[1], name, line);
      if (digits < 0 || digits > 15) RuntimeFail("round() digits must be within 0..15", line);
      const double scale = std::pow(10.0, static_cast<double>(digits));
      return std::round(x * scale) / scale;
    }
    if (name == "clamp") {
      Arity(name, args, 3, 3, line);
      const double x  = ExpectNumber(args[0], name, line);
      const double lo = ExpectNumber(args[1], name, line);
      const double hi = ExpectNumber(args[2], name, line);
      if (lo > hi) RuntimeFail("clamp() lower bound exceeds upper bound", line);
      return std::min(std::max(x, lo), hi);
    }
    if (name == "len") {
      Arity(name, args, 1, 1, line);
      if (const auto* list = std::get_if<List*>(&args[0])) return static_cast<double>((*list)->items.size());
      if (const auto* text = std::get_if<Text>(&args[0])) return static_cast<double>((*text)->size());
      if (const auto* map = std::get_if<const Map*>(&args[0])) return static_cast<double>((*map)->entries.size());
      RuntimeFail("len() of " + std::string(TypeName(args[0])), line);
    }
    if (name == "range") {
      Arity(name, args, 1, 2, line);
      long long start = 0;
      long long stop  = ExpectInteger(args[0], name, line);
      if (args.size() == 2) {
        start = stop;
        stop  = ExpectInteger(args[1], name, line);
      }
      List* list = heap_.NewList();
      if (stop <= start) return list;
      const auto count = static_cast<std::uint64_t>(stop - start);
      // Charge before allocating so huge ranges fail cheaply.
      heap_.Charge(kValueCost * count);
      Step(line, count);
      list->items.reserve(count);
      for (long long i = start; i < stop; ++i) {
        list->items.emplace_back(static_cast<double>(i));
      }
      return list;
    }
    if (name == "push") {
      Arity(name, args, 2, 2, line);
      auto* list = std::get_if<List*>(&args[0]);
      if (list == nullptr) RuntimeFail("push() expects a list", line);
      heap_.Charge(kValueCost);
      (*list)->items.push_back(std::move(args[1]));
      return Value{};
    }
    if (name == "has") {
      Arity(name, args, 2, 2, line);
      const auto* map = std::get_if<const Map*>(&args[0]);
      if (map == nullptr) RuntimeFail("has() expects a map", line);
      return (*map)->entries.count(MapKey(args[1], line)) != 0;
    }
    if (name == "get") {
      Arity(name, args, 2, 3, line);
      const auto* map = std::get_if<const Map*>(&args[0]);
      if (map == nullptr) RuntimeFail("get() expects a map", line);
      auto it = (*map)->entries.find(MapKey(args[1], line));
      if (it != (*map)->entries.end()) return it->second;
      return args.size() == 3 ? args[2] : Value{};
    }
    if (name == "str") {
      Arity(name, args, 1, 1, line);
      // Every rendered piece is a step and is charged as it is appended.
      std::string text = Display(args[0], [&](std::size_t bytes) {
        Step(line);
        heap_.Charge(bytes);
      });
      return heap_.AdoptString(std::move(text));
    }
    if (name == "num") {
      Arity(name, args, 1, 1, line);
      if (const auto* d = std::get_if<double>(&args[0])) return *d;
      if (const auto* b = std::get_if<bool>(&args[0])) return *b ? 1.0 : 0.0;
      if (const auto* text = std::get_if<Text>(&args[0])) {
        const std::string& raw = **text;
        if (raw.empty()) return Value{};
        errno               = 0;
        char*        end    = nullptr;
        const double parsed = std::strtod(raw.c_str(), &end);
        if (errno == ERANGE || end != raw.c_str() + raw.size()) return Value{};
        return parsed;
      }
      return Value{};
    }
    RuntimeFail("unknown function '" + name + "'", line);
  }

  Value ModuleConstant(const std::string& module, const std::string& member, int line) {
    if (module == "math") {
      if (member == "pi") return std::numbers::pi;
      if (member == "e") return std::numbers::e;
    }
    if (!IsImportableModule(module)) RuntimeFail("module '" + module + "' is not available", line);
    RuntimeFail("module '" + module + "' has no constant '" + member + "'", line);
  }

  Value CallModule(const std::string& module, const std::string& member, std::vector<Value>& args, int line) {
    if (!IsImportableModule(module)) RuntimeFail("module '" + module + "' is not available", line);

    const std::string name = module + "." + member;
    if (member == "pow") {
      Arity(name, args, 2, 2, line);
      const double r = std::pow(ExpectNumber(args[0], name, line), ExpectNumber(args[1], name, line));
      if (std::isnan(r)) RuntimeFail("math domain error in " + name + "()", line);
      return r;
    }
    if (member == "log") {
      Arity(name, args, 1, 2, line);
      const double x = ExpectNumber(args[0], name, line);
      if (x <= 0.0) RuntimeFail("math domain error in " + name + "()", line);
      if (args.size() == 1) return std::log(x);
      const double base = ExpectNumber(args[1], name, line);
      if (base <= 0.0 || base == 1.0) RuntimeFail("math domain error in " + name + "()", line);
      return std::log(x) / std::log(base);
    }

    double (*unary)(double) = nullptr;
    if (member == "sqrt") {
      unary = [](double x) { return std::sqrt(x); };
    } else if (member == "exp") {
      unary = [](double x) { return std::exp(x); };
    } else if (member == "sin") {
      unary = [](double x) { return std::sin(x); };
    } else if (member == "cos") {
      unary = [](double x) { return std::cos(x); };
    } else if (member == "tanh") {
      unary = [](double x) { return std::tanh(x); };
    } else {
      RuntimeFail("module '" + module + "' has no function '" + member + "'", line);
    }

    Arity(name, args, 1, 1, line);
    const double x = ExpectNumber(args[0], name, line);
    if (member == "sqrt" && x < 0.0) RuntimeFail("math domain error in " + name + "()", line);
    return unary(x);
  }

  const std::unordered_map<std::string, const FunctionDecl*>& functions_;
  const Program&                                              program_;
  const Limits&                                               limits_;
  Heap&                                                       heap_;

  std::vector<std::pair<const List*, const List*>> comparing_;

  std::uint64_t                         steps_               = 0;
  std::uint64_t                         last_deadline_check_ = 0;
  std::uint32_t                         depth_               = 0;
  bool                                  has_deadline_        = false;
  std::chrono::steady_clock::time_point deadline_;
};

} // namespace

bool IsBuiltin(std::string_view name) {
  return Builtins().count(name) != 0;
}

bool IsImportableModule(std::string_view name) {
  return name == "math";
}

Interpreter::Interpreter(std::shared_ptr<const Program> program, Limits limits)
    : program_(std::move(program)), limits_(limits) {
  for (const auto& fn : program_->functions) {
    functions_.emplace(fn.name, &fn);
  }
}

Value Interpreter::Call(Heap& heap, const std::string& function, std::vector<Value> args) {
  last_steps_ = 0;

  for (const auto& import : program_->imports) {
    if (!IsImportableModule(import.name)) {
      throw ScriptError(ScriptError::Kind::kRuntime, "module '" + import.name + "' is not available", import.line);
    }
  }

  auto fn = functions_.find(function);
  if (fn == functions_.end()) {
    throw ScriptError(ScriptError::Kind::kRuntime, "function '" + function + "' is not defined");
  }

  Evaluator evaluator(functions_, *program_, limits_, heap);
  try {
    Value result = evaluator.Invoke(*fn->second, std::move(args), fn->second->line);
    last_steps_  = evaluator.steps();
    return result;
  } catch (const ScriptError&) {
    last_steps_ = evaluator.steps();
    throw;
  }
}

} // namespace arena::script
