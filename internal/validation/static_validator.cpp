#include "internal/validation/static_validator.hpp"

#include <unordered_set>

#include "internal/script/interpreter.hpp"
#include "internal/script/script_error.hpp"

namespace arena::validation {

namespace {

using arena::core::v1::ValidationErrorKind;
using arena::core::v1::ValidationResult;
using script::Expr;
using script::ExprKind;
using script::FunctionDecl;
using script::Stmt;
using script::StmtKind;

const std::unordered_set<std::string_view>& DeniedNames() {
  static const std::unordered_set<std::string_view> kDenied = {
      // filesystem
      "open", "read_file", "write_file", "file", "fopen", "remove", "unlink", "rmdir", "mkdir", "listdir", "chmod",
      "rename",
      // network
      "socket", "connect", "http_get", "http_post", "fetch", "urlopen", "request", "requests", "urllib", "bind",
      "listen",
      // process
      "system", "exec", "execv", "spawn", "fork", "popen", "subprocess", "kill", "exit", "os", "sys",
      // dynamic import and code loading
      "__import__", "import_module", "importlib", "load", "require", "eval", "compile", "loadstring",
      // reflection
      "globals", "locals", "vars", "getattr", "setattr", "delattr", "env", "getenv", "setenv", "builtins", "dir",
  };
  return kDenied;
}

const char* KindLabel(ValidationErrorKind kind) {
  switch (kind) {
    case arena::core::v1::VALIDATION_ERROR_KIND_SYNTAX_ERROR: return "SyntaxError";
    case arena::core::v1::VALIDATION_ERROR_KIND_FORBIDDEN_CONSTRUCT: return "ForbiddenConstruct";
    case arena::core::v1::VALIDATION_ERROR_KIND_MISSING_ENTRY_POINT: return "MissingEntryPoint";
    default: return "ValidationError";
  }
}

// Walks the tree in source order and reports the first denied name.
class DenylistScan {
 public:
  std::string Run(const script::Program& program) {
    for (const auto& import : program.imports) {
      if (!script::IsImportableModule(import.name)) return "import:" + import.name;
    }
    for (const auto& fn : program.functions) {
      if (Check(fn.name)) return found_;
      for (const auto& param : fn.params) {
        if (Check(param)) return found_;
      }
      if (Body(fn.body)) return found_;
      if (CallsSelfUnconditionally(fn)) return "unbounded_recursion:" + fn.name;
    }
    return {};
  }

 private:
  bool Check(const std::string& name) {
    if (IsDeniedName(name)) {
      found_ = name;
      return true;
    }
    return false;
  }

  bool Body(const std::vector<script::StmtPtr>& body) {
    for (const auto& stmt : body) {
      if (Statement(*stmt)) return true;
    }
    return false;
  }

  bool Statement(const Stmt& stmt) {
    if (!stmt.name.empty() && Check(stmt.name)) return true;
    if (stmt.target && Expression(*stmt.target)) return true;
    if (stmt.index && Expression(*stmt.index)) return true;
    if (stmt.value && Expression(*stmt.value)) return true;
    return Body(stmt.body) || Body(stmt.else_body);
  }

  bool Expression(const Expr& expr) {
    if ((expr.kind == ExprKind::kIdentifier || expr.kind == ExprKind::kMember) && Check(expr.text)) return true;
    if (expr.lhs && Expression(*expr.lhs)) return true;
    if (expr.rhs && Expression(*expr.rhs)) return true;
    for (const auto& arg : expr.args) {
      if (Expression(*arg)) return true;
    }
    return false;
  }

  static bool CallsFunction(const Expr& expr, const std::string& name) {
    if (expr.kind == ExprKind::kCall && expr.lhs->kind == ExprKind::kIdentifier && expr.lhs->text == name) {
      return true;
    }
    if (expr.kind == ExprKind::kLogical) {
      // Only the left operand is evaluated unconditionally.
      return CallsFunction(*expr.lhs, name);
    }
    if (expr.lhs && CallsFunction(*expr.lhs, name)) return true;
    if (expr.rhs && CallsFunction(*expr.rhs, name)) return true;
    for (const auto& arg : expr.args) {
      if (CallsFunction(*arg, name)) return true;
    }
    return false;
  }

  static bool ContainsReturn(const std::vector<script::StmtPtr>& body) {
    for (const auto& stmt : body) {
      if (stmt->kind == StmtKind::kReturn) return true;
      if (ContainsReturn(stmt->body) || ContainsReturn(stmt->else_body)) return true;
    }
    return false;
  }

  // True when the expressions evaluated on every path through `body`, up to
  // the first statement that may return, call `name`.
  static bool UnconditionalCall(const std::vector<script::StmtPtr>& body, const std::string& name) {
    for (const auto& stmt : body) {
      const bool evaluated_first = stmt->kind != StmtKind::kBlock;
      if (evaluated_first) {
        if (stmt->target && CallsFunction(*stmt->target, name)) return true;
        if (stmt->index && CallsFunction(*stmt->index, name)) return true;
        if (stmt->value && CallsFunction(*stmt->value, name)) return true;
      }
      if (stmt->kind == StmtKind::kReturn) return false;
      if (stmt->kind == StmtKind::kBlock) {
        if (UnconditionalCall(stmt->body, name)) return true;
        if (ContainsReturn(stmt->body)) return false;
        continue;
      }
      if (ContainsReturn(stmt->body) || ContainsReturn(stmt->else_body)) return false;
    }
    return false;
  }

  static bool CallsSelfUnconditionally(const FunctionDecl& fn) {
    return UnconditionalCall(fn.body, fn.name);
  }

  std::string found_;
};

} // namespace

StaticValidator::StaticValidator(script::ParseLimits limits) : limits_(limits) {
}

ValidationResult StaticValidator::Validate(std::string_view source) const {
  script::Program program;
  try {
    program = script::Parse(source, limits_);
  } catch (const script::ScriptError& e) {
    return Rejected(arena::core::v1::VALIDATION_ERROR_KIND_SYNTAX_ERROR, e.what());
  }

  DenylistScan scan;
  if (std::string construct = scan.Run(program); !construct.empty()) {
    return Rejected(arena::core::v1::VALIDATION_ERROR_KIND_FORBIDDEN_CONSTRUCT, std::move(construct));
  }

  const std::string entry(kEntryPointName);
  const auto*       fn = program.FindFunction(entry);
  if (fn == nullptr) {
    return Rejected(arena::core::v1::VALIDATION_ERROR_KIND_MISSING_ENTRY_POINT, "no function named " + entry);
  }
  if (fn->params.size() != kEntryPointArity) {
    return Rejected(arena::core::v1::VALIDATION_ERROR_KIND_MISSING_ENTRY_POINT,
                    entry + " must take exactly 2 parameters (ctx, state), found " + std::to_string(fn->params.size()));
  }

  return Accepted();
}

std::string StripCodeFences(std::string_view source) {
  auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };

  std::size_t begin = 0;
  std::size_t end   = source.size();
  while (begin < end && is_space(source[begin])) ++begin;
  while (end > begin && is_space(source[end - 1])) --end;
  std::string_view body = source.substr(begin, end - begin);

  if (body.substr(0, 3) != "```") {
    return std::string(source);
  }

  const std::size_t first_newline = body.find('\n');
  if (first_newline == std::string_view::npos) {
    return {};
  }
  body.remove_prefix(first_newline + 1);

  if (body.size() >= 3 && body.substr(body.size() - 3) == "```") {
    body.remove_suffix(3);
  }
  return std::string(body);
}

ValidationResult Accepted() {
  ValidationResult result;
  result.set_accepted(true);
  return result;
}

ValidationResult Rejected(ValidationErrorKind kind, std::string detail) {
  ValidationResult result;
  result.set_accepted(false);
  result.set_error_kind(kind);
  result.set_reason(std::string(KindLabel(kind)) + ": " + detail);
  result.set_detail(std::move(detail));
  return result;
}

bool IsDeniedName(std::string_view name) {
  return name.substr(0, 2) == "__" || DeniedNames().count(name) != 0;
}

} // namespace arena::validation
