#include "parser.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "script_error.hpp"

namespace arena::script {

namespace {

class Parser {
 public:
  Parser(std::vector<Token> tokens, const ParseLimits& limits) : tokens_(std::move(tokens)), limits_(limits) {
  }

  Program Run() {
    Program               program;
    std::set<std::string> seen;

    while (!Check(TokenKind::kEnd)) {
      if (Match(TokenKind::kImport)) {
        const int line = Previous().line;
        Token     name = Expect(TokenKind::kIdentifier, "module name after 'import'");
        Expect(TokenKind::kSemicolon, "';' after import");
        program.imports.push_back(ImportDecl{name.text, line});
        continue;
      }
      if (Check(TokenKind::kFn)) {
        FunctionDecl fn = Function();
        if (!seen.insert(fn.name).second) {
          throw ScriptError(ScriptError::Kind::kSyntax, "function '" + fn.name + "' is defined more than once", fn.line);
        }
        program.functions.push_back(std::move(fn));
        continue;
      }
      Fail("'fn' or 'import' at top level");
    }
    return program;
  }

 private:
  // Bounds recursion so hostile input cannot exhaust the native stack.
  class DepthGuard {
   public:
    explicit DepthGuard(Parser& parser) : parser_(parser) {
      if (++parser_.depth_ > parser_.limits_.max_nesting) {
        throw ScriptError(ScriptError::Kind::kSyntax, "nesting too deep", parser_.Peek().line);
      }
    }
    ~DepthGuard() {
      --parser_.depth_;
    }

    DepthGuard(const DepthGuard&)            = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

   private:
    Parser& parser_;
  };

  const Token& Peek() const {
    return tokens_[pos_];
  }

  const Token& Previous() const {
    return tokens_[pos_ - 1];
  }

  bool Check(TokenKind kind) const {
    return Peek().kind == kind;
  }

  bool Match(TokenKind kind) {
    if (!Check(kind)) return false;
    ++pos_;
    return true;
  }

  [[noreturn]] void Fail(std::string_view expected) const {
    const Token& t     = Peek();
    std::string  found = t.kind == TokenKind::kIdentifier ? "'" + t.text + "'" : std::string(TokenName(t.kind));
    throw ScriptError(ScriptError::Kind::kSyntax, "expected " + std::string(expected) + ", found " + found, t.line);
  }

  Token Expect(TokenKind kind, std::string_view what) {
    if (!Check(kind)) Fail(what);
    return tokens_[pos_++];
  }

  FunctionDecl Function() {
    FunctionDecl fn;
    fn.line = Expect(TokenKind::kFn, "'fn'").line;
    fn.name = Expect(TokenKind::kIdentifier, "function name").text;
    Expect(TokenKind::kLParen, "'(' after function name");
    if (!Check(TokenKind::kRParen)) {
      do {
        std::string param = Expect(TokenKind::kIdentifier, "parameter name").text;
        for (const auto& existing : fn.params) {
          if (existing == param) {
            throw ScriptError(ScriptError::Kind::kSyntax, "duplicate parameter '" + param + "'", Previous().line);
          }
        }
        fn.params.push_back(std::move(param));
      } while (Match(TokenKind::kComma));
    }
    Expect(TokenKind::kRParen, "')' after parameters");
    fn.body = Block();
    return fn;
  }

  std::vector<StmtPtr> Block() {
    DepthGuard guard(*this);
    Expect(TokenKind::kLBrace, "'{'");
    std::vector<StmtPtr> body;
    while (!Check(TokenKind::kRBrace)) {
      if (Check(TokenKind::kEnd)) Fail("'}'");
      body.push_back(Statement());
    }
    Expect(TokenKind::kRBrace, "'}'");
    return body;
  }

  StmtPtr NewStmt(StmtKind kind, int line) {
    auto stmt  = std::make_unique<Stmt>();
    stmt->kind = kind;
    stmt->line = line;
    return stmt;
  }

  StmtPtr Statement() {
    const int line = Peek().line;

    if (Match(TokenKind::kLet)) {
      auto stmt   = NewStmt(StmtKind::kLet, line);
      stmt->name  = Expect(TokenKind::kIdentifier, "variable name after 'let'").text;
      Expect(TokenKind::kAssign, "'=' in let");
      stmt->value = Expression();
      Expect(TokenKind::kSemicolon, "';' after let");
      return stmt;
    }
    if (Match(TokenKind::kIf)) {
      return IfTail(line);
    }
    if (Match(TokenKind::kWhile)) {
      auto stmt   = NewStmt(StmtKind::kWhile, line);
      stmt->value = Expression();
      stmt->body  = Block();
      return stmt;
    }
    if (Match(TokenKind::kFor)) {
      auto stmt  = NewStmt(StmtKind::kFor, line);
      stmt->name = Expect(TokenKind::kIdentifier, "loop variable after 'for'").text;
      Expect(TokenKind::kIn, "'in' after loop variable");
      stmt->value = Expression();
      stmt->body  = Block();
      return stmt;
    }
    if (Match(TokenKind::kReturn)) {
      auto stmt = NewStmt(StmtKind::kReturn, line);
      if (!Check(TokenKind::kSemicolon)) stmt->value = Expression();
      Expect(TokenKind::kSemicolon, "';' after return");
      return stmt;
    }
    if (Match(TokenKind::kBreak)) {
      Expect(TokenKind::kSemicolon, "';' after break");
      return NewStmt(StmtKind::kBreak, line);
    }
    if (Match(TokenKind::kContinue)) {
      Expect(TokenKind::kSemicolon, "';' after continue");
      return NewStmt(StmtKind::kContinue, line);
    }
    if (Check(TokenKind::kLBrace)) {
      auto stmt  = NewStmt(StmtKind::kBlock, line);
      stmt->body = Block();
      return stmt;
    }

    ExprPtr expr = Expression();
    if (Match(TokenKind::kAssign)) {
      StmtPtr stmt;
      if (expr->kind == ExprKind::kIdentifier) {
        stmt       = NewStmt(StmtKind::kAssign, line);
        stmt->name = expr->text;
      } else if (expr->kind == ExprKind::kIndex) {
        stmt         = NewStmt(StmtKind::kIndexAssign, line);
        stmt->target = std::move(expr->lhs);
        stmt->index  = std::move(expr->rhs);
      } else {
        throw ScriptError(ScriptError::Kind::kSyntax, "invalid assignment target", line);
      }
      stmt->value = Expression();
      Expect(TokenKind::kSemicolon, "';' after assignment");
      return stmt;
    }

    auto stmt   = NewStmt(StmtKind::kExpr, line);
    stmt->value = std::move(expr);
    Expect(TokenKind::kSemicolon, "';' after expression");
    return stmt;
  }

  StmtPtr IfTail(int line) {
    DepthGuard guard(*this);
    auto       stmt = NewStmt(StmtKind::kIf, line);
    stmt->value     = Expression();
    stmt->body      = Block();
    if (Match(TokenKind::kElse)) {
      if (Check(TokenKind::kIf)) {
        const int else_line = Peek().line;
        ++pos_;
        stmt->else_body.push_back(IfTail(else_line));
      } else {
        stmt->else_body = Block();
      }
    }
    return stmt;
  }

  ExprPtr NewExpr(ExprKind kind, int line) {
    auto expr  = std::make_unique<Expr>();
    expr->kind = kind;
    expr->line = line;
    return expr;
  }

  ExprPtr Sealed(ExprPtr expr) {
    std::size_t child = 0;
    if (expr->lhs) child = std::max(child, expr->lhs->height);
    if (expr->rhs) child = std::max(child, expr->rhs->height);
    for (const auto& arg : expr->args) child = std::max(child, arg->height);
    expr->height = child + 1;
    if (expr->height > limits_.max_expression_height) {
      throw ScriptError(ScriptError::Kind::kSyntax, "expression too deep", expr->line);
    }
    return expr;
  }

  ExprPtr MakeBinary(ExprKind kind, TokenKind op, ExprPtr lhs, ExprPtr rhs, int line) {
    auto expr = NewExpr(kind, line);
    expr->op  = op;
    expr->lhs = std::move(lhs);
    expr->rhs = std::move(rhs);
    return Sealed(std::move(expr));
  }

  ExprPtr Expression() {
    DepthGuard guard(*this);
    return Or();
  }

  ExprPtr Or() {
    ExprPtr lhs = And();
    while (Check(TokenKind::kOr)) {
      const int line = tokens_[pos_++].line;
      lhs            = MakeBinary(ExprKind::kLogical, TokenKind::kOr, std::move(lhs), And(), line);
    }
    return lhs;
  }

  ExprPtr And() {
    ExprPtr lhs = Equality();
    while (Check(TokenKind::kAnd)) {
      const int line = tokens_[pos_++].line;
      lhs            = MakeBinary(ExprKind::kLogical, TokenKind::kAnd, std::move(lhs), Equality(), line);
    }
    return lhs;
  }

  ExprPtr Equality() {
    ExprPtr lhs = Comparison();
    while (Check(TokenKind::kEq) || Check(TokenKind::kNe)) {
      const Token& op = tokens_[pos_++];
      lhs             = MakeBinary(ExprKind::kBinary, op.kind, std::move(lhs), Comparison(), op.line);
    }
    return lhs;
  }

  ExprPtr Comparison() {
    ExprPtr lhs = Additive();
    while (Check(TokenKind::kLt) || Check(TokenKind::kLe) || Check(TokenKind::kGt) || Check(TokenKind::kGe)) {
      const Token& op = tokens_[pos_++];
      lhs             = MakeBinary(ExprKind::kBinary, op.kind, std::move(lhs), Additive(), op.line);
    }
    return lhs;
  }

  ExprPtr Additive() {
    ExprPtr lhs = Term();
    while (Check(TokenKind::kPlus) || Check(TokenKind::kMinus)) {
      const Token& op = tokens_[pos_++];
      lhs             = MakeBinary(ExprKind::kBinary, op.kind, std::move(lhs), Term(), op.line);
    }
    return lhs;
  }

  ExprPtr Term() {
    ExprPtr lhs = Unary();
    while (Check(TokenKind::kStar) || Check(TokenKind::kSlash) || Check(TokenKind::kPercent)) {
      const Token& op = tokens_[pos_++];
      lhs             = MakeBinary(ExprKind::kBinary, op.kind, std::move(lhs), Unary(), op.line);
    }
    return lhs;
  }

  ExprPtr Unary() {
    if (Check(TokenKind::kMinus) || Check(TokenKind::kNot)) {
      DepthGuard   guard(*this);
      const Token& op = tokens_[pos_++];
      auto         expr = NewExpr(ExprKind::kUnary, op.line);
      expr->op          = op.kind;
      expr->lhs         = Unary();
      return Sealed(std::move(expr));
    }
    return Postfix();
  }

  ExprPtr Postfix() {
    ExprPtr expr = Primary();
    while (true) {
      const int line = Peek().line;
      if (Match(TokenKind::kLParen)) {
        auto call = NewExpr(ExprKind::kCall, line);
        call->lhs = std::move(expr);
        if (!Check(TokenKind::kRParen)) {
          do {
            call->args.push_back(Expression());
          } while (Match(TokenKind::kComma));
        }
        Expect(TokenKind::kRParen, "')' after arguments");
        expr = Sealed(std::move(call));
      } else if (Match(TokenKind::kDot)) {
        auto member  = NewExpr(ExprKind::kMember, line);
        member->lhs  = std::move(expr);
        member->text = Expect(TokenKind::kIdentifier, "member name after '.'").text;
        expr         = Sealed(std::move(member));
      } else if (Match(TokenKind::kLBracket)) {
        auto index = NewExpr(ExprKind::kIndex, line);
        index->lhs = std::move(expr);
        index->rhs = Expression();
        Expect(TokenKind::kRBracket, "']' after index");
        expr = Sealed(std::move(index));
      } else {
        return expr;
      }
    }
  }

  ExprPtr Primary() {
    const Token& t = Peek();
    switch (t.kind) {
      case TokenKind::kNumber: {
        auto expr    = NewExpr(ExprKind::kNumber, t.line);
        expr->number = t.number;
        ++pos_;
        return expr;
      }
      case TokenKind::kString: {
        auto expr  = NewExpr(ExprKind::kString, t.line);
        expr->text = t.text;
        ++pos_;
        return expr;
      }
      case TokenKind::kTrue:
      case TokenKind::kFalse: {
        auto expr     = NewExpr(ExprKind::kBool, t.line);
        expr->boolean = t.kind == TokenKind::kTrue;
        ++pos_;
        return expr;
      }
      case TokenKind::kNone: {
        auto expr = NewExpr(ExprKind::kNone, t.line);
        ++pos_;
        return expr;
      }
      case TokenKind::kIdentifier: {
        auto expr  = NewExpr(ExprKind::kIdentifier, t.line);
        expr->text = t.text;
        ++pos_;
        return expr;
      }
      case TokenKind::kLParen: {
        ++pos_;
        ExprPtr inner = Expression();
        Expect(TokenKind::kRParen, "')'");
        return inner;
      }
      case TokenKind::kLBracket: {
        auto expr = NewExpr(ExprKind::kList, t.line);
        ++pos_;
        if (!Check(TokenKind::kRBracket)) {
          do {
            expr->args.push_back(Expression());
          } while (Match(TokenKind::kComma));
        }
        Expect(TokenKind::kRBracket, "']' after list elements");
        return Sealed(std::move(expr));
      }
      default:
        Fail("expression");
    }
  }

  std::vector<Token> tokens_;
  ParseLimits        limits_;
  std::size_t        pos_   = 0;
  std::size_t        depth_ = 0;
};

} // namespace

Program Parse(std::string_view source, const ParseLimits& limits) {
  if (source.size() > limits.max_source_bytes) {
    throw ScriptError(ScriptError::Kind::kSyntax,
                      "source exceeds " + std::to_string(limits.max_source_bytes) + " bytes");
  }
  return Parser(Tokenize(source), limits).Run();
}

} // namespace arena::script
