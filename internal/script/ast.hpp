#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "lexer.hpp"

namespace arena::script {

enum class ExprKind : std::uint8_t {
  kNumber,
  kString,
  kBool,
  kNone,
  kIdentifier,
  kList,
  kUnary,
  kBinary,
  kLogical,
  kCall,
  kMember,
  kIndex,
};

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

/*
  Expression node.

  Field use by kind:
      kNumber      number
      kString      text
      kBool        boolean
      kIdentifier  text
      kList        args (elements)
      kUnary       op, lhs
      kBinary      op, lhs, rhs
      kLogical     op (kAnd/kOr), lhs, rhs
      kCall        lhs (callee), args
      kMember      lhs (object), text (member name)
      kIndex       lhs (object), rhs (index)
*/
struct Expr {
  ExprKind             kind    = ExprKind::kNone;
  int                  line    = 0;
  std::size_t          height  = 1;
  double               number  = 0.0;
  bool                 boolean = false;
  std::string          text;
  TokenKind            op = TokenKind::kEnd;
  ExprPtr              lhs;
  ExprPtr              rhs;
  std::vector<ExprPtr> args;
};

enum class StmtKind : std::uint8_t {
  kLet,
  kAssign,
  kIndexAssign,
  kIf,
  kWhile,
  kFor,
  kReturn,
  kBreak,
  kContinue,
  kExpr,
  kBlock,
};

struct Stmt;
using StmtPtr = std::unique_ptr<Stmt>;

/*
  Statement node.

      kLet / kAssign  name = value
      kIndexAssign    target[index] = value
      kIf             if (value) body else else_body
      kWhile          while (value) body
      kFor            for name in value body
      kReturn         return value (may be null)
      kExpr           value
      kBlock          body
*/
struct Stmt {
  StmtKind             kind = StmtKind::kBlock;
  int                  line = 0;
  std::string          name;
  ExprPtr              target;
  ExprPtr              index;
  ExprPtr              value;
  std::vector<StmtPtr> body;
  std::vector<StmtPtr> else_body;
};

struct FunctionDecl {
  std::string              name;
  std::vector<std::string> params;
  std::vector<StmtPtr>     body;
  int                      line = 0;
};

struct ImportDecl {
  std::string name;
  int         line = 0;
};

struct Program {
  std::vector<ImportDecl>   imports;
  std::vector<FunctionDecl> functions;

  const FunctionDecl* FindFunction(const std::string& name) const {
    for (const auto& fn : functions) {
      if (fn.name == name) return &fn;
    }
    return nullptr;
  }
};

} // namespace arena::script
