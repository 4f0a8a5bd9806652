#pragma once

#include <cstddef>
#include <string_view>

#include "ast.hpp"

namespace arena::script {

struct ParseLimits {
  std::size_t max_source_bytes = 64 * 1024;
  std::size_t max_nesting      = 200;
  // Longest chain of operators or postfix operations in one expression tree.
  std::size_t max_expression_height = 256;
};

/*
  Recursive-descent parser for BidScript.

  Grammar (lowest precedence first):

      program    := { "import" IDENT ";" | function }
      function   := "fn" IDENT "(" [ IDENT { "," IDENT } ] ")" block
      block      := "{" { statement } "}"
      expression := or
      or         := and { ("||" | "or") and }
      and        := equality { ("&&" | "and") equality }
      equality   := comparison { ("==" | "!=") comparison }
      comparison := additive { ("<" | "<=" | ">" | ">=") additive }
      additive   := term { ("+" | "-") term }
      term       := unary { ("*" | "/" | "%") unary }
      unary      := ("-" | "!" | "not") unary | postfix
      postfix    := primary { "(" args ")" | "." IDENT | "[" expression "]" }

  Throws ScriptError(kSyntax) on malformed input, oversized input, nesting
  beyond the limit and duplicate function names.
*/
Program Parse(std::string_view source, const ParseLimits& limits = {});

} // namespace arena::script
