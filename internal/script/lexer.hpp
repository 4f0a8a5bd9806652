#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace arena::script {

enum class TokenKind : std::uint8_t {
  kEnd,
  kNumber,
  kString,
  kIdentifier,

  // keywords
  kFn,
  kLet,
  kIf,
  kElse,
  kWhile,
  kFor,
  kIn,
  kReturn,
  kBreak,
  kContinue,
  kTrue,
  kFalse,
  kNone,
  kImport,
  kAnd,
  kOr,
  kNot,

  // punctuation
  kLParen,
  kRParen,
  kLBrace,
  kRBrace,
  kLBracket,
  kRBracket,
  kComma,
  kSemicolon,
  kDot,
  kAssign,

  // operators
  kPlus,
  kMinus,
  kStar,
  kSlash,
  kPercent,
  kEq,
  kNe,
  kLt,
  kLe,
  kGt,
  kGe,
};

struct Token {
  TokenKind   kind = TokenKind::kEnd;
  std::string text;
  double      number = 0.0;
  int         line   = 1;
};

std::string_view TokenName(TokenKind kind);

// Splits BidScript source into tokens. Throws ScriptError(kSyntax).
std::vector<Token> Tokenize(std::string_view source);

} // namespace arena::script
