#include "lexer.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <unordered_map>

#include "script_error.hpp"

namespace arena::script {

namespace {

const std::unordered_map<std::string_view, TokenKind>& Keywords() {
  static const std::unordered_map<std::string_view, TokenKind> kKeywords = {
      {"fn", TokenKind::kFn},         {"let", TokenKind::kLet},       {"if", TokenKind::kIf},
      {"else", TokenKind::kElse},     {"while", TokenKind::kWhile},   {"for", TokenKind::kFor},
      {"in", TokenKind::kIn},         {"return", TokenKind::kReturn}, {"break", TokenKind::kBreak},
      {"continue", TokenKind::kContinue}, {"true", TokenKind::kTrue}, {"false", TokenKind::kFalse},
      {"none", TokenKind::kNone},     {"import", TokenKind::kImport}, {"and", TokenKind::kAnd},
      {"or", TokenKind::kOr},         {"not", TokenKind::kNot},
  };
  return kKeywords;
}

class Lexer {
 public:
  explicit Lexer(std::string_view source) : src_(source) {
  }

  std::vector<Token> Run() {
    std::vector<Token> tokens;
    while (true) {
      SkipTrivia();
      if (AtEnd()) {
        tokens.push_back(Token{TokenKind::kEnd, "", 0.0, line_});
        return tokens;
      }
      tokens.push_back(Next());
    }
  }

 private:
  bool AtEnd() const {
    return pos_ >= src_.size();
  }

  char Peek(std::size_t ahead = 0) const {
    return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
  }

  void SkipTrivia() {
    while (!AtEnd()) {
      const char c = Peek();
      if (c == '\n') {
        ++line_;
        ++pos_;
      } else if (std::isspace(static_cast<unsigned char>(c))) {
        ++pos_;
      } else if (c == '#' || (c == '/' && Peek(1) == '/')) {
        while (!AtEnd() && Peek() != '\n') ++pos_;
      } else {
        return;
      }
    }
  }

  Token Simple(TokenKind kind, std::size_t width) {
    Token t{kind, std::string(src_.substr(pos_, width)), 0.0, line_};
    pos_ += width;
    return t;
  }

  Token Next() {
    const char c = Peek();

    if (std::isdigit(static_cast<unsigned char>(c)) || (c == '.' && std::isdigit(static_cast<unsigned char>(Peek(1))))) {
      return Number();
    }
    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
      return Word();
    }
    if (c == '"' || c == '\'') {
      return String(c);
    }

    switch (c) {
      case '(': return Simple(TokenKind::kLParen, 1);
      case ')': return Simple(TokenKind::kRParen, 1);
      case '{': return Simple(TokenKind::kLBrace, 1);
      case '}': return Simple(TokenKind::kRBrace, 1);
      case '[': return Simple(TokenKind::kLBracket, 1);
      case ']': return Simple(TokenKind::kRBracket, 1);
      case ',': return Simple(TokenKind::kComma, 1);
      case ';': return Simple(TokenKind::kSemicolon, 1);
      case '.': return Simple(TokenKind::kDot, 1);
      case '+': return Simple(TokenKind::kPlus, 1);
      case '-': return Simple(TokenKind::kMinus, 1);
      case '*': return Simple(TokenKind::kStar, 1);
      case '/': return Simple(TokenKind::kSlash, 1);
      case '%': return Simple(TokenKind::kPercent, 1);
      case '=': return Peek(1) == '=' ? Simple(TokenKind::kEq, 2) : Simple(TokenKind::kAssign, 1);
      case '!': return Peek(1) == '=' ? Simple(TokenKind::kNe, 2) : Simple(TokenKind::kNot, 1);
      case '<': return Peek(1) == '=' ? Simple(TokenKind::kLe, 2) : Simple(TokenKind::kLt, 1);
      case '>': return Peek(1) == '=' ? Simple(TokenKind::kGe, 2) : Simple(TokenKind::kGt, 1);
      case '&':
        if (Peek(1) == '&') return Simple(TokenKind::kAnd, 2);
        break;
      case '|':
        if (Peek(1) == '|') return Simple(TokenKind::kOr, 2);
        break;
      default:
        break;
    }

    std::string shown = std::isprint(static_cast<unsigned char>(c)) ? std::string(1, c) : "\\x" + std::to_string(static_cast<unsigned char>(c));
    throw ScriptError(ScriptError::Kind::kSyntax, "unexpected character '" + shown + "'", line_);
  }

  Token Number() {
    const std::size_t start = pos_;
    while (std::isdigit(static_cast<unsigned char>(Peek()))) ++pos_;
    if (Peek() == '.' && std::isdigit(static_cast<unsigned char>(Peek(1)))) {
      ++pos_;
      while (std::isdigit(static_cast<unsigned char>(Peek()))) ++pos_;
    }
    if (Peek() == 'e' || Peek() == 'E') {
      std::size_t save = pos_;
      ++pos_;
      if (Peek() == '+' || Peek() == '-') ++pos_;
      if (!std::isdigit(static_cast<unsigned char>(Peek()))) {
        pos_ = save;
      } else {
        while (std::isdigit(static_cast<unsigned char>(Peek()))) ++pos_;
      }
    }

    std::string text(src_.substr(start, pos_ - start));
    errno             = 0;
    char*        end  = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (errno == ERANGE || end != text.c_str() + text.size()) {
      throw ScriptError(ScriptError::Kind::kSyntax, "invalid number literal '" + text + "'", line_);
    }
    return Token{TokenKind::kNumber, std::move(text), value, line_};
  }

  Token Word() {
    const std::size_t start = pos_;
    while (std::isalnum(static_cast<unsigned char>(Peek())) || Peek() == '_') ++pos_;
    std::string_view word = src_.substr(start, pos_ - start);

    const auto& keywords = Keywords();
    auto        it       = keywords.find(word);
    return Token{it == keywords.end() ? TokenKind::kIdentifier : it->second, std::string(word), 0.0, line_};
  }

  Token String(char quote) {
    const int start_line = line_;
    ++pos_;
    std::string value;
    while (true) {
      if (AtEnd() || Peek() == '\n') {
        throw ScriptError(ScriptError::Kind::kSyntax, "unterminated string literal", start_line);
      }
      const char c = Peek();
      ++pos_;
      if (c == quote) break;
      if (c != '\\') {
        value.push_back(c);
        continue;
      }
      const char esc = Peek();
      ++pos_;
      switch (esc) {
        case 'n': value.push_back('\n'); break;
        case 't': value.push_back('\t'); break;
        case '\\': value.push_back('\\'); break;
        case '"': value.push_back('"'); break;
        case '\'': value.push_back('\''); break;
        default:
          throw ScriptError(ScriptError::Kind::kSyntax, std::string("unknown escape sequence '\\") + esc + "'", start_line);
      }
    }
    return Token{TokenKind::kString, std::move(value), 0.0, start_line};
  }

  std::string_view src_;
  std::size_t      pos_  = 0;
  int              line_ = 1;
};

} // namespace

std::string_view TokenName(TokenKind kind) {
  switch (kind) {
    case TokenKind::kEnd: return "end of input";
    case TokenKind::kNumber: return "number";
    case TokenKind::kString: return "string";
    case TokenKind::kIdentifier: return "identifier";
    case TokenKind::kFn: return "'fn'";
    case TokenKind::kLet: return "'let'";
    case TokenKind::kIf: return "'if'";
    case TokenKind::kElse: return "'else'";
    case TokenKind::kWhile: return "'while'";
    case TokenKind::kFor: return "'for'";
    case TokenKind::kIn: return "'in'";
    case TokenKind::kReturn: return "'return'";
    case TokenKind::kBreak: return "'break'";
    case TokenKind::kContinue: return "'continue'";
    case TokenKind::kTrue: return "'true'";
    case TokenKind::kFalse: return "'false'";
    case TokenKind::kNone: return "'none'";
    case TokenKind::kImport: return "'import'";
    case TokenKind::kAnd: return "'and'";
    case TokenKind::kOr: return "'or'";
    case TokenKind::kNot: return "'not'";
    case TokenKind::kLParen: return "'('";
    case TokenKind::kRParen: return "')'";
    case TokenKind::kLBrace: return "'{'";
    case TokenKind::kRBrace: return "'}'";
    case TokenKind::kLBracket: return "'['";
    case TokenKind::kRBracket: return "']'";
    case TokenKind::kComma: return "','";
    case TokenKind::kSemicolon: return "';'";
    case TokenKind::kDot: return "'.'";
    case TokenKind::kAssign: return "'='";
    case TokenKind::kPlus: return "'+'";
    case TokenKind::kMinus: return "'-'";
    case TokenKind::kStar: return "'*'";
    case TokenKind::kSlash: return "'/'";
    case TokenKind::kPercent: return "'%'";
    case TokenKind::kEq: return "'=='";
    case TokenKind::kNe: return "'!='";
    case TokenKind::kLt: return "'<'";
    case TokenKind::kLe: return "'<='";
    case TokenKind::kGt: return "'>'";
    case TokenKind::kGe: return "'>='";
  }
  return "token";
}

std::vector<Token> Tokenize(std::string_view source) {
  return Lexer(source).Run();
}

} // namespace arena::script
