#include "lang_lexer.h"

#include <cctype>
#include <unordered_map>

namespace Brisk::Lang {

namespace {

const std::unordered_map<std::string, TokenKind> kKeywords = {
  {"fn", TokenKind::KwFn},
  {"if", TokenKind::KwIf},
  {"else", TokenKind::KwElse},
  {"loop", TokenKind::KwLoop},
  {"break", TokenKind::KwBreak},
  {"true", TokenKind::KwTrue},
  {"false", TokenKind::KwFalse},
};

bool IsIdentStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool IsIdentPart(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

Lexer::Lexer(std::string source) : source_(std::move(source)) {}

const char* ToString(TokenKind kind) {
  switch (kind) {
    case TokenKind::End: return "end";
    case TokenKind::Invalid: return "invalid";
    case TokenKind::Identifier: return "identifier";
    case TokenKind::Integer: return "integer";
    case TokenKind::String: return "string";
    case TokenKind::KwFn: return "fn";
    case TokenKind::KwIf: return "if";
    case TokenKind::KwElse: return "else";
    case TokenKind::KwLoop: return "loop";
    case TokenKind::KwBreak: return "break";
    case TokenKind::KwTrue: return "true";
    case TokenKind::KwFalse: return "false";
    case TokenKind::LParen: return "(";
    case TokenKind::RParen: return ")";
    case TokenKind::LBrace: return "{";
    case TokenKind::RBrace: return "}";
    case TokenKind::Comma: return ",";
    case TokenKind::Semicolon: return ";";
    case TokenKind::Assign: return "=";
    case TokenKind::Plus: return "+";
    case TokenKind::Minus: return "-";
    case TokenKind::Star: return "*";
    case TokenKind::Slash: return "/";
    case TokenKind::Percent: return "%";
    case TokenKind::EqEq: return "==";
    case TokenKind::Lt: return "<";
    case TokenKind::Le: return "<=";
    case TokenKind::Gt: return ">";
    case TokenKind::Ge: return ">=";
  }
  return "unknown";
}

bool Lexer::Lex() {
  tokens_.clear();
  error_.clear();

  while (!IsAtEnd()) {
    if (!SkipWhitespaceAndComments()) return false;
    if (IsAtEnd()) break;

    char c = Peek();
    if (IsIdentStart(c)) {
      if (!LexIdentifierOrKeyword()) return false;
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(c))) {
      if (!LexNumber()) return false;
      continue;
    }

    switch (c) {
      case '(': AddSimpleToken(TokenKind::LParen); break;
      case ')': AddSimpleToken(TokenKind::RParen); break;
      case '{': AddSimpleToken(TokenKind::LBrace); break;
      case '}': AddSimpleToken(TokenKind::RBrace); break;
      case ',': AddSimpleToken(TokenKind::Comma); break;
      case ';': AddSimpleToken(TokenKind::Semicolon); break;
      case '+': AddSimpleToken(TokenKind::Plus); break;
      case '-': AddSimpleToken(TokenKind::Minus); break;
      case '*': AddSimpleToken(TokenKind::Star); break;
      case '/': AddSimpleToken(TokenKind::Slash); break;
      case '%': AddSimpleToken(TokenKind::Percent); break;
      case '=':
        Advance();
        if (Match('=')) {
          AddToken(TokenKind::EqEq, "==");
        } else {
          AddToken(TokenKind::Assign, "=");
        }
        break;
      case '<':
        Advance();
        if (Match('=')) {
          AddToken(TokenKind::Le, "<=");
        } else {
          AddToken(TokenKind::Lt, "<");
        }
        break;
      case '>':
        Advance();
        if (Match('=')) {
          AddToken(TokenKind::Ge, ">=");
        } else {
          AddToken(TokenKind::Gt, ">");
        }
        break;
      case '"':
        if (!LexString()) return false;
        break;
      default:
        SetError(line_, column_, "unexpected character '" + std::string(1, c) + "'");
        return false;
    }
  }

  Token end;
  end.kind = TokenKind::End;
  end.text = "";
  end.line = line_;
  end.column = column_;
  tokens_.push_back(end);
  return true;
}

char Lexer::Peek(size_t offset) const {
  if (index_ + offset >= source_.size()) return '\0';
  return source_[index_ + offset];
}

char Lexer::Advance() {
  if (IsAtEnd()) return '\0';
  char c = source_[index_++];
  if (c == '\n') {
    ++line_;
    column_ = 1;
  } else {
    ++column_;
  }
  return c;
}

bool Lexer::Match(char expected) {
  if (IsAtEnd()) return false;
  if (source_[index_] != expected) return false;
  Advance();
  return true;
}

bool Lexer::IsAtEnd() const {
  return index_ >= source_.size();
}

bool Lexer::SkipWhitespaceAndComments() {
  for (;;) {
    char c = Peek();
    if (std::isspace(static_cast<unsigned char>(c))) {
      Advance();
      continue;
    }
    if (c == '/' && Peek(1) == '/') {
      while (!IsAtEnd() && Peek() != '\n') {
        Advance();
      }
      continue;
    }
    if (c == '/' && Peek(1) == '*') {
      uint32_t start_line = line_;
      uint32_t start_col = column_;
      Advance();
      Advance();
      bool closed = false;
      while (!IsAtEnd()) {
        if (Peek() == '*' && Peek(1) == '/') {
          Advance();
          Advance();
          closed = true;
          break;
        }
        Advance();
      }
      if (!closed) {
        SetError(start_line, start_col, "unterminated block comment");
        return false;
      }
      continue;
    }
    break;
  }
  return true;
}

void Lexer::AddToken(TokenKind kind, const std::string& text) {
  Token tok;
  tok.kind = kind;
  tok.text = text;
  tok.line = line_;
  tok.column = column_ - static_cast<uint32_t>(text.size());
  tokens_.push_back(tok);
}

void Lexer::AddSimpleToken(TokenKind kind) {
  char c = Advance();
  AddToken(kind, std::string(1, c));
}

void Lexer::SetError(uint32_t line, uint32_t column, const std::string& message) {
  error_ = std::to_string(line) + ":" + std::to_string(column) + ": " + message;
}

bool Lexer::LexIdentifierOrKeyword() {
  size_t start = index_;
  while (IsIdentPart(Peek())) {
    Advance();
  }
  std::string text = source_.substr(start, index_ - start);
  auto it = kKeywords.find(text);
  if (it != kKeywords.end()) {
    AddToken(it->second, text);
  } else {
    AddToken(TokenKind::Identifier, text);
  }
  return true;
}

bool Lexer::LexNumber() {
  size_t start = index_;
  while (std::isdigit(static_cast<unsigned char>(Peek()))) {
    Advance();
  }
  if (IsIdentStart(Peek())) {
    SetError(line_, column_, "invalid character in integer literal");
    return false;
  }
  std::string text = source_.substr(start, index_ - start);
  AddToken(TokenKind::Integer, text);
  return true;
}

bool Lexer::LexString() {
  uint32_t start_line = line_;
  uint32_t start_col = column_;
  Advance();
  std::string value;
  while (!IsAtEnd()) {
    char c = Advance();
    if (c == '"') {
      Token tok;
      tok.kind = TokenKind::String;
      tok.text = value;
      tok.line = start_line;
      tok.column = start_col;
      tokens_.push_back(tok);
      return true;
    }
    if (c == '\\') {
      char esc = Advance();
      switch (esc) {
        case 'n': value.push_back('\n'); break;
        case 't': value.push_back('\t'); break;
        case 'r': value.push_back('\r'); break;
        case '"': value.push_back('"'); break;
        case '\\': value.push_back('\\'); break;
        default:
          SetError(start_line, start_col, "invalid string escape");
          return false;
      }
    } else {
      value.push_back(c);
    }
  }
  SetError(start_line, start_col, "unterminated string literal");
  return false;
}

} // namespace Brisk::Lang
