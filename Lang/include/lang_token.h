#pragma once

#include <cstdint>
#include <string>

namespace Brisk::Lang {

enum class TokenKind : uint8_t {
  End,
  Invalid,

  Identifier,
  Integer,
  String,

  KwFn,
  KwIf,
  KwElse,
  KwLoop,
  KwBreak,
  KwTrue,
  KwFalse,

  LParen,
  RParen,
  LBrace,
  RBrace,
  Comma,
  Semicolon,

  Assign,

  Plus,
  Minus,
  Star,
  Slash,
  Percent,

  EqEq,
  Lt,
  Le,
  Gt,
  Ge,
};

struct Token {
  TokenKind kind = TokenKind::Invalid;
  std::string text;
  uint32_t line = 1;
  uint32_t column = 1;
};

const char* ToString(TokenKind kind);

} // namespace Brisk::Lang
