#pragma once

#include <string>
#include <vector>

#include "lang_ast.h"
#include "lang_token.h"

namespace Brisk::Lang {

class Parser {
public:
  explicit Parser(std::vector<Token> tokens);

  const std::string& Error() const { return error_; }

  bool ParseProgram(Program* out);

private:
  const Token& Peek(size_t offset = 0) const;
  const Token& Advance();
  bool Match(TokenKind kind);
  bool IsAtEnd() const;
  bool Fail(const Token& at, const std::string& message);

  bool ParseStatement(Statement* out);
  bool ParseFnDef(FnDef* out);
  bool ParseParamList(std::vector<std::string>* out);
  bool ParseBlock(std::vector<BlockLine>* out);
  bool ParseBlockLine(BlockLine* out);
  bool ParseExpr(Expr* out);
  bool ParseBinaryExpr(int min_prec, Expr* out);
  bool ParseUnaryExpr(Expr* out);
  bool ParsePrimaryExpr(Expr* out);
  bool ParseIfExpr(Expr* out);
  bool ParseCallArgs(std::vector<Expr>* out);
  bool ParseIntegerLiteral(const Token& tok, bool negative, int32_t* out);
  bool GetBinaryOperator(const Token& tok, Operator* out) const;

  std::vector<Token> tokens_;
  size_t index_ = 0;
  std::string error_;
};

bool ParseProgramFromString(const std::string& text, Program* out, std::string* error);

} // namespace Brisk::Lang
