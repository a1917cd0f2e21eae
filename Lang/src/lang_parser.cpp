#include "lang_parser.h"

#include "lang_lexer.h"

namespace Brisk::Lang {

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
  if (tokens_.empty() || tokens_.back().kind != TokenKind::End) {
    Token end;
    end.kind = TokenKind::End;
    if (!tokens_.empty()) {
      end.line = tokens_.back().line;
      end.column = tokens_.back().column;
    }
    tokens_.push_back(end);
  }
}

const Token& Parser::Peek(size_t offset) const {
  if (index_ + offset >= tokens_.size()) return tokens_.back();
  return tokens_[index_ + offset];
}

const Token& Parser::Advance() {
  if (IsAtEnd()) return tokens_.back();
  return tokens_[index_++];
}

bool Parser::Match(TokenKind kind) {
  if (Peek().kind == kind) {
    Advance();
    return true;
  }
  return false;
}

bool Parser::IsAtEnd() const {
  return Peek().kind == TokenKind::End;
}

bool Parser::Fail(const Token& at, const std::string& message) {
  error_ = std::to_string(at.line) + ":" + std::to_string(at.column) + ": " + message;
  return false;
}

bool Parser::ParseProgram(Program* out) {
  if (!out) return false;
  out->statements.clear();
  error_.clear();
  while (!IsAtEnd()) {
    Statement stmt;
    if (!ParseStatement(&stmt)) return false;
    out->statements.push_back(std::move(stmt));
  }
  return true;
}

bool Parser::ParseStatement(Statement* out) {
  if (Peek().kind == TokenKind::KwFn) {
    out->kind = StatementKind::FnDef;
    return ParseFnDef(&out->fn);
  }
  out->kind = StatementKind::BlockLine;
  return ParseBlockLine(&out->line);
}

bool Parser::ParseFnDef(FnDef* out) {
  const Token& fn_tok = Advance();
  out->line = fn_tok.line;
  out->column = fn_tok.column;
  const Token& name_tok = Peek();
  if (name_tok.kind != TokenKind::Identifier) {
    return Fail(name_tok, "expected function name after 'fn'");
  }
  out->name = name_tok.text;
  Advance();
  if (!Match(TokenKind::LParen)) {
    return Fail(Peek(), "expected '(' after function name");
  }
  if (!ParseParamList(&out->params)) return false;
  if (!ParseBlock(&out->block)) return false;
  Match(TokenKind::Semicolon);
  return true;
}

bool Parser::ParseParamList(std::vector<std::string>* out) {
  if (Match(TokenKind::RParen)) return true;
  for (;;) {
    const Token& tok = Peek();
    if (tok.kind != TokenKind::Identifier) {
      return Fail(tok, "expected parameter name");
    }
    out->push_back(tok.text);
    Advance();
    if (Match(TokenKind::Comma)) continue;
    if (Match(TokenKind::RParen)) break;
    return Fail(Peek(), "expected ',' or ')' after parameter");
  }
  return true;
}

bool Parser::ParseBlock(std::vector<BlockLine>* out) {
  if (!Match(TokenKind::LBrace)) {
    return Fail(Peek(), "expected '{'");
  }
  while (!Match(TokenKind::RBrace)) {
    if (IsAtEnd()) {
      return Fail(Peek(), "expected '}' before end of input");
    }
    BlockLine line;
    if (!ParseBlockLine(&line)) return false;
    out->push_back(std::move(line));
  }
  return true;
}

bool Parser::ParseBlockLine(BlockLine* out) {
  const Token& start = Peek();
  out->line = start.line;
  out->column = start.column;

  if (start.kind == TokenKind::KwFn) {
    return Fail(start, "function definitions are only allowed at the top level");
  }

  if (Match(TokenKind::KwLoop)) {
    out->kind = BlockLineKind::Loop;
    if (!ParseBlock(&out->body)) return false;
    Match(TokenKind::Semicolon);
    return true;
  }

  if (Match(TokenKind::KwBreak)) {
    out->kind = BlockLineKind::Break;
    if (!Match(TokenKind::Semicolon)) {
      return Fail(Peek(), "expected ';' after break");
    }
    return true;
  }

  out->kind = BlockLineKind::Expr;
  if (!ParseExpr(&out->expr)) return false;
  if (out->expr.kind == ExprKind::If) {
    Match(TokenKind::Semicolon);
    return true;
  }
  if (!Match(TokenKind::Semicolon)) {
    return Fail(Peek(), "expected ';' after expression");
  }
  return true;
}

bool Parser::ParseExpr(Expr* out) {
  if (Peek().kind == TokenKind::Identifier && Peek(1).kind == TokenKind::Assign) {
    const Token& name_tok = Advance();
    Advance();
    Expr value;
    if (!ParseExpr(&value)) return false;
    out->kind = ExprKind::Assignment;
    out->text = name_tok.text;
    out->line = name_tok.line;
    out->column = name_tok.column;
    out->children.push_back(std::move(value));
    return true;
  }
  return ParseBinaryExpr(0, out);
}

bool Parser::GetBinaryOperator(const Token& tok, Operator* out) const {
  switch (tok.kind) {
    case TokenKind::Plus: *out = Operator::Add; return true;
    case TokenKind::Minus: *out = Operator::Sub; return true;
    case TokenKind::Star: *out = Operator::Mul; return true;
    case TokenKind::Slash: *out = Operator::Div; return true;
    case TokenKind::Percent: *out = Operator::Mod; return true;
    case TokenKind::EqEq: *out = Operator::Eq; return true;
    case TokenKind::Lt: *out = Operator::Lt; return true;
    case TokenKind::Le: *out = Operator::Lte; return true;
    case TokenKind::Gt: *out = Operator::Gt; return true;
    case TokenKind::Ge: *out = Operator::Gte; return true;
    default:
      return false;
  }
}

bool Parser::ParseBinaryExpr(int min_prec, Expr* out) {
  Expr lhs;
  if (!ParseUnaryExpr(&lhs)) return false;

  while (true) {
    const Token& op_tok = Peek();
    Operator op = Operator::Add;
    if (!GetBinaryOperator(op_tok, &op)) break;
    int prec = Precedence(op);
    if (prec < min_prec) break;
    Advance();
    Expr rhs;
    if (!ParseBinaryExpr(prec + 1, &rhs)) return false;
    Expr combined;
    combined.kind = ExprKind::BinOp;
    combined.op = op;
    combined.line = op_tok.line;
    combined.column = op_tok.column;
    combined.children.push_back(std::move(lhs));
    combined.children.push_back(std::move(rhs));
    lhs = std::move(combined);
  }

  *out = std::move(lhs);
  return true;
}

bool Parser::ParseUnaryExpr(Expr* out) {
  const Token& tok = Peek();
  if (tok.kind != TokenKind::Minus) {
    return ParsePrimaryExpr(out);
  }
  Advance();
  if (Peek().kind == TokenKind::Integer) {
    const Token& lit = Advance();
    out->kind = ExprKind::Int;
    out->line = tok.line;
    out->column = tok.column;
    return ParseIntegerLiteral(lit, true, &out->int_value);
  }
  // -x is sugar for 0 - x.
  Expr operand;
  if (!ParseUnaryExpr(&operand)) return false;
  Expr zero;
  zero.kind = ExprKind::Int;
  zero.line = tok.line;
  zero.column = tok.column;
  out->kind = ExprKind::BinOp;
  out->op = Operator::Sub;
  out->line = tok.line;
  out->column = tok.column;
  out->children.push_back(std::move(zero));
  out->children.push_back(std::move(operand));
  return true;
}

bool Parser::ParsePrimaryExpr(Expr* out) {
  const Token& tok = Peek();
  out->line = tok.line;
  out->column = tok.column;
  switch (tok.kind) {
    case TokenKind::Integer:
      Advance();
      out->kind = ExprKind::Int;
      return ParseIntegerLiteral(tok, false, &out->int_value);
    case TokenKind::String:
      out->kind = ExprKind::Str;
      out->text = tok.text;
      Advance();
      return true;
    case TokenKind::KwTrue:
    case TokenKind::KwFalse:
      out->kind = ExprKind::Boolean;
      out->bool_value = tok.kind == TokenKind::KwTrue;
      Advance();
      return true;
    case TokenKind::KwIf:
      return ParseIfExpr(out);
    case TokenKind::Identifier:
      out->text = tok.text;
      Advance();
      if (Match(TokenKind::LParen)) {
        out->kind = ExprKind::FnCall;
        return ParseCallArgs(&out->args);
      }
      out->kind = ExprKind::Name;
      return true;
    case TokenKind::LParen: {
      Advance();
      if (!ParseExpr(out)) return false;
      if (!Match(TokenKind::RParen)) {
        return Fail(Peek(), "expected ')' after expression");
      }
      return true;
    }
    default:
      break;
  }
  if (tok.kind == TokenKind::End) {
    return Fail(tok, "expected expression before end of input");
  }
  return Fail(tok, std::string("expected expression, found '") + ToString(tok.kind) + "'");
}

bool Parser::ParseIfExpr(Expr* out) {
  const Token& if_tok = Advance();
  out->kind = ExprKind::If;
  out->line = if_tok.line;
  out->column = if_tok.column;
  if (!Match(TokenKind::LParen)) {
    return Fail(Peek(), "expected '(' after 'if'");
  }
  Expr cond;
  if (!ParseExpr(&cond)) return false;
  if (!Match(TokenKind::RParen)) {
    return Fail(Peek(), "expected ')' after if condition");
  }
  out->children.push_back(std::move(cond));
  if (!ParseBlock(&out->true_block)) return false;
  if (!Match(TokenKind::KwElse)) return true;
  out->has_false_block = true;
  if (Peek().kind == TokenKind::KwIf) {
    BlockLine nested;
    nested.kind = BlockLineKind::Expr;
    nested.line = Peek().line;
    nested.column = Peek().column;
    if (!ParseIfExpr(&nested.expr)) return false;
    out->false_block.push_back(std::move(nested));
    return true;
  }
  return ParseBlock(&out->false_block);
}

bool Parser::ParseCallArgs(std::vector<Expr>* out) {
  if (Match(TokenKind::RParen)) return true;
  for (;;) {
    Expr arg;
    if (!ParseExpr(&arg)) return false;
    out->push_back(std::move(arg));
    if (Match(TokenKind::Comma)) continue;
    if (Match(TokenKind::RParen)) break;
    return Fail(Peek(), "expected ',' or ')' in call arguments");
  }
  return true;
}

bool Parser::ParseIntegerLiteral(const Token& tok, bool negative, int32_t* out) {
  const int64_t limit = negative ? 2147483648LL : 2147483647LL;
  int64_t value = 0;
  for (char c : tok.text) {
    value = value * 10 + (c - '0');
    if (value > limit) {
      return Fail(tok, "integer literal out of range: " + std::string(negative ? "-" : "") + tok.text);
    }
  }
  *out = static_cast<int32_t>(negative ? -value : value);
  return true;
}

bool ParseProgramFromString(const std::string& text, Program* out, std::string* error) {
  Lexer lexer(text);
  if (!lexer.Lex()) {
    if (error) *error = lexer.Error();
    return false;
  }
  Parser parser(lexer.Tokens());
  if (!parser.ParseProgram(out)) {
    if (error) *error = parser.Error();
    return false;
  }
  return true;
}

} // namespace Brisk::Lang
