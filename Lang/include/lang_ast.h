#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Brisk::Lang {

enum class Operator : uint8_t {
  Add,
  Sub,
  Mul,
  Div,
  Mod,
  Eq,
  Lt,
  Lte,
  Gt,
  Gte,
};

// Lower value binds weaker and sits higher in the tree.
int Precedence(Operator op);
const char* ToString(Operator op);

enum class ExprKind : uint8_t {
  Int,
  Str,
  Boolean,
  Name,
  Assignment,
  BinOp,
  FnCall,
  If,
};

struct BlockLine;

struct Expr {
  ExprKind kind = ExprKind::Int;
  int32_t int_value = 0;
  bool bool_value = false;
  // Name, Assignment target, FnCall callee, or Str contents.
  std::string text;
  Operator op = Operator::Add;
  // BinOp: lhs, rhs. Assignment: value. If: condition.
  std::vector<Expr> children;
  std::vector<Expr> args;
  std::vector<BlockLine> true_block;
  bool has_false_block = false;
  std::vector<BlockLine> false_block;
  uint32_t line = 0;
  uint32_t column = 0;
};

enum class BlockLineKind : uint8_t {
  Expr,
  Loop,
  Break,
};

struct BlockLine {
  BlockLineKind kind = BlockLineKind::Expr;
  Expr expr;
  std::vector<BlockLine> body;
  uint32_t line = 0;
  uint32_t column = 0;
};

struct FnDef {
  std::string name;
  std::vector<std::string> params;
  std::vector<BlockLine> block;
  uint32_t line = 0;
  uint32_t column = 0;
};

enum class StatementKind : uint8_t {
  FnDef,
  BlockLine,
};

struct Statement {
  StatementKind kind = StatementKind::BlockLine;
  FnDef fn;
  BlockLine line;
};

struct Program {
  std::vector<Statement> statements;
};

std::string DumpProgram(const Program& program);

} // namespace Brisk::Lang
