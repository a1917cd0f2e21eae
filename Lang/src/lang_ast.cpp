#include "lang_ast.h"

#include <sstream>

namespace Brisk::Lang {

namespace {

void Indent(std::ostringstream& out, int depth) {
  for (int i = 0; i < depth; ++i) out << "  ";
}

void DumpBlock(std::ostringstream& out, const std::vector<BlockLine>& block, int depth);

void DumpExpr(std::ostringstream& out, const Expr& expr, int depth) {
  Indent(out, depth);
  switch (expr.kind) {
    case ExprKind::Int:
      out << "Int " << expr.int_value << "\n";
      return;
    case ExprKind::Str:
      out << "Str \"" << expr.text << "\"\n";
      return;
    case ExprKind::Boolean:
      out << "Boolean " << (expr.bool_value ? "true" : "false") << "\n";
      return;
    case ExprKind::Name:
      out << "Name " << expr.text << "\n";
      return;
    case ExprKind::Assignment:
      out << "Assignment " << expr.text << "\n";
      for (const auto& child : expr.children) DumpExpr(out, child, depth + 1);
      return;
    case ExprKind::BinOp:
      out << "BinOp " << ToString(expr.op) << "\n";
      for (const auto& child : expr.children) DumpExpr(out, child, depth + 1);
      return;
    case ExprKind::FnCall:
      out << "FnCall " << expr.text << "\n";
      for (const auto& arg : expr.args) DumpExpr(out, arg, depth + 1);
      return;
    case ExprKind::If:
      out << "If\n";
      for (const auto& child : expr.children) DumpExpr(out, child, depth + 1);
      Indent(out, depth + 1);
      out << "Then\n";
      DumpBlock(out, expr.true_block, depth + 2);
      if (expr.has_false_block) {
        Indent(out, depth + 1);
        out << "Else\n";
        DumpBlock(out, expr.false_block, depth + 2);
      }
      return;
  }
}

void DumpBlockLine(std::ostringstream& out, const BlockLine& line, int depth) {
  switch (line.kind) {
    case BlockLineKind::Expr:
      DumpExpr(out, line.expr, depth);
      return;
    case BlockLineKind::Loop:
      Indent(out, depth);
      out << "Loop\n";
      DumpBlock(out, line.body, depth + 1);
      return;
    case BlockLineKind::Break:
      Indent(out, depth);
      out << "Break\n";
      return;
  }
}

void DumpBlock(std::ostringstream& out, const std::vector<BlockLine>& block, int depth) {
  for (const auto& line : block) DumpBlockLine(out, line, depth);
}

} // namespace

int Precedence(Operator op) {
  switch (op) {
    case Operator::Eq:
    case Operator::Lt:
    case Operator::Lte:
    case Operator::Gt:
    case Operator::Gte:
      return 0;
    case Operator::Add:
    case Operator::Sub:
    case Operator::Mod:
      return 1;
    case Operator::Mul:
    case Operator::Div:
      return 2;
  }
  return 0;
}

const char* ToString(Operator op) {
  switch (op) {
    case Operator::Add: return "+";
    case Operator::Sub: return "-";
    case Operator::Mul: return "*";
    case Operator::Div: return "/";
    case Operator::Mod: return "%";
    case Operator::Eq: return "==";
    case Operator::Lt: return "<";
    case Operator::Lte: return "<=";
    case Operator::Gt: return ">";
    case Operator::Gte: return ">=";
  }
  return "?";
}

std::string DumpProgram(const Program& program) {
  std::ostringstream out;
  out << "Program\n";
  for (const auto& stmt : program.statements) {
    if (stmt.kind == StatementKind::FnDef) {
      Indent(out, 1);
      out << "FnDef " << stmt.fn.name << "(";
      for (size_t i = 0; i < stmt.fn.params.size(); ++i) {
        if (i > 0) out << ", ";
        out << stmt.fn.params[i];
      }
      out << ")\n";
      DumpBlock(out, stmt.fn.block, 2);
      continue;
    }
    DumpBlockLine(out, stmt.line, 1);
  }
  return out.str();
}

} // namespace Brisk::Lang
