#include "ir_builder.h"

namespace Brisk::IR {

namespace {

bool LowerOperator(Lang::Operator op, OpKind* out) {
  switch (op) {
    case Lang::Operator::Add: *out = OpKind::Add; return true;
    case Lang::Operator::Sub: *out = OpKind::Sub; return true;
    case Lang::Operator::Mul: *out = OpKind::Mul; return true;
    case Lang::Operator::Div: *out = OpKind::Div; return true;
    case Lang::Operator::Mod: *out = OpKind::Mod; return true;
    case Lang::Operator::Eq: *out = OpKind::CmpEq; return true;
    case Lang::Operator::Lt: *out = OpKind::CmpLt; return true;
    case Lang::Operator::Lte: *out = OpKind::CmpLte; return true;
    case Lang::Operator::Gt: *out = OpKind::CmpGt; return true;
    case Lang::Operator::Gte: *out = OpKind::CmpGte; return true;
  }
  return false;
}

} // namespace

IrBuilder::IrBuilder() : IrBuilder(BuildOptions{}) {}

IrBuilder::IrBuilder(BuildOptions options) : options_(options) {
  scopes_.push_back(Scope{"top level", 0, {}});
}

bool IrBuilder::Build(const Lang::Program& program, IR* out, std::string* error) {
  if (used_) {
    if (error) *error = "IrBuilder already used; construct a new builder per program";
    return false;
  }
  used_ = true;

  Ops ops;
  bool has_result = false;
  Register result;
  bool ok = true;
  for (const auto& stmt : program.statements) {
    if (stmt.kind == Lang::StatementKind::FnDef) {
      ok = BuildFnDef(stmt.fn, &ops);
    } else {
      bool has_out = false;
      Register line_out;
      ok = BuildBlockLine(stmt.line, &ops, &has_out, &line_out);
      if (ok && has_out) {
        has_result = true;
        result = line_out;
      }
    }
    if (!ok) break;
  }
  if (ok && options_.check_call_arity) {
    ok = CheckCallSites();
  }
  if (!ok) {
    scopes_.clear();
    loop_ends_.clear();
    if (error) *error = error_;
    return false;
  }

  RelabelShadowedFunctions(&ops);
  if (out) {
    out->instructions = std::move(ops);
    out->has_result = has_result;
    out->result = result;
  }
  return true;
}

bool IrBuilder::BuildFnDef(const Lang::FnDef& fn, Ops* ops) {
  FunctionSymbol& symbol = functions_[fn.name];
  symbol.param_count = fn.params.size();
  symbol.definitions += 1;

  Label fn_end = NextLabel();
  ops->push_back(MakeJumpI(fn_end));
  ops->push_back(MakeLabel(Label::Named(fn.name)));

  scopes_.push_back(Scope{"function '" + fn.name + "'", 0, {}});

  // Arguments arrive pushed in reverse, so popping in declaration order
  // yields p0 first. The count is trusted, not checked.
  for (const auto& param : fn.params) {
    Register reg;
    if (!VariableRegister(param, &reg)) return false;
    ops->push_back(MakePop(reg));
  }

  bool has_out = false;
  Register body_out;
  if (!BuildBlock(fn.block, ops, &has_out, &body_out)) return false;
  if (!has_out) {
    return Fail(fn.line, fn.column, "function '" + fn.name + "' body does not end with a value");
  }

  scopes_.pop_back();

  ops->push_back(MakePush(body_out));
  ops->push_back(MakeReturn());
  ops->push_back(MakeLabel(fn_end));
  return true;
}

bool IrBuilder::BuildBlock(const std::vector<Lang::BlockLine>& block,
                           Ops* ops,
                           bool* has_out,
                           Register* out) {
  *has_out = false;
  for (const auto& line : block) {
    if (!BuildBlockLine(line, ops, has_out, out)) return false;
  }
  return true;
}

bool IrBuilder::BuildBlockLine(const Lang::BlockLine& line, Ops* ops, bool* has_out, Register* out) {
  switch (line.kind) {
    case Lang::BlockLineKind::Expr:
      *has_out = true;
      return BuildExpr(line.expr, ops, out);
    case Lang::BlockLineKind::Loop:
      *has_out = false;
      return BuildLoop(line, ops);
    case Lang::BlockLineKind::Break:
      *has_out = false;
      if (loop_ends_.empty()) {
        return Fail(line.line, line.column, "'break' outside of a loop");
      }
      ops->push_back(MakeJumpI(loop_ends_.back()));
      return true;
  }
  return Fail(line.line, line.column, "unsupported block line");
}

bool IrBuilder::BuildLoop(const Lang::BlockLine& line, Ops* ops) {
  Label start = NextLabel();
  Label end = NextLabel();
  ops->push_back(MakeLabel(start));

  loop_ends_.push_back(end);
  bool has_out = false;
  Register body_out;
  if (!BuildBlock(line.body, ops, &has_out, &body_out)) return false;
  loop_ends_.pop_back();

  ops->push_back(MakeJumpI(start));
  ops->push_back(MakeLabel(end));
  return true;
}

bool IrBuilder::BuildExpr(const Lang::Expr& expr, Ops* ops, Register* out) {
  switch (expr.kind) {
    case Lang::ExprKind::Int:
      if (!NextRegister(out)) return false;
      ops->push_back(MakeLoadI(expr.int_value, *out));
      return true;
    case Lang::ExprKind::Boolean:
      if (!NextRegister(out)) return false;
      ops->push_back(MakeLoadI(expr.bool_value ? 1 : 0, *out));
      return true;
    case Lang::ExprKind::Str:
      return Fail(expr.line, expr.column, "string literals have no register representation");
    case Lang::ExprKind::Name:
      return BuildName(expr, out);
    case Lang::ExprKind::Assignment:
      return BuildAssignment(expr, ops, out);
    case Lang::ExprKind::BinOp:
      return BuildBinOp(expr, ops, out);
    case Lang::ExprKind::FnCall:
      return BuildFnCall(expr, ops, out);
    case Lang::ExprKind::If:
      return BuildIf(expr, ops, out);
  }
  return Fail(expr.line, expr.column, "unsupported expression");
}

bool IrBuilder::BuildName(const Lang::Expr& expr, Register* out) {
  // Reading an unbound name binds it to a fresh, zero-valued register.
  return VariableRegister(expr.text, out);
}

bool IrBuilder::BuildAssignment(const Lang::Expr& expr, Ops* ops, Register* out) {
  if (expr.children.size() != 1) {
    return Fail(expr.line, expr.column, "malformed assignment");
  }
  Register value;
  if (!BuildExpr(expr.children[0], ops, &value)) return false;
  if (!VariableRegister(expr.text, out)) return false;
  ops->push_back(MakeI2i(value, *out));
  return true;
}

bool IrBuilder::BuildBinOp(const Lang::Expr& expr, Ops* ops, Register* out) {
  if (expr.children.size() != 2) {
    return Fail(expr.line, expr.column, "malformed binary expression");
  }
  Register lhs;
  if (!BuildExpr(expr.children[0], ops, &lhs)) return false;
  Register rhs;
  if (!BuildExpr(expr.children[1], ops, &rhs)) return false;
  OpKind kind = OpKind::Add;
  if (!LowerOperator(expr.op, &kind)) {
    return Fail(expr.line, expr.column,
                std::string("operator '") + Lang::ToString(expr.op) + "' has no lowering");
  }
  if (!NextRegister(out)) return false;
  ops->push_back(MakeBinary(kind, lhs, rhs, *out));
  return true;
}

bool IrBuilder::BuildFnCall(const Lang::Expr& expr, Ops* ops, Register* out) {
  std::vector<Register> arg_regs;
  arg_regs.reserve(expr.args.size());
  for (const auto& arg : expr.args) {
    Register reg;
    if (!BuildExpr(arg, ops, &reg)) return false;
    arg_regs.push_back(reg);
  }
  for (auto it = arg_regs.rbegin(); it != arg_regs.rend(); ++it) {
    ops->push_back(MakePush(*it));
  }
  ops->push_back(MakeCall(Label::Named(expr.text)));
  call_sites_.push_back(CallSite{expr.text, expr.args.size(), expr.line, expr.column});

  if (!NextRegister(out)) return false;
  ops->push_back(MakePop(*out));
  return true;
}

bool IrBuilder::BuildIf(const Lang::Expr& expr, Ops* ops, Register* out) {
  if (expr.children.size() != 1) {
    return Fail(expr.line, expr.column, "malformed if expression");
  }
  if (!NextRegister(out)) return false;

  Register cond;
  if (!BuildExpr(expr.children[0], ops, &cond)) return false;

  Label label_true = NextLabel();
  Label label_end = NextLabel();
  Label label_false = NextLabel();
  ops->push_back(MakeCondBranch(cond, label_true, label_false));

  ops->push_back(MakeLabel(label_true));
  bool has_true = false;
  Register true_out;
  if (!BuildBlock(expr.true_block, ops, &has_true, &true_out)) return false;
  if (has_true) {
    ops->push_back(MakeI2i(true_out, *out));
  } else {
    ops->push_back(MakeLoadI(0, *out));
  }
  ops->push_back(MakeJumpI(label_end));

  ops->push_back(MakeLabel(label_false));
  bool has_false = false;
  Register false_out;
  if (expr.has_false_block) {
    if (!BuildBlock(expr.false_block, ops, &has_false, &false_out)) return false;
  }
  if (has_false) {
    ops->push_back(MakeI2i(false_out, *out));
  } else {
    ops->push_back(MakeLoadI(0, *out));
  }
  ops->push_back(MakeJumpI(label_end));

  ops->push_back(MakeLabel(label_end));
  return true;
}

bool IrBuilder::NextRegister(Register* out) {
  Scope& scope = scopes_.back();
  if (scope.next_free >= kRegisterFileSize) {
    error_ = "register file exhausted: " + scope.owner + " needs more than " +
             std::to_string(kRegisterFileSize) + " registers";
    return false;
  }
  RegAddr addr = scope.next_free++;
  *out = scopes_.size() == 1 ? Register::Global(addr) : Register::Arp(addr);
  return true;
}

bool IrBuilder::VariableRegister(const std::string& name, Register* out) {
  Scope& scope = scopes_.back();
  auto it = scope.variables.find(name);
  if (it != scope.variables.end()) {
    *out = it->second;
    return true;
  }
  if (!NextRegister(out)) return false;
  scopes_.back().variables.emplace(name, *out);
  return true;
}

Label IrBuilder::NextLabel() {
  return Label::Numbered(next_label_++);
}

bool IrBuilder::Fail(uint32_t line, uint32_t column, const std::string& message) {
  if (line == 0) {
    error_ = message;
  } else {
    error_ = std::to_string(line) + ":" + std::to_string(column) + ": " + message;
  }
  return false;
}

bool IrBuilder::CheckCallSites() {
  for (const auto& site : call_sites_) {
    auto it = functions_.find(site.name);
    if (it == functions_.end()) {
      return Fail(site.line, site.column, "call to undefined function '" + site.name + "'");
    }
    if (it->second.param_count != site.arg_count) {
      return Fail(site.line, site.column,
                  "function '" + site.name + "' expects " + std::to_string(it->second.param_count) +
                      " argument(s), got " + std::to_string(site.arg_count));
    }
  }
  return true;
}

void IrBuilder::RelabelShadowedFunctions(Ops* ops) {
  std::unordered_map<std::string, uint32_t> remaining;
  for (const auto& entry : functions_) {
    if (entry.second.definitions > 1) {
      remaining.emplace(entry.first, entry.second.definitions);
    }
  }
  if (remaining.empty()) return;
  for (auto& op : *ops) {
    if (op.kind != OpKind::Label || op.label.kind != LabelKind::Named) continue;
    auto it = remaining.find(op.label.name);
    if (it == remaining.end()) continue;
    it->second -= 1;
    if (it->second > 0) {
      op.label = NextLabel();
    }
  }
}

bool BuildProgram(const Lang::Program& program, IR* out, std::string* error) {
  IrBuilder builder;
  return builder.Build(program, out, error);
}

bool BuildProgram(const Lang::Program& program,
                  const BuildOptions& options,
                  IR* out,
                  std::string* error) {
  IrBuilder builder(options);
  return builder.Build(program, out, error);
}

} // namespace Brisk::IR
