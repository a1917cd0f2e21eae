#include "ir_builder.h"
#include "ir_model.h"
#include "lang_parser.h"
#include "test_utils.h"

#include <iostream>
#include <string>
#include <vector>

namespace Brisk::Tests {
namespace {

using IR::Label;
using IR::OpKind;
using IR::Operation;
using IR::Register;

Register G(uint32_t n) { return Register::Global(n); }
Register A(uint32_t n) { return Register::Arp(n); }
Label L(uint32_t n) { return Label::Numbered(n); }
Label Fn(const char* name) { return Label::Named(name); }

bool BuildOk(const std::string& src, IR::IR* ir) {
  std::string error;
  if (!BuildSource(src, ir, &error)) {
    std::cerr << "build failed: " << error << "\n";
    return false;
  }
  return true;
}

bool ExpectResult(const IR::IR& ir, Register reg) {
  if (!ir.has_result || ir.result != reg) {
    std::cerr << "expected result " << IR::FormatRegister(reg) << ", got "
              << (ir.has_result ? IR::FormatRegister(ir.result) : std::string("none")) << "\n";
    return false;
  }
  return true;
}

bool IrLowersIntLiteral() {
  IR::IR ir;
  if (!BuildOk("4;", &ir)) return false;
  return ExpectOps(ir.instructions, {IR::MakeLoadI(4, G(0))}, "int literal") && ExpectResult(ir, G(0));
}

bool IrLowersBooleans() {
  IR::IR ir;
  if (!BuildOk("true; false;", &ir)) return false;
  return ExpectOps(ir.instructions, {IR::MakeLoadI(1, G(0)), IR::MakeLoadI(0, G(1))}, "booleans") &&
         ExpectResult(ir, G(1));
}

bool IrLowersBinaryOps() {
  IR::IR ir;
  if (!BuildOk("1 + 2;", &ir)) return false;
  return ExpectOps(ir.instructions,
                   {
                     IR::MakeLoadI(1, G(0)),
                     IR::MakeLoadI(2, G(1)),
                     IR::MakeBinary(OpKind::Add, G(0), G(1), G(2)),
                   },
                   "binary add") &&
         ExpectResult(ir, G(2));
}

bool IrLowersEveryOperator() {
  const struct {
    const char* src;
    OpKind kind;
  } cases[] = {
    {"1 + 2;", OpKind::Add},     {"1 - 2;", OpKind::Sub},    {"1 * 2;", OpKind::Mul},
    {"1 / 2;", OpKind::Div},     {"1 % 2;", OpKind::Mod},    {"1 == 2;", OpKind::CmpEq},
    {"1 < 2;", OpKind::CmpLt},   {"1 <= 2;", OpKind::CmpLte}, {"1 > 2;", OpKind::CmpGt},
    {"1 >= 2;", OpKind::CmpGte},
  };
  for (const auto& c : cases) {
    IR::IR ir;
    if (!BuildOk(c.src, &ir)) return false;
    if (ir.instructions.size() != 3 || ir.instructions[2].kind != c.kind) {
      std::cerr << "wrong lowering for " << c.src << "\n";
      return false;
    }
  }
  return true;
}

bool IrLowersAssignment() {
  IR::IR ir;
  if (!BuildOk("a = 4;", &ir)) return false;
  return ExpectOps(ir.instructions, {IR::MakeLoadI(4, G(0)), IR::MakeI2i(G(0), G(1))}, "assignment") &&
         ExpectResult(ir, G(1));
}

bool IrReusesVariableRegister() {
  IR::IR ir;
  if (!BuildOk("a = 1; a = 2; a;", &ir)) return false;
  return ExpectOps(ir.instructions,
                   {
                     IR::MakeLoadI(1, G(0)),
                     IR::MakeI2i(G(0), G(1)),
                     IR::MakeLoadI(2, G(2)),
                     IR::MakeI2i(G(2), G(1)),
                   },
                   "variable reuse") &&
         ExpectResult(ir, G(1));
}

bool IrUnboundNameAllocatesRegister() {
  IR::IR ir;
  if (!BuildOk("x;", &ir)) return false;
  return ir.instructions.empty() && ExpectResult(ir, G(0));
}

bool IrLowersIfThen() {
  IR::IR ir;
  if (!BuildOk("if (1 < 2) { 3; }", &ir)) return false;
  return ExpectOps(ir.instructions,
                   {
                     IR::MakeLoadI(1, G(1)),
                     IR::MakeLoadI(2, G(2)),
                     IR::MakeBinary(OpKind::CmpLt, G(1), G(2), G(3)),
                     IR::MakeCondBranch(G(3), L(0), L(2)),
                     IR::MakeLabel(L(0)),
                     IR::MakeLoadI(3, G(4)),
                     IR::MakeI2i(G(4), G(0)),
                     IR::MakeJumpI(L(1)),
                     IR::MakeLabel(L(2)),
                     IR::MakeLoadI(0, G(0)),
                     IR::MakeJumpI(L(1)),
                     IR::MakeLabel(L(1)),
                   },
                   "if then") &&
         ExpectResult(ir, G(0));
}

bool IrLowersIfElse() {
  IR::IR ir;
  if (!BuildOk("if (c) { 3; } else { 4; }", &ir)) return false;
  return ExpectOps(ir.instructions,
                   {
                     IR::MakeCondBranch(G(1), L(0), L(2)),
                     IR::MakeLabel(L(0)),
                     IR::MakeLoadI(3, G(2)),
                     IR::MakeI2i(G(2), G(0)),
                     IR::MakeJumpI(L(1)),
                     IR::MakeLabel(L(2)),
                     IR::MakeLoadI(4, G(3)),
                     IR::MakeI2i(G(3), G(0)),
                     IR::MakeJumpI(L(1)),
                     IR::MakeLabel(L(1)),
                   },
                   "if else") &&
         ExpectResult(ir, G(0));
}

bool IrLowersFnDefAndCall() {
  IR::IR ir;
  if (!BuildOk("fn add(a, b) { a + b; } x = 5; add(x, 7);", &ir)) return false;
  return ExpectOps(ir.instructions,
                   {
                     IR::MakeJumpI(L(0)),
                     IR::MakeLabel(Fn("add")),
                     IR::MakePop(A(0)),
                     IR::MakePop(A(1)),
                     IR::MakeBinary(OpKind::Add, A(0), A(1), A(2)),
                     IR::MakePush(A(2)),
                     IR::MakeReturn(),
                     IR::MakeLabel(L(0)),
                     IR::MakeLoadI(5, G(0)),
                     IR::MakeI2i(G(0), G(1)),
                     IR::MakeLoadI(7, G(2)),
                     IR::MakePush(G(2)),
                     IR::MakePush(G(1)),
                     IR::MakeCall(Fn("add")),
                     IR::MakePop(G(3)),
                   },
                   "fn def and call") &&
         ExpectResult(ir, G(3));
}

bool IrFnScopesAreIndependent() {
  IR::IR ir;
  if (!BuildOk("a = 1; fn f(a) { b = a; b; } a;", &ir)) return false;
  // The parameter shadows the global inside f, and f's registers restart at 0.
  return ExpectOps(ir.instructions,
                   {
                     IR::MakeLoadI(1, G(0)),
                     IR::MakeI2i(G(0), G(1)),
                     IR::MakeJumpI(L(0)),
                     IR::MakeLabel(Fn("f")),
                     IR::MakePop(A(0)),
                     IR::MakeI2i(A(0), A(1)),
                     IR::MakePush(A(1)),
                     IR::MakeReturn(),
                     IR::MakeLabel(L(0)),
                   },
                   "fn scopes") &&
         ExpectResult(ir, G(1));
}

bool IrLowersLoopAndBreak() {
  IR::IR ir;
  if (!BuildOk("loop { break; }", &ir)) return false;
  if (ir.has_result) {
    std::cerr << "loop should not produce a result\n";
    return false;
  }
  return ExpectOps(ir.instructions,
                   {
                     IR::MakeLabel(L(0)),
                     IR::MakeJumpI(L(1)),
                     IR::MakeJumpI(L(0)),
                     IR::MakeLabel(L(1)),
                   },
                   "loop");
}

bool IrBreakTargetsInnermostLoop() {
  IR::IR ir;
  if (!BuildOk("loop { loop { break; } break; }", &ir)) return false;
  return ExpectOps(ir.instructions,
                   {
                     IR::MakeLabel(L(0)),
                     IR::MakeLabel(L(2)),
                     IR::MakeJumpI(L(3)),
                     IR::MakeJumpI(L(2)),
                     IR::MakeLabel(L(3)),
                     IR::MakeJumpI(L(1)),
                     IR::MakeJumpI(L(0)),
                     IR::MakeLabel(L(1)),
                   },
                   "nested loops");
}

bool IrResultIsLastValueLine() {
  IR::IR ir;
  if (!BuildOk("7; loop { break; } fn f() { 1; }", &ir)) return false;
  return ExpectResult(ir, G(0));
}

bool IrEmptyProgramHasNoResult() {
  IR::IR ir;
  if (!BuildOk("", &ir)) return false;
  return ir.instructions.empty() && !ir.has_result;
}

bool IrFnDefOnlyHasNoResult() {
  IR::IR ir;
  if (!BuildOk("fn f() { 1; }", &ir)) return false;
  return !ir.has_result;
}

bool IrRedefinitionLastWins() {
  IR::IR ir;
  if (!BuildOk("fn f() { 1; } f(); fn f() { 2; } f();", &ir)) return false;
  size_t named = 0;
  size_t named_index = 0;
  for (size_t i = 0; i < ir.instructions.size(); ++i) {
    const Operation& op = ir.instructions[i];
    if (op.kind == OpKind::Label && op.label == Fn("f")) {
      ++named;
      named_index = i;
    }
  }
  if (named != 1) {
    std::cerr << "expected one entry label for f, got " << named << "\n";
    return false;
  }
  // The first body keeps its place behind its skip jump, under a fresh label.
  if (ir.instructions[1].kind != OpKind::Label || ir.instructions[1].label.kind != IR::LabelKind::Numbered) {
    std::cerr << "first definition should be relabelled\n";
    return false;
  }
  return named_index > 1 && ir.instructions[named_index - 1].kind == OpKind::JumpI;
}

bool IrRejectsBreakOutsideLoop() {
  return BuildExpectFail("break;", "'break' outside of a loop") &&
         BuildExpectFail("fn f() { break; 1; }", "'break' outside of a loop");
}

bool IrRejectsValuelessFnBody() {
  return BuildExpectFail("fn f() { }", "does not end with a value") &&
         BuildExpectFail("fn f() { loop { break; } }", "does not end with a value");
}

bool IrRejectsStringLiteral() {
  return BuildExpectFail("x = \"text\";", "string literals");
}

bool IrErrorCarriesLocation() {
  IR::IR ir;
  std::string error;
  if (BuildSource("1;\n  break;", &ir, &error)) return false;
  return error.find("2:3:") == 0;
}

std::string RepeatLiteral(size_t count) {
  std::string src;
  for (size_t i = 0; i < count; ++i) src += "0;";
  return src;
}

bool IrRegisterFileLimit() {
  IR::IR ir;
  if (!BuildOk(RepeatLiteral(256), &ir)) return false;
  if (!ExpectResult(ir, G(255))) return false;
  return BuildExpectFail(RepeatLiteral(257), "register file exhausted");
}

bool IrArityUncheckedByDefault() {
  IR::IR ir;
  return BuildOk("fn f(a) { a; } f(1, 2); g(3);", &ir);
}

bool IrArityCheckRejectsMismatch() {
  IR::BuildOptions options;
  options.check_call_arity = true;
  return BuildExpectFail("fn f(a) { a; } f(1, 2);", options, "expects 1 argument(s), got 2") &&
         BuildExpectFail("g(3);", options, "call to undefined function 'g'");
}

bool IrArityCheckUsesFinalDefinition() {
  IR::BuildOptions options;
  options.check_call_arity = true;
  IR::IR ir;
  std::string error;
  if (!BuildSource("f(1, 2); fn f(a) { a; } fn f(a, b) { a + b; }", options, &ir, &error)) {
    std::cerr << "build failed: " << error << "\n";
    return false;
  }
  return BuildExpectFail("fn f(a, b) { a; } fn f(a) { a; } f(1, 2);", options, "expects 1");
}

bool IrBuilderIsSingleUse() {
  Lang::Program program;
  std::string error;
  if (!Lang::ParseProgramFromString("1;", &program, &error)) return false;
  IR::IrBuilder builder;
  IR::IR first;
  if (!builder.Build(program, &first, &error)) return false;
  IR::IR second;
  return !builder.Build(program, &second, &error) && second.instructions.empty();
}

bool IrFailedBuildLeavesOutput() {
  IR::IR ir;
  ir.instructions.push_back(IR::MakeReturn());
  std::string error;
  if (BuildSource("1; break;", &ir, &error)) return false;
  return ir.instructions.size() == 1 && ir.instructions[0].kind == OpKind::Return && !ir.has_result;
}

bool IrFormatsListing() {
  IR::IR ir;
  if (!BuildOk("fn id(x) { x; } a = id(4);", &ir)) return false;
  const std::string expected =
      "  jumpI -> L0\n"
      "@id:\n"
      "  pop arp+0\n"
      "  push arp+0\n"
      "  return\n"
      "L0:\n"
      "  loadI 4 => g0\n"
      "  push g0\n"
      "  call -> @id\n"
      "  pop g1\n"
      "  i2i g1 => g2\n"
      "; result: g2\n";
  const std::string got = IR::FormatIR(ir);
  if (got != expected) {
    std::cerr << "listing mismatch:\n" << got;
    return false;
  }
  return true;
}

bool IrFormatsOperands() {
  return IR::FormatOperation(IR::MakeCondBranch(G(3), L(0), L(2))) == "cbr g3 -> L0, L2" &&
         IR::FormatOperation(IR::MakeBinary(OpKind::Mul, A(1), G(2), A(3))) == "mult arp+1, g2 => arp+3" &&
         IR::FormatOperation(IR::MakeBinaryImm(OpKind::AddI, G(0), -5, G(1))) == "addI g0, -5 => g1" &&
         IR::FormatOperation(IR::MakePushI(9)) == "pushI 9";
}

const TestCase kIrTests[] = {
  {"ir_int_literal", IrLowersIntLiteral},
  {"ir_booleans", IrLowersBooleans},
  {"ir_binary_ops", IrLowersBinaryOps},
  {"ir_every_operator", IrLowersEveryOperator},
  {"ir_assignment", IrLowersAssignment},
  {"ir_variable_register_reuse", IrReusesVariableRegister},
  {"ir_unbound_name", IrUnboundNameAllocatesRegister},
  {"ir_if_then", IrLowersIfThen},
  {"ir_if_else", IrLowersIfElse},
  {"ir_fn_def_and_call", IrLowersFnDefAndCall},
  {"ir_fn_scopes_independent", IrFnScopesAreIndependent},
  {"ir_loop_and_break", IrLowersLoopAndBreak},
  {"ir_break_innermost_loop", IrBreakTargetsInnermostLoop},
  {"ir_result_last_value_line", IrResultIsLastValueLine},
  {"ir_empty_program", IrEmptyProgramHasNoResult},
  {"ir_fn_def_only", IrFnDefOnlyHasNoResult},
  {"ir_redefinition_last_wins", IrRedefinitionLastWins},
  {"ir_reject_break_outside_loop", IrRejectsBreakOutsideLoop},
  {"ir_reject_valueless_fn_body", IrRejectsValuelessFnBody},
  {"ir_reject_string_literal", IrRejectsStringLiteral},
  {"ir_error_location", IrErrorCarriesLocation},
  {"ir_register_file_limit", IrRegisterFileLimit},
  {"ir_arity_unchecked_default", IrArityUncheckedByDefault},
  {"ir_arity_check_mismatch", IrArityCheckRejectsMismatch},
  {"ir_arity_check_final_definition", IrArityCheckUsesFinalDefinition},
  {"ir_builder_single_use", IrBuilderIsSingleUse},
  {"ir_failed_build_leaves_output", IrFailedBuildLeavesOutput},
  {"ir_format_listing", IrFormatsListing},
  {"ir_format_operands", IrFormatsOperands},
};

} // namespace

static const TestSection kIrSections[] = {
  {"ir", kIrTests, sizeof(kIrTests) / sizeof(kIrTests[0])},
};

const TestSection* GetIrSections(size_t* count) {
  if (count) {
    *count = sizeof(kIrSections) / sizeof(kIrSections[0]);
  }
  return kIrSections;
}

} // namespace Brisk::Tests
