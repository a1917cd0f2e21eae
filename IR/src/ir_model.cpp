#include "ir_model.h"

#include <functional>
#include <sstream>

namespace Brisk::IR {

size_t LabelHash::operator()(const Label& label) const {
  if (label.kind == LabelKind::Named) {
    return std::hash<std::string>()(label.name);
  }
  return std::hash<uint32_t>()(label.number) ^ 0x9e3779b9u;
}

bool Operation::operator==(const Operation& other) const {
  return kind == other.kind && lhs == other.lhs && rhs == other.rhs && out == other.out &&
         imm == other.imm && label == other.label && label_false == other.label_false;
}

Operation MakeLabel(Label label) {
  Operation op;
  op.kind = OpKind::Label;
  op.label = std::move(label);
  return op;
}

Operation MakeCall(Label label) {
  Operation op;
  op.kind = OpKind::Call;
  op.label = std::move(label);
  return op;
}

Operation MakeReturn() {
  Operation op;
  op.kind = OpKind::Return;
  return op;
}

Operation MakePush(Register reg) {
  Operation op;
  op.kind = OpKind::Push;
  op.lhs = reg;
  return op;
}

Operation MakePop(Register reg) {
  Operation op;
  op.kind = OpKind::Pop;
  op.lhs = reg;
  return op;
}

Operation MakePushI(ImmVal imm) {
  Operation op;
  op.kind = OpKind::PushI;
  op.imm = imm;
  return op;
}

Operation MakeBinary(OpKind kind, Register lhs, Register rhs, Register out) {
  Operation op;
  op.kind = kind;
  op.lhs = lhs;
  op.rhs = rhs;
  op.out = out;
  return op;
}

Operation MakeBinaryImm(OpKind kind, Register lhs, ImmVal imm, Register out) {
  Operation op;
  op.kind = kind;
  op.lhs = lhs;
  op.imm = imm;
  op.out = out;
  return op;
}

Operation MakeLoadI(ImmVal val, Register out) {
  Operation op;
  op.kind = OpKind::LoadI;
  op.imm = val;
  op.out = out;
  return op;
}

Operation MakeI2i(Register lhs, Register rhs) {
  Operation op;
  op.kind = OpKind::I2i;
  op.lhs = lhs;
  op.rhs = rhs;
  return op;
}

Operation MakeJumpI(Label label) {
  Operation op;
  op.kind = OpKind::JumpI;
  op.label = std::move(label);
  return op;
}

Operation MakeCondBranch(Register cond, Label label_true, Label label_false) {
  Operation op;
  op.kind = OpKind::CondBranch;
  op.lhs = cond;
  op.label = std::move(label_true);
  op.label_false = std::move(label_false);
  return op;
}

bool IsRegisterBinary(OpKind kind) {
  switch (kind) {
    case OpKind::Add:
    case OpKind::Sub:
    case OpKind::Mul:
    case OpKind::Div:
    case OpKind::Mod:
    case OpKind::CmpEq:
    case OpKind::CmpLt:
    case OpKind::CmpLte:
    case OpKind::CmpGt:
    case OpKind::CmpGte:
      return true;
    default:
      return false;
  }
}

bool IsImmediateBinary(OpKind kind) {
  switch (kind) {
    case OpKind::AddI:
    case OpKind::SubI:
    case OpKind::MulI:
    case OpKind::DivI:
      return true;
    default:
      return false;
  }
}

const char* ToString(OpKind kind) {
  switch (kind) {
    case OpKind::Label: return "label";
    case OpKind::Call: return "call";
    case OpKind::Return: return "return";
    case OpKind::Push: return "push";
    case OpKind::Pop: return "pop";
    case OpKind::PushI: return "pushI";
    case OpKind::Add: return "add";
    case OpKind::Sub: return "sub";
    case OpKind::Mul: return "mult";
    case OpKind::Div: return "div";
    case OpKind::Mod: return "mod";
    case OpKind::AddI: return "addI";
    case OpKind::SubI: return "subI";
    case OpKind::MulI: return "multI";
    case OpKind::DivI: return "divI";
    case OpKind::CmpEq: return "cmp_EQ";
    case OpKind::CmpLt: return "cmp_LT";
    case OpKind::CmpLte: return "cmp_LE";
    case OpKind::CmpGt: return "cmp_GT";
    case OpKind::CmpGte: return "cmp_GE";
    case OpKind::LoadI: return "loadI";
    case OpKind::I2i: return "i2i";
    case OpKind::JumpI: return "jumpI";
    case OpKind::CondBranch: return "cbr";
  }
  return "unknown";
}

std::string FormatRegister(const Register& reg) {
  if (reg.kind == RegKind::Global) return "g" + std::to_string(reg.addr);
  return "arp+" + std::to_string(reg.addr);
}

std::string FormatLabel(const Label& label) {
  if (label.kind == LabelKind::Named) return "@" + label.name;
  return "L" + std::to_string(label.number);
}

std::string FormatOperation(const Operation& op) {
  std::ostringstream out;
  if (op.kind == OpKind::Label) {
    out << FormatLabel(op.label) << ":";
    return out.str();
  }
  out << ToString(op.kind);
  switch (op.kind) {
    case OpKind::Call:
    case OpKind::JumpI:
      out << " -> " << FormatLabel(op.label);
      break;
    case OpKind::Push:
    case OpKind::Pop:
      out << " " << FormatRegister(op.lhs);
      break;
    case OpKind::PushI:
      out << " " << op.imm;
      break;
    case OpKind::LoadI:
      out << " " << op.imm << " => " << FormatRegister(op.out);
      break;
    case OpKind::I2i:
      out << " " << FormatRegister(op.lhs) << " => " << FormatRegister(op.rhs);
      break;
    case OpKind::CondBranch:
      out << " " << FormatRegister(op.lhs) << " -> " << FormatLabel(op.label) << ", "
          << FormatLabel(op.label_false);
      break;
    default:
      if (IsRegisterBinary(op.kind)) {
        out << " " << FormatRegister(op.lhs) << ", " << FormatRegister(op.rhs) << " => "
            << FormatRegister(op.out);
      } else if (IsImmediateBinary(op.kind)) {
        out << " " << FormatRegister(op.lhs) << ", " << op.imm << " => "
            << FormatRegister(op.out);
      }
      break;
  }
  return out.str();
}

std::string FormatIR(const IR& ir) {
  std::ostringstream out;
  for (const auto& op : ir.instructions) {
    if (op.kind != OpKind::Label) out << "  ";
    out << FormatOperation(op) << "\n";
  }
  out << "; result: " << (ir.has_result ? FormatRegister(ir.result) : std::string("none")) << "\n";
  return out.str();
}

} // namespace Brisk::IR
