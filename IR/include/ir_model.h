#ifndef BRISK_IR_MODEL_H
#define BRISK_IR_MODEL_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Brisk::IR {

using RegAddr = uint32_t;
using ImmVal = int32_t;

// Slots in one register file. Both the builder's allocator and the VM's
// frames are bounded by it.
constexpr size_t kRegisterFileSize = 256;

enum class RegKind : uint8_t {
  Global,
  Arp,
};

struct Register {
  RegKind kind = RegKind::Global;
  RegAddr addr = 0;

  static Register Global(RegAddr addr) { return Register{RegKind::Global, addr}; }
  static Register Arp(RegAddr addr) { return Register{RegKind::Arp, addr}; }

  bool operator==(const Register& other) const {
    return kind == other.kind && addr == other.addr;
  }
  bool operator!=(const Register& other) const { return !(*this == other); }
};

enum class LabelKind : uint8_t {
  Named,
  Numbered,
};

struct Label {
  LabelKind kind = LabelKind::Numbered;
  std::string name;
  uint32_t number = 0;

  static Label Named(std::string name) { return Label{LabelKind::Named, std::move(name), 0}; }
  static Label Numbered(uint32_t number) { return Label{LabelKind::Numbered, {}, number}; }

  bool operator==(const Label& other) const {
    if (kind != other.kind) return false;
    return kind == LabelKind::Named ? name == other.name : number == other.number;
  }
  bool operator!=(const Label& other) const { return !(*this == other); }
};

struct LabelHash {
  size_t operator()(const Label& label) const;
};

enum class OpKind : uint8_t {
  Label,
  Call,
  Return,

  Push,
  Pop,
  PushI,

  Add,
  Sub,
  Mul,
  Div,
  Mod,

  AddI,
  SubI,
  MulI,
  DivI,

  CmpEq,
  CmpLt,
  CmpLte,
  CmpGt,
  CmpGte,

  LoadI,
  I2i,

  JumpI,
  CondBranch,
};

// Field use by kind:
//   Label, Call, JumpI      label
//   CondBranch               lhs (condition), label (true), label_false
//   Push, Pop                lhs
//   PushI                    imm
//   Add..Mod, Cmp*           lhs, rhs, out
//   AddI..DivI               lhs, imm, out
//   LoadI                    imm, out
//   I2i                      lhs (source), rhs (destination)
// Unused fields keep their defaults so whole-operation equality is exact.
struct Operation {
  OpKind kind = OpKind::Label;
  Register lhs;
  Register rhs;
  Register out;
  ImmVal imm = 0;
  Label label;
  Label label_false;

  bool operator==(const Operation& other) const;
  bool operator!=(const Operation& other) const { return !(*this == other); }
};

Operation MakeLabel(Label label);
Operation MakeCall(Label label);
Operation MakeReturn();
Operation MakePush(Register reg);
Operation MakePop(Register reg);
Operation MakePushI(ImmVal imm);
Operation MakeBinary(OpKind kind, Register lhs, Register rhs, Register out);
Operation MakeBinaryImm(OpKind kind, Register lhs, ImmVal imm, Register out);
Operation MakeLoadI(ImmVal val, Register out);
Operation MakeI2i(Register lhs, Register rhs);
Operation MakeJumpI(Label label);
Operation MakeCondBranch(Register cond, Label label_true, Label label_false);

bool IsRegisterBinary(OpKind kind);
bool IsImmediateBinary(OpKind kind);

struct IR {
  std::vector<Operation> instructions;
  bool has_result = false;
  Register result;
};

const char* ToString(OpKind kind);
std::string FormatRegister(const Register& reg);
std::string FormatLabel(const Label& label);
std::string FormatOperation(const Operation& op);
std::string FormatIR(const IR& ir);

} // namespace Brisk::IR

#endif // BRISK_IR_MODEL_H
