#include "vm.h"

#include <sstream>

namespace Brisk::VM {

using Brisk::IR::OpKind;
using Brisk::IR::RegKind;

namespace {

bool RegisterInRange(const Register& reg) {
  return reg.addr < Brisk::IR::kRegisterFileSize;
}

int32_t WrapAdd(int32_t a, int32_t b) {
  return static_cast<int32_t>(static_cast<uint32_t>(a) + static_cast<uint32_t>(b));
}

int32_t WrapSub(int32_t a, int32_t b) {
  return static_cast<int32_t>(static_cast<uint32_t>(a) - static_cast<uint32_t>(b));
}

int32_t WrapMul(int32_t a, int32_t b) {
  return static_cast<int32_t>(static_cast<uint32_t>(a) * static_cast<uint32_t>(b));
}

// Division and modulo share their failure cases.
bool CheckDivision(int32_t a, int32_t b, const char** message) {
  if (b == 0) {
    *message = "division by zero";
    return false;
  }
  if (a == INT32_MIN && b == -1) {
    *message = "division overflow";
    return false;
  }
  return true;
}

} // namespace

const char* ToString(FaultKind kind) {
  switch (kind) {
    case FaultKind::None: return "none";
    case FaultKind::LabelResolution: return "label resolution";
    case FaultKind::StackUnderflow: return "stack underflow";
    case FaultKind::FrameUnderflow: return "frame underflow";
    case FaultKind::Arithmetic: return "arithmetic";
    case FaultKind::ResourceExhausted: return "resource exhausted";
  }
  return "unknown";
}

bool Machine::Load(const IR& ir, std::string* error) {
  loaded_ = false;
  labels_.clear();
  for (size_t i = 0; i < ir.instructions.size(); ++i) {
    const Operation& op = ir.instructions[i];
    if (!RegisterInRange(op.lhs) || !RegisterInRange(op.rhs) || !RegisterInRange(op.out)) {
      if (error) {
        *error = "register index out of range at ip " + std::to_string(i) + ": " +
                 Brisk::IR::FormatOperation(op);
      }
      return false;
    }
    if (op.kind != OpKind::Label) continue;
    if (!labels_.emplace(op.label, i).second) {
      if (error) {
        *error = "duplicate label " + Brisk::IR::FormatLabel(op.label) + " at ip " + std::to_string(i);
      }
      labels_.clear();
      return false;
    }
  }
  if (ir.has_result && !RegisterInRange(ir.result)) {
    if (error) *error = "result register out of range: " + Brisk::IR::FormatRegister(ir.result);
    labels_.clear();
    return false;
  }
  ir_ = ir;
  loaded_ = true;
  return true;
}

int32_t Machine::ReadRegister(const Register& reg) const {
  if (frames_.empty() || !RegisterInRange(reg)) return 0;
  const Frame& frame = reg.kind == RegKind::Global ? frames_.front() : frames_.back();
  return frame[reg.addr];
}

int32_t& Machine::Slot(const Register& reg) {
  Frame& frame = reg.kind == RegKind::Global ? frames_.front() : frames_.back();
  return frame[reg.addr];
}

bool Machine::Resolve(const Label& label, size_t* index) const {
  auto it = labels_.find(label);
  if (it == labels_.end()) return false;
  *index = it->second;
  return true;
}

ExecResult Machine::Fault(FaultKind kind, const std::string& message) const {
  ExecResult result;
  result.status = ExecStatus::Trapped;
  result.fault = kind;
  result.ip = ip_;
  std::ostringstream out;
  out << message << " (ip " << ip_;
  if (ip_ < ir_.instructions.size()) {
    out << " op " << Brisk::IR::FormatOperation(ir_.instructions[ip_]);
  }
  out << ")";
  result.error = out.str();
  return result;
}

ExecResult Machine::Run() {
  if (!loaded_) {
    ExecResult result;
    result.status = ExecStatus::BadModule;
    result.error = "no program loaded";
    return result;
  }

  operands_.clear();
  returns_.clear();
  frames_.clear();
  frames_.push_back(Frame{});
  ip_ = 0;

  uint64_t steps = 0;
  const auto& code = ir_.instructions;
  while (ip_ < code.size()) {
    const Operation& op = code[ip_];
    ++steps;
    switch (op.kind) {
      case OpKind::Label:
        break;
      case OpKind::Call: {
        size_t target = 0;
        if (!Resolve(op.label, &target)) {
          return Fault(FaultKind::LabelResolution,
                       "call to undefined label " + Brisk::IR::FormatLabel(op.label));
        }
        if (returns_.size() >= kMaxCallDepth) {
          return Fault(FaultKind::ResourceExhausted, "call depth limit exceeded");
        }
        returns_.push_back(ip_);
        frames_.push_back(Frame{});
        ip_ = target;
        break;
      }
      case OpKind::Return:
        if (returns_.empty() || frames_.size() < 2) {
          return Fault(FaultKind::FrameUnderflow, "return with no active call");
        }
        ip_ = returns_.back();
        returns_.pop_back();
        frames_.pop_back();
        break;
      case OpKind::Push:
      case OpKind::PushI:
        if (operands_.size() >= kMaxOperandStack) {
          return Fault(FaultKind::ResourceExhausted, "operand stack limit exceeded");
        }
        operands_.push_back(op.kind == OpKind::Push ? Slot(op.lhs) : op.imm);
        break;
      case OpKind::Pop:
        if (operands_.empty()) {
          return Fault(FaultKind::StackUnderflow, "pop on empty operand stack");
        }
        Slot(op.lhs) = operands_.back();
        operands_.pop_back();
        break;
      case OpKind::Add:
        Slot(op.out) = WrapAdd(Slot(op.lhs), Slot(op.rhs));
        break;
      case OpKind::Sub:
        Slot(op.out) = WrapSub(Slot(op.lhs), Slot(op.rhs));
        break;
      case OpKind::Mul:
        Slot(op.out) = WrapMul(Slot(op.lhs), Slot(op.rhs));
        break;
      case OpKind::Div:
      case OpKind::Mod: {
        int32_t a = Slot(op.lhs);
        int32_t b = Slot(op.rhs);
        const char* message = nullptr;
        if (!CheckDivision(a, b, &message)) return Fault(FaultKind::Arithmetic, message);
        Slot(op.out) = op.kind == OpKind::Div ? a / b : a % b;
        break;
      }
      case OpKind::AddI:
        Slot(op.out) = WrapAdd(Slot(op.lhs), op.imm);
        break;
      case OpKind::SubI:
        Slot(op.out) = WrapSub(Slot(op.lhs), op.imm);
        break;
      case OpKind::MulI:
        Slot(op.out) = WrapMul(Slot(op.lhs), op.imm);
        break;
      case OpKind::DivI: {
        int32_t a = Slot(op.lhs);
        const char* message = nullptr;
        if (!CheckDivision(a, op.imm, &message)) return Fault(FaultKind::Arithmetic, message);
        Slot(op.out) = a / op.imm;
        break;
      }
      case OpKind::CmpEq:
        Slot(op.out) = Slot(op.lhs) == Slot(op.rhs) ? 1 : 0;
        break;
      case OpKind::CmpLt:
        Slot(op.out) = Slot(op.lhs) < Slot(op.rhs) ? 1 : 0;
        break;
      case OpKind::CmpLte:
        Slot(op.out) = Slot(op.lhs) <= Slot(op.rhs) ? 1 : 0;
        break;
      case OpKind::CmpGt:
        Slot(op.out) = Slot(op.lhs) > Slot(op.rhs) ? 1 : 0;
        break;
      case OpKind::CmpGte:
        Slot(op.out) = Slot(op.lhs) >= Slot(op.rhs) ? 1 : 0;
        break;
      case OpKind::LoadI:
        Slot(op.out) = op.imm;
        break;
      case OpKind::I2i:
        Slot(op.rhs) = Slot(op.lhs);
        break;
      case OpKind::JumpI: {
        size_t target = 0;
        if (!Resolve(op.label, &target)) {
          return Fault(FaultKind::LabelResolution,
                       "jump to undefined label " + Brisk::IR::FormatLabel(op.label));
        }
        ip_ = target;
        break;
      }
      case OpKind::CondBranch: {
        const Label& label = Slot(op.lhs) == 1 ? op.label : op.label_false;
        size_t target = 0;
        if (!Resolve(label, &target)) {
          return Fault(FaultKind::LabelResolution,
                       "branch to undefined label " + Brisk::IR::FormatLabel(label));
        }
        ip_ = target;
        break;
      }
    }
    ++ip_;
  }

  ExecResult result;
  result.status = ExecStatus::Halted;
  result.ip = ip_;
  result.steps = steps;
  if (ir_.has_result) {
    result.has_value = true;
    result.value = ReadRegister(ir_.result);
  }
  return result;
}

ExecResult ExecuteIR(const IR& ir) {
  Machine machine;
  std::string error;
  if (!machine.Load(ir, &error)) {
    ExecResult result;
    result.status = ExecStatus::BadModule;
    result.error = error;
    return result;
  }
  return machine.Run();
}

} // namespace Brisk::VM
