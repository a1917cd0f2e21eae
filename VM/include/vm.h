#ifndef BRISK_VM_H
#define BRISK_VM_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "ir_model.h"

namespace Brisk::VM {

using Brisk::IR::IR;
using Brisk::IR::Label;
using Brisk::IR::LabelHash;
using Brisk::IR::Operation;
using Brisk::IR::Register;

enum class ExecStatus {
  Ok,
  Halted,
  Trapped,
  BadModule,
};

enum class FaultKind {
  None,
  LabelResolution,
  StackUnderflow,
  FrameUnderflow,
  Arithmetic,
  ResourceExhausted,
};

// Nested calls allowed before a Call faults with ResourceExhausted.
constexpr size_t kMaxCallDepth = 4096;
// Operand stack entries allowed before a Push faults with ResourceExhausted.
constexpr size_t kMaxOperandStack = 65536;

struct ExecResult {
  ExecStatus status = ExecStatus::Ok;
  FaultKind fault = FaultKind::None;
  std::string error;
  size_t ip = 0;
  bool has_value = false;
  int32_t value = 0;
  uint64_t steps = 0;
};

const char* ToString(FaultKind kind);

// Executes one IR program. Global registers resolve against the bottom frame,
// Arp registers against the top frame. Each Call pushes a zeroed frame.
class Machine {
 public:
  bool Load(const IR& ir, std::string* error);
  ExecResult Run();

  int32_t ReadRegister(const Register& reg) const;
  const std::vector<int32_t>& OperandStack() const { return operands_; }
  size_t CallDepth() const { return frames_.empty() ? 0 : frames_.size() - 1; }

 private:
  using Frame = std::array<int32_t, Brisk::IR::kRegisterFileSize>;

  int32_t& Slot(const Register& reg);
  bool Resolve(const Label& label, size_t* index) const;
  ExecResult Fault(FaultKind kind, const std::string& message) const;

  IR ir_;
  bool loaded_ = false;
  std::unordered_map<Label, size_t, LabelHash> labels_;
  std::vector<int32_t> operands_;
  std::vector<size_t> returns_;
  std::vector<Frame> frames_;
  size_t ip_ = 0;
};

ExecResult ExecuteIR(const IR& ir);

} // namespace Brisk::VM

#endif // BRISK_VM_H
