#ifndef BRISK_IR_BUILDER_H
#define BRISK_IR_BUILDER_H

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "ir_model.h"
#include "lang_ast.h"

namespace Brisk::IR {

struct BuildOptions {
  // Reject calls to undefined functions and calls whose argument count does
  // not match the callee's parameter count. Off by default: callers and
  // callees otherwise agree on arity only through matching Push/Pop counts.
  bool check_call_arity = false;
};

// Lowers a parsed program into register IR. An instance builds exactly one
// program; construct a fresh builder per compilation.
//
// Register policy: every scope hands out indices from a strictly increasing
// counter and never reuses them. The top-level scope allocates Global
// registers, function bodies allocate Arp registers.
//
// Function names form a symbol table with last-definition-wins semantics:
// when a name is defined more than once, only the last body keeps the Named
// entry label, earlier bodies are relabelled and become unreachable.
class IrBuilder {
 public:
  IrBuilder();
  explicit IrBuilder(BuildOptions options);

  bool Build(const Lang::Program& program, IR* out, std::string* error);

 private:
  struct Scope {
    std::string owner;
    RegAddr next_free = 0;
    std::unordered_map<std::string, Register> variables;
  };

  struct FunctionSymbol {
    size_t param_count = 0;
    uint32_t definitions = 0;
  };

  struct CallSite {
    std::string name;
    size_t arg_count = 0;
    uint32_t line = 0;
    uint32_t column = 0;
  };

  using Ops = std::vector<Operation>;

  bool BuildFnDef(const Lang::FnDef& fn, Ops* ops);
  bool BuildBlock(const std::vector<Lang::BlockLine>& block, Ops* ops, bool* has_out, Register* out);
  bool BuildBlockLine(const Lang::BlockLine& line, Ops* ops, bool* has_out, Register* out);
  bool BuildLoop(const Lang::BlockLine& line, Ops* ops);
  bool BuildExpr(const Lang::Expr& expr, Ops* ops, Register* out);
  bool BuildName(const Lang::Expr& expr, Register* out);
  bool BuildAssignment(const Lang::Expr& expr, Ops* ops, Register* out);
  bool BuildBinOp(const Lang::Expr& expr, Ops* ops, Register* out);
  bool BuildFnCall(const Lang::Expr& expr, Ops* ops, Register* out);
  bool BuildIf(const Lang::Expr& expr, Ops* ops, Register* out);

  bool NextRegister(Register* out);
  bool VariableRegister(const std::string& name, Register* out);
  Label NextLabel();
  bool Fail(uint32_t line, uint32_t column, const std::string& message);

  bool CheckCallSites();
  void RelabelShadowedFunctions(Ops* ops);

  BuildOptions options_;
  uint32_t next_label_ = 0;
  std::vector<Scope> scopes_;
  std::vector<Label> loop_ends_;
  std::unordered_map<std::string, FunctionSymbol> functions_;
  std::vector<CallSite> call_sites_;
  bool used_ = false;
  std::string error_;
};

bool BuildProgram(const Lang::Program& program, IR* out, std::string* error);
bool BuildProgram(const Lang::Program& program,
                  const BuildOptions& options,
                  IR* out,
                  std::string* error);

} // namespace Brisk::IR

#endif // BRISK_IR_BUILDER_H
