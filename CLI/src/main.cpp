#include <cctype>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "ir_builder.h"
#include "ir_model.h"
#include "lang_parser.h"
#include "vm.h"

namespace {
bool ReadFileText(const std::string& path, std::string* out, std::string* error) {
  if (!out) return false;
  std::ifstream in(path);
  if (!in) {
    if (error) *error = "failed to open file: " + path;
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  *out = buffer.str();
  return true;
}

bool WriteFileText(const std::string& path, const std::string& text, std::string* error) {
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    if (error) *error = "failed to open output file: " + path;
    return false;
  }
  out.write(text.data(), static_cast<std::streamsize>(text.size()));
  if (!out) {
    if (error) *error = "failed to write output file: " + path;
    return false;
  }
  return true;
}

std::string ReplaceExt(const std::string& path, const char* ext) {
  const size_t dot = path.find_last_of('.');
  const size_t slash = path.find_last_of("/\\");
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return path + ext;
  return path.substr(0, dot) + ext;
}

std::string BaseName(const char* argv0) {
  if (!argv0 || !*argv0) return "brisk";
  std::string name = argv0;
  const size_t slash = name.find_last_of("/\\");
  if (slash != std::string::npos) name = name.substr(slash + 1);
  if (name.empty()) return "brisk";
  return name;
}

struct ErrorLocation {
  bool ok = false;
  uint32_t line = 0;
  uint32_t column = 0;
  std::string message;
};

std::string TrimCopy(std::string s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
  return s;
}

// Front-end and builder messages start with "<line>:<column>: ".
ErrorLocation ParseErrorLocation(const std::string& raw_message) {
  ErrorLocation out;
  const std::string message = TrimCopy(raw_message);
  size_t p = 0;
  while (p < message.size() && std::isdigit(static_cast<unsigned char>(message[p]))) ++p;
  if (p == 0 || p >= message.size() || message[p] != ':') {
    out.message = message;
    return out;
  }
  const uint32_t line = static_cast<uint32_t>(std::stoul(message.substr(0, p)));
  const size_t col_start = ++p;
  while (p < message.size() && std::isdigit(static_cast<unsigned char>(message[p]))) ++p;
  if (p == col_start || p >= message.size() || message[p] != ':') {
    out.message = message;
    return out;
  }
  const uint32_t column = static_cast<uint32_t>(std::stoul(message.substr(col_start, p - col_start)));
  if (line == 0 || column == 0) {
    out.message = message;
    return out;
  }
  out.ok = true;
  out.line = line;
  out.column = column;
  out.message = TrimCopy(message.substr(p + 1));
  if (out.message.empty()) out.message = "diagnostic error";
  return out;
}

std::string GetSourceLine(const std::string& text, uint32_t line) {
  if (line == 0) return {};
  std::istringstream in(text);
  std::string current_text;
  uint32_t current = 0;
  while (std::getline(in, current_text)) {
    ++current;
    if (current == line) return current_text;
  }
  return {};
}

void PrintError(const std::string& message) {
  std::cerr << "error[E0001]: " << TrimCopy(message) << "\n";
}

std::string DiagnosticHelpFor(const std::string& message) {
  if (message.find("unexpected character") != std::string::npos) {
    return "remove unsupported characters or escape them if inside literals";
  }
  if (message.find("'break' outside of a loop") != std::string::npos) {
    return "'break' may only appear inside a loop body";
  }
  if (message.find("does not end with a value") != std::string::npos) {
    return "end the function body with an expression line";
  }
  if (message.find("argument(s), got") != std::string::npos) {
    return "pass exactly as many arguments as the function declares";
  }
  if (message.find("expected") != std::string::npos) {
    return "check surrounding syntax near the highlighted token";
  }
  return {};
}

void PrintDiagnosticHelp(const std::string& message) {
  const std::string hint = DiagnosticHelpFor(message);
  if (!hint.empty()) {
    std::cerr << "  = help: " << hint << "\n";
  }
}

void PrintErrorWithContext(const std::string& path, const std::string& source, const std::string& message) {
  ErrorLocation loc = ParseErrorLocation(message);
  if (!loc.ok) {
    PrintError(loc.message);
    PrintDiagnosticHelp(loc.message);
    return;
  }
  std::cerr << "error[E0001]: " << loc.message << "\n";
  std::cerr << " --> " << path << ":" << loc.line << ":" << loc.column << "\n";
  const std::string line_text = GetSourceLine(source, loc.line);
  if (!line_text.empty()) {
    std::cerr << "  |\n";
    std::cerr << loc.line << " | " << line_text << "\n";
    std::cerr << "  | ";
    for (uint32_t i = 1; i < loc.column; ++i) {
      std::cerr << ' ';
    }
    std::cerr << "^\n";
  }
  PrintDiagnosticHelp(loc.message);
}

bool LoadSource(const std::string& path, std::string* source) {
  std::string error;
  if (!ReadFileText(path, source, &error)) {
    PrintError(error);
    return false;
  }
  return true;
}

bool ParseSource(const std::string& path, const std::string& source, Brisk::Lang::Program* program) {
  std::string error;
  if (!Brisk::Lang::ParseProgramFromString(source, program, &error)) {
    PrintErrorWithContext(path, source, error);
    return false;
  }
  return true;
}

bool CompileSource(const std::string& path,
                   const std::string& source,
                   const Brisk::IR::BuildOptions& options,
                   Brisk::IR::IR* ir) {
  Brisk::Lang::Program program;
  if (!ParseSource(path, source, &program)) return false;
  std::string error;
  if (!Brisk::IR::BuildProgram(program, options, ir, &error)) {
    PrintErrorWithContext(path, source, error);
    return false;
  }
  return true;
}

void PrintUsage(const std::string& tool_name) {
  std::cerr << "usage:\n"
            << "  " << tool_name << " run <file.bk> [--check-arity]\n"
            << "  " << tool_name << " emit -ir <file.bk> [--out <file.ir>] [--check-arity]\n"
            << "  " << tool_name << " emit -ast <file.bk> [--out <file.ast>]\n"
            << "  " << tool_name << " check <file.bk> [--check-arity]\n"
            << "  " << tool_name << " <file.bk> [--check-arity]\n";
}

} // namespace

int main(int argc, char** argv) {
  const std::string tool_name = BaseName(argv[0]);
  if (argc < 2) {
    PrintUsage(tool_name);
    return 1;
  }

  const std::string cmd = argv[1];
  const bool is_command = (cmd == "run" || cmd == "check" || cmd == "emit");
  Brisk::IR::BuildOptions options;
  std::string out_path;
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check-arity") {
      options.check_call_arity = true;
    } else if (arg == "--out") {
      if (i + 1 >= argc) {
        PrintError("--out expects a path");
        return 1;
      }
      out_path = argv[++i];
    }
  }

  if (cmd == "emit") {
    if (argc < 4) {
      PrintError("emit expects -ir or -ast and an input file");
      return 1;
    }
    const std::string mode = argv[2];
    const std::string emit_path = argv[3];
    std::string source;
    if (!LoadSource(emit_path, &source)) return 1;
    std::string text;
    if (mode == "-ir") {
      Brisk::IR::IR ir;
      if (!CompileSource(emit_path, source, options, &ir)) return 1;
      text = Brisk::IR::FormatIR(ir);
      if (out_path.empty()) out_path = ReplaceExt(emit_path, ".ir");
    } else if (mode == "-ast") {
      Brisk::Lang::Program program;
      if (!ParseSource(emit_path, source, &program)) return 1;
      text = Brisk::Lang::DumpProgram(program);
      if (out_path.empty()) out_path = ReplaceExt(emit_path, ".ast");
    } else {
      PrintError("emit expects -ir or -ast");
      return 1;
    }
    std::string error;
    if (!WriteFileText(out_path, text, &error)) {
      PrintError(error);
      return 1;
    }
    return 0;
  }

  const std::string path = is_command ? (argc > 2 ? argv[2] : "") : cmd;
  if (path.empty() || path.rfind("--", 0) == 0) {
    PrintError("missing input file");
    return 1;
  }

  std::string source;
  if (!LoadSource(path, &source)) return 1;
  Brisk::IR::IR ir;
  if (!CompileSource(path, source, options, &ir)) return 1;
  if (cmd == "check") return 0;

  Brisk::VM::ExecResult exec = Brisk::VM::ExecuteIR(ir);
  if (exec.status == Brisk::VM::ExecStatus::BadModule) {
    PrintError("load failed: " + exec.error);
    return 1;
  }
  if (exec.status != Brisk::VM::ExecStatus::Halted) {
    PrintError(std::string("runtime trap: ") + Brisk::VM::ToString(exec.fault) + ": " + exec.error);
    return 1;
  }
  if (exec.has_value) {
    std::cout << exec.value << "\n";
  } else {
    std::cout << "none\n";
  }
  return 0;
}
