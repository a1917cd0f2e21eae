#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ir_builder.h"
#include "ir_model.h"
#include "vm.h"

namespace Brisk::Tests {

struct TestCase {
  const char* name;
  bool (*fn)();
};

struct TestSection {
  const char* name;
  const TestCase* tests;
  size_t count;
};

struct TestResult {
  size_t total = 0;
  size_t failed = 0;
};

bool BuildSource(const std::string& src,
                 const IR::BuildOptions& options,
                 IR::IR* out,
                 std::string* error);
bool BuildSource(const std::string& src, IR::IR* out, std::string* error);

bool ExpectOps(const std::vector<IR::Operation>& got,
               const std::vector<IR::Operation>& expected,
               const char* name);

bool BuildExpectFail(const std::string& src, const char* needle);
bool BuildExpectFail(const std::string& src, const IR::BuildOptions& options, const char* needle);

bool RunSourceExpect(const std::string& src, int32_t expected);
bool RunSourceExpectNone(const std::string& src);
bool RunSourceExpectFault(const std::string& src, VM::FaultKind kind);
bool RunIrExpectFault(const IR::IR& ir, VM::FaultKind kind, const char* name);

TestResult RunSection(const TestSection& section);
TestResult RunAllSections(const TestSection* sections, size_t count);

} // namespace Brisk::Tests
