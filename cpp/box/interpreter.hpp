#ifndef BOX_INTERPRETER_HPP
#define BOX_INTERPRETER_HPP
#include <string>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/embed.h>
#pragma GCC diagnostic pop

#include "capnp/value.capnp.h"

namespace box {

// Layout of the scratch directory shared by the box and the program process.
static const constexpr char* kProgramFile = "program.py";
static const constexpr char* kInputFile = "input";
static const constexpr char* kResultFile = "result.bin";
static const constexpr char* kResultTypeFile = "result_type";
static const constexpr char* kDepsDir = "deps";

// Deeper structures are reported as opaque values.
static const constexpr int kMaxValueDepth = 32;
static const constexpr size_t kMaxReprLength = 500;

// Converts a Python object to a Value. Never throws for Python-side errors:
// whatever cannot be converted becomes an opaque value.
void ToValue(pybind11::handle obj, capnproto::Value::Builder out,
             int depth = 0);

// Runs dir/program.py in the embedded interpreter of the current process,
// with input_data bound to the content of dir/input. The global `result`, if
// any, is written to dir/result.bin and its type name to dir/result_type.
// Returns the process exit code.
int RunProgram(const std::string& dir);

}  // namespace box

#endif
