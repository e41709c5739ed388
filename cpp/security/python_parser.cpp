#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/embed.h>
#pragma GCC diagnostic pop

#include <algorithm>

#include <kj/debug.h>

#include "security/parser.hpp"
#include "util/python.hpp"

namespace py = pybind11;

namespace security {
namespace {

int LineOf(const py::handle& node) {
  if (!py::hasattr(node, "lineno")) return 0;
  py::object lineno = node.attr("lineno");
  if (lineno.is_none()) return 0;
  return lineno.cast<int>();
}

bool IsStringConstant(const py::handle& node, const py::object& constant) {
  if (!py::isinstance(node, constant)) return false;
  py::object value = node.attr("value");
  return py::isinstance<py::str>(value);
}

bool IsWriteMode(const std::string& mode) {
  return mode.find_first_of("wax+") != std::string::npos;
}

// Returns the callee name if node opens a file, and sets *mode_index to the
// position of the mode argument. os.open takes integer flags and is reported
// with *mode_index = -1.
bool OpenCallee(const py::handle& call, const py::object& name_node,
                const py::object& attribute_node, std::string* callee,
                int* mode_index) {
  py::object func = call.attr("func");
  if (py::isinstance(func, name_node)) {
    *callee = func.attr("id").cast<std::string>();
    *mode_index = 1;
    return *callee == "open";
  }
  if (!py::isinstance(func, attribute_node)) return false;
  if (func.attr("attr").cast<std::string>() != "open") return false;
  std::string owner = "<expr>";
  py::object value = func.attr("value");
  if (py::isinstance(value, name_node)) {
    owner = value.attr("id").cast<std::string>();
  }
  *callee = owner + ".open";
  if (owner == "os") {
    *mode_index = -1;
  } else if (owner == "io" || owner == "codecs" || owner == "builtins") {
    *mode_index = 1;
  } else {
    // Path.open and friends take the mode first.
    *mode_index = 0;
  }
  return true;
}

// True unless the call provably opens for reading only.
bool MayWrite(const py::handle& call, int mode_index,
              const py::object& constant, const py::object& starred) {
  if (mode_index < 0) return true;
  for (py::handle keyword : call.attr("keywords")) {
    py::object arg = keyword.attr("arg");
    // **kwargs could carry a mode.
    if (arg.is_none()) return true;
    if (arg.cast<std::string>() != "mode") continue;
    py::object value = keyword.attr("value");
    if (!IsStringConstant(value, constant)) return true;
    return IsWriteMode(value.attr("value").cast<std::string>());
  }
  auto args = call.attr("args").cast<py::list>();
  for (size_t i = 0; i < args.size() && i <= static_cast<size_t>(mode_index);
       i++) {
    py::object arg = args[i];
    if (py::isinstance(arg, starred)) return true;
  }
  if (args.size() <= static_cast<size_t>(mode_index)) return false;
  py::object mode = args[mode_index];
  if (!IsStringConstant(mode, constant)) return true;
  return IsWriteMode(mode.attr("value").cast<std::string>());
}

}  // namespace

PythonParser::PythonParser() { util::EnsurePython(); }

ParseResult PythonParser::Parse(const std::string& code) const {
  ParseResult result;
  py::gil_scoped_acquire gil;
  try {
    py::module_ ast = py::module_::import("ast");
    py::object tree =
        ast.attr("parse")(py::bytes(code), "<program>", "exec");
    py::object import_node = ast.attr("Import");
    py::object import_from_node = ast.attr("ImportFrom");
    py::object call_node = ast.attr("Call");
    py::object name_node = ast.attr("Name");
    py::object attribute_node = ast.attr("Attribute");
    py::object constant_node = ast.attr("Constant");
    py::object starred_node = ast.attr("Starred");
    for (py::handle node : ast.attr("walk")(tree)) {
      if (py::isinstance(node, import_node)) {
        for (py::handle alias : node.attr("names")) {
          result.imports.push_back(
              {alias.attr("name").cast<std::string>(), LineOf(node), false});
        }
      } else if (py::isinstance(node, import_from_node)) {
        int level = node.attr("level").cast<int>();
        py::object module = node.attr("module");
        std::string name = module.is_none() ? "" : module.cast<std::string>();
        if (level > 0) {
          result.imports.push_back(
              {std::string(level, '.') + name, LineOf(node), true});
        } else {
          result.imports.push_back({name, LineOf(node), false});
        }
      } else if (py::isinstance(node, call_node)) {
        std::string callee;
        int mode_index = 0;
        if (OpenCallee(node, name_node, attribute_node, &callee,
                       &mode_index) &&
            MayWrite(node, mode_index, constant_node, starred_node)) {
          result.write_opens.push_back({callee, LineOf(node)});
        }
      }
    }
  } catch (py::error_already_set& e) {
    // SyntaxError, ValueError (NUL bytes), RecursionError on absurd nesting:
    // all of them mean the program cannot be analyzed.
    result.ok = false;
    result.imports.clear();
    result.write_opens.clear();
    py::object value = e.value();
    if (e.matches(PyExc_SyntaxError)) {
      py::object msg = value.attr("msg");
      result.error = msg.is_none() ? std::string("invalid syntax")
                                   : py::str(msg).cast<std::string>();
      result.error_line = LineOf(value);
    } else {
      result.error = py::str(value).cast<std::string>();
    }
    KJ_LOG(INFO, "Program does not parse", result.error, result.error_line);
  }
  std::stable_sort(
      result.imports.begin(), result.imports.end(),
      [](const ImportRef& a, const ImportRef& b) { return a.line < b.line; });
  std::stable_sort(result.write_opens.begin(), result.write_opens.end(),
                   [](const WriteOpenRef& a, const WriteOpenRef& b) {
                     return a.line < b.line;
                   });
  return result;
}

}  // namespace security
