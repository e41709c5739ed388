#include "box/interpreter.hpp"

#include <cstdio>

#include <capnp/message.h>
#include <capnp/serialize.h>
#include <kj/debug.h>

#include "util/file.hpp"
#include "util/python.hpp"

namespace py = pybind11;

namespace box {
namespace {

// Cuts s to at most len bytes without splitting a UTF-8 sequence.
std::string Truncate(const std::string& s, size_t len) {
  if (s.size() <= len) return s;
  while (len > 0 && (static_cast<unsigned char>(s[len]) & 0xC0) == 0x80) len--;
  return s.substr(0, len);
}

std::string TypeName(py::handle obj) {
  return py::str(py::type::handle_of(obj).attr("__name__")).cast<std::string>();
}

void SetOpaque(py::handle obj, capnproto::Value::Builder out) {
  auto opaque = out.initOpaque();
  std::string type_name = "object";
  std::string repr = "<unrepresentable>";
  try {
    type_name = TypeName(obj);
    repr = py::repr(obj).cast<std::string>();
  } catch (py::error_already_set& e) {
    KJ_LOG(WARNING, "repr() failed", e.what());
  }
  opaque.setTypeName(type_name);
  opaque.setRepr(Truncate(repr, kMaxReprLength));
}

bool HasAttrs(py::handle obj, const char* a, const char* b) {
  return py::hasattr(obj, a) && py::hasattr(obj, b);
}

}  // namespace

void ToValue(py::handle obj, capnproto::Value::Builder out, int depth) {
  if (depth > kMaxValueDepth) {
    SetOpaque(obj, out);
    return;
  }
  try {
    if (obj.is_none()) {
      out.setNone();
    } else if (py::isinstance<py::bool_>(obj)) {
      out.setBoolean(obj.cast<bool>());
    } else if (py::isinstance<py::int_>(obj)) {
      int overflow = 0;
      long long value = PyLong_AsLongLongAndOverflow(obj.ptr(), &overflow);
      if (overflow != 0) {
        SetOpaque(obj, out);
      } else {
        if (value == -1 && PyErr_Occurred()) throw py::error_already_set();
        out.setInteger(value);
      }
    } else if (py::isinstance<py::float_>(obj)) {
      out.setReal(obj.cast<double>());
    } else if (py::isinstance<py::str>(obj)) {
      out.setText(obj.cast<std::string>());
    } else if (py::isinstance<py::dict>(obj)) {
      py::dict dict = py::reinterpret_borrow<py::dict>(obj);
      auto fields = out.initRecord(dict.size());
      size_t i = 0;
      for (auto item : dict) {
        fields[i].setName(py::str(item.first).cast<std::string>());
        ToValue(item.second, fields[i].initValue(), depth + 1);
        i++;
      }
    } else if (py::isinstance<py::list>(obj) ||
               py::isinstance<py::tuple>(obj)) {
      py::sequence seq = py::reinterpret_borrow<py::sequence>(obj);
      auto list = out.initList(seq.size());
      for (size_t i = 0; i < seq.size(); i++) {
        ToValue(seq[i], list[i], depth + 1);
      }
    } else if (HasAttrs(obj, "to_dict", "columns")) {
      // DataFrame-like: one record per row.
      ToValue(obj.attr("to_dict")("records"), out, depth + 1);
    } else if (HasAttrs(obj, "tolist", "dtype")) {
      // numpy arrays and scalars, pandas Series.
      ToValue(obj.attr("tolist")(), out, depth + 1);
    } else {
      SetOpaque(obj, out);
    }
  } catch (py::error_already_set& e) {
    KJ_LOG(WARNING, "Value conversion failed", e.what());
    SetOpaque(obj, out);
  }
}

int RunProgram(const std::string& dir) {
  util::EnsurePython();
  py::gil_scoped_acquire gil;
  py::module_ sys = py::module_::import("sys");
  py::module_ builtins = py::module_::import("builtins");
  sys.attr("path").attr("insert")(0, util::File::JoinPath(dir, kDepsDir));
  sys.attr("argv") = py::make_tuple(kProgramFile);

  py::dict globals;
  globals["__name__"] = "__main__";
  globals["__builtins__"] = builtins;

  std::string input_path = util::File::JoinPath(dir, kInputFile);
  if (util::File::Exists(input_path)) {
    py::bytes raw(util::File::ReadHead(input_path));
    try {
      globals["input_data"] = py::module_::import("json").attr("loads")(raw);
    } catch (py::error_already_set&) {
      try {
        globals["input_data"] = raw.attr("decode")("utf-8");
      } catch (py::error_already_set&) {
        globals["input_data"] = raw;
      }
    }
  } else {
    globals["input_data"] = py::none();
  }

  int exit_code = 0;
  auto flush = [&sys]() {
    sys.attr("stdout").attr("flush")();
    sys.attr("stderr").attr("flush")();
  };
  try {
    std::string code =
        util::File::ReadHead(util::File::JoinPath(dir, kProgramFile));
    py::object compiled =
        builtins.attr("compile")(py::bytes(code), kProgramFile, "exec");
    builtins.attr("exec")(compiled, globals);
  } catch (py::error_already_set& e) {
    if (e.matches(PyExc_SystemExit)) {
      py::object status = e.value().attr("code");
      if (status.is_none()) {
        exit_code = 0;
      } else if (py::isinstance<py::int_>(status)) {
        exit_code = status.cast<int>();
      } else {
        sys.attr("stderr").attr("write")(py::str(status));
        sys.attr("stderr").attr("write")("\n");
        exit_code = 1;
      }
    } else {
      e.restore();
      PyErr_Print();
      exit_code = 1;
    }
  }
  flush();
  if (exit_code != 0) return exit_code;

  if (globals.contains("result")) {
    py::object result = globals["result"];
    capnp::MallocMessageBuilder builder;
    ToValue(result, builder.initRoot<capnproto::Value>());
    kj::Array<capnp::word> words = capnp::messageToFlatArray(builder);
    util::File::WriteAll(util::File::JoinPath(dir, kResultFile),
                         words.asPtr().asChars());
    util::File::WriteAll(util::File::JoinPath(dir, kResultTypeFile),
                         TypeName(result));
  }
  return 0;
}

}  // namespace box
