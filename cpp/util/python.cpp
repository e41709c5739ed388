#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/embed.h>
#pragma GCC diagnostic pop

#include "util/python.hpp"

#include <mutex>

#include <kj/debug.h>

namespace util {

void EnsurePython() {
  static std::once_flag once;
  std::call_once(once, []() {
    if (!Py_IsInitialized()) {
      pybind11::initialize_interpreter(/*init_signal_handlers=*/false);
    }
    PyThreadState* state = PyEval_SaveThread();
    KJ_ASSERT(state != nullptr, "Python interpreter without a thread state");
    KJ_LOG(INFO, "Embedded Python interpreter started");
  });
}

}  // namespace util
