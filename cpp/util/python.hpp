#ifndef UTIL_PYTHON_HPP
#define UTIL_PYTHON_HPP

namespace util {

// Starts the embedded Python interpreter once per process and releases the
// GIL, so any thread can use it under pybind11::gil_scoped_acquire. The
// interpreter lives until the process exits.
void EnsurePython();

}  // namespace util

#endif
