#ifndef UTIL_VERSION_HPP
#define UTIL_VERSION_HPP

#include <string>

namespace util {
static const std::string version = "0.1.0";
}  // namespace util

#endif
