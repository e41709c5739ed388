#include "util/misc.hpp"

#include <kj/debug.h>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::string join(const std::vector<std::string>& pieces,
                 const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < pieces.size(); i++) {
    if (i) out += sep;
    out += pieces[i];
  }
  return out;
}

std::function<bool()> setBool(bool* var) {
  return [var]() {
    *var = true;
    return true;
  };
}

std::function<bool(kj::StringPtr)> setString(std::string* var) {
  return [var](kj::StringPtr p) {
    *var = p.cStr();
    return true;
  };
}

std::function<bool(kj::StringPtr)> appendString(
    std::vector<std::string>* var) {
  return [var](kj::StringPtr p) {
    var->emplace_back(p.cStr());
    return true;
  };
}

std::function<bool(kj::StringPtr)> setInt(int32_t* var) {
  return [var](kj::StringPtr p) {
    *var = p.parseAs<int32_t>();
    return true;
  };
}

std::function<bool(kj::StringPtr)> setUint(uint32_t* var) {
  return [var](kj::StringPtr p) {
    *var = p.parseAs<uint32_t>();
    return true;
  };
}

std::function<bool(kj::StringPtr)> setDouble(double* var) {
  return [var](kj::StringPtr p) {
    *var = p.parseAs<double>();
    return true;
  };
}

}  // namespace util
