#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <cstdint>
#include <string>

#include <kj/common.h>
#include <kj/debug.h>

namespace util {

class File {
 public:
  // Reads at most limit bytes from the beginning of the file.
  static std::string ReadHead(const std::string& path,
                              uint64_t limit = UINT64_MAX);

  // Reads at most limit bytes from the end of the file.
  static std::string ReadTail(const std::string& path, uint64_t limit);

  // Writes the whole content to path, replacing it atomically. Missing parent
  // directories are created.
  static void WriteAll(const std::string& path, kj::ArrayPtr<const char> data);
  static void WriteAll(const std::string& path, const std::string& data) {
    WriteAll(path, kj::ArrayPtr<const char>(data.data(), data.size()));
  }

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Removes a file.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created.
  explicit TempDir(const std::string& base);

  // Returns the path of the temporary folder.
  const std::string& Path() const;

  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    other.moved_ = true;
    return *this;
  }
  KJ_DISALLOW_COPY(TempDir);

 private:
  std::string path_;
  bool moved_ = false;
};

}  // namespace util

#endif
