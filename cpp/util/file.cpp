#include "util/file.hpp"

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/io.h>
#include <array>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";
const size_t kMaxPathLen = 1 << 15;

[[noreturn]] void Fail(const std::string& what, const std::string& path) {
  throw std::system_error(errno, std::system_category(), what + " " + path);
}

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

// mkdtemp/mkostemp want a mutable template ending in XXXXXX.
void MakeTemplate(const std::string& prefix, char (&buf)[kMaxPathLen]) {
  std::string tmp = prefix + "XXXXXX";
  KJ_REQUIRE(tmp.size() < kMaxPathLen, tmp.size(), "Path too long");
  buf[0] = 0;
  strncat(buf, tmp.c_str(), kMaxPathLen - 1);  // NOLINT
}

kj::AutoCloseFd OpenForRead(const std::string& path) {
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY)};  // NOLINT
  if (fd.get() == -1) Fail("Read", path);
  return fd;
}

// Appends up to limit bytes from fd to content.
void ReadUpTo(int fd, const std::string& path, uint64_t limit,
              std::string* content) {
  std::array<char, 64 * 1024> buf;
  uint64_t total = 0;
  while (total < limit) {
    size_t want = buf.size();
    if (limit - total < want) want = limit - total;
    ssize_t amount = read(fd, buf.data(), want);  // NOLINT
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) Fail("Read", path);
    if (amount == 0) break;
    content->append(buf.data(), amount);
    total += amount;
  }
}

}  // namespace

namespace util {

std::string File::ReadHead(const std::string& path, uint64_t limit) {
  auto fd = OpenForRead(path);
  std::string content;
  ReadUpTo(fd, path, limit, &content);
  return content;
}

std::string File::ReadTail(const std::string& path, uint64_t limit) {
  auto fd = OpenForRead(path);
  int64_t size = Size(path);
  if (size > 0 && static_cast<uint64_t>(size) > limit) {
    if (lseek(fd, size - limit, SEEK_SET) == -1) Fail("lseek", path);
  }
  std::string content;
  ReadUpTo(fd, path, UINT64_MAX, &content);
  // The file may have grown between stat and read.
  if (content.size() > limit) content.erase(0, content.size() - limit);
  return content;
}

void File::WriteAll(const std::string& path, kj::ArrayPtr<const char> data) {
  std::string dir = BaseDir(path);
  if (!dir.empty()) MakeDirs(dir);
  char buf[kMaxPathLen];
  MakeTemplate(path + ".", buf);
  kj::AutoCloseFd fd{mkostemp(buf, O_CLOEXEC)};  // NOLINT
  if (fd.get() == -1) Fail("Write", path);
  std::string temp_file = buf;  // NOLINT
  bool done = false;
  auto cleanup = kj::defer([&]() {
    if (!done) remove(temp_file.c_str());
  });

  size_t pos = 0;
  while (pos < data.size()) {
    ssize_t written = write(fd, data.begin() + pos, data.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) Fail("Write", temp_file);
    pos += written;
  }
  if (fsync(fd) == -1) Fail("fsync", temp_file);
  if (rename(temp_file.c_str(), path.c_str()) == -1) Fail("Write", path);
  done = true;
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir");
    }
  }
}

void File::Remove(const std::string& path) {
  if (remove(path.c_str()) == -1) {
    throw std::system_error(errno, std::system_category(), "remove");
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path)) {
    throw std::system_error(errno, std::system_category(), "removetree");
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (strchr(kPathSeparators, second[0]) != nullptr) return second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  char buf[kMaxPathLen];
  MakeTemplate(base + kPathSeparators[0], buf);
  if (mkdtemp(buf) == nullptr) Fail("mkdtemp", base);  // NOLINT
  path_ = buf;                                          // NOLINT
}
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {  // NOLINT
  if (!moved_) {
    kj::UnwindDetector detector;
    detector.catchExceptionsIfUnwinding([&]() { File::RemoveTree(path_); });
  }
}

}  // namespace util
