#ifndef BOX_BOX_HPP
#define BOX_BOX_HPP
#include <cstdint>
#include <string>

#include "capnp/box.capnp.h"

namespace box {

// A result list longer or bigger than this ships its first items only.
static const constexpr size_t kMaxResultItems = 10000;
static const constexpr size_t kMaxResultBytes = 16 * 1024 * 1024;

struct BoxOptions {
  // Scratch directories are created here.
  std::string temp_directory = "/tmp";
  // Local wheels used to install dependencies when there is no network.
  std::string wheelhouse;
  std::string python = "python3";
  // Executable started as `<self> box --run-program <dir>` for the program.
  std::string self;
  // Bytes of stdout (head) and stderr (tail) that are forwarded.
  size_t max_output = 1024 * 1024;
};

// Runs one program inside the container: dependency installation, the
// program itself under resource limits, and collection of its outputs.
class Box {
 public:
  explicit Box(BoxOptions options) : options_(std::move(options)) {}

  // Failures of the program are reported in response; failures of the box
  // itself are reported as internalError.
  void Run(capnproto::BoxRequest::Reader request,
           capnproto::BoxResponse::Builder response);

 private:
  // Returns false, after filling response, if installation failed.
  bool InstallDependencies(capnproto::BoxRequest::Reader request,
                           const std::string& dir,
                           capnproto::BoxResponse::Builder response);

  // Runs the program and fills status, streams, usage and result.
  void Execute(capnproto::BoxRequest::Reader request, const std::string& dir,
               capnproto::BoxResponse::Builder response);

  BoxOptions options_;
};

}  // namespace box

#endif
