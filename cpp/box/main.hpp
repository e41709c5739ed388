#ifndef BOX_MAIN_HPP
#define BOX_MAIN_HPP
#include <kj/main.h>

namespace box {

// `rexec box`: runs inside the container. Reads a BoxRequest from stdin and
// writes a BoxResponse to stdout. With --run-program, runs the program of a
// scratch directory in-process instead.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
};
}  // namespace box
#endif
