#ifndef SANDBOX_FAKE_RUNTIME_HPP
#define SANDBOX_FAKE_RUNTIME_HPP
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "capnp/box.capnp.h"
#include "sandbox/runtime.hpp"

namespace sandbox {

// In-memory runtime for tests. Exec decodes the BoxRequest sent to
// `rexec box` and answers with a BoxResponse produced by the handler. By
// default programs containing "while True" run until their wall limit or
// until their container is removed; anything else succeeds and echoes the
// input as a text result.
class FakeRuntime : public Runtime {
 public:
  using Handler = std::function<void(capnproto::BoxRequest::Reader,
                                     capnproto::BoxResponse::Builder)>;

  bool Create(const ContainerSpec& spec, std::string* container_id,
              std::string* error_msg) override;
  bool Exec(const std::string& container_id,
            const std::vector<std::string>& args, const std::string& input,
            int64_t timeout_millis, ProcessOutcome* outcome,
            std::string* error_msg) override;
  bool Remove(const std::string& container_id,
              std::string* error_msg) override;
  bool Ping() override {
    pings++;
    return reachable;
  }

  void SetHandler(Handler handler) {
    std::lock_guard<std::mutex> lck(mutex_);
    handler_ = std::move(handler);
  }

  // Containers created and not removed yet.
  std::set<std::string> Live();
  std::vector<ContainerSpec> CreatedSpecs();
  std::vector<std::string> LastExecArgs();

  std::atomic<int> creates{0};
  std::atomic<int> removes{0};
  std::atomic<int> execs{0};
  std::atomic<int> pings{0};
  std::atomic<bool> fail_create{false};
  std::atomic<bool> fail_remove{false};
  std::atomic<bool> reachable{true};
  // Cuts the box response to this many bytes when non-zero.
  std::atomic<size_t> max_output{0};

 private:
  // Sleeps up to millis, returning early (false) if the container goes away.
  bool SleepInside(const std::string& container_id, int64_t millis);

  std::mutex mutex_;
  std::condition_variable removed_;
  std::set<std::string> live_;
  std::vector<ContainerSpec> specs_;
  std::vector<std::string> last_exec_args_;
  Handler handler_;
  int next_ = 0;
};

}  // namespace sandbox

#endif
