#include "sandbox/fake_runtime.hpp"

#include <chrono>
#include <cstring>

#include <capnp/message.h>
#include <capnp/serialize.h>
#include <kj/debug.h>

namespace sandbox {

bool FakeRuntime::Create(const ContainerSpec& spec, std::string* container_id,
                         std::string* error_msg) {
  creates++;
  if (!reachable) {
    *error_msg = "Cannot connect to the Docker daemon";
    return false;
  }
  if (fail_create) {
    *error_msg = "image not found";
    return false;
  }
  std::lock_guard<std::mutex> lck(mutex_);
  *container_id = "c" + std::to_string(++next_);
  live_.insert(*container_id);
  specs_.push_back(spec);
  return true;
}

bool FakeRuntime::SleepInside(const std::string& container_id,
                              int64_t millis) {
  std::unique_lock<std::mutex> lck(mutex_);
  return !removed_.wait_for(
      lck, std::chrono::milliseconds(millis),
      [this, &container_id]() { return live_.count(container_id) == 0; });
}

bool FakeRuntime::Exec(const std::string& container_id,
                       const std::vector<std::string>& args,
                       const std::string& input, int64_t timeout_millis,
                       ProcessOutcome* outcome, std::string* error_msg) {
  execs++;
  Handler handler;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    last_exec_args_ = args;
    if (live_.count(container_id) == 0) {
      *error_msg = "No such container: " + container_id;
      return false;
    }
    handler = handler_;
  }

  kj::Array<capnp::word> words =
      kj::heapArray<capnp::word>(input.size() / sizeof(capnp::word));
  memcpy(words.begin(), input.data(), words.size() * sizeof(capnp::word));
  capnp::FlatArrayMessageReader reader(words);
  auto request = reader.getRoot<capnproto::BoxRequest>();

  capnp::MallocMessageBuilder builder;
  auto response = builder.initRoot<capnproto::BoxResponse>();
  std::string code = request.getCode();
  if (code.find("while True") != std::string::npos) {
    int64_t wall = request.getLimits().getWallTimeMillis();
    bool timed_out = timeout_millis != 0 && timeout_millis < wall;
    if (!SleepInside(container_id, timed_out ? timeout_millis : wall)) {
      // Killed together with its container.
      outcome->exit_code = 137;
      return true;
    }
    if (timed_out) {
      outcome->timed_out = true;
      return true;
    }
    response.getStatus().setWallLimit();
    response.getUsage().setWallTime(wall / 1000.0);
  } else if (handler) {
    handler(request, response);
  } else {
    response.getStatus().setSuccess();
    response.setStdout(kj::StringPtr("ran\n").asBytes());
    if (request.getHasInput()) {
      auto input_data = request.getInput();
      response.initResult().initValue().setText(capnp::Text::Reader(
          reinterpret_cast<const char*>(input_data.begin()),
          input_data.size()));
      response.setResultType("str");
    }
  }
  kj::Array<capnp::word> out = capnp::messageToFlatArray(builder);
  kj::ArrayPtr<const char> chars = out.asPtr().asChars();
  outcome->exit_code = 0;
  outcome->stdout_data.assign(chars.begin(), chars.size());
  if (max_output != 0 && outcome->stdout_data.size() > max_output) {
    outcome->stdout_data.resize(max_output);
    outcome->stdout_truncated = true;
  }
  return true;
}

bool FakeRuntime::Remove(const std::string& container_id,
                         std::string* error_msg) {
  removes++;
  if (fail_remove) {
    *error_msg = "device or resource busy";
    return false;
  }
  {
    std::lock_guard<std::mutex> lck(mutex_);
    live_.erase(container_id);
  }
  removed_.notify_all();
  return true;
}

std::set<std::string> FakeRuntime::Live() {
  std::lock_guard<std::mutex> lck(mutex_);
  return live_;
}

std::vector<ContainerSpec> FakeRuntime::CreatedSpecs() {
  std::lock_guard<std::mutex> lck(mutex_);
  return specs_;
}

std::vector<std::string> FakeRuntime::LastExecArgs() {
  std::lock_guard<std::mutex> lck(mutex_);
  return last_exec_args_;
}

}  // namespace sandbox
