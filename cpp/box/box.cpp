#include "box/box.hpp"

#include <cstdlib>
#include <system_error>

#include <capnp/serialize.h>
#include <kj/debug.h>

#include "box/interpreter.hpp"
#include "box/runner.hpp"
#include "util/file.hpp"
#include "util/subprocess.hpp"
#include "worker/summarizer.hpp"

namespace box {
namespace {

kj::ArrayPtr<const kj::byte> AsBytes(const std::string& s) {
  return kj::ArrayPtr<const kj::byte>(
      reinterpret_cast<const kj::byte*>(s.data()), s.size());
}

size_t SizeInBytes(capnproto::Value::Reader value) {
  return value.totalSize().wordCount * sizeof(capnp::word);
}

// Copies value into the response within kMaxResultItems and kMaxResultBytes.
// A cut list carries the length, schema and stats of the whole list.
void SetResult(capnproto::Value::Reader value, const std::string& type_name,
               capnproto::BoxResponse::Builder response) {
  if (!value.isList()) {
    size_t size = SizeInBytes(value);
    if (size <= kMaxResultBytes) {
      response.initResult().setValue(value);
      return;
    }
    auto opaque = response.initResult().initValue().initOpaque();
    opaque.setTypeName(type_name);
    opaque.setRepr(kj::str("<", type_name.c_str(), " of ", size, " bytes>"));
    return;
  }
  auto items = value.getList();
  size_t keep = 0;
  size_t bytes = 0;
  while (keep < items.size() && keep < kMaxResultItems) {
    bytes += SizeInBytes(items[keep]);
    if (bytes > kMaxResultBytes) break;
    keep++;
  }
  if (keep == items.size()) {
    response.initResult().setValue(value);
    return;
  }
  KJ_LOG(INFO, "Result list cut", items.size(), keep);
  auto list = response.initResult().initValue().initList(keep);
  for (size_t i = 0; i < keep; i++) list.setWithCaveats(i, items[i]);
  response.setResultCapped(true);
  response.setResultCount(items.size());
  for (auto item : items) {
    if (!item.isRecord()) return;
  }
  worker::Summary table;
  worker::SummarizeRows(items, &table);
  auto schema = response.initResultSchema(table.schema.size());
  for (size_t i = 0; i < table.schema.size(); i++) {
    schema[i].setName(table.schema[i].first);
    schema[i].setType(table.schema[i].second);
  }
  auto stats = response.initResultStats(table.stats.size());
  for (size_t i = 0; i < table.stats.size(); i++) {
    const worker::FieldStats& s = table.stats[i];
    stats[i].setField(s.field);
    stats[i].setCount(s.count);
    stats[i].setNulls(s.nulls);
    stats[i].setMin(s.min);
    stats[i].setMax(s.max);
    stats[i].setMean(s.mean);
  }
}

}  // namespace

bool Box::InstallDependencies(capnproto::BoxRequest::Reader request,
                              const std::string& dir,
                              capnproto::BoxResponse::Builder response) {
  util::SubprocessOptions install;
  install.args = {options_.python,
                  "-m",
                  "pip",
                  "install",
                  "--quiet",
                  "--no-input",
                  "--disable-pip-version-check",
                  "--target",
                  util::File::JoinPath(dir, kDepsDir)};
  if (!request.getNetworkEnabled()) {
    install.args.push_back("--no-index");
    if (!options_.wheelhouse.empty()) {
      install.args.push_back("--find-links");
      install.args.push_back(options_.wheelhouse);
    }
  }
  for (auto dep : request.getDependencies()) {
    if (dep.size() == 0 || dep[0] == '-') {
      response.getStatus().setDependencyFailure(
          kj::str("Invalid dependency: ", dep));
      return false;
    }
    install.args.push_back(dep);
  }
  install.timeout_millis = request.getLimits().getInstallTimeMillis();
  install.max_output = options_.max_output;

  KJ_LOG(INFO, "Installing dependencies", request.getDependencies().size());
  util::SubprocessResult result;
  std::string error_msg;
  if (!util::RunSubprocess(install, &result, &error_msg)) {
    response.getStatus().setDependencyFailure(error_msg);
    return false;
  }
  if (result.timed_out) {
    response.getStatus().setDependencyFailure(
        "Dependency installation timed out");
  } else if (result.signal != 0 || result.exit_code != 0) {
    response.getStatus().setDependencyFailure(
        "Dependency installation failed with code " +
        std::to_string(result.exit_code));
  } else {
    return true;
  }
  response.setStdout(AsBytes(result.stdout_data));
  response.setStderr(AsBytes(result.stderr_data));
  KJ_LOG(WARNING, "Dependency installation failed", result.exit_code,
         result.timed_out);
  return false;
}

void Box::Execute(capnproto::BoxRequest::Reader request,
                  const std::string& dir,
                  capnproto::BoxResponse::Builder response) {
  auto limits = request.getLimits();
  ExecutionOptions exec_options(dir, options_.self);
  exec_options.SetArgs({"box", "--run-program", dir});
  exec_options.cpu_limit_millis = limits.getCpuTimeMillis();
  exec_options.wall_limit_millis = limits.getWallTimeMillis();
  exec_options.memory_limit_kb = limits.getMemoryKb();
  exec_options.max_file_size_kb = limits.getFileSizeKb();
  exec_options.max_files = limits.getMaxFiles();

  std::string stdout_path = util::File::JoinPath(dir, "stdout");
  std::string stderr_path = util::File::JoinPath(dir, "stderr");
  ExecutionOptions::stringcpy(exec_options.stdin_file, "/dev/null");
  ExecutionOptions::stringcpy(exec_options.stdout_file, stdout_path);
  ExecutionOptions::stringcpy(exec_options.stderr_file, stderr_path);

  std::unique_ptr<Runner> runner = Runner::Create();
  ExecutionInfo outcome;
  std::string error_msg;
  if (!runner->Execute(exec_options, &outcome, &error_msg)) {
    response.getStatus().setInternalError(error_msg);
    return;
  }

  std::string stdout_data = util::File::ReadHead(stdout_path,
                                                 options_.max_output);
  std::string stderr_data =
      util::File::ReadTail(stderr_path, options_.max_output);
  response.setStdout(AsBytes(stdout_data));
  response.setStderr(AsBytes(stderr_data));

  auto usage = response.initUsage();
  usage.setCpuTime(outcome.cpu_time_millis / 1000.0);
  usage.setSysTime(outcome.sys_time_millis / 1000.0);
  usage.setWallTime(outcome.wall_time_millis / 1000.0);
  usage.setMemoryKb(outcome.memory_usage_kb);

  // Python reports an exhausted address space as MemoryError.
  bool out_of_memory =
      (exec_options.memory_limit_kb != 0 &&
       outcome.memory_usage_kb >= exec_options.memory_limit_kb) ||
      (outcome.status_code != 0 &&
       stderr_data.find("MemoryError") != std::string::npos);
  auto status = response.getStatus();
  if (out_of_memory) {
    status.setMemoryLimit();
  } else if (exec_options.cpu_limit_millis != 0 &&
             outcome.cpu_time_millis + outcome.sys_time_millis >=
                 exec_options.cpu_limit_millis) {
    status.setTimeLimit();
  } else if (exec_options.wall_limit_millis != 0 &&
             outcome.wall_time_millis >= exec_options.wall_limit_millis) {
    status.setWallLimit();
  } else if (outcome.signal != 0) {
    status.setSignal(outcome.signal);
  } else if (outcome.status_code != 0) {
    status.setRuntimeError(outcome.status_code);
  } else {
    status.setSuccess();
  }
  KJ_LOG(INFO, "Program finished", outcome.status_code, outcome.signal,
         outcome.wall_time_millis, outcome.memory_usage_kb);

  std::string result_path = util::File::JoinPath(dir, kResultFile);
  if (!status.isSuccess() || !util::File::Exists(result_path)) {
    response.initResult().setAbsent();
    return;
  }
  std::string data = util::File::ReadHead(result_path);
  kj::ArrayPtr<const capnp::word> words(
      reinterpret_cast<const capnp::word*>(data.data()),
      data.size() / sizeof(capnp::word));
  capnp::ReaderOptions reader_options;
  reader_options.traversalLimitInWords = 1024 * 1024 * 1024;
  reader_options.nestingLimit = kMaxValueDepth * 2 + 8;
  capnp::FlatArrayMessageReader reader(words, reader_options);
  std::string result_type =
      util::File::ReadHead(util::File::JoinPath(dir, kResultTypeFile));
  SetResult(reader.getRoot<capnproto::Value>(), result_type, response);
  response.setResultType(result_type);
}

void Box::Run(capnproto::BoxRequest::Reader request,
              capnproto::BoxResponse::Builder response) {
  try {
    if (request.getLanguage() != "python") {
      response.getStatus().setInternalError(
          kj::str("Unsupported language: ", request.getLanguage()));
      return;
    }
    util::TempDir tmp(options_.temp_directory);
    util::File::WriteAll(util::File::JoinPath(tmp.Path(), kProgramFile),
                         std::string(request.getCode()));
    if (request.getHasInput()) {
      auto input = request.getInput();
      util::File::WriteAll(
          util::File::JoinPath(tmp.Path(), kInputFile),
          kj::ArrayPtr<const char>(reinterpret_cast<const char*>(input.begin()),
                                   input.size()));
    }
    if (request.getDependencies().size() != 0 &&
        !InstallDependencies(request, tmp.Path(), response)) {
      return;
    }
    Execute(request, tmp.Path(), response);
  } catch (const std::system_error& exc) {
    KJ_LOG(ERROR, "Box failure", exc.what());
    response.getStatus().setInternalError(exc.what());
  } catch (const std::runtime_error& exc) {
    KJ_LOG(ERROR, "Box failure", exc.what());
    response.getStatus().setInternalError(exc.what());
  } catch (kj::Exception& exc) {
    KJ_LOG(ERROR, "Box failure", exc.getDescription());
    response.getStatus().setInternalError(exc.getDescription());
  }
}

}  // namespace box
