#ifndef WORKER_SUMMARIZER_HPP
#define WORKER_SUMMARIZER_HPP
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "capnp/rexec.capnp.h"
#include "capnp/value.capnp.h"
#include "worker/executor.hpp"

namespace worker {

static const constexpr size_t kSampleRows = 3;
static const constexpr size_t kSampleChars = 500;
static const constexpr size_t kPreviewChars = 500;
static const constexpr size_t kStreamChars = 1000;
static const constexpr size_t kMaxSchemaFields = 64;
static const constexpr size_t kMaxFieldNameChars = 64;
static const constexpr size_t kMaxTypeNameChars = 32;
// Upper bound on the serialized ExecutionSummary, whatever the raw size.
static const constexpr size_t kSummarySizeBound = 64 * 1024;

struct Summary {
  std::string result_type;
  // Field name and type name, in first-seen order.
  std::vector<std::pair<std::string, std::string>> schema;
  int64_t row_count = 0;
  std::vector<std::string> sample;
  std::vector<FieldStats> stats;
  std::string preview;
  std::string stdout_text;
  std::string stderr_text;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  int64_t execution_time_millis = 0;
  bool success = false;
};

// Bounded description of a successful run. Never throws.
Summary Summarize(const RawResult& raw);

// Schema, row count, sample and numeric stats of a list of records.
void SummarizeRows(capnp::List<capnproto::Value>::Reader rows,
                   Summary* summary);

// Bounded description of a failed run: streams and timing only.
Summary SummarizeFault(const ExecutionFault& fault);

void ToCapnp(const Summary& summary, capnproto::ExecutionSummary::Builder out);

// JSON-like rendering of a value, cut to at most limit characters.
std::string Render(capnproto::Value::Reader value, size_t limit);

// Python type name of a value.
std::string TypeName(capnproto::Value::Reader value);

// First/last `chars` UTF-8 characters of s. Sets *truncated if s was cut.
std::string HeadChars(const std::string& s, size_t chars, bool* truncated);
std::string TailChars(const std::string& s, size_t chars, bool* truncated);

}  // namespace worker

#endif
