#include "worker/summarizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <map>

#include <capnp/message.h>
#include <capnp/orphan.h>
#include <kj/debug.h>

namespace worker {
namespace {

const constexpr size_t kMaxContinuation = 3;

bool IsContinuation(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::string FormatReal(double d) {
  if (std::isnan(d)) return "NaN";
  if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
  char buf[32];
  // Shortest representation that reads back to the same value.
  for (int precision = 1; precision <= 17; precision++) {
    snprintf(buf, sizeof(buf), "%.*g", precision, d);
    if (strtod(buf, nullptr) == d) break;
  }
  std::string s = buf;
  if (s.find_first_of(".eEn") == std::string::npos) s += ".0";
  return s;
}

void AppendQuoted(kj::StringPtr text, std::string* out) {
  out->push_back('"');
  for (char c : text) {
    switch (c) {
      case '"':
        *out += "\\\"";
        break;
      case '\\':
        *out += "\\\\";
        break;
      case '\n':
        *out += "\\n";
        break;
      case '\r':
        *out += "\\r";
        break;
      case '\t':
        *out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          snprintf(buf, sizeof(buf), "\\u%04x", c);
          *out += buf;
        } else {
          out->push_back(c);
        }
    }
  }
  out->push_back('"');
}

// Appends value to out, stopping once out holds more than budget bytes.
void AppendValue(capnproto::Value::Reader value, size_t budget,
                 std::string* out) {
  if (out->size() > budget) return;
  switch (value.which()) {
    case capnproto::Value::NONE:
      *out += "null";
      break;
    case capnproto::Value::BOOLEAN:
      *out += value.getBoolean() ? "true" : "false";
      break;
    case capnproto::Value::INTEGER:
      *out += std::to_string(value.getInteger());
      break;
    case capnproto::Value::REAL:
      *out += FormatReal(value.getReal());
      break;
    case capnproto::Value::TEXT:
      AppendQuoted(value.getText(), out);
      break;
    case capnproto::Value::LIST: {
      out->push_back('[');
      bool first = true;
      for (auto item : value.getList()) {
        if (out->size() > budget) break;
        if (!first) *out += ", ";
        first = false;
        AppendValue(item, budget, out);
      }
      out->push_back(']');
      break;
    }
    case capnproto::Value::RECORD: {
      out->push_back('{');
      bool first = true;
      for (auto field : value.getRecord()) {
        if (out->size() > budget) break;
        if (!first) *out += ", ";
        first = false;
        AppendQuoted(field.getName(), out);
        *out += ": ";
        AppendValue(field.getValue(), budget, out);
      }
      out->push_back('}');
      break;
    }
    case capnproto::Value::OPAQUE:
      AppendQuoted(value.getOpaque().getRepr(), out);
      break;
  }
}

std::string MergeTypes(const std::string& a, const std::string& b) {
  if (a == b) return a;
  if (a == "NoneType") return b;
  if (b == "NoneType") return a;
  if ((a == "int" && b == "float") || (a == "float" && b == "int")) {
    return "float";
  }
  return "mixed";
}

bool IsNumericType(const std::string& type) {
  return type == "int" || type == "float";
}

struct Accumulator {
  int64_t count = 0;
  int64_t nulls = 0;
  double min = 0;
  double max = 0;
  double sum = 0;
};

}  // namespace

void SummarizeRows(capnp::List<capnproto::Value>::Reader rows,
                   Summary* summary) {
  std::map<std::string, size_t> index;
  for (auto row : rows) {
    for (auto field : row.getRecord()) {
      std::string name =
          HeadChars(field.getName(), kMaxFieldNameChars, nullptr);
      std::string type = TypeName(field.getValue());
      auto it = index.find(name);
      if (it == index.end()) {
        if (summary->schema.size() >= kMaxSchemaFields) continue;
        index.emplace(name, summary->schema.size());
        summary->schema.emplace_back(name, type);
      } else {
        std::string& current = summary->schema[it->second].second;
        current = MergeTypes(current, type);
      }
    }
  }
  for (auto& field : summary->schema) {
    field.second = HeadChars(field.second, kMaxTypeNameChars, nullptr);
  }

  summary->row_count = rows.size();
  for (size_t i = 0; i < rows.size() && i < kSampleRows; i++) {
    summary->sample.push_back(Render(rows[i], kSampleChars));
  }

  std::vector<Accumulator> acc(summary->schema.size());
  std::vector<bool> seen(summary->schema.size());
  for (auto row : rows) {
    std::fill(seen.begin(), seen.end(), false);
    for (auto field : row.getRecord()) {
      auto it =
          index.find(HeadChars(field.getName(), kMaxFieldNameChars, nullptr));
      if (it == index.end()) continue;
      size_t idx = it->second;
      if (!IsNumericType(summary->schema[idx].second)) continue;
      seen[idx] = true;
      auto value = field.getValue();
      double v;
      if (value.isInteger()) {
        v = value.getInteger();
      } else if (value.isReal()) {
        v = value.getReal();
      } else {
        acc[idx].nulls++;
        continue;
      }
      Accumulator& a = acc[idx];
      if (a.count == 0 || v < a.min) a.min = v;
      if (a.count == 0 || v > a.max) a.max = v;
      a.sum += v;
      a.count++;
    }
    for (size_t idx = 0; idx < seen.size(); idx++) {
      if (!seen[idx]) acc[idx].nulls++;
    }
  }
  for (size_t idx = 0; idx < acc.size(); idx++) {
    if (!IsNumericType(summary->schema[idx].second)) continue;
    FieldStats stats;
    stats.field = summary->schema[idx].first;
    stats.count = acc[idx].count;
    stats.nulls = acc[idx].nulls;
    stats.min = acc[idx].min;
    stats.max = acc[idx].max;
    stats.mean = acc[idx].count ? acc[idx].sum / acc[idx].count : 0;
    summary->stats.push_back(stats);
  }
}

namespace {

bool IsTabular(capnproto::Value::Reader value) {
  if (!value.isList() || value.getList().size() == 0) return false;
  for (auto item : value.getList()) {
    if (!item.isRecord()) return false;
  }
  return true;
}

void SummarizeValue(capnproto::Value::Reader value, Summary* summary) {
  if (value.isRecord()) {
    capnp::MallocMessageBuilder builder;
    auto rows =
        builder.getOrphanage().newOrphan<capnp::List<capnproto::Value>>(1);
    rows.get().setWithCaveats(0, value);
    SummarizeRows(rows.getReader(), summary);
    return;
  }
  if (IsTabular(value)) {
    SummarizeRows(value.getList(), summary);
    return;
  }
  summary->preview = Render(value, kPreviewChars);
  if (value.isList()) {
    summary->row_count = value.getList().size();
  } else if (value.isNone()) {
    summary->row_count = 0;
  } else {
    summary->row_count = 1;
  }
}

void SetStreams(const std::string& out, const std::string& err,
                const Usage& usage, Summary* summary) {
  summary->stdout_text =
      HeadChars(out, kStreamChars, &summary->stdout_truncated);
  summary->stderr_text =
      TailChars(err, kStreamChars, &summary->stderr_truncated);
  summary->execution_time_millis = std::llround(usage.wall_time * 1000);
}

void ApplyShape(const TableShape& shape, Summary* summary) {
  summary->row_count = shape.row_count;
  if (shape.schema.empty()) return;
  summary->schema.clear();
  for (const auto& field : shape.schema) {
    if (summary->schema.size() >= kMaxSchemaFields) break;
    summary->schema.emplace_back(
        HeadChars(field.first, kMaxFieldNameChars, nullptr),
        HeadChars(field.second, kMaxTypeNameChars, nullptr));
  }
  summary->stats.clear();
  for (const FieldStats& stats : shape.stats) {
    if (summary->stats.size() >= kMaxSchemaFields) break;
    summary->stats.push_back(stats);
    summary->stats.back().field =
        HeadChars(stats.field, kMaxFieldNameChars, nullptr);
  }
}

}  // namespace

// A character is a lead byte plus at most three continuation bytes. Stray
// continuation bytes beyond that start a new character, so a cut never keeps
// more than 4 * chars bytes whatever the input.
std::string HeadChars(const std::string& s, size_t chars, bool* truncated) {
  size_t count = 0;
  size_t run = kMaxContinuation;
  for (size_t i = 0; i < s.size(); i++) {
    if (IsContinuation(s[i]) && run < kMaxContinuation) {
      run++;
      continue;
    }
    run = 0;
    if (count == chars) {
      if (truncated) *truncated = true;
      return s.substr(0, i);
    }
    count++;
  }
  if (truncated) *truncated = false;
  return s;
}

std::string TailChars(const std::string& s, size_t chars, bool* truncated) {
  size_t count = 0;
  size_t run = 0;
  for (size_t i = s.size(); i > 0; i--) {
    if (IsContinuation(s[i - 1]) && run < kMaxContinuation) {
      run++;
      continue;
    }
    run = 0;
    if (count == chars) {
      if (truncated) *truncated = true;
      return s.substr(i);
    }
    count++;
  }
  if (truncated) *truncated = false;
  return s;
}

std::string TypeName(capnproto::Value::Reader value) {
  switch (value.which()) {
    case capnproto::Value::NONE:
      return "NoneType";
    case capnproto::Value::BOOLEAN:
      return "bool";
    case capnproto::Value::INTEGER:
      return "int";
    case capnproto::Value::REAL:
      return "float";
    case capnproto::Value::TEXT:
      return "str";
    case capnproto::Value::LIST:
      return "list";
    case capnproto::Value::RECORD:
      return "dict";
    case capnproto::Value::OPAQUE:
      return value.getOpaque().getTypeName();
  }
  return "object";
}

std::string Render(capnproto::Value::Reader value, size_t limit) {
  std::string out;
  // Four bytes per character at most.
  AppendValue(value, limit * 4, &out);
  bool truncated = false;
  std::string head = HeadChars(out, limit, &truncated);
  if (truncated && limit > 3) {
    head = HeadChars(out, limit - 3, nullptr) + "...";
  }
  return head;
}

Summary Summarize(const RawResult& raw) {
  Summary summary;
  summary.success = true;
  SetStreams(raw.stdout_data, raw.stderr_data, raw.usage, &summary);
  if (!raw.HasValue()) {
    summary.result_type = "NoneType";
    return summary;
  }
  KJ_IF_MAYBE(exc, kj::runCatchingExceptions([&]() {
                capnproto::Value::Reader value = raw.Value();
                summary.result_type = raw.result_type.empty()
                                          ? TypeName(value)
                                          : raw.result_type;
                SummarizeValue(value, &summary);
                KJ_IF_MAYBE(shape, raw.capped) { ApplyShape(*shape, &summary); }
              })) {
    KJ_LOG(WARNING, "Cannot summarize result", exc->getDescription());
    summary.schema.clear();
    summary.sample.clear();
    summary.stats.clear();
    summary.row_count = 0;
    if (summary.result_type.empty()) summary.result_type = raw.result_type;
    summary.preview = "<malformed result>";
  }
  summary.result_type =
      HeadChars(summary.result_type, kMaxTypeNameChars, nullptr);
  return summary;
}

Summary SummarizeFault(const ExecutionFault& fault) {
  Summary summary;
  summary.success = false;
  summary.result_type = "NoneType";
  SetStreams(fault.stdout_data, fault.stderr_data, fault.usage, &summary);
  return summary;
}

void ToCapnp(const Summary& summary, capnproto::ExecutionSummary::Builder out) {
  out.setResultType(summary.result_type);
  auto schema = out.initSchema(summary.schema.size());
  for (size_t i = 0; i < summary.schema.size(); i++) {
    schema[i].setName(summary.schema[i].first);
    schema[i].setType(summary.schema[i].second);
  }
  out.setRowCount(summary.row_count);
  auto sample = out.initSample(summary.sample.size());
  for (size_t i = 0; i < summary.sample.size(); i++) {
    sample.set(i, summary.sample[i]);
  }
  auto stats = out.initStats(summary.stats.size());
  for (size_t i = 0; i < summary.stats.size(); i++) {
    const FieldStats& s = summary.stats[i];
    stats[i].setField(s.field);
    stats[i].setCount(s.count);
    stats[i].setNulls(s.nulls);
    stats[i].setMin(s.min);
    stats[i].setMax(s.max);
    stats[i].setMean(s.mean);
  }
  out.setPreview(summary.preview);
  out.setStdout(summary.stdout_text);
  out.setStderr(summary.stderr_text);
  out.setExecutionTimeMillis(summary.execution_time_millis);
  out.setSuccess(summary.success);
  out.setStdoutTruncated(summary.stdout_truncated);
  out.setStderrTruncated(summary.stderr_truncated);
}

}  // namespace worker
