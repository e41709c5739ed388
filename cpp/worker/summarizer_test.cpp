#include "worker/summarizer.hpp"

#include <capnp/message.h>
#include <capnp/serialize.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Pair;
using ::testing::SizeIs;

using worker::RawResult;
using worker::Summary;

RawResult WithValue() {
  RawResult raw;
  raw.value = kj::heap<capnp::MallocMessageBuilder>();
  return raw;
}

capnproto::Value::Builder Root(RawResult* raw) {
  return raw->value->initRoot<capnproto::Value>();
}

void SetField(capnproto::Value::Field::Builder field, const char* name,
              int64_t value) {
  field.setName(name);
  field.initValue().setInteger(value);
}

size_t SerializedSize(const Summary& summary) {
  capnp::MallocMessageBuilder builder;
  worker::ToCapnp(summary, builder.initRoot<capnproto::ExecutionSummary>());
  return capnp::computeSerializedSizeInWords(builder) * sizeof(capnp::word);
}

// NOLINTNEXTLINE
TEST(SummarizerTest, SingleRecord) {
  RawResult raw = WithValue();
  auto fields = Root(&raw).initRecord(2);
  SetField(fields[0], "a", 1);
  SetField(fields[1], "b", 2);
  raw.result_type = "dict";
  Summary summary = worker::Summarize(raw);
  EXPECT_TRUE(summary.success);
  EXPECT_EQ(summary.result_type, "dict");
  EXPECT_THAT(summary.schema, ElementsAre(Pair("a", "int"), Pair("b", "int")));
  EXPECT_EQ(summary.row_count, 1);
  EXPECT_THAT(summary.sample, ElementsAre("{\"a\": 1, \"b\": 2}"));
  ASSERT_THAT(summary.stats, SizeIs(2));
  EXPECT_EQ(summary.stats[0].field, "a");
  EXPECT_EQ(summary.stats[0].count, 1);
  EXPECT_DOUBLE_EQ(summary.stats[0].mean, 1);
  EXPECT_EQ(summary.preview, "");
}

// NOLINTNEXTLINE
TEST(SummarizerTest, HundredThousandRecordsStayBounded) {
  const int64_t kRows = 100000;
  RawResult raw = WithValue();
  auto rows = Root(&raw).initList(kRows);
  for (int64_t i = 0; i < kRows; i++) {
    auto fields = rows[i].initRecord(3);
    SetField(fields[0], "id", i);
    fields[1].setName("score");
    fields[1].initValue().setReal(i / 2.0);
    fields[2].setName("name");
    fields[2].initValue().setText(std::string(200, 'x'));
  }
  Summary summary = worker::Summarize(raw);
  EXPECT_EQ(summary.result_type, "list");
  EXPECT_EQ(summary.row_count, kRows);
  EXPECT_THAT(summary.sample, SizeIs(worker::kSampleRows));
  for (const std::string& row : summary.sample) {
    EXPECT_LE(row.size(), worker::kSampleChars);
  }
  EXPECT_THAT(summary.schema,
              ElementsAre(Pair("id", "int"), Pair("score", "float"),
                          Pair("name", "str")));
  ASSERT_THAT(summary.stats, SizeIs(2));
  EXPECT_DOUBLE_EQ(summary.stats[0].min, 0);
  EXPECT_DOUBLE_EQ(summary.stats[0].max, kRows - 1);
  EXPECT_DOUBLE_EQ(summary.stats[0].mean, (kRows - 1) / 2.0);
  EXPECT_EQ(summary.stats[1].nulls, 0);
  EXPECT_LE(SerializedSize(summary), worker::kSummarySizeBound);
}

// NOLINTNEXTLINE
TEST(SummarizerTest, CappedListUsesShapeFromTheBox) {
  RawResult raw = WithValue();
  auto rows = Root(&raw).initList(2);
  SetField(rows[0].initRecord(1)[0], "x", 0);
  SetField(rows[1].initRecord(1)[0], "x", 1);
  worker::TableShape shape;
  shape.row_count = 50000;
  shape.schema.emplace_back(std::string(500, 'n'), "int");
  worker::FieldStats stats;
  stats.field = std::string(500, 'n');
  stats.count = 50000;
  stats.max = 49999;
  stats.mean = 24999.5;
  shape.stats.push_back(stats);
  raw.capped = shape;

  Summary summary = worker::Summarize(raw);
  EXPECT_EQ(summary.row_count, 50000);
  EXPECT_THAT(summary.sample, SizeIs(2));
  ASSERT_THAT(summary.schema, SizeIs(1));
  EXPECT_EQ(summary.schema[0].first.size(), worker::kMaxFieldNameChars);
  ASSERT_THAT(summary.stats, SizeIs(1));
  EXPECT_EQ(summary.stats[0].count, 50000);
  EXPECT_EQ(summary.stats[0].max, 49999);
  EXPECT_EQ(summary.stats[0].field.size(), worker::kMaxFieldNameChars);
}

// NOLINTNEXTLINE
TEST(SummarizerTest, WideRecordsStayBounded) {
  RawResult raw = WithValue();
  auto rows = Root(&raw).initList(5);
  for (int r = 0; r < 5; r++) {
    auto fields = rows[r].initRecord(200);
    for (int f = 0; f < 200; f++) {
      std::string name = std::to_string(f) + std::string(300, '\xe2');
      fields[f].setName(name);
      auto opaque = fields[f].initValue().initOpaque();
      opaque.setTypeName(std::string(300, 't'));
      opaque.setRepr(std::string(1000, 'r'));
    }
  }
  Summary summary = worker::Summarize(raw);
  EXPECT_THAT(summary.schema, SizeIs(worker::kMaxSchemaFields));
  EXPECT_LE(SerializedSize(summary), worker::kSummarySizeBound);
}

// NOLINTNEXTLINE
TEST(SummarizerTest, TypeMerging) {
  RawResult raw = WithValue();
  auto rows = Root(&raw).initList(3);
  auto r0 = rows[0].initRecord(3);
  SetField(r0[0], "x", 1);
  r0[1].setName("y");
  r0[1].initValue().setNone();
  SetField(r0[2], "z", 1);
  auto r1 = rows[1].initRecord(3);
  r1[0].setName("x");
  r1[0].initValue().setReal(2.5);
  SetField(r1[1], "y", 7);
  r1[2].setName("z");
  r1[2].initValue().setText("one");
  rows[2].initRecord(0);
  Summary summary = worker::Summarize(raw);
  EXPECT_THAT(summary.schema, ElementsAre(Pair("x", "float"), Pair("y", "int"),
                                          Pair("z", "mixed")));
  ASSERT_THAT(summary.stats, SizeIs(2));
  EXPECT_EQ(summary.stats[0].count, 2);
  EXPECT_EQ(summary.stats[0].nulls, 1);
  EXPECT_DOUBLE_EQ(summary.stats[0].mean, 1.75);
  EXPECT_EQ(summary.stats[1].count, 1);
  EXPECT_EQ(summary.stats[1].nulls, 2);
}

// NOLINTNEXTLINE
TEST(SummarizerTest, NonTabularValues) {
  RawResult raw = WithValue();
  auto list = Root(&raw).initList(3);
  list[0].setInteger(1);
  list[1].setText("two");
  list[2].setReal(3.0);
  Summary summary = worker::Summarize(raw);
  EXPECT_EQ(summary.result_type, "list");
  EXPECT_EQ(summary.row_count, 3);
  EXPECT_THAT(summary.schema, IsEmpty());
  EXPECT_EQ(summary.preview, "[1, \"two\", 3.0]");

  RawResult scalar = WithValue();
  Root(&scalar).setReal(0.1);
  summary = worker::Summarize(scalar);
  EXPECT_EQ(summary.result_type, "float");
  EXPECT_EQ(summary.row_count, 1);
  EXPECT_EQ(summary.preview, "0.1");

  RawResult none = WithValue();
  Root(&none).setNone();
  summary = worker::Summarize(none);
  EXPECT_EQ(summary.row_count, 0);
  EXPECT_EQ(summary.preview, "null");
}

// NOLINTNEXTLINE
TEST(SummarizerTest, OpaqueUsesItsTypeName) {
  RawResult raw = WithValue();
  auto opaque = Root(&raw).initOpaque();
  opaque.setTypeName("set");
  opaque.setRepr("{1, 2}");
  Summary summary = worker::Summarize(raw);
  EXPECT_EQ(summary.result_type, "set");
  EXPECT_EQ(summary.preview, "\"{1, 2}\"");
}

// NOLINTNEXTLINE
TEST(SummarizerTest, MissingResultIsEmpty) {
  RawResult raw;
  raw.stdout_data = "hello\n";
  Summary summary = worker::Summarize(raw);
  EXPECT_TRUE(summary.success);
  EXPECT_EQ(summary.row_count, 0);
  EXPECT_THAT(summary.schema, IsEmpty());
  EXPECT_THAT(summary.sample, IsEmpty());
  EXPECT_EQ(summary.stdout_text, "hello\n");
}

// NOLINTNEXTLINE
TEST(SummarizerTest, LongPreviewIsCut) {
  RawResult raw = WithValue();
  Root(&raw).setText(std::string(10000, 'a'));
  Summary summary = worker::Summarize(raw);
  EXPECT_EQ(summary.preview.size(), worker::kPreviewChars);
  EXPECT_EQ(summary.preview.substr(summary.preview.size() - 3), "...");
}

// NOLINTNEXTLINE
TEST(SummarizerTest, StreamsAreTruncated) {
  RawResult raw;
  raw.stdout_data = "start" + std::string(5000, 'o');
  raw.stderr_data = std::string(5000, 'e') + "Traceback end";
  raw.usage.wall_time = 1.5;
  Summary summary = worker::Summarize(raw);
  EXPECT_EQ(summary.stdout_text.size(), worker::kStreamChars);
  EXPECT_EQ(summary.stdout_text.substr(0, 5), "start");
  EXPECT_TRUE(summary.stdout_truncated);
  EXPECT_EQ(summary.stderr_text.size(), worker::kStreamChars);
  EXPECT_EQ(summary.stderr_text.substr(summary.stderr_text.size() - 13),
            "Traceback end");
  EXPECT_TRUE(summary.stderr_truncated);
  EXPECT_EQ(summary.execution_time_millis, 1500);
}

// NOLINTNEXTLINE
TEST(SummarizerTest, TruncationKeepsUtf8Intact) {
  std::string s;
  for (int i = 0; i < 10; i++) s += "\xc3\xa9";  // é
  bool truncated = false;
  EXPECT_EQ(worker::HeadChars(s, 3, &truncated), "\xc3\xa9\xc3\xa9\xc3\xa9");
  EXPECT_TRUE(truncated);
  EXPECT_EQ(worker::TailChars(s, 2, &truncated), "\xc3\xa9\xc3\xa9");
  EXPECT_EQ(worker::HeadChars(s, 10, &truncated), s);
  EXPECT_FALSE(truncated);
}

// NOLINTNEXTLINE
TEST(SummarizerTest, InvalidUtf8StreamsStayBounded) {
  RawResult raw;
  raw.stdout_data = std::string(1 << 20, '\x80');
  raw.stderr_data = std::string(1 << 20, '\xbf');
  Summary summary = worker::Summarize(raw);
  EXPECT_TRUE(summary.stdout_truncated);
  EXPECT_TRUE(summary.stderr_truncated);
  EXPECT_LE(summary.stdout_text.size(), 4 * worker::kStreamChars);
  EXPECT_LE(summary.stderr_text.size(), 4 * worker::kStreamChars);
  EXPECT_LT(SerializedSize(summary), worker::kSummarySizeBound);

  // A stray continuation byte after a complete character counts on its own.
  std::string s = "\xf0\x9f\x98\x80\x80\x80";
  bool truncated = false;
  EXPECT_EQ(worker::HeadChars(s, 1, &truncated), "\xf0\x9f\x98\x80");
  EXPECT_TRUE(truncated);
  EXPECT_LE(worker::TailChars(s, 1, &truncated).size(), 4u);
  EXPECT_TRUE(truncated);
}

// NOLINTNEXTLINE
TEST(SummarizerTest, FaultKeepsStreamsOnly) {
  worker::ExecutionFault fault;
  fault.kind = worker::FaultKind::RUNTIME_ERROR;
  fault.stderr_data = "ValueError: boom\n";
  Summary summary = worker::SummarizeFault(fault);
  EXPECT_FALSE(summary.success);
  EXPECT_EQ(summary.stderr_text, "ValueError: boom\n");
  EXPECT_EQ(summary.row_count, 0);
}

// NOLINTNEXTLINE
TEST(SummarizerTest, RenderEscapes) {
  capnp::MallocMessageBuilder builder;
  auto value = builder.initRoot<capnproto::Value>();
  auto fields = value.initRecord(1);
  fields[0].setName("k\"ey");
  fields[0].initValue().setText("line\nbreak\x01");
  EXPECT_EQ(worker::Render(value.asReader(), 100),
            "{\"k\\\"ey\": \"line\\nbreak\\u0001\"}");
}

}  // namespace
