// Repository: ReelPlan
// Component: SubtitleEmitter Contract Tests
// Purpose: SubRip timestamp formatting, document layout, and read-back.
// Copyright (c) 2026 ReelPlan

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

#include "reelplan/subtitle/SubtitleEmitter.hpp"

namespace reelplan::subtitle {
namespace {

timeline::Segment MakeSegment(int32_t clip_index, double start, double end) {
  timeline::Segment seg;
  seg.clip_index = clip_index;
  seg.start_sec = start;
  seg.end_sec = end;
  seg.duration_sec = end - start;
  return seg;
}

// =============================================================================
// Timestamps
// =============================================================================

TEST(SubtitleTimestamp, FormatsHoursMinutesSecondsMillis) {
  EXPECT_EQ(FormatTimestamp(0.0), "00:00:00,000");
  EXPECT_EQ(FormatTimestamp(7.5), "00:00:07,500");
  EXPECT_EQ(FormatTimestamp(60.0), "00:01:00,000");
  EXPECT_EQ(FormatTimestamp(3661.001), "01:01:01,001");
}

TEST(SubtitleTimestamp, RoundsToNearestMillisecond) {
  EXPECT_EQ(FormatTimestamp(1.2344), "00:00:01,234");
  EXPECT_EQ(FormatTimestamp(1.2346), "00:00:01,235");
  EXPECT_EQ(FormatTimestamp(59.9996), "00:01:00,000");
}

TEST(SubtitleTimestamp, HalfMillisecondTiesRoundToEven) {
  EXPECT_EQ(FormatTimestamp(1.0625), "00:00:01,062");
  EXPECT_EQ(FormatTimestamp(0.0025), "00:00:00,002");
  EXPECT_EQ(FormatTimestamp(0.0035), "00:00:00,004");
  EXPECT_EQ(FormatTimestamp(7.5005), "00:00:07,500");
}

TEST(SubtitleTimestamp, HoursNeverTruncated) {
  EXPECT_EQ(FormatTimestamp(360000.0), "100:00:00,000");
}

TEST(SubtitleTimestamp, NegativeClampsToZero) {
  EXPECT_EQ(FormatTimestamp(-3.0), "00:00:00,000");
}

TEST(SubtitleTimestamp, ParseInvertsFormat) {
  const std::vector<double> samples = {0.0, 0.001, 7.5, 13.5, 59.999, 61.25,
                                       3599.999, 3661.001, 86399.5, 360000.125};
  for (double s : samples) {
    auto ms = ParseTimestamp(FormatTimestamp(s));
    ASSERT_TRUE(ms.has_value()) << s;
    EXPECT_EQ(*ms, static_cast<int64_t>(std::nearbyint(s * 1000.0))) << s;
  }
}

TEST(SubtitleTimestamp, ParseRejectsMalformed) {
  EXPECT_FALSE(ParseTimestamp("1:00:00,000").has_value());
  EXPECT_FALSE(ParseTimestamp("00:00:00.000").has_value());
  EXPECT_FALSE(ParseTimestamp("00:60:00,000").has_value());
  EXPECT_FALSE(ParseTimestamp("00:00:60,000").has_value());
  EXPECT_FALSE(ParseTimestamp("00:00:00,00").has_value());
  EXPECT_FALSE(ParseTimestamp("").has_value());
}

// =============================================================================
// Records and documents
// =============================================================================

TEST(SubtitleDocument, OneRecordPerSegmentNumberedFromOne) {
  std::vector<timeline::Segment> segments = {MakeSegment(1, 0.0, 7.5),
                                             MakeSegment(2, 7.5, 13.5)};
  auto records = BuildSubtitleRecords(segments, {"Hello", "World"});

  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].index, 1);
  EXPECT_EQ(records[1].index, 2);
  EXPECT_DOUBLE_EQ(records[1].start_sec, 7.5);
  EXPECT_DOUBLE_EQ(records[1].end_sec, 13.5);
}

TEST(SubtitleDocument, RendersExactLayout) {
  std::vector<timeline::Segment> segments = {MakeSegment(1, 0.0, 7.5),
                                             MakeSegment(2, 7.5, 13.5)};
  auto records = BuildSubtitleRecords(segments, {"Hello", "World"});

  EXPECT_EQ(RenderSrt(records),
            "1\n00:00:00,000 --> 00:00:07,500\nHello\n"
            "\n"
            "2\n00:00:07,500 --> 00:00:13,500\nWorld\n");
}

TEST(SubtitleDocument, EmptyTimelineRendersEmptyDocument) {
  EXPECT_EQ(RenderSrt({}), "");
}

TEST(SubtitleDocument, CaptionsFlattenedToOneLine) {
  EXPECT_EQ(FlattenCaption("  Line one\nLine two\r\n"), "Line one Line two");
  EXPECT_EQ(FlattenCaption("a\r\nb"), "a  b");
}

TEST(SubtitleDocument, CaptionsComeFromPlanClips) {
  plan::Plan plan;
  plan::Clip c1;
  c1.index = 1;
  c1.caption_text = "First caption";
  plan::Clip c2;
  c2.index = 2;
  c2.caption_text = "Second\ncaption";
  plan.clips = {c1, c2};

  auto records = BuildSubtitleRecords(
      plan, {MakeSegment(1, 0.0, 10.0), MakeSegment(2, 10.0, 20.0)});
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].text, "First caption");
  EXPECT_EQ(records[1].text, "Second caption");
}

TEST(SubtitleDocument, ParseReadsRenderedDocument) {
  std::vector<SubtitleRecord> records = {
      {1, 0.0, 7.5, "Hello"},
      {2, 7.5, 13.5, ""},
      {3, 13.5, 3661.001, "Last line"}};

  auto parsed = ParseSrt(RenderSrt(records));
  ASSERT_TRUE(parsed.has_value());
  ASSERT_EQ(parsed->size(), 3u);
  EXPECT_EQ((*parsed)[0], records[0]);
  EXPECT_EQ((*parsed)[1].text, "");
  EXPECT_EQ((*parsed)[2].index, 3);
  EXPECT_EQ((*parsed)[2].text, "Last line");
  EXPECT_EQ(std::llround((*parsed)[2].end_sec * 1000.0), 3661001);
}

TEST(SubtitleDocument, ParseAcceptsCrlfAndMultiLineCues) {
  const std::string doc =
      "1\r\n00:00:01,000 --> 00:00:02,500\r\nfirst\r\nsecond\r\n\r\n"
      "2\r\n00:00:02,500 --> 00:00:04,000\r\nthird\r\n";

  auto parsed = ParseSrt(doc);
  ASSERT_TRUE(parsed.has_value());
  ASSERT_EQ(parsed->size(), 2u);
  EXPECT_EQ((*parsed)[0].text, "first second");
  EXPECT_DOUBLE_EQ((*parsed)[0].end_sec, 2.5);
  EXPECT_EQ((*parsed)[1].text, "third");
}

TEST(SubtitleDocument, ParseRejectsMalformedBlocks) {
  EXPECT_FALSE(ParseSrt("one\n00:00:00,000 --> 00:00:01,000\nx\n").has_value());
  EXPECT_FALSE(ParseSrt("1\n00:00:00,000 -> 00:00:01,000\nx\n").has_value());
  EXPECT_FALSE(ParseSrt("1\n").has_value());
}

}  // namespace
}  // namespace reelplan::subtitle
