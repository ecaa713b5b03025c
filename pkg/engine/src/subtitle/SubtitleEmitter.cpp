// Repository: ReelPlan
// Component: SubtitleEmitter Implementation
// Copyright (c) 2026 ReelPlan

#include "reelplan/subtitle/SubtitleEmitter.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace reelplan::subtitle {

namespace {

constexpr int64_t kMsPerSecond = 1000;
constexpr int64_t kMsPerMinute = 60 * kMsPerSecond;
constexpr int64_t kMsPerHour = 60 * kMsPerMinute;

std::string Trim(const std::string& s) {
  const char* ws = " \t\n\r\f\v";
  size_t first = s.find_first_not_of(ws);
  if (first == std::string::npos) return "";
  size_t last = s.find_last_not_of(ws);
  return s.substr(first, last - first + 1);
}

// Split on '\n', dropping a trailing '\r' from each line.
std::vector<std::string> SplitLines(const std::string& document) {
  std::vector<std::string> lines;
  std::istringstream in(document);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(line);
  }
  return lines;
}

}  // namespace

bool operator==(const SubtitleRecord& a, const SubtitleRecord& b) {
  return a.index == b.index && a.start_sec == b.start_sec &&
         a.end_sec == b.end_sec && a.text == b.text;
}

std::string FlattenCaption(const std::string& text) {
  std::string out = text;
  std::replace(out.begin(), out.end(), '\r', ' ');
  std::replace(out.begin(), out.end(), '\n', ' ');
  return Trim(out);
}

std::vector<SubtitleRecord> BuildSubtitleRecords(
    const std::vector<timeline::Segment>& segments,
    const std::vector<std::string>& captions) {
  std::vector<SubtitleRecord> records;
  records.reserve(segments.size());
  for (size_t i = 0; i < segments.size(); ++i) {
    SubtitleRecord r;
    r.index = static_cast<int32_t>(i + 1);
    r.start_sec = segments[i].start_sec;
    r.end_sec = segments[i].end_sec;
    r.text = i < captions.size() ? FlattenCaption(captions[i]) : std::string();
    records.push_back(std::move(r));
  }
  return records;
}

std::vector<SubtitleRecord> BuildSubtitleRecords(
    const plan::Plan& plan, const std::vector<timeline::Segment>& segments) {
  std::map<int32_t, const plan::Clip*> by_index;
  for (const auto& clip : plan.clips) {
    by_index[clip.index] = &clip;
  }

  std::vector<std::string> captions;
  captions.reserve(segments.size());
  for (const auto& seg : segments) {
    auto it = by_index.find(seg.clip_index);
    captions.push_back(it != by_index.end() ? it->second->caption_text : std::string());
  }
  return BuildSubtitleRecords(segments, captions);
}

std::string FormatTimestamp(double seconds) {
  // Nearest millisecond, ties to even.
  auto ms = static_cast<int64_t>(std::nearbyint(std::max(0.0, seconds) * 1000.0));

  int64_t hours = ms / kMsPerHour;
  ms %= kMsPerHour;
  int64_t minutes = ms / kMsPerMinute;
  ms %= kMsPerMinute;
  int64_t secs = ms / kMsPerSecond;
  ms %= kMsPerSecond;

  std::ostringstream out;
  out << std::setfill('0')
      << std::setw(2) << hours << ':'
      << std::setw(2) << minutes << ':'
      << std::setw(2) << secs << ','
      << std::setw(3) << ms;
  return out.str();
}

std::optional<int64_t> ParseTimestamp(const std::string& text) {
  static const std::regex kPattern(R"(^(\d{2,}):(\d{2}):(\d{2}),(\d{3})$)");
  std::smatch m;
  const std::string trimmed = Trim(text);
  if (!std::regex_match(trimmed, m, kPattern)) {
    return std::nullopt;
  }

  int64_t hours = 0;
  try {
    hours = std::stoll(m[1].str());
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
  int64_t minutes = std::stoll(m[2].str());
  int64_t secs = std::stoll(m[3].str());
  int64_t ms = std::stoll(m[4].str());
  if (minutes >= 60 || secs >= 60) {
    return std::nullopt;
  }
  return hours * kMsPerHour + minutes * kMsPerMinute + secs * kMsPerSecond + ms;
}

std::string RenderSrt(const std::vector<SubtitleRecord>& records) {
  std::ostringstream out;
  for (size_t i = 0; i < records.size(); ++i) {
    const auto& r = records[i];
    if (i > 0) out << '\n';
    out << r.index << '\n'
        << FormatTimestamp(r.start_sec) << " --> " << FormatTimestamp(r.end_sec) << '\n'
        << r.text << '\n';
  }
  return out.str();
}

std::optional<std::vector<SubtitleRecord>> ParseSrt(const std::string& document) {
  static const std::regex kIndex(R"(^\d+$)");
  static const std::regex kTiming(R"(^(\S+)\s+-->\s+(\S+)$)");

  const std::vector<std::string> lines = SplitLines(document);
  std::vector<SubtitleRecord> records;

  size_t i = 0;
  while (i < lines.size()) {
    if (Trim(lines[i]).empty()) {
      ++i;
      continue;
    }

    const std::string index_line = Trim(lines[i]);
    if (!std::regex_match(index_line, kIndex) || i + 1 >= lines.size()) {
      return std::nullopt;
    }

    std::smatch m;
    const std::string timing_line = Trim(lines[i + 1]);
    if (!std::regex_match(timing_line, m, kTiming)) {
      return std::nullopt;
    }
    auto start_ms = ParseTimestamp(m[1].str());
    auto end_ms = ParseTimestamp(m[2].str());
    if (!start_ms || !end_ms) {
      return std::nullopt;
    }

    SubtitleRecord r;
    try {
      r.index = std::stoi(index_line);
    } catch (const std::out_of_range&) {
      return std::nullopt;
    }
    r.start_sec = static_cast<double>(*start_ms) / 1000.0;
    r.end_sec = static_cast<double>(*end_ms) / 1000.0;

    // Text runs to the next blank line; multi-line cues are joined.
    i += 2;
    std::string text;
    while (i < lines.size() && !Trim(lines[i]).empty()) {
      if (!text.empty()) text += ' ';
      text += Trim(lines[i]);
      ++i;
    }
    r.text = text;
    records.push_back(std::move(r));
  }
  return records;
}

}  // namespace reelplan::subtitle
