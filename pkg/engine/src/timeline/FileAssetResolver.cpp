// Repository: ReelPlan
// Component: FileAssetResolver Implementation
// Purpose: Probes narration audio with FFmpeg
// Copyright (c) 2026 ReelPlan

#include "reelplan/timeline/FileAssetResolver.hpp"

#include <filesystem>
#include <sstream>
#include <system_error>
#include <utility>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

#include "reelplan/util/Logger.hpp"

namespace reelplan::timeline {

namespace fs = std::filesystem;

FileAssetResolver::FileAssetResolver(AssetLayout layout)
    : layout_(std::move(layout)) {}

std::string FileAssetResolver::ExpandPattern(const std::string& pattern,
                                             int32_t clip_index) {
  static const std::string kToken = "{index}";
  std::string out = pattern;
  const std::string value = std::to_string(clip_index);
  size_t pos = 0;
  while ((pos = out.find(kToken, pos)) != std::string::npos) {
    out.replace(pos, kToken.size(), value);
    pos += value.size();
  }
  return out;
}

std::string FileAssetResolver::ImageRef(int32_t clip_index) const {
  return (fs::path(layout_.image_dir) /
          ExpandPattern(layout_.image_pattern, clip_index)).string();
}

std::string FileAssetResolver::AudioPath(int32_t clip_index) const {
  return (fs::path(layout_.audio_dir) /
          ExpandPattern(layout_.audio_pattern, clip_index)).string();
}

bool FileAssetResolver::ImageExists(int32_t clip_index) const {
  std::error_code ec;
  return fs::is_regular_file(ImageRef(clip_index), ec);
}

AudioInfo FileAssetResolver::GetAudioInfo(int32_t clip_index) const {
  auto it = audio_cache_.find(clip_index);
  if (it != audio_cache_.end()) return it->second;

  AudioInfo info;
  const std::string path = AudioPath(clip_index);
  std::error_code ec;
  if (fs::is_regular_file(path, ec)) {
    info = ProbeAudio(path);
  }
  audio_cache_[clip_index] = info;
  return info;
}

AudioInfo FileAssetResolver::ProbeAudio(const std::string& path) {
  AudioInfo info;
  AVFormatContext* fmt_ctx = nullptr;

  if (avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr) < 0) {
    util::Logger::Warn("[FileAssetResolver] Failed to open: " + path);
    return info;
  }

  if (avformat_find_stream_info(fmt_ctx, nullptr) < 0) {
    avformat_close_input(&fmt_ctx);
    util::Logger::Warn("[FileAssetResolver] Failed to find stream info: " + path);
    return info;
  }

  int stream_index = av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_AUDIO,
                                         -1, -1, nullptr, 0);
  if (stream_index < 0) {
    avformat_close_input(&fmt_ctx);
    util::Logger::Warn("[FileAssetResolver] No audio stream: " + path);
    return info;
  }

  AVStream* stream = fmt_ctx->streams[stream_index];

  // Stream duration first, then container duration.
  double duration_sec = 0.0;
  if (stream->duration != AV_NOPTS_VALUE) {
    duration_sec = static_cast<double>(stream->duration) * av_q2d(stream->time_base);
  } else if (fmt_ctx->duration != AV_NOPTS_VALUE) {
    duration_sec = static_cast<double>(fmt_ctx->duration) / AV_TIME_BASE;
  }

  info.exists = true;
  info.duration_sec = duration_sec;
  info.sample_rate = stream->codecpar->sample_rate;
  info.channels = stream->codecpar->ch_layout.nb_channels;
  info.ref = path;

  avformat_close_input(&fmt_ctx);

  std::ostringstream oss;
  oss << "[FileAssetResolver] Probed: " << path << " (" << duration_sec << "s, "
      << info.sample_rate << "Hz, " << info.channels << "ch)";
  util::Logger::Debug(oss.str());
  return info;
}

}  // namespace reelplan::timeline
