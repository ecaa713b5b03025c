// Repository: ReelPlan
// Component: FileAssetResolver
// Purpose: Resolves per-clip images and narration audio on disk. Audio is
//          probed with FFmpeg (libavformat) for duration and format.
// Copyright (c) 2026 ReelPlan

#ifndef REELPLAN_TIMELINE_FILE_ASSET_RESOLVER_HPP_
#define REELPLAN_TIMELINE_FILE_ASSET_RESOLVER_HPP_

#include <cstdint>
#include <map>
#include <string>

#include "reelplan/timeline/IAssetResolver.hpp"
#include "reelplan/timeline/TimelineConfig.hpp"

namespace reelplan::timeline {

// Not thread-safe: one resolver per composition run.
class FileAssetResolver : public IAssetResolver {
 public:
  explicit FileAssetResolver(AssetLayout layout);

  bool ImageExists(int32_t clip_index) const override;
  std::string ImageRef(int32_t clip_index) const override;

  // Probes once per clip and caches. A file that exists but cannot be
  // probed is reported as absent (and logged as a warning).
  AudioInfo GetAudioInfo(int32_t clip_index) const override;

  std::string AudioPath(int32_t clip_index) const;

  const AssetLayout& layout() const { return layout_; }

  // Replace every "{index}" in pattern with the decimal clip index.
  static std::string ExpandPattern(const std::string& pattern, int32_t clip_index);

  // Probe one audio file. exists == false if it cannot be opened or has
  // no audio stream.
  static AudioInfo ProbeAudio(const std::string& path);

 private:
  AssetLayout layout_;
  mutable std::map<int32_t, AudioInfo> audio_cache_;
};

}  // namespace reelplan::timeline

#endif  // REELPLAN_TIMELINE_FILE_ASSET_RESOLVER_HPP_
