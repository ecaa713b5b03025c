// Repository: ReelPlan
// Component: IAssetResolver
// Purpose: Per-clip asset lookup consulted by TimelineComposer.
//          Production uses FileAssetResolver; tests use FakeAssetResolver.
// Copyright (c) 2026 ReelPlan

#ifndef REELPLAN_TIMELINE_IASSET_RESOLVER_HPP_
#define REELPLAN_TIMELINE_IASSET_RESOLVER_HPP_

#include <cstdint>
#include <string>

#include "reelplan/timeline/TimelineTypes.hpp"

namespace reelplan::timeline {

class IAssetResolver {
 public:
  virtual ~IAssetResolver() = default;

  virtual bool ImageExists(int32_t clip_index) const = 0;

  // Reference handed to the encoder (path for file-backed resolvers).
  virtual std::string ImageRef(int32_t clip_index) const = 0;

  // exists == false means no usable audio; the clip gets silence.
  virtual AudioInfo GetAudioInfo(int32_t clip_index) const = 0;
};

}  // namespace reelplan::timeline

#endif  // REELPLAN_TIMELINE_IASSET_RESOLVER_HPP_
