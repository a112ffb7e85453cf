#pragma once

#include <cstdint>
#include <optional>

#include "sync_types.hpp"

// Engine-facing throughput caps in bytes/sec. An absent value means unlimited;
// zero is never stored.
struct RateLimits {
  std::optional<std::uint32_t> upload_bps;
  std::optional<std::uint32_t> download_bps;
};

// KB/s -> B/s. Absent input, zero, or a result outside uint32 all collapse to
// "no limit".
std::optional<std::uint32_t> kbps_to_bps_limit(std::optional<std::uint64_t> kilobytes_per_second);

RateLimits make_rate_limits(const SyncConfig& config);
