#include "rate_limits.hpp"

#include <limits>

namespace {
constexpr std::uint64_t kBytesPerKilobyte = 1024;
}

std::optional<std::uint32_t> kbps_to_bps_limit(std::optional<std::uint64_t> kilobytes_per_second) {
  if(!kilobytes_per_second || *kilobytes_per_second == 0) return std::nullopt;
  constexpr std::uint64_t kMax = std::numeric_limits<std::uint32_t>::max();
  if(*kilobytes_per_second > kMax / kBytesPerKilobyte) return std::nullopt;
  return static_cast<std::uint32_t>(*kilobytes_per_second * kBytesPerKilobyte);
}

RateLimits make_rate_limits(const SyncConfig& config) {
  RateLimits limits;
  limits.upload_bps = kbps_to_bps_limit(config.max_upload_speed);
  limits.download_bps = kbps_to_bps_limit(config.max_download_speed);
  return limits;
}
