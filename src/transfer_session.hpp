#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "log.hpp"
#include "status_channel.hpp"
#include "sync_types.hpp"
#include "transfer_engine.hpp"

// Thrown by manage_transfer_task when the engine refused to register the new
// transfer. what() carries the context followed by the engine's detail.
class TransferTaskError : public std::runtime_error {
public:
  TransferTaskError(const std::string& context, const std::string& detail)
    : std::runtime_error(context + ": " + detail), detail_(detail) {}

  const std::string& detail() const { return detail_; }

private:
  std::string detail_;
};

extern const char* const kDownloadPathNotConfigured;
extern const char* const kTorrentAddedWithoutId;

AddOptions make_add_options(const SyncConfig& config);

// Replaces `previous` (if any) with a transfer built from `content`.
//
// Retiring the old transfer is best effort: a failure is reported on `sink` as an
// Error event and the new transfer is still registered. An unconfigured
// download path and an add that yields no identifier both end in an Error status
// and return nullopt. Only a failed add throws (TransferTaskError).
//
// The caller must not run two invocations concurrently for the same
// download path, and owns the returned identifier for the next invocation.
std::optional<TorrentId> manage_transfer_task(const SyncConfig& config,
                                              TransferEngine& engine,
                                              const SyncSender& sink,
                                              std::optional<TorrentId> previous,
                                              const std::vector<std::uint8_t>& content,
                                              Logger* logger = nullptr);
