#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "rate_limits.hpp"
#include "sync_types.hpp"

// Raised by an engine when a request could not be carried out.
class EngineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct AddOptions {
  std::string output_folder;
  bool overwrite = false; // reuse and re-check files already present in output_folder
  bool paused = false;
  RateLimits rate_limits;
};

struct AddResponse {
  std::optional<TorrentId> id;
};

struct TransferStats {
  std::string name;
  std::string state;
  double progress = 0.0; // 0..1
  std::uint64_t total_bytes = 0;
  std::uint64_t download_rate = 0; // B/s
  std::uint64_t upload_rate = 0;   // B/s
  int peers = 0;
  bool paused = false;
};

// The add/forget/query capability of a BitTorrent engine. Implementations may
// block inside forget() and add(); callers run them off the UI thread.
class TransferEngine {
public:
  virtual ~TransferEngine() = default;

  // Stops tracking `id`. Downloaded data stays on disk.
  virtual void forget(TorrentId id) = 0;

  // Registers a transfer from a serialized .torrent metafile.
  virtual AddResponse add(const std::vector<std::uint8_t>& content, const AddOptions& options) = 0;

  virtual std::optional<TransferStats> query(TorrentId id) const = 0;
};
