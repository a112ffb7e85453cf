#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

using TorrentId = std::size_t;

struct SyncConfig {
  std::string torrent_url;
  std::filesystem::path download_path; // empty = not configured
  bool should_seed = false;
  std::optional<std::uint64_t> max_upload_speed;   // KB/s
  std::optional<std::uint64_t> max_download_speed; // KB/s

  bool has_download_path() const { return !download_path.empty(); }
  bool is_complete() const { return !torrent_url.empty() && has_download_path(); }
};

// Current state of the sync orchestration. Observers only ever get copies.
struct SyncStatus {
  enum class Kind { Idle, UpdatingTorrent, Error };

  Kind kind = Kind::Idle;
  std::string message; // only set for Kind::Error

  static SyncStatus idle() { return {Kind::Idle, {}}; }
  static SyncStatus updating_torrent() { return {Kind::UpdatingTorrent, {}}; }
  static SyncStatus error(std::string message) { return {Kind::Error, std::move(message)}; }

  bool is_error() const { return kind == Kind::Error; }
  std::string display_text() const;

  bool operator==(const SyncStatus& other) const {
    return kind == other.kind && message == other.message;
  }
  bool operator!=(const SyncStatus& other) const { return !(*this == other); }
};

// Something that happened; unlike SyncStatus this is a log, not a state.
struct SyncEvent {
  enum class Kind { TorrentAdded, Error };

  Kind kind = Kind::Error;
  TorrentId torrent_id = 0; // only set for Kind::TorrentAdded
  std::string message;      // only set for Kind::Error

  static SyncEvent torrent_added(TorrentId id) { return {Kind::TorrentAdded, id, {}}; }
  static SyncEvent error(std::string message) { return {Kind::Error, 0, std::move(message)}; }

  std::string describe() const;

  bool operator==(const SyncEvent& other) const {
    return kind == other.kind && torrent_id == other.torrent_id && message == other.message;
  }
  bool operator!=(const SyncEvent& other) const { return !(*this == other); }
};

using SyncMessage = std::variant<SyncStatus, SyncEvent>;

// User intents forwarded from the console to the scheduler.
enum class SyncCommand { TriggerManualRefresh, TriggerFolderVerify };

const char* to_string(SyncCommand command);
