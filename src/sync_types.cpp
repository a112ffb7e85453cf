#include "sync_types.hpp"

std::string SyncStatus::display_text() const {
  switch(kind) {
    case Kind::Idle: return "Idle";
    case Kind::UpdatingTorrent: return "Updating torrent...";
    case Kind::Error: return "Error: " + message;
  }
  return "Unknown";
}

std::string SyncEvent::describe() const {
  switch(kind) {
    case Kind::TorrentAdded: return "Torrent added with ID " + std::to_string(torrent_id);
    case Kind::Error: return "Error: " + message;
  }
  return "Unknown event";
}

const char* to_string(SyncCommand command) {
  switch(command) {
    case SyncCommand::TriggerManualRefresh: return "refresh";
    case SyncCommand::TriggerFolderVerify: return "verify";
  }
  return "unknown";
}
