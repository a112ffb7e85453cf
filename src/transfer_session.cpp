#include "transfer_session.hpp"

#include "rate_limits.hpp"

const char* const kDownloadPathNotConfigured = "Download path not configured";
const char* const kTorrentAddedWithoutId = "Torrent added but engine returned no ID";

namespace {

std::string describe_limit(const std::optional<std::uint64_t>& kbps) {
  return kbps ? std::to_string(*kbps) + " KB/s" : std::string("unlimited");
}

void report_error(const SyncSender& sink, const std::string& message) {
  send_sync_event(sink, SyncEvent::error(message));
  send_sync_status(sink, SyncStatus::error(message));
}

} // namespace

AddOptions make_add_options(const SyncConfig& config) {
  AddOptions options;
  options.output_folder = config.download_path.string();
  // Existing files are reconciled against the new descriptor, never rejected.
  options.overwrite = true;
  options.paused = !config.should_seed;
  options.rate_limits = make_rate_limits(config);
  return options;
}

std::optional<TorrentId> manage_transfer_task(const SyncConfig& config,
                                              TransferEngine& engine,
                                              const SyncSender& sink,
                                              std::optional<TorrentId> previous,
                                              const std::vector<std::uint8_t>& content,
                                              Logger* logger) {
  log_info(logger, "Managing torrent task for URL: {}. Path: {}. Previous ID: {}",
           config.torrent_url,
           config.download_path.string(),
           previous ? std::to_string(*previous) : std::string("none"));

  if(previous) {
    log_info(logger, "Forgetting previous torrent ID: {}", *previous);
    send_sync_status(sink, SyncStatus::updating_torrent());
    try {
      engine.forget(*previous);
      log_info(logger, "Forgot torrent {}", *previous);
    } catch(const std::exception& e) {
      // The old transfer may already be gone; the new one matters more.
      log_warn(logger, "Error forgetting torrent {}: {}. Proceeding to add new one.",
               *previous, e.what());
      send_sync_event(sink, SyncEvent::error(
        "Error forgetting old torrent " + std::to_string(*previous) + ": " + e.what()));
    }
  }

  if(!config.has_download_path()) {
    log_warn(logger, "Download path is empty, cannot add torrent");
    report_error(sink, kDownloadPathNotConfigured);
    return std::nullopt;
  }

  log_info(logger, "Adding new torrent content ({} bytes) to path: {}",
           content.size(), config.download_path.string());
  send_sync_status(sink, SyncStatus::updating_torrent());

  const AddOptions options = make_add_options(config);
  log_info(logger, "Applying settings - Seeding: {}, Upload limit: {}, Download limit: {}",
           config.should_seed,
           describe_limit(config.max_upload_speed),
           describe_limit(config.max_download_speed));

  AddResponse response;
  try {
    response = engine.add(content, options);
  } catch(const std::exception& e) {
    log_error(logger, "Failed to add torrent: {}", e.what());
    throw TransferTaskError("Failed to add torrent via transfer engine", e.what());
  }

  if(!response.id) {
    log_warn(logger, "Torrent added but no ID returned by engine");
    report_error(sink, kTorrentAddedWithoutId);
    return std::nullopt;
  }

  log_info(logger, "Torrent added with ID: {}", *response.id);
  send_sync_event(sink, SyncEvent::torrent_added(*response.id));
  send_sync_status(sink, SyncStatus::idle());
  return response.id;
}
