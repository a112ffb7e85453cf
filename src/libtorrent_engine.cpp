#include "libtorrent_engine.hpp"

#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/alert.hpp>
#include <libtorrent/alert_types.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/file_storage.hpp>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/torrent_flags.hpp>
#include <libtorrent/torrent_info.hpp>
#include <libtorrent/torrent_status.hpp>

#include <algorithm>
#include <filesystem>
#include <limits>

namespace {

int to_libtorrent_limit(const std::optional<std::uint32_t>& bps) {
  if(!bps) return -1;
  constexpr std::uint32_t kMaxInt = static_cast<std::uint32_t>(std::numeric_limits<int>::max());
  return static_cast<int>(std::min(*bps, kMaxInt));
}

const char* state_name(lt::torrent_status::state_t state) {
  switch(state) {
    case lt::torrent_status::checking_files: return "checking";
    case lt::torrent_status::downloading_metadata: return "downloading metadata";
    case lt::torrent_status::downloading: return "downloading";
    case lt::torrent_status::finished: return "finished";
    case lt::torrent_status::seeding: return "seeding";
    case lt::torrent_status::checking_resume_data: return "checking resume data";
    default: return "unknown";
  }
}

// Any file of the torrent that already exists under save_path.
std::optional<std::string> first_existing_file(const lt::torrent_info& ti,
                                               const std::string& save_path) {
  const auto& files = ti.files();
  for(auto index : files.file_range()) {
    std::filesystem::path path = std::filesystem::path(save_path) / files.file_path(index);
    std::error_code ec;
    if(std::filesystem::exists(path, ec)) return path.string();
  }
  return std::nullopt;
}

} // namespace

LibtorrentEngine::LibtorrentEngine(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("libtorrent")) {
  lt::settings_pack pack;
  pack.set_str(lt::settings_pack::listen_interfaces,
               "0.0.0.0:" + std::to_string(options_.listen_port) +
               ",[::]:" + std::to_string(options_.listen_port));
  pack.set_int(lt::settings_pack::alert_mask,
               lt::alert_category::error |
               lt::alert_category::status |
               lt::alert_category::storage);
  pack.set_str(lt::settings_pack::user_agent, "modsync/1.0");
  session_ = std::make_unique<lt::session>(std::move(pack));
  logger_->info("libtorrent session listening on port {}", options_.listen_port);
}

LibtorrentEngine::~LibtorrentEngine() = default;

void LibtorrentEngine::forget(TorrentId id) {
  lt::torrent_handle handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(id);
    if(it == handles_.end()) {
      throw EngineError("torrent " + std::to_string(id) + " not found");
    }
    handle = it->second;
    handles_.erase(it);
  }
  if(!handle.is_valid()) {
    throw EngineError("torrent " + std::to_string(id) + " is no longer valid");
  }
  // Files stay on disk: the replacement re-checks them.
  session_->remove_torrent(handle);
  wait_for_removal(handle);
}

void LibtorrentEngine::wait_for_removal(const lt::torrent_handle& handle) {
  const auto deadline = std::chrono::steady_clock::now() + options_.removal_timeout;
  const auto info_hashes = handle.info_hashes();
  while(std::chrono::steady_clock::now() < deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
    if(!session_->wait_for_alert(remaining)) break;
    std::vector<lt::alert*> alerts;
    session_->pop_alerts(&alerts);
    for(auto* alert : alerts) {
      if(auto* removed = lt::alert_cast<lt::torrent_removed_alert>(alert)) {
        if(removed->info_hashes == info_hashes) {
          logger_->debug("{}", removed->message());
          return;
        }
      } else if(alert->category() & lt::alert_category::error) {
        logger_->warn("{}", alert->message());
      }
    }
  }
  throw EngineError("timed out waiting for torrent removal");
}

void LibtorrentEngine::drain_alerts() {
  std::vector<lt::alert*> alerts;
  session_->pop_alerts(&alerts);
  for(auto* alert : alerts) {
    if(alert->category() & lt::alert_category::error) {
      logger_->warn("{}", alert->message());
    } else {
      logger_->debug("{}", alert->message());
    }
  }
}

AddResponse LibtorrentEngine::add(const std::vector<std::uint8_t>& content, const AddOptions& options) {
  drain_alerts();

  if(content.empty()) {
    throw EngineError("empty torrent descriptor");
  }
  lt::error_code ec;
  lt::span<const char> buffer(reinterpret_cast<const char*>(content.data()),
                              static_cast<std::ptrdiff_t>(content.size()));
  auto ti = std::make_shared<lt::torrent_info>(buffer, ec, lt::from_span);
  if(ec) {
    throw EngineError("metainfo parse failed: " + ec.message());
  }

  if(!options.overwrite) {
    if(auto existing = first_existing_file(*ti, options.output_folder)) {
      throw EngineError("refusing to overwrite existing file " + *existing);
    }
  }

  lt::add_torrent_params params;
  params.ti = ti;
  params.save_path = options.output_folder;
  params.flags &= ~lt::torrent_flags::auto_managed;
  if(options.paused) {
    params.flags |= lt::torrent_flags::paused;
  } else {
    params.flags &= ~lt::torrent_flags::paused;
  }
  params.upload_limit = to_libtorrent_limit(options.rate_limits.upload_bps);
  params.download_limit = to_libtorrent_limit(options.rate_limits.download_bps);

  auto handle = session_->add_torrent(std::move(params), ec);
  if(ec) {
    throw EngineError("add_torrent failed: " + ec.message());
  }
  if(!handle.is_valid()) {
    return {};
  }

  TorrentId id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_id_++;
    handles_.emplace(id, handle);
  }
  logger_->info("Registered '{}' as torrent {} in {}", ti->name(), id, options.output_folder);
  return AddResponse{id};
}

std::optional<TransferStats> LibtorrentEngine::query(TorrentId id) const {
  lt::torrent_handle handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(id);
    if(it == handles_.end()) return std::nullopt;
    handle = it->second;
  }
  if(!handle.is_valid()) return std::nullopt;

  auto status = handle.status(lt::torrent_handle::query_name);
  TransferStats stats;
  stats.name = status.name;
  stats.state = state_name(status.state);
  stats.progress = status.progress;
  stats.total_bytes = static_cast<std::uint64_t>(std::max<std::int64_t>(0, status.total_wanted));
  stats.download_rate = static_cast<std::uint64_t>(std::max(0, status.download_payload_rate));
  stats.upload_rate = static_cast<std::uint64_t>(std::max(0, status.upload_payload_rate));
  stats.peers = status.num_peers;
  stats.paused = static_cast<bool>(status.flags & lt::torrent_flags::paused);
  return stats;
}
