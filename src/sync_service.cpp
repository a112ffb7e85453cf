#include "sync_service.hpp"

#include "transfer_session.hpp"
#include "utils.hpp"

namespace {

const char* const kUrlNotConfigured = "Remote torrent URL not configured";

} // namespace

SyncService::SyncService(std::shared_ptr<TransferEngine> engine,
                         SyncSender sink,
                         SyncConfig config,
                         Options options,
                         TorrentFetcher fetcher,
                         std::shared_ptr<Logger> logger)
  : engine_(std::move(engine)),
    sink_(std::move(sink)),
    fetcher_(fetcher ? std::move(fetcher) : make_torrent_fetcher()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sync")),
    config_(std::move(config)),
    refresh_interval_(options.refresh_interval),
    refresh_on_start_(options.refresh_on_start) {
  if(!engine_) {
    throw std::invalid_argument("SyncService requires a transfer engine");
  }
  if(refresh_interval_.count() < 0) {
    refresh_interval_ = std::chrono::seconds(0);
  }
}

SyncService::~SyncService() {
  stop();
}

void SyncService::start_background() {
  if(started_.exchange(true)) return;

  work_.emplace(asio::make_work_guard(io_));
  refresh_timer_ = std::make_unique<asio::steady_timer>(io_);
  schedule_refresh_tick();

  bool initial_refresh = false;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    initial_refresh = refresh_on_start_ && config_.is_complete();
  }
  if(initial_refresh) {
    post_cycle(SyncCommand::TriggerManualRefresh);
  }

  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void SyncService::stop() {
  if(!started_.exchange(false)) return;

  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  refresh_timer_.reset();
  io_.restart();

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    pending_ = 0;
  }
  idle_cv_.notify_all();
}

void SyncService::submit(SyncCommand command) {
  logger_->info("Command received: {}", to_string(command));
  post_cycle(command);
}

void SyncService::update_config(SyncConfig config) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++pending_;
  }
  asio::post(io_, [this, config = std::move(config)]() mutable {
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      config_ = std::move(config);
    }
    logger_->debug("Configuration updated");
    finish_pending();
  });
}

void SyncService::set_refresh_interval(std::chrono::seconds interval) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++pending_;
  }
  asio::post(io_, [this, interval](){
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      refresh_interval_ = interval.count() < 0 ? std::chrono::seconds(0) : interval;
    }
    schedule_refresh_tick();
    finish_pending();
  });
}

bool SyncService::wait_idle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(state_mutex_);
  return idle_cv_.wait_for(lock, timeout, [this]{ return pending_ == 0; });
}

SyncConfig SyncService::config() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return config_;
}

std::optional<TorrentId> SyncService::current_torrent() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return current_id_;
}

SyncService::Stats SyncService::stats() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return stats_;
}

void SyncService::post_cycle(SyncCommand command) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++pending_;
  }
  asio::post(io_, [this, command](){
    run_cycle(command);
    finish_pending();
  });
}

void SyncService::finish_pending() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if(pending_ > 0) --pending_;
  }
  idle_cv_.notify_all();
}

void SyncService::schedule_refresh_tick() {
  if(!refresh_timer_) return;
  std::chrono::seconds interval;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    interval = refresh_interval_;
  }
  std::error_code cancel_ec;
  refresh_timer_->cancel(cancel_ec);
  if(interval.count() == 0) return;

  refresh_timer_->expires_after(interval);
  refresh_timer_->async_wait([this](const std::error_code& ec){
    if(ec || !started_) return;
    logger_->debug("Periodic update check");
    post_cycle(SyncCommand::TriggerManualRefresh);
    schedule_refresh_tick();
  });
}

void SyncService::report_failure(const std::string& message) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++stats_.failures;
  }
  send_sync_event(sink_, SyncEvent::error(message));
  send_sync_status(sink_, SyncStatus::error(message));
}

bool SyncService::transfer_settings_changed(const SyncConfig& config) const {
  if(!applied_config_) return true;
  const auto& applied = *applied_config_;
  return applied.download_path != config.download_path ||
         applied.should_seed != config.should_seed ||
         applied.max_upload_speed != config.max_upload_speed ||
         applied.max_download_speed != config.max_download_speed;
}

void SyncService::run_cycle(SyncCommand command) {
  SyncConfig config;
  std::optional<TorrentId> previous;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++stats_.cycles;
    config = config_;
    previous = current_id_;
  }
  logger_->info("Running {} cycle", to_string(command));

  if(config.torrent_url.empty()) {
    logger_->warn("{}", kUrlNotConfigured);
    report_failure(kUrlNotConfigured);
    return;
  }

  const bool verify = (command == SyncCommand::TriggerFolderVerify);
  std::vector<std::uint8_t> content;
  if(verify && !cached_content_.empty() && cached_url_ == config.torrent_url) {
    content = cached_content_;
  } else {
    try {
      content = fetcher_(config.torrent_url);
    } catch(const std::exception& e) {
      logger_->error("Failed to fetch torrent from {}: {}", config.torrent_url, e.what());
      report_failure(std::string("Failed to fetch torrent: ") + e.what());
      return;
    }
    logger_->info("Fetched {} from {}", format_bytes(content.size()), config.torrent_url);
    cached_content_ = content;
    cached_url_ = config.torrent_url;
  }

  const std::string fingerprint = sha256_hex(content);
  if(!verify && previous && fingerprint == applied_fingerprint_ &&
     !transfer_settings_changed(config)) {
    logger_->info("Torrent {} is up to date ({})", *previous, fingerprint.substr(0, 12));
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      ++stats_.up_to_date;
    }
    send_sync_status(sink_, SyncStatus::idle());
    return;
  }

  try {
    auto id = manage_transfer_task(config, *engine_, sink_, previous, content, logger_.get());
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      current_id_ = id;
      if(id) ++stats_.transfers_registered;
    }
    if(id) {
      applied_fingerprint_ = fingerprint;
      applied_config_ = config;
    } else {
      applied_fingerprint_.clear();
      applied_config_.reset();
    }
  } catch(const TransferTaskError& e) {
    // Keep the previous ID; the next cycle retries the replacement.
    logger_->error("Sync cycle failed: {}", e.what());
    report_failure(e.what());
  }
}
