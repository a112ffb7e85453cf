#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"
#include "status_channel.hpp"
#include "sync_types.hpp"
#include "torrent_fetcher.hpp"
#include "transfer_engine.hpp"

// Owns the sync loop: turns commands and timer ticks into fetch + replace
// cycles, and threads the active torrent ID from one cycle to the next. Every
// cycle runs on the service's io thread, so at most one manage_transfer_task
// call is in flight at a time.
class SyncService {
public:
  struct Options {
    std::chrono::seconds refresh_interval{3600}; // 0 = manual refresh only
    bool refresh_on_start = true;
  };

  struct Stats {
    std::size_t cycles = 0;
    std::size_t transfers_registered = 0;
    std::size_t up_to_date = 0;
    std::size_t failures = 0;
  };

  SyncService(std::shared_ptr<TransferEngine> engine,
              SyncSender sink,
              SyncConfig config,
              Options options,
              TorrentFetcher fetcher = make_torrent_fetcher(),
              std::shared_ptr<Logger> logger = nullptr);
  ~SyncService();

  SyncService(const SyncService&) = delete;
  SyncService& operator=(const SyncService&) = delete;

  void start_background();
  // Lets an in-flight cycle finish, then drops queued commands and joins.
  void stop();

  void submit(SyncCommand command);
  void update_config(SyncConfig config);
  void set_refresh_interval(std::chrono::seconds interval);

  // Blocks until every command queued so far has been handled.
  bool wait_idle(std::chrono::milliseconds timeout);

  SyncConfig config() const;
  std::optional<TorrentId> current_torrent() const;
  Stats stats() const;
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  void post_cycle(SyncCommand command);
  void run_cycle(SyncCommand command);
  void schedule_refresh_tick();
  void finish_pending();
  void report_failure(const std::string& message);
  bool transfer_settings_changed(const SyncConfig& config) const;

  std::shared_ptr<TransferEngine> engine_;
  SyncSender sink_;
  TorrentFetcher fetcher_;
  std::shared_ptr<Logger> logger_;

  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::unique_ptr<asio::steady_timer> refresh_timer_;
  std::thread io_thread_;
  std::atomic<bool> started_{false};

  mutable std::mutex state_mutex_;
  std::condition_variable idle_cv_;
  std::size_t pending_ = 0;
  SyncConfig config_;
  std::chrono::seconds refresh_interval_;
  bool refresh_on_start_;
  std::optional<TorrentId> current_id_;
  Stats stats_;

  // Touched only on the io thread.
  std::vector<std::uint8_t> cached_content_;
  std::string cached_url_;
  std::string applied_fingerprint_;
  std::optional<SyncConfig> applied_config_;
};
