#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <libtorrent/session.hpp>
#include <libtorrent/torrent_handle.hpp>

#include "log.hpp"
#include "transfer_engine.hpp"

// TransferEngine backed by an in-process libtorrent session. IDs are handed
// out sequentially and never reused within one session.
class LibtorrentEngine : public TransferEngine {
public:
  struct Options {
    int listen_port = 6881;
    std::chrono::milliseconds removal_timeout{5000};
  };

  explicit LibtorrentEngine(Options options, std::shared_ptr<Logger> logger = nullptr);
  ~LibtorrentEngine() override;

  void forget(TorrentId id) override;
  AddResponse add(const std::vector<std::uint8_t>& content, const AddOptions& options) override;
  std::optional<TransferStats> query(TorrentId id) const override;


private:
  void wait_for_removal(const lt::torrent_handle& handle);
  void drain_alerts();

  Options options_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<lt::session> session_;

  mutable std::mutex mutex_;
  std::map<TorrentId, lt::torrent_handle> handles_;
  TorrentId next_id_ = 1;
};
