#pragma once

#include <atomic>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "log.hpp"
#include "settings_manager.hpp"
#include "status_channel.hpp"
#include "sync_service.hpp"
#include "sync_types.hpp"
#include "transfer_engine.hpp"

// Console front end: reads commands, forwards sync intents to the service and
// prints every status change and event coming back on the channel.
class SyncCLI {
public:
  SyncCLI(std::shared_ptr<SyncService> service,
          std::shared_ptr<SettingsManager> settings,
          std::shared_ptr<TransferEngine> engine,
          std::shared_ptr<Logger> logger = nullptr);
  ~SyncCLI();

  SyncCLI(const SyncCLI&) = delete;
  SyncCLI& operator=(const SyncCLI&) = delete;

  void start_status_pump(SyncReceiver receiver);
  void stop();

  // Reads commands until "quit" or end of input.
  void run(std::istream& in);
  // Same, from the terminal with line editing and history when available.
  void run_interactive();

  // Returns false once the user asked to quit.
  bool execute_command(const std::string& line);

  void render(const SyncMessage& message);
  SyncStatus last_status() const;

private:
  void status_pump(SyncReceiver receiver);
  void show_status();
  void handle_set(const std::string& args);
  void handle_get(const std::string& args);
  bool request_sync(SyncCommand command);
  std::optional<std::string> read_command_line(const char* prompt);

  std::shared_ptr<SyncService> service_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<TransferEngine> engine_;
  std::shared_ptr<Logger> logger_;

  std::atomic<bool> running_{false};
  std::thread pump_thread_;
  mutable std::mutex status_mutex_;
  SyncStatus last_status_;
};
