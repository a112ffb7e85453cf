#include "sync_cli.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <variant>

#include "utils.hpp"

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

namespace {

void trim(std::string& value) {
  value = SettingsManager::trim_copy(value);
}

} // namespace

SyncCLI::SyncCLI(std::shared_ptr<SyncService> service,
                 std::shared_ptr<SettingsManager> settings,
                 std::shared_ptr<TransferEngine> engine,
                 std::shared_ptr<Logger> logger)
  : service_(std::move(service)),
    settings_(std::move(settings)),
    engine_(std::move(engine)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("cli")) {}

SyncCLI::~SyncCLI() {
  stop();
}

void SyncCLI::start_status_pump(SyncReceiver receiver) {
  if(running_.exchange(true)) return;
  pump_thread_ = std::thread([this, receiver = std::move(receiver)]() mutable {
    status_pump(std::move(receiver));
  });
}

void SyncCLI::stop() {
  running_ = false;
  if(pump_thread_.joinable()) pump_thread_.join();
}

void SyncCLI::status_pump(SyncReceiver receiver) {
  using namespace std::chrono_literals;
  while(running_) {
    auto message = receiver.recv_for(200ms);
    if(message) {
      render(*message);
    } else if(receiver.senders_gone()) {
      break;
    }
  }
  for(const auto& message : receiver.drain()) {
    render(message);
  }
}

void SyncCLI::render(const SyncMessage& message) {
  if(const auto* status = std::get_if<SyncStatus>(&message)) {
    {
      std::lock_guard<std::mutex> lock(status_mutex_);
      last_status_ = *status;
    }
    logger_->print("Sync Status: {}", status->display_text());
    return;
  }
  const auto& event = std::get<SyncEvent>(message);
  if(event.kind == SyncEvent::Kind::Error) {
    logger_->print_err("{}", event.describe());
  } else {
    logger_->print("{}", event.describe());
  }
}

SyncStatus SyncCLI::last_status() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return last_status_;
}

void SyncCLI::run(std::istream& in) {
  std::string line;
  while(std::getline(in, line)) {
    if(!execute_command(line)) break;
  }
}

void SyncCLI::run_interactive() {
  while(true) {
    auto line = read_command_line("> ");
    if(!line) break;
    if(!execute_command(*line)) break;
  }
}

std::optional<std::string> SyncCLI::read_command_line(const char* prompt) {
#ifdef HAVE_READLINE
  char* line = readline(prompt);
  if(!line) return std::nullopt;
  std::string result(line);
  if(!result.empty()) add_history(result.c_str());
  free(line);
  return result;
#else
  std::cout << prompt << std::flush;
  std::string result;
  if(!std::getline(std::cin, result)) return std::nullopt;
  return result;
#endif
}

bool SyncCLI::execute_command(const std::string& line) {
  std::istringstream iss(line);
  std::string cmd;
  iss >> cmd;
  if(cmd.empty()) return true;

  std::string args;
  std::getline(iss, args);
  trim(args);

  if(cmd == "refresh" || cmd == "r" || cmd == "check") {
    request_sync(SyncCommand::TriggerManualRefresh);
  } else if(cmd == "verify") {
    request_sync(SyncCommand::TriggerFolderVerify);
  } else if(cmd == "status" || cmd == "st") {
    show_status();
  } else if(cmd == "set") {
    handle_set(args);
  } else if(cmd == "get" || cmd == "settings") {
    handle_get(args);
  } else if(cmd == "save") {
    if(settings_->save()) {
      logger_->print("Settings saved to {}", settings_->settings_path().string());
    } else {
      logger_->print_err("Unable to save settings to {}", settings_->settings_path().string());
    }
  } else if(cmd == "quit" || cmd == "exit" || cmd == "q") {
    return false;
  } else if(cmd == "help" || cmd == "?") {
    logger_->print("Commands:");
    logger_->print("  refresh            check the remote torrent for updates");
    logger_->print("  verify             re-check local files against the torrent");
    logger_->print("  status             show sync status and transfer progress");
    logger_->print("  set <key> <value>  change a setting");
    logger_->print("  get [key]          show settings");
    logger_->print("  save               persist settings");
    logger_->print("  quit               exit");
  } else {
    logger_->print_err("Unknown command '{}'. Type 'help' for a list.", cmd);
  }
  return true;
}

bool SyncCLI::request_sync(SyncCommand command) {
  const auto config = service_->config();
  if(!config.is_complete()) {
    logger_->print_err("Set torrent_url and download_path before running '{}'", to_string(command));
    return false;
  }
  service_->submit(command);
  return true;
}

void SyncCLI::show_status() {
  logger_->print("Sync Status: {}", last_status().display_text());
  auto id = service_->current_torrent();
  if(!id) {
    logger_->print("No active torrent");
    return;
  }
  auto stats = engine_ ? engine_->query(*id) : std::nullopt;
  if(!stats) {
    logger_->print("Torrent {}: no engine status", *id);
    return;
  }
  logger_->print("Torrent {} '{}': {} {:.1f}% of {} ({}), down {}/s, up {}/s, {} peers",
                 *id,
                 stats->name,
                 stats->state,
                 stats->progress * 100.0,
                 format_bytes(stats->total_bytes),
                 stats->paused ? "paused" : "active",
                 format_bytes(stats->download_rate),
                 format_bytes(stats->upload_rate),
                 stats->peers);
}

void SyncCLI::handle_set(const std::string& args) {
  std::istringstream iss(args);
  std::string key;
  iss >> key;
  std::string value;
  std::getline(iss, value);
  trim(value);
  if(key.empty()) {
    logger_->print_err("Usage: set <key> <value>");
    return;
  }
  std::string error;
  if(!settings_->set_from_string(key, value, error)) {
    logger_->print_err("Cannot set {}: {}", key, error);
    return;
  }
  auto resolved = settings_->resolve_key(key).value_or(key);
  logger_->print("{} = {}", resolved, settings_->value_as_string(resolved));
  if(resolved == "refresh_interval") {
    service_->set_refresh_interval(std::chrono::seconds(settings_->get<int>("refresh_interval")));
  } else if(resolved == "verbose") {
    init(settings_->get<bool>("verbose"));
  } else {
    service_->update_config(settings_->sync_config());
  }
}

void SyncCLI::handle_get(const std::string& args) {
  if(!args.empty()) {
    auto resolved = settings_->resolve_key(args);
    if(!resolved) {
      logger_->print_err("Unknown setting '{}'", args);
      return;
    }
    logger_->print("{} = {}", *resolved, settings_->value_as_string(*resolved));
    return;
  }
  for(const auto& key : settings_->keys()) {
    logger_->print("{} = {}", key, settings_->value_as_string(key));
  }
}
