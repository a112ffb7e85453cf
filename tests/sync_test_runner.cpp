#include "log.hpp"
#include "rate_limits.hpp"
#include "status_channel.hpp"
#include "test_runner_utils.hpp"
#include "transfer_session.hpp"

#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>
#include <thread>
#include <vector>

namespace {

using modsync::test::RecordingEngine;
using modsync::test::bytes_of;
using modsync::test::count_error_events;
using modsync::test::events_of;
using modsync::test::statuses_of;

struct TestContext {
  modsync::test::LogCapture& logs;
  std::shared_ptr<Logger> logger;
  bool verbose = false;
};

SyncConfig mods_config() {
  SyncConfig config;
  config.torrent_url = "magnet:x";
  config.download_path = "/tmp/mods";
  config.should_seed = false;
  config.max_download_speed = 500;
  return config;
}

bool test_rate_limit_absent_or_zero(TestContext&) {
  return !kbps_to_bps_limit(std::nullopt) &&
         !kbps_to_bps_limit(0);
}

bool test_rate_limit_converts_kilobytes(TestContext&) {
  return kbps_to_bps_limit(1) == std::optional<std::uint32_t>(1024) &&
         kbps_to_bps_limit(500) == std::optional<std::uint32_t>(512000) &&
         kbps_to_bps_limit(4194303) == std::optional<std::uint32_t>(4294966272u);
}

bool test_rate_limit_overflow_is_unlimited(TestContext&) {
  return !kbps_to_bps_limit(4194304) &&
         !kbps_to_bps_limit(std::numeric_limits<std::uint64_t>::max()) &&
         !kbps_to_bps_limit(std::numeric_limits<std::uint64_t>::max() / 1024 + 1);
}

bool test_rate_limits_per_direction(TestContext&) {
  SyncConfig config;
  config.max_upload_speed = 0;
  config.max_download_speed = 64;
  auto limits = make_rate_limits(config);
  if(limits.upload_bps) return false;
  if(limits.download_bps != std::optional<std::uint32_t>(65536)) return false;

  config.max_upload_speed = 8;
  config.max_download_speed = std::nullopt;
  limits = make_rate_limits(config);
  return limits.upload_bps == std::optional<std::uint32_t>(8192) && !limits.download_bps;
}

bool test_channel_preserves_order_per_producer(TestContext&) {
  auto channel = make_channel<int>();
  auto& receiver = channel.second;
  constexpr int kPerProducer = 500;
  std::vector<std::thread> producers;
  for(int p = 0; p < 2; ++p) {
    Sender<int> sender = channel.first;
    producers.emplace_back([sender, p]{
      for(int i = 0; i < kPerProducer; ++i) {
        sender.send(p * kPerProducer + i);
      }
    });
  }
  for(auto& t : producers) t.join();

  auto values = receiver.drain();
  if(values.size() != 2 * kPerProducer) return false;
  int last[2] = {-1, -1};
  for(int value : values) {
    int producer = value / kPerProducer;
    int seq = value % kPerProducer;
    if(seq != last[producer] + 1) return false;
    last[producer] = seq;
  }
  return true;
}

bool test_channel_send_without_receiver(TestContext&) {
  auto channel = make_channel<SyncMessage>();
  SyncSender sender = channel.first;
  channel.second.close();
  if(sender.send(SyncMessage(SyncStatus::idle()))) return false;
  if(!sender.is_closed()) return false;
  // Helpers must swallow the failed send.
  send_sync_status(sender, SyncStatus::updating_torrent());
  send_sync_event(sender, SyncEvent::torrent_added(1));
  return true;
}

bool test_channel_recv_ends_when_senders_gone(TestContext&) {
  std::optional<Receiver<int>> receiver;
  {
    auto channel = make_channel<int>();
    receiver.emplace(std::move(channel.second));
    channel.first.send(7);
  }
  auto first = receiver->recv_for(std::chrono::milliseconds(100));
  if(first != std::optional<int>(7)) return false;
  auto start = std::chrono::steady_clock::now();
  auto second = receiver->recv_for(std::chrono::seconds(5));
  auto waited = std::chrono::steady_clock::now() - start;
  return !second && receiver->senders_gone() && waited < std::chrono::seconds(1);
}

bool test_empty_path_without_previous(TestContext& ctx) {
  RecordingEngine engine;
  auto channel = make_channel<SyncMessage>();
  SyncConfig config;
  config.torrent_url = "http://example.com/mods.torrent";

  auto result = manage_transfer_task(config, engine, channel.first, std::nullopt,
                                     bytes_of("d4:infoe"), ctx.logger.get());
  auto messages = channel.second.drain();
  auto statuses = statuses_of(messages);
  auto events = events_of(messages);
  return !result &&
         engine.calls().empty() &&
         count_error_events(messages) == 1 &&
         events.size() == 1 &&
         events[0].message == kDownloadPathNotConfigured &&
         !statuses.empty() &&
         statuses.back() == SyncStatus::error(kDownloadPathNotConfigured);
}

bool test_empty_path_with_previous(TestContext& ctx) {
  RecordingEngine engine;
  auto channel = make_channel<SyncMessage>();
  SyncConfig config;

  auto result = manage_transfer_task(config, engine, channel.first, TorrentId{3},
                                     bytes_of("d4:infoe"), ctx.logger.get());
  auto messages = channel.second.drain();
  auto statuses = statuses_of(messages);
  return !result &&
         engine.forgets() == std::vector<TorrentId>{3} &&
         engine.adds().empty() &&
         count_error_events(messages) == 1 &&
         statuses.front() == SyncStatus::updating_torrent() &&
         statuses.back().is_error();
}

bool test_retire_failure_still_registers(TestContext& ctx) {
  RecordingEngine engine;
  engine.forget_error = "torrent not found";
  auto channel = make_channel<SyncMessage>();

  auto result = manage_transfer_task(mods_config(), engine, channel.first, TorrentId{9},
                                     bytes_of("payload"), ctx.logger.get());
  auto messages = channel.second.drain();
  auto events = events_of(messages);
  auto statuses = statuses_of(messages);
  if(engine.calls() != std::vector<std::string>{"forget:9", "add"}) return false;
  if(result != std::optional<TorrentId>(42)) return false;
  if(events.size() != 2) return false;
  if(events[0].kind != SyncEvent::Kind::Error ||
     events[0].message.find("torrent not found") == std::string::npos ||
     events[0].message.find("9") == std::string::npos) {
    return false;
  }
  return events[1] == SyncEvent::torrent_added(42) &&
         statuses.back() == SyncStatus::idle() &&
         ctx.logs.contains("Proceeding to add new one");
}

bool test_success_emits_added_then_idle(TestContext& ctx) {
  RecordingEngine engine;
  engine.next_id = 5;
  auto channel = make_channel<SyncMessage>();

  auto result = manage_transfer_task(mods_config(), engine, channel.first, std::nullopt,
                                     bytes_of("payload"), ctx.logger.get());
  auto messages = channel.second.drain();
  if(result != std::optional<TorrentId>(5)) return false;
  if(messages.size() < 3) return false;

  const auto* first = std::get_if<SyncStatus>(&messages.front());
  if(!first || *first != SyncStatus::updating_torrent()) return false;

  const auto* added = std::get_if<SyncEvent>(&messages[messages.size() - 2]);
  const auto* last = std::get_if<SyncStatus>(&messages.back());
  return added && *added == SyncEvent::torrent_added(5) &&
         last && *last == SyncStatus::idle() &&
         count_error_events(messages) == 0;
}

bool test_missing_identifier_is_soft_error(TestContext& ctx) {
  RecordingEngine engine;
  engine.add_returns_id = false;
  auto channel = make_channel<SyncMessage>();

  auto result = manage_transfer_task(mods_config(), engine, channel.first, std::nullopt,
                                     bytes_of("payload"), ctx.logger.get());
  auto messages = channel.second.drain();
  auto statuses = statuses_of(messages);
  auto events = events_of(messages);
  return !result &&
         engine.adds().size() == 1 &&
         statuses.back() == SyncStatus::error(kTorrentAddedWithoutId) &&
         events.size() == 1 &&
         events[0] == SyncEvent::error(kTorrentAddedWithoutId);
}

bool test_add_failure_propagates(TestContext& ctx) {
  RecordingEngine engine;
  engine.add_error = "disk full";
  auto channel = make_channel<SyncMessage>();

  bool threw = false;
  try {
    manage_transfer_task(mods_config(), engine, channel.first, TorrentId{2},
                         bytes_of("payload"), ctx.logger.get());
  } catch(const TransferTaskError& e) {
    threw = true;
    std::string what = e.what();
    if(what.find("Failed to add torrent") == std::string::npos) return false;
    if(e.detail() != "disk full") return false;
  }
  if(!threw) return false;

  auto messages = channel.second.drain();
  for(const auto& status : statuses_of(messages)) {
    if(status == SyncStatus::idle()) return false;
  }
  for(const auto& event : events_of(messages)) {
    if(event.kind == SyncEvent::Kind::TorrentAdded) return false;
  }
  return engine.calls() == std::vector<std::string>{"forget:2", "add"};
}

bool test_replace_scenario(TestContext& ctx) {
  RecordingEngine engine;
  auto channel = make_channel<SyncMessage>();
  const auto content = bytes_of("d8:announce0:4:infod4:name4:modsee");

  auto result = manage_transfer_task(mods_config(), engine, channel.first, TorrentId{7},
                                     content, ctx.logger.get());
  auto messages = channel.second.drain();
  auto events = events_of(messages);
  auto statuses = statuses_of(messages);
  auto adds = engine.adds();
  if(result != std::optional<TorrentId>(42)) return false;
  if(engine.forgets() != std::vector<TorrentId>{7}) return false;
  if(adds.size() != 1) return false;
  const auto& options = adds[0].options;
  return adds[0].content == content &&
         options.output_folder == "/tmp/mods" &&
         options.overwrite &&
         options.paused &&
         !options.rate_limits.upload_bps &&
         options.rate_limits.download_bps == std::optional<std::uint32_t>(512000) &&
         events.size() == 1 &&
         events[0] == SyncEvent::torrent_added(42) &&
         statuses.back() == SyncStatus::idle();
}

bool test_seeding_starts_unpaused(TestContext& ctx) {
  RecordingEngine engine;
  auto channel = make_channel<SyncMessage>();
  auto config = mods_config();
  config.should_seed = true;
  config.max_upload_speed = 100;

  manage_transfer_task(config, engine, channel.first, std::nullopt,
                       bytes_of("payload"), ctx.logger.get());
  auto adds = engine.adds();
  return adds.size() == 1 &&
         !adds[0].options.paused &&
         adds[0].options.rate_limits.upload_bps == std::optional<std::uint32_t>(102400);
}

bool test_no_observer_does_not_abort(TestContext& ctx) {
  RecordingEngine engine;
  auto channel = make_channel<SyncMessage>();
  channel.second.close();
  engine.forget_error = "gone";

  auto result = manage_transfer_task(mods_config(), engine, channel.first, TorrentId{1},
                                     bytes_of("payload"), ctx.logger.get());
  return result == std::optional<TorrentId>(42) && engine.adds().size() == 1;
}

bool test_status_display_text(TestContext&) {
  return SyncStatus::idle().display_text() == "Idle" &&
         SyncStatus::updating_torrent().display_text() == "Updating torrent..." &&
         SyncStatus::error("boom").display_text() == "Error: boom" &&
         SyncEvent::torrent_added(3).describe() == "Torrent added with ID 3";
}

bool test_phases_are_logged(TestContext& ctx) {
  RecordingEngine engine;
  auto channel = make_channel<SyncMessage>();
  manage_transfer_task(mods_config(), engine, channel.first, TorrentId{7},
                       bytes_of("payload"), ctx.logger.get());
  return ctx.logs.contains("Forgetting previous torrent ID: 7") &&
         ctx.logs.contains("Adding new torrent content (7 bytes)") &&
         ctx.logs.contains("Download limit: 500 KB/s") &&
         ctx.logs.contains("Torrent added with ID: 42");
}

} // namespace

int main(int argc, char** argv) {
  bool verbose = (std::getenv("MODSYNC_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  const bool show_logs = (std::getenv("MODSYNC_TEST_LOGS") != nullptr) || verbose;
  init(verbose);
  if(!show_logs) {
    set_log_passthrough(false);
  }

  modsync::test::LogCapture logs;
  auto logger = std::make_shared<Logger>("sync-test");
  logs.attach(logger);
  TestContext ctx{logs, logger, verbose};

  std::vector<modsync::test::TestCase<TestContext>> tests = {
    {"rate_limit_absent_or_zero", test_rate_limit_absent_or_zero},
    {"rate_limit_converts_kilobytes", test_rate_limit_converts_kilobytes},
    {"rate_limit_overflow_is_unlimited", test_rate_limit_overflow_is_unlimited},
    {"rate_limits_per_direction", test_rate_limits_per_direction},
    {"channel_preserves_order_per_producer", test_channel_preserves_order_per_producer},
    {"channel_send_without_receiver", test_channel_send_without_receiver},
    {"channel_recv_ends_when_senders_gone", test_channel_recv_ends_when_senders_gone},
    {"empty_path_without_previous", test_empty_path_without_previous},
    {"empty_path_with_previous", test_empty_path_with_previous},
    {"retire_failure_still_registers", test_retire_failure_still_registers},
    {"success_emits_added_then_idle", test_success_emits_added_then_idle},
    {"missing_identifier_is_soft_error", test_missing_identifier_is_soft_error},
    {"add_failure_propagates", test_add_failure_propagates},
    {"replace_scenario", test_replace_scenario},
    {"seeding_starts_unpaused", test_seeding_starts_unpaused},
    {"no_observer_does_not_abort", test_no_observer_does_not_abort},
    {"status_display_text", test_status_display_text},
    {"phases_are_logged", test_phases_are_logged}
  };

  int rc = modsync::test::run_tests("sync", tests, ctx, logs);
  set_log_passthrough(true);
  return rc;
}
