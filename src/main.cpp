#include <cpptrace/cpptrace.hpp>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>

#include "command_line_parser.hpp"
#include "libtorrent_engine.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "status_channel.hpp"
#include "sync_cli.hpp"
#include "sync_service.hpp"

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(std::filesystem::current_path() / ".config" / "modsync.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "modsync");
    try {
      parser.parse(argc, argv, *settings);
    } catch(const CommandLineError& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings->get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("modsync");
    logger->debug("Verbose logging enabled");

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    int listen_port = settings->get<int>("listen_port");
    if(listen_port < 0 || listen_port > 65535) {
      logger->error("Invalid listen_port '{}'", listen_port);
      return 1;
    }

    LibtorrentEngine::Options engine_options;
    engine_options.listen_port = listen_port;
    auto engine = std::make_shared<LibtorrentEngine>(engine_options, std::make_shared<Logger>("libtorrent"));

    auto config = settings->sync_config();
    if(!config.is_complete()) {
      logger->warn("Configuration incomplete: set torrent_url and download_path (see 'help')");
    }

    SyncService::Options service_options;
    service_options.refresh_interval = std::chrono::seconds(settings->get<int>("refresh_interval"));
    service_options.refresh_on_start = true;

    auto channel = make_channel<SyncMessage>();
    auto service = std::make_shared<SyncService>(engine,
                                                 std::move(channel.first),
                                                 config,
                                                 service_options,
                                                 make_torrent_fetcher(),
                                                 std::make_shared<Logger>("sync"));

    SyncCLI cli(service, settings, engine, logger);
    cli.start_status_pump(std::move(channel.second));
    service->start_background();

    logger->print("modsync ready. Type 'help' for commands.");
    cli.run_interactive();

    service->stop();
    cli.stop();
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("modsync-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
