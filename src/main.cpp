#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <csignal>
#include <filesystem>
#include <string>
#include <vector>

#include "log.hpp"
#include "settings_manager.hpp"
#include "sync_config.hpp"
#include "sync_engine.hpp"

int main(int argc, char** argv){
  try {
    SettingsManager settings;
    std::filesystem::path settings_path = (argc > 1 && argv[1])
      ? std::filesystem::path(argv[1])
      : std::filesystem::current_path() / "settings.json";
    settings.set_settings_path(settings_path);
    bool loaded = settings.load();

    std::vector<std::string> errors;
    auto overridden = settings.apply_environment(errors);

    init(settings.get<bool>("verbose"));
    Logger logger("usenetsync");
    auto log_file = settings.get<std::string>("log_file");
    if(!log_file.empty()) {
      auto max_bytes = static_cast<std::size_t>(settings.get<int>("log_file_max_mb")) * 1024 * 1024;
      if(!add_log_file(log_file, max_bytes)) {
        logger.warn("Logging to the console only");
      }
    }
    if(!loaded) {
      logger.warn("No readable settings at {}; using defaults", settings_path.string());
    }
    for(const auto& key : overridden) logger.info("Setting {} taken from the environment", key);
    logger.debug("Effective settings: {}", settings.redacted_json().dump());

    auto config = SyncConfig::from_settings(settings, errors);
    if(!errors.empty()) {
      for(const auto& error : errors) logger.error("Invalid setting: {}", error);
      return 1;
    }
    if(config.servers.empty()) {
      logger.warn("No news servers configured; transfers will fail until one is added");
    }

    SyncEngine::Options options;
    options.config = config;
    SyncEngine engine(std::move(options));
    engine.start();

    asio::io_context io;
    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code& ec, int signo){
      if(!ec) logger.info("Signal {} received, shutting down", signo);
    });
    io.run();

    engine.stop();
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("usenetsync-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
