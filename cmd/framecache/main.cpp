#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/extract/exiv2_extractor.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: framecache <config.yaml> OR framecache --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = framecache::config::ConfigLoader::LoadFromYaml(config_path);

    framecache::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build the cache (dependency graph)
    // ------------------------------------------------------------
    auto cache = framecache::factory::Build(config, {std::make_shared<framecache::extract::Exiv2Extractor>(), nullptr});

    // Register signal handlers before starting the loop to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    cache->Start(!config.scheduler().autostart());
    FRAMECACHE_LOG_INFO("framecache started", {framecache::observability::StringField("picture_dir", config.library().picture_dir())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FRAMECACHE_LOG_INFO("shutting down framecache");

    cache->Stop();
    framecache::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    FRAMECACHE_LOG_ERROR("fatal error", {framecache::observability::StringField("error", e.what())});
    framecache::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
