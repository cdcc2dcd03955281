// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "network/tcp_transport.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <filesystem>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.draftops)\n"
      << "  --conf=<file>        Config file (default: <datadir>/draftops.json)\n"
      << "  --connect=<host:port>  Draft event stream to follow\n"
      << "  --team=<id>          Tracked team id (overrides team_id)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: protocol, draft, network, resolver, app, all\n"
      << "                       Can be comma-separated: --debug=network,draft\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    draftops::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    // Command-line values win over the config file, which is read first
    std::optional<std::string> stream_override;
    std::optional<std::string> team_override;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << draftops::GetFullVersionString() << std::endl;
        std::cout << draftops::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--conf=") == 0) {
        config.conf_file = arg.substr(7);
      } else if (arg.find("--connect=") == 0) {
        std::string target = arg.substr(10);
        if (!draftops::network::ParseEndpoint(target)) {
          std::cerr << "Error: Invalid stream endpoint: " << target << std::endl;
          std::cerr << "Expected host:port (IPv6 as [addr]:port)" << std::endl;
          return 1;
        }
        stream_override = target;
      } else if (arg.find("--team=") == 0) {
        std::string team = arg.substr(7);
        if (team.empty()) {
          std::cerr << "Error: --team requires a team id" << std::endl;
          return 1;
        }
        team_override = team;
      } else if (arg == "--verbose") {
        config.verbose = true;
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=network,draft
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    // Ensure datadir exists before initializing file logger
    if (!draftops::util::ensure_directory(config.datadir)) {
      std::cerr << "Error: Cannot create data directory " << config.datadir.string()
                << std::endl;
      return 1;
    }

    // Initialize logging system (enable file logging with debug.log)
    std::string log_file = (config.datadir / "debug.log").string();
    draftops::util::LogManager::Initialize(log_level, true, log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        draftops::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        draftops::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        draftops::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    // Config file: explicit --conf must exist, the default one is optional
    std::filesystem::path conf = config.conf_file;
    bool conf_required = !conf.empty();
    if (conf.empty()) {
      conf = config.datadir / "draftops.json";
    }
    if (conf_required || std::filesystem::exists(conf)) {
      std::string error;
      if (!draftops::app::LoadConfigFile(conf, config, error)) {
        LOG_ERROR("Failed to load config {}: {}", conf.string(), error);
        std::cerr << "Error: " << conf.string() << ": " << error << std::endl;
        draftops::util::LogManager::Shutdown();
        return 1;
      }
      LOG_INFO("Loaded config from {}", conf.string());
    }

    if (stream_override) {
      config.stream = *stream_override;
    }
    if (team_override) {
      config.session.team_id = *team_override;
    }

    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    // so no IO callback logs after the logger is gone
    int exit_code = 0;
    {
      draftops::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        exit_code = 1;
      } else if (!app.start()) {
        LOG_ERROR("Failed to start application");
        exit_code = 1;
      } else {
        // Run until shutdown requested
        app.wait_for_shutdown();
      }
    }

    draftops::util::LogManager::Shutdown();

    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    draftops::util::LogManager::Shutdown();
    return 1;
  }
}
