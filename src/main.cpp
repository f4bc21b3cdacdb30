// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <cstdint>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <limits>
#include <optional>
#include <string>
#include <vector>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.blockledger)\n"
      << "  --regtest            Use regression test parameters (short intervals)\n"
      << "  --nopersist          Keep blocks in memory only (no blocks.json)\n"
      << "\n"
      << "Consensus overrides:\n"
      << "  --maxnonce=<n>            Exclusive bound of the nonce search\n"
      << "  --halvinginterval=<n>     Reward halving interval in blocks\n"
      << "  --difficultyinterval=<n>  Difficulty step interval in blocks\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: chain, store, rpc, app, all\n"
      << "                       Can be comma-separated: --debug=chain,store\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

namespace {

std::optional<int64_t> ParsePositiveOption(const std::string &arg,
                                           size_t prefix_len,
                                           const char *name) {
  auto value = blockledger::util::SafeParseInt64(
      arg.substr(prefix_len), 1, std::numeric_limits<int64_t>::max());
  if (!value) {
    std::cerr << "Error: Invalid " << name << ": " << arg.substr(prefix_len)
              << std::endl;
    std::cerr << "Value must be a positive integer" << std::endl;
  }
  return value;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    blockledger::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << blockledger::GetFullVersionString() << std::endl;
        std::cout << blockledger::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg == "--regtest") {
        config.chain_type = blockledger::chain::ChainType::REGTEST;
      } else if (arg == "--nopersist") {
        config.persist = false;
      } else if (arg.find("--maxnonce=") == 0) {
        auto value = ParsePositiveOption(arg, 11, "max nonce");
        if (!value) {
          return 1;
        }
        config.max_nonce = static_cast<uint64_t>(*value);
      } else if (arg.find("--halvinginterval=") == 0) {
        config.halving_interval = ParsePositiveOption(arg, 18, "halving interval");
        if (!config.halving_interval) {
          return 1;
        }
      } else if (arg.find("--difficultyinterval=") == 0) {
        config.difficulty_interval =
            ParsePositiveOption(arg, 21, "difficulty interval");
        if (!config.difficulty_interval) {
          return 1;
        }
      } else if (arg == "--verbose") {
        config.verbose = true;
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=chain,store
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
    if (!blockledger::util::ensure_directory(config.datadir)) {
      std::cerr << "Error: Cannot create data directory: "
                << config.datadir.string() << std::endl;
      return 1;
    }

    // Initialize logging system (enable file logging with debug.log)
    std::string log_file = (config.datadir / "debug.log").string();
    blockledger::util::LogManager::Initialize(log_level, true, log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        blockledger::util::LogManager::SetLogLevel("trace");
      } else if (!blockledger::util::LogManager::SetComponentLevel(component,
                                                                   "trace")) {
        LOG_WARN("Unknown debug component: {}", component);
      }
    }

    // Nested scope so the app destructor runs before LogManager::Shutdown()
    {
      blockledger::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      // Run until shutdown requested
      app.wait_for_shutdown();
    }

    blockledger::util::LogManager::Shutdown();

    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    blockledger::util::LogManager::Shutdown();
    return 1;
  }
}
