// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#include "app/relay_driver.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <filesystem>
#include <iostream> // Keep for CLI output and early errors before logger initialized

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.equirelay)\n"
      << "  --header=<file>      Verify and register the header in a JSON file\n"
      << "  --genesis            Verify and register the chain's genesis header\n"
      << "  --caller=<hex>       20-byte caller id owning the verification session\n"
      << "                       Default: all zero\n"
      << "  --resume             Continue an interrupted session for the same header\n"
      << "  --status             Print chain and session status\n"
      << "  --finalitydepth=<n>  Override finality depth (0 = use chain default)\n"
      << "  --regtest            Use regression test chain (finality depth 1)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: chain, crypto, verify, app, all\n"
      << "                       Can be comma-separated: --debug=verify,chain\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    equirelay::app::RelayConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;
    std::string header_file;
    bool relay_genesis = false;
    bool resume = false;
    bool show_status = false;
    uint160 caller;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << equirelay::GetFullVersionString() << std::endl;
        std::cout << equirelay::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--header=") == 0) {
        header_file = arg.substr(9);
      } else if (arg == "--genesis") {
        relay_genesis = true;
      } else if (arg.find("--caller=") == 0) {
        auto caller_opt = equirelay::util::SafeParseUint160(arg.substr(9));
        if (!caller_opt) {
          std::cerr << "Error: Invalid caller id: " << arg.substr(9) << std::endl;
          std::cerr << "Caller must be 40 hex characters" << std::endl;
          return 1;
        }
        caller = *caller_opt;
      } else if (arg == "--resume") {
        resume = true;
      } else if (arg == "--status") {
        show_status = true;
      } else if (arg.find("--finalitydepth=") == 0) {
        auto depth_opt = equirelay::util::SafeParseInt(arg.substr(16), 0, 1000000);
        if (!depth_opt) {
          std::cerr << "Error: Invalid finality depth: " << arg.substr(16) << std::endl;
          std::cerr << "Depth must be a number between 0 and 1000000" << std::endl;
          return 1;
        }
        config.finality_depth = *depth_opt;
      } else if (arg == "--regtest") {
        config.chain_type = equirelay::chain::ChainType::REGTEST;
      } else if (arg == "--verbose") {
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=verify,chain
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

    if (header_file.empty() && !relay_genesis && !show_status) {
      std::cerr << "Nothing to do: pass --header, --genesis or --status" << std::endl;
      print_usage(argv[0]);
      return 1;
    }

    // Ensure datadir exists before initializing file logger
    if (!equirelay::util::ensure_directory(config.datadir)) {
      std::cerr << "Error: Cannot create data directory: " << config.datadir.string()
                << std::endl;
      return 1;
    }
    std::string log_file = (config.datadir / "debug.log").string();
    equirelay::util::LogManager::Initialize(log_level, true, log_file);

    for (const auto &component : debug_components) {
      if (component == "all") {
        equirelay::util::LogManager::SetLogLevel("trace");
      } else {
        equirelay::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    int exit_code = 0;
    // Nested scope: the driver and its subscriptions go before the logger
    {
      equirelay::app::RelayDriver driver(config);
      if (!driver.initialize()) {
        LOG_ERROR("Failed to initialize relay driver");
        equirelay::util::LogManager::Shutdown();
        return 1;
      }

      std::cout << equirelay::GetStartupBanner(driver.chain_params().GetChainTypeString());

      if (relay_genesis) {
        const CBlockHeader &genesis = driver.chain_params().GenesisBlock();
        if (driver.chain_store().IsRegistered(genesis.GetHash())) {
          std::cout << "Genesis already registered: " << genesis.GetHash().GetHex() << std::endl;
        } else if (auto hash = driver.Relay(genesis, caller, resume)) {
          std::cout << "Registered genesis " << hash->GetHex() << std::endl;
        } else {
          std::cerr << "Genesis verification failed (see debug.log)" << std::endl;
          exit_code = 1;
        }
      }

      if (exit_code == 0 && !header_file.empty()) {
        auto header = equirelay::app::ReadHeaderFile(header_file);
        if (!header) {
          std::cerr << "Error: Cannot read header from " << header_file << std::endl;
          exit_code = 1;
        } else if (auto hash = driver.Relay(*header, caller, resume)) {
          std::cout << "Registered block " << hash->GetHex() << std::endl;
        } else {
          std::cerr << "Header verification failed (see debug.log)" << std::endl;
          exit_code = 1;
        }
      }

      if (show_status) {
        std::cout << driver.GetStatusString();
      }

      if (!driver.save_state()) {
        exit_code = 1;
      }
    }

    equirelay::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    equirelay::util::LogManager::Shutdown();
    return 1;
  }
}
