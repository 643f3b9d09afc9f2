// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "network/errors.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <string>
#include <vector>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --port=<port>        Service port shared by all nodes (default: 7890)\n"
      << "  --address=<ip>       Use this local IPv4 address instead of detecting it\n"
      << "  --interface=<name>   Detect the local address on this interface only\n"
      << "\n"
      << "Discovery:\n"
      << "  --scanfirst=<n>      First host index of the /24 sweep (default: 0)\n"
      << "  --scanlast=<n>       Last host index of the /24 sweep (default: 254)\n"
      << "  --maxprobes=<n>      Probes in flight at once, 0 = all (default: 0)\n"
      << "  --probetimeout=<ms>  Per-address probe timeout (default: 1000)\n"
      << "  --connecttimeout=<ms> Sync client connect timeout (default: 10000)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, service, server, client, connection, app, all\n"
      << "                       Can be comma-separated: --debug=network,service\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "  --logfile=<path>     Log to a rotating file instead of the console\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    lansync::app::AppConfig config;
    std::string log_level = "info";
    std::string log_file;
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << lansync::GetFullVersionString() << std::endl;
        std::cout << lansync::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--port=") == 0) {
        auto port_opt = lansync::util::SafeParsePort(arg.substr(7));
        if (!port_opt) {
          std::cerr << "Error: Invalid port number: " << arg.substr(7) << std::endl;
          std::cerr << "Port must be a number between 1 and 65535" << std::endl;
          return 1;
        }
        config.port = *port_opt;
      } else if (arg.find("--address=") == 0) {
        auto address = lansync::util::ValidateAndNormalizeIP(arg.substr(10));
        if (!address || !lansync::util::SubnetPrefix(*address)) {
          std::cerr << "Error: Invalid IPv4 address: " << arg.substr(10) << std::endl;
          return 1;
        }
        config.bind_address = *address;
      } else if (arg.find("--interface=") == 0) {
        config.interface_name = arg.substr(12);
      } else if (arg.find("--scanfirst=") == 0) {
        auto host_opt = lansync::util::SafeParseInt(arg.substr(12), 0, 255);
        if (!host_opt) {
          std::cerr << "Error: Invalid first host index: " << arg.substr(12) << std::endl;
          std::cerr << "Host index must be a number between 0 and 255" << std::endl;
          return 1;
        }
        config.scan.first_host = *host_opt;
      } else if (arg.find("--scanlast=") == 0) {
        auto host_opt = lansync::util::SafeParseInt(arg.substr(11), 0, 255);
        if (!host_opt) {
          std::cerr << "Error: Invalid last host index: " << arg.substr(11) << std::endl;
          std::cerr << "Host index must be a number between 0 and 255" << std::endl;
          return 1;
        }
        config.scan.last_host = *host_opt;
      } else if (arg.find("--maxprobes=") == 0) {
        auto probes_opt = lansync::util::SafeParseInt(arg.substr(12), 0, 256);
        if (!probes_opt) {
          std::cerr << "Error: Invalid probe limit: " << arg.substr(12) << std::endl;
          std::cerr << "Probe limit must be a number between 0 and 256" << std::endl;
          return 1;
        }
        config.scan.max_concurrent_probes = static_cast<size_t>(*probes_opt);
      } else if (arg.find("--probetimeout=") == 0) {
        auto ms_opt = lansync::util::SafeParseInt(arg.substr(15), 1, 60000);
        if (!ms_opt) {
          std::cerr << "Error: Invalid probe timeout: " << arg.substr(15) << std::endl;
          std::cerr << "Timeout must be between 1 and 60000 milliseconds" << std::endl;
          return 1;
        }
        config.scan.probe_timeout = std::chrono::milliseconds(*ms_opt);
      } else if (arg.find("--connecttimeout=") == 0) {
        auto ms_opt = lansync::util::SafeParseInt(arg.substr(17), 1, 600000);
        if (!ms_opt) {
          std::cerr << "Error: Invalid connect timeout: " << arg.substr(17) << std::endl;
          std::cerr << "Timeout must be between 1 and 600000 milliseconds" << std::endl;
          return 1;
        }
        config.client_connect_timeout = std::chrono::milliseconds(*ms_opt);
      } else if (arg == "--verbose") {
        config.verbose = true;
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        log_file = arg.substr(10);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=network,service
        debug_components = lansync::util::SplitCommaList(arg.substr(8));
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (config.scan.first_host > config.scan.last_host) {
      std::cerr << "Error: --scanfirst must not exceed --scanlast" << std::endl;
      return 1;
    }

    lansync::util::LogManager::Initialize(log_level, !log_file.empty(), log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        lansync::util::LogManager::SetLogLevel("trace");
      } else if (component == "net" || component == "network") {
        lansync::util::LogManager::SetComponentLevel("network", "trace");
      } else if (lansync::util::LogManager::IsKnownComponent(component)) {
        lansync::util::LogManager::SetComponentLevel(component, "trace");
      } else {
        std::cerr << "WARNING: unknown log component '" << component << "' ignored" << std::endl;
      }
    }

    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    // so no socket callback logs through a destroyed logger
    {
      lansync::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        return 1;
      }

      try {
        if (!app.start()) {
          LOG_ERROR("Failed to start application");
          return 1;
        }
      } catch (const lansync::network::BindError &e) {
        LOG_ERROR("Startup failed: {}", e.what());
        return 1;
      } catch (const lansync::network::NoAddressError &e) {
        LOG_ERROR("Startup failed: {}", e.what());
        return 1;
      } catch (const lansync::network::ConnectError &e) {
        LOG_ERROR("Startup failed: {}", e.what());
        return 1;
      }

      // Run until shutdown requested
      app.wait_for_shutdown();
    }

    lansync::util::LogManager::Shutdown();

    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    lansync::util::LogManager::Shutdown();
    return 1;
  }
}
