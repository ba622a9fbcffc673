#include "config/config.hpp"
#include "logger/logger.hpp"
#include "network/csrf_guard.hpp"
#include "network/http_server.hpp"
#include "network/router.hpp"
#include "store/metadata_store.hpp"
#include "store/store.hpp"
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string config_path;
  std::optional<std::string> address;
  std::optional<uint16_t> port;
  std::optional<std::string> database;
  std::optional<std::string> log_level;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-c <config>] [-a <address>] [-p <port>] [-d <db>] [-l <level>]\n"
        << "Optional arguments:\n"
        << "  -c, --config  JSON config file\n"
        << "  -a, --address Listen address (default 0.0.0.0)\n"
        << "  -p, --port    Port number (default 8080)\n"
        << "  -d, --db      Database file (default bucketd.db)\n"
        << "  -l, --log     Log level: trace, debug, info, warning, error or fatal\n"
        << "Example: " << program_name << " -p 8080 -d data.db\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "-c", "--config",
    "-a", "--address",
    "-p", "--port",
    "-d", "--db",
    "-l", "--log"
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Missing value for argument: " << argv[argc - 1] << '\n';
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (flag == "-c" || flag == "--config") {
      options.config_path = value;
    } else if (flag == "-a" || flag == "--address") {
      options.address = value;
    } else if (flag == "-p" || flag == "--port") {
      try {
        int port = std::stoi(value);
        if (port < 1 || port > 65535) {
          throw std::out_of_range(value);
        }
        options.port = static_cast<uint16_t>(port);
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid port number\n";
        print_usage(argv[0]);
        return options;
      }
    } else if (flag == "-d" || flag == "--db") {
      options.database = value;
    } else if (flag == "-l" || flag == "--log") {
      options.log_level = value;
    }
  }

  options.valid = true;
  return options;
}

// File values first, then command-line overrides
std::optional<bucketd::config::Settings> load_settings(const ProgramOptions& options) {
  try {
    bucketd::config::Settings settings;
    if (!options.config_path.empty()) {
      settings = bucketd::config::load_config(options.config_path);
    }
    if (options.address) settings.address = *options.address;
    if (options.port) settings.port = *options.port;
    if (options.database) settings.database = *options.database;
    if (options.log_level) settings.log_level = *options.log_level;

    bucketd::config::validate(settings);
    return settings;
  } catch (const bucketd::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return std::nullopt;
  }
}

bool run_server(const bucketd::config::Settings& settings) {
  try {
    bucketd::store::Database database(settings.database);
    bucketd::store::MetadataStore::bootstrap(database);

    bucketd::network::Router router(database);
    std::unique_ptr<bucketd::network::CsrfGuard> guard;
    bucketd::network::RequestHandler* handler = &router;
    if (settings.csrf.enabled()) {
      guard = std::make_unique<bucketd::network::CsrfGuard>(settings.csrf.key, router);
      handler = guard.get();
    }

    bucketd::network::HttpServer server(settings.port, settings.address, *handler);
    if (!server.start_listener()) {
      std::cerr << "Error: Failed to start server on " << settings.address << ":" << settings.port << '\n';
      return false;
    }

    // Block until the process is asked to stop
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& error, int signal_number) {
      if (!error) {
        BOOST_LOG_TRIVIAL(info) << "Main: Received signal " << signal_number << ", shutting down";
      }
    });
    signal_context.run();

    server.shutdown();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Main: Startup failed: " << e.what();
    std::cerr << "Error: Failed to start server: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  const auto settings = load_settings(options);
  if (!settings) {
    return 1;
  }

  try {
    bucketd::logging::init_logging(settings->log_file, bucketd::logging::parse_severity(settings->log_level));
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to initialize logging: " << e.what() << '\n';
    return 1;
  }

  return run_server(*settings) ? 0 : 1;
}
