#include "auth/credential_store.hpp"
#include "logger/logger.hpp"
#include "server/server.hpp"
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>
#include <csignal>
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  vault::server::ServerConfig config;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
            << "Options:\n"
            << "  -h, --host         Listen address (default 0.0.0.0)\n"
            << "  -p, --port         Listen port (default 12345)\n"
            << "  -s, --storage      Storage root (default server_storage)\n"
            << "  -c, --credentials  Credentials file (default id_passwd.txt)\n"
            << "  -g, --grace-ms     Shutdown grace window in ms (default 100)\n"
            << "  -l, --log-file     Log file (default vault_server.log)\n"
            << "  -v, --log-level    trace|debug|info|warning|error|fatal (default info)\n"
            << "Example: " << program_name << " -p 12345 -s server_storage -c id_passwd.txt\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "-h", "--host", "-p", "--port", "-s", "--storage", "-c", "--credentials",
    "-g", "--grace-ms", "-l", "--log-file", "-v", "--log-level"
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

    try {
      if (flag == "-h" || flag == "--host") {
        options.config.address = value;
      } else if (flag == "-p" || flag == "--port") {
        int port = std::stoi(value);
        if (port < 0 || port > 65535) {
          throw std::out_of_range(value);
        }
        options.config.port = static_cast<uint16_t>(port);
      } else if (flag == "-s" || flag == "--storage") {
        options.config.storage_root = value;
      } else if (flag == "-c" || flag == "--credentials") {
        options.config.credentials_file = value;
      } else if (flag == "-g" || flag == "--grace-ms") {
        long grace = std::stol(value);
        if (grace < 0) {
          throw std::out_of_range(value);
        }
        options.config.grace_period = std::chrono::milliseconds(grace);
      } else if (flag == "-l" || flag == "--log-file") {
        options.config.log_file = value;
      } else if (flag == "-v" || flag == "--log-level") {
        vault::logging::parse_severity(value);
        options.config.log_level = value;
      }
    } catch (const std::exception& e) {
      std::cerr << "Error: Invalid value for " << flag << ": " << value << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  options.valid = true;
  return options;
}

bool run_server(const vault::server::ServerConfig& config) {
  try {
    vault::logging::init_logging(config.log_file, vault::logging::parse_severity(config.log_level), true);

    vault::auth::FileCredentialStore credentials(config.credentials_file);
    vault::server::Server server(config, credentials);

    if (!server.start_listener()) {
      std::cerr << "Error: Failed to start server on " << config.address << ":" << config.port << '\n';
      return false;
    }
    std::cout << "Server listening on " << config.address << ":" << server.port() << std::endl;

    // Block the main thread until SIGINT or SIGTERM
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
      if (!ec) {
        BOOST_LOG_TRIVIAL(info) << "Main: Received signal " << signal_number << ", shutting down";
      }
    });
    signal_context.run();

    std::cout << "\n[SERVER SHUTDOWN] Notifying clients and closing connections..." << std::endl;
    server.shutdown();
    std::cout << "[SERVER SHUTDOWN] Server stopped" << std::endl;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Main: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_server(options.config)) {
    return 1;
  }
  return 0;
}
