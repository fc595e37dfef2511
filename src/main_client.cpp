#include "cli/cli.hpp"
#include "client/client.hpp"
#include "logger/logger.hpp"
#include "network/protocol_error.hpp"
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <unordered_set>
#include <unistd.h>

struct ProgramOptions {
  vault::client::ClientConfig config;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
            << "Options:\n"
            << "  -h, --host       Server address (default 127.0.0.1)\n"
            << "  -p, --port       Server port (default 12345)\n"
            << "  -l, --log-file   Log file (default vault_client.log)\n"
            << "  -v, --log-level  trace|debug|info|warning|error|fatal (default warning)\n"
            << "Example: " << program_name << " -h 127.0.0.1 -p 12345\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "-h", "--host", "-p", "--port", "-l", "--log-file", "-v", "--log-level"
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
        options.config.host = value;
      } else if (flag == "-p" || flag == "--port") {
        int port = std::stoi(value);
        if (port <= 0 || port > 65535) {
          throw std::out_of_range(value);
        }
        options.config.port = static_cast<uint16_t>(port);
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

bool run_client(const vault::client::ClientConfig& config) {
  try {
    vault::logging::init_logging(config.log_file, vault::logging::parse_severity(config.log_level));

    vault::client::Client client;
    client.connect(config.host, config.port);

    std::string username;
    std::string password;
    std::cout << "Username: " << std::flush;
    std::getline(std::cin, username);
    std::cout << "Password: " << std::flush;
    std::getline(std::cin, password);

    client.authenticate(username, password);
    std::cout << "Authentication successful!" << std::endl;

    // Ctrl+C says goodbye to the server before the process ends
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&client](const boost::system::error_code& ec, int) {
      if (ec) {
        return;
      }
      std::cout << "\n[CLIENT SHUTDOWN] Signal received, closing connection..." << std::endl;
      client.interrupt();
      std::cout << "[CLIENT SHUTDOWN] Connection closed" << std::endl;
      ::_exit(0);
    });
    std::thread signal_thread([&signal_context]() { signal_context.run(); });

    vault::cli::CLI cli(client);
    cli.run();

    signals.cancel();
    signal_thread.join();
    return true;
  } catch (const vault::network::HandshakeRejected&) {
    std::cerr << "Handshake failed" << '\n';
    return false;
  } catch (const vault::network::AuthenticationFailed& e) {
    std::cerr << "Authentication failed: " << e.what() << '\n';
    return false;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Main: " << e.what();
    std::cerr << "An error occurred: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_client(options.config)) {
    return 1;
  }
  return 0;
}
