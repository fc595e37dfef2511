#include "server/server.hpp"
#include "network/connection.hpp"
#include "protocol/command_codec.hpp"
#include "server/session.hpp"
#include <boost/log/trivial.hpp>

namespace vault {
namespace server {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Server::Server(const ServerConfig& config, const auth::CredentialStore& credentials)
  : config_(config)
  , credentials_(credentials)
  , store_(config.storage_root)
  , cancellation_(std::make_shared<CancellationToken>()) {
  BOOST_LOG_TRIVIAL(info) << "Server: Initializing server on " << config_.address << ":" << config_.port
                          << " with storage root " << store_.base_path().string();
}

Server::~Server() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool Server::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "Server: Server already running";
    return false;
  }
  if (cancellation_->is_cancelled()) {
    BOOST_LOG_TRIVIAL(warning) << "Server: Cannot restart after shutdown";
    return false;
  }

  try {
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(config_.address),
      config_.port
    );

    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    bound_port_ = acceptor_->local_endpoint().port();

    is_running_ = true;

    // Start accepting connections
    start_accept();

    // Start io_context in a separate thread
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work_guard = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "Server: Listening on " << config_.address << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Server: Failed to start listener: " << e.what();
    acceptor_.reset();
    return false;
  }
}

void Server::shutdown() {
  if (!is_running_.exchange(false)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Server: Initiating server shutdown";

  // Stop accepting new connections
  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Server: Error closing acceptor: " << ec.message();
    }
  }

  // Sessions see the token before their next read, blocked reads end with the forced close
  cancellation_->cancel();
  registry_.broadcast_shutdown(config_.grace_period);

  std::list<Worker> workers;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers.swap(workers_);
  }
  for (auto& worker : workers) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Server: Server shutdown complete, joined " << workers.size() << " sessions";
}


//==============================================
// CONNECTION HANDLING
//==============================================

void Server::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  // Create new socket for incoming connection
  auto socket = std::make_shared<boost::asio::ip::tcp::socket>(io_context_);

  acceptor_->async_accept(*socket,
    [this, socket](const boost::system::error_code& error) {
      if (!error) {
        handle_connection(std::move(*socket));
      } else if (error != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "Server: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void Server::handle_connection(boost::asio::ip::tcp::socket socket) {
  reap_workers();

  auto connection = std::make_shared<network::Connection>(std::move(socket));
  SessionId id = next_session_id_++;

  BOOST_LOG_TRIVIAL(info) << "Server: New connection " << id << " from " << connection->remote_address();

  if (!registry_.add(id, connection)) {
    // Accepted while the shutdown broadcast is running
    try {
      connection->send_message(protocol::CommandCodec::encode(
        protocol::Response::shutdown("Server is shutting down")));
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(debug) << "Server: Could not notify late connection " << id << ": " << e.what();
    }
    connection->close();
    return;
  }

  Session::Options options;
  options.transfer_start_delay = config_.transfer_start_delay;

  auto finished = std::make_shared<std::atomic<bool>>(false);
  std::thread thread([this, id, connection, options, finished]() {
    try {
      Session session(id, connection, credentials_, store_, registry_, cancellation_, options);
      session.run();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Server: Session " << id << " failed: " << e.what();
      registry_.remove(id);
    }
    *finished = true;
  });

  std::lock_guard<std::mutex> lock(workers_mutex_);
  workers_.push_back(Worker{std::move(thread), finished});
  BOOST_LOG_TRIVIAL(info) << "Server: Active connections: " << workers_.size();
}

void Server::reap_workers() {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (*it->finished) {
      if (it->thread.joinable()) {
        it->thread.join();
      }
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace server
} // namespace vault
