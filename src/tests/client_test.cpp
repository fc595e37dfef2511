#include <gtest/gtest.h>
#include <functional>
#include <thread>
#include "client/client.hpp"
#include "network/protocol_error.hpp"
#include "protocol/command_codec.hpp"
#include "transfer/transfer_framer.hpp"
#include "test_utils.hpp"

using namespace vault;
using network::Frame;
using network::FrameType;
using protocol::CommandCodec;
using protocol::Response;
namespace fs = std::filesystem;

namespace {

// Accepts a single connection and plays a scripted server side on it
class ScriptedServer {
public:
  using Script = std::function<void(network::Connection&)>;

  explicit ScriptedServer(Script script)
    : acceptor_(io_context_, boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)) {
    thread_ = std::thread([this, script]() {
      try {
        network::Connection connection(acceptor_.accept());
        script(connection);
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(debug) << "Scripted server: " << e.what();
      }
    });
  }

  ~ScriptedServer() {
    thread_.join();
  }

  uint16_t port() const { return acceptor_.local_endpoint().port(); }

private:
  boost::asio::io_context io_context_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::thread thread_;
};

// Handshake and authentication as the real server answers them
void accept_login(network::Connection& connection) {
  connection.read_message();
  connection.send_message(protocol::ACK_TOKEN);
  connection.read_message();
  connection.send_message(CommandCodec::encode(Response::success("Authentication successful")));
}

} // namespace

class ClientTest : public ::testing::Test {
protected:
  test::TempDirectory temp_dir_{"vault_client"};

  void SetUp() override {
    test::init_logging(boost::log::trivial::error);
  }
};

TEST_F(ClientTest, RejectedHandshakeThrows) {
  ScriptedServer server([](network::Connection& connection) {
    connection.read_message();
    connection.send_message(protocol::REJECT_TOKEN);
  });

  client::Client client;
  EXPECT_THROW(client.connect("127.0.0.1", server.port()), network::HandshakeRejected);
  EXPECT_FALSE(client.is_connected());
}

TEST_F(ClientTest, SendsGreetingAndCredentials) {
  std::string greeting;
  protocol::Credentials credentials;
  {
    ScriptedServer server([&](network::Connection& connection) {
      greeting = connection.read_message();
      connection.send_message(protocol::ACK_TOKEN);
      credentials = CommandCodec::decode_credentials(connection.read_message());
      connection.send_message(CommandCodec::encode(Response::success("Authentication successful")));
    });

    client::Client client;
    client.connect("127.0.0.1", server.port());
    client.authenticate("alice", "pw123");
    EXPECT_TRUE(client.is_connected());
    client.exit();
  }

  EXPECT_EQ(greeting, "HELLO");
  EXPECT_EQ(credentials.username, "alice");
  EXPECT_EQ(credentials.password, "pw123");
}

TEST_F(ClientTest, InterruptedDownloadRemovesPartialFile) {
  ScriptedServer server([](network::Connection& connection) {
    accept_login(connection);
    connection.read_message();
    Response starting = Response::success("Starting transfer");
    starting.size = 100;
    connection.send_message(CommandCodec::encode(starting));
    connection.write_frame(Frame{FrameType::CHUNK, "only part of it"});
    connection.close();
  });

  client::Client client;
  client.connect("127.0.0.1", server.port());
  client.authenticate("alice", "pw123");

  fs::path local_path = temp_dir_.path() / "notes.txt";
  EXPECT_THROW(client.download("notes.txt", local_path), network::TransferAborted);
  EXPECT_FALSE(fs::exists(local_path));
  EXPECT_FALSE(fs::exists(temp_dir_.path() / "notes.txt.part"));
}

TEST_F(ClientTest, FailedDownloadKeepsExistingLocalFile) {
  ScriptedServer server([](network::Connection& connection) {
    accept_login(connection);
    connection.read_message();
    connection.send_message(CommandCodec::encode(Response::error("File not found")));
    connection.read_message();
  });

  client::Client client;
  client.connect("127.0.0.1", server.port());
  client.authenticate("alice", "pw123");

  fs::path local_path = temp_dir_.path() / "notes.txt";
  test::write_file(local_path, "keep me");
  auto response = client.download("notes.txt", local_path);
  EXPECT_FALSE(response.is_success());
  EXPECT_EQ(response.message, "File not found");
  EXPECT_EQ(test::read_file(local_path), "keep me");
  EXPECT_FALSE(fs::exists(temp_dir_.path() / "notes.txt.part"));
  client.exit();
}

TEST_F(ClientTest, ShutdownResponseToCommandThrows) {
  ScriptedServer server([](network::Connection& connection) {
    accept_login(connection);
    connection.read_message();
    connection.send_message(CommandCodec::encode(Response::shutdown("Server is shutting down")));
  });

  client::Client client;
  client.connect("127.0.0.1", server.port());
  client.authenticate("alice", "pw123");

  EXPECT_THROW(client.list(), network::ShutdownInProgress);
  EXPECT_FALSE(client.is_connected());
}

TEST_F(ClientTest, ShutdownDuringDownloadRemovesPartialFile) {
  ScriptedServer server([](network::Connection& connection) {
    accept_login(connection);
    connection.read_message();
    connection.send_message(CommandCodec::encode(Response::success("Starting transfer")));
    connection.write_frame(Frame{FrameType::CHUNK, "partial"});
    connection.send_message(CommandCodec::encode(Response::shutdown("Server is shutting down")));
  });

  client::Client client;
  client.connect("127.0.0.1", server.port());
  client.authenticate("alice", "pw123");

  fs::path local_path = temp_dir_.path() / "big.bin";
  EXPECT_THROW(client.download("big.bin", local_path), network::ShutdownInProgress);
  EXPECT_FALSE(fs::exists(local_path));
}

TEST_F(ClientTest, PollWithoutNoticeReturns) {
  ScriptedServer server([](network::Connection& connection) {
    accept_login(connection);
    connection.read_message();
  });

  client::Client client;
  client.connect("127.0.0.1", server.port());
  client.authenticate("alice", "pw123");

  EXPECT_NO_THROW(client.poll_shutdown(std::chrono::milliseconds(20)));
  EXPECT_TRUE(client.is_connected());
  client.exit();
}

TEST_F(ClientTest, UploadOfMissingLocalFileSendsNothing) {
  std::string next_record;
  {
    ScriptedServer server([&](network::Connection& connection) {
      accept_login(connection);
      next_record = connection.read_message();
    });

    client::Client client;
    client.connect("127.0.0.1", server.port());
    client.authenticate("alice", "pw123");

    EXPECT_THROW(client.upload(temp_dir_.path() / "absent.txt", "absent.txt"), network::NotFound);
    client.exit();
  }

  EXPECT_EQ(CommandCodec::decode_command(next_record).action, protocol::Action::EXIT);
}

TEST_F(ClientTest, ExitSendsExitCommand) {
  std::string record;
  {
    ScriptedServer server([&](network::Connection& connection) {
      accept_login(connection);
      record = connection.read_message();
    });

    client::Client client;
    client.connect("127.0.0.1", server.port());
    client.authenticate("alice", "pw123");
    client.exit();
    EXPECT_FALSE(client.is_connected());
    // Exiting twice is harmless
    client.exit();
  }

  EXPECT_EQ(CommandCodec::decode_command(record).action, protocol::Action::EXIT);
}

TEST_F(ClientTest, InterruptFromAnotherThreadSendsExit) {
  std::string pending;
  std::string record;
  {
    ScriptedServer server([&](network::Connection& connection) {
      accept_login(connection);
      // Leave the command unanswered so the client stays blocked
      pending = connection.read_message();
      record = connection.read_message();
    });

    client::Client client;
    client.connect("127.0.0.1", server.port());
    client.authenticate("alice", "pw123");

    std::thread interrupter([&client]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      client.interrupt();
    });
    EXPECT_THROW(client.list(), network::ConnectionClosed);
    interrupter.join();

    EXPECT_FALSE(client.is_connected());
    // Nothing left to interrupt
    client.interrupt();
  }

  EXPECT_EQ(CommandCodec::decode_command(pending).action, protocol::Action::LIST);
  EXPECT_EQ(CommandCodec::decode_command(record).action, protocol::Action::EXIT);
}

TEST_F(ClientTest, CommandsWithoutConnectionThrow) {
  client::Client client;
  EXPECT_THROW(client.list(), network::ConnectionClosed);
}
