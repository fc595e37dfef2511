#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <sstream>
#include <thread>
#include "mock_credential_store.hpp"
#include "network/protocol_error.hpp"
#include "protocol/command_codec.hpp"
#include "server/session.hpp"
#include "transfer/transfer_framer.hpp"
#include "test_utils.hpp"

using namespace vault::server;
using namespace vault::protocol;
using vault::network::ConnectionClosed;
using vault::network::Frame;
using vault::network::FrameType;
using vault::transfer::TransferFramer;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
namespace fs = std::filesystem;

class SessionTest : public ::testing::Test {
protected:
  static constexpr SessionId SESSION_ID = 1;

  boost::asio::io_context io_context_;
  vault::test::TempDirectory temp_dir_{"vault_session"};
  NiceMock<vault::test::MockCredentialStore> credentials_;
  std::unique_ptr<vault::storage::UserStore> store_;
  SessionRegistry registry_;
  std::shared_ptr<CancellationToken> cancellation_ = std::make_shared<CancellationToken>();
  vault::test::ConnectionPair pair_;
  std::unique_ptr<Session> session_;
  std::thread session_thread_;

  void SetUp() override {
    vault::test::init_logging(boost::log::trivial::error);
    store_ = std::make_unique<vault::storage::UserStore>((temp_dir_.path() / "server_storage").string());
    pair_ = vault::test::make_connection_pair(io_context_);
    ON_CALL(credentials_, verify(_, _)).WillByDefault(Return(false));
    ON_CALL(credentials_, verify("alice", "pw123")).WillByDefault(Return(true));
  }

  void TearDown() override {
    pair_.client->close();
    if (session_thread_.joinable()) {
      session_thread_.join();
    }
  }

  void start_session() {
    registry_.add(SESSION_ID, pair_.server);
    Session::Options options;
    options.transfer_start_delay = std::chrono::milliseconds(0);
    session_ = std::make_unique<Session>(SESSION_ID, pair_.server, credentials_, *store_, registry_,
                                         cancellation_, options);
    session_thread_ = std::thread([this]() { session_->run(); });
  }

  void finish_session() {
    session_thread_.join();
  }

  void login(const std::string& username = "alice", const std::string& password = "pw123") {
    start_session();
    pair_.client->send_message(HELLO_TOKEN);
    ASSERT_EQ(pair_.client->read_message(), ACK_TOKEN);
    pair_.client->send_message(CommandCodec::encode(Credentials{username, password}));
    Response response = read_response();
    ASSERT_TRUE(response.is_success()) << response.message;
  }

  Response read_response() {
    return CommandCodec::decode_response(pair_.client->read_message());
  }

  Response send(const Command& command) {
    pair_.client->send_message(CommandCodec::encode(command));
    return read_response();
  }

  fs::path alice_file(const std::string& name) {
    return store_->base_path() / "alice" / name;
  }
};

TEST_F(SessionTest, WrongGreetingIsRejected) {
  start_session();
  pair_.client->send_message("HI");

  EXPECT_EQ(pair_.client->read_message(), REJECT_TOKEN);
  EXPECT_THROW(pair_.client->read_frame(), ConnectionClosed);
  finish_session();
  EXPECT_EQ(session_->state(), SessionState::State::TERMINATED);
  EXPECT_FALSE(registry_.contains(SESSION_ID));
}

TEST_F(SessionTest, NonMessageGreetingIsRejected) {
  start_session();
  pair_.client->write_frame(Frame{FrameType::CHUNK, HELLO_TOKEN});

  EXPECT_EQ(pair_.client->read_message(), REJECT_TOKEN);
  finish_session();
  EXPECT_EQ(session_->state(), SessionState::State::TERMINATED);
}

TEST_F(SessionTest, WrongPasswordEndsSession) {
  EXPECT_CALL(credentials_, verify("alice", "wrong")).WillOnce(Return(false));
  start_session();
  pair_.client->send_message(HELLO_TOKEN);
  ASSERT_EQ(pair_.client->read_message(), ACK_TOKEN);
  pair_.client->send_message(CommandCodec::encode(Credentials{"alice", "wrong"}));

  Response response = read_response();
  EXPECT_FALSE(response.is_success());
  EXPECT_EQ(response.message, "Authentication failed");
  EXPECT_THROW(pair_.client->read_frame(), ConnectionClosed);
  finish_session();
  EXPECT_FALSE(fs::exists(store_->base_path() / "alice"));
}

TEST_F(SessionTest, MalformedCredentialsEndSession) {
  EXPECT_CALL(credentials_, verify(_, _)).Times(0);
  start_session();
  pair_.client->send_message(HELLO_TOKEN);
  ASSERT_EQ(pair_.client->read_message(), ACK_TOKEN);
  pair_.client->send_message("alice:pw123");

  EXPECT_EQ(read_response().message, "Authentication failed");
  EXPECT_THROW(pair_.client->read_frame(), ConnectionClosed);
  finish_session();
}

TEST_F(SessionTest, UsernameThatEscapesStorageIsRefused) {
  // Credentials may be valid yet unusable as a directory name
  ON_CALL(credentials_, verify("..", "pw")).WillByDefault(Return(true));
  start_session();
  pair_.client->send_message(HELLO_TOKEN);
  ASSERT_EQ(pair_.client->read_message(), ACK_TOKEN);
  pair_.client->send_message(CommandCodec::encode(Credentials{"..", "pw"}));

  EXPECT_EQ(read_response().message, "Authentication failed");
  finish_session();
}

TEST_F(SessionTest, SuccessfulLoginCreatesSandbox) {
  login();
  EXPECT_TRUE(fs::is_directory(store_->base_path() / "alice"));
  pair_.client->send_message(CommandCodec::encode(Command{Action::EXIT, std::nullopt}));
  finish_session();
  EXPECT_EQ(session_->username(), "alice");
}

TEST_F(SessionTest, UploadThenPreviewListDownloadDelete) {
  login();

  Response ready = send(Command{Action::UPLOAD, std::string("notes.txt")});
  ASSERT_TRUE(ready.is_success());
  EXPECT_EQ(ready.message, "Ready to receive");

  TransferFramer framer;
  std::istringstream body("hello world");
  framer.send_stream(*pair_.client, body);
  Response uploaded = read_response();
  EXPECT_TRUE(uploaded.is_success());
  EXPECT_EQ(uploaded.message, "File notes.txt uploaded successfully");
  EXPECT_EQ(uploaded.size, 11u);
  EXPECT_EQ(vault::test::read_file(alice_file("notes.txt")), "hello world");

  Response preview = send(Command{Action::PREVIEW, std::string("notes.txt")});
  EXPECT_TRUE(preview.is_success());
  EXPECT_EQ(preview.preview, "hello world");

  Response listing = send(Command{Action::LIST, std::nullopt});
  ASSERT_TRUE(listing.files.has_value());
  EXPECT_EQ(*listing.files, std::vector<std::string>{"notes.txt"});

  Response starting = send(Command{Action::DOWNLOAD, std::string("notes.txt")});
  EXPECT_TRUE(starting.is_success());
  EXPECT_EQ(starting.size, 11u);
  std::ostringstream downloaded;
  EXPECT_EQ(framer.receive_stream(*pair_.client, downloaded), 11u);
  EXPECT_EQ(downloaded.str(), "hello world");

  Response deleted = send(Command{Action::DELETE, std::string("notes.txt")});
  EXPECT_EQ(deleted.message, "File notes.txt deleted successfully");
  EXPECT_FALSE(fs::exists(alice_file("notes.txt")));

  pair_.client->send_message(CommandCodec::encode(Command{Action::EXIT, std::nullopt}));
  EXPECT_THROW(pair_.client->read_frame(), ConnectionClosed);
  finish_session();
  EXPECT_FALSE(registry_.contains(SESSION_ID));
}

TEST_F(SessionTest, InvalidCommandKeepsSessionOpen) {
  login();

  EXPECT_EQ(send(Command{Action::UNKNOWN, std::nullopt}).message, "Invalid command");
  pair_.client->send_message(R"({"action":"rename","filename":"a.txt"})");
  EXPECT_EQ(read_response().message, "Invalid command");
  EXPECT_EQ(send(Command{Action::DELETE, std::nullopt}).message, "Invalid command");

  Response listing = send(Command{Action::LIST, std::nullopt});
  EXPECT_TRUE(listing.is_success());
  EXPECT_EQ(listing.message, "0 file(s)");
}

TEST_F(SessionTest, MissingFilesReportNotFound) {
  login();
  EXPECT_EQ(send(Command{Action::DOWNLOAD, std::string("ghost.txt")}).message, "File not found");
  EXPECT_EQ(send(Command{Action::PREVIEW, std::string("ghost.txt")}).message, "File not found");
  EXPECT_EQ(send(Command{Action::DELETE, std::string("ghost.txt")}).message, "File not found");
}

TEST_F(SessionTest, TraversalIsRejectedAndNothingIsWritten) {
  login();

  EXPECT_EQ(send(Command{Action::DOWNLOAD, std::string("../../etc/passwd")}).message, "Invalid filename");
  EXPECT_EQ(send(Command{Action::UPLOAD, std::string("../bob/evil.txt")}).message, "Invalid filename");
  EXPECT_EQ(send(Command{Action::UPLOAD, std::string("/tmp/evil.txt")}).message, "Invalid filename");
  EXPECT_FALSE(fs::exists(store_->base_path() / "bob"));

  EXPECT_TRUE(send(Command{Action::LIST, std::nullopt}).is_success());
}

TEST_F(SessionTest, AbortedUploadLeavesNoFile) {
  login();

  ASSERT_TRUE(send(Command{Action::UPLOAD, std::string("partial.bin")}).is_success());
  pair_.client->write_frame(Frame{FrameType::CHUNK, "first half"});
  pair_.client->write_frame(Frame{FrameType::ABORT, "source read failed"});

  Response response = read_response();
  EXPECT_FALSE(response.is_success());
  EXPECT_THAT(response.message, ::testing::StartsWith("Upload failed"));
  finish_session();
  EXPECT_FALSE(fs::exists(alice_file("partial.bin")));
}

TEST_F(SessionTest, AbortedReuploadKeepsStoredCopy) {
  login();
  vault::test::write_file(alice_file("notes.txt"), "original");

  ASSERT_TRUE(send(Command{Action::UPLOAD, std::string("notes.txt")}).is_success());
  pair_.client->write_frame(Frame{FrameType::CHUNK, "replace"});
  pair_.client->write_frame(Frame{FrameType::ABORT, "source read failed"});

  EXPECT_FALSE(read_response().is_success());
  finish_session();
  EXPECT_EQ(vault::test::read_file(alice_file("notes.txt")), "original");
  EXPECT_EQ(store_->list(store_->base_path() / "alice"), std::vector<std::string>{"notes.txt"});
  EXPECT_FALSE(fs::exists(alice_file(".notes.txt.part")));
}

TEST_F(SessionTest, ReuploadReplacesStoredCopy) {
  login();
  vault::test::write_file(alice_file("notes.txt"), "original");

  ASSERT_TRUE(send(Command{Action::UPLOAD, std::string("notes.txt")}).is_success());
  TransferFramer framer;
  std::istringstream body("replacement");
  framer.send_stream(*pair_.client, body);
  EXPECT_TRUE(read_response().is_success());

  EXPECT_EQ(vault::test::read_file(alice_file("notes.txt")), "replacement");
  EXPECT_FALSE(fs::exists(alice_file(".notes.txt.part")));
}

TEST_F(SessionTest, DisconnectMidUploadLeavesNoFile) {
  login();

  ASSERT_TRUE(send(Command{Action::UPLOAD, std::string("partial.bin")}).is_success());
  pair_.client->write_frame(Frame{FrameType::CHUNK, "first half"});
  pair_.client->close();

  finish_session();
  EXPECT_EQ(session_->state(), SessionState::State::TERMINATED);
  EXPECT_FALSE(fs::exists(alice_file("partial.bin")));
}

TEST_F(SessionTest, MalformedCommandEndsSession) {
  login();
  pair_.client->send_message("{not json");

  EXPECT_THROW(pair_.client->read_frame(), ConnectionClosed);
  finish_session();
}

TEST_F(SessionTest, PipelinedCommandsAreAnsweredInOrder) {
  login();
  vault::test::write_file(alice_file("a.txt"), "A");

  // Both commands in flight before either response is read
  pair_.client->send_message(CommandCodec::encode(Command{Action::LIST, std::nullopt}));
  pair_.client->send_message(CommandCodec::encode(Command{Action::PREVIEW, std::string("a.txt")}));

  Response listing = read_response();
  Response preview = read_response();
  ASSERT_TRUE(listing.files.has_value());
  EXPECT_EQ(*listing.files, std::vector<std::string>{"a.txt"});
  EXPECT_EQ(preview.preview, "A");
}

TEST_F(SessionTest, CancelledSessionDoesNotHandshake) {
  cancellation_->cancel();
  start_session();
  finish_session();

  EXPECT_THROW(pair_.client->read_frame(), ConnectionClosed);
  EXPECT_EQ(session_->state(), SessionState::State::TERMINATED);
}
