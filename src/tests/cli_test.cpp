#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <sstream>
#include <thread>
#include "auth/credential_store.hpp"
#include "cli/cli.hpp"
#include "server/server.hpp"
#include "test_utils.hpp"

using namespace vault;
using ::testing::HasSubstr;
using ::testing::Not;
namespace fs = std::filesystem;

class CLITest : public ::testing::Test {
protected:
  test::TempDirectory temp_dir_{"vault_cli"};
  std::unique_ptr<auth::FileCredentialStore> credentials_;
  std::unique_ptr<server::Server> server_;
  client::Client client_;

  void SetUp() override {
    test::init_logging(boost::log::trivial::error);

    fs::path credentials_file = temp_dir_.path() / "id_passwd.txt";
    test::write_file(credentials_file, "alice:pw123\n");
    credentials_ = std::make_unique<auth::FileCredentialStore>(credentials_file.string());

    server::ServerConfig config;
    config.address = "127.0.0.1";
    config.port = 0;
    config.storage_root = (temp_dir_.path() / "server_storage").string();
    config.grace_period = std::chrono::milliseconds(50);
    config.transfer_start_delay = std::chrono::milliseconds(0);
    server_ = std::make_unique<server::Server>(config, *credentials_);
    ASSERT_TRUE(server_->start_listener());

    client_.connect("127.0.0.1", server_->port());
    client_.authenticate("alice", "pw123");
  }

  void TearDown() override {
    client_.close();
    server_->shutdown();
  }

  std::string run_script(const std::string& script) {
    std::istringstream in(script);
    std::ostringstream out;
    cli::CLI cli(client_, in, out, std::chrono::milliseconds(10));
    cli.run();
    return out.str();
  }
};

TEST_F(CLITest, ShowsMenuAndExits) {
  std::string output = run_script("6\n");

  EXPECT_THAT(output, HasSubstr("1. Upload file"));
  EXPECT_THAT(output, HasSubstr("6. Exit"));
  EXPECT_THAT(output, HasSubstr("[CLIENT SHUTDOWN] Exiting..."));
  EXPECT_FALSE(client_.is_connected());
}

TEST_F(CLITest, InvalidChoiceIsReprompted) {
  std::string output = run_script("9\nupload\n5\n6\n");

  EXPECT_THAT(output, HasSubstr("Invalid input. Please choose from 1, 2, 3, 4, 5, 6"));
  EXPECT_THAT(output, HasSubstr("Your files:"));
}

TEST_F(CLITest, UploadStoresUnderBasenameThenLists) {
  fs::path local = temp_dir_.path() / "local" / "notes.txt";
  fs::create_directories(local.parent_path());
  test::write_file(local, "hello world");

  std::string output = run_script("1\n" + local.string() + "\n5\n3\nnotes.txt\n6\n");

  EXPECT_THAT(output, HasSubstr("uploaded successfully"));
  EXPECT_THAT(output, HasSubstr("- notes.txt"));
  EXPECT_THAT(output, HasSubstr("File preview:"));
  EXPECT_THAT(output, HasSubstr("hello world"));
  EXPECT_EQ(test::read_file(server_->get_store().base_path() / "alice" / "notes.txt"), "hello world");
}

TEST_F(CLITest, MissingLocalFileIsReportedWithoutContactingServer) {
  std::string output = run_script("1\n" + (temp_dir_.path() / "absent.txt").string() + "\n5\n6\n");

  EXPECT_THAT(output, HasSubstr("File does not exist!"));
  EXPECT_THAT(output, Not(HasSubstr("- absent.txt")));
}

TEST_F(CLITest, DeleteReportsServerMessage) {
  std::string output = run_script("4\nghost.txt\n6\n");
  EXPECT_THAT(output, HasSubstr("File not found"));
}

TEST_F(CLITest, EndOfInputExitsCleanly) {
  std::string output = run_script("");
  EXPECT_THAT(output, HasSubstr("[CLIENT SHUTDOWN] Exiting..."));
  EXPECT_FALSE(client_.is_connected());
}

TEST_F(CLITest, ServerShutdownEndsLoop) {
  std::thread stopper([this]() { server_->shutdown(); });
  // Keeps listing until the notice arrives
  std::string script;
  for (int i = 0; i < 200; ++i) {
    script += "5\n";
  }
  std::string output = run_script(script);
  stopper.join();

  EXPECT_THAT(output, HasSubstr("[SERVER SHUTDOWN]"));
  EXPECT_FALSE(client_.is_connected());
}
