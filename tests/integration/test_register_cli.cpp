#include "test_fixture.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using json = nlohmann::json;

namespace fs = std::filesystem;

class RegisterCliTest : public IntegrationTestFixture {
protected:
    static constexpr const char* TOOL = KEYREG_REGISTER_TOOL;

    void SetUp() override {
        IntegrationTestFixture::SetUp();
        ASSERT_TRUE(fs::exists(TOOL)) << "Register tool not built: " << TOOL;
        dir_ = fs::temp_directory_path() / ("keyreg_cli_test_" + std::to_string(getpid()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
        IntegrationTestFixture::TearDown();
    }

    std::string write_file(const std::string& name, const std::string& content) {
        fs::path path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    fs::path dir_;
};

TEST_F(RegisterCliTest, RegistersFromFlags) {
    server_->respond_with(200, "");

    auto result = run_command({TOOL, "--port=" + std::to_string(port_), "--name=alice", "--key=abc"});

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "registered alice\n");

    auto requests = server_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(json::parse(requests[0].body), json::parse(R"({"name": "alice", "key": "abc"})"));
}

TEST_F(RegisterCliTest, RejectionPrintsDiagnosticAndExitsNormally) {
    server_->respond_with(400, R"({"error": "bad key"})");

    auto result = run_command({TOOL, "--port=" + std::to_string(port_), "--name=alice", "--key=abc"});

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "{\"error\":\"bad key\"}\n");
}

TEST_F(RegisterCliTest, RejectionPrintsRawText) {
    server_->respond_with(500, "internal error", "text/plain");

    auto result = run_command({TOOL, "--port=" + std::to_string(port_), "--name=alice", "--key=abc"});

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "internal error\n");
}

TEST_F(RegisterCliTest, RejectionWithOverflowingNumberPrintsRawText) {
    server_->respond_with(400, R"({"error": 1e999})");

    auto result = run_command({TOOL, "--port=" + std::to_string(port_), "--name=alice", "--key=abc"});

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "{\"error\": 1e999}\n");
}

TEST_F(RegisterCliTest, TransportFailureExitsWithError) {
    auto result = run_command({TOOL, "--port=" + std::to_string(unused_port()),
                               "--name=alice", "--key=abc"});

    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(result.output.empty());
}

TEST_F(RegisterCliTest, ReadsConfigFileAndKeyFile) {
    server_->respond_with(201, "");
    std::string key_file = write_file("bob.pub", "ssh-ed25519 AAAAC3 bob@host\n");
    std::string config = write_file("client.yaml",
        "port: " + std::to_string(port_) + "\nname: bob\nkey_file: " + key_file + "\n");

    auto result = run_command({TOOL, "--config=" + config});

    EXPECT_EQ(result.exit_code, 0);
    auto requests = server_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(json::parse(requests[0].body),
              json::parse(R"({"name": "bob", "key": "ssh-ed25519 AAAAC3 bob@host"})"));
}

TEST_F(RegisterCliTest, FlagsOverrideConfigFile) {
    server_->respond_with(200, "");
    std::string config = write_file("client.yaml", "port: 1\nname: bob\nkey: old\n");

    auto result = run_command({TOOL, "--config=" + config, "--port=" + std::to_string(port_),
                               "--key=new"});

    EXPECT_EQ(result.exit_code, 0);
    auto requests = server_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(json::parse(requests[0].body), json::parse(R"({"name": "bob", "key": "new"})"));
}

TEST_F(RegisterCliTest, MissingArgumentsFail) {
    EXPECT_EQ(run_command({TOOL, "--name=alice", "--key=abc"}).exit_code, 1);
    EXPECT_EQ(run_command({TOOL, "--port=" + std::to_string(port_), "--key=abc"}).exit_code, 1);
    EXPECT_EQ(run_command({TOOL, "--port=" + std::to_string(port_), "--name=alice"}).exit_code, 1);
    EXPECT_EQ(run_command({TOOL, "--port=http", "--name=alice", "--key=abc"}).exit_code, 1);
    EXPECT_EQ(run_command({TOOL, "--bogus"}).exit_code, 1);

    EXPECT_TRUE(server_->requests().empty());
}
