#include <gtest/gtest.h>
#include <ssh/command_channel.hpp>
#include <ssh/host_key.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fmt/format.h>

namespace {

std::string wire_string(const std::string& s) {
    std::string out;
    uint32_t len = static_cast<uint32_t>(s.size());
    out += static_cast<char>((len >> 24) & 0xFF);
    out += static_cast<char>((len >> 16) & 0xFF);
    out += static_cast<char>((len >> 8) & 0xFF);
    out += static_cast<char>(len & 0xFF);
    out += s;
    return out;
}

} // namespace

// Runs against a real SSH server. Set AWSRENDER_TEST_HOST, AWSRENDER_TEST_USER,
// AWSRENDER_TEST_KEY (private key path) and AWSRENDER_TEST_HOSTKEY
// ("ssh-ed25519 AAAA...") to enable.
class SshIntegrationTest : public ::testing::Test {
protected:
    std::string host;
    Credentials creds;
    std::unique_ptr<CommandChannel> channel;

    static std::string env(const char* name) {
        const char* v = std::getenv(name);
        return v ? v : "";
    }

    void SetUp() override {
        host = env("AWSRENDER_TEST_HOST");
        creds.username = env("AWSRENDER_TEST_USER");
        creds.private_key_path = env("AWSRENDER_TEST_KEY");
        creds.host_key = env("AWSRENDER_TEST_HOSTKEY");
        if (host.empty() || creds.username.empty() || creds.private_key_path.empty() ||
            creds.host_key.empty()) {
            GTEST_SKIP() << "AWSRENDER_TEST_* not set";
        }

        auto opened = SSHCommandChannel::open(host, creds);
        ASSERT_TRUE(opened.is_ok()) << opened.error;
        channel = std::move(opened.value);
    }

    void TearDown() override {
        if (channel) channel->close();
    }

    std::string captured(const std::string& cmd) {
        auto r = channel->run_command_captured(cmd);
        EXPECT_FALSE(r.transport_failed()) << r.error;
        return trimmed(r.stdout_data);
    }
};

TEST_F(SshIntegrationTest, ExitStatusIsReported) {
    EXPECT_EQ(channel->run_command("true").exit_status, 0);
    EXPECT_EQ(channel->run_command("exit 3").exit_status, 3);
}

TEST_F(SshIntegrationTest, KilledCommandReportsSentinelWithoutError) {
    auto r = channel->run_command("kill -9 $$");
    EXPECT_EQ(r.exit_status, STATUS_MISSING);
    EXPECT_FALSE(r.transport_failed());
}

TEST_F(SshIntegrationTest, CapturesOutput) {
    EXPECT_EQ(captured("echo hello"), "hello");
}

TEST_F(SshIntegrationTest, LargeBinaryUploadIsByteIdentical) {
    const size_t size = 10 * 1024 * 1024;
    std::string payload(size, '\0');
    for (size_t i = 0; i < size; i++) {
        payload[i] = static_cast<char>((i * 31 + i / 4096) & 0xFF);
    }
    size_t non_nul = size - static_cast<size_t>(std::count(payload.begin(), payload.end(), '\0'));

    const std::string path = "/tmp/awsrender-integration-upload.bin";
    auto up = channel->upload_bytes(payload, path);
    ASSERT_TRUE(up.is_ok()) << up.error;

    EXPECT_EQ(captured("wc -c < " + shell_quote(path)), std::to_string(size));
    EXPECT_EQ(captured("tr -d '\\000' < " + shell_quote(path) + " | wc -c"), std::to_string(non_nul));

    std::string tail_hex;
    for (size_t i = size - 8; i < size; i++) {
        tail_hex += fmt::format(" {:02x}", static_cast<unsigned char>(payload[i]));
    }
    EXPECT_EQ(captured("tail -c 8 " + shell_quote(path) + " | od -An -tx1"), trimmed(tail_hex));

    channel->run_command("rm -f " + shell_quote(path));
}

TEST_F(SshIntegrationTest, UploadToPathWithQuote) {
    const std::string path = "/tmp/awsrender it's here.txt";
    ASSERT_TRUE(channel->upload_bytes("quoted\n", path).is_ok());
    EXPECT_EQ(captured("cat " + shell_quote(path)), "quoted");
    channel->run_command("rm -f " + shell_quote(path));
}

TEST_F(SshIntegrationTest, UploadIntoMissingDirectoryFails) {
    auto r = channel->upload_bytes("x", "/nonexistent-awsrender-dir/file");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::CommandTransportFailure);
}

TEST_F(SshIntegrationTest, DetachedCommandOutlivesChannel) {
    const std::string marker = "/tmp/awsrender-detached-marker";
    channel->run_command("rm -f " + marker);

    auto r = channel->run_detached("sleep 2; touch " + marker, true);
    EXPECT_EQ(r.exit_status, 0);
    channel->close();
    channel.reset();

    platform::sleep_ms(5000);

    auto reopened = SSHCommandChannel::open(host, creds);
    ASSERT_TRUE(reopened.is_ok()) << reopened.error;
    channel = std::move(reopened.value);
    EXPECT_EQ(channel->run_command("test -f " + marker).exit_status, 0);
    channel->run_command("rm -f " + marker);
}

TEST_F(SshIntegrationTest, WrongHostKeyIsRejected) {
    auto key = parse_host_key(creds.host_key);
    ASSERT_TRUE(key.is_ok()) << key.error;

    // Same algorithm, different key material
    std::string blob = key.value.blob;
    blob.back() = static_cast<char>(blob.back() ^ 0x01);
    Credentials wrong = creds;
    wrong.host_key = key.value.type_name + " " + base64_encode(blob);

    auto r = SSHCommandChannel::open(host, wrong);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConnectFailed);
    EXPECT_NE(r.error.find("mismatch"), std::string::npos);
}

TEST_F(SshIntegrationTest, OtherAlgorithmKeyIsRejected) {
    auto key = parse_host_key(creds.host_key);
    ASSERT_TRUE(key.is_ok()) << key.error;

    // Well-formed key of a different supported type
    std::string other = key.value.type == HostKeyType::Ed25519 ? "ecdsa-sha2-nistp256"
                                                                : "ssh-ed25519";
    std::string blob = wire_string(other) + wire_string(std::string(32, 'k'));
    Credentials wrong = creds;
    wrong.host_key = other + " " + base64_encode(blob);
    ASSERT_TRUE(parse_host_key(wrong.host_key).is_ok());

    auto r = SSHCommandChannel::open(host, wrong);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConnectFailed);
}

TEST_F(SshIntegrationTest, ClosedChannelReportsSentinelWithError) {
    channel->close();

    auto r = channel->run_command("true");
    EXPECT_EQ(r.exit_status, STATUS_COMMAND_FAILED);
    EXPECT_TRUE(r.transport_failed());

    auto c = channel->run_command_captured("echo hello");
    EXPECT_EQ(c.exit_status, STATUS_COMMAND_FAILED);
    EXPECT_TRUE(c.transport_failed());
    EXPECT_TRUE(c.stdout_data.empty());

    auto up = channel->upload_bytes("x", "/tmp/awsrender-closed-channel");
    ASSERT_TRUE(up.is_err());
    EXPECT_EQ(up.kind, ErrorKind::CommandTransportFailure);
}

TEST_F(SshIntegrationTest, UploadAfterKeepaliveIntervalIsByteIdentical) {
    // Idle past the interval so a keepalive is due when the upload starts
    platform::sleep_ms((SSH_KEEPALIVE_SECS + 2) * 1000);

    const size_t size = 4 * 1024 * 1024;
    std::string payload(size, '\0');
    for (size_t i = 0; i < size; i++) {
        payload[i] = static_cast<char>((i * 7 + i / 1000) & 0xFF);
    }

    const std::string path = "/tmp/awsrender-keepalive-upload.bin";
    auto up = channel->upload_bytes(payload, path);
    ASSERT_TRUE(up.is_ok()) << up.error;
    EXPECT_EQ(captured("wc -c < " + shell_quote(path)), std::to_string(size));

    std::string tail_hex;
    for (size_t i = size - 8; i < size; i++) {
        tail_hex += fmt::format(" {:02x}", static_cast<unsigned char>(payload[i]));
    }
    EXPECT_EQ(captured("tail -c 8 " + shell_quote(path) + " | od -An -tx1"), trimmed(tail_hex));
    channel->run_command("rm -f " + shell_quote(path));
}
