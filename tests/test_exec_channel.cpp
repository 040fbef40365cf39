#include <gtest/gtest.h>
#include <ssh/command_channel.hpp>
#include <ssh/exec_channel.hpp>
#include <ssh/session.hpp>
#include <core/constants.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

// ── Exit status mapping ──────────────────────────────────────

TEST(ClassifyExit, ExitCodeIsReported) {
    ExitInfo info;
    info.exit_code_reported = true;
    info.exit_code = 7;
    auto r = classify_exit("", info);
    EXPECT_EQ(r.exit_status, 7);
    EXPECT_FALSE(r.transport_failed());
}

TEST(ClassifyExit, ZeroIsSuccess) {
    ExitInfo info;
    info.exit_code_reported = true;
    auto r = classify_exit("", info);
    EXPECT_EQ(r.exit_status, 0);
    EXPECT_TRUE(r.success());
}

TEST(ClassifyExit, KilledBySignalHasSentinelAndNoError) {
    ExitInfo info;
    info.exit_signal = "KILL";
    auto r = classify_exit("", info);
    EXPECT_EQ(r.exit_status, STATUS_MISSING);
    EXPECT_FALSE(r.transport_failed());
    EXPECT_TRUE(r.failed());
}

TEST(ClassifyExit, TransportFailureCarriesError) {
    ExitInfo info;
    info.exit_code_reported = true;
    info.exit_code = 0;
    auto r = classify_exit("unable to create session on host: closed", info);
    EXPECT_EQ(r.exit_status, STATUS_COMMAND_FAILED);
    EXPECT_TRUE(r.transport_failed());
    EXPECT_EQ(r.error, "unable to create session on host: closed");
}

// ── Command builders ─────────────────────────────────────────

TEST(DetachedCommand, DiscardingOutput) {
    EXPECT_EQ(detached_command("/home/u/tmp.x/run.sh", true),
              "nohup bash -c '((/home/u/tmp.x/run.sh) &)' >/dev/null 2>&1");
}

TEST(DetachedCommand, KeepingOutput) {
    EXPECT_EQ(detached_command("sleep 60", false),
              "nohup bash -c '((sleep 60) &)' ");
}

TEST(DetachedCommand, QuotedCommandSurvivesWrapping) {
    EXPECT_EQ(detached_command("echo 'hi'", true),
              "nohup bash -c '((echo '\\''hi'\\'') &)' >/dev/null 2>&1");
}

TEST(UploadCommand, QuotesPath) {
    EXPECT_EQ(upload_command("/tmp/out.stl"), "cat >'/tmp/out.stl'");
    EXPECT_EQ(upload_command("/tmp/it's.scad"), "cat >'/tmp/it'\\''s.scad'");
}

// ── Upload source checks ─────────────────────────────────────

class UploadSourceTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "awsrender_upload_source_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(UploadSourceTest, RegularFileAccepted) {
    std::ofstream(test_dir / "model.scad") << "cube(10);";
    EXPECT_TRUE(check_upload_source(test_dir / "model.scad").is_ok());
}

TEST_F(UploadSourceTest, MissingFileRejected) {
    auto r = check_upload_source(test_dir / "absent.scad");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::SourceInvalid);
}

TEST_F(UploadSourceTest, DirectoryRejected) {
    auto r = check_upload_source(test_dir);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::SourceInvalid);
    EXPECT_NE(r.error.find("regular file"), std::string::npos);
}

// ── Channel construction without network ────────────────────

TEST_F(UploadSourceTest, OpenRejectsEmptyAddress) {
    Credentials creds{"ssh-ed25519 AAAA", "ec2-user", (test_dir / "key").string()};
    auto r = SSHCommandChannel::open("", creds);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::AddressUnresolved);
}

TEST_F(UploadSourceTest, OpenRejectsMalformedHostKeyBeforeConnecting) {
    std::ofstream(test_dir / "key") << "not really a key";
    Credentials creds{"ssh-ed25519", "ec2-user", (test_dir / "key").string()};
    // 192.0.2.0/24 is reserved for documentation; nothing may be contacted
    auto r = SSHCommandChannel::open("192.0.2.1", creds);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidHostKey);
}

TEST_F(UploadSourceTest, OpenRejectsMissingKeyFileBeforeConnecting) {
    std::string blob_b64 = "AAAAC3NzaC1lZDI1NTE5";   // just the "ssh-ed25519" type field
    Credentials creds{"ssh-ed25519 " + blob_b64, "ec2-user", (test_dir / "absent").string()};
    auto r = SSHCommandChannel::open("192.0.2.1", creds);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConfigInvalid);
}

// ── Sub-sessions on a transport that is not connected ───────

static SessionTarget unconnected_target() {
    SessionTarget target;
    target.address = "192.0.2.1";
    target.user = "ec2-user";
    target.host_key.type = HostKeyType::Ed25519;
    target.host_key.type_name = "ssh-ed25519";
    return target;
}

TEST(ExecChannelOffline, OpenFailsWithTransportError) {
    SessionManager session(unconnected_target());
    ExecChannel ch(session);
    auto r = ch.open();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::CommandTransportFailure);

    ch.release();
    EXPECT_TRUE(ch.released());
}

TEST(ExecChannelOffline, ClosedTransportReportsSentinelWithError) {
    SessionManager session(unconnected_target());
    session.close();
    session.close();
    EXPECT_FALSE(session.is_active());
    EXPECT_FALSE(session.send_keepalive());
    EXPECT_FALSE(session.wait_socket(0));

    ExecChannel ch(session);
    auto opened = ch.open();
    ASSERT_TRUE(opened.is_err());

    auto r = classify_exit(opened.error, ExitInfo{});
    EXPECT_EQ(r.exit_status, STATUS_COMMAND_FAILED);
    EXPECT_TRUE(r.transport_failed());
    EXPECT_NE(r.error.find("connection is closed"), std::string::npos);
}
