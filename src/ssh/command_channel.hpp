#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <core/credentials.hpp>
#include <core/types.hpp>

namespace fs = std::filesystem;

class SessionManager;

// Run-to-completion, detached and upload primitives on one remote host.
// Operations are sequential: each opens, drains and releases its own
// sub-session before returning.
class CommandChannel {
public:
    virtual ~CommandChannel() = default;

    // Run cmdline, discarding output. See classify_exit for status mapping.
    virtual CommandResult run_command(const std::string& cmdline) = 0;

    // Run cmdline under a pseudo-terminal, capturing stdout and stderr in full.
    virtual CommandResult run_command_captured(const std::string& cmdline) = 0;

    // Launch cmdline so it outlives this connection. The status reflects only
    // whether the launching shell ran, never the detached command's result.
    virtual CommandResult run_detached(const std::string& cmdline, bool discard_output) = 0;

    // Stream into remote_path, overwriting it.
    virtual Result<void> upload_bytes(const std::string& payload,
                                      const std::string& remote_path) = 0;
    virtual Result<void> upload_file(const fs::path& local_path,
                                     const std::string& remote_path) = 0;

    // Drop the transport. No sub-session may be outstanding.
    virtual void close() = 0;
};

// Builds a verified-transport channel for one address. The controller takes
// one of these so tests can substitute a fake transport.
using ChannelFactory = std::function<Result<std::unique_ptr<CommandChannel>>(
    const std::string& address, const Credentials& credentials, StatusCallback callback)>;

// nohup bash -c '((cmdline) &)' [>/dev/null 2>&1]
std::string detached_command(const std::string& cmdline, bool discard_output);

// cat >'remote_path' with the path single-quote escaped
std::string upload_command(const std::string& remote_path);

// SourceInvalid unless local_path exists and is a regular file.
Result<void> check_upload_source(const fs::path& local_path);

class SSHCommandChannel : public CommandChannel {
public:
    // Parse the pinned host key (InvalidHostKey), validate credentials
    // (ConfigInvalid), then connect and authenticate (ConnectFailed).
    // The first two never touch the network.
    static Result<std::unique_ptr<CommandChannel>> open(const std::string& address,
                                                        const Credentials& credentials,
                                                        StatusCallback callback = nullptr);

    ~SSHCommandChannel() override;

    CommandResult run_command(const std::string& cmdline) override;
    CommandResult run_command_captured(const std::string& cmdline) override;
    CommandResult run_detached(const std::string& cmdline, bool discard_output) override;
    Result<void> upload_bytes(const std::string& payload,
                              const std::string& remote_path) override;
    Result<void> upload_file(const fs::path& local_path,
                             const std::string& remote_path) override;
    void close() override;

private:
    explicit SSHCommandChannel(std::unique_ptr<SessionManager> session);

    // Fills buf with up to cap bytes; returns bytes written, 0 at end, -1 on error.
    using ChunkSource = std::function<long(char* buf, size_t cap)>;

    CommandResult execute(const std::string& cmdline, bool capture);
    Result<void> stream_to_file(const std::string& remote_path, const ChunkSource& source);

    std::unique_ptr<SessionManager> session_;
};
