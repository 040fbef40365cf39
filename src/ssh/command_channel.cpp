#include "command_channel.hpp"
#include "exec_channel.hpp"
#include "host_key.hpp"
#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <vector>

// ── Command builders ─────────────────────────────────────────

std::string detached_command(const std::string& cmdline, bool discard_output) {
    // Double parentheses: the inner subshell is backgrounded from a subshell
    // that exits at once, so the command is reparented away from the session.
    std::string cmd = "nohup bash -c " + shell_quote("((" + cmdline + ") &)") + " ";
    if (discard_output) {
        cmd += ">/dev/null 2>&1";
    }
    return cmd;
}

std::string upload_command(const std::string& remote_path) {
    return "cat >" + shell_quote(remote_path);
}

Result<void> check_upload_source(const fs::path& local_path) {
    std::error_code ec;
    auto status = fs::status(local_path, ec);
    if (ec || !fs::exists(status)) {
        return Result<void>::Err(ErrorKind::SourceInvalid,
            fmt::format("Error statting source file {}: {}", local_path.string(),
                        ec ? ec.message() : "no such file"));
    }
    if (!fs::is_regular_file(status)) {
        return Result<void>::Err(ErrorKind::SourceInvalid,
            fmt::format("Source file {} must be a regular file", local_path.string()));
    }
    return Result<void>::Ok();
}

// ── SSHCommandChannel ────────────────────────────────────────

Result<std::unique_ptr<CommandChannel>> SSHCommandChannel::open(
        const std::string& address, const Credentials& credentials, StatusCallback callback) {
    using ChannelResult = Result<std::unique_ptr<CommandChannel>>;

    if (address.empty()) {
        return ChannelResult::Err(ErrorKind::AddressUnresolved,
                                  "cannot open a channel without an address");
    }

    auto key = parse_host_key(credentials.host_key);
    if (key.is_err()) {
        return ChannelResult::Err(key.kind, "Error parsing host key: " + key.error);
    }

    auto valid = credentials.validate();
    if (valid.is_err()) {
        return ChannelResult::Err(valid.kind, valid.error);
    }

    SessionTarget target;
    target.address = address;
    target.user = credentials.username;
    target.private_key_path = credentials.private_key_path;
    target.host_key = key.value;

    auto session = std::make_unique<SessionManager>(target);
    auto established = session->establish(callback);
    if (established.is_err()) {
        return ChannelResult::Err(ErrorKind::ConnectFailed,
                                  "unable to connect to SSH server: " + established.error);
    }

    return ChannelResult::Ok(
        std::unique_ptr<CommandChannel>(new SSHCommandChannel(std::move(session))));
}

SSHCommandChannel::SSHCommandChannel(std::unique_ptr<SessionManager> session)
    : session_(std::move(session)) {
}

SSHCommandChannel::~SSHCommandChannel() {
    close();
}

void SSHCommandChannel::close() {
    if (session_) {
        session_->close();
    }
}

CommandResult SSHCommandChannel::execute(const std::string& cmdline, bool capture) {
    ExecChannel ch(*session_);
    std::string out;
    std::string err;

    auto step = ch.open();
    if (step.is_ok()) step = ch.request_pty();
    if (step.is_ok()) step = ch.exec(cmdline);
    if (step.is_ok()) step = ch.drain(capture ? &out : nullptr, capture ? &err : nullptr);

    ExitInfo info;
    if (step.is_ok()) {
        auto finished = ch.finish();
        if (finished.is_ok()) {
            info = finished.value;
        } else {
            step = Result<void>::Err(finished.kind, finished.error);
        }
    }
    ch.release();

    CommandResult result = classify_exit(step.is_ok() ? "" : step.error, info);
    result.stdout_data = std::move(out);
    result.stderr_data = std::move(err);
    if (!info.exit_signal.empty()) {
        app_log(fmt::format("command terminated by signal {}: {}", info.exit_signal, cmdline));
    }
    app_log_cmd(capture ? "run_captured" : "run", cmdline, result);
    return result;
}

CommandResult SSHCommandChannel::run_command(const std::string& cmdline) {
    return execute(cmdline, false);
}

CommandResult SSHCommandChannel::run_command_captured(const std::string& cmdline) {
    return execute(cmdline, true);
}

CommandResult SSHCommandChannel::run_detached(const std::string& cmdline, bool discard_output) {
    return execute(detached_command(cmdline, discard_output), false);
}

Result<void> SSHCommandChannel::stream_to_file(const std::string& remote_path,
                                               const ChunkSource& source) {
    const std::string cmd = upload_command(remote_path);
    ExecChannel ch(*session_);

    auto step = ch.open();
    if (step.is_ok()) step = ch.exec(cmd);
    if (step.is_err()) {
        ch.release();
        return step;
    }

    std::vector<char> buf(SSH_WRITE_CHUNK_SIZE);
    Result<void> sent = Result<void>::Ok();
    size_t total = 0;
    while (true) {
        long n = source(buf.data(), buf.size());
        if (n < 0) {
            sent = Result<void>::Err(ErrorKind::SourceInvalid,
                                     "read error on local source while uploading to " + remote_path);
            break;
        }
        if (n == 0) break;
        sent = ch.write_all(buf.data(), static_cast<size_t>(n));
        if (sent.is_err()) break;
        total += static_cast<size_t>(n);
    }
    if (sent.is_ok()) sent = ch.send_eof();

    // Collect the writer's status even after a failed write: an early exit
    // (permissions, missing directory) explains the failure better.
    std::string err;
    auto drained = ch.drain(nullptr, &err);
    Result<ExitInfo> finished = drained.is_ok()
        ? ch.finish()
        : Result<ExitInfo>::Err(drained.kind, drained.error);
    ch.release();

    app_log(fmt::format("upload {} bytes to {}: {}", total, remote_path,
                        sent.is_ok() ? "sent" : sent.error));

    if (finished.is_ok() && finished.value.exit_code_reported && finished.value.exit_code != 0) {
        trim(err);
        return Result<void>::Err(ErrorKind::CommandTransportFailure,
            fmt::format("remote write to {} exited with status {}: {}",
                        remote_path, finished.value.exit_code, err.empty() ? "no error output" : err));
    }
    if (sent.is_err()) return sent;
    if (finished.is_err()) {
        return Result<void>::Err(finished.kind, finished.error);
    }
    if (!finished.value.exit_code_reported) {
        return Result<void>::Err(ErrorKind::CommandTransportFailure,
            fmt::format("remote write to {} terminated by signal {}",
                        remote_path, finished.value.exit_signal));
    }
    return Result<void>::Ok();
}

Result<void> SSHCommandChannel::upload_bytes(const std::string& payload,
                                             const std::string& remote_path) {
    size_t offset = 0;
    return stream_to_file(remote_path, [&](char* buf, size_t cap) -> long {
        size_t n = std::min(cap, payload.size() - offset);
        std::memcpy(buf, payload.data() + offset, n);
        offset += n;
        return static_cast<long>(n);
    });
}

Result<void> SSHCommandChannel::upload_file(const fs::path& local_path,
                                            const std::string& remote_path) {
    auto source_ok = check_upload_source(local_path);
    if (source_ok.is_err()) return source_ok;

    std::ifstream file(local_path, std::ios::binary);
    if (!file) {
        return Result<void>::Err(ErrorKind::SourceInvalid,
                                 "Error opening source file " + local_path.string());
    }

    auto result = stream_to_file(remote_path, [&](char* buf, size_t cap) -> long {
        file.read(buf, static_cast<std::streamsize>(cap));
        if (file.bad()) return -1;
        return static_cast<long>(file.gcount());
    });
    if (result.is_err()) {
        result.error = fmt::format("Error copying source file {}: {}", local_path.string(), result.error);
    }
    return result;
}
