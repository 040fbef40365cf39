#include "instance_controller.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

InstanceController::InstanceController(std::string instance_id, Credentials credentials,
                                       ControlPlane& control_plane,
                                       ChannelFactory channel_factory)
    : credentials_(std::move(credentials)),
      control_plane_(control_plane),
      channel_factory_(std::move(channel_factory)) {
    handle_.instance_id = std::move(instance_id);
}

InstanceController::~InstanceController() {
    close();
}

void InstanceController::close() {
    if (channel_) {
        app_log("closing channel to " + handle_.instance_id);
        channel_->close();
        channel_.reset();
    }
    handle_.channel_verified = false;
}

// ── ensure_ready ─────────────────────────────────────────────

Result<void> InstanceController::ensure_ready(StatusCallback callback) {
    // One channel per instance: a second call replaces the first
    close();
    handle_.address.reset();
    handle_.state = LifecycleState::Unknown;

    auto result = bring_up(callback);
    if (result.is_err()) {
        app_log_error("ensure_ready " + handle_.instance_id, result);
        close();
        return result;
    }

    app_log(fmt::format("instance {} ready at {}", handle_.instance_id, *handle_.address));
    return result;
}

Result<void> InstanceController::bring_up(StatusCallback callback) {
    const std::string& id = handle_.instance_id;

    auto state = control_plane_.query_state(id);
    if (state.is_err()) {
        return Result<void>::Err(state.kind, state.error);
    }
    handle_.state = state.value;
    app_log(fmt::format("instance {} is {}", id, lifecycle_state_name(state.value)));

    if (handle_.state != LifecycleState::Running) {
        if (callback) callback(fmt::format("Starting EC2 instance {}", id));
        auto started = control_plane_.request_start(id);
        if (started.is_err()) {
            return Result<void>::Err(ErrorKind::StartFailed, started.error);
        }
        handle_.state = LifecycleState::Starting;

        if (callback) {
            callback(fmt::format("Waiting for instance {} to become ready (may take a few minutes)", id));
        }
        auto waited = control_plane_.wait_until_running(id);
        if (waited.is_err()) {
            return Result<void>::Err(ErrorKind::StartFailed, waited.error);
        }
        handle_.state = LifecycleState::Running;
    }

    auto address = control_plane_.resolve_address(id);
    if (address.is_err()) {
        return Result<void>::Err(ErrorKind::AddressUnresolved, address.error);
    }
    if (address.value.empty()) {
        return Result<void>::Err(ErrorKind::AddressUnresolved,
            fmt::format("Instance {} has no public IP address", id));
    }
    handle_.address = address.value;

    return connect_and_probe(callback);
}

Result<void> InstanceController::connect_and_probe(StatusCallback callback) {
    const std::string& id = handle_.instance_id;
    if (callback) callback(fmt::format("Connecting to {} ({})", id, *handle_.address));

    auto channel = channel_factory_(*handle_.address, credentials_, callback);
    if (channel.is_err()) {
        return Result<void>::Err(channel.kind, channel.error);
    }
    if (!channel.value) {
        return Result<void>::Err(ErrorKind::ConnectFailed,
            fmt::format("no channel to {} at {}", id, *handle_.address));
    }
    channel_ = std::move(channel.value);

    auto probe = channel_->run_command("true");
    if (probe.transport_failed()) {
        return Result<void>::Err(ErrorKind::InstanceNotUsable,
            fmt::format("Error running commands on instance {}: {}", id, probe.error));
    }
    if (probe.exit_status != 0) {
        return Result<void>::Err(ErrorKind::InstanceNotUsable,
            fmt::format("Error running commands on instance {}: probe exited with status {}",
                        id, probe.exit_status));
    }
    handle_.channel_verified = true;
    return Result<void>::Ok();
}

// ── Delegation ───────────────────────────────────────────────

CommandResult InstanceController::not_ready(const std::string& operation) const {
    CommandResult r;
    r.exit_status = STATUS_COMMAND_FAILED;
    r.error = fmt::format("{} on instance {}: instance is not ready", operation,
                          handle_.instance_id);
    return r;
}

CommandResult InstanceController::run_command(const std::string& cmdline) {
    if (!handle_.ready()) return not_ready("run command");
    return channel_->run_command(cmdline);
}

CommandResult InstanceController::run_command_captured(const std::string& cmdline) {
    if (!handle_.ready()) return not_ready("run command");
    return channel_->run_command_captured(cmdline);
}

CommandResult InstanceController::run_detached(const std::string& cmdline, bool discard_output) {
    if (!handle_.ready()) return not_ready("launch command");
    return channel_->run_detached(cmdline, discard_output);
}

Result<void> InstanceController::upload_bytes(const std::string& payload,
                                              const std::string& remote_path) {
    if (!handle_.ready()) {
        return Result<void>::Err(ErrorKind::CommandTransportFailure,
                                 not_ready("upload to " + remote_path).error);
    }
    return channel_->upload_bytes(payload, remote_path);
}

Result<void> InstanceController::upload_file(const fs::path& local_path,
                                             const std::string& remote_path) {
    if (!handle_.ready()) {
        return Result<void>::Err(ErrorKind::CommandTransportFailure,
                                 not_ready("upload to " + remote_path).error);
    }
    return channel_->upload_file(local_path, remote_path);
}
