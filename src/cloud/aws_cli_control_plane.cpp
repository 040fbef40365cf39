#include "aws_cli_control_plane.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <arpa/inet.h>

const char* lifecycle_state_name(LifecycleState state) {
    switch (state) {
        case LifecycleState::Unknown:    return "unknown";
        case LifecycleState::NotRunning: return "not running";
        case LifecycleState::Starting:   return "starting";
        case LifecycleState::Running:    return "running";
    }
    return "unknown";
}

AwsCliControlPlane::AwsCliControlPlane(AwsCliOptions options)
    : options_(std::move(options)) {}

AwsCliControlPlane::CliReply AwsCliControlPlane::invoke(std::vector<std::string> args) const {
    args.push_back("--output");
    args.push_back("json");
    if (!options_.profile.empty()) {
        args.push_back("--profile");
        args.push_back(options_.profile);
    }
    if (!options_.region.empty()) {
        args.push_back("--region");
        args.push_back(options_.region);
    }

    std::string joined = options_.program;
    for (const auto& a : args) joined += " " + a;
    app_log("control plane: " + joined);

    auto out = platform::run_captured(options_.program, args);
    CliReply reply{out.spawned && out.exit_code != 127, out.exit_code,
                   std::move(out.stdout_data), std::move(out.stderr_data)};
    app_log(fmt::format("control plane exit={} stderr={}", reply.exit_code,
                        reply.err.substr(0, LOG_TRUNCATE_CHARS)));
    return reply;
}

// ── Reply parsing ────────────────────────────────────────────

LifecycleState AwsCliControlPlane::map_state_name(const std::string& ec2_state) {
    if (ec2_state == "running") return LifecycleState::Running;
    if (ec2_state == "pending") return LifecycleState::Starting;
    if (ec2_state.empty()) return LifecycleState::Unknown;
    // stopped, stopping, shutting-down, terminated
    return LifecycleState::NotRunning;
}

bool AwsCliControlPlane::is_not_found_error(const std::string& stderr_text) {
    return stderr_text.find("InvalidInstanceID.NotFound") != std::string::npos ||
           stderr_text.find("InvalidInstanceID.Malformed") != std::string::npos;
}

// First instance of the first reservation, or an undefined node.
static YAML::Node first_instance(const YAML::Node& root) {
    const YAML::Node reservations = root["Reservations"];
    if (!reservations || !reservations.IsSequence() || reservations.size() == 0) {
        return YAML::Node(YAML::NodeType::Undefined);
    }
    const YAML::Node instances = reservations[0]["Instances"];
    if (!instances || !instances.IsSequence() || instances.size() == 0) {
        return YAML::Node(YAML::NodeType::Undefined);
    }
    return instances[0];
}

Result<LifecycleState> AwsCliControlPlane::parse_state_reply(const std::string& instance_id,
                                                             const std::string& json) {
    try {
        YAML::Node instance = first_instance(YAML::Load(json));
        if (!instance.IsDefined()) {
            return Result<LifecycleState>::Err(ErrorKind::ResourceNotFound,
                fmt::format("Instance {} does not exist", instance_id));
        }
        std::string name = instance["State"]["Name"].as<std::string>("");
        return Result<LifecycleState>::Ok(map_state_name(name));
    } catch (const YAML::Exception& e) {
        return Result<LifecycleState>::Err(ErrorKind::ResourceNotFound,
            fmt::format("Error getting instance status for {}: unreadable reply ({})",
                        instance_id, e.what()));
    }
}

Result<std::string> AwsCliControlPlane::parse_address_reply(const std::string& instance_id,
                                                            const std::string& json) {
    std::string address;
    try {
        YAML::Node instance = first_instance(YAML::Load(json));
        if (instance.IsDefined()) {
            address = instance["PublicIpAddress"].as<std::string>("");
        }
    } catch (const YAML::Exception& e) {
        return Result<std::string>::Err(ErrorKind::AddressUnresolved,
            fmt::format("Error getting instance details for {}: {}", instance_id, e.what()));
    }

    trim(address);
    if (address.empty()) {
        return Result<std::string>::Err(ErrorKind::AddressUnresolved,
            fmt::format("Instance {} has no public IP address", instance_id));
    }

    unsigned char buf[sizeof(struct in6_addr)];
    if (inet_pton(AF_INET, address.c_str(), buf) != 1 &&
        inet_pton(AF_INET6, address.c_str(), buf) != 1) {
        return Result<std::string>::Err(ErrorKind::AddressUnresolved,
            fmt::format("Error parsing IP address '{}' for instance {}", address, instance_id));
    }
    return Result<std::string>::Ok(address);
}

// ── Operations ───────────────────────────────────────────────

Result<LifecycleState> AwsCliControlPlane::query_state(const std::string& instance_id) {
    auto reply = invoke({"ec2", "describe-instances", "--instance-ids", instance_id});
    if (!reply.ran) {
        return Result<LifecycleState>::Err(ErrorKind::ResourceNotFound,
            fmt::format("Error getting instance status for {}: cannot run {}",
                        instance_id, options_.program));
    }
    if (reply.exit_code != 0) {
        trim(reply.err);
        if (is_not_found_error(reply.err)) {
            return Result<LifecycleState>::Err(ErrorKind::ResourceNotFound,
                fmt::format("Instance {} does not exist: {}", instance_id, reply.err));
        }
        return Result<LifecycleState>::Err(ErrorKind::ResourceNotFound,
            fmt::format("Error getting instance status for {}: {}", instance_id, reply.err));
    }
    return parse_state_reply(instance_id, reply.out);
}

Result<void> AwsCliControlPlane::request_start(const std::string& instance_id) {
    auto reply = invoke({"ec2", "start-instances", "--instance-ids", instance_id});
    if (!reply.ran || reply.exit_code != 0) {
        trim(reply.err);
        return Result<void>::Err(ErrorKind::StartFailed,
            fmt::format("Error starting instance {}: {}", instance_id,
                        reply.ran ? reply.err : "cannot run " + options_.program));
    }
    return Result<void>::Ok();
}

Result<void> AwsCliControlPlane::wait_until_running(const std::string& instance_id) {
    auto reply = invoke({"ec2", "wait", "instance-status-ok", "--instance-ids", instance_id});
    if (!reply.ran || reply.exit_code != 0) {
        trim(reply.err);
        return Result<void>::Err(ErrorKind::StartFailed,
            fmt::format("Error waiting for instance {} to become available: {}", instance_id,
                        reply.ran ? reply.err : "cannot run " + options_.program));
    }
    return Result<void>::Ok();
}

Result<std::string> AwsCliControlPlane::resolve_address(const std::string& instance_id) {
    auto reply = invoke({"ec2", "describe-instances", "--instance-ids", instance_id});
    if (!reply.ran || reply.exit_code != 0) {
        trim(reply.err);
        return Result<std::string>::Err(ErrorKind::AddressUnresolved,
            fmt::format("Error getting instance details for {}: {}", instance_id,
                        reply.ran ? reply.err : "cannot run " + options_.program));
    }
    return parse_address_reply(instance_id, reply.out);
}
