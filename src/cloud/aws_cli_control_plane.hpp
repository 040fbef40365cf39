#pragma once

#include <string>
#include <vector>
#include "control_plane.hpp"

struct AwsCliOptions {
    std::string program = "aws";
    std::string profile;
    std::string region;
};

// EC2 control plane driven through the aws command line tool.
class AwsCliControlPlane : public ControlPlane {
public:
    explicit AwsCliControlPlane(AwsCliOptions options = AwsCliOptions{});

    Result<LifecycleState> query_state(const std::string& instance_id) override;
    Result<void> request_start(const std::string& instance_id) override;
    Result<void> wait_until_running(const std::string& instance_id) override;
    Result<std::string> resolve_address(const std::string& instance_id) override;

    // Reply parsing, exposed for tests.
    static LifecycleState map_state_name(const std::string& ec2_state);
    static bool is_not_found_error(const std::string& stderr_text);
    static Result<LifecycleState> parse_state_reply(const std::string& instance_id,
                                                    const std::string& json);
    static Result<std::string> parse_address_reply(const std::string& instance_id,
                                                   const std::string& json);

private:
    AwsCliOptions options_;

    struct CliReply {
        bool ran;
        int exit_code;
        std::string out;
        std::string err;
    };

    CliReply invoke(std::vector<std::string> args) const;
};
