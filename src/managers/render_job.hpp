#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/config.hpp>
#include <core/types.hpp>
#include "instance_controller.hpp"

namespace fs = std::filesystem;

// One provisioning check run on the instance before any files are staged.
struct InstanceCheck {
    std::string description;
    std::string command;
    int required_status = 0;
    std::string hint;           // shown when the check fails
};

// OpenSCAD runnable, aws CLI configured for this instance, bucket reachable.
std::vector<InstanceCheck> default_instance_checks(const std::string& instance_id,
                                                   const std::string& output);

// Stops at the first failing check: InstanceNotUsable, or
// CommandTransportFailure when the check could not run at all.
Result<void> run_instance_checks(InstanceController& instance,
                                 const std::vector<InstanceCheck>& checks,
                                 StatusCallback callback = nullptr);

// Regular file ending in .scad. No network.
Result<void> check_source_file(const fs::path& source);

// Fresh directory under the remote $HOME, returned as an absolute path.
Result<std::string> make_working_dir(InstanceController& instance);

struct RenderOutcome {
    std::string workdir;
    bool launched = false;
};

// Drives one render: ready the instance, check it, stage the model and job
// script in a fresh working directory, and launch the script detached. The
// instance connection is closed on every path.
class RenderJob {
public:
    RenderJob(InstanceController& instance, const Settings& settings);

    Result<RenderOutcome> run(const fs::path& source, bool debug_run,
                              StatusCallback callback = nullptr);

    // SUCCESS, FAILED, or "pending" while the job has not recorded a result.
    Result<std::string> fetch_result(const std::string& workdir_name,
                                     StatusCallback callback = nullptr);

private:
    InstanceController& instance_;
    const Settings& settings_;

    Result<RenderOutcome> stage_and_launch(const fs::path& source, bool debug_run,
                                           StatusCallback callback);
};
