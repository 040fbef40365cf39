#include "render_job.hpp"
#include "job_script.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

// ── Instance checks ──────────────────────────────────────────

std::vector<InstanceCheck> default_instance_checks(const std::string& instance_id,
                                                   const std::string& output) {
    return {
        {"OpenSCAD installed",
         "openscad --version >/dev/null 2>&1", 0,
         "Non-zero exit status from attempt to run OpenSCAD on instance. Check OpenSCAD installed."},
        {"AWS CLI configured",
         "aws ec2 describe-instances --instance-ids " + shell_quote(instance_id) + " >/dev/null", 0,
         "Non-zero exit status from AWS EC2 CLI test on target instance. "
         "Check AWS CLI installed and configured."},
        {"S3 bucket reachable",
         "aws s3 ls " + shell_quote(output) + " >/dev/null", 0,
         "Non-zero exit status from AWS S3 CLI test on target instance. "
         "Check instance has correct permission on S3 bucket."},
    };
}

Result<void> run_instance_checks(InstanceController& instance,
                                 const std::vector<InstanceCheck>& checks,
                                 StatusCallback callback) {
    for (const auto& check : checks) {
        auto r = instance.run_command(check.command);
        if (r.transport_failed()) {
            return Result<void>::Err(ErrorKind::CommandTransportFailure,
                fmt::format("Error running check '{}': {}", check.description, r.error));
        }
        if (r.exit_status != check.required_status) {
            return Result<void>::Err(ErrorKind::InstanceNotUsable,
                fmt::format("{} (exit status {})", check.hint, r.exit_status));
        }
        if (callback) callback(check.description);
    }
    return Result<void>::Ok();
}

// ── Local input ──────────────────────────────────────────────

Result<void> check_source_file(const fs::path& source) {
    std::error_code ec;
    auto status = fs::status(source, ec);
    if (ec || !fs::exists(status)) {
        return Result<void>::Err(ErrorKind::SourceInvalid,
            fmt::format("Error statting source file {}: {}", source.string(),
                        ec ? ec.message() : "no such file"));
    }
    if (!fs::is_regular_file(status)) {
        return Result<void>::Err(ErrorKind::SourceInvalid,
            fmt::format("Source file {} must be a regular file", source.string()));
    }
    if (!ends_with(source.filename().string(), ".scad")) {
        return Result<void>::Err(ErrorKind::SourceInvalid,
            fmt::format("Source file {} must be a .scad file", source.string()));
    }
    return Result<void>::Ok();
}

// ── Remote working directory ─────────────────────────────────

static Result<std::string> captured_line(InstanceController& instance,
                                         const std::string& cmd, const std::string& what) {
    auto r = instance.run_command_captured(cmd);
    if (r.transport_failed()) {
        return Result<std::string>::Err(ErrorKind::CommandTransportFailure,
            fmt::format("Error {}: {}", what, r.error));
    }
    if (r.exit_status != 0) {
        return Result<std::string>::Err(ErrorKind::InstanceNotUsable,
            fmt::format("Non-zero exit status {} {}", r.exit_status, what));
    }
    return Result<std::string>::Ok(trimmed(r.stdout_data));
}

Result<std::string> make_working_dir(InstanceController& instance) {
    auto dir = captured_line(instance, "mktemp -d -p.", "creating working directory");
    if (dir.is_err()) return dir;

    auto home = captured_line(instance, "printf '%s\\n' \"$HOME\"", "locating home directory");
    if (home.is_err()) return home;

    // mktemp answers relative to the login directory: ./tmp.XXXXXXXXXX
    std::string rel = dir.value;
    if (rel.rfind("./", 0) == 0) rel.erase(0, 1);
    if (rel.empty() || rel[0] != '/') rel = "/" + rel;

    if (home.value.empty() || home.value[0] != '/' || rel.size() < 2) {
        return Result<std::string>::Err(ErrorKind::InstanceNotUsable,
            fmt::format("Unexpected working directory '{}' under home '{}'", dir.value, home.value));
    }
    while (home.value.size() > 1 && home.value.back() == '/') home.value.pop_back();
    return Result<std::string>::Ok(home.value + rel);
}

// ── RenderJob ────────────────────────────────────────────────

RenderJob::RenderJob(InstanceController& instance, const Settings& settings)
    : instance_(instance), settings_(settings) {}

Result<RenderOutcome> RenderJob::run(const fs::path& source, bool debug_run,
                                     StatusCallback callback) {
    auto source_ok = check_source_file(source);
    if (source_ok.is_err()) {
        return Result<RenderOutcome>::Err(source_ok.kind, source_ok.error);
    }

    if (callback) callback(fmt::format("Initializing instance {}", settings_.instance_id));
    auto ready = instance_.ensure_ready(callback);
    if (ready.is_err()) {
        return Result<RenderOutcome>::Err(ready.kind, ready.error);
    }

    auto outcome = stage_and_launch(source, debug_run, callback);
    instance_.close();
    if (outcome.is_err()) {
        app_log_error("render " + source.string(), outcome);
    }
    return outcome;
}

Result<RenderOutcome> RenderJob::stage_and_launch(const fs::path& source, bool debug_run,
                                                  StatusCallback callback) {
    using R = Result<RenderOutcome>;

    auto checked = run_instance_checks(instance_,
        default_instance_checks(settings_.instance_id, settings_.values.output), callback);
    if (checked.is_err()) return R::Err(checked.kind, checked.error);

    if (callback) callback(fmt::format("Setting up rendering on {}", settings_.instance_id));
    auto workdir = make_working_dir(instance_);
    if (workdir.is_err()) return R::Err(workdir.kind, workdir.error);

    RenderOutcome outcome;
    outcome.workdir = workdir.value;

    const std::string source_name = source.filename().string();
    const std::string remote_source = outcome.workdir + "/" + source_name;
    auto copied = instance_.upload_file(source, remote_source);
    if (copied.is_err()) {
        return R::Err(copied.kind, fmt::format("Error copying file {} to target {}: {}",
                                               source.string(), remote_source, copied.error));
    }

    JobScriptParams params;
    params.instance_id = settings_.instance_id;
    params.workdir = outcome.workdir;
    params.source_name = source_name;
    params.output = settings_.values.output;
    params.email = settings_.values.email;
    params.shutdown = settings_.values.shutdown;

    const std::string script_path = outcome.workdir + "/" + RUN_SCRIPT_NAME;
    auto written = instance_.upload_bytes(build_run_script(params), script_path);
    if (written.is_err()) {
        return R::Err(written.kind, "Error writing run script: " + written.error);
    }

    auto chmod = instance_.run_command("chmod a+x " + shell_quote(script_path));
    if (chmod.failed()) {
        return R::Err(chmod.transport_failed() ? ErrorKind::CommandTransportFailure
                                               : ErrorKind::InstanceNotUsable,
            fmt::format("Error making run script executable: {}",
                        chmod.transport_failed() ? chmod.error
                                                 : fmt::format("exit status {}", chmod.exit_status)));
    }

    if (debug_run) {
        return R::Ok(outcome);
    }

    auto launched = instance_.run_detached(shell_quote(script_path), true);
    if (launched.failed()) {
        return R::Err(launched.transport_failed() ? ErrorKind::CommandTransportFailure
                                                  : ErrorKind::InstanceNotUsable,
            fmt::format("Error running script: {}",
                        launched.transport_failed() ? launched.error
                                                    : fmt::format("exit status {}", launched.exit_status)));
    }
    outcome.launched = true;
    return R::Ok(outcome);
}

Result<std::string> RenderJob::fetch_result(const std::string& workdir_name,
                                            StatusCallback callback) {
    if (!valid_workdir_name(workdir_name)) {
        return Result<std::string>::Err(ErrorKind::ConfigInvalid,
            fmt::format("'{}' is not a working directory name (expected e.g. tmp.AbC123)",
                        workdir_name));
    }

    auto ready = instance_.ensure_ready(callback);
    if (ready.is_err()) {
        return Result<std::string>::Err(ready.kind, ready.error);
    }

    const std::string path = result_file_path(workdir_name);
    auto r = instance_.run_command_captured(
        fmt::format("if [ -f {0} ]; then cat {0}; else echo pending; fi", path));
    instance_.close();

    if (r.transport_failed()) {
        return Result<std::string>::Err(ErrorKind::CommandTransportFailure,
            fmt::format("Error reading result for {}: {}", workdir_name, r.error));
    }
    if (r.exit_status != 0) {
        return Result<std::string>::Err(ErrorKind::InstanceNotUsable,
            fmt::format("Error reading result for {}: exit status {}", workdir_name, r.exit_status));
    }
    return Result<std::string>::Ok(trimmed(r.stdout_data));
}
