#include <iostream>
#include <string>
#include "cli/options.hpp"
#include "cli/theme.hpp"
#include "cloud/aws_cli_control_plane.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/log.hpp"
#include "managers/instance_controller.hpp"
#include "managers/render_job.hpp"

static void print_version() {
    std::cout << theme::color::ORANGE << theme::color::BOLD << "awsrender"
              << theme::color::RESET << theme::color::DIM
              << " version " << AWSRENDER_VERSION << theme::color::RESET << "\n";
    std::cout << theme::dim("AWS is a trademark of Amazon Web Services, Inc.") << "\n";
}

static void print_settings(const std::string& title, const Settings& s) {
    std::cout << theme::section(title);
    std::cout << theme::kv("instance", s.instance_id);
    std::cout << theme::kv("keyfile", s.values.keyfile);
    std::cout << theme::kv("username", s.values.username);
    std::cout << theme::kv("hostkey", s.values.hostkey);
    std::cout << theme::kv("output", s.values.output);
    std::cout << theme::kv("email", s.values.email);
    std::cout << theme::kv("shutdown", s.values.shutdown ? "yes" : "no");
    if (!s.values.profile.empty()) std::cout << theme::kv("profile", s.values.profile);
    if (!s.values.region.empty()) std::cout << theme::kv("region", s.values.region);
}

static int report(const std::string& what, ErrorKind kind, const std::string& error) {
    app_log(fmt::format("{} failed [{}]: {}", what, error_kind_name(kind), error));
    std::cout << theme::fail(error);
    return 1;
}

// Defaults file, command line, optional save, then host key fallback.
static Result<Settings> resolve_settings(const CliOptions& opts, bool for_render) {
    auto store = DefaultsStore::load();
    if (store.is_err()) return Result<Settings>::Err(store.kind, store.error);

    auto merged = merge_settings(store.value, opts.overrides);
    if (merged.is_err()) return merged;
    Settings settings = merged.value;
    if (opts.debug_run) print_settings("Settings after defaults applied", settings);

    auto valid = validate_settings(settings, for_render);
    if (valid.is_err()) return Result<Settings>::Err(valid.kind, valid.error);

    if (opts.save_defaults) {
        store.value.store(settings.instance_id, settings.values, opts.set_primary);
        auto saved = store.value.save();
        if (saved.is_err()) return Result<Settings>::Err(saved.kind, saved.error);
        app_log("saved defaults for " + settings.instance_id + " to " + store.value.path().string());
    }

    if (settings.values.hostkey.empty()) {
        settings.values.hostkey = lookup_known_host(settings.instance_id);
    }
    if (settings.values.hostkey.empty()) {
        return Result<Settings>::Err(ErrorKind::ConfigInvalid,
            "Require SSH host key to be specified (ssh-keyscan to generate)");
    }
    return Result<Settings>::Ok(settings);
}

int main(int argc, char** argv) {
    try {
        auto parsed = parse_options(argc, argv);
        if (parsed.is_err()) {
            std::cout << theme::fail(parsed.error);
            std::cout << usage_text();
            return 1;
        }
        const CliOptions& opts = parsed.value;

        if (opts.show_help) {
            std::cout << theme::banner(AWSRENDER_VERSION) << usage_text();
            return 0;
        }
        if (opts.show_version) {
            print_version();
            return 0;
        }

        const bool fetching = !opts.result_workdir.empty();
        if (!fetching && opts.positional.empty()) {
            std::cout << theme::fail("No input file.");
            std::cout << usage_text();
            return 1;
        }

        auto settings = resolve_settings(opts, !fetching);
        if (settings.is_err()) return report("settings", settings.kind, settings.error);

        AwsCliOptions cli;
        cli.program = AWS_CLI_PROGRAM;
        cli.profile = settings.value.values.profile;
        cli.region = settings.value.values.region;
        AwsCliControlPlane control_plane(cli);

        InstanceController instance(settings.value.instance_id,
                                    settings.value.credentials(), control_plane);
        RenderJob job(instance, settings.value);

        auto status = [](const std::string& msg) {
            app_log(msg);
            std::cout << theme::step(msg) << std::flush;
        };

        if (fetching) {
            auto result = job.fetch_result(opts.result_workdir, status);
            if (result.is_err()) return report("result", result.kind, result.error);
            std::cout << theme::kv(opts.result_workdir, result.value);
            return 0;
        }

        const fs::path source = opts.positional.front();
        auto outcome = job.run(source, opts.debug_run, status);
        if (outcome.is_err()) return report("render", outcome.kind, outcome.error);

        const auto& s = settings.value;
        const std::string workdir_name = fs::path(outcome.value.workdir).filename().string();
        if (outcome.value.launched) {
            std::string note;
            if (!s.values.email.empty()) note += fmt::format(" Notification will be sent to {}.", s.values.email);
            if (s.values.shutdown) note += " Instance will be stopped on completion.";
            std::cout << theme::ok(fmt::format("Render of {} started on {}. Output to {}.{}",
                                               source.filename().string(), s.instance_id,
                                               s.values.output, note));
            std::cout << theme::info(fmt::format("Check progress with: awsrender -i {} --result {}",
                                                 s.instance_id, workdir_name));
        } else {
            std::cout << theme::info(fmt::format(
                "DEBUG MODE - render script not started. Files in working directory {} on instance {}.",
                outcome.value.workdir, s.instance_id));
        }
        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
