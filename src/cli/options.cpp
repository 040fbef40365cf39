#include "options.hpp"
#include "theme.hpp"
#include <fmt/format.h>
#include <optional>

namespace {

enum class Flag {
    InstanceId, KeyFile, Username, HostKey, Output, Email, Profile, Region,
    Shutdown, SaveDefaults, SetPrimary, DebugRun, Result, Version, Help,
};

struct FlagSpec {
    char short_name;            // 0 when there is none
    const char* long_name;
    Flag flag;
    bool takes_value;
    const char* help;
};

const FlagSpec FLAGS[] = {
    {'i', "instanceid",    Flag::InstanceId,   true,  "AWS instance ID"},
    {'k', "keyfile",       Flag::KeyFile,      true,  "SSH private key file to access instance"},
    {'u', "username",      Flag::Username,     true,  "Instance SSH username"},
    {'H', "hostkey",       Flag::HostKey,      true,  "SSH host key (ssh-keyscan to generate)"},
    {'o', "output",        Flag::Output,       true,  "S3 bucket to store output files"},
    {'e', "emailaddr",     Flag::Email,        true,  "(optional) email address for notifications, must be SES verified"},
    {0,   "profile",       Flag::Profile,      true,  "(optional) aws CLI profile for the control plane"},
    {0,   "region",        Flag::Region,       true,  "(optional) aws region for the control plane"},
    {'s', "shutdown",      Flag::Shutdown,     false, "(optional) stop instance on completion"},
    {'d', "save-defaults", Flag::SaveDefaults, false, "Save settings as future defaults for this instance ID"},
    {'p', "set-primary",   Flag::SetPrimary,   false, "Mark this instance as primary (used if none specified), implies -d"},
    {0,   "debug-run",     Flag::DebugRun,     false, "Stage everything but do not start the run script"},
    {0,   "result",        Flag::Result,       true,  "Report the result of a detached render by working directory"},
    {'V', "version",       Flag::Version,      false, "Print version information"},
    {'h', "help",          Flag::Help,         false, "Show this help"},
};

const FlagSpec* find_short(char c) {
    for (const auto& f : FLAGS) {
        if (f.short_name != 0 && f.short_name == c) return &f;
    }
    return nullptr;
}

const FlagSpec* find_long(const std::string& name) {
    for (const auto& f : FLAGS) {
        if (name == f.long_name) return &f;
    }
    return nullptr;
}

void apply(CliOptions& opts, const FlagSpec& spec, const std::string& value) {
    auto& o = opts.overrides;
    switch (spec.flag) {
        case Flag::InstanceId:   o.instance_id = value; break;
        case Flag::KeyFile:      o.keyfile = value; break;
        case Flag::Username:     o.username = value; break;
        case Flag::HostKey:      o.hostkey = value; break;
        case Flag::Output:       o.output = value; break;
        case Flag::Email:        o.email = value; break;
        case Flag::Profile:      o.profile = value; break;
        case Flag::Region:       o.region = value; break;
        case Flag::Shutdown:     o.shutdown = true; break;
        case Flag::SaveDefaults: opts.save_defaults = true; break;
        case Flag::SetPrimary:   opts.set_primary = true; opts.save_defaults = true; break;
        case Flag::DebugRun:     opts.debug_run = true; break;
        case Flag::Result:       opts.result_workdir = value; break;
        case Flag::Version:      opts.show_version = true; break;
        case Flag::Help:         opts.show_help = true; break;
    }
}

} // namespace

Result<CliOptions> parse_options(const std::vector<std::string>& args) {
    CliOptions opts;
    bool only_positional = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (only_positional || arg == "-" || arg.empty() || arg[0] != '-') {
            opts.positional.push_back(arg);
            continue;
        }
        if (arg == "--") {
            only_positional = true;
            continue;
        }

        const FlagSpec* spec = nullptr;
        std::optional<std::string> inline_value;

        if (arg.rfind("--", 0) == 0) {
            std::string name = arg.substr(2);
            auto eq = name.find('=');
            if (eq != std::string::npos) {
                inline_value = name.substr(eq + 1);
                name = name.substr(0, eq);
            }
            spec = find_long(name);
        } else if (arg.size() == 2) {
            spec = find_short(arg[1]);
        }

        if (!spec) {
            return Result<CliOptions>::Err(ErrorKind::ConfigInvalid,
                                           fmt::format("Unknown option: {}", arg));
        }

        std::string value;
        if (spec->takes_value) {
            if (inline_value) {
                value = *inline_value;
            } else if (i + 1 < args.size()) {
                value = args[++i];
            } else {
                return Result<CliOptions>::Err(ErrorKind::ConfigInvalid,
                                               fmt::format("Option {} requires a value", arg));
            }
        } else if (inline_value) {
            return Result<CliOptions>::Err(ErrorKind::ConfigInvalid,
                                           fmt::format("Option --{} takes no value", spec->long_name));
        }

        apply(opts, *spec, value);
    }

    return Result<CliOptions>::Ok(opts);
}

Result<CliOptions> parse_options(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) args.emplace_back(argv[i]);
    return parse_options(args);
}

std::string usage_text() {
    std::string out;
    out += theme::section("Usage");
    out += theme::color::BLUE + "    awsrender " + theme::color::RESET
         + theme::color::BROWN + "[flags] <file.scad>" + theme::color::RESET + "\n\n";
    out += theme::color::DIM
         + "    Renders an OpenSCAD file to STL on the given Amazon EC2 instance.\n"
         + "    Results are stored in S3; optionally stops the instance and/or sends\n"
         + "    an email notification on completion. The instance needs OpenSCAD,\n"
         + "    the AWS CLI, SSH access and S3 permissions configured.\n"
         + theme::color::RESET;

    out += theme::section("Flags");
    for (const auto& f : FLAGS) {
        std::string names = f.short_name ? fmt::format("-{}, --{}", f.short_name, f.long_name)
                                         : fmt::format("    --{}", f.long_name);
        if (f.takes_value) names += " <value>";
        out += theme::color::BLUE + fmt::format("    {:<30}", names) + theme::color::RESET
             + theme::color::DIM + f.help + theme::color::RESET + "\n";
    }
    out += "\n" + theme::color::DIM
         + "    Use of awsrender may incur fees from Amazon Web Services Inc.\n"
         + theme::color::RESET + "\n";
    return out;
}
