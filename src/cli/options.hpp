#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>

struct CliOptions {
    SettingOverrides overrides;
    bool save_defaults = false;
    bool set_primary = false;       // implies save_defaults
    bool debug_run = false;
    bool show_version = false;
    bool show_help = false;
    std::string result_workdir;     // --result <workdir>
    std::vector<std::string> positional;
};

// Hand-written parser over argv. Short flags take their value as the next
// word; long flags accept "--flag value" and "--flag=value". Unknown flags
// and missing values are ConfigInvalid.
Result<CliOptions> parse_options(const std::vector<std::string>& args);
Result<CliOptions> parse_options(int argc, char** argv);

std::string usage_text();
