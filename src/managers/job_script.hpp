#pragma once

#include <string>

struct JobScriptParams {
    std::string instance_id;
    std::string workdir;        // absolute remote working directory
    std::string source_name;    // model file name inside workdir
    std::string output;         // S3 location receiving the artefacts
    std::string email;          // SES-verified address, empty for none
    bool shutdown = false;      // stop the instance when done
};

// model.scad -> model.stl
std::string render_output_name(const std::string& source_name);

// Where the job records SUCCESS or FAILED, as a shell word ($HOME unexpanded).
std::string result_file_path(const std::string& workdir_name);

// Working directory names come from mktemp; anything else is refused before
// it reaches a remote shell.
bool valid_workdir_name(const std::string& workdir_name);

// The bash script run detached on the instance.
std::string build_run_script(const JobScriptParams& params);
