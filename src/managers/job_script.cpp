#include "job_script.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <filesystem>

std::string render_output_name(const std::string& source_name) {
    const std::string ext = ".scad";
    if (ends_with(source_name, ext)) {
        return source_name.substr(0, source_name.size() - ext.size()) + ".stl";
    }
    return source_name + ".stl";
}

bool valid_workdir_name(const std::string& workdir_name) {
    if (workdir_name.empty() || workdir_name == "." || workdir_name == "..") return false;
    for (char c : workdir_name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

std::string result_file_path(const std::string& workdir_name) {
    // Double quotes keep $HOME expandable; the name is validated separately
    return "\"$HOME/" + std::string(RESULT_FILE_PREFIX) + workdir_name + RESULT_FILE_SUFFIX + "\"";
}

// printf format: literal % must be doubled
static std::string printf_escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '%') out += "%%";
        else out += c;
    }
    return out;
}

static std::string notification_block(const JobScriptParams& p) {
    if (p.email.empty()) return "";

    std::string format = fmt::format(
        "Subject={{Data=\"OpenSCAD render - %s\",Charset=UTF-8}},"
        "Body={{Text={{Data=\"Render of file {} complete. Result was %s. "
        "Output put in S3 bucket {} .\",Charset=UTF-8}}}}",
        printf_escape(p.source_name), printf_escape(p.output));

    return fmt::format(
        "printf -v notificationMessage {} \"${{renderResult}}\" \"${{renderResult}}\"\n"
        "aws ses send-email --from {} --to {} --message \"${{notificationMessage}}\"\n",
        shell_quote(format), shell_quote(p.email), shell_quote(p.email));
}

std::string build_run_script(const JobScriptParams& p) {
    const std::string workdir = shell_quote(p.workdir);
    const std::string source = shell_quote(p.source_name);
    const std::string output = shell_quote(render_output_name(p.source_name));
    const std::string bucket = shell_quote(p.output);
    const std::string workdir_name = std::filesystem::path(p.workdir).filename().string();

    std::string script;
    script += "#!/bin/bash -x\n\n";
    script += fmt::format("cd {} || exit 1\n", workdir);
    script += fmt::format("openscad -o {} {} 2>openscad.err >openscad.out\n", output, source);
    script += fmt::format("if [[ $? -ne 0 || ! -f {} ]]\n", output);
    script +=
        "then\n"
        "    # render failed, dump dmesg to help debug memory problems\n"
        "    dmesg > dmesg.out\n"
        "    renderResult=FAILED\n"
        "else\n"
        "    renderResult=SUCCESS\n"
        "fi\n";
    script += fmt::format("for f in {} {} openscad.err openscad.out dmesg.out\n", source, output);
    script += fmt::format(
        "do\n"
        "    if [[ -s ${{f}} ]]\n"
        "    then\n"
        "        aws s3 cp \"${{f}}\" {}\n"
        "    fi\n"
        "done\n", bucket);

    script += "\n# Email notification if address given\n";
    script += notification_block(p);

    script += "\n# Record the outcome, tidy up, and if necessary stop the instance\n";
    script += fmt::format("echo \"${{renderResult}}\" > {}\n", result_file_path(workdir_name));
    script += "cd ~\n";
    script += fmt::format("rm -rf {}\n", workdir);
    if (p.shutdown) {
        script += fmt::format("aws ec2 stop-instances --instance-ids {}\n", shell_quote(p.instance_id));
    }
    return script;
}
