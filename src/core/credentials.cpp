#include "credentials.hpp"
#include <filesystem>
#include <fstream>
#include <fmt/format.h>

namespace fs = std::filesystem;

Result<void> Credentials::validate() const {
    if (host_key.empty()) {
        return Result<void>::Err(ErrorKind::ConfigInvalid,
            "Require SSH host key to be specified (ssh-keyscan to generate)");
    }
    if (username.empty()) {
        return Result<void>::Err(ErrorKind::ConfigInvalid,
            "Require SSH username to be specified");
    }
    if (private_key_path.empty()) {
        return Result<void>::Err(ErrorKind::ConfigInvalid,
            "Require SSH private key file to be specified");
    }

    std::error_code ec;
    auto status = fs::status(private_key_path, ec);
    if (ec || !fs::exists(status)) {
        return Result<void>::Err(ErrorKind::ConfigInvalid,
            fmt::format("Cannot locate SSH private key file {}", private_key_path));
    }
    if (!fs::is_regular_file(status)) {
        return Result<void>::Err(ErrorKind::ConfigInvalid,
            fmt::format("SSH private key {} must be a regular file", private_key_path));
    }
    std::ifstream probe(private_key_path);
    if (!probe) {
        return Result<void>::Err(ErrorKind::ConfigInvalid,
            fmt::format("SSH private key {} is not readable", private_key_path));
    }
    return Result<void>::Ok();
}
