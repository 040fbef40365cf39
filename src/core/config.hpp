#pragma once

#include <string>
#include <map>
#include <optional>
#include <filesystem>
#include "credentials.hpp"
#include "types.hpp"

namespace fs = std::filesystem;

// Per-instance settings stored in the defaults file.
struct InstanceDefaults {
    std::string keyfile;
    std::string username;
    std::string hostkey;
    std::string output;         // S3 location for results
    std::string email;
    bool shutdown = false;
    std::string profile;        // aws CLI profile
    std::string region;
};

// Values given on the command line. Unset fields fall back to stored defaults.
struct SettingOverrides {
    std::optional<std::string> instance_id;
    std::optional<std::string> keyfile;
    std::optional<std::string> username;
    std::optional<std::string> hostkey;
    std::optional<std::string> output;
    std::optional<std::string> email;
    std::optional<bool> shutdown;
    std::optional<std::string> profile;
    std::optional<std::string> region;
};

// Effective settings for one run.
struct Settings {
    std::string instance_id;
    InstanceDefaults values;

    Credentials credentials() const;
};

// The defaults file: a primary instance and stored settings per instance id.
class DefaultsStore {
public:
    DefaultsStore() = default;
    explicit DefaultsStore(fs::path path) : path_(std::move(path)) {}

    // A missing file loads as empty. A file that isn't valid YAML is ConfigInvalid.
    static Result<DefaultsStore> load(const fs::path& path = default_path());
    static fs::path default_path();

    Result<void> save() const;

    const std::string& default_instance() const { return default_instance_; }
    const InstanceDefaults* find(const std::string& instance_id) const;
    void store(const std::string& instance_id, const InstanceDefaults& values, bool make_primary);

    const fs::path& path() const { return path_; }
    size_t size() const { return instances_.size(); }

private:
    fs::path path_;
    std::string default_instance_;
    std::map<std::string, InstanceDefaults> instances_;
};

// Command line over stored values. ConfigInvalid when no instance id can be
// determined.
Result<Settings> merge_settings(const DefaultsStore& store, const SettingOverrides& overrides);

// Key text from the first known_hosts line whose first field is instance_id,
// or empty when there is none.
fs::path default_known_hosts();
std::string lookup_known_host(const std::string& instance_id,
                              const fs::path& known_hosts = default_known_hosts());

// Required: instance id, username, existing key file, and (for a render)
// the output location. The email address, when set, must look like
// local@domain.
Result<void> validate_settings(const Settings& settings, bool require_output = true);

bool valid_email_address(const std::string& address);
