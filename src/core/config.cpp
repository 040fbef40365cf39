#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

Credentials Settings::credentials() const {
    Credentials c;
    c.host_key = values.hostkey;
    c.username = values.username;
    c.private_key_path = values.keyfile;
    return c;
}

// ── Defaults file ────────────────────────────────────────────

fs::path DefaultsStore::default_path() {
    return platform::config_home() / CONFIG_DIR_NAME / DEFAULTS_FILE_NAME;
}

static InstanceDefaults read_instance(const YAML::Node& n) {
    InstanceDefaults d;
    d.keyfile = n["keyfile"].as<std::string>("");
    d.username = n["username"].as<std::string>("");
    d.hostkey = n["hostkey"].as<std::string>("");
    d.output = n["output"].as<std::string>("");
    d.email = n["email"].as<std::string>("");
    d.shutdown = n["shutdown"].as<bool>(false);
    d.profile = n["profile"].as<std::string>("");
    d.region = n["region"].as<std::string>("");
    return d;
}

Result<DefaultsStore> DefaultsStore::load(const fs::path& path) {
    DefaultsStore store(path);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<DefaultsStore>::Ok(store);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root || root.IsNull()) {
            return Result<DefaultsStore>::Ok(store);
        }
        if (!root.IsMap()) {
            return Result<DefaultsStore>::Err(ErrorKind::ConfigInvalid,
                fmt::format("{}: expected a mapping at the top level", path.string()));
        }

        store.default_instance_ = root["default_instance"].as<std::string>("");

        const YAML::Node instances = root["instances"];
        if (instances && instances.IsMap()) {
            for (const auto& entry : instances) {
                auto id = entry.first.as<std::string>();
                if (!entry.second.IsMap()) continue;
                store.instances_[id] = read_instance(entry.second);
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<DefaultsStore>::Err(ErrorKind::ConfigInvalid,
            fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }

    return Result<DefaultsStore>::Ok(store);
}

Result<void> DefaultsStore::save() const {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::ConfigInvalid,
            fmt::format("Cannot create {}: {}", path_.parent_path().string(), ec.message()));
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "default_instance" << YAML::Value << default_instance_;
    out << YAML::Key << "instances" << YAML::Value << YAML::BeginMap;
    for (const auto& [id, d] : instances_) {
        out << YAML::Key << id << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "keyfile" << YAML::Value << d.keyfile;
        out << YAML::Key << "username" << YAML::Value << d.username;
        out << YAML::Key << "hostkey" << YAML::Value << d.hostkey;
        out << YAML::Key << "output" << YAML::Value << d.output;
        out << YAML::Key << "email" << YAML::Value << d.email;
        out << YAML::Key << "shutdown" << YAML::Value << d.shutdown;
        out << YAML::Key << "profile" << YAML::Value << d.profile;
        out << YAML::Key << "region" << YAML::Value << d.region;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;

    std::ofstream fout(path_.string());
    if (!fout) {
        return Result<void>::Err(ErrorKind::ConfigInvalid,
                                 "Cannot write defaults file " + path_.string());
    }
    fout << out.c_str() << "\n";
    if (!fout) {
        return Result<void>::Err(ErrorKind::ConfigInvalid,
                                 "Error writing defaults file " + path_.string());
    }
    return Result<void>::Ok();
}

const InstanceDefaults* DefaultsStore::find(const std::string& instance_id) const {
    auto it = instances_.find(instance_id);
    return it == instances_.end() ? nullptr : &it->second;
}

void DefaultsStore::store(const std::string& instance_id, const InstanceDefaults& values,
                          bool make_primary) {
    instances_[instance_id] = values;
    if (make_primary) {
        default_instance_ = instance_id;
    }
}

// ── Merge ────────────────────────────────────────────────────

static void overlay(std::string& field, const std::optional<std::string>& given) {
    if (given) field = *given;
}

Result<Settings> merge_settings(const DefaultsStore& store, const SettingOverrides& overrides) {
    Settings s;
    if (overrides.instance_id && !overrides.instance_id->empty()) {
        s.instance_id = *overrides.instance_id;
    } else if (!store.default_instance().empty()) {
        s.instance_id = store.default_instance();
    } else {
        return Result<Settings>::Err(ErrorKind::ConfigInvalid,
            "Require either an instance ID on the command line or a default primary instance");
    }

    if (const InstanceDefaults* stored = store.find(s.instance_id)) {
        s.values = *stored;
    }

    overlay(s.values.keyfile, overrides.keyfile);
    overlay(s.values.username, overrides.username);
    overlay(s.values.hostkey, overrides.hostkey);
    overlay(s.values.output, overrides.output);
    overlay(s.values.email, overrides.email);
    overlay(s.values.profile, overrides.profile);
    overlay(s.values.region, overrides.region);
    if (overrides.shutdown) s.values.shutdown = *overrides.shutdown;

    return Result<Settings>::Ok(s);
}

// ── Host key lookup ──────────────────────────────────────────

fs::path default_known_hosts() {
    return platform::home_dir() / ".ssh" / "known_hosts";
}

std::string lookup_known_host(const std::string& instance_id, const fs::path& known_hosts) {
    std::ifstream in(known_hosts);
    if (!in || instance_id.empty()) return "";

    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto sep = line.find_first_of(" \t");
        if (sep == std::string::npos) continue;
        if (line.compare(0, sep, instance_id) != 0) continue;

        return trimmed(line.substr(sep));
    }
    return "";
}

// ── Validation ───────────────────────────────────────────────

bool valid_email_address(const std::string& address) {
    auto at = address.find('@');
    if (at == std::string::npos || at == 0 || at == address.size() - 1) return false;
    if (address.find('@', at + 1) != std::string::npos) return false;
    if (address.find_first_of(" \t\r\n<>,;\"") != std::string::npos) return false;

    std::string domain = address.substr(at + 1);
    return domain.front() != '.' && domain.back() != '.';
}

Result<void> validate_settings(const Settings& settings, bool require_output) {
    const auto& v = settings.values;

    if (settings.instance_id.empty()) {
        return Result<void>::Err(ErrorKind::ConfigInvalid, "Require EC2 instance ID to be specified");
    }
    if (v.username.empty()) {
        return Result<void>::Err(ErrorKind::ConfigInvalid, "Require SSH username to be specified");
    }
    if (v.keyfile.empty()) {
        return Result<void>::Err(ErrorKind::ConfigInvalid, "Require SSH private key file to be specified");
    }
    std::error_code ec;
    if (!fs::exists(v.keyfile, ec)) {
        return Result<void>::Err(ErrorKind::ConfigInvalid,
                                 "Cannot locate SSH private key file " + v.keyfile);
    }
    if (require_output && v.output.empty()) {
        return Result<void>::Err(ErrorKind::ConfigInvalid, "Require result S3 bucket to be specified");
    }
    if (!v.email.empty() && !valid_email_address(v.email)) {
        return Result<void>::Err(ErrorKind::ConfigInvalid,
                                 fmt::format("Invalid email address '{}'", v.email));
    }
    return Result<void>::Ok();
}
