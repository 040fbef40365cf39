#include "host_key.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cstdint>

namespace {

struct KeyTypeInfo {
    const char* name;
    HostKeyType type;
    const char* prefs;
};

// RSA keys sign with three hash variants; all of them verify against the
// same pinned key, so offering them together cannot pick a different key.
const KeyTypeInfo KEY_TYPES[] = {
    {"ssh-ed25519",         HostKeyType::Ed25519,   "ssh-ed25519"},
    {"ecdsa-sha2-nistp256", HostKeyType::EcdsaP256, "ecdsa-sha2-nistp256"},
    {"ecdsa-sha2-nistp384", HostKeyType::EcdsaP384, "ecdsa-sha2-nistp384"},
    {"ecdsa-sha2-nistp521", HostKeyType::EcdsaP521, "ecdsa-sha2-nistp521"},
    {"ssh-rsa",             HostKeyType::Rsa,       "rsa-sha2-512,rsa-sha2-256,ssh-rsa"},
};

const KeyTypeInfo* find_type(const std::string& name) {
    for (const auto& info : KEY_TYPES) {
        if (name == info.name) return &info;
    }
    return nullptr;
}

const KeyTypeInfo* find_type(HostKeyType type) {
    for (const auto& info : KEY_TYPES) {
        if (type == info.type) return &info;
    }
    return nullptr;
}

} // namespace

std::string blob_type_name(const std::string& blob) {
    if (blob.size() < 4) return "";
    const auto* p = reinterpret_cast<const unsigned char*>(blob.data());
    uint32_t len = (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
                   (uint32_t(p[2]) << 8) | uint32_t(p[3]);
    if (len == 0 || len > blob.size() - 4) return "";
    return blob.substr(4, len);
}

std::string HostKey::algorithm_prefs() const {
    const auto* info = find_type(type);
    return info ? info->prefs : "";
}

bool HostKey::matches(const std::string& presented_blob) const {
    return !blob.empty() && presented_blob == blob;
}

std::string HostKey::to_text() const {
    return type_name + " " + base64_encode(blob);
}

Result<HostKey> parse_host_key(const std::string& text) {
    auto fields = split_whitespace(trimmed(text));
    if (fields.empty()) {
        return Result<HostKey>::Err(ErrorKind::InvalidHostKey, "host key is empty");
    }
    if (fields.size() < 2) {
        return Result<HostKey>::Err(ErrorKind::InvalidHostKey,
            fmt::format("host key '{}' has no key data (expected '<algorithm> <base64>')",
                        fields[0]));
    }

    const auto* info = find_type(fields[0]);
    if (!info) {
        return Result<HostKey>::Err(ErrorKind::InvalidHostKey,
            fmt::format("unsupported host key algorithm '{}'", fields[0]));
    }

    HostKey key;
    key.type = info->type;
    key.type_name = info->name;
    if (!base64_decode(fields[1], key.blob)) {
        return Result<HostKey>::Err(ErrorKind::InvalidHostKey,
            fmt::format("host key data for {} is not valid base64", info->name));
    }

    std::string embedded = blob_type_name(key.blob);
    if (embedded != info->name) {
        return Result<HostKey>::Err(ErrorKind::InvalidHostKey,
            fmt::format("host key declares {} but encodes '{}'", info->name, embedded));
    }

    for (size_t i = 2; i < fields.size(); i++) {
        if (!key.comment.empty()) key.comment += " ";
        key.comment += fields[i];
    }
    return Result<HostKey>::Ok(key);
}
