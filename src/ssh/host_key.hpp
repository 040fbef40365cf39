#pragma once

#include <string>
#include <core/types.hpp>

enum class HostKeyType {
    Ed25519,
    EcdsaP256,
    EcdsaP384,
    EcdsaP521,
    Rsa,
};

// A pinned server identity, parsed from the "algorithm base64 [comment]"
// text used by authorized_keys and known_hosts.
struct HostKey {
    HostKeyType type;
    std::string type_name;   // e.g. "ssh-ed25519"
    std::string blob;        // decoded SSH wire-format public key
    std::string comment;

    // Host key algorithms to offer during negotiation. Only algorithms that
    // verify with this key's type are listed.
    std::string algorithm_prefs() const;

    // Byte-for-byte comparison against the key the server presented.
    bool matches(const std::string& presented_blob) const;

    // "ssh-ed25519 AAAA..." form, without the comment.
    std::string to_text() const;
};

// Parse fingerprint text. Fails with InvalidHostKey when the text is empty,
// names an unsupported algorithm, is not valid base64, or encodes a key whose
// embedded algorithm differs from the declared one.
Result<HostKey> parse_host_key(const std::string& text);

// Read the algorithm name stored at the start of a wire-format key blob.
// Returns "" if the blob is too short to hold one.
std::string blob_type_name(const std::string& blob);
