#pragma once

#include <string>
#include "types.hpp"

// Everything needed to authenticate one SSH connection. Immutable once built;
// the same value can be reused for any number of sequential connections.
struct Credentials {
    std::string host_key;           // "ssh-ed25519 AAAA..." pinned server key
    std::string username;           // login principal
    std::string private_key_path;   // PEM/OpenSSH private key file

    // Non-empty fields, and a private key path naming a readable regular file.
    Result<void> validate() const;
};
