// Basic types shared between the core engine and the front-end.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace romfetch {

// Remote root that holds one directory per platform.
inline constexpr const char *kRemoteRoot = "/roms";

// Host key validation policy against known_hosts.
enum class KnownHostsPolicy {
    Strict,    // Requires an exact match in known_hosts.
    AcceptNew, // TOFU: accept and store new hosts, reject changed keys.
    Off        // No verification.
};

// POSIX file type bits as carried in SFTP attributes.
inline constexpr std::uint32_t kModeTypeMask = 0170000;
inline constexpr std::uint32_t kModeDirectory = 0040000;
inline constexpr std::uint32_t kModeRegular = 0100000;
inline constexpr std::uint32_t kModeSymlink = 0120000;

struct FileInfo {
    std::string name; // base name
    bool is_dir = false;
    bool is_symlink = false;
    std::uint64_t size = 0;  // bytes
    std::uint64_t mtime = 0; // epoch seconds
    std::uint32_t mode = 0;  // POSIX bits (type and permissions)
};

inline bool modeIsDirectory(std::uint32_t mode) {
    return (mode & kModeTypeMask) == kModeDirectory;
}

inline bool modeIsSymlink(std::uint32_t mode) {
    return (mode & kModeTypeMask) == kModeSymlink;
}

// Ciphers tried first during negotiation, most preferred first.
inline std::vector<std::string> defaultPreferredCiphers() {
    return {"chacha20-poly1305@openssh.com", "aes128-gcm@openssh.com",
            "aes256-gcm@openssh.com", "aes128-ctr", "aes256-ctr"};
}

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;
    std::optional<std::string> password;

    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Empty list leaves the library defaults untouched.
    std::vector<std::string> preferred_ciphers = defaultPreferredCiphers();

    // Asked when known_hosts has no entry under AcceptNew.
    std::function<bool(const std::string &host, std::uint16_t port,
                       const std::string &algorithm,
                       const std::string &fingerprint)>
        hostkey_confirm_cb;
};

} // namespace romfetch
