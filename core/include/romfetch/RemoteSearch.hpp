// Remote tree traversal and file-name search.
#pragma once
#include "SftpClient.hpp"
#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace romfetch {

class NotificationBus;

inline constexpr std::size_t kDefaultSearchLimit = 2000;

// Joins a remote directory and a child name with exactly one '/'.
std::string joinRemotePath(const std::string &base, const std::string &name);

// Immediate subdirectories of `root`, in server order. Classification uses
// the entry type bits. On failure `out` is empty, `err` is set and the error
// is published when `bus` is given.
bool listPlatforms(SftpClient &client, const std::string &root,
                   std::vector<std::string> &out, std::string &err,
                   NotificationBus *bus = nullptr);

struct WalkEntry {
    std::string dir;
    std::vector<std::string> subdirs;
    std::vector<std::string> files;
};

// Depth-first pre-order walk driven by an explicit stack. Symbolic links are
// neither files nor directories and are never followed. A directory that
// cannot be listed is reported and its subtree dropped; the walk goes on with
// the remaining siblings.
class RemoteWalker {
public:
    RemoteWalker(SftpClient &client, std::string top,
                 NotificationBus *bus = nullptr);

    // Produces the next directory. Returns false once the tree is exhausted.
    bool next(WalkEntry &out);

    std::size_t failedDirectories() const { return failed_; }

private:
    SftpClient &client_;
    NotificationBus *bus_;
    std::vector<std::string> pending_;
    std::unordered_set<std::string> visited_;
    std::size_t failed_ = 0;
};

// Absolute paths of files whose name contains `query`, ignoring case, in walk
// order. A blank query returns no results. Stops after `limit` matches.
std::vector<std::string> searchRemote(SftpClient &client,
                                      const std::string &baseDir,
                                      const std::string &query,
                                      std::size_t limit = kDefaultSearchLimit,
                                      NotificationBus *bus = nullptr);

} // namespace romfetch
