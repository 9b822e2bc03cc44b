#include "romfetch/RemoteSearch.hpp"
#include "romfetch/NotificationBus.hpp"
#include "romfetch/RuntimeLogging.hpp"

#include <cctype>

namespace romfetch {

namespace {

std::string lowered(std::string s) {
    for (char &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string trimmed(const std::string &s) {
    std::size_t start = 0;
    while (start < s.size() &&
           std::isspace(static_cast<unsigned char>(s[start])))
        ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return s.substr(start, end - start);
}

std::string withoutTrailingSlash(const std::string &p) {
    std::string out = p;
    while (out.size() > 1 && out.back() == '/')
        out.pop_back();
    return out;
}

} // namespace

std::string joinRemotePath(const std::string &base, const std::string &name) {
    if (base.empty())
        return std::string("/") + name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

bool listPlatforms(SftpClient &client, const std::string &root,
                   std::vector<std::string> &out, std::string &err,
                   NotificationBus *bus) {
    out.clear();
    std::vector<FileInfo> entries;
    if (!client.list(root, entries, err)) {
        if (bus)
            bus->error("Could not list " + root + ": " + err);
        logMessage(LogLevel::Warning,
                   "List platforms failed for " + root + ": " + err);
        return false;
    }
    for (const auto &e : entries) {
        if (e.is_dir && !e.is_symlink)
            out.push_back(e.name);
    }
    return true;
}

RemoteWalker::RemoteWalker(SftpClient &client, std::string top,
                           NotificationBus *bus)
    : client_(client), bus_(bus) {
    pending_.push_back(withoutTrailingSlash(top));
}

bool RemoteWalker::next(WalkEntry &out) {
    while (!pending_.empty()) {
        std::string dir = std::move(pending_.back());
        pending_.pop_back();
        if (!visited_.insert(dir).second)
            continue;

        std::vector<FileInfo> entries;
        std::string err;
        if (!client_.list(dir, entries, err)) {
            ++failed_;
            if (bus_)
                bus_->error("Cannot access " + dir + ": " + err);
            logMessage(LogLevel::Warning,
                       "Walk skipped " + dir + ": " + err);
            continue;
        }

        out.dir = dir;
        out.subdirs.clear();
        out.files.clear();
        for (auto &e : entries) {
            if (e.is_symlink)
                continue;
            if (e.is_dir)
                out.subdirs.push_back(e.name);
            else
                out.files.push_back(e.name);
        }
        // Reverse push keeps the server order when popping.
        for (auto it = out.subdirs.rbegin(); it != out.subdirs.rend(); ++it)
            pending_.push_back(joinRemotePath(dir, *it));
        return true;
    }
    return false;
}

std::vector<std::string> searchRemote(SftpClient &client,
                                      const std::string &baseDir,
                                      const std::string &query,
                                      std::size_t limit, NotificationBus *bus) {
    std::vector<std::string> results;
    const std::string q = lowered(trimmed(query));
    if (q.empty() || limit == 0)
        return results;

    RemoteWalker walker(client, baseDir, bus);
    WalkEntry entry;
    while (walker.next(entry)) {
        for (const auto &name : entry.files) {
            if (lowered(name).find(q) == std::string::npos)
                continue;
            results.push_back(joinRemotePath(entry.dir, name));
            if (results.size() >= limit)
                return results;
        }
    }
    return results;
}

} // namespace romfetch
