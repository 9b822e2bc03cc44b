#include "romfetch/MockSftpClient.hpp"

#include <algorithm>
#include <cstring>

namespace romfetch {

class MockSftpClient::Reader : public RemoteFileReader {
public:
    Reader(MockSftpClient &owner, std::string path, std::string contents,
           std::optional<std::uint64_t> failAt, ReadHook hook)
        : owner_(owner), path_(std::move(path)), contents_(std::move(contents)),
          failAt_(failAt), hook_(std::move(hook)) {
        const int now = ++owner_.activeReaders_;
        int prev = owner_.maxReaders_.load();
        while (now > prev && !owner_.maxReaders_.compare_exchange_weak(prev, now)) {
        }
    }
    ~Reader() override { --owner_.activeReaders_; }

    bool enableReadAhead() override {
        owner_.readAheadRequested_ = true;
        return owner_.readAhead_;
    }

    std::int64_t read(char *buf, std::size_t len, std::string &err) override {
        if (hook_)
            hook_(path_, offset_);
        if (failAt_ && offset_ >= *failAt_) {
            err = "Simulated read failure at offset " + std::to_string(offset_);
            return -1;
        }
        std::uint64_t end = std::min<std::uint64_t>(offset_ + len, contents_.size());
        if (failAt_)
            end = std::min<std::uint64_t>(end, *failAt_);
        const auto n = static_cast<std::size_t>(end - offset_);
        if (n > 0)
            std::memcpy(buf, contents_.data() + offset_, n);
        offset_ = end;
        return static_cast<std::int64_t>(n);
    }

private:
    MockSftpClient &owner_;
    std::string path_;
    std::string contents_;
    std::optional<std::uint64_t> failAt_;
    ReadHook hook_;
    std::uint64_t offset_ = 0;
};

MockSftpClient::MockSftpClient() { ensureNode("/", true); }

std::string MockSftpClient::normalize(const std::string &path) {
    std::string p = path.empty() ? "/" : path;
    if (p.front() != '/')
        p.insert(p.begin(), '/');
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    return p;
}

MockSftpClient::Node &MockSftpClient::ensureNode(const std::string &path,
                                                 bool isDir) {
    const std::string p = normalize(path);
    auto it = nodes_.find(p);
    if (it != nodes_.end())
        return it->second;

    Node node;
    const auto slash = p.rfind('/');
    node.info.name = p == "/" ? "/" : p.substr(slash + 1);
    node.info.is_dir = isDir;
    node.info.mode = isDir ? (kModeDirectory | 0755) : (kModeRegular | 0644);
    if (p != "/") {
        const std::string parent = slash == 0 ? "/" : p.substr(0, slash);
        ensureNode(parent, true).children.push_back(p);
    }
    return nodes_.emplace(p, std::move(node)).first->second;
}

bool MockSftpClient::connect(const SessionOptions &opt, std::string &err) {
    lastOpt_ = opt;
    if (opt.host.empty() || opt.username.empty()) {
        err = "Host and user are required";
        return false;
    }
    if (password_ && (!opt.password || *opt.password != *password_)) {
        err = "Authentication failed";
        return false;
    }
    connected_ = true;
    return true;
}

void MockSftpClient::disconnect() {
    if (connected_)
        ++disconnects_;
    connected_ = false;
}

bool MockSftpClient::list(const std::string &remote_path,
                          std::vector<FileInfo> &out, std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    const std::string p = normalize(remote_path);
    std::lock_guard<std::mutex> lk(mtx_);
    ++listCalls_[p];
    auto it = nodes_.find(p);
    if (it == nodes_.end() || !it->second.info.is_dir) {
        err = "No such directory: " + p;
        return false;
    }
    if (it->second.listError) {
        err = *it->second.listError;
        return false;
    }
    out.clear();
    for (const auto &child : it->second.children)
        out.push_back(nodes_.at(child).info);
    return true;
}

bool MockSftpClient::stat(const std::string &remote_path, FileInfo &info,
                          std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    const std::string p = normalize(remote_path);
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(p);
    if (it == nodes_.end()) {
        err = "No such file: " + p;
        return false;
    }
    if (it->second.failStat) {
        err = "Simulated stat failure";
        return false;
    }
    info = it->second.info;
    if (it->second.reportedSize)
        info.size = *it->second.reportedSize;
    return true;
}

std::unique_ptr<RemoteFileReader>
MockSftpClient::openRead(const std::string &remote_path, std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return nullptr;
    }
    const std::string p = normalize(remote_path);
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(p);
    if (it == nodes_.end() || it->second.info.is_dir) {
        err = "No such file: " + p;
        return nullptr;
    }
    if (it->second.failOpen) {
        err = "Simulated open failure";
        return nullptr;
    }
    return std::make_unique<Reader>(*this, p, it->second.contents,
                                    it->second.failReadAt, hook_);
}

void MockSftpClient::addDirectory(const std::string &path) {
    std::lock_guard<std::mutex> lk(mtx_);
    ensureNode(path, true);
}

void MockSftpClient::addFile(const std::string &path, std::string contents) {
    std::lock_guard<std::mutex> lk(mtx_);
    Node &n = ensureNode(path, false);
    n.info.size = contents.size();
    n.contents = std::move(contents);
}

void MockSftpClient::addSymlink(const std::string &path,
                                const std::string &target) {
    std::lock_guard<std::mutex> lk(mtx_);
    Node &n = ensureNode(path, false);
    n.info.is_symlink = true;
    n.info.mode = kModeSymlink | 0777;
    n.contents = target;
    n.info.size = target.size();
}

void MockSftpClient::failListing(const std::string &path, std::string error) {
    std::lock_guard<std::mutex> lk(mtx_);
    ensureNode(path, true).listError = std::move(error);
}

void MockSftpClient::failStat(const std::string &path) {
    std::lock_guard<std::mutex> lk(mtx_);
    ensureNode(path, false).failStat = true;
}

void MockSftpClient::failOpen(const std::string &path) {
    std::lock_guard<std::mutex> lk(mtx_);
    ensureNode(path, false).failOpen = true;
}

void MockSftpClient::failReadAt(const std::string &path,
                                std::uint64_t offset) {
    std::lock_guard<std::mutex> lk(mtx_);
    ensureNode(path, false).failReadAt = offset;
}

void MockSftpClient::reportSize(const std::string &path, std::uint64_t size) {
    std::lock_guard<std::mutex> lk(mtx_);
    ensureNode(path, false).reportedSize = size;
}

void MockSftpClient::setReadHook(ReadHook hook) {
    std::lock_guard<std::mutex> lk(mtx_);
    hook_ = std::move(hook);
}

std::size_t MockSftpClient::listCalls(const std::string &path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = listCalls_.find(normalize(path));
    return it == listCalls_.end() ? 0 : it->second;
}

} // namespace romfetch
