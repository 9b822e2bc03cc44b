// In-memory SftpClient for tests and offline runs. Entries keep insertion
// order, as a server's readdir would.
#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace romfetch {

class MockSftpClient : public SftpClient {
public:
    // Called on the reading thread before each block, with the file offset.
    using ReadHook =
        std::function<void(const std::string &path, std::uint64_t offset)>;

    MockSftpClient();

    bool connect(const SessionOptions &opt, std::string &err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool list(const std::string &remote_path, std::vector<FileInfo> &out,
              std::string &err) override;
    bool stat(const std::string &remote_path, FileInfo &info,
              std::string &err) override;
    std::unique_ptr<RemoteFileReader> openRead(const std::string &remote_path,
                                               std::string &err) override;

    // Tree setup. Missing parent directories are created.
    void addDirectory(const std::string &path);
    void addFile(const std::string &path, std::string contents);
    void addSymlink(const std::string &path, const std::string &target);

    // Fault injection.
    void failListing(const std::string &path,
                     std::string error = "Permission denied");
    void failStat(const std::string &path);
    void failOpen(const std::string &path);
    void failReadAt(const std::string &path, std::uint64_t offset);
    void reportSize(const std::string &path, std::uint64_t size);

    // Connection behaviour.
    void requirePassword(std::string password) { password_ = password; }
    void setReadAheadSupported(bool on) { readAhead_ = on; }
    void setReadHook(ReadHook hook);

    const SessionOptions &lastOptions() const { return lastOpt_; }
    std::size_t listCalls(const std::string &path) const;
    int disconnectCount() const { return disconnects_; }
    int maxConcurrentReaders() const { return maxReaders_.load(); }
    bool readAheadRequested() const { return readAheadRequested_.load(); }

private:
    struct Node {
        FileInfo info;
        std::string contents;
        std::vector<std::string> children; // insertion order
        std::optional<std::string> listError;
        std::optional<std::uint64_t> failReadAt;
        std::optional<std::uint64_t> reportedSize;
        bool failStat = false;
        bool failOpen = false;
    };
    class Reader;

    Node &ensureNode(const std::string &path, bool isDir);
    static std::string normalize(const std::string &path);

    bool connected_ = false;
    int disconnects_ = 0;
    SessionOptions lastOpt_{};
    std::optional<std::string> password_;
    bool readAhead_ = true;

    mutable std::mutex mtx_; // protects nodes_, listCalls_, hook_
    std::map<std::string, Node> nodes_;
    std::map<std::string, std::size_t> listCalls_;
    ReadHook hook_;

    std::atomic<int> activeReaders_{0};
    std::atomic<int> maxReaders_{0};
    std::atomic<bool> readAheadRequested_{false};
};

} // namespace romfetch
