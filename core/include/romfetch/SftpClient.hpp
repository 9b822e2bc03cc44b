// Abstract interface for the remote file service. Concrete backends (libssh2,
// mock) implement it so the engine stays independent of the transport.
#pragma once
#include "SftpTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace romfetch {

// Open remote file consumed sequentially.
class RemoteFileReader {
public:
    virtual ~RemoteFileReader() = default;

    // Ask the backend to keep several read requests in flight.
    // Returns false when the backend has no such hint.
    virtual bool enableReadAhead() { return false; }

    // Returns bytes read (> 0), 0 at end of file, or < 0 on error.
    virtual std::int64_t read(char *buf, std::size_t len, std::string &err) = 0;
};

class SftpClient {
public:
    virtual ~SftpClient() = default;

    virtual bool connect(const SessionOptions &opt, std::string &err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Entries of a remote directory without "." and "..", in server order.
    virtual bool list(const std::string &remote_path,
                      std::vector<FileInfo> &out, std::string &err) = 0;

    // Metadata of a remote path. Returns false if it cannot be read.
    virtual bool stat(const std::string &remote_path, FileInfo &info,
                      std::string &err) = 0;

    virtual std::unique_ptr<RemoteFileReader>
    openRead(const std::string &remote_path, std::string &err) = 0;
};

} // namespace romfetch
