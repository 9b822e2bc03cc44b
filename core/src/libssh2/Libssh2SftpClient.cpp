// libssh2 backend: owns the TCP socket, the SSH session and the SFTP channel.
// Includes keepalive, cipher preference and known_hosts validation.
#include "romfetch/Libssh2SftpClient.hpp"
#include "romfetch/RuntimeLogging.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace romfetch {

namespace {

// libssh2 global initialization, once per process.
std::once_flag g_libssh2_once;

struct KbdIntCtx {
    const char *pass;
};

// keyboard-interactive: answer every prompt with the password.
void kbint_password_callback(const char *name, int name_len,
                             const char *instruction, int instruction_len,
                             int num_prompts,
                             const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                             LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                             void **abstract) {
    (void)name;
    (void)name_len;
    (void)instruction;
    (void)instruction_len;
    (void)prompts;
    if (!abstract || !*abstract)
        return;
    const KbdIntCtx *ctx = static_cast<const KbdIntCtx *>(*abstract);
    const char *pass = ctx->pass;
    const size_t plen = pass ? std::strlen(pass) : 0;
    for (int i = 0; i < num_prompts; ++i) {
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (plen == 0)
            continue;
        // libssh2 frees the responses with its allocator (malloc by default).
        char *buf = static_cast<char *>(std::malloc(plen + 1));
        if (!buf)
            continue;
        std::memcpy(buf, pass, plen);
        buf[plen] = '\0';
        responses[i].text = buf;
        responses[i].length = static_cast<unsigned int>(plen);
    }
}

std::string joinCiphers(const std::vector<std::string> &ciphers) {
    std::string out;
    for (const auto &c : ciphers) {
        if (c.empty())
            continue;
        if (!out.empty())
            out += ',';
        out += c;
    }
    return out;
}

void fillInfo(const LIBSSH2_SFTP_ATTRIBUTES &attrs, FileInfo &fi) {
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        fi.mode = static_cast<std::uint32_t>(attrs.permissions);
        fi.is_symlink = modeIsSymlink(fi.mode);
        fi.is_dir = modeIsDirectory(fi.mode);
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)
        fi.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
        fi.mtime = attrs.mtime;
}

// Sequential reader over an open SFTP handle.
class Libssh2FileReader : public RemoteFileReader {
public:
    explicit Libssh2FileReader(LIBSSH2_SFTP_HANDLE *h) : handle_(h) {}
    ~Libssh2FileReader() override {
        if (handle_)
            libssh2_sftp_close(handle_);
    }

    // libssh2_sftp_read already keeps several FXP_READ requests outstanding
    // when the buffer spans more than one packet, so large blocks are enough.
    bool enableReadAhead() override { return true; }

    std::int64_t read(char *buf, std::size_t len, std::string &err) override {
        ssize_t n = 0;
        for (;;) {
            n = libssh2_sftp_read(handle_, buf, len);
            if (n != LIBSSH2_ERROR_EAGAIN)
                break;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (n < 0) {
            err = "Remote read failed (libssh2 error " + std::to_string(n) + ")";
            return -1;
        }
        return static_cast<std::int64_t>(n);
    }

private:
    LIBSSH2_SFTP_HANDLE *handle_;
};

} // namespace

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_once, []() {
        if (libssh2_init(0) != 0)
            logMessage(LogLevel::Critical, "libssh2_init failed");
    });
}

Libssh2SftpClient::~Libssh2SftpClient() { disconnect(); }

std::string Libssh2SftpClient::lastError() const {
    if (!session_)
        return {};
    char *msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len))
                            : std::string();
}

bool Libssh2SftpClient::tcpConnect(const std::string &host, uint16_t port,
                                   std::string &err) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo *res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err = "Could not reach " + host + ":" + std::to_string(port);
    return false;
}

void Libssh2SftpClient::applyCipherPreference(const SessionOptions &opt) {
    const std::string prefs = joinCiphers(opt.preferred_ciphers);
    if (prefs.empty())
        return;
    // Unknown names are skipped by libssh2; a rejection keeps the defaults.
    const int cs = libssh2_session_method_pref(session_, LIBSSH2_METHOD_CRYPT_CS,
                                               prefs.c_str());
    const int sc = libssh2_session_method_pref(session_, LIBSSH2_METHOD_CRYPT_SC,
                                               prefs.c_str());
    if (cs != 0 || sc != 0)
        logMessage(LogLevel::Debug,
                   "Cipher preference not applied, using library defaults");
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions &opt,
                                      std::string &err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Could not initialize known_hosts";
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else {
        const char *home = std::getenv("HOME");
        if (home)
            khPath = std::string(home) + "/.ssh/known_hosts";
    }
    bool khLoaded = false;
    if (!khPath.empty())
        khLoaded = libssh2_knownhost_readfile(nh, khPath.c_str(),
                                              LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char *hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Could not read the server host key";
        return false;
    }

    int alg = 0;
    std::string algName = "UNKNOWN";
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        alg = LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        algName = "RSA";
        break;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        algName = "ECDSA-256";
        break;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        algName = "ECDSA-384";
        break;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
        algName = "ECDSA-521";
        break;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        alg = LIBSSH2_KNOWNHOST_KEY_ED25519;
        algName = "ED25519";
        break;
#endif
    default:
        break;
    }

    const int plainMask =
        LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    struct libssh2_knownhost *known = nullptr;
    const int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                               hostkey, keylen, plainMask,
                                               &known);
    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }
    if (check != LIBSSH2_KNOWNHOST_CHECK_NOTFOUND ||
        opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH
                  ? "Host key does not match known_hosts"
                  : "Host not present in known_hosts";
        return false;
    }

    // AcceptNew: confirm the fingerprint, then record it.
    std::string fpStr;
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
    const unsigned char *h = reinterpret_cast<const unsigned char *>(
        libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256));
    if (h) {
        std::ostringstream oss;
        oss << "SHA256:";
        for (int i = 0; i < 32; ++i) {
            if (i)
                oss << ':';
            char b[4];
            std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
            oss << b;
        }
        fpStr = oss.str();
    }
#endif
    const bool confirmed =
        !opt.hostkey_confirm_cb ||
        opt.hostkey_confirm_cb(opt.host, opt.port, algName, fpStr);
    if (!confirmed) {
        libssh2_knownhost_free(nh);
        err = "Unknown host: fingerprint not confirmed";
        return false;
    }
    if (!khPath.empty()) {
        const int added = libssh2_knownhost_addc(
            nh, opt.host.c_str(), nullptr, hostkey, keylen, nullptr, 0,
            plainMask, nullptr);
        if (added != 0 ||
            libssh2_knownhost_writefile(nh, khPath.c_str(),
                                        LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0)
            logMessage(LogLevel::Warning,
                       "Could not record host key in " + khPath);
    }
    libssh2_knownhost_free(nh);
    return true;
}

bool Libssh2SftpClient::authenticate(const SessionOptions &opt,
                                     std::string &err) {
    if (!opt.password.has_value()) {
        err = "No password in the connection string";
        return false;
    }

    int rc = 0;
    for (;;) {
        rc = libssh2_userauth_password(session_, opt.username.c_str(),
                                       opt.password->c_str());
        if (rc != LIBSSH2_ERROR_EAGAIN)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (rc == 0)
        return true;
    if (rc == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc == LIBSSH2_ERROR_SOCKET_SEND ||
        rc == LIBSSH2_ERROR_SOCKET_RECV) {
        err = "Server closed the connection after the password attempt";
        return false;
    }

    // Some servers only offer password logins through keyboard-interactive.
    const char *methods = libssh2_userauth_list(
        session_, opt.username.c_str(),
        static_cast<unsigned>(opt.username.size()));
    const std::string authlist = methods ? methods : "";
    if (authlist.find("keyboard-interactive") != std::string::npos) {
        KbdIntCtx ctx{opt.password->c_str()};
        void **abs = libssh2_session_abstract(session_);
        if (abs)
            *abs = &ctx;
        for (;;) {
            rc = libssh2_userauth_keyboard_interactive(
                session_, opt.username.c_str(), kbint_password_callback);
            if (rc != LIBSSH2_ERROR_EAGAIN)
                break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (abs)
            *abs = nullptr;
        if (rc == 0)
            return true;
    }

    const std::string detail = lastError();
    err = "Authentication failed" +
          (authlist.empty() ? std::string() : " (methods: " + authlist + ")") +
          (detail.empty() ? std::string() : ": " + detail);
    return false;
}

bool Libssh2SftpClient::connect(const SessionOptions &opt, std::string &err) {
    if (connected_) {
        err = "Already connected";
        return false;
    }
    if (!tcpConnect(opt.host, opt.port, err))
        return false;

    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        disconnect();
        return false;
    }
    applyCipherPreference(opt);

    if (libssh2_session_handshake(session_, sock_) != 0) {
        const std::string detail = lastError();
        err = "SSH handshake failed" + (detail.empty() ? "" : ": " + detail);
        disconnect();
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, 20000); // 20s
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err) || !authenticate(opt, err)) {
        disconnect();
        return false;
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "Could not start the SFTP subsystem";
        disconnect();
        return false;
    }
    connected_ = true;
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

bool Libssh2SftpClient::list(const std::string &remote_path,
                             std::vector<FileInfo> &out, std::string &err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    const std::string path = remote_path.empty() ? "/" : remote_path;

    LIBSSH2_SFTP_HANDLE *dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = "Cannot open directory " + path + " (SFTP error " +
              std::to_string(libssh2_sftp_last_error(sftp_)) + ")";
        return false;
    }

    out.clear();
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                         longentry, sizeof(longentry), &attrs);
        if (rc > 0) {
            FileInfo fi{};
            fi.name = std::string(filename, static_cast<size_t>(rc));
            if (fi.name == "." || fi.name == "..")
                continue;
            fillInfo(attrs, fi);
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break;
        } else {
            err = "Reading directory " + path + " failed";
            libssh2_sftp_closedir(dir);
            return false;
        }
    }
    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpClient::stat(const std::string &remote_path, FileInfo &info,
                             std::string &err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(),
                                  static_cast<unsigned>(remote_path.size()),
                                  LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        const unsigned long sftpErr = libssh2_sftp_last_error(sftp_);
        err = sftpErr == LIBSSH2_FX_NO_SUCH_FILE
                  ? "No such file: " + remote_path
                  : "Remote stat failed for " + remote_path;
        return false;
    }
    info = FileInfo{};
    const auto slash = remote_path.rfind('/');
    info.name = slash == std::string::npos ? remote_path
                                           : remote_path.substr(slash + 1);
    fillInfo(st, info);
    return true;
}

std::unique_ptr<RemoteFileReader>
Libssh2SftpClient::openRead(const std::string &remote_path, std::string &err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return nullptr;
    }
    LIBSSH2_SFTP_HANDLE *rh = libssh2_sftp_open_ex(
        sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err = "Cannot open " + remote_path + " for reading";
        return nullptr;
    }
    return std::make_unique<Libssh2FileReader>(rh);
}

} // namespace romfetch
