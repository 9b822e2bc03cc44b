#include "romfetch/ConnectionUri.hpp"
#include "romfetch/RuntimeLogging.hpp"

#include <cctype>

namespace romfetch {

namespace {

bool parsePort(const std::string &raw, std::uint16_t &port) {
    if (raw.empty() || raw.size() > 5)
        return false;
    unsigned long n = 0;
    for (char c : raw) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
        n = n * 10 + static_cast<unsigned long>(c - '0');
    }
    if (n < 1 || n > 65535)
        return false;
    port = static_cast<std::uint16_t>(n);
    return true;
}

} // namespace

bool parseConnectionUri(const std::string &uri, SessionOptions &out,
                        std::string &err) {
    const std::string prefix = "sftp://";
    bool schemeOk = uri.size() >= prefix.size();
    for (std::size_t i = 0; schemeOk && i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(uri[i])) != prefix[i])
            schemeOk = false;
    }
    if (!schemeOk) {
        err = "Connection string must start with sftp://";
        return false;
    }

    std::string rest = uri.substr(prefix.size());
    // Anything after the authority is ignored: the remote root is fixed.
    const auto slash = rest.find('/');
    if (slash != std::string::npos)
        rest.erase(slash);

    std::string userinfo;
    std::string hostport = rest;
    const auto at = rest.rfind('@');
    if (at != std::string::npos) {
        userinfo = rest.substr(0, at);
        hostport = rest.substr(at + 1);
    }

    // Credentials are taken verbatim, '%' included.
    std::string user;
    std::optional<std::string> password;
    if (!userinfo.empty()) {
        const auto colon = userinfo.find(':');
        user = userinfo.substr(0, colon);
        if (colon != std::string::npos)
            password = userinfo.substr(colon + 1);
    }
    if (user.empty()) {
        err = "Connection string has no user name";
        return false;
    }

    std::string host;
    std::string portStr;
    if (!hostport.empty() && hostport.front() == '[') {
        const auto close = hostport.find(']');
        if (close == std::string::npos) {
            err = "Unterminated IPv6 host";
            return false;
        }
        host = hostport.substr(1, close - 1);
        const std::string tail = hostport.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                err = "Unexpected text after IPv6 host";
                return false;
            }
            portStr = tail.substr(1);
            if (portStr.empty()) {
                err = "Empty port";
                return false;
            }
        }
    } else {
        const auto colon = hostport.rfind(':');
        host = hostport.substr(0, colon);
        if (colon != std::string::npos) {
            portStr = hostport.substr(colon + 1);
            if (portStr.empty()) {
                err = "Empty port";
                return false;
            }
        }
    }
    if (host.empty()) {
        err = "Connection string has no host";
        return false;
    }

    std::uint16_t port = 22;
    if (!portStr.empty() && !parsePort(portStr, port)) {
        err = "Invalid port: " + portStr;
        return false;
    }

    out.host = host;
    out.port = port;
    out.username = user;
    out.password = password;
    return true;
}

std::string describeConnection(const SessionOptions &opt) {
    std::string s = "sftp://" + opt.username;
    if (opt.password.has_value())
        s += ":" + (sensitiveLoggingEnabled() ? *opt.password
                                              : std::string("***"));
    const bool ipv6 = opt.host.find(':') != std::string::npos;
    s += "@" + (ipv6 ? "[" + opt.host + "]" : opt.host);
    s += ":" + std::to_string(opt.port);
    return s;
}

} // namespace romfetch
