#include "remote/Sftp.hpp"
#include "runtime/errors.hpp"
#include "sync/model/SftpConfig.hpp"
#include "log/Registry.hpp"

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cerrno>
#include <cstring>
#include <mutex>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace sm::remote;
using namespace sm::remote::model;
using namespace sm::runtime;
using namespace sm::log;

namespace {

void ensureLibssh2Init() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (libssh2_init(0) != 0) throw ConnectionFailure("libssh2_init failed");
    });
}

std::string joinPath(const std::string& dir, const std::string& name) {
    if (dir.empty() || dir == "/") return "/" + name;
    return dir.back() == '/' ? dir + name : dir + "/" + name;
}

std::string baseName(const std::string& path) {
    const auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

Entry fromAttrs(std::string name, std::string path, const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    Entry e;
    e.name = std::move(name);
    e.path = std::move(path);
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) e.is_dir = LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) e.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) e.mtime = static_cast<std::time_t>(attrs.mtime);
    return e;
}

struct HandleCloser {
    void operator()(LIBSSH2_SFTP_HANDLE* h) const noexcept { if (h) libssh2_sftp_close_handle(h); }
};

using HandlePtr = std::unique_ptr<LIBSSH2_SFTP_HANDLE, HandleCloser>;

class SftpReader final : public Reader {
public:
    SftpReader(HandlePtr handle, std::string path) : handle_(std::move(handle)), path_(std::move(path)) {}

    size_t read(char* buf, const size_t len) override {
        const auto n = libssh2_sftp_read(handle_.get(), buf, len);
        if (n < 0) throw TransferFailure("SFTP read failed for " + path_ + " (code " + std::to_string(n) + ")");
        return static_cast<size_t>(n);
    }

private:
    HandlePtr handle_;
    std::string path_;
};

}

Sftp::Sftp(const unsigned int connectTimeoutSeconds) : connectTimeoutSeconds_(connectTimeoutSeconds) {}

Sftp::~Sftp() { disconnect(); }

void Sftp::connect(const sync::model::SftpConfig& cfg) {
    disconnect();
    ensureLibssh2Init();

    try {
        tcpConnect(cfg.host, cfg.port);
        sshHandshakeAuth(cfg.username, cfg.password);
    } catch (...) {
        disconnect();
        throw;
    }

    Registry::remote()->info("[Sftp] Connected to {}@{}:{}", cfg.username, cfg.host, cfg.port);
}

void Sftp::tcpConnect(const std::string& host, const uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    const auto portStr = std::to_string(port);
    if (const int rc = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res); rc != 0)
        throw ConnectionFailure("Cannot resolve " + host + ": " + gai_strerror(rc));

    std::string lastErr = "no usable address";
    for (auto* ai = res; ai; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) { lastErr = std::strerror(errno); continue; }

        const int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            pollfd pfd{fd, POLLOUT, 0};
            rc = ::poll(&pfd, 1, static_cast<int>(connectTimeoutSeconds_ * 1000));
            if (rc == 0) {
                lastErr = "connection timed out";
                rc = -1;
            } else if (rc > 0) {
                int soErr = 0;
                socklen_t len = sizeof(soErr);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &soErr, &len);
                if (soErr != 0) lastErr = std::strerror(soErr);
                rc = soErr == 0 ? 0 : -1;
            } else {
                lastErr = std::strerror(errno);
            }
        } else if (rc != 0) {
            lastErr = std::strerror(errno);
        }

        if (rc == 0) {
            fcntl(fd, F_SETFL, flags);
            sock_ = fd;
            break;
        }
        ::close(fd);
    }
    freeaddrinfo(res);

    if (sock_ < 0) throw ConnectionFailure("Cannot connect to " + host + ":" + portStr + ": " + lastErr);
}

void Sftp::sshHandshakeAuth(const std::string& username, const std::string& password) {
    session_ = libssh2_session_init();
    if (!session_) throw ConnectionFailure("libssh2_session_init failed");

    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, static_cast<long>(connectTimeoutSeconds_) * 1000);

    if (libssh2_session_handshake(session_, sock_) != 0)
        throw ConnectionFailure("SSH handshake failed: " + lastError());

    if (libssh2_userauth_password(session_, username.c_str(), password.c_str()) != 0)
        throw ConnectionFailure("SSH authentication failed for " + username + ": " + lastError());

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) throw ConnectionFailure("SFTP subsystem unavailable: " + lastError());
}

void Sftp::disconnect() noexcept {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "Normal Shutdown");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ >= 0) {
        ::close(sock_);
        sock_ = -1;
    }
}

void Sftp::requireConnected() const {
    if (!sftp_) throw ConnectionFailure("SFTP session is not connected");
}

std::string Sftp::lastError() const {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    std::string out = msg ? std::string(msg, static_cast<size_t>(len)) : std::string("unknown error");
    if (sftp_) out += " (sftp code " + std::to_string(libssh2_sftp_last_error(sftp_)) + ")";
    return out;
}

std::vector<Entry> Sftp::list(const std::string& dir) {
    requireConnected();

    const HandlePtr handle(libssh2_sftp_opendir(sftp_, dir.c_str()));
    if (!handle) throw TransferFailure("Cannot list " + dir + ": " + lastError());

    std::vector<Entry> out;
    char name[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs{};

    while (true) {
        const int rc = libssh2_sftp_readdir_ex(handle.get(), name, sizeof(name), longentry, sizeof(longentry), &attrs);
        if (rc == 0) break;
        if (rc < 0) throw TransferFailure("Error reading directory " + dir + ": " + lastError());

        std::string entryName(name, static_cast<size_t>(rc));
        if (entryName == "." || entryName == "..") continue;
        auto path = joinPath(dir, entryName);
        out.push_back(fromAttrs(std::move(entryName), std::move(path), attrs));
    }

    return out;
}

Entry Sftp::stat(const std::string& path) {
    requireConnected();

    LIBSSH2_SFTP_ATTRIBUTES attrs{};
    if (libssh2_sftp_stat(sftp_, path.c_str(), &attrs) != 0)
        throw TransferFailure("Cannot stat " + path + ": " + lastError());

    return fromAttrs(baseName(path), path, attrs);
}

std::unique_ptr<Reader> Sftp::openRead(const std::string& path) {
    requireConnected();

    HandlePtr handle(libssh2_sftp_open(sftp_, path.c_str(), LIBSSH2_FXF_READ, 0));
    if (!handle) throw TransferFailure("Cannot open " + path + ": " + lastError());

    return std::make_unique<SftpReader>(std::move(handle), path);
}
