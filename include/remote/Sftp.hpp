#pragma once

#include "remote/FileSystem.hpp"

#include <cstdint>
#include <string>

// libssh2's internal types
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace sm::remote {

// FileSystem over SFTP (libssh2, password auth). Readers handed out by openRead()
// must be destroyed before disconnect() or the destructor.
class Sftp final : public FileSystem {
public:
    explicit Sftp(unsigned int connectTimeoutSeconds = 20);
    ~Sftp() override;

    Sftp(const Sftp&) = delete;
    Sftp& operator=(const Sftp&) = delete;

    void connect(const sync::model::SftpConfig& cfg) override;
    void disconnect() noexcept override;

    [[nodiscard]] std::vector<model::Entry> list(const std::string& dir) override;
    [[nodiscard]] model::Entry stat(const std::string& path) override;
    [[nodiscard]] std::unique_ptr<Reader> openRead(const std::string& path) override;

private:
    unsigned int connectTimeoutSeconds_;
    int sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr;
    _LIBSSH2_SFTP* sftp_ = nullptr;

    void tcpConnect(const std::string& host, uint16_t port);
    void sshHandshakeAuth(const std::string& username, const std::string& password);
    void requireConnected() const;

    [[nodiscard]] std::string lastError() const;
};

}
