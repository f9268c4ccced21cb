#pragma once

#include "remote/model/Entry.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sm::sync::model { struct SftpConfig; }

namespace sm::remote {

// Sequential reader over one remote file. read() returns 0 at EOF.
class Reader {
public:
    virtual ~Reader() = default;

    virtual size_t read(char* buf, size_t len) = 0;
};

// The remote side of a mirror. connect() throws runtime::ConnectionFailure;
// list/stat/openRead throw runtime::TransferFailure on I/O errors.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual void connect(const sync::model::SftpConfig& cfg) = 0;
    virtual void disconnect() noexcept = 0;

    [[nodiscard]] virtual std::vector<model::Entry> list(const std::string& dir) = 0;
    [[nodiscard]] virtual model::Entry stat(const std::string& path) = 0;
    [[nodiscard]] virtual std::unique_ptr<Reader> openRead(const std::string& path) = 0;
};

using FileSystemFactory = std::function<std::unique_ptr<FileSystem>()>;

}
