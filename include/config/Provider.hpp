#pragma once

#include "sync/model/SftpConfig.hpp"
#include "jellyfin/model/Config.hpp"

#include <functional>
#include <optional>

namespace sm::config {

// Source of the decrypted sync / media-server configuration. std::nullopt means
// "not configured".
class Provider {
public:
    using Listener = std::function<void(const std::optional<sync::model::SftpConfig>&)>;

    virtual ~Provider() = default;

    [[nodiscard]] virtual std::optional<sync::model::SftpConfig> sftp() const = 0;
    [[nodiscard]] virtual std::optional<jellyfin::model::Config> jellyfin() const = 0;

    // Called with the new SftpConfig snapshot whenever it changes.
    virtual void onChanged(Listener listener) = 0;
};

}
