#pragma once

#include "config/Provider.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace YAML { class Node; }

namespace sm::config {

struct Sources {
    std::optional<sync::model::SftpConfig> sftp;
    std::optional<jellyfin::model::Config> jellyfin;

    bool operator==(const Sources&) const = default;
};

// Validates and converts a sources document. Throws runtime::InvalidConfig.
Sources parseSources(const YAML::Node& root);
Sources parseSources(const std::string& yaml);

// Provider over a YAML sources file with "sftp" and "jellyfin" sections.
class FileProvider final : public Provider {
public:
    explicit FileProvider(std::filesystem::path path);

    // Re-reads the file. On failure the previous snapshot stays in effect and
    // false is returned. Listeners fire only when the sftp section changed.
    bool reload();

    [[nodiscard]] std::optional<sync::model::SftpConfig> sftp() const override;
    [[nodiscard]] std::optional<jellyfin::model::Config> jellyfin() const override;
    void onChanged(Listener listener) override;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    mutable std::mutex mutex_;
    Sources sources_;
    std::vector<Listener> listeners_;
};

}
