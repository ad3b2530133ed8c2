#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "presence/core/Config.hpp"
#include "presence/net/TransportProvider.hpp"

namespace presence::net
{
// Fallback tier: each message is one file under <root>/<roomKey>/, named
// <unix-ms>_<origin>_<seq>.json. Readers poll the directory and skip their own files.
class StorageTransport final : public TransportProvider
{
public:
    struct FileName
    {
        std::int64_t timestampMs = 0;
        std::string originId;
        std::uint64_t sequence = 0;
    };

    static std::unique_ptr<StorageTransport> Open(
        const core::StorageSettings& settings,
        const std::string& roomKey,
        const std::string& originId,
        std::string* outError = nullptr
    );

    [[nodiscard]] TransportKind Kind() const override { return TransportKind::SharedStorage; }
    bool Send(const std::string& payload) override;

    [[nodiscard]] const std::filesystem::path& Directory() const { return m_directory; }

    [[nodiscard]] static std::string FormatFileName(const FileName& name);
    [[nodiscard]] static std::optional<FileName> ParseFileName(const std::string& fileName);

protected:
    void CollectIncoming(std::vector<std::string>& outPayloads) override;

private:
    StorageTransport(core::StorageSettings settings, const std::string& roomKey, std::string originId, std::filesystem::path directory);

    void MarkExistingSeen();

    core::StorageSettings m_settings;
    std::string m_originId;
    std::filesystem::path m_directory;

    std::mutex m_mutex;
    std::uint64_t m_nextSequence = 1;
    double m_lastPollSeconds = -1.0;
    std::unordered_set<std::string> m_seen;
};
} // namespace presence::net
