#include "presence/net/StorageTransport.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <system_error>
#include <tuple>
#include <utility>

#include "presence/core/Log.hpp"
#include "presence/core/Time.hpp"

namespace presence::net
{
namespace
{
constexpr const char* kTag = "Storage";
constexpr const char* kExtension = ".json";
constexpr const char* kTempPrefix = ".tmp_";

std::int64_t UnixMillis()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

bool ReadFileText(const std::filesystem::path& path, std::string& outText)
{
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open())
    {
        return false;
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    outText = buffer.str();
    return true;
}
} // namespace

std::unique_ptr<StorageTransport> StorageTransport::Open(
    const core::StorageSettings& settings,
    const std::string& roomKey,
    const std::string& originId,
    std::string* outError
)
{
    const std::filesystem::path root = settings.root.empty() ? std::filesystem::path(core::DefaultStorageRoot()) : std::filesystem::path(settings.root);
    const std::filesystem::path directory = root / roomKey;

    std::error_code error;
    std::filesystem::create_directories(directory, error);
    if (error)
    {
        if (outError != nullptr)
        {
            *outError = "Failed to create " + directory.string() + ": " + error.message();
        }
        return nullptr;
    }

    std::unique_ptr<StorageTransport> transport(new StorageTransport(settings, roomKey, originId, directory));
    transport->MarkExistingSeen();
    return transport;
}

StorageTransport::StorageTransport(
    core::StorageSettings settings,
    const std::string& roomKey,
    std::string originId,
    std::filesystem::path directory
)
    : TransportProvider(roomKey)
    , m_settings(std::move(settings))
    , m_originId(std::move(originId))
    , m_directory(std::move(directory))
{
}

bool StorageTransport::Send(const std::string& payload)
{
    FileName name;
    name.timestampMs = UnixMillis();
    name.originId = m_originId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        name.sequence = m_nextSequence++;
    }

    const std::string fileName = FormatFileName(name);
    const std::filesystem::path finalPath = m_directory / fileName;
    const std::filesystem::path tempPath = m_directory / (std::string(kTempPrefix) + fileName);

    {
        std::ofstream stream(tempPath, std::ios::binary | std::ios::trunc);
        if (!stream.is_open())
        {
            core::Log::Warn(kTag, "Unable to write " + tempPath.string());
            return false;
        }
        stream << payload;
        if (!stream.good())
        {
            core::Log::Warn(kTag, "Short write to " + tempPath.string());
            return false;
        }
    }

    // Readers never observe a partially written message.
    std::error_code error;
    std::filesystem::rename(tempPath, finalPath, error);
    if (error)
    {
        core::Log::Warn(kTag, "Rename failed for " + finalPath.string() + ": " + error.message());
        std::filesystem::remove(tempPath, error);
        return false;
    }
    return true;
}

void StorageTransport::CollectIncoming(std::vector<std::string>& outPayloads)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const double now = core::Time::MonotonicSeconds();
    if (m_lastPollSeconds >= 0.0 && now - m_lastPollSeconds < m_settings.pollIntervalSeconds)
    {
        return;
    }
    m_lastPollSeconds = now;

    const std::int64_t cutoffMs = UnixMillis() - static_cast<std::int64_t>(m_settings.retentionSeconds * 1000.0);

    std::vector<std::pair<FileName, std::string>> fresh;
    std::unordered_set<std::string> present;

    std::error_code error;
    std::filesystem::directory_iterator it(m_directory, error);
    if (error)
    {
        core::Log::Warn(kTag, "Unable to list " + m_directory.string() + ": " + error.message());
        return;
    }

    for (std::filesystem::directory_iterator end; !error && it != end; it.increment(error))
    {
        const std::filesystem::directory_entry& entry = *it;
        const std::string fileName = entry.path().filename().string();
        const std::optional<FileName> parsed = ParseFileName(fileName);
        if (!parsed)
        {
            continue;
        }

        if (parsed->timestampMs < cutoffMs)
        {
            std::error_code removeError;
            std::filesystem::remove(entry.path(), removeError);
            continue;
        }

        present.insert(fileName);
        if (m_seen.count(fileName) != 0)
        {
            continue;
        }
        m_seen.insert(fileName);

        if (parsed->originId == m_originId)
        {
            continue;
        }
        fresh.emplace_back(*parsed, fileName);
    }

    // Forget names whose files have expired so the set stays bounded.
    for (auto seenIt = m_seen.begin(); seenIt != m_seen.end();)
    {
        if (present.count(*seenIt) == 0)
        {
            seenIt = m_seen.erase(seenIt);
        }
        else
        {
            ++seenIt;
        }
    }

    // Write order per origin is (timestamp, sequence); the sequence is not zero-padded.
    std::sort(fresh.begin(), fresh.end(), [](const auto& a, const auto& b) {
        return std::tie(a.first.timestampMs, a.first.originId, a.first.sequence) <
               std::tie(b.first.timestampMs, b.first.originId, b.first.sequence);
    });
    for (const auto& entry : fresh)
    {
        std::string text;
        if (!ReadFileText(m_directory / entry.second, text))
        {
            continue;
        }
        outPayloads.push_back(std::move(text));
    }
}

std::string StorageTransport::FormatFileName(const FileName& name)
{
    char stamp[32]{};
    std::snprintf(stamp, sizeof(stamp), "%015lld", static_cast<long long>(name.timestampMs));
    return std::string(stamp) + "_" + name.originId + "_" + std::to_string(name.sequence) + kExtension;
}

std::optional<StorageTransport::FileName> StorageTransport::ParseFileName(const std::string& fileName)
{
    const std::string extension = kExtension;
    if (fileName.size() <= extension.size() || fileName.compare(fileName.size() - extension.size(), extension.size(), extension) != 0)
    {
        return std::nullopt;
    }
    if (fileName.rfind(kTempPrefix, 0) == 0)
    {
        return std::nullopt;
    }

    const std::string stem = fileName.substr(0, fileName.size() - extension.size());
    const std::size_t first = stem.find('_');
    const std::size_t last = stem.rfind('_');
    if (first == std::string::npos || last == first || first == 0 || last + 1 >= stem.size())
    {
        return std::nullopt;
    }

    FileName parsed;
    parsed.originId = stem.substr(first + 1, last - first - 1);
    if (parsed.originId.empty())
    {
        return std::nullopt;
    }

    try
    {
        std::size_t consumed = 0;
        const std::string stampText = stem.substr(0, first);
        parsed.timestampMs = std::stoll(stampText, &consumed);
        if (consumed != stampText.size())
        {
            return std::nullopt;
        }
        const std::string sequenceText = stem.substr(last + 1);
        parsed.sequence = std::stoull(sequenceText, &consumed);
        if (consumed != sequenceText.size())
        {
            return std::nullopt;
        }
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
    return parsed;
}

void StorageTransport::MarkExistingSeen()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code error;
    for (std::filesystem::directory_iterator it(m_directory, error), end; !error && it != end; it.increment(error))
    {
        m_seen.insert(it->path().filename().string());
    }
}
} // namespace presence::net
