#pragma once

#include <filesystem>
#include <string>
#include <system_error>

#include "presence/core/Config.hpp"
#include "presence/scene/Participant.hpp"

// Per-test scratch directory, removed on destruction.
class ScratchDirectory {
 public:
  ScratchDirectory()
      : m_path(std::filesystem::temp_directory_path() / ("presence_test_" + presence::scene::GeneratePeerId())) {
    std::filesystem::create_directories(m_path);
  }
  ~ScratchDirectory() {
    std::error_code error;
    std::filesystem::remove_all(m_path, error);
  }

  ScratchDirectory(const ScratchDirectory&) = delete;
  ScratchDirectory& operator=(const ScratchDirectory&) = delete;

  const std::filesystem::path& Path() const { return m_path; }

 private:
  std::filesystem::path m_path;
};

// Storage-only configuration: no relay, no multicast, instant polling.
inline presence::core::PresenceConfig StorageOnlyConfig(const ScratchDirectory& scratch) {
  presence::core::PresenceConfig config;
  config.localBroadcast.enabled = false;
  config.storage.root = scratch.Path().string();
  config.storage.pollIntervalSeconds = 0.0;
  config.log.filePath.clear();
  return config;
}
