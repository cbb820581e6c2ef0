// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ConfigStore.hpp>
#include <mcp/ServerConfig.hpp>

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcphost
{

/// @brief ConfigStore backed by the "mcpServers" section of a JSON config file.
///
/// The file is re-read on every call, so edits made while the host runs are
/// picked up by the next bootstrap or restart. A missing file is an empty store.
class FileConfigStore: public ConfigStore
{
  public:
    explicit FileConfigStore(std::string path);

    [[nodiscard]] auto listAll() -> Result<std::vector<ServerConfig>> override;

    /// @brief Looks up one server by name.
    [[nodiscard]] auto find(std::string_view name) -> Result<ServerConfig>;

    /// @brief Adds or replaces a server entry and writes the file back.
    [[nodiscard]] auto upsert(const ServerConfig& config) -> VoidResult;

    /// @brief Removes a server entry and writes the file back.
    /// @return ConfigError if no such server exists.
    [[nodiscard]] auto remove(std::string_view name) -> VoidResult;

    [[nodiscard]] auto path() const -> const std::string& { return _path; }

  private:
    std::string _path;
    std::mutex _mutex;
};

} // namespace mcphost
