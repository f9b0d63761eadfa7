/// @file registry.hpp
/// @brief Named VM definitions stored in a JSON file
///
/// File layout:
/// @code
/// {
///     "names": {
///         "<name>": {
///             "disk_image": "/path/to/disk.qcow2",
///             "cmd": "qemu-system-x86_64",
///             "mem": 3,
///             "port": 2222
///         }
///     }
/// }
/// @endcode
/// Every setting is optional; missing ones fall back to the VmSpec defaults.

#pragma once

#include <vmwarden/core/error.hpp>
#include <vmwarden/vm/types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vmw_config {

/// Environment variable overriding the registry location
inline constexpr const char* kConfigPathEnv = "VMWARDEN_CONFIG";

// =============================================================================
// VmSettings
// =============================================================================

/// Settings stored for one name
struct VmSettings {
    std::optional<std::string> disk_image;
    std::optional<std::string> command;
    std::optional<double> mem_gb;
    std::optional<std::uint16_t> port;

    /// Parse one registry entry
    [[nodiscard]] static vmw_core::Result<VmSettings> from_json(const nlohmann::json& j,
                                                                const std::string& name);

    [[nodiscard]] nlohmann::json to_json() const;

    /// Copy the settings that are present onto @p spec
    void apply_to(vmw_vm::VmSpec& spec) const;

    /// Overlay the settings present in @p other
    void merge(const VmSettings& other);

    [[nodiscard]] bool empty() const {
        return !disk_image && !command && !mem_gb && !port;
    }
};

// =============================================================================
// VmRegistry
// =============================================================================

class VmRegistry {
public:
    VmRegistry() = default;

    /// `$VMWARDEN_CONFIG`, else `$XDG_CONFIG_HOME/vmwarden/vms.json`,
    /// else `~/.config/vmwarden/vms.json`
    [[nodiscard]] static std::filesystem::path default_path();

    /// Load a registry. Never fails: a missing file gives an empty registry,
    /// an unreadable or malformed one gives an empty registry with errors().
    [[nodiscard]] static VmRegistry load(const std::filesystem::path& path);

    /// Problems found while loading
    [[nodiscard]] const std::vector<vmw_core::Error>& errors() const { return m_errors; }

    /// True if the file exists but could not be used; such a registry must
    /// not be saved over the original
    [[nodiscard]] bool corrupt() const { return !m_errors.empty(); }

    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] std::size_t size() const { return m_names.size(); }

    /// Settings for @p name (NotFound if absent, InvalidArgument if malformed)
    [[nodiscard]] vmw_core::Result<VmSettings> find(const std::string& name) const;

    /// Raw stored entry, nullptr if absent
    [[nodiscard]] const nlohmann::json* entry(const std::string& name) const;

    /// Add or replace an entry
    void add(const std::string& name, const VmSettings& settings);

    /// Remove an entry (NotFound if absent)
    vmw_core::Result<void> remove(const std::string& name);

    void clear();

    /// Write the registry, creating parent directories as needed
    [[nodiscard]] vmw_core::Result<void> save(const std::filesystem::path& path) const;

    [[nodiscard]] nlohmann::json to_json() const;

private:
    nlohmann::json m_names = nlohmann::json::object();
    std::vector<vmw_core::Error> m_errors;
};

/// Render a stored value for listings (strings unquoted)
[[nodiscard]] std::string display_value(const nlohmann::json& value);

} // namespace vmw_config
