/// @file registry.cpp
/// @brief VmRegistry implementation

#include <vmwarden/config/registry.hpp>
#include <vmwarden/core/log.hpp>

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace vmw_config {

namespace {

constexpr int kIndent = 4;

} // anonymous namespace

// =============================================================================
// VmSettings
// =============================================================================

vmw_core::Result<VmSettings> VmSettings::from_json(const nlohmann::json& j, const std::string& name) {
    auto invalid = [&name](const std::string& reason) {
        return vmw_core::Err<VmSettings>(
            vmw_core::Error(vmw_core::ConfigError::invalid_entry({}, name, reason)));
    };

    if (!j.is_object()) {
        return invalid("expected an object");
    }

    VmSettings settings;

    if (j.contains("disk_image")) {
        if (!j["disk_image"].is_string()) {
            return invalid("'disk_image' must be a string");
        }
        settings.disk_image = j["disk_image"].get<std::string>();
    }

    if (j.contains("cmd")) {
        if (!j["cmd"].is_string()) {
            return invalid("'cmd' must be a string");
        }
        settings.command = j["cmd"].get<std::string>();
    }

    if (j.contains("mem")) {
        if (!j["mem"].is_number() || !vmw_vm::valid_mem_gb(j["mem"].get<double>())) {
            return invalid("'mem' must be a positive number");
        }
        settings.mem_gb = j["mem"].get<double>();
    }

    if (j.contains("port")) {
        if (!j["port"].is_number_integer()) {
            return invalid("'port' must be an integer");
        }
        auto port = j["port"].get<std::int64_t>();
        if (port <= 0 || port > std::numeric_limits<std::uint16_t>::max()) {
            return invalid("'port' out of range");
        }
        settings.port = static_cast<std::uint16_t>(port);
    }

    return vmw_core::Ok(std::move(settings));
}

nlohmann::json VmSettings::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    if (disk_image) j["disk_image"] = *disk_image;
    if (command) j["cmd"] = *command;
    if (mem_gb) {
        // Whole numbers are stored as integers ("mem": 3, not 3.0)
        if (vmw_vm::valid_mem_gb(*mem_gb) && std::trunc(*mem_gb) == *mem_gb) {
            j["mem"] = static_cast<std::int64_t>(*mem_gb);
        } else {
            j["mem"] = *mem_gb;
        }
    }
    if (port) j["port"] = *port;
    return j;
}

void VmSettings::apply_to(vmw_vm::VmSpec& spec) const {
    if (disk_image) spec.disk_image = *disk_image;
    if (command) spec.command = *command;
    if (mem_gb) spec.mem_gb = *mem_gb;
    if (port) spec.port = *port;
}

void VmSettings::merge(const VmSettings& other) {
    if (other.disk_image) disk_image = other.disk_image;
    if (other.command) command = other.command;
    if (other.mem_gb) mem_gb = other.mem_gb;
    if (other.port) port = other.port;
}

// =============================================================================
// VmRegistry
// =============================================================================

std::filesystem::path VmRegistry::default_path() {
    if (const char* explicit_path = std::getenv(kConfigPathEnv); explicit_path && *explicit_path) {
        return explicit_path;
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "vmwarden" / "vms.json";
    }
    const char* home = std::getenv("HOME");
    std::filesystem::path base = (home && *home) ? std::filesystem::path(home) : std::filesystem::path(".");
    return base / ".config" / "vmwarden" / "vms.json";
}

VmRegistry VmRegistry::load(const std::filesystem::path& path) {
    VmRegistry registry;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        vmw_core::core_logger()->debug("No registry at {}", path.string());
        return registry;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        registry.m_errors.emplace_back(vmw_core::ConfigError::unreadable(path.string()));
        return registry;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        registry.m_errors.emplace_back(vmw_core::ConfigError::malformed(path.string(), e.what()));
        return registry;
    }

    if (!j.is_object()) {
        registry.m_errors.emplace_back(
            vmw_core::ConfigError::malformed(path.string(), "top level is not an object"));
        return registry;
    }

    if (!j.contains("names")) {
        return registry;
    }
    if (!j["names"].is_object()) {
        registry.m_errors.emplace_back(
            vmw_core::ConfigError::malformed(path.string(), "'names' is not an object"));
        return registry;
    }

    registry.m_names = j["names"];
    vmw_core::core_logger()->debug("Loaded {} registry entries from {}", registry.m_names.size(), path.string());
    return registry;
}

bool VmRegistry::contains(const std::string& name) const {
    return m_names.contains(name);
}

std::vector<std::string> VmRegistry::names() const {
    std::vector<std::string> result;
    for (const auto& item : m_names.items()) {
        result.push_back(item.key());
    }
    return result;
}

vmw_core::Result<VmSettings> VmRegistry::find(const std::string& name) const {
    const auto* raw = entry(name);
    if (!raw) {
        return vmw_core::Err<VmSettings>(
            vmw_core::Error(vmw_core::ErrorCode::NotFound, "Entry '" + name + "' not found"));
    }
    return VmSettings::from_json(*raw, name);
}

const nlohmann::json* VmRegistry::entry(const std::string& name) const {
    auto it = m_names.find(name);
    return it != m_names.end() ? &*it : nullptr;
}

void VmRegistry::add(const std::string& name, const VmSettings& settings) {
    m_names[name] = settings.to_json();
}

vmw_core::Result<void> VmRegistry::remove(const std::string& name) {
    if (m_names.erase(name) == 0) {
        return vmw_core::Err(
            vmw_core::Error(vmw_core::ErrorCode::NotFound, "Entry '" + name + "' not found"));
    }
    return vmw_core::Ok();
}

void VmRegistry::clear() {
    m_names = nlohmann::json::object();
}

nlohmann::json VmRegistry::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    j["names"] = m_names;
    return j;
}

vmw_core::Result<void> VmRegistry::save(const std::filesystem::path& path) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return vmw_core::Err(vmw_core::Error(
                vmw_core::ConfigError::unwritable(path.string(), ec.message())));
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return vmw_core::Err(vmw_core::Error(
            vmw_core::ConfigError::unwritable(path.string(), "cannot open for writing")));
    }

    file << to_json().dump(kIndent) << '\n';
    if (!file) {
        return vmw_core::Err(vmw_core::Error(
            vmw_core::ConfigError::unwritable(path.string(), "write failed")));
    }
    return vmw_core::Ok();
}

std::string display_value(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

} // namespace vmw_config
