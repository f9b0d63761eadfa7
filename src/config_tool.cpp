/// @file config_tool.cpp
/// @brief vmwarden-config entry point - maintains the VM registry
///
/// Lets users refer to disk images by a short name, so the paths to images
/// that must not be deleted by accident are not typed routinely.
///
///   vmwarden-config add <NAME> [--disk PATH] [--cmd CMD] [--mem GB] [--port N]
///   vmwarden-config del [NAME]
///   vmwarden-config list [NAME]

#include <vmwarden/config/registry.hpp>
#include <vmwarden/core/log.hpp>
#include <vmwarden/version.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

const char* g_program = "vmwarden-config";

void print_usage() {
    std::cerr << "Usage: " << g_program << " <COMMAND> [NAME] [OPTIONS]\n"
              << "\n"
              << "Commands:\n"
              << "  add NAME     Add or update a VM definition\n"
              << "  del [NAME]   Delete one definition, or all of them\n"
              << "  list [NAME]  List one definition, or all of them\n"
              << "\n"
              << "Options for add:\n"
              << "  --disk PATH  Disk image\n"
              << "  --cmd CMD    Hypervisor binary\n"
              << "  --mem GB     Guest memory in GB\n"
              << "  --port N     Host port forwarded to guest ssh\n"
              << "\n"
              << "The registry lives at $" << vmw_config::kConfigPathEnv
              << ", $XDG_CONFIG_HOME/vmwarden/vms.json or ~/.config/vmwarden/vms.json.\n";
}

/// Ask a yes/no question; EOF and an empty answer mean no
bool confirm(const std::string& prompt) {
    for (;;) {
        std::cout << prompt << " (y/[n]): " << std::flush;

        std::string answer;
        if (!std::getline(std::cin, answer)) {
            std::cout << "\n";
            return false;
        }
        std::transform(answer.begin(), answer.end(), answer.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (answer == "y" || answer == "yes") {
            return true;
        }
        if (answer == "n" || answer == "no" || answer.empty()) {
            return false;
        }
    }
}

bool save(const vmw_config::VmRegistry& registry, const fs::path& path) {
    auto saved = registry.save(path);
    if (!saved) {
        std::cerr << g_program << ": " << saved.error().message() << "\n";
        return false;
    }
    return true;
}

// =============================================================================
// Commands
// =============================================================================

int cmd_add(vmw_config::VmRegistry& registry, const fs::path& path,
            const std::string& name, int argc, char** argv, int first) {
    if (registry.corrupt()) {
        std::cerr << g_program << ": can't update corrupt config; delete it (or fix manually) first\n";
        return 1;
    }

    vmw_config::VmSettings settings;
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            std::cerr << g_program << ": missing value for " << arg << "\n";
            return 1;
        }
        std::string text = argv[++i];

        try {
            if (arg == "--disk") {
                settings.disk_image = fs::absolute(text).string();
            } else if (arg == "--cmd") {
                settings.command = text;
            } else if (arg == "--mem") {
                double mem = std::stod(text);
                if (!vmw_vm::valid_mem_gb(mem)) {
                    throw std::out_of_range("must be a positive number of GB");
                }
                settings.mem_gb = mem;
            } else if (arg == "--port") {
                unsigned long port = std::stoul(text);
                if (port == 0 || port > 65535) {
                    throw std::out_of_range("not a TCP port");
                }
                settings.port = static_cast<std::uint16_t>(port);
            } else {
                std::cerr << g_program << ": unknown option " << arg << "\n";
                return 1;
            }
        } catch (const std::exception& e) {
            std::cerr << g_program << ": invalid value '" << text << "' for " << arg << ": " << e.what() << "\n";
            return 1;
        }
    }

    if (registry.contains(name) && !confirm("Replace existing entry " + name + "?")) {
        std::cout << "Aborted\n";
        return 0;
    }

    registry.add(name, settings);
    return save(registry, path) ? 0 : 1;
}

int cmd_del(vmw_config::VmRegistry& registry, const fs::path& path, const std::string& name) {
    if (registry.corrupt()) {
        std::cerr << g_program << ": can't update corrupt config; delete it (or fix manually) first\n";
        return 1;
    }

    bool confirmed = name.empty()
        ? confirm("Delete ALL config entries?")
        : confirm("Delete entry " + name + "?");
    if (!confirmed) {
        std::cout << "Aborted\n";
        return 0;
    }

    if (name.empty()) {
        registry.clear();
    } else {
        auto removed = registry.remove(name);
        if (!removed) {
            std::cerr << g_program << ": " << removed.error().message() << "\n";
            return 1;
        }
    }
    return save(registry, path) ? 0 : 1;
}

int cmd_list(const vmw_config::VmRegistry& registry, const std::string& name) {
    std::vector<std::string> names = name.empty() ? registry.names() : std::vector<std::string>{name};

    int status = 0;
    for (const auto& entry_name : names) {
        const auto* entry = registry.entry(entry_name);
        if (!entry || !entry->is_object()) {
            std::cerr << g_program << ": invalid entry for '" << entry_name << "'\n\n";
            status = 1;
            continue;
        }
        std::cout << entry_name << "\n";
        for (const auto& item : entry->items()) {
            std::cout << "    " << item.key() << "=" << vmw_config::display_value(item.value()) << "\n";
        }
        std::cout << "\n";
    }
    return status;
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }
    if (command == "--version" || command == "-v") {
        std::cout << g_program << " " << vmwarden::kVersionString << "\n";
        return 0;
    }
    if (command != "add" && command != "del" && command != "list") {
        std::cerr << g_program << ": unknown command '" << command << "'\n";
        print_usage();
        return 1;
    }

    std::string name;
    int next = 2;
    if (next < argc && argv[next][0] != '-') {
        name = argv[next++];
    }
    if (command == "add" && name.empty()) {
        std::cerr << g_program << ": add requires a NAME\n";
        return 1;
    }
    if (command != "add" && next < argc) {
        std::cerr << g_program << ": unexpected argument '" << argv[next] << "'\n";
        return 1;
    }

    vmw_core::init_logging();

    auto path = vmw_config::VmRegistry::default_path();
    auto registry = vmw_config::VmRegistry::load(path);
    for (const auto& error : registry.errors()) {
        std::cerr << g_program << ": " << error.message() << "\n";
    }

    if (!name.empty() && command != "add" && !registry.contains(name)) {
        std::cerr << g_program << ": entry '" << name << "' not found\n";
        return 1;
    }

    if (command == "add") {
        return cmd_add(registry, path, name, argc, argv, next);
    }
    if (command == "del") {
        return cmd_del(registry, path, name);
    }
    return cmd_list(registry, name);
}
