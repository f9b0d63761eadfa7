/// @file main.cpp
/// @brief vmwarden entry point - boots a VM, waits for Ctrl-C, shuts it down
///
/// Usage: vmwarden [OPTIONS] <NAME|DISK_IMAGE>
///
/// A NAME registered with vmwarden-config supplies the disk image and
/// hypervisor settings; explicit options override them. Progress characters
/// go to stdout, the final report to stdout (success) or stderr (failure),
/// and everything else to the session log `vmwarden_<title>.log`.

#include <vmwarden/config/registry.hpp>
#include <vmwarden/core/log.hpp>
#include <vmwarden/core/session_log.hpp>
#include <vmwarden/version.hpp>
#include <vmwarden/vm/controller.hpp>
#include <vmwarden/vm/report.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace {

// =============================================================================
// Command line
// =============================================================================

struct Options {
    std::string target;
    vmw_config::VmSettings overrides;
    vmw_vm::SessionConfig session;
    spdlog::level::level_enum log_level = spdlog::level::warn;
};

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] <NAME|DISK_IMAGE>\n"
              << "\n"
              << "Arguments:\n"
              << "  NAME                  Entry registered with vmwarden-config\n"
              << "  DISK_IMAGE            Path to a disk image\n"
              << "\n"
              << "Options:\n"
              << "  --cmd CMD             Hypervisor binary (default: qemu-system-x86_64)\n"
              << "  --mem GB              Guest memory in GB (default: 3)\n"
              << "  --port N              Host port forwarded to guest ssh (default: 2222)\n"
              << "  --log-dir DIR         Directory for the session log (default: .)\n"
              << "  --boot-timeout SEC    Give up booting after SEC seconds (default: 300)\n"
              << "  --shutdown-timeout SEC\n"
              << "                        Give up shutting down after SEC seconds (default: 60)\n"
              << "  --on-timeout POLICY   abandon (default) or kill\n"
              << "  --flush-log           Flush the session log after every line\n"
              << "  --log-level LEVEL     Diagnostic level on stderr (default: warn)\n"
              << "  --help, -h            Show this help message\n"
              << "  --version, -v         Show version information\n"
              << "\n"
              << "Press Ctrl-C once the guest is running to shut it down.\n";
}

void print_version() {
    std::cout << "vmwarden " << vmwarden::kVersionString << "\n";
}

std::chrono::steady_clock::duration seconds_arg(const std::string& text) {
    auto duration = vmw_vm::duration_from_seconds(std::stod(text));
    if (!duration) {
        throw std::out_of_range("must be a positive number of seconds, at most one week");
    }
    return *duration;
}

/// Returns an exit status when the program should stop, nullopt to proceed
std::optional<int> parse_args(int argc, char** argv, Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string text;
        try {
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--version" || arg == "-v") {
                print_version();
                return 0;
            } else if (arg == "--flush-log") {
                options.session.flush_log = true;
            } else if (arg == "--cmd") {
                if (!value(text)) return 1;
                options.overrides.command = text;
            } else if (arg == "--mem") {
                if (!value(text)) return 1;
                double mem = std::stod(text);
                if (!vmw_vm::valid_mem_gb(mem)) {
                    throw std::out_of_range("must be a positive number of GB");
                }
                options.overrides.mem_gb = mem;
            } else if (arg == "--port") {
                if (!value(text)) return 1;
                unsigned long port = std::stoul(text);
                if (port == 0 || port > 65535) {
                    throw std::out_of_range("not a TCP port");
                }
                options.overrides.port = static_cast<std::uint16_t>(port);
            } else if (arg == "--log-dir") {
                if (!value(text)) return 1;
                options.session.log_directory = text;
            } else if (arg == "--boot-timeout") {
                if (!value(text)) return 1;
                options.session.boot_timeout = seconds_arg(text);
            } else if (arg == "--shutdown-timeout") {
                if (!value(text)) return 1;
                options.session.shutdown_timeout = seconds_arg(text);
            } else if (arg == "--on-timeout") {
                if (!value(text)) return 1;
                auto policy = vmw_vm::parse_timeout_policy(text);
                if (!policy) {
                    throw std::invalid_argument("expected abandon or kill");
                }
                options.session.timeout_policy = *policy;
            } else if (arg == "--log-level") {
                if (!value(text)) return 1;
                auto level = vmw_core::parse_log_level(text);
                if (!level) {
                    throw std::invalid_argument("unknown level");
                }
                options.log_level = *level;
            } else if (!arg.empty() && arg[0] != '-' && options.target.empty()) {
                options.target = arg;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        } catch (const std::exception& e) {
            std::cerr << "Invalid value '" << text << "' for " << arg << ": " << e.what() << "\n";
            return 1;
        }
    }

    if (options.target.empty()) {
        std::cerr << "Error: No VM specified.\n\n";
        print_usage(argv[0]);
        return 1;
    }
    return std::nullopt;
}

// =============================================================================
// VM resolution
// =============================================================================

/// Registered name, else a disk image path; explicit options win
std::optional<vmw_vm::VmSpec> resolve_spec(const Options& options) {
    vmw_config::VmSettings settings;

    auto registry_path = vmw_config::VmRegistry::default_path();
    auto registry = vmw_config::VmRegistry::load(registry_path);
    for (const auto& error : registry.errors()) {
        spdlog::warn("{}", error.message());
    }

    if (registry.contains(options.target)) {
        auto found = registry.find(options.target);
        if (!found) {
            std::cerr << "Error: " << found.error().message() << " in " << registry_path.string() << "\n";
            return std::nullopt;
        }
        settings = *found;
    } else {
        settings.disk_image = options.target;
    }
    settings.merge(options.overrides);

    if (!settings.disk_image || settings.disk_image->empty()) {
        std::cerr << "Error: no disk image configured for '" << options.target << "'\n";
        return std::nullopt;
    }

    vmw_vm::VmSpec spec;
    settings.apply_to(spec);

    std::error_code ec;
    if (!fs::exists(spec.disk_image, ec)) {
        spdlog::warn("Disk image {} does not exist", spec.disk_image.string());
    }
    return spec;
}

// =============================================================================
// Report
// =============================================================================

void report(const vmw_vm::RunResult& result, const vmw_vm::VmSpec& spec, vmw_core::SessionLog* log) {
    bool alive = result.pid && vmw_vm::process_alive(*result.pid);
    auto run_report = vmw_vm::build_report(result, spec.mem_gb, alive);

    std::ostream& stream = run_report.success ? std::cout : std::cerr;
    stream << "\n\n" << run_report.message << "\n\n";
    if (log) {
        log->plain("\n" + run_report.message);
    }

    if (!run_report.advice.empty()) {
        std::cerr << run_report.advice << "\n\n";
        if (log) {
            log->plain(run_report.advice);
        }
    }
    if (log) {
        log->flush();
    }
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    Options options;
    if (auto status = parse_args(argc, argv, options)) {
        return *status;
    }

    vmw_core::configure_logging(vmw_core::LogConfig{true, options.log_level});

    auto spec = resolve_spec(options);
    if (!spec) {
        return 1;
    }

    vmw_vm::Controller controller(*spec, options.session);
    spdlog::info("Supervising {} (log: {})", spec->disk_image.string(), controller.log_path().string());

    auto result = controller.run();
    if (!result) {
        std::cerr << "Error: " << vmw_core::build_error_chain(result.error()) << "\n";
        vmw_core::shutdown_logging();
        return 1;
    }

    report(*result, *spec, controller.log());

    vmw_core::shutdown_logging();
    return result->process_exit_status();
}
