// vmw_config VmRegistry tests

#include <catch2/catch_test_macros.hpp>
#include <vmwarden/config/registry.hpp>

#include "support/test_support.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

using namespace vmw_config;
using vmw_test::TempDir;

namespace {

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream file(path, std::ios::trunc);
    file << text;
}

/// Sets an environment variable for the current scope
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : m_name(name) {
        if (const char* old = std::getenv(name)) {
            m_old = old;
        }
        if (value) {
            ::setenv(name, value, 1);
        } else {
            ::unsetenv(name);
        }
    }

    ~ScopedEnv() {
        if (m_old) {
            ::setenv(m_name, m_old->c_str(), 1);
        } else {
            ::unsetenv(m_name);
        }
    }

private:
    const char* m_name;
    std::optional<std::string> m_old;
};

} // anonymous namespace

TEST_CASE("VmSettings: parse entry", "[config][registry]") {
    SECTION("all fields") {
        auto j = nlohmann::json::parse(
            R"({"disk_image": "/vms/dev.qcow2", "cmd": "qemu-kvm", "mem": 1.5, "port": 2200})");
        auto settings = VmSettings::from_json(j, "dev");
        REQUIRE(settings);
        REQUIRE(settings->disk_image == "/vms/dev.qcow2");
        REQUIRE(settings->command == "qemu-kvm");
        REQUIRE(settings->mem_gb == 1.5);
        REQUIRE(settings->port == 2200);
    }

    SECTION("empty entry") {
        auto settings = VmSettings::from_json(nlohmann::json::object(), "dev");
        REQUIRE(settings);
        REQUIRE(settings->empty());
    }

    SECTION("wrong types") {
        for (const char* text : {R"("just a string")",
                                 R"({"disk_image": 3})",
                                 R"({"mem": "lots"})",
                                 R"({"mem": 0})",
                                 R"({"mem": -2})",
                                 R"({"mem": 1e300})",
                                 R"({"port": 2.5})",
                                 R"({"port": 70000})"}) {
            auto settings = VmSettings::from_json(nlohmann::json::parse(text), "dev");
            REQUIRE_FALSE(settings);
            REQUIRE(settings.error().code() == vmw_core::ErrorCode::InvalidArgument);
            REQUIRE(settings.error().as<vmw_core::ConfigError>()->entry == "dev");
        }
    }
}

TEST_CASE("VmSettings: overlay and apply", "[config][registry]") {
    VmSettings stored;
    stored.disk_image = "/vms/dev.qcow2";
    stored.mem_gb = 4.0;

    VmSettings overrides;
    overrides.mem_gb = 2.0;
    overrides.port = 2300;
    stored.merge(overrides);

    vmw_vm::VmSpec spec;
    stored.apply_to(spec);
    REQUIRE(spec.disk_image == "/vms/dev.qcow2");
    REQUIRE(spec.command == "qemu-system-x86_64");
    REQUIRE(spec.mem_gb == 2.0);
    REQUIRE(spec.port == 2300);
}

TEST_CASE("VmSettings: whole memory sizes are stored as integers", "[config][registry]") {
    VmSettings settings;
    settings.mem_gb = 3.0;
    REQUIRE(settings.to_json().dump() == R"({"mem":3})");

    settings.mem_gb = 0.5;
    REQUIRE(settings.to_json().dump() == R"({"mem":0.5})");
}

TEST_CASE("VmSettings: out-of-range memory sizes are not stored as integers", "[config][registry]") {
    VmSettings settings;
    for (double mem : {1e300, std::numeric_limits<double>::infinity(),
                       std::numeric_limits<double>::quiet_NaN()}) {
        settings.mem_gb = mem;
        auto j = settings.to_json();
        REQUIRE(j.contains("mem"));
        REQUIRE_FALSE(j["mem"].is_number_integer());
    }
}

TEST_CASE("VmRegistry: load", "[config][registry]") {
    TempDir dir;
    auto path = dir / "vms.json";

    SECTION("missing file is an empty registry") {
        auto registry = VmRegistry::load(path);
        REQUIRE(registry.size() == 0);
        REQUIRE_FALSE(registry.corrupt());
    }

    SECTION("valid file") {
        write_text(path, R"({"names": {"dev": {"disk_image": "/vms/dev.qcow2"}, "big": {"mem": 16}}})");
        auto registry = VmRegistry::load(path);
        REQUIRE_FALSE(registry.corrupt());
        REQUIRE(registry.size() == 2);
        REQUIRE(registry.contains("dev"));
        REQUIRE(registry.names() == std::vector<std::string>{"big", "dev"});

        auto dev = registry.find("dev");
        REQUIRE(dev);
        REQUIRE(dev->disk_image == "/vms/dev.qcow2");

        auto missing = registry.find("nope");
        REQUIRE_FALSE(missing);
        REQUIRE(missing.error().code() == vmw_core::ErrorCode::NotFound);
    }

    SECTION("no names key") {
        write_text(path, "{}");
        auto registry = VmRegistry::load(path);
        REQUIRE_FALSE(registry.corrupt());
        REQUIRE(registry.size() == 0);
    }

    SECTION("malformed JSON") {
        write_text(path, "{\"names\": {");
        auto registry = VmRegistry::load(path);
        REQUIRE(registry.corrupt());
        REQUIRE(registry.size() == 0);
        REQUIRE(registry.errors().front().code() == vmw_core::ErrorCode::ParseError);
    }

    SECTION("wrong shape") {
        write_text(path, R"({"names": []})");
        auto registry = VmRegistry::load(path);
        REQUIRE(registry.corrupt());

        write_text(path, "[1, 2]");
        REQUIRE(VmRegistry::load(path).corrupt());
    }

    SECTION("invalid entry surfaces on find") {
        write_text(path, R"({"names": {"bad": 42}})");
        auto registry = VmRegistry::load(path);
        REQUIRE_FALSE(registry.corrupt());
        REQUIRE(registry.entry("bad") != nullptr);
        REQUIRE(registry.find("bad").error().code() == vmw_core::ErrorCode::InvalidArgument);
    }
}

TEST_CASE("VmRegistry: edit and save", "[config][registry]") {
    TempDir dir;
    auto path = dir / "nested" / "vmwarden" / "vms.json";

    VmRegistry registry;
    VmSettings dev;
    dev.disk_image = "/vms/dev.qcow2";
    dev.port = 2201;
    registry.add("dev", dev);
    registry.add("tmp", VmSettings{});
    REQUIRE(registry.remove("tmp"));
    REQUIRE(registry.remove("tmp").error().code() == vmw_core::ErrorCode::NotFound);

    REQUIRE(registry.save(path));
    REQUIRE(vmw_test::read_file(path) ==
            "{\n"
            "    \"names\": {\n"
            "        \"dev\": {\n"
            "            \"disk_image\": \"/vms/dev.qcow2\",\n"
            "            \"port\": 2201\n"
            "        }\n"
            "    }\n"
            "}\n");

    auto reloaded = VmRegistry::load(path);
    REQUIRE(reloaded.names() == std::vector<std::string>{"dev"});
    REQUIRE(reloaded.find("dev")->port == 2201);

    reloaded.clear();
    REQUIRE(reloaded.size() == 0);
}

TEST_CASE("VmRegistry: save into an unwritable location", "[config][registry]") {
    TempDir dir;
    vmw_test::touch(dir / "file");

    VmRegistry registry;
    auto saved = registry.save(dir / "file" / "vms.json");
    REQUIRE_FALSE(saved);
    REQUIRE(saved.error().as<vmw_core::ConfigError>()->kind == vmw_core::ConfigError::Kind::Unwritable);
}

TEST_CASE("VmRegistry: default location", "[config][registry]") {
    SECTION("explicit variable wins") {
        ScopedEnv config(kConfigPathEnv, "/etc/vmwarden/vms.json");
        ScopedEnv xdg("XDG_CONFIG_HOME", "/xdg");
        REQUIRE(VmRegistry::default_path() == "/etc/vmwarden/vms.json");
    }

    SECTION("XDG config home") {
        ScopedEnv config(kConfigPathEnv, nullptr);
        ScopedEnv xdg("XDG_CONFIG_HOME", "/xdg");
        REQUIRE(VmRegistry::default_path() == "/xdg/vmwarden/vms.json");
    }

    SECTION("home directory") {
        ScopedEnv config(kConfigPathEnv, nullptr);
        ScopedEnv xdg("XDG_CONFIG_HOME", nullptr);
        ScopedEnv home("HOME", "/home/user");
        REQUIRE(VmRegistry::default_path() == "/home/user/.config/vmwarden/vms.json");
    }
}

TEST_CASE("display_value", "[config][registry]") {
    REQUIRE(display_value("/vms/dev.qcow2") == "/vms/dev.qcow2");
    REQUIRE(display_value(3) == "3");
    REQUIRE(display_value(1.5) == "1.5");
}
