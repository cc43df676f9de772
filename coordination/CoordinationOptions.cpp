// CoordinationOptions.cpp - Coordination options provider with auto-registration
#include "CoordinationOptions.hpp"
#include "options/Options.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>
#include <vector>

namespace {
    constexpr int kDefaultConnectAttempts = 20;
    constexpr int kMaxConnectAttempts = 1000;

    std::mutex g_coord_opts_mtx;
    std::string g_group;
    std::string g_mode = "auto";
    std::vector<std::string> g_lock_dirs;
    int g_connect_attempts = kDefaultConnectAttempts;
    std::atomic<bool> g_coord_registered{false};

    std::vector<std::string> lock_dirs_from_json(const nlohmann::json& arr) {
        std::vector<std::string> out;
        const auto base = shared_opts::Options::get_config_dir();
        for (const auto& entry : arr) {
            if (!entry.is_string()) continue;
            std::filesystem::path p = entry.get<std::string>();
            if (p.empty()) continue;
            if (p.is_relative() && base) p = *base / p;
            out.push_back(p.string());
        }
        return out;
    }
}

namespace coordination_opts {

void register_options() {
    bool expected = false;
    if (!g_coord_registered.compare_exchange_strong(expected, true)) {
        return; // already registered
    }

    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        std::string group_default;
        std::string mode_default = "auto";
        std::vector<std::string> lock_dirs_default;
        int attempts_default = kDefaultConnectAttempts;

        if (j.contains("coordination") && j["coordination"].is_object()) {
            const auto& cj = j["coordination"];
            if (cj.contains("group") && cj["group"].is_string()) {
                group_default = cj["group"].get<std::string>();
            }
            if (cj.contains("mode") && cj["mode"].is_string() &&
                coordination::parse_coordination_mode(cj["mode"].get<std::string>())) {
                mode_default = cj["mode"].get<std::string>();
            }
            if (cj.contains("lock_dirs") && cj["lock_dirs"].is_array()) {
                lock_dirs_default = lock_dirs_from_json(cj["lock_dirs"]);
            }
            if (cj.contains("connect_attempts") && cj["connect_attempts"].is_number_integer()) {
                int v = cj["connect_attempts"].get<int>();
                if (v >= 1 && v <= kMaxConnectAttempts) attempts_default = v;
            }
        }

        {
            std::lock_guard<std::mutex> lk(g_coord_opts_mtx);
            g_group = group_default;
            g_mode = mode_default;
            g_lock_dirs = lock_dirs_default;
            g_connect_attempts = attempts_default;
        }

        app.add_option("--instance-group", g_group,
                       "Group qualifier: instances in different groups do not see each other")
            ->group("Coordination");
        app.add_option("--coordination-mode", g_mode, "Coordination mechanism")
            ->check(CLI::IsMember({"auto", "abstract", "filesystem"}))
            ->group("Coordination");
        app.add_option("--lock-dir", g_lock_dirs,
                       "Directory for lock/socket files (repeatable; replaces the platform defaults)")
            ->group("Coordination");
        app.add_option("--connect-attempts", g_connect_attempts,
                       "Connect attempts of a secondary while the primary starts listening")
            ->check(CLI::Range(1, kMaxConnectAttempts))
            ->group("Coordination");
    });
}

std::optional<std::string> get_group() {
    std::lock_guard<std::mutex> lk(g_coord_opts_mtx);
    if (g_group.empty()) return std::nullopt;
    return g_group;
}

coordination::CoordinatorSettings build_settings() {
    std::lock_guard<std::mutex> lk(g_coord_opts_mtx);
    coordination::CoordinatorSettings settings;
    settings.mode = coordination::parse_coordination_mode(g_mode).value_or(coordination::CoordinationMode::Auto);
    for (const auto& dir : g_lock_dirs) {
        if (!dir.empty()) settings.lock_dirs.emplace_back(dir);
    }
    settings.connect.attempts = g_connect_attempts;
    return settings;
}

} // namespace coordination_opts

// Static auto-registration object
namespace {
    struct CoordinationOptsAutoReg {
        CoordinationOptsAutoReg() { coordination_opts::register_options(); }
    };
    [[maybe_unused]] static CoordinationOptsAutoReg s_coordination_auto_reg;
}
