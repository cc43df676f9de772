// AppOptions.cpp - instance-coordinator options provider with auto-registration
#include "AppOptions.hpp"
#include "options/Options.hpp"
#include "processUtils.hpp"

#include <atomic>
#include <mutex>

namespace {
    std::mutex g_app_opts_mtx;
    std::string g_app_name;
    std::string g_listen_on;
    std::string g_log_level = "info";
    std::atomic<bool> g_app_registered{false};
}

namespace app_opts {

void register_options() {
    bool expected = false;
    if (!g_app_registered.compare_exchange_strong(expected, true)) {
        return; // already registered
    }

    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        std::string name_default;
        std::string listen_default;
        std::string level_default = "info";

        if (j.contains("instance") && j["instance"].is_object()) {
            const auto& ij = j["instance"];
            if (ij.contains("app_name") && ij["app_name"].is_string()) {
                name_default = ij["app_name"].get<std::string>();
            }
            if (ij.contains("listen_on") && ij["listen_on"].is_string()) {
                listen_default = ij["listen_on"].get<std::string>();
            }
        }
        if (j.contains("logging") && j["logging"].is_object()) {
            const auto& lj = j["logging"];
            if (lj.contains("level") && lj["level"].is_string() &&
                parse_log_level(lj["level"].get<std::string>())) {
                level_default = lj["level"].get<std::string>();
            }
        }

        {
            std::lock_guard<std::mutex> lk(g_app_opts_mtx);
            g_app_name = name_default;
            g_listen_on = listen_default;
            g_log_level = level_default;
        }

        app.add_option("--app-name", g_app_name, "Application name (default: executable name)")
            ->group("Instance");
        app.add_option("--listen-on", g_listen_on,
                       "Extra endpoint the primary listens on (unix:/path, unix:@name, tcp:host:port, tcp6:host:port)")
            ->group("Instance");
        app.add_option("--log-level", g_log_level, "Console log level")
            ->check(CLI::IsMember({"debug", "info", "warning", "warn", "error", "critical"}))
            ->group("Logging");
    });
}

std::string get_app_name() {
    {
        std::lock_guard<std::mutex> lk(g_app_opts_mtx);
        if (!g_app_name.empty()) return g_app_name;
    }
    auto stem = ProcessUtils::get_executable_path().stem().string();
    return stem.empty() ? std::string{"instance-coordinator"} : stem;
}

std::optional<std::string> get_listen_on() {
    std::lock_guard<std::mutex> lk(g_app_opts_mtx);
    if (g_listen_on.empty()) return std::nullopt;
    return g_listen_on;
}

LogLevel get_log_level() {
    std::lock_guard<std::mutex> lk(g_app_opts_mtx);
    return parse_log_level(g_log_level).value_or(LogLevel::Info);
}

} // namespace app_opts

// Static auto-registration object
namespace {
    struct AppOptsAutoReg {
        AppOptsAutoReg() { app_opts::register_options(); }
    };
    [[maybe_unused]] static AppOptsAutoReg s_app_auto_reg;
}
