// instanceMain.cpp - Single-instance coordinator: become the primary or hand off to the running one.
#include "AppOptions.hpp"
#include "coordination/CoordinationErrors.hpp"
#include "coordination/CoordinationOptions.hpp"
#include "coordination/SingleInstance.hpp"
#include "transport/address/EndpointAddress.hpp"
#include "transport/socket/posix/PosixSocket.hpp"
#include "logger.hpp"
#include "options/Options.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <optional>

// Global shutdown flag for signal handlers
static std::atomic<bool> shutdown_requested{false};

// Signal handler for graceful shutdown
static void signal_handler(int) {
    shutdown_requested.store(true, std::memory_order_relaxed);
}

// Serve until a shutdown signal arrives: log every secondary that checks in and every
// client of the optional extra listener, then drop the connection.
static void serve_primary(coordination::LifecycleCleanup& instance,
                          transport::PosixSocket* extra_listener,
                          const std::shared_ptr<Logger>& logger) {
    constexpr auto ACCEPT_SLICE = std::chrono::milliseconds(200);
    std::size_t secondaries = 0;

    while (!shutdown_requested.load(std::memory_order_relaxed)) {
        std::error_code ec;
        auto peer = instance->accept(ec, ACCEPT_SLICE);
        if (ec) {
            logger->error("Accept on coordination socket failed: " + ec.message());
            break;
        }
        if (peer) {
            ++secondaries;
            logger->info("Secondary instance #" + std::to_string(secondaries) + " connected");
            peer->close();
        }

        if (extra_listener) {
            auto client = extra_listener->try_accept(ec);
            if (ec) {
                logger->warning("Accept on " + extra_listener->local_endpoint() + " failed: " + ec.message());
            } else if (client) {
                logger->info("Client connected on " + extra_listener->local_endpoint() +
                             (client->remote_endpoint().empty() ? std::string{} : " from " + client->remote_endpoint()));
                client->close();
            }
        }
    }

    logger->info("Primary served " + std::to_string(secondaries) + " secondary instance(s)");
}

int main(int argc, char* argv[]) {

    // --- Stage 1: Build logging pipeline ---
    auto logger = std::make_shared<Logger>("InstanceCoordinator");
    auto stdout_sink = std::make_shared<StdoutSink>();
    stdout_sink->set_level(LogLevel::Info);
    logger->add_sink(stdout_sink);

    try {

        // --- Stage 2: Parse CLI/JSON options ---

        // Providers also auto-register via static objects; registering here keeps them
        // when the linker drops unreferenced objects from static libraries
        app_opts::register_options();
        coordination_opts::register_options();

        std::string opts_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opts_err);
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return 0; // help/version already printed
        } else if (parse_res == shared_opts::Options::ParseResult::Error) {
            logger->error(std::string("Failed to parse options: ") + opts_err);
            return 2;
        }
        logger->set_level(app_opts::get_log_level());

        std::optional<transport::EndpointAddress> listen_on;
        std::optional<coordination::InstanceIdentity> identity;
        try {
            if (auto spec = app_opts::get_listen_on()) {
                listen_on = transport::parse_address_spec(*spec);
            }
            identity.emplace(coordination::InstanceIdentity::for_current_user(app_opts::get_app_name(),
                                                                               coordination_opts::get_group()));
        } catch (const std::invalid_argument& e) {
            logger->error(std::string("Invalid option: ") + e.what());
            return 2;
        }

        // --- Stage 3: Elect primary or connect to it ---
        coordination::SingleInstance single_instance(logger, coordination_opts::build_settings());
        auto result = single_instance.acquire(*identity);

        if (!result.is_primary()) {
            logger->info("Another instance is already running; connected to it at " +
                         result.cleanup->endpoint());
            return 0;
        }

        // --- Stage 4: Primary mode ---

        // Install signal handlers for graceful shutdown
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGINT, signal_handler);

        std::unique_ptr<transport::PosixSocket> extra_listener;
        if (listen_on) {
            extra_listener = std::make_unique<transport::PosixSocket>(logger);
            std::error_code ec;
            if (!extra_listener->start_listening(*listen_on, single_instance.settings().backlog, ec)) {
                logger->error("Cannot listen on " + listen_on->to_string() + ": " + ec.message());
                return 3;
            }
            logger->info("Also listening on " + listen_on->to_string());
        }

        serve_primary(result.cleanup, extra_listener.get(), logger);

        // Clean shutdown
        logger->info("Shutting down primary instance...");
        if (extra_listener) {
            extra_listener->close();
            if (const auto& path = listen_on->cleanup_path()) {
                std::error_code ignored;
                std::filesystem::remove(*path, ignored);
            }
        }
        result.cleanup.release();

    } catch (const coordination::AcquisitionError& e) {
        logger->error(std::string("Cannot determine instance role: ") + e.what());
        return 3;
    } catch (const std::exception& e) {
        logger->error("Exception in instance coordinator: " + std::string(e.what()));
        return 1;
    }

    // --- Stage 5: Final shutdown log ---
    logger->info("Instance coordinator shut down successfully");

    return 0;
}
