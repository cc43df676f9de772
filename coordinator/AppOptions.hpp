#pragma once

#include "logger.hpp"

#include <optional>
#include <string>

namespace app_opts {

/**
 * \brief Register application options (name, extra listen address, log level).
 *
 * This function is safe to call multiple times; registration is protected
 * by an internal flag.
 */
void register_options();

/**
 * \brief Application name used for the instance identity.
 * \return Configured name, or the executable's file name when none was given.
 */
std::string get_app_name();

/**
 * \brief Extra endpoint the primary listens on, in address-spec form.
 * \return nullopt when not configured.
 */
std::optional<std::string> get_listen_on();

/** \brief Console log level (Info unless configured). */
LogLevel get_log_level();

} // namespace app_opts
