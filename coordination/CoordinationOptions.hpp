/**
 * \file CoordinationOptions.hpp
 * \brief CLI/config options for single-instance coordination.
 * \ingroup coordination
 * \details JSON section `coordination`:
 *  \code
 *  { "coordination": { "group": "work", "mode": "auto",
 *                      "lock_dirs": ["/run/user/1000", "locks"], "connect_attempts": 20 } }
 *  \endcode
 *  Relative `lock_dirs` from the config file are resolved against the config file's
 *  directory; relative `--lock-dir` values are taken as given.
 */
#pragma once

#include "SingleInstance.hpp"

#include <optional>
#include <string>

namespace coordination_opts {

/** \brief Register coordination options (once). Safe to call multiple times. */
void register_options();

/** \brief Group qualifier; nullopt when unset or empty. */
std::optional<std::string> get_group();

/** \brief Settings assembled from the parsed options. */
coordination::CoordinatorSettings build_settings();

} // namespace coordination_opts
