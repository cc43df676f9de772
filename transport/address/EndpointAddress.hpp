/**
 * \file EndpointAddress.hpp
 * \brief Transport-neutral endpoint description and the textual address spec parser.
 * \ingroup socket_backend
 * \details An endpoint spec has the form `<protocol>:<rest>`:
 *  - `unix:@name`  abstract-namespace Unix socket (no filesystem artifact)
 *  - `unix:/path`  filesystem Unix socket; the path must be unlinked after use
 *  - `tcp:host:port` / `tcp6:host:port`  split on the last ':' so IPv6 literals work
 *
 *  The same grammar is used for the single-instance rendezvous and for general
 *  listen-address configuration (`--listen-on`).
 */
#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace transport {

/** \brief Socket family an endpoint resolves to. */
enum class AddressFamily { Unix, TcpV4, TcpV6 };

/** \brief Unix-domain endpoint: either a filesystem path or an abstract name. */
struct UnixEndpoint {
    std::string name;          ///< Filesystem path, or abstract name without the leading '@'
    bool is_abstract = false;

    bool operator==(const UnixEndpoint&) const = default;
};

/** \brief TCP endpoint; an empty host means "all interfaces" when binding. */
struct TcpEndpoint {
    std::string host;
    int port = 0;

    bool operator==(const TcpEndpoint&) const = default;
};

/** \brief Thrown by \ref parse_address_spec for malformed specs. */
class InvalidAddressSpec : public std::invalid_argument {
public:
    InvalidAddressSpec(std::string spec, const std::string& reason)
        : std::invalid_argument("invalid address spec '" + spec + "': " + reason),
          spec_(std::move(spec)) {}

    /** \brief The offending spec string, verbatim. */
    const std::string& spec() const noexcept { return spec_; }

private:
    std::string spec_;
};

/** \brief Tagged endpoint value plus the filesystem path to remove after use (if any).
 *  \ingroup socket_backend
 */
class EndpointAddress {
public:
    static EndpointAddress unix_path(std::filesystem::path path);
    static EndpointAddress unix_abstract(std::string name);
    static EndpointAddress tcp(std::string host, int port);
    static EndpointAddress tcp6(std::string host, int port);

    AddressFamily family() const noexcept { return family_; }

    /** \brief Unix endpoint details, or nullptr for TCP endpoints. */
    const UnixEndpoint* as_unix() const noexcept { return std::get_if<UnixEndpoint>(&value_); }
    /** \brief TCP endpoint details, or nullptr for Unix endpoints. */
    const TcpEndpoint* as_tcp() const noexcept { return std::get_if<TcpEndpoint>(&value_); }

    /** \brief Present only for filesystem-backed Unix endpoints. */
    const std::optional<std::filesystem::path>& cleanup_path() const noexcept { return cleanup_path_; }

    /** \brief Canonical spec form, e.g. `unix:@name` or `tcp6:::1:8080`. */
    std::string to_string() const;

    bool operator==(const EndpointAddress&) const = default;

private:
    EndpointAddress(AddressFamily family, std::variant<UnixEndpoint, TcpEndpoint> value,
                    std::optional<std::filesystem::path> cleanup_path)
        : family_(family), value_(std::move(value)), cleanup_path_(std::move(cleanup_path)) {}

    AddressFamily family_;
    std::variant<UnixEndpoint, TcpEndpoint> value_;
    std::optional<std::filesystem::path> cleanup_path_;
};

/** \brief Parse `<protocol>:<rest>` into an \ref EndpointAddress.
 *  \details Pure function. Unknown protocols, a missing host/port separator, or a
 *  port that is not a decimal number in 0..65535 raise \ref InvalidAddressSpec.
 *  \throws InvalidAddressSpec
 */
EndpointAddress parse_address_spec(std::string_view spec);

} // namespace transport
