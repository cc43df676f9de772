/**
 * \file EndpointAddress.cpp
 * \brief Address spec parsing and canonical rendering.
 * \ingroup socket_backend
 */
#include "EndpointAddress.hpp"

#include <charconv>

namespace transport {

EndpointAddress EndpointAddress::unix_path(std::filesystem::path path) {
    auto name = path.string();
    return EndpointAddress(AddressFamily::Unix, UnixEndpoint{std::move(name), false}, std::move(path));
}

EndpointAddress EndpointAddress::unix_abstract(std::string name) {
    return EndpointAddress(AddressFamily::Unix, UnixEndpoint{std::move(name), true}, std::nullopt);
}

EndpointAddress EndpointAddress::tcp(std::string host, int port) {
    return EndpointAddress(AddressFamily::TcpV4, TcpEndpoint{std::move(host), port}, std::nullopt);
}

EndpointAddress EndpointAddress::tcp6(std::string host, int port) {
    return EndpointAddress(AddressFamily::TcpV6, TcpEndpoint{std::move(host), port}, std::nullopt);
}

std::string EndpointAddress::to_string() const {
    if (const auto* u = as_unix()) {
        return u->is_abstract ? "unix:@" + u->name : "unix:" + u->name;
    }
    const auto* t = as_tcp();
    const char* proto = family_ == AddressFamily::TcpV6 ? "tcp6:" : "tcp:";
    return proto + t->host + ":" + std::to_string(t->port);
}

namespace {

int parse_port(std::string_view spec, std::string_view text) {
    if (text.empty()) {
        throw InvalidAddressSpec(std::string(spec), "missing port");
    }
    int port = -1;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, port);
    // from_chars accepts a leading '-', so reject it explicitly along with trailing junk
    if (ec != std::errc{} || ptr != last || text.front() == '-') {
        throw InvalidAddressSpec(std::string(spec), "port '" + std::string(text) + "' is not a number");
    }
    if (port < 0 || port > 65535) {
        throw InvalidAddressSpec(std::string(spec), "port " + std::string(text) + " out of range");
    }
    return port;
}

} // namespace

EndpointAddress parse_address_spec(std::string_view spec) {
    const auto colon = spec.find(':');
    if (colon == std::string_view::npos) {
        throw InvalidAddressSpec(std::string(spec), "expected <protocol>:<address>");
    }
    const std::string_view protocol = spec.substr(0, colon);
    const std::string_view rest = spec.substr(colon + 1);

    if (protocol == "unix") {
        if (rest.empty()) {
            throw InvalidAddressSpec(std::string(spec), "empty socket path");
        }
        if (rest.front() == '@' && rest.size() > 1) {
            return EndpointAddress::unix_abstract(std::string(rest.substr(1)));
        }
        return EndpointAddress::unix_path(std::filesystem::path(std::string(rest)));
    }

    if (protocol == "tcp" || protocol == "tcp6") {
        const auto sep = rest.rfind(':');
        if (sep == std::string_view::npos) {
            throw InvalidAddressSpec(std::string(spec), "expected <host>:<port>");
        }
        std::string host(rest.substr(0, sep));
        const int port = parse_port(spec, rest.substr(sep + 1));
        if (protocol == "tcp6" && host.size() >= 2 && host.front() == '[' && host.back() == ']') {
            host = host.substr(1, host.size() - 2);
        }
        return protocol == "tcp" ? EndpointAddress::tcp(std::move(host), port)
                                 : EndpointAddress::tcp6(std::move(host), port);
    }

    throw InvalidAddressSpec(std::string(spec), "unknown protocol '" + std::string(protocol) + "'");
}

} // namespace transport
