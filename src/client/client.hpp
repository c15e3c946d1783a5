#ifndef USBKIT_CLIENT_CLIENT_HPP
#define USBKIT_CLIENT_CLIENT_HPP

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

#include <boost/json.hpp>

#include "error.hpp"
#include "protocol/protocol.hpp"

namespace usbkit::client {

enum class errc : std::uint8_t { invalid_option = 1 };

constexpr auto error_category_of(errc /*unused*/) noexcept
{
    return error_category::config;
}

struct invocation {
    protocol::request request{};
    std::filesystem::path socket{};
    bool help{false};
};

[[nodiscard]] auto usage() -> std::string;

/// Parses `usbkit <command> [--params JSON] [--data HEX] [--socket PATH]`.
[[nodiscard]] auto parse_arguments(std::span<const char* const> args)
    -> result<invocation>;

/// Sends one request to the daemon and waits for its response.
[[nodiscard]] auto send(
    const std::filesystem::path& socket,
    const protocol::request& request
) -> result<boost::json::object>;

[[nodiscard]] auto run(std::span<const char* const> args) -> int;

} // namespace usbkit::client

#endif // USBKIT_CLIENT_CLIENT_HPP
