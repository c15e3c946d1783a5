#ifndef USBKIT_PROTOCOL_PROTOCOL_HPP
#define USBKIT_PROTOCOL_PROTOCOL_HPP

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include <boost/asio.hpp>
#include <boost/json.hpp>

#include "command/dispatcher.hpp"
#include "error.hpp"
#include "types.hpp"

namespace usbkit::protocol {

enum class errc : std::uint8_t {
    malformed_request = 1,
    frame_too_large,
    connection_closed,
    io_failed
};

constexpr auto error_category_of(errc /*unused*/) noexcept
{
    return error_category::protocol;
}

[[nodiscard]] auto to_string(errc e) noexcept -> std::string_view;

// Frames are a native-endian u32 length followed by a JSON document.
using frame_size_type = std::uint32_t;

constexpr auto max_frame_size = frame_size_type{64U << 20U};

struct request {
    boost::json::value id{};
    std::string command{};
    boost::json::object params{};
    type::bytes_type data{};
};

[[nodiscard]] auto parse_request(std::string_view text) -> result<request>;

[[nodiscard]] auto to_json(const request& req) -> boost::json::object;

[[nodiscard]] auto make_success(
    const boost::json::value& id,
    const command::reply& payload
) -> boost::json::object;

[[nodiscard]] auto make_failure(
    const boost::json::value& id,
    const error& err
) -> boost::json::object;

/// Name reported in the "code" field of a failed response.
[[nodiscard]] auto code_name(const error& err) -> std::string_view;

template <typename SyncWriteStream>
auto write_frame(SyncWriteStream& stream, std::string_view payload)
    -> result<void>
{
    if (payload.size() > max_frame_size) {
        return make_error(
            errc::frame_too_large,
            "Frame of " + std::to_string(payload.size()) + " bytes"
        );
    }

    const auto size = static_cast<frame_size_type>(payload.size());
    const auto buffers = std::array{
        boost::asio::buffer(&size, sizeof(size)),
        boost::asio::const_buffer{payload.data(), payload.size()}
    };

    auto ec = boost::system::error_code{};
    boost::asio::write(stream, buffers, ec);
    if (ec) {
        return make_error(errc::io_failed, ec.message());
    }

    return {};
}

template <typename SyncReadStream>
auto read_frame(SyncReadStream& stream) -> result<std::string>
{
    auto size = frame_size_type{};
    auto ec = boost::system::error_code{};

    boost::asio::read(stream, boost::asio::buffer(&size, sizeof(size)), ec);
    if (ec == boost::asio::error::eof) {
        return make_error(errc::connection_closed, "Peer closed connection");
    }
    if (ec) {
        return make_error(errc::io_failed, ec.message());
    }

    if (size > max_frame_size) {
        return make_error(
            errc::frame_too_large,
            "Frame of " + std::to_string(size) + " bytes"
        );
    }

    auto payload = std::string(size, '\0');
    boost::asio::read(stream, boost::asio::buffer(payload), ec);
    if (ec) {
        return make_error(errc::io_failed, ec.message());
    }

    return payload;
}

} // namespace usbkit::protocol

#endif // USBKIT_PROTOCOL_PROTOCOL_HPP
