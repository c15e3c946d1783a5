#include "usb/descriptor.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace usbkit::usb {

namespace {

template <typename E, std::size_t N>
using vocabulary = std::array<std::pair<std::string_view, E>, N>;

constexpr auto directions = vocabulary<usb::direction, 2>{{
    {"out", direction::out},
    {"in", direction::in},
}};

constexpr auto request_types = vocabulary<request_type, 4>{{
    {"standard", request_type::standard},
    {"class", request_type::class_},
    {"vendor", request_type::vendor},
    {"reserved", request_type::reserved},
}};

constexpr auto recipients = vocabulary<usb::recipient, 4>{{
    {"device", recipient::device},
    {"interface", recipient::interface},
    {"endpoint", recipient::endpoint},
    {"other", recipient::other},
}};

constexpr auto endpoint_types = vocabulary<endpoint_type, 4>{{
    {"control", endpoint_type::control},
    {"isochronous", endpoint_type::isochronous},
    {"bulk", endpoint_type::bulk},
    {"interrupt", endpoint_type::interrupt},
}};

auto to_lower(std::string_view text) -> std::string
{
    auto lowered = std::string{text};
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

template <typename E, std::size_t N>
auto name_of(const vocabulary<E, N>& words, E value) -> std::string_view
{
    using entry = std::pair<std::string_view, E>;
    const auto it = std::ranges::find(words, value, &entry::second);
    return it != std::end(words) ? it->first : std::string_view{"unknown"};
}

template <typename E, std::size_t N>
auto lookup(
    const vocabulary<E, N>& words,
    std::string_view name,
    std::string_view what
) -> result<E>
{
    using entry = std::pair<std::string_view, E>;
    const auto lowered = to_lower(name);
    const auto it = std::ranges::find(words, lowered, &entry::first);

    if (it == std::end(words)) {
        return make_error(
            errc::unknown_vocabulary,
            fmt::format("Unknown transfer {}: {}", what, lowered)
        );
    }

    return it->second;
}

} // namespace

auto to_string(usb::direction d) -> std::string_view
{
    return name_of(directions, d);
}

auto to_string(endpoint_type type) -> std::string_view
{
    return name_of(endpoint_types, type);
}

auto to_string(request_type type) -> std::string_view
{
    return name_of(request_types, type);
}

auto to_string(usb::recipient r) -> std::string_view
{
    return name_of(recipients, r);
}

auto parse_direction(std::string_view name) -> result<usb::direction>
{
    return lookup(directions, name, "direction");
}

auto parse_request_type(std::string_view name) -> result<request_type>
{
    return lookup(request_types, name, "requestType");
}

auto parse_recipient(std::string_view name) -> result<usb::recipient>
{
    return lookup(recipients, name, "recipient");
}

} // namespace usbkit::usb
