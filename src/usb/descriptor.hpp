#ifndef USBKIT_USB_DESCRIPTOR_HPP
#define USBKIT_USB_DESCRIPTOR_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "errc.hpp"
#include "error.hpp"

namespace usbkit::usb {

using index_type = std::uint16_t;
using address_type = std::uint32_t;

enum class direction : std::uint8_t { out, in };

// Values follow bmAttributes bits 1..0 of the endpoint descriptor.
enum class endpoint_type : std::uint8_t {
    control,
    isochronous,
    bulk,
    interrupt
};

enum class request_type : std::uint8_t { standard, class_, vendor, reserved };

enum class recipient : std::uint8_t { device, interface, endpoint, other };

// bmRequestType bit layout, USB 2.0 section 9.3.1.
namespace setup {

constexpr auto direction_mask = std::uint8_t{0x80};
constexpr auto type_mask = std::uint8_t{0x60};
constexpr auto recipient_mask = std::uint8_t{0x1f};
constexpr auto type_shift = 5U;

} // namespace setup

struct device_info {
    std::int32_t id{0};
    std::uint16_t vendor_id{0};
    std::uint16_t product_id{0};

    auto operator==(const device_info&) const -> bool = default;
};

struct endpoint_descriptor {
    index_type endpoint_number{0};
    address_type address{0};
    usb::direction direction{usb::direction::out};
    endpoint_type type{endpoint_type::bulk};
    std::uint16_t maximum_packet_size{0};
    std::optional<std::uint8_t> polling_interval{};

    auto operator==(const endpoint_descriptor&) const -> bool = default;
};

struct interface_descriptor {
    index_type interface_number{0};
    std::uint8_t interface_class{0};
    std::uint8_t interface_subclass{0};
    std::uint8_t interface_protocol{0};
    std::uint8_t alternate_setting{0};
    std::vector<endpoint_descriptor> endpoints{};

    auto operator==(const interface_descriptor&) const -> bool = default;
};

namespace address {

constexpr auto interface_shift = 16U;
constexpr auto endpoint_mask = address_type{(1U << interface_shift) - 1};

struct decoded {
    index_type interface_number{0};
    index_type endpoint_number{0};

    auto operator==(const decoded&) const -> bool = default;
};

constexpr auto encode(index_type interface_number, index_type endpoint_number)
    -> address_type
{
    return (address_type{interface_number} << interface_shift) |
           address_type{endpoint_number};
}

constexpr auto decode(address_type value) -> decoded
{
    return decoded{
        .interface_number = static_cast<index_type>(value >> interface_shift),
        .endpoint_number = static_cast<index_type>(value & endpoint_mask)
    };
}

} // namespace address

// Only interrupt and isochronous endpoints are polled.
constexpr auto has_polling_interval(endpoint_type type) noexcept -> bool
{
    return type == endpoint_type::interrupt ||
           type == endpoint_type::isochronous;
}

[[nodiscard]] auto to_string(usb::direction d) -> std::string_view;
[[nodiscard]] auto to_string(endpoint_type type) -> std::string_view;
[[nodiscard]] auto to_string(request_type type) -> std::string_view;
[[nodiscard]] auto to_string(usb::recipient r) -> std::string_view;

// Case-insensitive parsers for the command vocabulary.
[[nodiscard]] auto parse_direction(std::string_view name)
    -> result<usb::direction>;
[[nodiscard]] auto parse_request_type(std::string_view name)
    -> result<request_type>;
[[nodiscard]] auto parse_recipient(std::string_view name)
    -> result<usb::recipient>;

[[nodiscard]] constexpr auto direction_bits(usb::direction d) noexcept
    -> std::uint8_t
{
    return d == direction::in ? setup::direction_mask : std::uint8_t{0};
}

[[nodiscard]] constexpr auto request_type_bits(request_type type) noexcept
    -> std::uint8_t
{
    return static_cast<std::uint8_t>(
        static_cast<std::uint8_t>(type) << setup::type_shift
    );
}

[[nodiscard]] constexpr auto recipient_bits(usb::recipient r) noexcept
    -> std::uint8_t
{
    return static_cast<std::uint8_t>(r);
}

[[nodiscard]] constexpr auto make_request_type(
    usb::direction d,
    request_type type,
    usb::recipient r = recipient::device
) noexcept -> std::uint8_t
{
    return static_cast<std::uint8_t>(
        direction_bits(d) | request_type_bits(type) | recipient_bits(r)
    );
}

[[nodiscard]] constexpr auto direction_of(std::uint8_t bits) noexcept
    -> usb::direction
{
    return (bits & setup::direction_mask) != 0 ? direction::in
                                                       : direction::out;
}

} // namespace usbkit::usb

#endif // USBKIT_USB_DESCRIPTOR_HPP
