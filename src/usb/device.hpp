#ifndef USBKIT_USB_DEVICE_HPP
#define USBKIT_USB_DEVICE_HPP

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>

#include "error.hpp"
#include "usb/descriptor.hpp"

namespace usbkit::usb {

// An open connection to one USB device. Interface and endpoint numbers are
// indices in the active configuration (alternate setting 0) and must be
// validated against interface_count() / endpoint_count() by the caller.
class connected_device {
public:
    using buffer_type = std::span<std::uint8_t>;

    connected_device() = default;
    virtual ~connected_device() = default;

    connected_device(const connected_device&) = delete;
    connected_device(connected_device&&) = delete;
    auto operator=(const connected_device&) -> connected_device& = delete;
    auto operator=(connected_device&&) -> connected_device& = delete;

    [[nodiscard]] virtual auto interface_count() const -> std::size_t = 0;

    [[nodiscard]] virtual auto endpoint_count(index_type interface_number) const
        -> std::size_t = 0;

    [[nodiscard]] virtual auto describe_interface(
        index_type interface_number
    ) const -> interface_descriptor = 0;

    [[nodiscard]] virtual auto describe_endpoint(
        index_type interface_number,
        index_type endpoint_number
    ) const -> endpoint_descriptor = 0;

    [[nodiscard]] virtual auto claim_interface(index_type interface_number)
        -> bool = 0;

    [[nodiscard]] virtual auto release_interface(index_type interface_number)
        -> bool = 0;

    /// Returns the number of bytes transferred, or a negative value on
    /// failure. The direction is taken from bit 7 of `request_type`.
    [[nodiscard]] virtual auto control_transfer(
        std::uint8_t request_type,
        std::uint8_t request,
        std::uint16_t value,
        std::uint16_t index,
        buffer_type buffer
    ) -> int = 0;

    /// Fails with errc::direction_mismatch when `dir` differs from the
    /// endpoint's declared direction; otherwise returns what the device
    /// transfer returned (negative on failure).
    [[nodiscard]] auto bulk_transfer(
        index_type interface_number,
        index_type endpoint_number,
        usb::direction dir,
        buffer_type buffer
    ) -> result<int>;

    /// Releases the connection. Calling it again is a no-op.
    virtual void close() = 0;

private:
    [[nodiscard]] virtual auto transfer_bulk(
        index_type interface_number,
        index_type endpoint_number,
        usb::direction dir,
        buffer_type buffer
    ) -> int = 0;
};

static_assert(!std::copyable<connected_device>);

} // namespace usbkit::usb

#endif // USBKIT_USB_DEVICE_HPP
