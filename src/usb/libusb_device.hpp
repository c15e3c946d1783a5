#ifndef USBKIT_USB_LIBUSB_DEVICE_HPP
#define USBKIT_USB_LIBUSB_DEVICE_HPP

#include <concepts>
#include <memory>

#include <libusb.h>

#include "types.hpp"
#include "usb/device.hpp"

namespace usbkit::usb {

// connected_device backed by a libusb handle. Every call forwards to libusb
// or reads the active configuration descriptor; nothing is decided here.
class real_device final : public connected_device {
public:
    using context_pointer = std::shared_ptr<libusb_context>;
    using device_handle_pointer =
        usbkit::type::unique_pointer_t<libusb_device_handle>;
    using config_descriptor_pointer =
        usbkit::type::unique_pointer_t<libusb_config_descriptor>;

    real_device(
        context_pointer context,
        device_handle_pointer handle,
        config_descriptor_pointer config
    );

    ~real_device() override;

    [[nodiscard]] auto interface_count() const -> std::size_t override;

    [[nodiscard]] auto endpoint_count(index_type interface_number) const
        -> std::size_t override;

    [[nodiscard]] auto describe_interface(index_type interface_number) const
        -> interface_descriptor override;

    [[nodiscard]] auto describe_endpoint(
        index_type interface_number,
        index_type endpoint_number
    ) const -> endpoint_descriptor override;

    [[nodiscard]] auto claim_interface(index_type interface_number)
        -> bool override;

    [[nodiscard]] auto release_interface(index_type interface_number)
        -> bool override;

    [[nodiscard]] auto control_transfer(
        std::uint8_t request_type,
        std::uint8_t request,
        std::uint16_t value,
        std::uint16_t index,
        buffer_type buffer
    ) -> int override;

    void close() override;

private:
    [[nodiscard]] auto transfer_bulk(
        index_type interface_number,
        index_type endpoint_number,
        usb::direction dir,
        buffer_type buffer
    ) -> int override;

    [[nodiscard]] auto altsetting(index_type interface_number) const
        -> const libusb_interface_descriptor&;

    [[nodiscard]] auto endpoint(
        index_type interface_number,
        index_type endpoint_number
    ) const -> const libusb_endpoint_descriptor&;

    context_pointer context_{};
    device_handle_pointer device_handle_{};
    config_descriptor_pointer config_descriptor_{};
};

static_assert(!std::copyable<real_device>);

} // namespace usbkit::usb

#endif // USBKIT_USB_LIBUSB_DEVICE_HPP
