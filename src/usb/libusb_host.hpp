#ifndef USBKIT_USB_LIBUSB_HOST_HPP
#define USBKIT_USB_LIBUSB_HOST_HPP

#include <concepts>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <tuple>
#include <vector>

#include <libusb.h>

#include "types.hpp"
#include "usb/host.hpp"

namespace usbkit::usb {

// host implementation over a private libusb context. Device ids are
// (bus number << 8) | device address, stable while the device stays
// plugged in.
class libusb_host final : public host {
public:
    libusb_host();

    [[nodiscard]] auto list_devices()
        -> result<std::vector<device_info>> override;

    [[nodiscard]] auto has_permission(const device_info& device)
        -> bool override;

    [[nodiscard]] auto open(const device_info& device)
        -> std::unique_ptr<connected_device> override;

    [[nodiscard]] static auto make_id(
        std::uint8_t bus_number,
        std::uint8_t device_address
    ) noexcept -> std::int32_t;

    [[nodiscard]] static auto device_node(const device_info& device)
        -> std::filesystem::path;

private:
    using device_list_pointer = usbkit::type::unique_pointer_t<libusb_device*>;

    [[nodiscard]] auto make_list() const
        -> std::tuple<device_list_pointer, std::ptrdiff_t>;

    [[nodiscard]] static auto describe(libusb_device* usb_device)
        -> std::optional<device_info>;

    std::shared_ptr<libusb_context> libusb_context_{};
};

static_assert(!std::copyable<libusb_host>);

} // namespace usbkit::usb

#endif // USBKIT_USB_LIBUSB_HOST_HPP
