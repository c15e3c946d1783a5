#ifndef USBKIT_USB_HOST_HPP
#define USBKIT_USB_HOST_HPP

#include <memory>
#include <vector>

#include "error.hpp"
#include "usb/descriptor.hpp"
#include "usb/device.hpp"

namespace usbkit::usb {

// The operating system's USB driver stack: enumeration, access checks and
// opening connections.
class host {
public:
    host() = default;
    virtual ~host() = default;

    host(const host&) = delete;
    host(host&&) = delete;
    auto operator=(const host&) -> host& = delete;
    auto operator=(host&&) -> host& = delete;

    [[nodiscard]] virtual auto list_devices()
        -> result<std::vector<device_info>> = 0;

    [[nodiscard]] virtual auto has_permission(const device_info& device)
        -> bool = 0;

    /// Returns nullptr when the driver gives no usable connection.
    [[nodiscard]] virtual auto open(const device_info& device)
        -> std::unique_ptr<connected_device> = 0;
};

} // namespace usbkit::usb

#endif // USBKIT_USB_HOST_HPP
