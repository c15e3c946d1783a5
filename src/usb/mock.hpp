#ifndef USBKIT_USB_MOCK_HPP
#define USBKIT_USB_MOCK_HPP

#include <gmock/gmock.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "error.hpp"
#include "usb/descriptor.hpp"
#include "usb/device.hpp"
#include "usb/host.hpp"

namespace usbkit::test {

class mock_device : public usb::connected_device {
public:
    MOCK_METHOD(std::size_t, interface_count, (), (const, override));
    MOCK_METHOD(
        std::size_t,
        endpoint_count,
        (usb::index_type),
        (const, override)
    );
    MOCK_METHOD(
        usb::interface_descriptor,
        describe_interface,
        (usb::index_type),
        (const, override)
    );
    MOCK_METHOD(
        usb::endpoint_descriptor,
        describe_endpoint,
        (usb::index_type, usb::index_type),
        (const, override)
    );
    MOCK_METHOD(bool, claim_interface, (usb::index_type), (override));
    MOCK_METHOD(bool, release_interface, (usb::index_type), (override));
    MOCK_METHOD(
        int,
        control_transfer,
        (std::uint8_t, std::uint8_t, std::uint16_t, std::uint16_t, buffer_type),
        (override)
    );
    MOCK_METHOD(void, close, (), (override));
    MOCK_METHOD(
        int,
        transfer_bulk,
        (usb::index_type, usb::index_type, usb::direction, buffer_type),
        (override)
    );
};

class mock_host : public usb::host {
public:
    MOCK_METHOD(
        result<std::vector<usb::device_info>>,
        list_devices,
        (),
        (override)
    );
    MOCK_METHOD(bool, has_permission, (const usb::device_info&), (override));
    MOCK_METHOD(
        std::unique_ptr<usb::connected_device>,
        open,
        (const usb::device_info&),
        (override)
    );
};

} // namespace usbkit::test

#endif // USBKIT_USB_MOCK_HPP
