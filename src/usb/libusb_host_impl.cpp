#include "usb/libusb_host.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include <unistd.h>

#include "errc.hpp"
#include "format.hpp"
#include "log.hpp"
#include "usb/libusb_device.hpp"

namespace usbkit::usb {

libusb_host::libusb_host()
{
    libusb_context* context{nullptr};
    const auto libusb_result = libusb_init(&context);

    if (libusb_result != LIBUSB_SUCCESS) {
        throw std::runtime_error(
            format::make_string(
                "Failed to initialize libusb:",
                libusb_error_name(libusb_result)
            )
        );
    }

    libusb_context_ = std::shared_ptr<libusb_context>{
        context,
        [](libusb_context* ctx) { libusb_exit(ctx); }
    };
}

auto libusb_host::make_id(
    std::uint8_t bus_number,
    std::uint8_t device_address
) noexcept -> std::int32_t
{
    return (std::int32_t{bus_number} << 8) | std::int32_t{device_address};
}

auto libusb_host::device_node(const device_info& device)
    -> std::filesystem::path
{
    return fmt::format(
        "/dev/bus/usb/{:03}/{:03}",
        (device.id >> 8) & 0xff,
        device.id & 0xff
    );
}

auto libusb_host::make_list() const
    -> std::tuple<device_list_pointer, std::ptrdiff_t>
{
    libusb_device** usb_device_list{nullptr};
    const auto device_count =
        libusb_get_device_list(libusb_context_.get(), &usb_device_list);

    const auto deleter = [](libusb_device** device_list) {
        libusb_free_device_list(device_list, 1);
    };

    return std::make_tuple(
        device_list_pointer{usb_device_list, deleter},
        device_count
    );
}

auto libusb_host::describe(libusb_device* usb_device)
    -> std::optional<device_info>
{
    auto descriptor = libusb_device_descriptor{};
    const auto libusb_result =
        libusb_get_device_descriptor(usb_device, &descriptor);

    if (libusb_result != LIBUSB_SUCCESS) {
        USBKIT_LOG_WARNING(
            "Skipping device without descriptor: {}",
            libusb_error_name(libusb_result)
        );
        return std::nullopt;
    }

    return device_info{
        .id = make_id(
            libusb_get_bus_number(usb_device),
            libusb_get_device_address(usb_device)
        ),
        .vendor_id = descriptor.idVendor,
        .product_id = descriptor.idProduct
    };
}

auto libusb_host::list_devices() -> result<std::vector<device_info>>
{
    const auto [usb_device_list, device_count] = make_list();

    if (device_count < 0) {
        return make_error(
            errc::enumeration_failed,
            format::make_string(
                "libusb_get_device_list failed:",
                libusb_error_name(static_cast<int>(device_count))
            )
        );
    }

    auto devices = std::vector<device_info>{};
    for (auto* usb_device : format::unsafe::vectorize(
             usb_device_list.get(),
             static_cast<std::size_t>(device_count)
         )) {
        if (auto info = describe(usb_device)) {
            devices.push_back(*info);
        }
    }

    return devices;
}

auto libusb_host::has_permission(const device_info& device) -> bool
{
    const auto node = device_node(device);
    return ::access(node.c_str(), R_OK | W_OK) == 0;
}

auto libusb_host::open(const device_info& device)
    -> std::unique_ptr<connected_device>
{
    const auto [usb_device_list, device_count] = make_list();

    if (device_count < 0) {
        USBKIT_LOG_ERROR(
            "libusb_get_device_list failed: {}",
            libusb_error_name(static_cast<int>(device_count))
        );
        return nullptr;
    }

    const auto usb_devices = format::unsafe::vectorize(
        usb_device_list.get(),
        static_cast<std::size_t>(device_count)
    );

    for (auto* usb_device : usb_devices) {
        const auto id = make_id(
            libusb_get_bus_number(usb_device),
            libusb_get_device_address(usb_device)
        );

        if (id != device.id) {
            continue;
        }

        libusb_device_handle* raw_handle{nullptr};
        auto libusb_result = libusb_open(usb_device, &raw_handle);
        if (libusb_result != LIBUSB_SUCCESS) {
            USBKIT_LOG_ERROR(
                "libusb_open failed for device {}: {}",
                device.id,
                libusb_error_name(libusb_result)
            );
            return nullptr;
        }

        auto handle = real_device::device_handle_pointer{
            raw_handle,
            [](libusb_device_handle* h) { libusb_close(h); }
        };

        libusb_result = libusb_set_auto_detach_kernel_driver(raw_handle, 1);
        if (libusb_result != LIBUSB_SUCCESS) {
            USBKIT_LOG_DEBUG(
                "Kernel driver auto-detach unavailable for device {}: {}",
                device.id,
                libusb_error_name(libusb_result)
            );
        }

        libusb_config_descriptor* raw_config{nullptr};
        libusb_result =
            libusb_get_active_config_descriptor(usb_device, &raw_config);
        if (libusb_result != LIBUSB_SUCCESS) {
            USBKIT_LOG_ERROR(
                "No active configuration for device {}: {}",
                device.id,
                libusb_error_name(libusb_result)
            );
            return nullptr;
        }

        auto config = real_device::config_descriptor_pointer{
            raw_config,
            [](libusb_config_descriptor* d) {
                libusb_free_config_descriptor(d);
            }
        };

        return std::make_unique<real_device>(
            libusb_context_,
            std::move(handle),
            std::move(config)
        );
    }

    USBKIT_LOG_WARNING("Device {} is no longer attached", device.id);
    return nullptr;
}

} // namespace usbkit::usb
