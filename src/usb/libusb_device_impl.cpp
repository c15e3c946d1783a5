#include "usb/libusb_device.hpp"

#include <utility>

namespace usbkit::usb {

namespace {

const auto ep_direction_mask = std::uint8_t{LIBUSB_ENDPOINT_DIR_MASK};
const auto ep_transfer_type_mask = std::uint8_t{LIBUSB_TRANSFER_TYPE_MASK};

// Transfers block until the device answers.
const auto no_timeout = 0U;

} // namespace

real_device::real_device(
    context_pointer context,
    device_handle_pointer handle,
    config_descriptor_pointer config
)
    : context_{std::move(context)}, device_handle_{std::move(handle)},
      config_descriptor_{std::move(config)}
{
}

real_device::~real_device() { close(); }

auto real_device::altsetting(index_type interface_number) const
    -> const libusb_interface_descriptor&
{
    return config_descriptor_->interface[interface_number].altsetting[0];
}

auto real_device::endpoint(
    index_type interface_number,
    index_type endpoint_number
) const -> const libusb_endpoint_descriptor&
{
    return altsetting(interface_number).endpoint[endpoint_number];
}

auto real_device::interface_count() const -> std::size_t
{
    return config_descriptor_->bNumInterfaces;
}

auto real_device::endpoint_count(index_type interface_number) const
    -> std::size_t
{
    return altsetting(interface_number).bNumEndpoints;
}

auto real_device::describe_interface(index_type interface_number) const
    -> interface_descriptor
{
    const auto& desc = altsetting(interface_number);

    return interface_descriptor{
        .interface_number = interface_number,
        .interface_class = desc.bInterfaceClass,
        .interface_subclass = desc.bInterfaceSubClass,
        .interface_protocol = desc.bInterfaceProtocol,
        .alternate_setting = 0
    };
}

auto real_device::describe_endpoint(
    index_type interface_number,
    index_type endpoint_number
) const -> endpoint_descriptor
{
    const auto& desc = endpoint(interface_number, endpoint_number);

    return endpoint_descriptor{
        .endpoint_number = endpoint_number,
        .address = address::encode(interface_number, endpoint_number),
        .direction = direction_of(desc.bEndpointAddress & ep_direction_mask),
        .type = static_cast<endpoint_type>(
            desc.bmAttributes & ep_transfer_type_mask
        ),
        .maximum_packet_size = desc.wMaxPacketSize,
        .polling_interval = desc.bInterval
    };
}

auto real_device::claim_interface(index_type interface_number) -> bool
{
    return libusb_claim_interface(
               device_handle_.get(),
               altsetting(interface_number).bInterfaceNumber
           ) == LIBUSB_SUCCESS;
}

auto real_device::release_interface(index_type interface_number) -> bool
{
    return libusb_release_interface(
               device_handle_.get(),
               altsetting(interface_number).bInterfaceNumber
           ) == LIBUSB_SUCCESS;
}

auto real_device::control_transfer(
    std::uint8_t request_type,
    std::uint8_t request,
    std::uint16_t value,
    std::uint16_t index,
    buffer_type buffer
) -> int
{
    return libusb_control_transfer(
        device_handle_.get(),
        request_type,
        request,
        value,
        index,
        buffer.data(),
        static_cast<std::uint16_t>(buffer.size()),
        no_timeout
    );
}

auto real_device::transfer_bulk(
    index_type interface_number,
    index_type endpoint_number,
    [[maybe_unused]] usb::direction dir,
    buffer_type buffer
) -> int
{
    auto transferred = int{0};
    const auto libusb_result = libusb_bulk_transfer(
        device_handle_.get(),
        endpoint(interface_number, endpoint_number).bEndpointAddress,
        buffer.data(),
        static_cast<int>(buffer.size()),
        &transferred,
        no_timeout
    );

    return libusb_result < LIBUSB_SUCCESS ? libusb_result : transferred;
}

void real_device::close() { device_handle_.reset(); }

} // namespace usbkit::usb
