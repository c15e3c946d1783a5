#include "usb/simulated_device.hpp"

#include <algorithm>
#include <array>

namespace usbkit::usb {

auto simulated_device::interface_count() const -> std::size_t { return 1; }

auto simulated_device::endpoint_count(
    [[maybe_unused]] index_type interface_number
) const -> std::size_t
{
    return 2;
}

auto simulated_device::describe_interface(index_type interface_number) const
    -> interface_descriptor
{
    return interface_descriptor{
        .interface_number = interface_number,
        .interface_class = vendor_specific,
        .interface_subclass = vendor_specific,
        .interface_protocol = vendor_specific,
        .alternate_setting = 0
    };
}

auto simulated_device::describe_endpoint(
    index_type interface_number,
    index_type endpoint_number
) const -> endpoint_descriptor
{
    return endpoint_descriptor{
        .endpoint_number = endpoint_number,
        .address = address::encode(interface_number, endpoint_number),
        .direction = endpoint_number == 0 ? direction::in : direction::out,
        .type = endpoint_type::bulk,
        .maximum_packet_size = max_packet_size,
        .polling_interval = 0
    };
}

auto simulated_device::claim_interface(
    [[maybe_unused]] index_type interface_number
) -> bool
{
    return true;
}

auto simulated_device::release_interface(
    [[maybe_unused]] index_type interface_number
) -> bool
{
    return true;
}

auto simulated_device::control_transfer(
    std::uint8_t request_type,
    std::uint8_t request,
    std::uint16_t value,
    std::uint16_t index,
    buffer_type buffer
) -> int
{
    if (direction_of(request_type) == direction::out) {
        return static_cast<int>(buffer.size());
    }

    const auto reflected = std::array{
        request,
        static_cast<std::uint8_t>(value & 0xff),
        static_cast<std::uint8_t>(index & 0xff)
    };

    const auto count = std::min(reflected.size(), buffer.size());
    std::copy_n(reflected.begin(), count, buffer.begin());
    return static_cast<int>(count);
}

auto simulated_device::transfer_bulk(
    [[maybe_unused]] index_type interface_number,
    [[maybe_unused]] index_type endpoint_number,
    usb::direction dir,
    buffer_type buffer
) -> int
{
    const auto lock = std::scoped_lock{mutex_};

    if (dir == direction::out) {
        echo_ = type::bytes_type{buffer.begin(), buffer.end()};
        return static_cast<int>(echo_->size());
    }

    if (!echo_) {
        return 0;
    }

    const auto count = std::min(echo_->size(), buffer.size());
    std::copy_n(echo_->begin(), count, buffer.begin());
    echo_.reset();
    return static_cast<int>(count);
}

void simulated_device::close() {}

} // namespace usbkit::usb
