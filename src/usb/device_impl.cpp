#include "usb/device.hpp"

#include <fmt/format.h>

#include "errc.hpp"

namespace usbkit::usb {

auto connected_device::bulk_transfer(
    index_type interface_number,
    index_type endpoint_number,
    usb::direction dir,
    buffer_type buffer
) -> result<int>
{
    const auto endpoint = describe_endpoint(interface_number, endpoint_number);

    if (endpoint.direction != dir) {
        return make_error(
            errc::direction_mismatch,
            fmt::format(
                "Endpoint has direction: {}",
                to_string(endpoint.direction)
            )
        );
    }

    return transfer_bulk(interface_number, endpoint_number, dir, buffer);
}

} // namespace usbkit::usb
