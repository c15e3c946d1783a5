#ifndef USBKIT_USB_SIMULATED_DEVICE_HPP
#define USBKIT_USB_SIMULATED_DEVICE_HPP

#include <concepts>
#include <cstdint>
#include <mutex>
#include <optional>

#include "types.hpp"
#include "usb/device.hpp"

namespace usbkit::usb {

// In-memory device with one vendor-specific interface holding a bulk IN
// endpoint (0) and a bulk OUT endpoint (1). Bulk OUT data is echoed back
// by the next bulk IN; control IN transfers reflect their setup fields.
class simulated_device final : public connected_device {
public:
    static constexpr auto id = std::int32_t{-1000000};
    static constexpr auto vendor_id = std::uint16_t{0x18d1};
    static constexpr auto product_id = std::uint16_t{0x2001};
    static constexpr auto max_packet_size = std::uint16_t{64};
    static constexpr auto vendor_specific = std::uint8_t{0xff};

    [[nodiscard]] static constexpr auto info() noexcept -> device_info
    {
        return device_info{
            .id = id,
            .vendor_id = vendor_id,
            .product_id = product_id
        };
    }

    simulated_device() = default;

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

    std::mutex mutex_{};
    std::optional<type::bytes_type> echo_{};
};

static_assert(!std::copyable<simulated_device>);

} // namespace usbkit::usb

#endif // USBKIT_USB_SIMULATED_DEVICE_HPP
