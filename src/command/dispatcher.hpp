#ifndef USBKIT_COMMAND_DISPATCHER_HPP
#define USBKIT_COMMAND_DISPATCHER_HPP

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <boost/json.hpp>

#include "error.hpp"
#include "registry.hpp"
#include "types.hpp"
#include "usb/descriptor.hpp"
#include "usb/device.hpp"
#include "usb/host.hpp"

namespace usbkit::command {

using bytes_type = type::bytes_type;

// Empty success, a JSON document, or received bytes.
using reply = std::variant<std::monostate, boost::json::value, bytes_type>;

inline constexpr auto command_names = std::array<std::string_view, 8>{
    "getDevices",
    "openDevice",
    "closeDevice",
    "listInterfaces",
    "claimInterface",
    "releaseInterface",
    "controlTransfer",
    "bulkTransfer"
};

struct connection_info {
    handle_type handle{0};
    std::uint16_t vendor_id{0};
    std::uint16_t product_id{0};
};

struct control_request {
    handle_type handle{0};
    std::string direction{};
    std::string request_type{};
    std::optional<std::string> recipient{};
    std::int64_t request{0};
    std::int64_t value{0};
    std::int64_t index{0};
    std::int64_t length{0};
    bytes_type data{};
};

// Outcome of a transfer: the accepted direction and, for "in", the bytes
// actually received.
struct transfer_result {
    usb::direction direction{usb::direction::in};
    bytes_type data{};
};

struct bulk_request {
    handle_type handle{0};
    std::int64_t endpoint{0};
    std::string direction{};
    std::int64_t length{0};
    bytes_type data{};
};

class dispatcher final {
public:
    struct options {
        std::size_t max_transfer_length{std::size_t{1} << 20};
    };

    dispatcher(
        usb::host& host,
        connection_registry& registry,
        options opts = options{}
    );

    dispatcher(const dispatcher&) = delete;
    dispatcher(dispatcher&&) = delete;
    auto operator=(const dispatcher&) -> dispatcher& = delete;
    auto operator=(dispatcher&&) -> dispatcher& = delete;
    ~dispatcher() = default;

    /// Runs one named command. `data` carries the payload of "out"
    /// transfers.
    [[nodiscard]] auto execute(
        std::string_view command,
        const boost::json::object& params,
        std::span<const std::uint8_t> data = {}
    ) -> result<reply>;

    [[nodiscard]] auto get_devices(bool append_simulated)
        -> result<std::vector<usb::device_info>>;

    [[nodiscard]] auto open_device(std::int64_t device_id)
        -> result<connection_info>;

    [[nodiscard]] auto close_device(handle_type handle) -> result<void>;

    [[nodiscard]] auto list_interfaces(handle_type handle)
        -> result<std::vector<usb::interface_descriptor>>;

    [[nodiscard]] auto claim_interface(
        handle_type handle,
        std::int64_t interface_number
    ) -> result<void>;

    [[nodiscard]] auto release_interface(
        handle_type handle,
        std::int64_t interface_number
    ) -> result<void>;

    [[nodiscard]] auto control_transfer(const control_request& request)
        -> result<transfer_result>;

    [[nodiscard]] auto bulk_transfer(const bulk_request& request)
        -> result<transfer_result>;

private:
    using handler_type = std::function<
        result<reply>(const boost::json::object&, std::span<const std::uint8_t>)
    >;

    [[nodiscard]] auto connection(handle_type handle) const
        -> result<connection_registry::device_pointer>;

    [[nodiscard]] auto make_buffer(
        usb::direction dir,
        std::int64_t length,
        const bytes_type& data,
        std::size_t limit
    ) const -> result<bytes_type>;

    auto on_get_devices(const boost::json::object& params) -> result<reply>;
    auto on_open_device(const boost::json::object& params) -> result<reply>;
    auto on_close_device(const boost::json::object& params) -> result<reply>;
    auto on_list_interfaces(const boost::json::object& params)
        -> result<reply>;
    auto on_claim_interface(const boost::json::object& params)
        -> result<reply>;
    auto on_release_interface(const boost::json::object& params)
        -> result<reply>;
    auto on_control_transfer(
        const boost::json::object& params,
        std::span<const std::uint8_t> data
    ) -> result<reply>;
    auto on_bulk_transfer(
        const boost::json::object& params,
        std::span<const std::uint8_t> data
    ) -> result<reply>;

    usb::host& host_;
    connection_registry& registry_;
    options options_;
    std::map<std::string, handler_type, std::less<>> handlers_{};
};

static_assert(!std::copyable<dispatcher>);

[[nodiscard]] auto to_json(const usb::device_info& device)
    -> boost::json::object;
[[nodiscard]] auto to_json(const usb::endpoint_descriptor& endpoint)
    -> boost::json::object;
[[nodiscard]] auto to_json(const usb::interface_descriptor& iface)
    -> boost::json::object;
[[nodiscard]] auto to_json(const connection_info& info) -> boost::json::object;

} // namespace usbkit::command

#endif // USBKIT_COMMAND_DISPATCHER_HPP
