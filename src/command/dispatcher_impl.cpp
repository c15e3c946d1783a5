#include "command/dispatcher.hpp"

#include <algorithm>
#include <iterator>
#include <memory>
#include <utility>

#include <fmt/format.h>

#include "errc.hpp"
#include "json/json.hpp"
#include "log.hpp"
#include "usb/simulated_device.hpp"

namespace usbkit::command {

namespace {

constexpr auto max_control_length = std::size_t{0xffff};

auto read_handle(const boost::json::object& params) -> result<handle_type>
{
    const auto value = json::read_int(params, "handle");
    if (!value) {
        return make_error(value.error());
    }

    if (!type::numeric::fits<handle_type>(*value)) {
        return make_error(
            errc::not_found,
            fmt::format("Unknown connection handle: {}", *value)
        );
    }

    return static_cast<handle_type>(*value);
}

template <std::integral T>
auto checked(std::int64_t value, std::string_view name) -> result<T>
{
    if (!type::numeric::fits<T>(value)) {
        return make_error(
            errc::invalid_argument,
            fmt::format(
                "Parameter {} = {} out of range {}..{}",
                name,
                value,
                type::numeric::min<T>,
                type::numeric::max<T>
            )
        );
    }

    return static_cast<T>(value);
}

auto to_bytes(std::span<const std::uint8_t> data) -> bytes_type
{
    return bytes_type{data.begin(), data.end()};
}

auto interface_index(
    const usb::connected_device& device,
    std::int64_t interface_number
) -> result<usb::index_type>
{
    const auto count = device.interface_count();
    if (interface_number < 0 ||
        std::cmp_greater_equal(interface_number, count)) {
        return make_error(
            errc::out_of_range,
            fmt::format(
                "Interface number {} out of range, device has {} "
                "interface(s)",
                interface_number,
                count
            )
        );
    }

    return static_cast<usb::index_type>(interface_number);
}

// Shrinks an IN buffer to what the device actually delivered.
auto received(bytes_type buffer, int transferred) -> bytes_type
{
    const auto count = std::min(
        buffer.size(),
        static_cast<std::size_t>(transferred)
    );
    buffer.resize(count);
    return buffer;
}

// OUT transfers answer with an empty success, IN transfers with the bytes
// received.
auto make_reply(transfer_result transferred) -> reply
{
    if (transferred.direction == usb::direction::out) {
        return reply{};
    }

    return reply{std::move(transferred.data)};
}

} // namespace

dispatcher::dispatcher(
    usb::host& host,
    connection_registry& registry,
    options opts
)
    : host_(host), registry_(registry), options_(opts)
{
    using params_type = const boost::json::object&;
    using data_type = std::span<const std::uint8_t>;

    handlers_ = {
        {"getDevices",
         [this](params_type params, data_type) {
             return on_get_devices(params);
         }},
        {"openDevice",
         [this](params_type params, data_type) {
             return on_open_device(params);
         }},
        {"closeDevice",
         [this](params_type params, data_type) {
             return on_close_device(params);
         }},
        {"listInterfaces",
         [this](params_type params, data_type) {
             return on_list_interfaces(params);
         }},
        {"claimInterface",
         [this](params_type params, data_type) {
             return on_claim_interface(params);
         }},
        {"releaseInterface",
         [this](params_type params, data_type) {
             return on_release_interface(params);
         }},
        {"controlTransfer",
         [this](params_type params, data_type data) {
             return on_control_transfer(params, data);
         }},
        {"bulkTransfer", [this](params_type params, data_type data) {
             return on_bulk_transfer(params, data);
         }}
    };
}

auto dispatcher::execute(
    std::string_view command,
    const boost::json::object& params,
    std::span<const std::uint8_t> data
) -> result<reply>
{
    USBKIT_LOG_DEBUG(
        "Command {} params {} data {} byte(s)",
        command,
        boost::json::serialize(params),
        data.size()
    );

    const auto handler = handlers_.find(command);
    if (handler == std::end(handlers_)) {
        USBKIT_LOG_WARNING("Unknown command: {}", command);
        return make_error(
            errc::unknown_command,
            fmt::format("Unknown command: {}", command)
        );
    }

    auto res = handler->second(params, data);
    if (!res) {
        USBKIT_LOG_WARNING(
            "Command {} failed: {}",
            command,
            res.error().message()
        );
    }

    return res;
}

auto dispatcher::connection(handle_type handle) const
    -> result<connection_registry::device_pointer>
{
    return registry_.get(handle);
}

auto dispatcher::make_buffer(
    usb::direction dir,
    std::int64_t length,
    const bytes_type& data,
    std::size_t limit
) const -> result<bytes_type>
{
    if (dir == usb::direction::out) {
        if (data.size() > limit) {
            return make_error(
                errc::invalid_argument,
                fmt::format(
                    "Transfer data of {} bytes exceeds the limit of {}",
                    data.size(),
                    limit
                )
            );
        }

        return data;
    }

    if (length < 0 || std::cmp_greater(length, limit)) {
        return make_error(
            errc::invalid_argument,
            fmt::format("Transfer length {} out of range 0..{}", length, limit)
        );
    }

    return bytes_type(static_cast<std::size_t>(length));
}

auto dispatcher::get_devices(bool append_simulated)
    -> result<std::vector<usb::device_info>>
{
    auto devices = host_.list_devices();
    if (!devices) {
        return make_error(devices.error());
    }

    if (append_simulated) {
        devices->push_back(usb::simulated_device::info());
    }

    return devices;
}

auto dispatcher::open_device(std::int64_t device_id) -> result<connection_info>
{
    if (device_id == usb::simulated_device::id) {
        const auto handle = registry_.open(
            std::make_unique<usb::simulated_device>()
        );
        return connection_info{
            .handle = handle,
            .vendor_id = usb::simulated_device::vendor_id,
            .product_id = usb::simulated_device::product_id
        };
    }

    const auto devices = host_.list_devices();
    if (!devices) {
        return make_error(devices.error());
    }

    const auto device = std::ranges::find_if(
        *devices,
        [device_id](const usb::device_info& d) {
            return std::cmp_equal(d.id, device_id);
        }
    );

    if (device == std::end(*devices)) {
        return make_error(
            errc::not_found,
            fmt::format("Unknown device ID: {}", device_id)
        );
    }

    if (!host_.has_permission(*device)) {
        return make_error(
            errc::permission_denied,
            fmt::format(
                "No permission for device {}, permission requests are not "
                "supported",
                device_id
            )
        );
    }

    auto connected = host_.open(*device);
    if (!connected) {
        return make_error(
            errc::open_failed,
            fmt::format("Failed to open device {}", device_id)
        );
    }

    return connection_info{
        .handle = registry_.open(std::move(connected)),
        .vendor_id = device->vendor_id,
        .product_id = device->product_id
    };
}

auto dispatcher::close_device(handle_type handle) -> result<void>
{
    registry_.close(handle);
    return {};
}

auto dispatcher::list_interfaces(handle_type handle)
    -> result<std::vector<usb::interface_descriptor>>
{
    const auto device = connection(handle);
    if (!device) {
        return make_error(device.error());
    }

    const auto& dev = **device;
    auto interfaces = std::vector<usb::interface_descriptor>{};

    for (std::size_t i = 0; i < dev.interface_count(); ++i) {
        const auto iface_number = static_cast<usb::index_type>(i);
        auto iface = dev.describe_interface(iface_number);
        iface.interface_number = iface_number;
        iface.endpoints.clear();

        for (std::size_t e = 0; e < dev.endpoint_count(iface_number); ++e) {
            const auto ep_number = static_cast<usb::index_type>(e);
            auto endpoint = dev.describe_endpoint(iface_number, ep_number);
            endpoint.endpoint_number = ep_number;
            endpoint.address = usb::address::encode(iface_number, ep_number);
            if (!usb::has_polling_interval(endpoint.type)) {
                endpoint.polling_interval.reset();
            }
            iface.endpoints.push_back(endpoint);
        }

        interfaces.push_back(std::move(iface));
    }

    return interfaces;
}

auto dispatcher::claim_interface(
    handle_type handle,
    std::int64_t interface_number
) -> result<void>
{
    const auto device = connection(handle);
    if (!device) {
        return make_error(device.error());
    }

    const auto index = interface_index(**device, interface_number);
    if (!index) {
        return make_error(index.error());
    }

    if (!(*device)->claim_interface(*index)) {
        return make_error(
            errc::claim_failed,
            fmt::format("Failed to claim interface {}", *index)
        );
    }

    return {};
}

auto dispatcher::release_interface(
    handle_type handle,
    std::int64_t interface_number
) -> result<void>
{
    const auto device = connection(handle);
    if (!device) {
        return make_error(device.error());
    }

    const auto index = interface_index(**device, interface_number);
    if (!index) {
        return make_error(index.error());
    }

    if (!(*device)->release_interface(*index)) {
        return make_error(
            errc::release_failed,
            fmt::format("Failed to release interface {}", *index)
        );
    }

    return {};
}

auto dispatcher::control_transfer(const control_request& request)
    -> result<transfer_result>
{
    const auto device = connection(request.handle);
    if (!device) {
        return make_error(device.error());
    }

    const auto dir = usb::parse_direction(request.direction);
    if (!dir) {
        return make_error(dir.error());
    }

    const auto type = usb::parse_request_type(request.request_type);
    if (!type) {
        return make_error(type.error());
    }

    auto target = usb::recipient::device;
    if (request.recipient) {
        const auto parsed = usb::parse_recipient(*request.recipient);
        if (!parsed) {
            return make_error(parsed.error());
        }
        target = *parsed;
    }

    const auto code = checked<std::uint8_t>(request.request, "request");
    if (!code) {
        return make_error(code.error());
    }

    const auto value = checked<std::uint16_t>(request.value, "value");
    if (!value) {
        return make_error(value.error());
    }

    const auto index = checked<std::uint16_t>(request.index, "index");
    if (!index) {
        return make_error(index.error());
    }

    auto buffer = make_buffer(
        *dir,
        request.length,
        request.data,
        max_control_length
    );
    if (!buffer) {
        return make_error(buffer.error());
    }

    const auto rc = (*device)->control_transfer(
        usb::make_request_type(*dir, *type, target),
        *code,
        *value,
        *index,
        *buffer
    );

    if (rc < 0) {
        return make_error(
            errc::transfer_failed,
            fmt::format("Control transfer returned {}", rc)
        );
    }

    if (*dir == usb::direction::out) {
        return transfer_result{.direction = *dir};
    }

    return transfer_result{
        .direction = *dir,
        .data = received(std::move(*buffer), rc)
    };
}

auto dispatcher::bulk_transfer(const bulk_request& request)
    -> result<transfer_result>
{
    const auto device = connection(request.handle);
    if (!device) {
        return make_error(device.error());
    }

    const auto not_found = [&request]() {
        return make_error(
            errc::out_of_range,
            fmt::format("Endpoint not found: {}", request.endpoint)
        );
    };

    if (!type::numeric::fits<usb::address_type>(request.endpoint)) {
        return not_found();
    }

    const auto [iface, endpoint] = usb::address::decode(
        static_cast<usb::address_type>(request.endpoint)
    );

    if (iface >= (*device)->interface_count() ||
        endpoint >= (*device)->endpoint_count(iface)) {
        return not_found();
    }

    const auto dir = usb::parse_direction(request.direction);
    if (!dir) {
        return make_error(dir.error());
    }

    auto buffer = make_buffer(
        *dir,
        request.length,
        request.data,
        options_.max_transfer_length
    );
    if (!buffer) {
        return make_error(buffer.error());
    }

    const auto rc = (*device)->bulk_transfer(iface, endpoint, *dir, *buffer);
    if (!rc) {
        return make_error(rc.error());
    }

    if (*rc < 0) {
        return make_error(
            errc::transfer_failed,
            fmt::format("Bulk transfer returned {}", *rc)
        );
    }

    if (*dir == usb::direction::out) {
        return transfer_result{.direction = *dir};
    }

    return transfer_result{
        .direction = *dir,
        .data = received(std::move(*buffer), *rc)
    };
}

auto dispatcher::on_get_devices(const boost::json::object& params)
    -> result<reply>
{
    const auto append = json::read_bool_or(params, "appendFakeDevice", false);
    if (!append) {
        return make_error(append.error());
    }

    const auto devices = get_devices(*append);
    if (!devices) {
        return make_error(devices.error());
    }

    auto array = boost::json::array{};
    for (const auto& device : *devices) {
        array.emplace_back(to_json(device));
    }

    return boost::json::value(std::move(array));
}

auto dispatcher::on_open_device(const boost::json::object& params)
    -> result<reply>
{
    const auto id = json::read_int(params, "device");
    if (!id) {
        return make_error(id.error());
    }

    const auto info = open_device(*id);
    if (!info) {
        return make_error(info.error());
    }

    return boost::json::value(to_json(*info));
}

auto dispatcher::on_close_device(const boost::json::object& params)
    -> result<reply>
{
    const auto value = json::read_int(params, "handle");
    if (!value) {
        return make_error(value.error());
    }

    // Nothing can be open under a handle that does not fit.
    if (!type::numeric::fits<handle_type>(*value)) {
        return reply{};
    }

    const auto res = close_device(static_cast<handle_type>(*value));
    if (!res) {
        return make_error(res.error());
    }

    return reply{};
}

auto dispatcher::on_list_interfaces(const boost::json::object& params)
    -> result<reply>
{
    const auto handle = read_handle(params);
    if (!handle) {
        return make_error(handle.error());
    }

    const auto interfaces = list_interfaces(*handle);
    if (!interfaces) {
        return make_error(interfaces.error());
    }

    auto array = boost::json::array{};
    for (const auto& iface : *interfaces) {
        array.emplace_back(to_json(iface));
    }

    return boost::json::value(std::move(array));
}

auto dispatcher::on_claim_interface(const boost::json::object& params)
    -> result<reply>
{
    const auto handle = read_handle(params);
    if (!handle) {
        return make_error(handle.error());
    }

    const auto number = json::read_int(params, "interfaceNumber");
    if (!number) {
        return make_error(number.error());
    }

    const auto res = claim_interface(*handle, *number);
    if (!res) {
        return make_error(res.error());
    }

    return reply{};
}

auto dispatcher::on_release_interface(const boost::json::object& params)
    -> result<reply>
{
    const auto handle = read_handle(params);
    if (!handle) {
        return make_error(handle.error());
    }

    const auto number = json::read_int(params, "interfaceNumber");
    if (!number) {
        return make_error(number.error());
    }

    const auto res = release_interface(*handle, *number);
    if (!res) {
        return make_error(res.error());
    }

    return reply{};
}

auto dispatcher::on_control_transfer(
    const boost::json::object& params,
    std::span<const std::uint8_t> data
) -> result<reply>
{
    auto request = control_request{};

    const auto handle = read_handle(params);
    if (!handle) {
        return make_error(handle.error());
    }
    request.handle = *handle;

    auto direction = json::read_string(params, "direction");
    if (!direction) {
        return make_error(direction.error());
    }
    request.direction = std::move(*direction);

    auto request_type = json::read_string(params, "requestType");
    if (!request_type) {
        return make_error(request_type.error());
    }
    request.request_type = std::move(*request_type);

    if (params.contains("recipient")) {
        auto recipient = json::read_string(params, "recipient");
        if (!recipient) {
            return make_error(recipient.error());
        }
        request.recipient = std::move(*recipient);
    }

    const auto fields = {
        std::pair{"request", &request.request},
        std::pair{"value", &request.value},
        std::pair{"index", &request.index}
    };

    for (const auto& [key, target] : fields) {
        const auto v = json::read_int(params, key);
        if (!v) {
            return make_error(v.error());
        }
        *target = *v;
    }

    const auto length = json::read_int_or(params, "length", 0);
    if (!length) {
        return make_error(length.error());
    }
    request.length = *length;
    request.data = to_bytes(data);

    auto transferred = control_transfer(request);
    if (!transferred) {
        return make_error(transferred.error());
    }

    return make_reply(std::move(*transferred));
}

auto dispatcher::on_bulk_transfer(
    const boost::json::object& params,
    std::span<const std::uint8_t> data
) -> result<reply>
{
    auto request = bulk_request{};

    const auto handle = read_handle(params);
    if (!handle) {
        return make_error(handle.error());
    }
    request.handle = *handle;

    const auto endpoint = json::read_int(params, "endpoint");
    if (!endpoint) {
        return make_error(endpoint.error());
    }
    request.endpoint = *endpoint;

    auto direction = json::read_string(params, "direction");
    if (!direction) {
        return make_error(direction.error());
    }
    request.direction = std::move(*direction);

    const auto length = json::read_int_or(params, "length", 0);
    if (!length) {
        return make_error(length.error());
    }
    request.length = *length;
    request.data = to_bytes(data);

    auto transferred = bulk_transfer(request);
    if (!transferred) {
        return make_error(transferred.error());
    }

    return make_reply(std::move(*transferred));
}

auto to_json(const usb::device_info& device) -> boost::json::object
{
    return boost::json::object{
        {"device", device.id},
        {"vendorId", device.vendor_id},
        {"productId", device.product_id}
    };
}

auto to_json(const usb::endpoint_descriptor& endpoint) -> boost::json::object
{
    auto jobject = boost::json::object{
        {"address", endpoint.address},
        {"direction", usb::to_string(endpoint.direction)},
        {"type", usb::to_string(endpoint.type)},
        {"maximumPacketSize", endpoint.maximum_packet_size}
    };

    if (endpoint.polling_interval) {
        jobject["pollingInterval"] = *endpoint.polling_interval;
    }

    jobject["extra_data"] = boost::json::object{};
    return jobject;
}

auto to_json(const usb::interface_descriptor& iface) -> boost::json::object
{
    auto endpoints = boost::json::array{};
    for (const auto& endpoint : iface.endpoints) {
        endpoints.emplace_back(to_json(endpoint));
    }

    return boost::json::object{
        {"interfaceNumber", iface.interface_number},
        {"alternateSetting", iface.alternate_setting},
        {"interfaceClass", iface.interface_class},
        {"interfaceSubclass", iface.interface_subclass},
        {"interfaceProtocol", iface.interface_protocol},
        {"extra_data", boost::json::object{}},
        {"endpoints", std::move(endpoints)}
    };
}

auto to_json(const connection_info& info) -> boost::json::object
{
    return boost::json::object{
        {"handle", info.handle},
        {"vendorId", info.vendor_id},
        {"productId", info.product_id}
    };
}

} // namespace usbkit::command
