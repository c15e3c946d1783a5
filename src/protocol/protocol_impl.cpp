#include "protocol/protocol.hpp"

#include <type_traits>
#include <utility>
#include <variant>

#include "errc.hpp"
#include "format.hpp"

namespace usbkit::protocol {

namespace {

auto malformed(std::string message)
{
    return make_error(errc::malformed_request, std::move(message));
}

} // namespace

auto to_string(errc e) noexcept -> std::string_view
{
    switch (e) {
        case errc::malformed_request:
            return "malformed_request";
        case errc::frame_too_large:
            return "frame_too_large";
        case errc::connection_closed:
            return "connection_closed";
        case errc::io_failed:
            return "io_failed";
    }

    return "unknown";
}

auto parse_request(std::string_view text) -> result<request>
{
    auto ec = boost::system::error_code{};
    auto document = boost::json::parse(text, ec);
    if (ec) {
        return malformed("Request is not valid JSON: " + ec.message());
    }

    const auto* jobject = document.if_object();
    if (jobject == nullptr) {
        return malformed("Request is not a JSON object");
    }

    auto req = request{};

    if (const auto* id = jobject->if_contains("id")) {
        req.id = *id;
    }

    const auto* command = jobject->if_contains("command");
    if (command == nullptr || !command->is_string()) {
        return malformed("Request has no command");
    }
    req.command = std::string(command->as_string());

    if (const auto* params = jobject->if_contains("params");
        params != nullptr && !params->is_null()) {
        if (!params->is_object()) {
            return malformed("Request params is not an object");
        }
        req.params = params->as_object();
    }

    if (const auto* data = jobject->if_contains("data");
        data != nullptr && !data->is_null()) {
        if (!data->is_string()) {
            return malformed("Request data is not a hex string");
        }

        const auto& hex = data->as_string();
        auto bytes = format::from_hex(std::string_view{hex.data(), hex.size()});
        if (!bytes) {
            return malformed("Request data is not a hex string");
        }
        req.data = std::move(*bytes);
    }

    return req;
}

auto to_json(const request& req) -> boost::json::object
{
    auto jobject = boost::json::object{
        {"id", req.id},
        {"command", req.command},
        {"params", req.params}
    };

    if (!req.data.empty()) {
        jobject["data"] = format::to_hex(req.data);
    }

    return jobject;
}

auto make_success(const boost::json::value& id, const command::reply& payload)
    -> boost::json::object
{
    auto response = boost::json::object{{"id", id}, {"ok", true}};

    std::visit(
        [&response](const auto& p) {
            using payload_type = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<payload_type, boost::json::value>) {
                response["result"] = p;
            } else if constexpr (std::is_same_v<payload_type, type::bytes_type>) {
                response["data"] = format::to_hex(p);
            }
        },
        payload
    );

    return response;
}

auto make_failure(const boost::json::value& id, const error& err)
    -> boost::json::object
{
    return boost::json::object{
        {"id", id},
        {"ok", false},
        {"error",
         {{"code", code_name(err)}, {"message", err.message()}}}
    };
}

auto code_name(const error& err) -> std::string_view
{
    switch (err.category()) {
        case error_category::usb:
        case error_category::registry:
        case error_category::command:
            return usbkit::to_string(static_cast<usbkit::errc>(err.code()));
        case error_category::protocol:
            return to_string(static_cast<errc>(err.code()));
        case error_category::config:
            return "invalid_config";
        case error_category::none:
            break;
    }

    return "unknown";
}

} // namespace usbkit::protocol
