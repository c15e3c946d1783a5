#include "json/json.hpp"

#include <utility>

#include <fmt/format.h>

#include "errc.hpp"
#include "format.hpp"
#include "types.hpp"

namespace usbkit::json {

namespace {

auto missing(std::string_view key)
{
    return make_error(
        errc::invalid_argument,
        fmt::format("Missing parameter: {}", key)
    );
}

auto mistyped(std::string_view key, std::string_view expected)
{
    return make_error(
        errc::invalid_argument,
        fmt::format("Parameter {} is not {}", key, expected)
    );
}

} // namespace

auto read_int(const boost::json::value& v, std::string_view key)
    -> result<std::int64_t>
{
    if (v.is_int64()) {
        return v.as_int64();
    }

    if (v.is_uint64() &&
        std::cmp_less_equal(v.as_uint64(), type::numeric::max<std::int64_t>)) {
        return static_cast<std::int64_t>(v.as_uint64());
    }

    if (v.is_string()) {
        if (auto parsed = format::parse_integer(std::string(v.as_string()))) {
            return *parsed;
        }
    }

    return mistyped(key, "an integer");
}

auto read_int(const boost::json::object& jobject, std::string_view key)
    -> result<std::int64_t>
{
    if (const auto* v = jobject.if_contains(key)) {
        return read_int(*v, key);
    }

    return missing(key);
}

auto read_int_or(
    const boost::json::object& jobject,
    std::string_view key,
    std::int64_t fallback
) -> result<std::int64_t>
{
    const auto* v = jobject.if_contains(key);
    if (v != nullptr && !v->is_null()) {
        return read_int(*v, key);
    }

    return fallback;
}

auto read_string(const boost::json::object& jobject, std::string_view key)
    -> result<std::string>
{
    const auto* v = jobject.if_contains(key);
    if (v == nullptr) {
        return missing(key);
    }

    if (!v->is_string()) {
        return mistyped(key, "a string");
    }

    return std::string(v->as_string());
}

auto read_bool_or(
    const boost::json::object& jobject,
    std::string_view key,
    bool fallback
) -> result<bool>
{
    const auto* v = jobject.if_contains(key);
    if (v == nullptr || v->is_null()) {
        return fallback;
    }

    if (!v->is_bool()) {
        return mistyped(key, "a boolean");
    }

    return v->as_bool();
}

} // namespace usbkit::json
