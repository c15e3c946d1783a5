#ifndef USBKIT_JSON_JSON_HPP
#define USBKIT_JSON_JSON_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include <boost/json.hpp>

#include "error.hpp"

namespace usbkit::json {

// Typed accessors for command parameters. Integers may be given as JSON
// numbers or as strings in decimal or "0x" hexadecimal notation. Missing
// or mistyped values fail with errc::invalid_argument.
[[nodiscard]] auto read_int(const boost::json::value& v, std::string_view key)
    -> result<std::int64_t>;

[[nodiscard]] auto read_int(
    const boost::json::object& jobject,
    std::string_view key
) -> result<std::int64_t>;

[[nodiscard]] auto read_int_or(
    const boost::json::object& jobject,
    std::string_view key,
    std::int64_t fallback
) -> result<std::int64_t>;

[[nodiscard]] auto read_string(
    const boost::json::object& jobject,
    std::string_view key
) -> result<std::string>;

[[nodiscard]] auto read_bool_or(
    const boost::json::object& jobject,
    std::string_view key,
    bool fallback
) -> result<bool>;

} // namespace usbkit::json

#endif // USBKIT_JSON_JSON_HPP
