#ifndef USBKIT_FORMAT_HPP
#define USBKIT_FORMAT_HPP

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/algorithm/hex.hpp>

namespace usbkit::format {

template <typename T>
auto to_string(T&& arg) -> std::string
{
    if constexpr (std::is_arithmetic_v<std::decay_t<T>>) {
        return std::to_string(std::forward<T>(arg));
    } else {
        return std::string{std::forward<T>(arg)};
    }
}

template <typename... T>
auto make_string(T&&... args)
{
    const auto trim_right = [](std::string& s,
                               const char* t = " \t\n\r\f\v") -> auto {
        if (auto pos = s.find_last_not_of(t); pos != std::string::npos) {
            s.erase(pos + 1);
        }

        return s;
    };

    std::string text{};
    text += ((to_string(std::forward<T>(args)) + " ") + ...);
    return trim_right(text);
};

// Accepts decimal, "0x" hexadecimal and leading-zero octal notation.
inline auto parse_integer(const std::string& s) -> std::optional<std::int64_t>
{
    try {
        auto consumed = std::size_t{0};
        const auto value = std::stoll(s, &consumed, 0);
        if (consumed == s.size()) {
            return value;
        }
    } catch ([[maybe_unused]] const std::invalid_argument& _) {
    } catch ([[maybe_unused]] const std::out_of_range& _) {
    }

    return std::nullopt;
}

inline auto to_hex(std::span<const std::uint8_t> bytes) -> std::string
{
    auto text = std::string{};
    text.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(
        std::begin(bytes),
        std::end(bytes),
        std::back_inserter(text)
    );
    return text;
}

inline auto from_hex(std::string_view text)
    -> std::optional<std::vector<std::uint8_t>>
{
    auto bytes = std::vector<std::uint8_t>{};
    bytes.reserve(text.size() / 2);

    try {
        boost::algorithm::unhex(
            std::begin(text),
            std::end(text),
            std::back_inserter(bytes)
        );
    } catch ([[maybe_unused]] const boost::algorithm::hex_decode_error& _) {
        return std::nullopt;
    }

    return bytes;
}

namespace unsafe {

template <typename T>
auto vectorize(const T* const begin, const std::size_t count)
{
    if (begin == nullptr || count == 0) {
        return std::vector<T>{};
    }

    return std::vector<T>{begin, begin + count};
}

} // namespace unsafe

} // namespace usbkit::format

#endif // USBKIT_FORMAT_HPP
