#ifndef USBKIT_TYPES_HPP
#define USBKIT_TYPES_HPP

#include <concepts>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace usbkit::type {

template <typename T>
struct unique_pointer {
    using deleter_type = std::function<void(T*)>;
    using type = std::unique_ptr<T, deleter_type>;
};

template <typename T>
using unique_pointer_t = typename unique_pointer<T>::type;

using bytes_type = std::vector<std::uint8_t>;

namespace numeric {

template <typename T>
requires std::is_arithmetic_v<T>
constexpr auto max = std::numeric_limits<T>::max();

template <typename T>
requires std::is_arithmetic_v<T>
constexpr auto min = std::numeric_limits<T>::min();

// True when `value` is representable as T without narrowing.
template <std::integral T>
constexpr auto fits(std::int64_t value) noexcept -> bool
{
    return std::cmp_greater_equal(value, min<T>) &&
           std::cmp_less_equal(value, max<T>);
}

} // namespace numeric

} // namespace usbkit::type

#endif // USBKIT_TYPES_HPP
