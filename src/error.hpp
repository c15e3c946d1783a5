#ifndef USBKIT_ERROR_HPP
#define USBKIT_ERROR_HPP

#include <cstdint>
#include <expected>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <boost/stacktrace.hpp>

#include <fmt/format.h>

namespace usbkit {

enum class error_category : std::uint8_t {
    none,
    usb,
    registry,
    command,
    protocol,
    config
};

template <typename T>
concept enum_type = std::is_enum_v<T>;

struct error final {
    error() = default;

    error(
        error_category category,
        enum_type auto code,
        std::string message = {},
        std::source_location where = std::source_location::current()
    )
        : category_(category), code_(static_cast<int>(code)),
          message_(std::move(message)), file_(where.file_name()),
          line_(where.line()), function_(where.function_name()),
          stacktrace_(
              boost::stacktrace::to_string(boost::stacktrace::stacktrace())
          )
    {
    }

    [[nodiscard]] auto category() const noexcept { return category_; }
    [[nodiscard]] auto code() const noexcept { return code_; }

    [[nodiscard]] auto message() const noexcept -> std::string_view
    {
        return message_;
    }

    [[nodiscard]] auto file() const noexcept -> std::string_view
    {
        return file_;
    }

    [[nodiscard]] auto line() const noexcept { return line_; }

    [[nodiscard]] auto function() const noexcept -> std::string_view
    {
        return function_;
    }

    [[nodiscard]] auto stacktrace() const noexcept -> std::string_view
    {
        return stacktrace_;
    }

    template <enum_type E>
    [[nodiscard]] auto is(E e) const noexcept -> bool
    {
        return code_ == static_cast<int>(e);
    }

    [[nodiscard]] auto describe() const -> std::string
    {
        return fmt::format(
            "Error (category = {}, code = {}): {}\n  at {}:{} in "
            "{}\nStacktrace:\n{}",
            static_cast<std::uint32_t>(category_),
            code_,
            message_,
            file_,
            line_,
            function_,
            stacktrace_
        );
    }

private:
    error_category category_{error_category::none};
    int code_{0};
    std::string message_;
    std::string file_;
    std::uint32_t line_{0};
    std::string function_;
    std::string stacktrace_;
};

constexpr auto make_error(
    enum_type auto e,
    std::string message = {},
    const std::source_location where = std::source_location::current()
) -> std::unexpected<error>
{
    const auto category = [&]() -> auto {
        if constexpr (requires { error_category_of(e); }) {
            return error_category_of(e);
        } else {
            return error_category::none;
        }
    };

    return std::unexpected{error{category(), e, std::move(message), where}};
}

constexpr auto make_error(const error& err) -> std::unexpected<error>
{
    return std::unexpected{err};
}

template <typename T>
using result = std::expected<T, error>;

} // namespace usbkit

#endif // USBKIT_ERROR_HPP
