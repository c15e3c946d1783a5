#ifndef USBKIT_LOG_HPP
#define USBKIT_LOG_HPP

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace usbkit::log {

enum class level : std::uint8_t {
    trace,
    debug,
    info,
    warning,
    error,
    critical
};

void set_level(level threshold) noexcept;
[[nodiscard]] auto current_level() noexcept -> level;
[[nodiscard]] auto is_enabled(level lvl) noexcept -> bool;

[[nodiscard]] auto to_string(level lvl) noexcept -> std::string_view;
[[nodiscard]] auto parse_level(std::string_view name) -> std::optional<level>;

constexpr auto trim_source_path(std::string_view source) -> std::string_view
{
    const auto pos = source.find_last_of("/\\");
    return pos == std::string_view::npos ? source : source.substr(pos + 1);
}

/// Writes an already formatted line to the sink.
void write(
    level lvl,
    std::string_view file,
    std::uint32_t line,
    std::string_view function,
    std::string_view message
);

template <typename... Args>
void message(
    level lvl,
    std::string_view file,
    std::uint32_t line,
    std::string_view function,
    fmt::format_string<Args...> format,
    Args&&... args
)
{
    if (!is_enabled(lvl)) {
        return;
    }

    write(
        lvl,
        trim_source_path(file),
        line,
        function,
        fmt::format(format, std::forward<Args>(args)...)
    );
}

} // namespace usbkit::log

#define USBKIT_LOG(lvl, ...)                                                   \
    ::usbkit::log::message(lvl, __FILE__, __LINE__, __func__, __VA_ARGS__)

#define USBKIT_LOG_TRACE(...)                                                  \
    USBKIT_LOG(::usbkit::log::level::trace, __VA_ARGS__)
#define USBKIT_LOG_DEBUG(...)                                                  \
    USBKIT_LOG(::usbkit::log::level::debug, __VA_ARGS__)
#define USBKIT_LOG_INFO(...)                                                   \
    USBKIT_LOG(::usbkit::log::level::info, __VA_ARGS__)
#define USBKIT_LOG_WARNING(...)                                                \
    USBKIT_LOG(::usbkit::log::level::warning, __VA_ARGS__)
#define USBKIT_LOG_ERROR(...)                                                  \
    USBKIT_LOG(::usbkit::log::level::error, __VA_ARGS__)
#define USBKIT_LOG_CRITICAL(...)                                               \
    USBKIT_LOG(::usbkit::log::level::critical, __VA_ARGS__)

#endif // USBKIT_LOG_HPP
