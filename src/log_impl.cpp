#include "log.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <iterator>
#include <mutex>
#include <string>

namespace usbkit::log {

namespace {

constexpr auto level_names = std::array<std::string_view, 6>{
    "trace",
    "debug",
    "info",
    "warning",
    "error",
    "critical"
};

auto threshold_ = std::atomic<level>{level::info};
auto sink_mutex_ = std::mutex{};
const auto start_time_ = std::chrono::steady_clock::now();

} // namespace

void set_level(level threshold) noexcept { threshold_.store(threshold); }

auto current_level() noexcept -> level { return threshold_.load(); }

auto is_enabled(level lvl) noexcept -> bool
{
    return static_cast<std::uint8_t>(lvl) >=
           static_cast<std::uint8_t>(current_level());
}

auto to_string(level lvl) noexcept -> std::string_view
{
    return level_names[static_cast<std::size_t>(lvl)];
}

auto parse_level(std::string_view name) -> std::optional<level>
{
    auto lowered = std::string{name};
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    const auto it = std::ranges::find(level_names, lowered);
    if (it == std::end(level_names)) {
        return std::nullopt;
    }

    return static_cast<level>(std::distance(std::begin(level_names), it));
}

void write(
    level lvl,
    std::string_view file,
    std::uint32_t line,
    std::string_view function,
    std::string_view message
)
{
    const auto elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_time_
    );

    const auto text = fmt::format(
        "[{:>12.6f}] <{}> {}:{} {}: {}\n",
        elapsed.count(),
        to_string(lvl),
        file,
        line,
        function,
        message
    );

    const auto lock = std::scoped_lock{sink_mutex_};
    std::fputs(text.c_str(), stderr);
}

} // namespace usbkit::log
