#ifndef USBKIT_DAEMON_DAEMON_HPP
#define USBKIT_DAEMON_DAEMON_HPP

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <span>
#include <string>
#include <string_view>

#include <boost/asio.hpp>
#include <boost/program_options.hpp>

#include "command/dispatcher.hpp"
#include "error.hpp"
#include "log.hpp"
#include "registry.hpp"
#include "usb/host.hpp"

namespace usbkit::daemon {

enum class errc : std::uint8_t { invalid_option = 1, startup_failed };

constexpr auto error_category_of(errc /*unused*/) noexcept
{
    return error_category::config;
}

[[nodiscard]] auto default_socket_path() -> std::filesystem::path;

struct config {
    std::filesystem::path socket{default_socket_path()};
    std::size_t workers{4};
    log::level log_level{log::level::info};
    std::size_t max_transfer_length{std::size_t{1} << 20};
    bool help{false};
};

[[nodiscard]] auto options_description()
    -> boost::program_options::options_description;

[[nodiscard]] auto usage() -> std::string;

/// Reads daemon options from `args` (the first element names the program)
/// and, when --config is given, from an INI-style file. Command-line
/// values take precedence over the file.
[[nodiscard]] auto parse_config(std::span<const char* const> args)
    -> result<config>;

class service final {
public:
    service(usb::host& host, config cfg);

    service(const service&) = delete;
    service(service&&) = delete;
    auto operator=(const service&) -> service& = delete;
    auto operator=(service&&) -> service& = delete;
    ~service() = default;

    /// Runs one framed request document and returns the response document.
    [[nodiscard]] auto handle_request(std::string_view text) -> std::string;

    /// Serves clients until SIGINT or SIGTERM, then closes every open
    /// connection. Returns the process exit code.
    [[nodiscard]] auto run() -> int;

    /// Disconnects every client and closes every open connection. A
    /// command still running keeps its device until it returns.
    void stop();

    [[nodiscard]] auto registry() noexcept -> connection_registry&
    {
        return registry_;
    }

private:
    using socket_type = boost::asio::local::stream_protocol::socket;
    using socket_pointer = std::shared_ptr<socket_type>;

    [[nodiscard]] auto is_already_running() const -> bool;
    [[nodiscard]] auto prepare_socket_path() -> result<void>;

    void serve_session(const socket_pointer& socket);
    void shutdown_sessions();

    config config_;
    connection_registry registry_{};
    command::dispatcher dispatcher_;

    std::mutex sessions_mutex_{};
    std::set<socket_pointer> sessions_{};
};

static_assert(!std::copyable<service>);

} // namespace usbkit::daemon

#endif // USBKIT_DAEMON_DAEMON_HPP
