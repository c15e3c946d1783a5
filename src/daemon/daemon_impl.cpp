#include "daemon/daemon.hpp"

#include <csignal>
#include <fstream>
#include <functional>
#include <sstream>
#include <system_error>
#include <utility>

#include <boost/json.hpp>

#include <fmt/format.h>

#include <sys/socket.h>
#include <sys/stat.h>

#include "protocol/protocol.hpp"

namespace usbkit::daemon {

using boost::asio::local::stream_protocol;

namespace {

constexpr auto default_workers = std::size_t{4};
constexpr auto default_max_transfer_length = std::size_t{1} << 20;

auto invalid_option(const std::string& what)
{
    return make_error(
        errc::invalid_option,
        fmt::format("{}\nUsage:\n{}", what, usage())
    );
}

} // namespace

auto default_socket_path() -> std::filesystem::path
{
    return std::filesystem::path{"/tmp/usbkitd"} / "usbkitd.sock";
}

auto options_description() -> boost::program_options::options_description
{
    namespace po = boost::program_options;
    auto desc = po::options_description{"usbkit serve"};
    // clang-format off
    desc.add_options()
    ("help,h", "Show this message")
    (
        "config,c",
        po::value<std::filesystem::path>(),
        "INI-style file with the options below"
    )
    (
        "socket,s",
        po::value<std::filesystem::path>()->default_value(
            default_socket_path(),
            default_socket_path().string()
        ),
        "Path of the listening unix socket"
    )
    (
        "workers,w",
        po::value<std::size_t>()->default_value(default_workers),
        "Number of threads serving client sessions"
    )
    (
        "log-level,l",
        po::value<std::string>()->default_value("info"),
        "trace, debug, info, warning, error or critical"
    )
    (
        "max-transfer-length",
        po::value<std::size_t>()->default_value(default_max_transfer_length),
        "Largest bulk transfer accepted, in bytes"
    );
    // clang-format on
    return desc;
}

auto usage() -> std::string
{
    auto ss = std::stringstream{};
    options_description().print(ss);
    return ss.str();
}

auto parse_config(std::span<const char* const> args) -> result<config>
{
    namespace po = boost::program_options;
    const auto desc = options_description();
    auto vm = po::variables_map{};

    try {
        po::store(
            po::parse_command_line(
                static_cast<int>(std::size(args)),
                args.data(),
                desc
            ),
            vm
        );

        if (vm.count("config")) {
            const auto path = vm["config"].as<std::filesystem::path>();
            auto file = std::ifstream{path};
            if (!file) {
                return invalid_option(
                    fmt::format("Cannot read config file {}", path.string())
                );
            }
            po::store(po::parse_config_file(file, desc), vm);
        }

        po::notify(vm);
    } catch (const po::error& e) {
        return invalid_option(e.what());
    }

    auto cfg = config{};
    cfg.help = vm.count("help") != 0;
    cfg.socket = vm["socket"].as<std::filesystem::path>();
    cfg.workers = vm["workers"].as<std::size_t>();
    cfg.max_transfer_length = vm["max-transfer-length"].as<std::size_t>();

    const auto level_name = vm["log-level"].as<std::string>();
    const auto level = log::parse_level(level_name);
    if (!level) {
        return invalid_option(fmt::format("Unknown log level: {}", level_name));
    }
    cfg.log_level = *level;

    if (cfg.workers == 0) {
        return invalid_option("--workers must be at least 1");
    }

    if (cfg.max_transfer_length == 0) {
        return invalid_option("--max-transfer-length must be at least 1");
    }

    if (cfg.socket.empty()) {
        return invalid_option("--socket must not be empty");
    }

    return cfg;
}

service::service(usb::host& host, config cfg)
    : config_(std::move(cfg)),
      dispatcher_(
          host,
          registry_,
          command::dispatcher::options{
              .max_transfer_length = config_.max_transfer_length
          }
      )
{
}

auto service::handle_request(std::string_view text) -> std::string
{
    auto request = protocol::parse_request(text);
    if (!request) {
        USBKIT_LOG_WARNING("Rejected request: {}", request.error().message());
        return boost::json::serialize(
            protocol::make_failure(nullptr, request.error())
        );
    }

    const auto reply = dispatcher_.execute(
        request->command,
        request->params,
        request->data
    );

    if (!reply) {
        return boost::json::serialize(
            protocol::make_failure(request->id, reply.error())
        );
    }

    return boost::json::serialize(protocol::make_success(request->id, *reply));
}

auto service::is_already_running() const -> bool
{
    auto io = boost::asio::io_context{};
    auto probe = socket_type{io};
    auto ec = boost::system::error_code{};
    probe.connect(stream_protocol::endpoint{config_.socket.string()}, ec);
    return !ec;
}

auto service::prepare_socket_path() -> result<void>
{
    auto ec = std::error_code{};
    std::filesystem::create_directories(config_.socket.parent_path(), ec);
    if (ec) {
        return make_error(
            errc::startup_failed,
            fmt::format(
                "Cannot create {}: {}",
                config_.socket.parent_path().string(),
                ec.message()
            )
        );
    }

    if (!std::filesystem::exists(config_.socket, ec)) {
        return {};
    }

    if (is_already_running()) {
        return make_error(
            errc::startup_failed,
            fmt::format(
                "Another daemon is listening on {}",
                config_.socket.string()
            )
        );
    }

    USBKIT_LOG_WARNING("Removing stale socket {}", config_.socket.string());
    std::filesystem::remove(config_.socket, ec);
    if (ec) {
        return make_error(
            errc::startup_failed,
            fmt::format(
                "Cannot remove {}: {}",
                config_.socket.string(),
                ec.message()
            )
        );
    }

    return {};
}

void service::serve_session(const socket_pointer& socket)
{
    USBKIT_LOG_DEBUG("Session started");

    for (;;) {
        const auto frame = protocol::read_frame(*socket);
        if (!frame) {
            if (!frame.error().is(protocol::errc::connection_closed)) {
                USBKIT_LOG_WARNING(
                    "Session read failed: {}",
                    frame.error().message()
                );
            }
            break;
        }

        const auto response = handle_request(*frame);
        if (auto res = protocol::write_frame(*socket, response); !res) {
            USBKIT_LOG_WARNING(
                "Session write failed: {}",
                res.error().message()
            );
            break;
        }
    }

    const auto lock = std::scoped_lock{sessions_mutex_};
    sessions_.erase(socket);
    USBKIT_LOG_DEBUG("Session ended");
}

void service::shutdown_sessions()
{
    const auto lock = std::scoped_lock{sessions_mutex_};
    for (const auto& socket : sessions_) {
        // Wakes the worker blocked in read_frame.
        if (::shutdown(socket->native_handle(), SHUT_RDWR) != 0) {
            USBKIT_LOG_DEBUG("Session socket already disconnected");
        }
    }
}

void service::stop()
{
    shutdown_sessions();
    registry_.close_all();
}

auto service::run() -> int
{
    if (auto res = prepare_socket_path(); !res) {
        USBKIT_LOG_ERROR("{}", res.error().message());
        return 1;
    }

    const auto path = config_.socket.string();
    auto io = boost::asio::io_context{};
    auto acceptor = stream_protocol::acceptor{io};
    auto ec = boost::system::error_code{};

    acceptor.open(stream_protocol{}, ec);
    if (!ec) {
        acceptor.bind(stream_protocol::endpoint{path}, ec);
    }
    if (!ec) {
        acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        USBKIT_LOG_ERROR("Cannot listen on {}: {}", path, ec.message());
        return 1;
    }

    if (::chmod(path.c_str(), 0777) != 0) {
        USBKIT_LOG_WARNING("Cannot change permissions of {}", path);
    }

    auto pool = boost::asio::thread_pool{config_.workers};

    auto signals = boost::asio::signal_set{io, SIGINT, SIGTERM};
    signals.async_wait([&](const boost::system::error_code& error, int sig) {
        if (error) {
            return;
        }

        USBKIT_LOG_INFO("Received signal {}. Shutting down", sig);
        auto ignored = boost::system::error_code{};
        acceptor.close(ignored);
        stop();
    });

    std::function<void()> do_accept;
    do_accept = [this, &io, &acceptor, &pool, &do_accept]() {
        auto socket = std::make_shared<socket_type>(io);
        acceptor.async_accept(
            *socket,
            [this, socket, &acceptor, &pool, &do_accept](
                const boost::system::error_code& error
            ) {
                if (error) {
                    if (error != boost::asio::error::operation_aborted) {
                        USBKIT_LOG_WARNING("Accept failed: {}", error.message());
                    }
                } else {
                    {
                        const auto lock = std::scoped_lock{sessions_mutex_};
                        sessions_.insert(socket);
                    }
                    boost::asio::post(pool, [this, socket]() {
                        serve_session(socket);
                    });
                }

                if (acceptor.is_open()) {
                    do_accept();
                }
            }
        );
    };

    USBKIT_LOG_INFO(
        "Listening on {} with {} worker(s)",
        path,
        config_.workers
    );

    do_accept();
    io.run();

    pool.join();

    auto remove_ec = std::error_code{};
    std::filesystem::remove(config_.socket, remove_ec);

    // Connections opened by commands that finished after stop().
    registry_.close_all();
    USBKIT_LOG_INFO("Stopped");
    return 0;
}

} // namespace usbkit::daemon
