#include "client/client.hpp"

#include <cstdio>
#include <sstream>
#include <utility>

#include <boost/asio.hpp>
#include <boost/program_options.hpp>

#include <fmt/format.h>

#include "command/dispatcher.hpp"
#include "daemon/daemon.hpp"
#include "format.hpp"
#include "log.hpp"

namespace usbkit::client {

using boost::asio::local::stream_protocol;

namespace {

auto options_description() -> boost::program_options::options_description
{
    namespace po = boost::program_options;
    auto desc = po::options_description{"usbkit <command>"};
    // clang-format off
    desc.add_options()
    ("help,h", "Show this message")
    ("command", po::value<std::string>(), "Command name")
    (
        "params,p",
        po::value<std::string>()->default_value("{}"),
        "Command parameters as a JSON object"
    )
    ("data,d", po::value<std::string>(), "Payload of an out transfer as hex")
    (
        "socket,s",
        po::value<std::filesystem::path>()->default_value(
            daemon::default_socket_path(),
            daemon::default_socket_path().string()
        ),
        "Path of the daemon socket"
    )
    ("id", po::value<std::int64_t>()->default_value(1), "Request id");
    // clang-format on
    return desc;
}

auto invalid_option(const std::string& what)
{
    return make_error(
        errc::invalid_option,
        fmt::format("{}\nUsage:\n{}", what, usage())
    );
}

} // namespace

auto usage() -> std::string
{
    auto ss = std::stringstream{};
    options_description().print(ss);
    ss << "Commands:\n";
    for (const auto name : command::command_names) {
        ss << "  " << name << '\n';
    }
    ss << "  serve (run the daemon, see usbkit serve --help)\n";
    return ss.str();
}

auto parse_arguments(std::span<const char* const> args) -> result<invocation>
{
    namespace po = boost::program_options;
    const auto desc = options_description();
    auto positional = po::positional_options_description{};
    positional.add("command", 1);

    auto vm = po::variables_map{};
    try {
        po::store(
            po::command_line_parser(
                static_cast<int>(std::size(args)),
                args.data()
            )
                .options(desc)
                .positional(positional)
                .run(),
            vm
        );
        po::notify(vm);
    } catch (const po::error& e) {
        return invalid_option(e.what());
    }

    auto result = invocation{};
    result.help = vm.count("help") != 0;
    result.socket = vm["socket"].as<std::filesystem::path>();

    if (result.help) {
        return result;
    }

    if (vm.count("command") == 0) {
        return invalid_option("No command given");
    }

    auto& request = result.request;
    request.id = vm["id"].as<std::int64_t>();
    request.command = vm["command"].as<std::string>();

    auto ec = boost::system::error_code{};
    const auto params = boost::json::parse(vm["params"].as<std::string>(), ec);
    if (ec || !params.is_object()) {
        return invalid_option("--params must be a JSON object");
    }
    request.params = params.as_object();

    if (vm.count("data")) {
        auto bytes = format::from_hex(vm["data"].as<std::string>());
        if (!bytes) {
            return invalid_option("--data must be a hex string");
        }
        request.data = std::move(*bytes);
    }

    return result;
}

auto send(const std::filesystem::path& socket, const protocol::request& request)
    -> result<boost::json::object>
{
    auto io = boost::asio::io_context{};
    auto stream = stream_protocol::socket{io};

    auto ec = boost::system::error_code{};
    stream.connect(stream_protocol::endpoint{socket.string()}, ec);
    if (ec) {
        return make_error(
            protocol::errc::io_failed,
            fmt::format(
                "Cannot connect to {}: {}. Is the daemon running?",
                socket.string(),
                ec.message()
            )
        );
    }

    const auto text = boost::json::serialize(protocol::to_json(request));
    if (auto res = protocol::write_frame(stream, text); !res) {
        return make_error(res.error());
    }

    const auto frame = protocol::read_frame(stream);
    if (!frame) {
        return make_error(frame.error());
    }

    auto response = boost::json::parse(*frame, ec);
    if (ec || !response.is_object()) {
        return make_error(
            protocol::errc::malformed_request,
            "Daemon sent an invalid response"
        );
    }

    return response.as_object();
}

auto run(std::span<const char* const> args) -> int
{
    const auto invocation = parse_arguments(args);
    if (!invocation) {
        fmt::print(stderr, "{}\n", invocation.error().message());
        return 1;
    }

    if (invocation->help) {
        fmt::print("{}", usage());
        return 0;
    }

    const auto response = send(invocation->socket, invocation->request);
    if (!response) {
        USBKIT_LOG_DEBUG("{}", response.error().describe());
        fmt::print(stderr, "{}\n", response.error().message());
        return 1;
    }

    fmt::print("{}\n", boost::json::serialize(*response));

    const auto* ok = response->if_contains("ok");
    return ok != nullptr && ok->is_bool() && ok->as_bool() ? 0 : 1;
}

} // namespace usbkit::client
