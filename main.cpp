#include <cstddef>
#include <cstdio>
#include <exception>
#include <span>
#include <string_view>

#include <fmt/format.h>

#include "client/client.hpp"
#include "daemon/daemon.hpp"
#include "log.hpp"
#include "usb/libusb_host.hpp"

namespace {

auto serve(std::span<const char* const> args) -> int
{
    const auto cfg = usbkit::daemon::parse_config(args);
    if (!cfg) {
        fmt::print(stderr, "{}\n", cfg.error().message());
        return 1;
    }

    if (cfg->help) {
        fmt::print("{}", usbkit::daemon::usage());
        return 0;
    }

    usbkit::log::set_level(cfg->log_level);

    try {
        auto host = usbkit::usb::libusb_host{};
        auto service = usbkit::daemon::service{host, *cfg};
        return service.run();
    } catch (const std::exception& e) {
        USBKIT_LOG_CRITICAL("Daemon failed: {}", e.what());
        return 1;
    }
}

} // namespace

int main(int argc, const char* argv[])
{
    const auto args = std::span<const char* const>{
        argv,
        static_cast<std::size_t>(argc)
    };

    if (args.size() > 1 && std::string_view{args[1]} == "serve") {
        return serve(args.subspan(1));
    }

    return usbkit::client::run(args);
}
