#include "registry.hpp"

#include <memory>
#include <utility>

#include <fmt/format.h>

#include "errc.hpp"
#include "log.hpp"

namespace usbkit {

namespace {

// Closes the device once nothing else references it.
auto make_closing_pointer(std::unique_ptr<usb::connected_device> device)
    -> connection_registry::device_pointer
{
    return connection_registry::device_pointer{
        device.release(),
        [](usb::connected_device* d) {
            const auto owned = std::unique_ptr<usb::connected_device>{d};
            owned->close();
        }
    };
}

} // namespace

connection_registry::~connection_registry() { close_all(); }

auto connection_registry::open(std::unique_ptr<usb::connected_device> device)
    -> handle_type
{
    auto pointer = make_closing_pointer(std::move(device));

    const auto lock = std::scoped_lock{mutex_};
    const auto handle = next_handle_++;
    connections_.emplace(handle, std::move(pointer));

    USBKIT_LOG_DEBUG("Opened connection {}", handle);
    return handle;
}

auto connection_registry::get(handle_type handle) const
    -> result<device_pointer>
{
    const auto lock = std::scoped_lock{mutex_};

    if (const auto it = connections_.find(handle); it != connections_.end()) {
        return it->second;
    }

    return make_error(
        errc::not_found,
        fmt::format("Unknown connection handle: {}", handle)
    );
}

void connection_registry::close(handle_type handle)
{
    auto removed = device_pointer{};

    {
        const auto lock = std::scoped_lock{mutex_};
        if (const auto it = connections_.find(handle);
            it != connections_.end()) {
            removed = std::move(it->second);
            connections_.erase(it);
        }
    }

    if (removed) {
        USBKIT_LOG_DEBUG("Closed connection {}", handle);
    }
}

void connection_registry::close_all()
{
    auto removed = std::map<handle_type, device_pointer>{};

    {
        const auto lock = std::scoped_lock{mutex_};
        removed.swap(connections_);
    }

    if (!removed.empty()) {
        USBKIT_LOG_INFO("Closing {} open connection(s)", removed.size());
    }
}

auto connection_registry::size() const -> std::size_t
{
    const auto lock = std::scoped_lock{mutex_};
    return connections_.size();
}

} // namespace usbkit
