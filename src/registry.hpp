#ifndef USBKIT_REGISTRY_HPP
#define USBKIT_REGISTRY_HPP

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

#include "error.hpp"
#include "usb/device.hpp"

namespace usbkit {

using handle_type = std::uint64_t;

// Owns every open connection, keyed by a process-unique handle. Handles
// start at 1 and are never handed out twice. A connection is closed when
// its entry is removed and the last in-flight command using it returns.
class connection_registry final {
public:
    using device_pointer = std::shared_ptr<usb::connected_device>;

    connection_registry() = default;
    ~connection_registry();

    connection_registry(const connection_registry&) = delete;
    connection_registry(connection_registry&&) = delete;
    auto operator=(const connection_registry&) -> connection_registry& = delete;
    auto operator=(connection_registry&&) -> connection_registry& = delete;

    [[nodiscard]] auto open(std::unique_ptr<usb::connected_device> device)
        -> handle_type;

    [[nodiscard]] auto get(handle_type handle) const -> result<device_pointer>;

    /// Removes `handle`. Unknown handles are ignored.
    void close(handle_type handle);

    void close_all();

    [[nodiscard]] auto size() const -> std::size_t;

private:
    mutable std::mutex mutex_{};
    handle_type next_handle_{1};
    std::map<handle_type, device_pointer> connections_{};
};

static_assert(!std::copyable<connection_registry>);

} // namespace usbkit

#endif // USBKIT_REGISTRY_HPP
