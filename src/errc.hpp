#ifndef USBKIT_ERRC_HPP
#define USBKIT_ERRC_HPP

#include <cstdint>
#include <string_view>

#include "error.hpp"

namespace usbkit {

// Every failure a command can report. None of them is retried.
enum class errc : std::uint8_t {
    not_found = 1,
    permission_denied,
    open_failed,
    out_of_range,
    direction_mismatch,
    unknown_vocabulary,
    transfer_failed,
    claim_failed,
    release_failed,
    invalid_argument,
    unknown_command,
    enumeration_failed
};

constexpr auto error_category_of(errc e) noexcept
{
    switch (e) {
        case errc::not_found:
            return error_category::registry;
        case errc::invalid_argument:
        case errc::unknown_command:
        case errc::unknown_vocabulary:
            return error_category::command;
        default:
            return error_category::usb;
    }
}

constexpr auto to_string(errc e) noexcept -> std::string_view
{
    switch (e) {
        case errc::not_found:
            return "not_found";
        case errc::permission_denied:
            return "permission_denied";
        case errc::open_failed:
            return "open_failed";
        case errc::out_of_range:
            return "out_of_range";
        case errc::direction_mismatch:
            return "direction_mismatch";
        case errc::unknown_vocabulary:
            return "unknown_vocabulary";
        case errc::transfer_failed:
            return "transfer_failed";
        case errc::claim_failed:
            return "claim_failed";
        case errc::release_failed:
            return "release_failed";
        case errc::invalid_argument:
            return "invalid_argument";
        case errc::unknown_command:
            return "unknown_command";
        case errc::enumeration_failed:
            return "enumeration_failed";
    }

    return "unknown";
}

} // namespace usbkit

#endif // USBKIT_ERRC_HPP
