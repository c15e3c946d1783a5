#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <utility>

#include "errc.hpp"
#include "usb/descriptor.hpp"

namespace usbkit::test {

class descriptor_test : public testing::Test {};

TEST_F(descriptor_test, address_encode)
{
    EXPECT_EQ(usb::address::encode(0, 0), 0U);
    EXPECT_EQ(usb::address::encode(0, 1), 1U);
    EXPECT_EQ(usb::address::encode(1, 0), 0x10000U);
    EXPECT_EQ(usb::address::encode(2, 3), 0x20003U);
    EXPECT_EQ(usb::address::encode(0xffff, 0xffff), 0xffffffffU);
}

TEST_F(descriptor_test, address_decode_inverts_encode)
{
    constexpr auto numbers = std::array<usb::index_type, 6>{
        0,
        1,
        2,
        0xff,
        0x100,
        0xffff
    };

    for (const auto i : numbers) {
        for (const auto e : numbers) {
            const auto decoded = usb::address::decode(
                usb::address::encode(i, e)
            );
            EXPECT_EQ(decoded.interface_number, i);
            EXPECT_EQ(decoded.endpoint_number, e);
        }
    }

    static_assert(
        usb::address::decode(0x00030002) ==
        usb::address::decoded{.interface_number = 3, .endpoint_number = 2}
    );
}

TEST_F(descriptor_test, parse_direction)
{
    EXPECT_EQ(usb::parse_direction("in"), usb::direction::in);
    EXPECT_EQ(usb::parse_direction("IN"), usb::direction::in);
    EXPECT_EQ(usb::parse_direction("Out"), usb::direction::out);

    const auto unknown = usb::parse_direction("sideways");
    ASSERT_FALSE(unknown);
    EXPECT_TRUE(unknown.error().is(errc::unknown_vocabulary));
    EXPECT_EQ(unknown.error().category(), error_category::command);
    EXPECT_EQ(
        unknown.error().message(),
        "Unknown transfer direction: sideways"
    );
}

TEST_F(descriptor_test, parse_request_type)
{
    EXPECT_EQ(usb::parse_request_type("standard"), usb::request_type::standard);
    EXPECT_EQ(usb::parse_request_type("CLASS"), usb::request_type::class_);
    EXPECT_EQ(usb::parse_request_type("Vendor"), usb::request_type::vendor);
    EXPECT_EQ(usb::parse_request_type("reserved"), usb::request_type::reserved);

    const auto unknown = usb::parse_request_type("custom");
    ASSERT_FALSE(unknown);
    EXPECT_TRUE(unknown.error().is(errc::unknown_vocabulary));
}

TEST_F(descriptor_test, parse_recipient)
{
    EXPECT_EQ(usb::parse_recipient("device"), usb::recipient::device);
    EXPECT_EQ(usb::parse_recipient("Interface"), usb::recipient::interface);
    EXPECT_EQ(usb::parse_recipient("ENDPOINT"), usb::recipient::endpoint);
    EXPECT_EQ(usb::parse_recipient("other"), usb::recipient::other);
    EXPECT_FALSE(usb::parse_recipient("host"));
}

TEST_F(descriptor_test, to_string)
{
    EXPECT_EQ(usb::to_string(usb::direction::in), "in");
    EXPECT_EQ(usb::to_string(usb::direction::out), "out");
    EXPECT_EQ(usb::to_string(usb::endpoint_type::control), "control");
    EXPECT_EQ(usb::to_string(usb::endpoint_type::isochronous), "isochronous");
    EXPECT_EQ(usb::to_string(usb::endpoint_type::bulk), "bulk");
    EXPECT_EQ(usb::to_string(usb::endpoint_type::interrupt), "interrupt");
    EXPECT_EQ(usb::to_string(usb::request_type::class_), "class");
    EXPECT_EQ(usb::to_string(usb::recipient::other), "other");
}

TEST_F(descriptor_test, request_type_bits)
{
    using usb::direction;
    using usb::recipient;
    using usb::request_type;

    EXPECT_EQ(
        usb::make_request_type(direction::out, request_type::standard),
        0x00
    );
    EXPECT_EQ(usb::make_request_type(direction::in, request_type::standard), 0x80);
    EXPECT_EQ(usb::make_request_type(direction::out, request_type::class_), 0x20);
    EXPECT_EQ(usb::make_request_type(direction::in, request_type::vendor), 0xc0);
    EXPECT_EQ(
        usb::make_request_type(direction::out, request_type::reserved),
        0x60
    );
    EXPECT_EQ(
        usb::make_request_type(
            direction::in,
            request_type::class_,
            recipient::interface
        ),
        0xa1
    );
    EXPECT_EQ(
        usb::make_request_type(
            direction::out,
            request_type::vendor,
            recipient::other
        ),
        0x43
    );

    EXPECT_EQ(usb::direction_of(0xc0), direction::in);
    EXPECT_EQ(usb::direction_of(0x41), direction::out);
}

TEST_F(descriptor_test, polling_interval_applies_to_periodic_endpoints)
{
    EXPECT_FALSE(usb::has_polling_interval(usb::endpoint_type::control));
    EXPECT_FALSE(usb::has_polling_interval(usb::endpoint_type::bulk));
    EXPECT_TRUE(usb::has_polling_interval(usb::endpoint_type::interrupt));
    EXPECT_TRUE(usb::has_polling_interval(usb::endpoint_type::isochronous));
}

} // namespace usbkit::test
