#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "format.hpp"

namespace usbkit::test {

class format_test : public testing::Test {
protected:
    std::vector<std::variant<
        std::int8_t,
        std::uint8_t,
        std::int16_t,
        std::uint16_t,
        std::int32_t,
        std::uint32_t,
        std::int64_t,
        std::uint64_t>>
        integrals_{
            std::int8_t{0x70},
            std::uint8_t{0x70},
            std::uint16_t{0x7170},
            std::int16_t{0x7170},
            std::int32_t{0x73727170},
            std::uint32_t{0x73727170},
            std::int64_t{0x7776757473727170},
            std::uint64_t{0x7776757473727170}
        };
};

TEST_F(format_test, make_string)
{
    EXPECT_EQ(format::make_string(1, 2, 3, 'a', "bc"), "1 2 3 97 bc");
    EXPECT_EQ(
        format::make_string("one,", "two,", 3, "five", 6),
        "one, two, 3 five 6"
    );
}

TEST_F(format_test, parse_integer)
{
    EXPECT_EQ(format::parse_integer("0"), 0);
    EXPECT_EQ(format::parse_integer("42"), 42);
    EXPECT_EQ(format::parse_integer("-1000000"), -1000000);
    EXPECT_EQ(format::parse_integer("0x10"), 16);
    EXPECT_EQ(format::parse_integer("0X1f"), 31);
    EXPECT_EQ(format::parse_integer("010"), 8);

    EXPECT_FALSE(format::parse_integer(""));
    EXPECT_FALSE(format::parse_integer("ten"));
    EXPECT_FALSE(format::parse_integer("12abc"));
    EXPECT_FALSE(format::parse_integer("0x"));
    EXPECT_FALSE(format::parse_integer("99999999999999999999"));
}

TEST_F(format_test, to_hex)
{
    const auto bytes = std::array<std::uint8_t, 4>{0x00, 0x0f, 0xa0, 0xff};
    EXPECT_EQ(format::to_hex(bytes), "000fa0ff");
    EXPECT_EQ(format::to_hex(std::span<const std::uint8_t>{}), "");
}

TEST_F(format_test, from_hex)
{
    const auto bytes = format::from_hex("000FA0ff");
    ASSERT_TRUE(bytes);
    EXPECT_THAT(*bytes, ::testing::ElementsAre(0x00, 0x0f, 0xa0, 0xff));

    const auto empty = format::from_hex("");
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty->empty());

    EXPECT_FALSE(format::from_hex("abc"));
    EXPECT_FALSE(format::from_hex("zz"));
    EXPECT_FALSE(format::from_hex("0x01"));
}

TEST_F(format_test, vectorize)
{
    const auto visitor = [](std::integral auto i) {
        using format::unsafe::vectorize;
        using T = decltype(i);

        const auto expect = std::array<T, 6>{0, 1, 2, 3, 4, 5};
        const auto size = std::size(expect);
        const auto vec = vectorize(expect.data(), size);
        EXPECT_THAT(vec, ::testing::ElementsAreArray(expect));

        using value_type = typename decltype(vec)::value_type;
        EXPECT_TRUE((std::is_same_v<T, value_type>));

        const T* null{};
        const auto empty_vec = vectorize(null, size);
        EXPECT_EQ(std::size(empty_vec), 0);

        using size_type = typename decltype(expect)::size_type;
        for (auto n = size_type{0}; n < std::size(expect); ++n) {
            const auto first_n = std::span{std::begin(expect), n};
            const auto vec_n = vectorize(first_n.data(), std::size(first_n));
            EXPECT_THAT(vec_n, ::testing::ElementsAreArray(first_n));
            EXPECT_EQ(std::size(vec_n), n);
        }
    };

    for (const auto i : integrals_) {
        std::visit(visitor, i);
    }
}

} // namespace usbkit::test
