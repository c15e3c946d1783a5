#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include <boost/json.hpp>

#include "errc.hpp"
#include "json/json.hpp"

namespace usbkit::test {

class json_test : public testing::Test {
protected:
    boost::json::object params_{
        {"number", 42},
        {"negative", -1000000},
        {"big", std::numeric_limits<std::uint64_t>::max()},
        {"decimal", "17"},
        {"hex", "0x1f"},
        {"word", "vendor"},
        {"flag", true},
        {"nothing", nullptr},
        {"fraction", 1.5}
    };
};

TEST_F(json_test, read_int)
{
    EXPECT_EQ(json::read_int(params_, "number"), 42);
    EXPECT_EQ(json::read_int(params_, "negative"), -1000000);
    EXPECT_EQ(json::read_int(params_, "decimal"), 17);
    EXPECT_EQ(json::read_int(params_, "hex"), 31);
}

TEST_F(json_test, read_int_rejects_non_integers)
{
    for (const auto* key : {"big", "word", "flag", "nothing", "fraction"}) {
        const auto v = json::read_int(params_, key);
        ASSERT_FALSE(v) << key;
        EXPECT_TRUE(v.error().is(errc::invalid_argument));
    }
}

TEST_F(json_test, read_int_missing)
{
    const auto v = json::read_int(params_, "handle");
    ASSERT_FALSE(v);
    EXPECT_TRUE(v.error().is(errc::invalid_argument));
    EXPECT_EQ(v.error().message(), "Missing parameter: handle");
}

TEST_F(json_test, read_int_or)
{
    EXPECT_EQ(json::read_int_or(params_, "number", 7), 42);
    EXPECT_EQ(json::read_int_or(params_, "length", 7), 7);
    EXPECT_EQ(json::read_int_or(params_, "nothing", 7), 7);
    EXPECT_FALSE(json::read_int_or(params_, "word", 7));
}

TEST_F(json_test, read_string)
{
    EXPECT_EQ(json::read_string(params_, "word"), "vendor");
    EXPECT_FALSE(json::read_string(params_, "number"));
    EXPECT_FALSE(json::read_string(params_, "direction"));
}

TEST_F(json_test, read_bool_or)
{
    EXPECT_EQ(json::read_bool_or(params_, "flag", false), true);
    EXPECT_EQ(json::read_bool_or(params_, "appendFakeDevice", false), false);
    EXPECT_EQ(json::read_bool_or(params_, "nothing", true), true);

    const auto v = json::read_bool_or(params_, "word", false);
    ASSERT_FALSE(v);
    EXPECT_TRUE(v.error().is(errc::invalid_argument));
}

} // namespace usbkit::test
