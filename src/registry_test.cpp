#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "errc.hpp"
#include "registry.hpp"
#include "usb/mock.hpp"
#include "usb/simulated_device.hpp"

namespace usbkit::test {

class registry_test : public testing::Test {
protected:
    static auto make_device() -> std::unique_ptr<usb::connected_device>
    {
        return std::make_unique<usb::simulated_device>();
    }

    connection_registry registry_{};
};

TEST_F(registry_test, handles_strictly_increase)
{
    const auto first = registry_.open(make_device());
    const auto second = registry_.open(make_device());
    EXPECT_EQ(first, 1);
    EXPECT_GT(second, first);
    EXPECT_EQ(registry_.size(), 2);
}

TEST_F(registry_test, handles_are_never_reused)
{
    auto handles = std::vector<handle_type>{};
    for (auto i = 0; i < 5; ++i) {
        const auto handle = registry_.open(make_device());
        registry_.close(handle);
        handles.push_back(handle);
    }

    for (std::size_t i = 1; i < handles.size(); ++i) {
        EXPECT_GT(handles[i], handles[i - 1]);
    }
    EXPECT_EQ(registry_.size(), 0);
}

TEST_F(registry_test, get_returns_registered_device)
{
    auto device = make_device();
    const auto* raw = device.get();
    const auto handle = registry_.open(std::move(device));

    const auto found = registry_.get(handle);
    ASSERT_TRUE(found);
    EXPECT_EQ(found->get(), raw);
}

TEST_F(registry_test, stale_handle_is_not_found)
{
    const auto handle = registry_.open(make_device());
    registry_.close(handle);

    const auto found = registry_.get(handle);
    ASSERT_FALSE(found);
    EXPECT_TRUE(found.error().is(errc::not_found));
    EXPECT_EQ(found.error().category(), error_category::registry);

    EXPECT_FALSE(registry_.get(12345));
}

TEST_F(registry_test, closing_unknown_handle_is_a_no_op)
{
    const auto handle = registry_.open(make_device());
    registry_.close(handle + 100);
    registry_.close(handle + 100);
    EXPECT_EQ(registry_.size(), 1);
    EXPECT_TRUE(registry_.get(handle));
}

TEST_F(registry_test, close_closes_device_once)
{
    auto device = std::make_unique<::testing::StrictMock<mock_device>>();
    EXPECT_CALL(*device, close()).Times(1);

    const auto handle = registry_.open(std::move(device));
    registry_.close(handle);
    registry_.close(handle);
}

TEST_F(registry_test, close_releases_device_after_closing_it)
{
    struct tracked_device : mock_device {
        explicit tracked_device(std::vector<std::string>& events)
            : events_(events)
        {
        }

        ~tracked_device() override { events_.emplace_back("destroyed"); }

        std::vector<std::string>& events_;
    };

    auto events = std::vector<std::string>{};
    auto device = std::make_unique<tracked_device>(events);
    EXPECT_CALL(*device, close()).WillOnce([&events]() {
        events.emplace_back("closed");
    });

    const auto handle = registry_.open(std::move(device));
    registry_.close(handle);

    EXPECT_THAT(events, ::testing::ElementsAre("closed", "destroyed"));
}

TEST_F(registry_test, in_flight_command_delays_close)
{
    auto device = std::make_unique<::testing::StrictMock<mock_device>>();
    auto* raw = device.get();

    const auto handle = registry_.open(std::move(device));
    auto in_flight = registry_.get(handle);
    ASSERT_TRUE(in_flight);

    registry_.close(handle);
    EXPECT_FALSE(registry_.get(handle));

    EXPECT_CALL(*raw, close()).Times(1);
    in_flight->reset();
}

TEST_F(registry_test, close_all_closes_every_connection)
{
    auto first = std::make_unique<::testing::StrictMock<mock_device>>();
    auto second = std::make_unique<::testing::StrictMock<mock_device>>();
    EXPECT_CALL(*first, close()).Times(1);
    EXPECT_CALL(*second, close()).Times(1);

    const auto h1 = registry_.open(std::move(first));
    const auto h2 = registry_.open(std::move(second));

    registry_.close_all();
    EXPECT_EQ(registry_.size(), 0);
    EXPECT_FALSE(registry_.get(h1));
    EXPECT_FALSE(registry_.get(h2));

    registry_.close_all();

    const auto h3 = registry_.open(make_device());
    EXPECT_GT(h3, h2);
}

TEST_F(registry_test, destructor_closes_remaining_connections)
{
    auto device = std::make_unique<::testing::StrictMock<mock_device>>();
    EXPECT_CALL(*device, close()).Times(1);

    {
        auto registry = connection_registry{};
        static_cast<void>(registry.open(std::move(device)));
    }
}

} // namespace usbkit::test
