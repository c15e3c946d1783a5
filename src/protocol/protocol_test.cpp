#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <boost/asio.hpp>
#include <boost/json.hpp>

#include "command/dispatcher.hpp"
#include "errc.hpp"
#include "protocol/protocol.hpp"

namespace usbkit::test {

class protocol_test : public testing::Test {
protected:
    using socket_type = boost::asio::local::stream_protocol::socket;

    boost::asio::io_context io_{};
    socket_type left_{io_};
    socket_type right_{io_};

    void SetUp() override { boost::asio::local::connect_pair(left_, right_); }
};

TEST_F(protocol_test, parse_request)
{
    const auto req = protocol::parse_request(
        R"({"id": 7, "command": "bulkTransfer",)"
        R"( "params": {"handle": 1, "endpoint": 1}, "data": "0102ff"})"
    );
    ASSERT_TRUE(req);
    EXPECT_EQ(req->id, boost::json::value(7));
    EXPECT_EQ(req->command, "bulkTransfer");
    EXPECT_EQ(req->params.at("endpoint").to_number<int>(), 1);
    EXPECT_THAT(req->data, ::testing::ElementsAre(0x01, 0x02, 0xff));
}

TEST_F(protocol_test, parse_request_defaults)
{
    const auto req = protocol::parse_request(R"({"command": "getDevices"})");
    ASSERT_TRUE(req);
    EXPECT_TRUE(req->id.is_null());
    EXPECT_TRUE(req->params.empty());
    EXPECT_TRUE(req->data.empty());
}

TEST_F(protocol_test, parse_request_rejects_malformed_documents)
{
    for (const auto* text : {
             "",
             "not json",
             "[1, 2]",
             R"({"id": 1})",
             R"({"command": 5})",
             R"({"command": "x", "params": [1]})",
             R"({"command": "x", "data": "zz"})",
             R"({"command": "x", "data": 12})"
         }) {
        const auto req = protocol::parse_request(text);
        ASSERT_FALSE(req) << text;
        EXPECT_TRUE(req.error().is(protocol::errc::malformed_request));
        EXPECT_EQ(req.error().category(), error_category::protocol);
    }
}

TEST_F(protocol_test, request_to_json)
{
    auto req = protocol::request{};
    req.id = 3;
    req.command = "controlTransfer";
    req.params = {{"handle", 1}};
    req.data = {0xca, 0xfe};

    const auto json = protocol::to_json(req);
    EXPECT_EQ(json.at("id"), boost::json::value(3));
    EXPECT_EQ(json.at("command").as_string(), "controlTransfer");
    EXPECT_EQ(json.at("data").as_string(), "cafe");

    const auto parsed = protocol::parse_request(boost::json::serialize(json));
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->params, req.params);
    EXPECT_EQ(parsed->data, req.data);
}

TEST_F(protocol_test, make_success)
{
    const auto id = boost::json::value("abc");

    const auto empty = protocol::make_success(id, command::reply{});
    EXPECT_EQ(empty.at("id"), id);
    EXPECT_TRUE(empty.at("ok").as_bool());
    EXPECT_FALSE(empty.contains("result"));
    EXPECT_FALSE(empty.contains("data"));

    const auto json = protocol::make_success(
        id,
        command::reply{boost::json::value(boost::json::array{1, 2})}
    );
    EXPECT_EQ(json.at("result"), (boost::json::array{1, 2}));

    const auto bytes = protocol::make_success(
        id,
        command::reply{type::bytes_type{5, 9, 2}}
    );
    EXPECT_EQ(bytes.at("data").as_string(), "050902");
}

TEST_F(protocol_test, make_failure)
{
    const auto err = make_error(errc::not_found, "Unknown device ID: 7").error();
    const auto json = protocol::make_failure(1, err);

    EXPECT_FALSE(json.at("ok").as_bool());
    const auto& detail = json.at("error").as_object();
    EXPECT_EQ(detail.at("code").as_string(), "not_found");
    EXPECT_EQ(detail.at("message").as_string(), "Unknown device ID: 7");
}

TEST_F(protocol_test, code_name)
{
    EXPECT_EQ(
        protocol::code_name(make_error(errc::transfer_failed).error()),
        "transfer_failed"
    );
    EXPECT_EQ(
        protocol::code_name(make_error(errc::unknown_command).error()),
        "unknown_command"
    );
    EXPECT_EQ(
        protocol::code_name(
            make_error(protocol::errc::malformed_request).error()
        ),
        "malformed_request"
    );
    EXPECT_EQ(protocol::code_name(error{}), "unknown");
}

TEST_F(protocol_test, frames_round_trip)
{
    const auto text = std::string{R"({"command":"getDevices"})"};
    ASSERT_TRUE(protocol::write_frame(left_, text));
    ASSERT_TRUE(protocol::write_frame(left_, ""));

    const auto first = protocol::read_frame(right_);
    ASSERT_TRUE(first);
    EXPECT_EQ(*first, text);

    const auto second = protocol::read_frame(right_);
    ASSERT_TRUE(second);
    EXPECT_TRUE(second->empty());
}

TEST_F(protocol_test, read_frame_reports_closed_peer)
{
    left_.close();

    const auto frame = protocol::read_frame(right_);
    ASSERT_FALSE(frame);
    EXPECT_TRUE(frame.error().is(protocol::errc::connection_closed));
}

TEST_F(protocol_test, read_frame_rejects_oversized_frame)
{
    const auto size = protocol::frame_size_type{protocol::max_frame_size + 1};
    boost::asio::write(left_, boost::asio::buffer(&size, sizeof(size)));

    const auto frame = protocol::read_frame(right_);
    ASSERT_FALSE(frame);
    EXPECT_TRUE(frame.error().is(protocol::errc::frame_too_large));
}

} // namespace usbkit::test
