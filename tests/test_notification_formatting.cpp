#include <gtest/gtest.h>
#include "core/app_state.hpp"
#include "notification/message_formatter.hpp"
#include "notification/pushover_channel.hpp"
#include "notification/simulated_channel.hpp"
#include "test_utils.hpp"

using webhunter::testing::make_listing;

TEST(MessageFormatterTest, DefaultTemplates) {
    webhunter::MessageFormatter formatter{webhunter::MessagesConfig{}};
    auto message = formatter.render(make_listing("bikes", "9"));

    EXPECT_EQ(message.title, "New listing on bikes");
    EXPECT_EQ(message.body, "Item 9\nEUR 10");
    EXPECT_EQ(message.url, "https://example.com/item/9");
    EXPECT_EQ(message.url_title, "Item 9");
}

TEST(MessageFormatterTest, EmptyPriceDropsTrailingLine) {
    webhunter::MessageFormatter formatter{webhunter::MessagesConfig{}};
    auto listing = make_listing("bikes", "9");
    listing.price.clear();

    EXPECT_EQ(formatter.render(listing).body, "Item 9");
}

TEST(MessageFormatterTest, EmptyBodyFallsBackToUrl) {
    webhunter::MessagesConfig config;
    config.body = "{price}";
    webhunter::MessageFormatter formatter(config);
    auto listing = make_listing("bikes", "9");
    listing.price.clear();

    EXPECT_EQ(formatter.render(listing).body, "https://example.com/item/9");
}

TEST(MessageFormatterTest, ExpandsAllPlaceholdersAndKeepsUnknown) {
    auto listing = make_listing("bikes", "9");
    EXPECT_EQ(webhunter::MessageFormatter::expand("{source}/{id}: {title} {price} {url} {seller} {", listing),
              "bikes/9: Item 9 EUR 10 https://example.com/item/9 {seller} {");
}

class PushoverChannelTest : public ::testing::Test {
protected:
    PushoverChannelTest() {
        config_.app_token = "apptoken";
        config_.device = "phone";
    }

    webhunter::NotifierConfig config_;
};

TEST_F(PushoverChannelTest, BuildsFormBody) {
    webhunter::PushoverChannel channel(config_, "test-agent", nullptr);
    webhunter::PushMessage message{"New listing", "Sofa\n20 EUR", "https://x.example/1", "Sofa"};

    EXPECT_EQ(channel.build_request_body(message, "userkey"),
              "device=phone&message=Sofa%0A20%20EUR&title=New%20listing&token=apptoken"
              "&url=https%3A%2F%2Fx.example%2F1&url_title=Sofa&user=userkey");
}

TEST_F(PushoverChannelTest, LongMessageIsTruncatedOnCharacterBoundary) {
    webhunter::PushoverChannel channel(config_, "test-agent", nullptr);
    // 2-byte characters; 1024 is not a boundary after the leading 'x'
    std::string body = "x";
    for (int i = 0; i < 600; ++i) {
        body += "\xC3\xA4";
    }
    webhunter::PushMessage message{"", body, "", ""};

    std::string encoded = channel.build_request_body(message, "u");
    // 'x' plus 511 complete characters
    size_t count = 0;
    for (size_t pos = encoded.find("%C3%A4"); pos != std::string::npos; pos = encoded.find("%C3%A4", pos + 1)) {
        ++count;
    }
    EXPECT_EQ(count, 511u);
}

TEST_F(PushoverChannelTest, MissingRecipientIsRejected) {
    webhunter::PushoverChannel channel(config_, "test-agent", nullptr);
    auto result = channel.send(webhunter::PushMessage{"t", "b", "", ""}, "");
    EXPECT_TRUE(result.is_rejected());
}

TEST_F(PushoverChannelTest, SendDuringShutdownIsCancelled) {
    webhunter::AppState app_state;
    app_state.shutdown();
    config_.endpoint = "http://127.0.0.1:9/1/messages.json";
    webhunter::PushoverChannel channel(config_, "test-agent", &app_state);

    auto result = channel.send(webhunter::PushMessage{"t", "b", "", ""}, "userkey");

    EXPECT_TRUE(result.is_cancelled());
    EXPECT_FALSE(result.is_transient());
}

TEST(PushoverClassifyTest, MapsStatusCodes) {
    using webhunter::PushoverChannel;
    EXPECT_TRUE(PushoverChannel::classify_response(200, R"({"status":1})").is_ok());
    EXPECT_TRUE(PushoverChannel::classify_response(429, "").is_transient());
    EXPECT_TRUE(PushoverChannel::classify_response(408, "").is_transient());
    EXPECT_TRUE(PushoverChannel::classify_response(500, "").is_transient());
    EXPECT_TRUE(PushoverChannel::classify_response(503, "").is_transient());
    EXPECT_TRUE(PushoverChannel::classify_response(0, "").is_transient());
    EXPECT_TRUE(PushoverChannel::classify_response(401, "").is_rejected());
}

TEST(PushoverClassifyTest, RejectionCarriesApiErrors) {
    auto result = webhunter::PushoverChannel::classify_response(
        400, R"({"user":"invalid","errors":["user identifier is not a valid user, group, or subscribed user key"],"status":0})");

    EXPECT_TRUE(result.is_rejected());
    EXPECT_EQ(result.status_code, 400);
    EXPECT_EQ(result.detail, "user identifier is not a valid user, group, or subscribed user key");
}

TEST(SimulatedChannelTest, AlwaysSucceeds) {
    webhunter::SimulatedChannel channel;
    EXPECT_TRUE(channel.send(webhunter::PushMessage{"t", "b", "", ""}, "").is_ok());
    EXPECT_TRUE(channel.send(webhunter::PushMessage{"t", "b", "", ""}, "user").is_ok());
    EXPECT_EQ(channel.sent_count(), 2u);
}
