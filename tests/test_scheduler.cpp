#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <stdexcept>
#include <thread>
#include "core/exceptions.hpp"
#include "core/scheduler.hpp"
#include "data/sqlite_seen_store.hpp"
#include "mocks/mock_notification_channel.hpp"
#include "mocks/mock_notification_dispatcher.hpp"
#include "mocks/mock_seen_store.hpp"
#include "mocks/mock_source_adapter.hpp"
#include "test_utils.hpp"

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using webhunter::testing::make_listing;

namespace {

webhunter::SourceConfig source(const std::string& name) {
    webhunter::SourceConfig config;
    config.name = name;
    config.adapter = "json_feed";
    config.poll_interval_sec = 1;
    config.jitter_sec = 0;
    return config;
}

// Waits until `predicate` holds or the deadline passes
template<typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds deadline = std::chrono::seconds(5)) {
    auto until = std::chrono::steady_clock::now() + deadline;
    while (std::chrono::steady_clock::now() < until) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

const webhunter::SourceStatus& find_status(const std::vector<webhunter::SourceStatus>& all, const std::string& name) {
    for (const auto& status : all) {
        if (status.name == name) {
            return status;
        }
    }
    throw std::out_of_range(name);
}

} // namespace

class SchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = webhunter::testing::temp_db_path("scheduler");
        store_ = std::make_unique<webhunter::SqliteSeenStore>(path_, webhunter::testing::fast_policy());

        ON_CALL(channel_, get_name()).WillByDefault(Return("mock"));
        ON_CALL(channel_, send(_, _)).WillByDefault([this](const webhunter::PushMessage&, const std::string&) {
            ++sent_;
            return webhunter::SendResult{webhunter::SendOutcome::OK, 200, ""};
        });
        dispatcher_ = std::make_unique<webhunter::NotificationDispatcher>(
            channel_, webhunter::MessageFormatter(webhunter::MessagesConfig{}), "user-key",
            webhunter::testing::fast_policy(), [](std::chrono::milliseconds) { return true; });
    }

    void TearDown() override {
        store_.reset();
        webhunter::testing::remove_db(path_);
    }

    // Keeps loops turning quickly while still honouring shutdown
    void use_fast_sleeper(webhunter::Scheduler& scheduler) {
        scheduler.set_sleeper([this](std::chrono::milliseconds) {
            return app_state_.wait_for(std::chrono::milliseconds(5));
        });
    }

    std::string path_;
    webhunter::AppState app_state_;
    NiceMock<webhunter::testing::MockNotificationChannel> channel_;
    std::unique_ptr<webhunter::NotificationDispatcher> dispatcher_;
    std::unique_ptr<webhunter::SqliteSeenStore> store_;
    std::atomic<int> sent_{0};
};

TEST_F(SchedulerTest, FailingSourceDoesNotBlockOthers) {
    auto failing = std::make_unique<webhunter::testing::MockSourceAdapter>();
    auto healthy = std::make_unique<webhunter::testing::MockSourceAdapter>();

    ON_CALL(*failing, fetch(_)).WillByDefault([](const webhunter::SourceConfig&) -> std::vector<webhunter::Listing> {
        throw webhunter::FetchError(webhunter::FetchError::Kind::TRANSIENT, "connection refused");
    });
    std::atomic<int> calls{0};
    ON_CALL(*healthy, fetch(_)).WillByDefault([&calls](const webhunter::SourceConfig&) {
        int n = ++calls;
        return std::vector<webhunter::Listing>{make_listing("healthy", "item-" + std::to_string(n))};
    });
    EXPECT_CALL(*failing, fetch(_)).Times(::testing::AtLeast(1));
    EXPECT_CALL(*healthy, fetch(_)).Times(::testing::AtLeast(5));

    webhunter::Scheduler scheduler(*store_, *dispatcher_, app_state_);
    scheduler.add_source(source("failing"), std::move(failing));
    scheduler.add_source(source("healthy"), std::move(healthy));
    use_fast_sleeper(scheduler);

    ASSERT_TRUE(scheduler.start().is_success());
    ASSERT_TRUE(eventually([&] { return find_status(scheduler.status(), "healthy").cycles >= 5; }));
    scheduler.stop();

    auto all = scheduler.status();
    const auto& bad = find_status(all, "failing");
    const auto& good = find_status(all, "healthy");
    EXPECT_GE(bad.cycles, 1u);
    ASSERT_TRUE(bad.last_report.has_value());
    EXPECT_EQ(bad.last_report->fetch_failed, 1u);
    EXPECT_GE(sent_.load(), 5);
    EXPECT_EQ(good.state, webhunter::SourceState::STOPPED);
    EXPECT_EQ(bad.state, webhunter::SourceState::STOPPED);
}

TEST_F(SchedulerTest, ThrowingCycleIsCountedAsFaultAndLoopContinues) {
    webhunter::testing::MockNotificationDispatcher dispatcher(channel_);
    ON_CALL(dispatcher, deliver(_)).WillByDefault([](const webhunter::Listing&) -> webhunter::DeliveryOutcome {
        throw std::runtime_error("renderer exploded");
    });
    EXPECT_CALL(dispatcher, deliver(_)).Times(::testing::AtLeast(3));

    auto adapter = std::make_unique<webhunter::testing::MockSourceAdapter>();
    ON_CALL(*adapter, fetch(_)).WillByDefault(Return(std::vector<webhunter::Listing>{make_listing("shop", "A")}));
    EXPECT_CALL(*adapter, fetch(_)).Times(::testing::AtLeast(3));

    webhunter::Scheduler scheduler(*store_, dispatcher, app_state_);
    scheduler.add_source(source("shop"), std::move(adapter));
    use_fast_sleeper(scheduler);

    ASSERT_TRUE(scheduler.start().is_success());
    ASSERT_TRUE(eventually([&] { return find_status(scheduler.status(), "shop").faults >= 3; }));
    scheduler.stop();

    EXPECT_FALSE(store_->has_seen("shop", "A"));
}

TEST_F(SchedulerTest, NonStandardThrowIsCountedAsFault) {
    auto odd = std::make_unique<webhunter::testing::MockSourceAdapter>();
    auto healthy = std::make_unique<webhunter::testing::MockSourceAdapter>();
    EXPECT_CALL(*odd, fetch(_)).WillOnce([](const webhunter::SourceConfig&) -> std::vector<webhunter::Listing> {
        throw 42;
    });
    EXPECT_CALL(*healthy, fetch(_)).WillOnce(Return(std::vector<webhunter::Listing>{make_listing("healthy", "1")}));

    webhunter::Scheduler scheduler(*store_, *dispatcher_, app_state_);
    scheduler.add_source(source("aaa-odd"), std::move(odd));
    scheduler.add_source(source("healthy"), std::move(healthy));

    auto reports = scheduler.run_once();
    ASSERT_TRUE(reports.is_success());
    ASSERT_EQ(reports.value().size(), 1u);
    EXPECT_EQ(reports.value()[0].delivered, 1u);

    auto all = scheduler.status();
    EXPECT_EQ(find_status(all, "aaa-odd").faults, 1u);
    EXPECT_EQ(find_status(all, "aaa-odd").state, webhunter::SourceState::IDLE);
    EXPECT_EQ(find_status(all, "healthy").faults, 0u);
}

TEST_F(SchedulerTest, StopWakesSleepingLoops) {
    auto adapter = std::make_unique<webhunter::testing::MockSourceAdapter>();
    ON_CALL(*adapter, fetch(_)).WillByDefault(Return(std::vector<webhunter::Listing>{}));
    EXPECT_CALL(*adapter, fetch(_)).Times(1);

    auto config = source("slow");
    config.poll_interval_sec = 3600;

    webhunter::Scheduler scheduler(*store_, *dispatcher_, app_state_);
    scheduler.add_source(config, std::move(adapter));

    ASSERT_TRUE(scheduler.start().is_success());
    ASSERT_TRUE(eventually([&] { return find_status(scheduler.status(), "slow").cycles >= 1; }));

    auto started = std::chrono::steady_clock::now();
    scheduler.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
    EXPECT_EQ(find_status(scheduler.status(), "slow").state, webhunter::SourceState::STOPPED);
}

TEST_F(SchedulerTest, StartPropagatesCorruptStore) {
    NiceMock<webhunter::testing::MockSeenStore> store;
    EXPECT_CALL(store, load())
        .WillOnce(Return(webhunter::Status::error(webhunter::ErrorCode::CORRUPT_STORE, "not a database")));

    auto adapter = std::make_unique<webhunter::testing::MockSourceAdapter>();
    EXPECT_CALL(*adapter, fetch(_)).Times(0);

    webhunter::Scheduler scheduler(store, *dispatcher_, app_state_);
    scheduler.add_source(source("shop"), std::move(adapter));

    auto status = scheduler.start();
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.code(), webhunter::ErrorCode::CORRUPT_STORE);
}

TEST_F(SchedulerTest, RunOnceVisitsEverySourceInOrder) {
    std::vector<std::string> order;
    auto first = std::make_unique<webhunter::testing::MockSourceAdapter>();
    auto second = std::make_unique<webhunter::testing::MockSourceAdapter>();
    EXPECT_CALL(*first, fetch(_)).WillOnce([&order](const webhunter::SourceConfig& config) {
        order.push_back(config.name);
        return std::vector<webhunter::Listing>{make_listing("alpha", "1")};
    });
    EXPECT_CALL(*second, fetch(_)).WillOnce([&order](const webhunter::SourceConfig& config) {
        order.push_back(config.name);
        return std::vector<webhunter::Listing>{make_listing("beta", "1"), make_listing("beta", "2")};
    });

    webhunter::Scheduler scheduler(*store_, *dispatcher_, app_state_);
    scheduler.add_source(source("alpha"), std::move(first));
    scheduler.add_source(source("beta"), std::move(second));

    auto reports = scheduler.run_once();
    ASSERT_TRUE(reports.is_success());
    ASSERT_EQ(reports.value().size(), 2u);
    EXPECT_EQ(reports.value()[0].source_id, "alpha");
    EXPECT_EQ(reports.value()[1].delivered, 2u);
    EXPECT_EQ(order, (std::vector<std::string>{"alpha", "beta"}));
    EXPECT_EQ(sent_.load(), 3);
}

TEST_F(SchedulerTest, ReseedSuppressesExistingListings) {
    auto adapter = std::make_unique<webhunter::testing::MockSourceAdapter>();
    EXPECT_CALL(*adapter, fetch(_))
        .WillOnce(Return(std::vector<webhunter::Listing>{make_listing("shop", "A"), make_listing("shop", "B")}))
        .WillOnce(Return(std::vector<webhunter::Listing>{make_listing("shop", "A"), make_listing("shop", "C")}));

    webhunter::Scheduler scheduler(*store_, *dispatcher_, app_state_);
    scheduler.add_source(source("shop"), std::move(adapter));

    auto seeded = scheduler.reseed();
    ASSERT_TRUE(seeded.is_success());
    EXPECT_EQ(seeded.value()[0].new_listings, 2u);
    EXPECT_EQ(sent_.load(), 0);

    auto reports = scheduler.run_once();
    ASSERT_TRUE(reports.is_success());
    EXPECT_EQ(reports.value()[0].delivered, 1u);
    EXPECT_EQ(sent_.load(), 1);
}
