// tests/test_layer3_remote/test_subscription_registry.cpp
/**
 * @file test_subscription_registry.cpp
 * @brief Event ordering, overflow, TV-side termination and unsubscribe.
 */
#include "fake_tv.h"
#include "lgtv_remote.hpp"
#include "shared_test_helpers.h"
#include "gtest/gtest.h"

using namespace lgtv::remote;
using namespace lgtv::tests::helper;
using namespace std::chrono_literals;

namespace
{
constexpr const char *kForeground = "ssap://com.webos.applicationManager/getForegroundAppInfo";
constexpr const char *kVolume = "ssap://audio/getVolume";

Endpoint endpoint(const char *uri)
{
    return Endpoint::parse(uri).content();
}
} // namespace

class SubscriptionRegistryTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        tv_.on_subscribe(kForeground, {{"appId", "com.webos.app.home"}, {"returnValue", true}});
        tv_.on_subscribe(kVolume, {{"volume", 10}, {"returnValue", true}});
        tv_.start();
        correlator_.start();
    }

    // The registry's close listener must not outlive it.
    void TearDown() override
    {
        correlator_.shutdown();
        tv_.stop();
    }

    /// Built on first use so a test can adjust options_ beforehand.
    SubscriptionRegistry &Registry()
    {
        if (!registry_)
        {
            registry_ = std::make_unique<SubscriptionRegistry>(correlator_, options_);
        }
        return *registry_;
    }

    Subscription Subscribe(const char *uri)
    {
        auto sub = Registry().subscribe(endpoint(uri), Payload());
        EXPECT_TRUE(sub.is_ok()) << describe_error(sub);
        return sub.is_ok() ? std::move(sub).content() : Subscription();
    }

    std::shared_ptr<FakeTransport> transport_ = std::make_shared<FakeTransport>();
    FakeTv tv_{transport_};
    RequestCorrelator correlator_{transport_};
    SubscriptionOptions options_;
    std::unique_ptr<SubscriptionRegistry> registry_;
};

TEST_F(SubscriptionRegistryTest, AcknowledgementCarriesInitialValue)
{
    auto sub = Subscribe(kForeground);
    ASSERT_TRUE(sub.valid());
    EXPECT_EQ(sub.initial()["appId"], "com.webos.app.home");
    EXPECT_EQ(sub.endpoint(), kForeground);
    EXPECT_EQ(sub.id().rfind("sub_", 0), 0u);
    EXPECT_EQ(Registry().active_count(), 1u);
    EXPECT_FALSE(sub.ended());

    const auto requests = tv_.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0]["type"], "subscribe");
}

TEST_F(SubscriptionRegistryTest, EventsArriveInOrder)
{
    auto sub = Subscribe(kForeground);
    for (int i = 0; i < 5; ++i)
    {
        ASSERT_TRUE(tv_.push_event(kForeground, {{"seq", i}}));
    }
    for (int i = 0; i < 5; ++i)
    {
        auto event = sub.next_for(2s);
        ASSERT_TRUE(event.has_value()) << "event " << i;
        EXPECT_EQ((*event)["seq"], i);
    }
    EXPECT_FALSE(sub.next_for(50ms).has_value());
    EXPECT_FALSE(sub.ended());
}

TEST_F(SubscriptionRegistryTest, EventsAreRoutedPerSubscription)
{
    auto apps = Subscribe(kForeground);
    auto volume = Subscribe(kVolume);
    ASSERT_NE(apps.id(), volume.id());

    tv_.push_event(kVolume, {{"volume", 11}});
    tv_.push_event(kForeground, {{"appId", "netflix"}});

    auto v = volume.next_for(2s);
    auto a = apps.next_for(2s);
    ASSERT_TRUE(v && a);
    EXPECT_EQ((*v)["volume"], 11);
    EXPECT_EQ((*a)["appId"], "netflix");
}

TEST_F(SubscriptionRegistryTest, SlowConsumerLosesOldestEvents)
{
    options_.capacity = 2;

    auto sub = Subscribe(kForeground);
    for (int i = 0; i < 5; ++i)
    {
        tv_.push_event(kForeground, {{"seq", i}});
    }
    ASSERT_TRUE(wait_until([&sub] { return sub.dropped() == 3; }));

    auto first = sub.next_for(1s);
    auto second = sub.next_for(1s);
    ASSERT_TRUE(first && second);
    EXPECT_EQ((*first)["seq"], 3);
    EXPECT_EQ((*second)["seq"], 4);
}

TEST_F(SubscriptionRegistryTest, TvErrorEndsTheSequenceAfterBufferedEvents)
{
    auto sub = Subscribe(kForeground);
    tv_.push_event(kForeground, {{"seq", 0}});
    ASSERT_TRUE(tv_.end_subscription(kForeground, "500 service went away"));

    std::vector<Json> seen;
    for (const auto &event : sub)
    {
        seen.push_back(event);
    }
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0]["seq"], 0);
    EXPECT_TRUE(sub.ended());
    EXPECT_EQ(Registry().active_count(), 0u);
}

TEST_F(SubscriptionRegistryTest, UnsubscribeEndsLocallyAndTellsTheTv)
{
    auto sub = Subscribe(kForeground);
    const auto id = sub.id();
    Registry().unsubscribe(sub);

    EXPECT_TRUE(sub.ended());
    EXPECT_FALSE(sub.next().has_value());
    EXPECT_EQ(Registry().active_count(), 0u);
    ASSERT_TRUE(wait_until([&] { return tv_.unsubscribed_ids().count(id) == 1; }));

    // A second unsubscribe is a no-op.
    Registry().unsubscribe(sub);
}

TEST_F(SubscriptionRegistryTest, UnsubscribeSucceedsEvenWhenTheFrameCannotBeSent)
{
    auto sub = Subscribe(kForeground);
    transport_->fail_sends(true);
    Registry().unsubscribe(sub);
    EXPECT_TRUE(sub.ended());
    EXPECT_EQ(Registry().active_count(), 0u);
}

TEST_F(SubscriptionRegistryTest, RejectedSubscribeLeavesNothingBehind)
{
    auto sub = Registry().subscribe(endpoint("ssap://tv/getCurrentChannel"), Payload());
    ASSERT_TRUE(sub.is_error());
    EXPECT_EQ(sub.error(), RemoteErrc::ProtocolError);
    EXPECT_EQ(sub.error_code(), 404);
    EXPECT_EQ(Registry().active_count(), 0u);
}

TEST_F(SubscriptionRegistryTest, ConnectionCloseEndsEverySubscription)
{
    auto apps = Subscribe(kForeground);
    auto volume = Subscribe(kVolume);
    tv_.push_event(kForeground, {{"seq", 1}});
    ASSERT_TRUE(apps.next_for(2s).has_value());

    correlator_.shutdown();
    EXPECT_FALSE(volume.next_for(2s).has_value());
    EXPECT_TRUE(volume.ended());
    while (apps.next_for(1s))
    {
    }
    EXPECT_TRUE(apps.ended());
    EXPECT_EQ(Registry().active_count(), 0u);
}

TEST_F(SubscriptionRegistryTest, HandleFromAnotherSessionIsIgnored)
{
    auto other_transport = std::make_shared<FakeTransport>("other-tv:3000");
    FakeTv other_tv{other_transport};
    other_tv.on_subscribe(kForeground, {{"appId", "com.webos.app.tv"}, {"returnValue", true}});
    other_tv.start();
    RequestCorrelator other_correlator{other_transport};
    other_correlator.start();
    SubscriptionRegistry other_registry(other_correlator, options_);

    auto mine = Subscribe(kForeground);
    auto theirs = other_registry.subscribe(endpoint(kForeground), Payload()).content();
    ASSERT_EQ(mine.id(), theirs.id());

    Registry().unsubscribe(theirs);
    EXPECT_EQ(Registry().active_count(), 1u);
    EXPECT_FALSE(mine.ended());
    EXPECT_FALSE(theirs.ended());
    EXPECT_TRUE(tv_.unsubscribed_ids().empty());

    ASSERT_TRUE(tv_.push_event(kForeground, {{"seq", 1}}));
    auto event = mine.next_for(2s);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ((*event)["seq"], 1);

    other_correlator.shutdown();
    other_tv.stop();
}
