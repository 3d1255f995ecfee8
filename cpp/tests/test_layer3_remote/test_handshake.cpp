// tests/test_layer3_remote/test_handshake.cpp
/**
 * @file test_handshake.cpp
 * @brief Registration state machine against the scripted fake TV.
 */
#include "fake_tv.h"
#include "lgtv_remote.hpp"
#include "gtest/gtest.h"

using namespace lgtv::remote;
using namespace lgtv::tests::helper;
using namespace std::chrono_literals;

class HandshakeTest : public ::testing::Test
{
  protected:
    std::shared_ptr<FakeTransport> transport_ = std::make_shared<FakeTransport>();
    FakeTv tv_{transport_};
    std::vector<HandshakeState> states_;

    HandshakeOptions FastOptions()
    {
        HandshakeOptions options;
        options.hello_timeout = 300ms;
        options.pairing_timeout = 300ms;
        return options;
    }

    RemoteResult<std::string> Run(Handshake &handshake, std::optional<std::string> key)
    {
        handshake.set_state_observer([this](HandshakeState s) { states_.push_back(s); });
        tv_.start();
        return handshake.run(*transport_, key);
    }
};

TEST_F(HandshakeTest, AcceptedKeyNeedsNoConfirmation)
{
    tv_.accept_key("abc123");
    Handshake handshake(FastOptions());
    auto key = Run(handshake, std::string("abc123"));

    ASSERT_TRUE(key.is_ok()) << describe_error(key);
    EXPECT_EQ(key.content(), "abc123");
    EXPECT_EQ(handshake.state(), HandshakeState::Authenticated);
    EXPECT_EQ(handshake.confirmation_prompts(), 0);
    EXPECT_EQ(states_, (std::vector<HandshakeState>{HandshakeState::HelloSent,
                                                    HandshakeState::Authenticated}));

    const auto registers = tv_.register_frames();
    ASSERT_EQ(registers.size(), 1u);
    EXPECT_EQ(registers[0]["payload"]["client-key"], "abc123");
}

TEST_F(HandshakeTest, NoKeyPairsThroughPrompt)
{
    tv_.set_issued_key("fresh-key");
    Handshake handshake(FastOptions());
    auto key = Run(handshake, std::nullopt);

    ASSERT_TRUE(key.is_ok()) << describe_error(key);
    EXPECT_EQ(key.content(), "fresh-key");
    EXPECT_EQ(handshake.confirmation_prompts(), 1);
    EXPECT_EQ(states_, (std::vector<HandshakeState>{HandshakeState::HelloSent,
                                                    HandshakeState::AwaitingConfirmation,
                                                    HandshakeState::Authenticated}));
    const auto registers = tv_.register_frames();
    ASSERT_EQ(registers.size(), 1u);
    EXPECT_FALSE(registers[0]["payload"].contains("client-key"));
    EXPECT_EQ(registers[0]["payload"]["pairingType"], "PROMPT");
    EXPECT_EQ(registers[0]["payload"]["manifest"]["appId"], "com.lgtv.remote");
}

TEST_F(HandshakeTest, EmptyStoredKeyCountsAsNone)
{
    Handshake handshake(FastOptions());
    auto key = Run(handshake, std::string());
    ASSERT_TRUE(key.is_ok());
    EXPECT_FALSE(tv_.register_frames()[0]["payload"].contains("client-key"));
}

TEST_F(HandshakeTest, UserRejectionEndsRejectedNotFailed)
{
    tv_.set_pairing(PairingMode::Reject);
    Handshake handshake(FastOptions());
    auto key = Run(handshake, std::nullopt);

    ASSERT_TRUE(key.is_error());
    EXPECT_EQ(key.error(), RemoteErrc::PairingRejected);
    EXPECT_EQ(key.error_code(), 403);
    EXPECT_EQ(handshake.state(), HandshakeState::Rejected);
}

TEST_F(HandshakeTest, UnansweredPromptTimesOut)
{
    tv_.set_pairing(PairingMode::IgnorePrompt);
    Handshake handshake(FastOptions());
    auto key = Run(handshake, std::nullopt);

    ASSERT_TRUE(key.is_error());
    EXPECT_EQ(key.error(), RemoteErrc::PairingTimeout);
    EXPECT_EQ(handshake.state(), HandshakeState::Rejected);
}

TEST_F(HandshakeTest, RevokedKeyFallsBackToPairing)
{
    tv_.set_reject_unknown_keys(true);
    tv_.set_issued_key("replacement");
    Handshake handshake(FastOptions());
    auto key = Run(handshake, std::string("revoked"));

    ASSERT_TRUE(key.is_ok()) << describe_error(key);
    EXPECT_EQ(key.content(), "replacement");
    const auto registers = tv_.register_frames();
    ASSERT_EQ(registers.size(), 2u);
    EXPECT_EQ(registers[0]["payload"]["client-key"], "revoked");
    EXPECT_FALSE(registers[1]["payload"].contains("client-key"));
    EXPECT_NE(registers[0]["id"], registers[1]["id"]);
}

TEST_F(HandshakeTest, RevokedKeyThenRejection)
{
    tv_.set_reject_unknown_keys(true);
    tv_.set_pairing(PairingMode::Reject);
    Handshake handshake(FastOptions());
    auto key = Run(handshake, std::string("revoked"));

    ASSERT_TRUE(key.is_error());
    EXPECT_EQ(key.error(), RemoteErrc::PairingRejected);
    EXPECT_EQ(tv_.register_frames().size(), 2u);
}

TEST(HandshakeSilenceTest, SilentTvTimesOutAsFailed)
{
    auto transport = std::make_shared<FakeTransport>();
    HandshakeOptions options;
    options.hello_timeout = 100ms;
    Handshake handshake(options);
    auto key = handshake.run(*transport, std::nullopt);

    ASSERT_TRUE(key.is_error());
    EXPECT_EQ(key.error(), RemoteErrc::Timeout);
    EXPECT_EQ(handshake.state(), HandshakeState::Failed);
}

TEST(HandshakeSilenceTest, ClosedTransportFails)
{
    auto transport = std::make_shared<FakeTransport>();
    transport->close();
    Handshake handshake;
    auto key = handshake.run(*transport, std::nullopt);

    ASSERT_TRUE(key.is_error());
    EXPECT_EQ(key.error(), RemoteErrc::TransportClosed);
    EXPECT_EQ(handshake.state(), HandshakeState::Failed);
}

TEST(HandshakeSilenceTest, FramesForOtherIdsAreIgnored)
{
    auto transport = std::make_shared<FakeTransport>();
    transport->push_frame({{"type", "registered"}, {"id", "someone_else"}, {"payload", {{"client-key", "x"}}}});
    transport->push_inbound("garbage");
    transport->push_frame({{"type", "registered"}, {"id", "register_0"}, {"payload", {{"client-key", "k"}}}});
    Handshake handshake;
    auto key = handshake.run(*transport, std::nullopt);
    ASSERT_TRUE(key.is_ok()) << describe_error(key);
    EXPECT_EQ(key.content(), "k");
}

TEST(HandshakeSilenceTest, ServerErrorBeforePromptIsNotARejection)
{
    auto transport = std::make_shared<FakeTransport>();
    transport->push_frame({{"type", "error"}, {"id", "register_0"}, {"error", "500 internal server error"}, {"payload", Json::object()}});
    Handshake handshake;
    auto key = handshake.run(*transport, std::nullopt);

    ASSERT_TRUE(key.is_error());
    EXPECT_EQ(key.error(), RemoteErrc::ProtocolError);
    EXPECT_EQ(key.error_code(), 500);
    EXPECT_EQ(handshake.state(), HandshakeState::Failed);
    EXPECT_EQ(handshake.confirmation_prompts(), 0);
}

TEST(HandshakeSilenceTest, ErrorAfterKeyFallbackWithoutPromptIsNotARejection)
{
    auto transport = std::make_shared<FakeTransport>();
    transport->push_frame({{"type", "error"}, {"id", "register_0"}, {"error", "401 insufficient permissions"}, {"payload", Json::object()}});
    transport->push_frame({{"type", "error"}, {"id", "register_1"}, {"error", "500 internal server error"}, {"payload", Json::object()}});
    Handshake handshake;
    auto key = handshake.run(*transport, std::string("revoked"));

    ASSERT_TRUE(key.is_error());
    EXPECT_EQ(key.error(), RemoteErrc::ProtocolError);
    EXPECT_EQ(handshake.state(), HandshakeState::Failed);
    EXPECT_EQ(transport->sent().size(), 2u);
}

TEST(HandshakeFrameTest, RegisterFrameCarriesManifest)
{
    HandshakeOptions options;
    options.force_pairing = true;
    const auto doc = nlohmann::json::parse(Handshake::build_register_frame("register_0", options, std::string("k1")));
    EXPECT_EQ(doc["type"], "register");
    EXPECT_EQ(doc["id"], "register_0");
    EXPECT_EQ(doc["payload"]["forcePairing"], true);
    EXPECT_EQ(doc["payload"]["client-key"], "k1");
    EXPECT_EQ(doc["payload"]["manifest"]["manifestVersion"], 1);
    EXPECT_FALSE(doc["payload"]["manifest"]["permissions"].empty());
}
