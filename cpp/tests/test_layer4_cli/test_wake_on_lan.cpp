// tests/test_layer4_cli/test_wake_on_lan.cpp
#include "cli/wake_on_lan.hpp"
#include "shared_test_helpers.h"
#include "gtest/gtest.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

using namespace lgtv::cli;
using namespace lgtv::tests::helper;
using lgtv::remote::RemoteErrc;

TEST(WakeOnLanTest, ParsesColonAndDashSeparatedMacs)
{
    const MacAddress expected{0xa8, 0x23, 0xfe, 0x00, 0x11, 0x22};
    EXPECT_EQ(parse_mac("a8:23:fe:00:11:22"), expected);
    EXPECT_EQ(parse_mac("A8-23-FE-00-11-22"), expected);
    EXPECT_EQ(parse_mac("  a8:23:fe:00:11:22\n"), expected);
}

TEST(WakeOnLanTest, RejectsMalformedMacs)
{
    for (const char *text : {"", "a8:23:fe:00:11", "a8:23:fe:00:11:22:33", "a8:23-fe:00:11:22",
                             "g8:23:fe:00:11:22", "a8.23.fe.00.11.22", "a8:23:fe:00:11:2"})
    {
        EXPECT_FALSE(parse_mac(text).has_value()) << text;
    }
}

TEST(WakeOnLanTest, MagicPacketIsSyncThenSixteenCopies)
{
    const MacAddress mac{0x01, 0x02, 0x03, 0x04, 0x05, 0x06};
    const auto packet = build_magic_packet(mac);
    ASSERT_EQ(packet.size(), 102u);
    for (size_t i = 0; i < 6; ++i)
    {
        EXPECT_EQ(packet[i], 0xFF);
    }
    for (size_t copy = 0; copy < 16; ++copy)
    {
        for (size_t i = 0; i < 6; ++i)
        {
            EXPECT_EQ(packet[6 + copy * 6 + i], mac[i]);
        }
    }
}

TEST(WakeOnLanTest, ArpLookupReadsCompleteEntries)
{
    TempDir dir("arp");
    const auto table = dir / "arp";
    write_file_contents(table,
                        "IP address       HW type     Flags       HW address            Mask     Device\n"
                        "192.168.1.1      0x1         0x2         00:11:22:33:44:55     *        eth0\n"
                        "192.168.1.20     0x1         0x2         A8:23:FE:00:11:22     *        eth0\n"
                        "192.168.1.30     0x1         0x0         00:00:00:00:00:00     *        eth0\n");

    EXPECT_EQ(arp_lookup("192.168.1.20", table.string()), "a8:23:fe:00:11:22");
    EXPECT_EQ(arp_lookup("192.168.1.1", table.string()), "00:11:22:33:44:55");
    EXPECT_FALSE(arp_lookup("192.168.1.30", table.string()).has_value());
    EXPECT_FALSE(arp_lookup("192.168.1.2", table.string()).has_value());
    EXPECT_FALSE(arp_lookup("192.168.1.20", (dir / "missing").string()).has_value());
}

TEST(WakeOnLanTest, SendsPacketToGivenAddress)
{
    boost::asio::io_context ioc;
    boost::asio::ip::udp::socket receiver(
        ioc, boost::asio::ip::udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    const auto port = receiver.local_endpoint().port();

    auto status = wake_on_lan("a8:23:fe:00:11:22", "127.0.0.1", port);
    ASSERT_TRUE(status.is_ok()) << lgtv::remote::describe_error(status);

    std::array<uint8_t, 256> buffer{};
    boost::asio::ip::udp::endpoint sender;
    const auto length = receiver.receive_from(boost::asio::buffer(buffer), sender);
    ASSERT_EQ(length, 102u);
    EXPECT_EQ(buffer[0], 0xFF);
    EXPECT_EQ(buffer[6], 0xa8);
    EXPECT_EQ(buffer[101], 0x22);
}

TEST(WakeOnLanTest, InvalidInputIsRejectedBeforeSending)
{
    auto bad_mac = wake_on_lan("not-a-mac", "127.0.0.1", 9);
    ASSERT_TRUE(bad_mac.is_error());
    EXPECT_EQ(bad_mac.error(), RemoteErrc::InvalidPayload);

    auto bad_address = wake_on_lan("a8:23:fe:00:11:22", "broadcast", 9);
    ASSERT_TRUE(bad_address.is_error());
    EXPECT_EQ(bad_address.error(), RemoteErrc::TransportError);
}
