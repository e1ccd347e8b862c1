// tests/test_device.cpp
#include <gtest/gtest.h>
#include <string>

#include "directory/device.hpp"
#include "term/ansi.hpp"

using directory::Device;

static Device make(const std::string &addr, const std::string &name)
{
    Device d;
    d.address = addr;
    d.name    = name;
    return d;
}

TEST(Device, NameWidthCountsCodePoints)
{
    EXPECT_EQ(directory::name_width(""), 0u);
    EXPECT_EQ(directory::name_width("Mouse"), 5u);
    EXPECT_EQ(directory::name_width("Caf\xC3\xA9"), 4u);          // é
    EXPECT_EQ(directory::name_width("\xE2\x9C\x93 ok"), 4u);      // check mark
}

TEST(Device, ValidityNeedsAddressAndShortName)
{
    EXPECT_TRUE(directory::valid_device(make("AA:BB:CC:DD:EE:FF", "")));
    EXPECT_FALSE(directory::valid_device(make("", "Mouse")));
    EXPECT_TRUE(directory::valid_device(make("AA:BB:CC:DD:EE:FF", std::string(248, 'x'))));
    EXPECT_FALSE(directory::valid_device(make("AA:BB:CC:DD:EE:FF", std::string(249, 'x'))));
}

TEST(Device, QuotingDependsOnWhitespace)
{
    EXPECT_EQ(directory::quoted_name(make("A", "Mouse"), false), " Mouse ");
    EXPECT_EQ(directory::quoted_name(make("A", "My Mouse"), false), "'My Mouse'");
    EXPECT_EQ(directory::colored_name(make("A", "My Mouse"), false), "My Mouse");
}

TEST(Device, ColorFollowsState)
{
    Device d = make("A", "Pad");
    EXPECT_EQ(directory::colored_name(d, true),
              std::string(ansi::DIM) + "Pad" + std::string(ansi::RESET));
    d.paired    = true;
    d.connected = true;
    EXPECT_EQ(directory::colored_name(d, true),
              std::string(ansi::BOLD_BLUE) + "Pad" + std::string(ansi::RESET));
}

TEST(Device, InfoBlockListsKnownFields)
{
    Device d      = make("AA:BB:CC:DD:EE:FF", "Headset");
    d.paired      = true;
    d.trusted     = true;
    d.remote_name = "WH-1000";
    d.battery     = 80;

    const std::string want = "AA:BB:CC:DD:EE:FF Headset"
                             "\n\tPaired: yes"
                             "\n\tBonded: no"
                             "\n\tTrusted: yes"
                             "\n\tBlocked: no"
                             "\n\tConnected: no"
                             "\n\tRemote Name: WH-1000"
                             "\n\tBattery Percentage: 80";
    EXPECT_EQ(directory::info_block(d, false), want);

    d.icon = "audio-headset";
    EXPECT_NE(directory::info_block(d, false).find("\n\tIcon: audio-headset"),
              std::string::npos);
}

TEST(Device, BatteryColorBands)
{
    Device d  = make("A", "B");
    d.battery = 20;
    EXPECT_NE(directory::info_block(d, true).find(std::string(ansi::RED) + "20"),
              std::string::npos);
    d.battery = 50;
    EXPECT_NE(directory::info_block(d, true).find(std::string(ansi::YELLOW) + "50"),
              std::string::npos);
    d.battery = 70;
    EXPECT_NE(directory::info_block(d, true).find(std::string(ansi::GREEN) + "70"),
              std::string::npos);
}
