// tests/test_directory.cpp
#include <atomic>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "backend/ibackend.hpp"
#include "directory/device_directory.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

using directory::Device;
using directory::DeviceDirectory;
using directory::MatchField;
using directory::MatchMode;

namespace test_directory
{

static Device dev(const std::string &addr, const std::string &name, bool paired = false,
                  bool connected = false)
{
    Device d;
    d.address   = addr;
    d.name      = name;
    d.paired    = paired;
    d.connected = connected;
    return d;
}

// Scripted backend: per-address outcome, every call recorded
struct FakeBackend : backend::IBackend
{
    std::vector<Device>      devices;
    std::vector<std::string> adapters = {"/org/bluez/hci0"};
    bool                     reachable = true;

    std::set<std::string> fail;        // addresses whose action fails
    std::set<std::string> throws;      // addresses whose action throws
    std::set<std::string> already;     // pair reports AlreadyExists
    std::atomic<int>      pairable_calls{0};
    std::atomic<int>      info_calls{0};

    std::mutex               mu;
    std::vector<std::string> calls;

    bool outcome(const std::string &what, const Device &d)
    {
        {
            std::lock_guard<std::mutex> lk(mu);
            calls.push_back(what + " " + d.address);
        }
        if (throws.count(d.address))
            throw std::runtime_error("transport exploded");
        return !fail.count(d.address);
    }

    bool refresh_snapshot(backend::Snapshot &out) override
    {
        if (!reachable)
            return false;
        out.devices  = devices;
        out.adapters = adapters;
        return true;
    }
    bool scan(std::chrono::seconds) override { return true; }
    bool set_pairable(bool) override
    {
        ++pairable_calls;
        return true;
    }
    bool pair(const Device &d) override
    {
        if (d.paired)
            return true;
        // a bus reply of AlreadyExists counts as paired
        if (already.count(d.address))
        {
            std::lock_guard<std::mutex> lk(mu);
            calls.push_back("pair " + d.address + " " + std::string(constants::ERR_ALREADY_EXIST));
            return true;
        }
        return outcome("pair", d);
    }
    bool unpair(const Device &d) override { return outcome("unpair", d); }
    bool connect(const Device &d) override
    {
        if (d.connected)
            return true;
        return outcome("connect", d);
    }
    bool disconnect(const Device &d) override { return outcome("disconnect", d); }
    bool info(Device &d) override
    {
        ++info_calls;
        for (const auto &src : devices)
        {
            if (src.address == d.address)
            {
                d = src;
                return true;
            }
        }
        return false;
    }
    std::string name() const override { return "fake"; }
};

static std::shared_ptr<FakeBackend> three_devices()
{
    auto be     = std::make_shared<FakeBackend>();
    be->devices = {dev("AA:AA:AA:AA:AA:01", "Keyboard", true, true),
                   dev("AA:AA:AA:AA:AA:02", "Headset", true),
                   dev("BB:BB:BB:BB:BB:03", "Mouse")};
    return be;
}

}  // namespace test_directory

using namespace test_directory;

TEST(Directory, RefreshLoadsSnapshotAndMetadata)
{
    auto be = three_devices();
    be->devices.push_back(dev("CC:CC:CC:CC:CC:04", "Desk Lamp"));
    DeviceDirectory dir(be);
    ASSERT_TRUE(dir.refresh());

    EXPECT_EQ(dir.size(), 4u);
    ASSERT_EQ(dir.adapters().size(), 1u);
    EXPECT_EQ(dir.adapters()[0], "/org/bluez/hci0");
    EXPECT_TRUE(dir.any_whitespace());
    EXPECT_EQ(dir.min_name_width(), 5u);
    EXPECT_EQ(dir.max_name_width(), 9u);
}

TEST(Directory, RefreshFailureKeepsContents)
{
    auto            be = three_devices();
    DeviceDirectory dir(be);
    ASSERT_TRUE(dir.refresh());
    be->reachable = false;
    EXPECT_FALSE(dir.refresh());
    EXPECT_EQ(dir.size(), 3u);
}

TEST(Directory, AddRejectsInvalidRecords)
{
    DeviceDirectory dir(std::make_shared<FakeBackend>());
    EXPECT_FALSE(dir.add(dev("", "Nameless")));
    EXPECT_FALSE(dir.add(dev("AA:AA:AA:AA:AA:AA", std::string(300, 'n'))));
    EXPECT_TRUE(dir.add(dev("AA:AA:AA:AA:AA:AA", "ok")));
    EXPECT_EQ(dir.size(), 1u);
}

TEST(Directory, AddRejectsDuplicateAddress)
{
    DeviceDirectory dir(std::make_shared<FakeBackend>());
    ASSERT_TRUE(dir.add(dev("AA:BB:CC:DD:EE:FF", "Keyboard")));

    bluelist::set_log_level(bluelist::Level::Warning);
    testing::internal::CaptureStderr();
    EXPECT_FALSE(dir.add(dev("aa:bb:cc:dd:ee:ff", "Keyboard (hci1)")));
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_NE(err.find("already in the directory"), std::string::npos);
    EXPECT_EQ(dir.size(), 1u);
    EXPECT_EQ(dir.devices()[0].name, "Keyboard");
}

TEST(Directory, RefreshKeepsFirstOfDuplicateAddresses)
{
    auto be = three_devices();
    be->devices.push_back(dev("BB:BB:BB:BB:BB:03", "Mouse on hci1"));
    DeviceDirectory dir(be);
    ASSERT_TRUE(dir.refresh());
    EXPECT_EQ(dir.size(), 3u);

    // one connect per address
    std::ostringstream out;
    auto               mice = dir.filter_by("BB:BB:BB:BB:BB:03", MatchMode::Full, MatchField::Address);
    EXPECT_EQ(mice.connect_all(out), 1u);
    EXPECT_EQ(be->calls, std::vector<std::string>{"connect BB:BB:BB:BB:BB:03"});
}

TEST(Directory, FilterModes)
{
    DeviceDirectory dir(three_devices());
    ASSERT_TRUE(dir.refresh());

    EXPECT_EQ(dir.filter_by("Mouse", MatchMode::Full, MatchField::Name).size(), 1u);
    EXPECT_EQ(dir.filter_by("Mous", MatchMode::Full, MatchField::Name).size(), 0u);
    EXPECT_EQ(dir.filter_by("se", MatchMode::Contains, MatchField::Name).size(), 2u);
    EXPECT_EQ(dir.filter_by("^[KH]", MatchMode::ContainsRegex, MatchField::Name).size(), 2u);
    EXPECT_EQ(dir.filter_by("[KH]", MatchMode::FullRegex, MatchField::Name).size(), 0u);
    EXPECT_EQ(dir.filter_by("[KH].*", MatchMode::FullRegex, MatchField::Name).size(), 2u);

    // addresses compare without regard to case
    EXPECT_EQ(dir.filter_by("bb:bb:bb:bb:bb:03", MatchMode::Full, MatchField::Address).size(), 1u);
    EXPECT_EQ(dir.filter_by("aa:aa", MatchMode::Contains, MatchField::Address).size(), 2u);
}

TEST(Directory, InvalidRegexGivesEmptyView)
{
    DeviceDirectory dir(three_devices());
    ASSERT_TRUE(dir.refresh());
    auto view = dir.filter_by("([", MatchMode::ContainsRegex, MatchField::Name);
    EXPECT_TRUE(view.empty());
    EXPECT_EQ(view.adapters().size(), 1u);
}

TEST(Directory, ViewsShareRecords)
{
    DeviceDirectory dir(three_devices());
    ASSERT_TRUE(dir.refresh());
    auto view = dir.filter([](const Device &d) { return d.name == "Mouse"; });
    ASSERT_EQ(view.size(), 1u);
    EXPECT_EQ(view.records()[0].get(), dir.records()[2].get());

    std::ostringstream sink;
    EXPECT_EQ(view.connect_all(sink), 1u);
    // the optimistic update is visible through the parent
    EXPECT_TRUE(dir.devices()[2].connected);
}

TEST(Directory, PairAllCountsAlreadyExistsAsSuccess)
{
    auto be     = std::make_shared<FakeBackend>();
    be->devices = {dev("AA:AA:AA:AA:AA:01", "Keyboard"), dev("AA:AA:AA:AA:AA:02", "Headset")};
    be->already.insert("AA:AA:AA:AA:AA:01");
    DeviceDirectory dir(be);
    ASSERT_TRUE(dir.refresh());

    std::ostringstream out;
    EXPECT_EQ(dir.pair_all(out), 2u);
    EXPECT_EQ(be->pairable_calls.load(), 2);  // on, then off again
    for (const auto &d : dir.devices())
        EXPECT_TRUE(d.paired) << d.address;
    EXPECT_NE(out.str().find("Attempting to pair with Keyboard..."), std::string::npos);
    EXPECT_NE(out.str().find("Headset paired."), std::string::npos);
}

TEST(Directory, OneFailureDoesNotStopTheOthers)
{
    auto be = three_devices();
    be->fail.insert("AA:AA:AA:AA:AA:01");
    DeviceDirectory dir(be);
    ASSERT_TRUE(dir.refresh());

    std::ostringstream out;
    EXPECT_EQ(dir.disconnect_all(out), 2u);
    EXPECT_EQ(be->calls.size(), 3u);
    EXPECT_NE(out.str().find("Could not disconnect Keyboard."), std::string::npos);
    EXPECT_NE(out.str().find("Mouse disconnected."), std::string::npos);
    // the failed record keeps its state
    EXPECT_TRUE(dir.devices()[0].connected);
}

TEST(Directory, ThrowingBackendCountsAsFailure)
{
    auto be = three_devices();
    be->throws.insert("BB:BB:BB:BB:BB:03");
    DeviceDirectory dir(be);
    ASSERT_TRUE(dir.refresh());

    std::ostringstream out;
    testing::internal::CaptureStderr();
    std::size_t n   = dir.unpair_all(out);
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(n, 2u);
    EXPECT_NE(out.str().find("Could not unpair Mouse."), std::string::npos);
    EXPECT_NE(err.find("transport exploded"), std::string::npos);
}

TEST(Directory, AlreadyConnectedSkipsTheBackend)
{
    auto            be = three_devices();
    DeviceDirectory dir(be);
    ASSERT_TRUE(dir.refresh());
    auto kb = dir.filter_by("Keyboard", MatchMode::Full, MatchField::Name);

    std::ostringstream out;
    EXPECT_EQ(kb.connect_all(out), 1u);
    EXPECT_TRUE(be->calls.empty());
}

TEST(Directory, EmptySelectionDoesNothing)
{
    auto            be = three_devices();
    DeviceDirectory dir(be);
    ASSERT_TRUE(dir.refresh());
    auto none = dir.filter_by("Toaster", MatchMode::Full, MatchField::Name);

    std::ostringstream out;
    EXPECT_EQ(none.pair_all(out), 0u);
    EXPECT_TRUE(out.str().empty());
    EXPECT_TRUE(be->calls.empty());
    EXPECT_EQ(be->pairable_calls.load(), 0);
}

TEST(Directory, PrintLongAndLinewise)
{
    DeviceDirectory dir(three_devices());
    ASSERT_TRUE(dir.refresh());
    dir.set_quote_names(false);

    std::ostringstream lines;
    dir.print(directory::PrintMode::Linewise, lines, 80);
    EXPECT_EQ(lines.str(), "Keyboard\nHeadset\nMouse\n");

    std::ostringstream longf;
    dir.print(directory::PrintMode::Long, longf, 80);
    EXPECT_EQ(longf.str(), "AA:AA:AA:AA:AA:01 Keyboard\n"
                           "AA:AA:AA:AA:AA:02 Headset\n"
                           "BB:BB:BB:BB:BB:03 Mouse\n");
}

TEST(Directory, PrintColumns)
{
    DeviceDirectory dir(three_devices());
    ASSERT_TRUE(dir.refresh());

    std::ostringstream grid;
    dir.print(directory::PrintMode::Columns, grid, 24);
    EXPECT_EQ(grid.str(), "Keyboard  Headset\nMouse\n");
}

TEST(Directory, PrintQuotesWhenSomeNameHasWhitespace)
{
    auto be = three_devices();
    be->devices.push_back(dev("CC:CC:CC:CC:CC:04", "Desk Lamp"));
    DeviceDirectory dir(be);
    ASSERT_TRUE(dir.refresh());
    ASSERT_TRUE(dir.quoting());

    std::ostringstream lines;
    dir.print(directory::PrintMode::Linewise, lines, 80);
    EXPECT_EQ(lines.str(), " Keyboard \n Headset \n Mouse \n'Desk Lamp'\n");
}

TEST(Directory, InfoRereadsEveryRecord)
{
    auto            be = three_devices();
    DeviceDirectory dir(be);
    ASSERT_TRUE(dir.refresh());

    be->devices[2].battery = 42;
    auto mouse             = dir.filter_by("Mouse", MatchMode::Full, MatchField::Name);
    std::ostringstream out;
    mouse.print_info_all(out);
    EXPECT_EQ(be->info_calls.load(), 1);
    EXPECT_NE(out.str().find("BB:BB:BB:BB:BB:03 Mouse\n\tPaired: no"), std::string::npos);
    EXPECT_NE(out.str().find("Battery Percentage: 42"), std::string::npos);
    // the refreshed detail lands in the shared record
    ASSERT_TRUE(dir.devices()[2].battery.has_value());
    EXPECT_EQ(*dir.devices()[2].battery, 42);
}
