// tests/test_bluez_pairing.cpp
// BluezBackend::pair against an in-process BlueZ stand-in that answers on
// the other end of a socketpair (peer-to-peer D-Bus, no system bus)
#include <gtest/gtest.h>

#if BLUELIST_HAVE_SDBUS
#include <atomic>
#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <sys/socket.h>
#include <systemd/sd-bus.h>
#include <systemd/sd-id128.h>
#include <thread>

#include "agent/pairing_agent.hpp"
#include "backend/bluez_backend.hpp"
#include "util/constants.hpp"

using backend::BluezBackend;
using backend::Device;

namespace test_bluez_pairing
{
const char *DEV_PATH          = "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF";
const char *ERR_AUTH_REJECTED = "org.bluez.Error.AuthenticationRejected";
const char *ERR_AUTH_FAILED   = "org.bluez.Error.AuthenticationFailed";
const char *ERR_AUTH_CANCELED = "org.bluez.Error.AuthenticationCanceled";

enum class PairMode
{
    Succeed,        // plain method return
    AlreadyExists,  // org.bluez.Error.AlreadyExists
    AskConfirmation,
    Delayed,  // method return after `delay`
    Hang      // answered only by CancelPairing
};

// ======================================================================
// Class: FakeBluez
// - AgentManager1 at /org/bluez and Device1 at DEV_PATH, served from its
//   own thread on the server end of the socket
// - Fields below the thread are only read after stop()
// ======================================================================
struct FakeBluez
{
    PairMode                  mode         = PairMode::Succeed;
    bool                      refuse_agent = false;
    bool                      stray_reply  = false;  // error reply with an old cookie first
    std::chrono::milliseconds delay{0};
    std::chrono::milliseconds connect_delay{0};

    sd_bus           *bus      = nullptr;
    sd_bus_slot      *mgr_slot = nullptr;
    sd_bus_slot      *dev_slot = nullptr;
    std::thread       th;
    std::atomic<bool> quit{false};

    sd_bus_message                       *register_call = nullptr;
    sd_bus_message                       *pending_pair  = nullptr;
    sd_bus_message                       *pending_conn  = nullptr;
    std::chrono::steady_clock::time_point release_at;
    std::chrono::steady_clock::time_point connect_at;

    int         registered   = 0;
    int         unregistered = 0;
    int         pair_calls   = 0;
    int         cancel_calls = 0;
    bool        stray_sent   = false;
    bool        agent_called = false;
    std::string agent_error;  // "" when the agent answered Ok

    bool start(int fd);
    void stop();
    void run();
    void answer_pair(const char *error_name);
};

static FakeBluez *fake_of(void *userdata)
{
    return static_cast<FakeBluez *>(userdata);
}

void FakeBluez::answer_pair(const char *error_name)
{
    if (!pending_pair)
        return;
    if (error_name)
        sd_bus_reply_method_errorf(pending_pair, error_name, "%s", error_name);
    else
        sd_bus_reply_method_return(pending_pair, "");
    sd_bus_message_unref(pending_pair);
    pending_pair = nullptr;
}

static int fake_RegisterAgent(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *f    = fake_of(userdata);
    const char *path = nullptr, *cap = nullptr;
    int         r    = sd_bus_message_read(m, "os", &path, &cap);
    if (r < 0)
        return r;
    if (f->refuse_agent)
        return sd_bus_reply_method_errorf(m, constants::ERR_ALREADY_EXIST.data(),
                                          "Already Exists");
    ++f->registered;
    if (f->stray_reply)
        f->register_call = sd_bus_message_ref(m);
    return sd_bus_reply_method_return(m, "");
}

static int fake_UnregisterAgent(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    ++fake_of(userdata)->unregistered;
    return sd_bus_reply_method_return(m, "");
}

static int fake_on_confirmation(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *f         = fake_of(userdata);
    f->agent_called = true;
    if (sd_bus_message_is_method_error(m, nullptr))
    {
        const sd_bus_error *e = sd_bus_message_get_error(m);
        f->agent_error        = e && e->name ? e->name : "?";
    }
    if (f->agent_error.empty())
        f->answer_pair(nullptr);
    else if (f->agent_error == constants::ERR_REJECTED)
        f->answer_pair(ERR_AUTH_REJECTED);
    else
        f->answer_pair(ERR_AUTH_FAILED);
    return 0;
}

static int fake_Pair(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *f = fake_of(userdata);
    ++f->pair_calls;

    if (f->register_call)
    {
        // a second answer to RegisterAgent, an error under an old cookie
        f->stray_sent = sd_bus_reply_method_errorf(f->register_call, "org.bluez.Error.Failed",
                                                   "late answer") >= 0;
        sd_bus_message_unref(f->register_call);
        f->register_call = nullptr;
    }

    switch (f->mode)
    {
    case PairMode::Succeed:
        return sd_bus_reply_method_return(m, "");
    case PairMode::AlreadyExists:
        return sd_bus_reply_method_errorf(m, constants::ERR_ALREADY_EXIST.data(),
                                          "Already Exists");
    case PairMode::AskConfirmation:
        f->pending_pair = sd_bus_message_ref(m);
        return sd_bus_call_method_async(f->bus, nullptr, nullptr, constants::AGENT_PATH.data(),
                                        constants::AGENT_IFACE.data(), "RequestConfirmation",
                                        fake_on_confirmation, f, "ou", DEV_PATH, 123456u);
    case PairMode::Delayed:
        f->pending_pair = sd_bus_message_ref(m);
        f->release_at   = std::chrono::steady_clock::now() + f->delay;
        return 1;
    case PairMode::Hang:
        f->pending_pair = sd_bus_message_ref(m);
        return 1;
    }
    return 1;
}

static int fake_Connect(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *f         = fake_of(userdata);
    f->pending_conn = sd_bus_message_ref(m);
    f->connect_at   = std::chrono::steady_clock::now() + f->connect_delay;
    return 1;
}

static int fake_CancelPairing(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *f = fake_of(userdata);
    ++f->cancel_calls;
    f->answer_pair(ERR_AUTH_CANCELED);
    return sd_bus_reply_method_return(m, "");
}

const sd_bus_vtable manager_vtable[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_METHOD("RegisterAgent", "os", "", fake_RegisterAgent, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("UnregisterAgent", "o", "", fake_UnregisterAgent, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_VTABLE_END};

const sd_bus_vtable device_vtable[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_METHOD("Pair", "", "", fake_Pair, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("CancelPairing", "", "", fake_CancelPairing, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("Connect", "", "", fake_Connect, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_VTABLE_END};

bool FakeBluez::start(int fd)
{
    sd_id128_t id;
    if (sd_id128_randomize(&id) < 0 || sd_bus_new(&bus) < 0)
        return false;
    if (sd_bus_set_fd(bus, fd, fd) < 0 || sd_bus_set_server(bus, 1, id) < 0 ||
        sd_bus_set_anonymous(bus, 1) < 0)
        return false;
    if (sd_bus_add_object_vtable(bus, &mgr_slot, "/org/bluez", constants::AGENT_MANAGER.data(),
                                 manager_vtable, this) < 0)
        return false;
    if (sd_bus_add_object_vtable(bus, &dev_slot, DEV_PATH, constants::DEVICE_IFACE.data(),
                                 device_vtable, this) < 0)
        return false;
    if (sd_bus_start(bus) < 0)
        return false;
    th = std::thread([this]() { run(); });
    return true;
}

void FakeBluez::run()
{
    while (!quit)
    {
        int r = sd_bus_process(bus, nullptr);
        if (r < 0)
            break;  // client went away
        if (mode == PairMode::Delayed && pending_pair &&
            std::chrono::steady_clock::now() >= release_at)
            answer_pair(nullptr);
        if (pending_conn && std::chrono::steady_clock::now() >= connect_at)
        {
            sd_bus_reply_method_return(pending_conn, "");
            sd_bus_message_unref(pending_conn);
            pending_conn = nullptr;
        }
        if (r > 0)
            continue;
        sd_bus_wait(bus, 50000);
    }
}

void FakeBluez::stop()
{
    quit = true;
    if (th.joinable())
        th.join();
    if (pending_pair)
        sd_bus_message_unref(pending_pair);
    if (register_call)
        sd_bus_message_unref(register_call);
    if (pending_conn)
        sd_bus_message_unref(pending_conn);
    pending_conn  = nullptr;
    pending_pair  = nullptr;
    register_call = nullptr;
    if (mgr_slot)
        sd_bus_slot_unref(mgr_slot);
    if (dev_slot)
        sd_bus_slot_unref(dev_slot);
    mgr_slot = dev_slot = nullptr;
    if (bus)
        sd_bus_flush_close_unref(bus);
    bus = nullptr;
}

static Device unpaired_device()
{
    Device d;
    d.address = "AA:BB:CC:DD:EE:FF";
    d.name    = "Keyboard";
    d.adapter = "/org/bluez/hci0";
    return d;
}

class BluezPairing : public ::testing::Test
{
  protected:
    void SetUp() override { be = std::make_unique<BluezBackend>(); }
    void TearDown() override { finish(); }

    // wires the backend to the fake and feeds `typed` to the agent
    void connect(const std::string &typed)
    {
        input.str(typed);
        prompt = std::make_unique<agent::StreamPrompt>(input, output);
        be->set_prompt(prompt.get());

        int fds[2];
        ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds), 0);
        ASSERT_TRUE(fake.start(fds[1]));

        sd_bus *client = nullptr;
        ASSERT_GE(sd_bus_new(&client), 0);
        ASSERT_GE(sd_bus_set_fd(client, fds[0], fds[0]), 0);
        ASSERT_GE(sd_bus_set_anonymous(client, 1), 0);
        ASSERT_GE(sd_bus_start(client), 0);
        ASSERT_TRUE(be->adopt(client));
    }

    // closes both ends; fake counters are stable afterwards
    void finish()
    {
        be.reset();
        fake.stop();
    }

    FakeBluez                            fake;
    std::unique_ptr<BluezBackend>        be;
    std::istringstream                   input;
    std::ostringstream                   output;
    std::unique_ptr<agent::StreamPrompt> prompt;
};

}  // namespace test_bluez_pairing

using namespace test_bluez_pairing;

TEST_F(BluezPairing, UnrelatedReplyDoesNotResolvePair)
{
    fake.stray_reply = true;
    connect("");
    EXPECT_TRUE(be->pair(unpaired_device()));
    finish();

    EXPECT_TRUE(fake.stray_sent);
    EXPECT_EQ(fake.pair_calls, 1);
    EXPECT_EQ(fake.registered, 1);
    EXPECT_EQ(fake.unregistered, 1);
}

TEST_F(BluezPairing, AlreadyExistsCountsAsPaired)
{
    fake.mode = PairMode::AlreadyExists;
    connect("");
    EXPECT_TRUE(be->pair(unpaired_device()));
    finish();
    EXPECT_EQ(fake.pair_calls, 1);
}

TEST_F(BluezPairing, DeclinedConfirmationFailsPair)
{
    fake.mode = PairMode::AskConfirmation;
    connect("n\n");
    EXPECT_FALSE(be->pair(unpaired_device()));
    EXPECT_NE(output.str().find("Does 123456 match the pincode on Keyboard? [y/n]"),
              std::string::npos);
    finish();

    EXPECT_TRUE(fake.agent_called);
    EXPECT_EQ(fake.agent_error, constants::ERR_REJECTED);
    EXPECT_EQ(fake.unregistered, 1);
}

TEST_F(BluezPairing, AcceptedConfirmationPairs)
{
    fake.mode = PairMode::AskConfirmation;
    connect("y\n");
    EXPECT_TRUE(be->pair(unpaired_device()));
    finish();
    EXPECT_TRUE(fake.agent_called);
    EXPECT_EQ(fake.agent_error, "");
}

TEST_F(BluezPairing, RefusedAgentLeavesNothingExported)
{
    fake.mode         = PairMode::AskConfirmation;
    fake.refuse_agent = true;
    connect("y\n");
    EXPECT_FALSE(be->pair(unpaired_device()));
    finish();

    // the challenge reached no object, and no answer was read
    EXPECT_TRUE(fake.agent_called);
    EXPECT_EQ(fake.agent_error.rfind("org.freedesktop.DBus.Error.Unknown", 0), 0u)
        << fake.agent_error;
    EXPECT_EQ(static_cast<long>(input.tellg()), 0L);
    EXPECT_EQ(fake.registered, 0);
    EXPECT_EQ(fake.unregistered, 0);
}

TEST_F(BluezPairing, ZeroPairTimeoutWaitsForLateReply)
{
    fake.mode  = PairMode::Delayed;
    fake.delay = std::chrono::milliseconds(1500);
    be->set_pair_timeout(std::chrono::seconds(0));
    connect("");
    EXPECT_TRUE(be->pair(unpaired_device()));
    finish();
    EXPECT_EQ(fake.cancel_calls, 0);
}

TEST_F(BluezPairing, IdlePairIsCanceled)
{
    fake.mode = PairMode::Hang;
    be->set_pair_timeout(std::chrono::seconds(1));
    connect("");
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(be->pair(unpaired_device()));
    auto waited = std::chrono::steady_clock::now() - t0;
    finish();

    EXPECT_EQ(fake.cancel_calls, 1);
    EXPECT_GE(waited, std::chrono::seconds(1));
    EXPECT_LT(waited, std::chrono::seconds(constants::CANCEL_GRACE_SECS));
    EXPECT_EQ(fake.unregistered, 1);
}

// the pair timeout never cuts a plain bus call short
TEST_F(BluezPairing, SlowConnectOutlivesPairTimeout)
{
    fake.connect_delay = std::chrono::milliseconds(2500);
    be->set_pair_timeout(std::chrono::seconds(1));
    connect("");
    EXPECT_TRUE(be->connect(unpaired_device()));
}

#endif  // BLUELIST_HAVE_SDBUS
