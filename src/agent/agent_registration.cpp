#include <cerrno>
#include <cstring>
#include <string>

#include "agent/agent_registration.hpp"
#include "agent/pairing_agent.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

#if BLUELIST_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace
{

inline void unref_slot(sd_bus_slot *&s)
{
    if (s)
    {
        sd_bus_slot_unref(s);
        s = nullptr;
    }
}

static agent::PairingAgent *agent_of(void *userdata)
{
    return static_cast<agent::PairingAgent *>(userdata);
}

// ======================================================================
// Function: reply_status
// - In: method call being answered, outcome of the challenge
// - Out: empty method return on Ok, otherwise the BlueZ error name
// ======================================================================
static int reply_status(sd_bus_message *m, agent::AgentStatus st)
{
    const char *ename = agent::status_error_name(st);
    if (!ename)
        return sd_bus_reply_method_return(m, "");
    return sd_bus_reply_method_errorf(m, ename, "%s",
                                      st == agent::AgentStatus::Rejected ? "Rejected by user"
                                                                         : "Canceled by user");
}

static int agent_Release(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    agent_of(userdata)->release();
    return sd_bus_reply_method_return(m, "");
}

static int agent_RequestPinCode(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    const char *dev = nullptr;
    int         r   = sd_bus_message_read(m, "o", &dev);
    if (r < 0)
        return r;
    auto rep = agent_of(userdata)->request_pin_code(dev ? dev : "");
    if (rep.status != agent::AgentStatus::Ok)
        return reply_status(m, rep.status);
    return sd_bus_reply_method_return(m, "s", rep.pin.c_str());
}

static int agent_DisplayPinCode(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    const char *dev = nullptr, *pin = nullptr;
    int         r   = sd_bus_message_read(m, "os", &dev, &pin);
    if (r < 0)
        return r;
    auto rep = agent_of(userdata)->display_pin_code(dev ? dev : "", pin ? pin : "");
    return reply_status(m, rep.status);
}

static int agent_RequestPasskey(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    const char *dev = nullptr;
    int         r   = sd_bus_message_read(m, "o", &dev);
    if (r < 0)
        return r;
    auto rep = agent_of(userdata)->request_passkey(dev ? dev : "");
    if (rep.status != agent::AgentStatus::Ok)
        return reply_status(m, rep.status);
    return sd_bus_reply_method_return(m, "u", rep.passkey);
}

static int agent_DisplayPasskey(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    const char *dev     = nullptr;
    uint32_t    passkey = 0;
    uint16_t    entered = 0;
    int         r       = sd_bus_message_read(m, "ouq", &dev, &passkey, &entered);
    if (r < 0)
        return r;
    auto rep = agent_of(userdata)->display_passkey(dev ? dev : "", passkey, entered);
    return reply_status(m, rep.status);
}

static int agent_RequestConfirmation(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    const char *dev     = nullptr;
    uint32_t    passkey = 0;
    int         r       = sd_bus_message_read(m, "ou", &dev, &passkey);
    if (r < 0)
        return r;
    auto rep = agent_of(userdata)->request_confirmation(dev ? dev : "", passkey);
    return reply_status(m, rep.status);
}

static int agent_RequestAuthorization(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    const char *dev = nullptr;
    int         r   = sd_bus_message_read(m, "o", &dev);
    if (r < 0)
        return r;
    auto rep = agent_of(userdata)->request_authorization(dev ? dev : "");
    return reply_status(m, rep.status);
}

static int agent_AuthorizeService(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    const char *dev = nullptr, *uuid = nullptr;
    int         r   = sd_bus_message_read(m, "os", &dev, &uuid);
    if (r < 0)
        return r;
    auto rep = agent_of(userdata)->authorize_service(dev ? dev : "", uuid ? uuid : "");
    return reply_status(m, rep.status);
}

static int agent_Cancel(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    agent_of(userdata)->cancel();
    return sd_bus_reply_method_return(m, "");
}

// org.bluez.Agent1
const sd_bus_vtable agent_vtable[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_METHOD("Release", "", "", agent_Release, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("RequestPinCode", "o", "s", agent_RequestPinCode, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("DisplayPinCode", "os", "", agent_DisplayPinCode, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("RequestPasskey", "o", "u", agent_RequestPasskey, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("DisplayPasskey", "ouq", "", agent_DisplayPasskey, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("RequestConfirmation",
                  "ou",
                  "",
                  agent_RequestConfirmation,
                  SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("RequestAuthorization",
                  "o",
                  "",
                  agent_RequestAuthorization,
                  SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("AuthorizeService", "os", "", agent_AuthorizeService, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("Cancel", "", "", agent_Cancel, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_VTABLE_END};

static bool call_agent_manager(sd_bus *bus, const char *method, const std::string &path, bool with_cap)
{
    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int             r;
    if (with_cap)
        r = sd_bus_call_method(bus, constants::BLUEZ_SERVICE.data(), "/org/bluez",
                               constants::AGENT_MANAGER.data(), method, &err, &rep, "os",
                               path.c_str(), constants::AGENT_CAPABILITY.data());
    else
        r = sd_bus_call_method(bus, constants::BLUEZ_SERVICE.data(), "/org/bluez",
                               constants::AGENT_MANAGER.data(), method, &err, &rep, "o",
                               path.c_str());
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        LOG_WARN("[AGENT] %s failed: %s", method, err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    return true;
}

}  // namespace
#endif

namespace agent
{

AgentRegistration::AgentRegistration(sd_bus *bus, PairingAgent &agent)
    : bus_(bus), path_(constants::AGENT_PATH)
{
#if !BLUELIST_HAVE_SDBUS
    (void)agent;
    LOG_ERROR("[AGENT] built without sd-bus, no agent exported");
#else
    if (!bus_)
        return;

    int r = sd_bus_add_object_vtable(bus_, &slot_, path_.c_str(), constants::AGENT_IFACE.data(),
                                     agent_vtable, &agent);
    if (r < 0)
    {
        LOG_ERROR("[AGENT] exporting %s failed: %s", path_.c_str(), strerror(-r));
        slot_ = nullptr;
        return;
    }

    if (!call_agent_manager(bus_, "RegisterAgent", path_, true))
    {
        // no dangling object when BlueZ refuses the agent
        unref_slot(slot_);
        return;
    }
    advertised_ = true;
    LOG_DEBUG("[AGENT] registered %s (%s)", path_.c_str(), constants::AGENT_CAPABILITY.data());
#endif
}

AgentRegistration::~AgentRegistration()
{
#if BLUELIST_HAVE_SDBUS
    if (advertised_ && bus_)
    {
        if (!call_agent_manager(bus_, "UnregisterAgent", path_, false))
            LOG_DEBUG("[AGENT] UnregisterAgent ignored");
    }
    unref_slot(slot_);
#endif
    advertised_ = false;
}

}  // namespace agent
