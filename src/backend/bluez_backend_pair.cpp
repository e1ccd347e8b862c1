/* ======================================================================
 * BlueZ pairing: one attempt
 *
 *  Caller thread                                  BlueZ
 *  -------------                                  -----
 *  lock pairing mutex (process wide)
 *  AgentRegistration ─────────────────────────▶  AgentManager1.RegisterAgent(path, "KeyboardDisplay")
 *  sd_bus_add_filter(on_pair_reply)
 *  sd_bus_send(Device1.Pair) -> cookie
 *  PairReply.expect(cookie)
 *  loop:
 *    sd_bus_process ◀──────────────────────────  Agent1.RequestPasskey / RequestConfirmation / ...
 *      └─ PairingAgent reads the terminal, answers inline
 *    sd_bus_process ◀──────────────────────────  method return / error for the Pair cookie
 *      └─ on_pair_reply -> PairReply.offer() -> Resolved
 *    sd_bus_wait(250ms) until the reply resolved
 *    pair timeout idle ────────────────────────▶  Device1.CancelPairing
 *      └─ keep pumping CANCEL_GRACE_SECS for the canceled Pair reply
 *  unref filter slot, ~AgentRegistration ─────▶  AgentManager1.UnregisterAgent
 *
 *  The pair timeout restarts whenever a challenge was answered, so typing
 *  a passkey never counts against it. A pair timeout of 0 waits for BlueZ.
 * ====================================================================== */

#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>

// clang-format off
#include "agent/agent_registration.hpp"
#include "agent/pair_reply.hpp"
#include "agent/pairing_agent.hpp"
#include "backend/bluez_backend.hpp"
#include "backend/bluez_backend_impl.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"
// clang-format on

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

// agent registration is bus-wide state, one attempt at a time
std::mutex &pairing_mutex()
{
    static std::mutex mu;
    return mu;
}

// asks BlueZ to abort the Pair in flight; its reply then arrives as an error
void cancel_pairing_locked(sd_bus *bus, const std::string &path)
{
    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, constants::BLUEZ_SERVICE.data(), path.c_str(),
                               constants::DEVICE_IFACE.data(), "CancelPairing", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
        LOG_WARN("[PAIR] CancelPairing on %s failed: %s", path.c_str(),
                 err.message ? err.message : strerror(-r));
    sd_bus_error_free(&err);
}

// ======================================================================
// Function: on_pair_reply
// - In: every inbound message while the filter is installed
// - Out: 1 (consumed) for the correlated reply, 0 otherwise
// - Note: non-replies have no reply cookie and fall through
// ======================================================================
int on_pair_reply(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto    *reply = static_cast<agent::PairReply *>(userdata);
    uint64_t rc    = 0;
    if (sd_bus_message_get_reply_cookie(m, &rc) < 0)
        return 0;

    const char *ename = nullptr;
    if (sd_bus_message_is_method_error(m, nullptr))
    {
        const sd_bus_error *e = sd_bus_message_get_error(m);
        ename                 = e && e->name ? e->name : "org.freedesktop.DBus.Error.Failed";
    }
    return reply->offer(rc, ename) == agent::ReplyMatch::Resolved ? 1 : 0;
}

}  // namespace
#endif

namespace backend
{

// ======================================================================
// Function: BluezBackend::pair
// - In: device record
// - Out: true when paired, already paired, or BlueZ says AlreadyExists
// - Note: an already paired record never touches the bus
// ======================================================================
bool BluezBackend::pair(const Device &d)
{
    if (d.paired)
        return true;
#if !BLUELIST_HAVE_SDBUS
    LOG_ERROR("[BLUEZ] built without sd-bus");
    return false;
#else
    auto path = device_path(d);
    if (!path)
        return false;

    std::lock_guard<std::mutex> serial(pairing_mutex());
    return pair_with_agent(d, *path);
#endif
}

bool BluezBackend::pair_with_agent(const Device &d, const std::string &path)
{
#if !BLUELIST_HAVE_SDBUS
    (void)d;
    (void)path;
    return false;
#else
    using clock = std::chrono::steady_clock;
    const uint64_t WAIT_USEC = 250000;  // 250ms

    agent::PairingAgent                       ag(path, d.name, *impl_->prompt);
    agent::PairReply                          reply;
    std::unique_ptr<agent::AgentRegistration> reg;
    sd_bus_slot                              *filter_slot = nullptr;

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (!impl_->bus)
            return false;

        reg = std::make_unique<agent::AgentRegistration>(impl_->bus, ag);
        if (!reg->ok())
            LOG_WARN("[PAIR] no agent for %s, pairing without one", d.address.c_str());

        int r = sd_bus_add_filter(impl_->bus, &filter_slot, on_pair_reply, &reply);
        if (r < 0)
        {
            LOG_ERROR("[PAIR] installing reply filter failed: %s", strerror(-r));
            reg.reset();
            return false;
        }

        sd_bus_message *msg    = nullptr;
        uint64_t        cookie = 0;
        r = sd_bus_message_new_method_call(impl_->bus, &msg, constants::BLUEZ_SERVICE.data(),
                                           path.c_str(), constants::DEVICE_IFACE.data(), "Pair");
        if (r >= 0)
            r = sd_bus_send(impl_->bus, msg, &cookie);
        if (msg)
            sd_bus_message_unref(msg);
        if (r < 0)
        {
            LOG_ERROR("[PAIR] sending Pair to %s failed: %s", path.c_str(), strerror(-r));
            unref_slot(filter_slot);
            reg.reset();
            return false;
        }
        reply.expect(cookie);
        LOG_DEBUG("[PAIR] Pair sent to %s (cookie %llu)", path.c_str(),
                  (unsigned long long)cookie);
    }

    const auto idle      = impl_->pair_timeout;
    auto       deadline  = clock::now() + idle;
    bool       canceling = false;
    unsigned   seen      = 0;
    while (reply.pending())
    {
        {
            std::lock_guard<std::mutex> lk(impl_->bus_mu);
            int                         pr = 0;
            do
            {
                pr = sd_bus_process(impl_->bus, nullptr);
            } while (pr > 0 && reply.pending());
            if (pr < 0)
            {
                LOG_ERROR("[PAIR] sd_bus_process failed: %s", strerror(-pr));
                break;
            }
        }
        if (!reply.pending())
            break;

        if (ag.challenges() != seen)
        {
            seen = ag.challenges();
            if (!canceling)
                deadline = clock::now() + idle;
        }
        if ((canceling || idle.count() > 0) && clock::now() >= deadline)
        {
            if (canceling)
            {
                LOG_WARN("[PAIR] %s did not answer CancelPairing", d.address.c_str());
                break;
            }
            LOG_WARN("[PAIR] no reply from %s within %llds, canceling", d.address.c_str(),
                     (long long)idle.count());
            {
                std::lock_guard<std::mutex> lk(impl_->bus_mu);
                cancel_pairing_locked(impl_->bus, path);
            }
            canceling = true;
            deadline  = clock::now() + std::chrono::seconds(constants::CANCEL_GRACE_SECS);
            continue;
        }

        // do not hold the lock while waiting
        int wr = sd_bus_wait(impl_->bus, WAIT_USEC);
        if (wr < 0 && wr != -EINTR)
        {
            LOG_ERROR("[PAIR] sd_bus_wait failed: %s", strerror(-wr));
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        unref_slot(filter_slot);
        reg.reset();
    }

    if (ag.canceled())
        LOG_SYSTEM("[PAIR] BlueZ canceled the request for %s", d.address.c_str());
    return reply.result().value_or(false);
#endif
}

}  // namespace backend
