#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <iostream>

#include "agent/pairing_agent.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace agent
{
namespace
{

static std::string trim(const std::string &s)
{
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

static std::string six_digits(std::uint32_t v)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%06u", static_cast<unsigned>(v));
    return buf;
}

static AgentReply with_status(AgentStatus s)
{
    AgentReply r;
    r.status = s;
    return r;
}

}  // namespace

// ---------------- StreamPrompt ----------------
StreamPrompt::StreamPrompt() : in_(std::cin), out_(std::cout) {}

StreamPrompt::StreamPrompt(std::istream &in, std::ostream &out) : in_(in), out_(out) {}

void StreamPrompt::show(const std::string &line)
{
    out_ << line << '\n';
    out_.flush();
}

std::optional<std::string> StreamPrompt::read_line()
{
    std::string line;
    if (!std::getline(in_, line))
        return std::nullopt;
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

std::optional<char> StreamPrompt::read_char()
{
    char c = 0;
    while (in_.get(c))
    {
        if (c == '\r' || c == '\n')
            continue;
        std::string rest;
        std::getline(in_, rest);
        in_.clear();
        return c;
    }
    return std::nullopt;
}

// ---------------- PairingAgent ----------------
PairingAgent::PairingAgent(std::string device_path, std::string label, Prompt &prompt)
    : device_path_(std::move(device_path)), label_(std::move(label)), prompt_(prompt)
{
}

bool PairingAgent::matches(const std::string &path)
{
    if (path == device_path_)
    {
        ++challenges_;
        return true;
    }
    LOG_WARN("[AGENT] challenge for %s while pairing %s, rejecting", path.c_str(),
             device_path_.c_str());
    return false;
}

// ======================================================================
// Function: PairingAgent::request_pin_code
// - In: device path of the challenge
// - Out: Ok with 1..16 symbols, Canceled on empty input or end of input
// - Note: longer input re-prompts; the pin goes out exactly as typed,
//         spaces are valid pin symbols
// ======================================================================
AgentReply PairingAgent::request_pin_code(const std::string &path)
{
    if (!matches(path))
        return with_status(AgentStatus::Rejected);

    const std::string ask = "Please enter the pin code displayed on " + label_ +
                            ". (1-16 symbols, empty input to cancel)";
    while (true)
    {
        prompt_.show(ask);
        auto line = prompt_.read_line();
        if (!line)
        {
            LOG_INFO("[AGENT] end of input during pin request");
            return with_status(AgentStatus::Canceled);
        }
        std::string pin = *line;
        if (pin.empty())
        {
            prompt_.show("Empty input, canceling.");
            return with_status(AgentStatus::Canceled);
        }
        if (pin.size() > MAX_PIN_LEN)
            continue;

        AgentReply r;
        r.pin = std::move(pin);
        return r;
    }
}

AgentReply PairingAgent::display_pin_code(const std::string &path, const std::string &pin)
{
    if (!matches(path))
        return with_status(AgentStatus::Rejected);
    prompt_.show("The pincode for " + label_ + " is " + pin + ".");
    return with_status(AgentStatus::Ok);
}

// ======================================================================
// Function: PairingAgent::request_passkey
// - In: device path of the challenge
// - Out: Ok with 0..999999, Canceled on empty input or end of input
// - Note: non-numeric or out of range input re-prompts
// ======================================================================
AgentReply PairingAgent::request_passkey(const std::string &path)
{
    if (!matches(path))
        return with_status(AgentStatus::Rejected);

    const std::string ask = "Please enter the passkey displayed on " + label_ +
                            ". (6 digits, empty input to cancel)";
    while (true)
    {
        prompt_.show(ask);
        auto line = prompt_.read_line();
        if (!line)
        {
            LOG_INFO("[AGENT] end of input during passkey request");
            return with_status(AgentStatus::Canceled);
        }
        const std::string text = trim(*line);
        if (text.empty())
        {
            prompt_.show("Empty input, canceling.");
            return with_status(AgentStatus::Canceled);
        }

        bool digits = text.size() <= 7;
        for (char c : text)
            digits = digits && std::isdigit(static_cast<unsigned char>(c));
        if (!digits)
            continue;
        unsigned long v = std::strtoul(text.c_str(), nullptr, 10);
        if (v >= PASSKEY_LIMIT)
            continue;

        AgentReply r;
        r.passkey = static_cast<std::uint32_t>(v);
        return r;
    }
}

AgentReply PairingAgent::display_passkey(const std::string &path,
                                         std::uint32_t      passkey,
                                         std::uint16_t      entered)
{
    if (!matches(path))
        return with_status(AgentStatus::Rejected);
    LOG_DEBUG("[AGENT] passkey display, %u digits entered", static_cast<unsigned>(entered));
    prompt_.show("The pincode for " + label_ + " is " + six_digits(passkey) + ".");
    return with_status(AgentStatus::Ok);
}

// ======================================================================
// Function: PairingAgent::request_confirmation
// - In: device path, passkey shown on both sides
// - Out: 'y' Ok, 'n' Rejected, end of input Canceled
// - Note: any other character re-prompts
// ======================================================================
AgentReply PairingAgent::request_confirmation(const std::string &path, std::uint32_t passkey)
{
    if (!matches(path))
        return with_status(AgentStatus::Rejected);

    const std::string ask =
        "Does " + six_digits(passkey) + " match the pincode on " + label_ + "? [y/n]";
    while (true)
    {
        prompt_.show(ask);
        auto c = prompt_.read_char();
        if (!c)
            return with_status(AgentStatus::Canceled);
        if (*c == 'y')
            return with_status(AgentStatus::Ok);
        if (*c == 'n')
            return with_status(AgentStatus::Rejected);
    }
}

AgentReply PairingAgent::request_authorization(const std::string &path)
{
    if (!matches(path))
        return with_status(AgentStatus::Rejected);
    return with_status(AgentStatus::Ok);
}

AgentReply PairingAgent::authorize_service(const std::string &path, const std::string &uuid)
{
    if (!matches(path))
        return with_status(AgentStatus::Rejected);
    LOG_DEBUG("[AGENT] authorizing service %s", uuid.c_str());
    return with_status(AgentStatus::Ok);
}

void PairingAgent::release()
{
    LOG_DEBUG("[AGENT] released");
}

void PairingAgent::cancel()
{
    canceled_ = true;
    LOG_INFO("[AGENT] request for %s canceled by BlueZ", device_path_.c_str());
}

const char *status_error_name(AgentStatus s)
{
    switch (s)
    {
        case AgentStatus::Ok:
            return nullptr;
        case AgentStatus::Rejected:
            return constants::ERR_REJECTED.data();
        case AgentStatus::Canceled:
            return constants::ERR_CANCELED.data();
    }
    return nullptr;
}

}  // namespace agent
