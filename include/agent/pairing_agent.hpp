#pragma once
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

namespace agent
{

// Where challenge text goes and answers come from (the controlling terminal)
struct Prompt
{
    virtual void show(const std::string &line) = 0;
    // nullopt at end of input
    virtual std::optional<std::string> read_line() = 0;
    // first character that is not a line break; the rest of that line is dropped
    virtual std::optional<char> read_char() = 0;
    virtual ~Prompt() = default;
};

class StreamPrompt final : public Prompt
{
  public:
    StreamPrompt();  // stdin / stdout
    StreamPrompt(std::istream &in, std::ostream &out);

    void                       show(const std::string &line) override;
    std::optional<std::string> read_line() override;
    std::optional<char>        read_char() override;

  private:
    std::istream &in_;
    std::ostream &out_;
};

enum class AgentStatus
{
    Ok,
    Rejected,  // org.bluez.Error.Rejected
    Canceled   // org.bluez.Error.Canceled
};

struct AgentReply
{
    AgentStatus   status = AgentStatus::Ok;
    std::string   pin;          // RequestPinCode
    std::uint32_t passkey = 0;  // RequestPasskey
};

inline constexpr std::size_t   MAX_PIN_LEN = 16;
inline constexpr std::uint32_t PASSKEY_LIMIT = 1000000;  // six digits

// ======================================================================
// Class: PairingAgent
// - Bound to one device object path for one pairing attempt
// - Every challenge checks the path first; a mismatch is Rejected and
//   nothing is printed or read
// - Runs on the thread that dispatches bus messages, blocking on input
// ======================================================================
class PairingAgent
{
  public:
    PairingAgent(std::string device_path, std::string label, Prompt &prompt);

    const std::string &device_path() const { return device_path_; }

    AgentReply request_pin_code(const std::string &path);
    AgentReply display_pin_code(const std::string &path, const std::string &pin);
    AgentReply request_passkey(const std::string &path);
    AgentReply display_passkey(const std::string &path, std::uint32_t passkey, std::uint16_t entered);
    AgentReply request_confirmation(const std::string &path, std::uint32_t passkey);
    AgentReply request_authorization(const std::string &path);
    AgentReply authorize_service(const std::string &path, const std::string &uuid);
    void       release();
    void       cancel();

    // bus-side Cancel arrived during this attempt
    bool canceled() const { return canceled_; }

    // challenges answered for the bound device so far
    unsigned challenges() const { return challenges_; }

  private:
    bool matches(const std::string &path);

    std::string device_path_;
    std::string label_;
    Prompt     &prompt_;
    bool        canceled_   = false;
    unsigned    challenges_ = 0;
};

const char *status_error_name(AgentStatus s);

}  // namespace agent
