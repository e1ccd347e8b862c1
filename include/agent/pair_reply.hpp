#pragma once
#include <cstdint>
#include <mutex>
#include <optional>

namespace agent
{

enum class ReplyMatch
{
    NoMatch,  // keep pumping
    Resolved  // the correlated reply; matcher may deregister
};

// ======================================================================
// Class: PairReply
// - Shared between the thread pumping the bus and the reply matcher
// - expect() arms it with the cookie of the Pair call just sent
// - offer() is fed every inbound reply; only the armed cookie resolves it
// ======================================================================
class PairReply
{
  public:
    void expect(std::uint64_t cookie);

    // error_name is nullptr for a method return
    ReplyMatch offer(std::uint64_t reply_cookie, const char *error_name);

    bool                pending() const;
    std::optional<bool> result() const;

  private:
    mutable std::mutex  mu_;
    std::uint64_t       cookie_  = 0;
    bool                pending_ = false;
    std::optional<bool> result_;
};

}  // namespace agent
