#include "agent/pair_reply.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace agent
{

void PairReply::expect(std::uint64_t cookie)
{
    std::lock_guard<std::mutex> lk(mu_);
    cookie_  = cookie;
    pending_ = true;
    result_.reset();
}

ReplyMatch PairReply::offer(std::uint64_t reply_cookie, const char *error_name)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!pending_ || reply_cookie != cookie_)
        return ReplyMatch::NoMatch;

    if (!error_name)
        result_ = true;
    else if (constants::ERR_ALREADY_EXIST == error_name)
    {
        LOG_INFO("[PAIR] device already paired, treating as success");
        result_ = true;
    }
    else
    {
        LOG_INFO("[PAIR] pairing failed: %s", error_name);
        result_ = false;
    }
    pending_ = false;
    return ReplyMatch::Resolved;
}

bool PairReply::pending() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return pending_;
}

std::optional<bool> PairReply::result() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return result_;
}

}  // namespace agent
