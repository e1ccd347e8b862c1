#pragma once
#include <string>

#include "agent/pairing_agent.hpp"

struct sd_bus;
struct sd_bus_slot;

namespace agent
{

// ======================================================================
// Class: AgentRegistration
// - Exports org.bluez.Agent1 for one PairingAgent and advertises it to
//   AgentManager1 as the default agent
// - If RegisterAgent is refused the exported object is removed again
//   before the constructor returns, ok() is then false
// - Destructor unregisters best-effort and removes the object
// - Caller holds the bus mutex for construction and destruction
// ======================================================================
class AgentRegistration
{
  public:
    AgentRegistration(sd_bus *bus, PairingAgent &agent);
    ~AgentRegistration();

    AgentRegistration(const AgentRegistration &)            = delete;
    AgentRegistration &operator=(const AgentRegistration &) = delete;

    bool               ok() const { return advertised_; }
    const std::string &path() const { return path_; }

  private:
    sd_bus      *bus_  = nullptr;
    sd_bus_slot *slot_ = nullptr;
    std::string  path_;
    bool         advertised_ = false;
};

}  // namespace agent
