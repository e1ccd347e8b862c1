#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "backend/ibackend.hpp"

namespace backend
{

struct CommandResult
{
    int         status = -1;  // exit status, -1 when the tool could not run
    std::string output;       // stdout and stderr, interleaved
};

// argv after the program name, e.g. {"info", "AA:BB:CC:DD:EE:FF"}
using CommandRunner = std::function<CommandResult(const std::vector<std::string> &args)>;

// fork/exec `program` with args, collecting both output streams
CommandResult run_command(const std::string &program, const std::vector<std::string> &args);

// ======================================================================
// Class: BluetoothctlBackend
// - Drives the bluetoothctl text tool, one child process per call
// - Success is decided by known phrases in the output; output without a
//   known phrase is a failed action, never a parse error
// ======================================================================
class BluetoothctlBackend final : public IBackend
{
  public:
    // default runner executes constants::bluetoothctl_path()
    BluetoothctlBackend();
    explicit BluetoothctlBackend(CommandRunner runner);

    bool refresh_snapshot(Snapshot &out) override;
    bool scan(std::chrono::seconds window) override;
    bool set_pairable(bool on) override;
    bool pair(const Device &d) override;
    bool unpair(const Device &d) override;
    bool connect(const Device &d) override;
    bool disconnect(const Device &d) override;
    bool info(Device &d) override;

    std::string name() const override { return "bluetoothctl"; }

    void set_action_timeout(std::chrono::seconds t) { action_timeout_ = t; }
    void set_interactive(bool on) { interactive_ = on; }

  private:
    CommandResult run(const std::vector<std::string> &args) const;

    CommandRunner        runner_;
    std::chrono::seconds action_timeout_;
    bool                 interactive_ = false;
};

// "Device <addr> <name>" lines of `bluetoothctl devices`
std::vector<Device> parse_devices(const std::string &output);

// `bluetoothctl info <addr>` into d; false when a required field is missing
bool parse_info(const std::string &output, Device &d);

// "Controller <addr> ..." lines of `bluetoothctl list`
std::vector<std::string> parse_controllers(const std::string &output);

}  // namespace backend
