#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

#include "backend/bluetoothctl_backend.hpp"
#include "term/ansi.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace backend
{
namespace
{

static std::string trim_start(const std::string &s)
{
    std::size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t'))
        ++i;
    return s.substr(i);
}

static bool starts_with(const std::string &s, const char *prefix)
{
    return s.rfind(prefix, 0) == 0;
}

static bool contains(const std::string &s, const std::string &needle)
{
    return s.find(needle) != std::string::npos;
}

static std::vector<std::string> split_lines(const std::string &out)
{
    std::vector<std::string> lines;
    std::istringstream       in(out);
    std::string              line;
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(std::move(line));
    }
    return lines;
}

// "Battery Percentage: 0x64 (100)" -> 100
static std::optional<std::uint8_t> battery_value(const std::string &line)
{
    auto open  = line.find('(');
    auto close = line.find(')', open == std::string::npos ? 0 : open);
    if (open == std::string::npos || close == std::string::npos || close <= open + 1)
        return std::nullopt;
    const std::string num = line.substr(open + 1, close - open - 1);
    char             *end = nullptr;
    unsigned long     v   = std::strtoul(num.c_str(), &end, 10);
    if (!end || *end != '\0' || v > 100)
        return std::nullopt;
    return static_cast<std::uint8_t>(v);
}

static std::string timeout_arg(std::chrono::seconds t)
{
    return std::to_string(t.count());
}

}  // namespace

// ======================================================================
// Function: run_command
// - In: program (searched in PATH) and its arguments
// - Out: exit status and combined stdout/stderr
// - Note: status -1 when the child could not be started
// ======================================================================
CommandResult run_command(const std::string &program, const std::vector<std::string> &args)
{
    CommandResult res;
    int           fds[2];
    // close-on-exec: children forked by other worker threads must not
    // inherit this pipe, or our read below waits for them too
    if (::pipe2(fds, O_CLOEXEC) == -1)
    {
        LOG_ERROR("pipe2() failed: %s", std::strerror(errno));
        return res;
    }

    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(program.c_str()));
    for (const auto &a : args)
        argv.push_back(const_cast<char *>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid == -1)
    {
        LOG_ERROR("fork() failed: %s", std::strerror(errno));
        ::close(fds[0]);
        ::close(fds[1]);
        return res;
    }
    if (pid == 0)
    {
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        ::close(fds[0]);
        ::close(fds[1]);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull != -1)
            ::dup2(devnull, STDIN_FILENO);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(fds[1]);
    char buf[4096];
    while (1)
    {
        ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if (n > 0)
        {
            res.output.append(buf, static_cast<std::size_t>(n));
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        if (n == -1)
            LOG_WARN("read() from %s failed: %s", program.c_str(), std::strerror(errno));
        break;
    }
    ::close(fds[0]);

    int wstatus = 0;
    while (::waitpid(pid, &wstatus, 0) == -1)
    {
        if (errno != EINTR)
        {
            LOG_ERROR("waitpid() failed: %s", std::strerror(errno));
            return res;
        }
    }
    if (WIFEXITED(wstatus))
    {
        res.status = WEXITSTATUS(wstatus);
        if (res.status == 127 && res.output.empty())
        {
            LOG_ERROR("could not execute %s", program.c_str());
            res.status = -1;
        }
    }
    else
        LOG_WARN("%s terminated by signal", program.c_str());
    return res;
}

std::vector<Device> parse_devices(const std::string &output)
{
    std::vector<Device> out;
    for (const auto &raw : split_lines(output))
    {
        const std::string line = trim_start(raw);
        if (!starts_with(line, "Device "))
            continue;
        const auto sp = line.find(' ', 7);
        Device     d;
        d.address = line.substr(7, sp == std::string::npos ? std::string::npos : sp - 7);
        d.name    = sp == std::string::npos ? std::string{} : line.substr(sp + 1);
        if (d.address.empty())
            continue;
        out.push_back(std::move(d));
    }
    return out;
}

// ======================================================================
// Function: parse_info
// - In: output of `bluetoothctl info <addr>`
// - Out: fields stored into d when Alias and all five flags are present
// - Note: d is left untouched when a required field is missing
// ======================================================================
bool parse_info(const std::string &output, Device &d)
{
    Device   fresh = d;
    bool     alias = false;
    unsigned seen  = 0;  // one bit per flag

    struct Flag
    {
        const char *prefix;
        bool       *field;
    };
    const Flag flags[] = {{"Paired: ", &fresh.paired},   {"Bonded: ", &fresh.bonded},
                          {"Trusted: ", &fresh.trusted}, {"Blocked: ", &fresh.blocked},
                          {"Connected: ", &fresh.connected}};

    for (const auto &raw : split_lines(output))
    {
        const std::string line = trim_start(raw);
        if (starts_with(line, "Alias: "))
        {
            fresh.name = line.substr(7);
            alias      = true;
        }
        else if (starts_with(line, "Name: "))
            fresh.remote_name = line.substr(6);
        else if (starts_with(line, "Icon: "))
            fresh.icon = line.substr(6);
        else if (starts_with(line, "Battery Percentage: "))
            fresh.battery = battery_value(line);
        else
        {
            for (unsigned i = 0; i < 5; ++i)
            {
                if (starts_with(line, flags[i].prefix))
                {
                    *flags[i].field = contains(line, "yes");
                    seen |= 1u << i;
                    break;
                }
            }
        }
    }
    if (!alias || seen != 0x1Fu)
        return false;
    d = std::move(fresh);
    return true;
}

std::vector<std::string> parse_controllers(const std::string &output)
{
    std::vector<std::string> out;
    for (const auto &raw : split_lines(output))
    {
        const std::string line = trim_start(raw);
        if (!starts_with(line, "Controller "))
            continue;
        const auto sp = line.find(' ', 11);
        out.push_back(line.substr(11, sp == std::string::npos ? std::string::npos : sp - 11));
    }
    return out;
}

// ---------------- BluetoothctlBackend ----------------
BluetoothctlBackend::BluetoothctlBackend()
    : BluetoothctlBackend([](const std::vector<std::string> &args) {
          return run_command(constants::bluetoothctl_path(), args);
      })
{
}

BluetoothctlBackend::BluetoothctlBackend(CommandRunner runner)
    : runner_(std::move(runner)), action_timeout_(constants::DEFAULT_ACTION_SECS)
{
}

CommandResult BluetoothctlBackend::run(const std::vector<std::string> &args) const
{
    CommandResult res = runner_(args);
    LOG_DEBUG("[CTL] %s%s -> %d", args.empty() ? "" : args.front().c_str(),
              args.size() > 1 ? " ..." : "", res.status);
    return res;
}

// ======================================================================
// Function: BluetoothctlBackend::refresh_snapshot
// - In: none
// - Out: `devices` listing, each completed by `info`, plus controllers
// - Note: false only when `devices` itself cannot run
// ======================================================================
bool BluetoothctlBackend::refresh_snapshot(Snapshot &out)
{
    CommandResult listing = run({"devices"});
    if (listing.status != 0)
    {
        LOG_ERROR("[CTL] `devices` failed (status %d)", listing.status);
        return false;
    }

    Snapshot snap;
    for (auto &d : parse_devices(listing.output))
    {
        CommandResult detail = run({"info", d.address});
        if (detail.status != 0 || !parse_info(detail.output, d))
        {
            LOG_WARN("[CTL] skipping %s: incomplete info", d.address.c_str());
            continue;
        }
        if (!directory::valid_device(d))
        {
            LOG_WARN("[CTL] skipping %s: name longer than %zu", d.address.c_str(),
                     constants::MAX_NAME_LEN);
            continue;
        }
        snap.devices.push_back(std::move(d));
    }

    CommandResult ctl = run({"list"});
    if (ctl.status == 0)
        snap.adapters = parse_controllers(ctl.output);
    else
        LOG_WARN("[CTL] `list` failed (status %d)", ctl.status);

    out = std::move(snap);
    return true;
}

bool BluetoothctlBackend::scan(std::chrono::seconds window)
{
    if (interactive_)
        std::cout << ansi::DIM << "Scanning for devices..." << ansi::RESET << std::flush;
    CommandResult res = run({"--timeout", timeout_arg(window), "scan", "on"});
    if (interactive_)
        std::cout << ansi::CLEAR_LINE << std::flush;
    return res.status == 0;
}

bool BluetoothctlBackend::set_pairable(bool on)
{
    CommandResult res = run({"pairable", on ? "on" : "off"});
    return contains(res.output, "succeeded");
}

bool BluetoothctlBackend::pair(const Device &d)
{
    if (d.paired)
        return true;
    CommandResult res = run({"--timeout", timeout_arg(action_timeout_), "pair", d.address});
    return contains(res.output, "Pairing successful") ||
           contains(res.output, std::string(constants::ERR_ALREADY_EXIST));
}

bool BluetoothctlBackend::unpair(const Device &d)
{
    CommandResult res = run({"remove", d.address});
    return contains(res.output, "Device has been removed");
}

bool BluetoothctlBackend::connect(const Device &d)
{
    if (d.connected)
        return true;
    CommandResult res = run({"--timeout", timeout_arg(action_timeout_), "connect", d.address});
    return contains(res.output, "Connection successful");
}

bool BluetoothctlBackend::disconnect(const Device &d)
{
    CommandResult res = run({"disconnect", d.address});
    return contains(res.output, "Successful disconnected") ||
           contains(res.output, "Device " + d.address + " Connected: no");
}

bool BluetoothctlBackend::info(Device &d)
{
    CommandResult res = run({"info", d.address});
    if (res.status != 0)
        return false;
    Device fresh = d;
    if (!parse_info(res.output, fresh) || !directory::valid_device(fresh))
        return false;
    d = std::move(fresh);
    return true;
}

}  // namespace backend
