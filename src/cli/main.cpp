#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <unordered_map>
#include <vector>

#include "backend/bluetoothctl_backend.hpp"
#include "backend/bluez_backend.hpp"
#include "cli/options.hpp"
#include "directory/device_directory.hpp"
#include "term/terminal.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

// the only place a concrete backend is chosen
static std::shared_ptr<backend::IBackend> make_backend(const cli::Options &opts,
                                                       bool                interactive,
                                                       int                &fail_code)
{
    const std::string which = constants::backend_name();

    if (which == "bluez")
    {
        // bus calls carry their own reply timeout; -t only bounds the wait
        // for Pair, and without -t or BT_TIMEOUT BlueZ decides
        const std::chrono::seconds pair_wait{opts.timeout ? *opts.timeout
                                                          : constants::timeout_secs(0)};
        auto be = std::make_shared<backend::BluezBackend>();
        be->set_pair_timeout(pair_wait);
        be->set_interactive(interactive);
        be->set_adapter_filter(constants::adapter_name());
        if (!be->open())
        {
            std::fprintf(stderr, "error: cannot connect to BlueZ on the system bus\n");
            fail_code = exitc::no_backend;
            return nullptr;
        }
        return be;
    }
    if (which == "bluetoothctl")
    {
        const std::chrono::seconds action{
            opts.timeout ? *opts.timeout
                         : constants::timeout_secs(constants::DEFAULT_ACTION_SECS)};
        auto be = std::make_shared<backend::BluetoothctlBackend>();
        be->set_action_timeout(action);
        be->set_interactive(interactive);
        if (!constants::adapter_name().empty())
            LOG_WARN("BLUELIST_ADAPTER is ignored by the bluetoothctl backend");
        return be;
    }
    std::fprintf(stderr, "error: unknown backend '%s' (bluez or bluetoothctl)\n", which.c_str());
    fail_code = exitc::bad_args;
    return nullptr;
}

// exit code for a bulk action over `matched` records
static int tally(std::size_t succeeded, std::size_t matched)
{
    if (matched == 0)
        return exitc::no_match;
    return succeeded == matched ? exitc::ok : exitc::partial;
}

static int run_cmd(const cli::Options &opts, directory::DeviceDirectory &dir, backend::IBackend &be)
{
    if (opts.command == cli::Command::List && opts.scan_first)
    {
        const std::chrono::seconds window{
            opts.timeout ? *opts.timeout : constants::timeout_secs(constants::DEFAULT_SCAN_SECS)};
        if (!be.scan(window))
            LOG_WARN("scan failed, listing known devices only");
    }

    if (!dir.refresh())
    {
        std::fprintf(stderr, "error: cannot enumerate devices through %s\n", be.name().c_str());
        return exitc::no_backend;
    }

    auto selection = [&]() {
        return dir.filter_by(opts.filter, cli::match_mode(opts), cli::match_field(opts));
    };

    std::unordered_map<cli::Command, std::function<int()>> cmd_map = {
        {cli::Command::List,
         [&]() -> int {
             directory::PrintMode mode = directory::PrintMode::Columns;
             if (opts.long_format)
                 mode = directory::PrintMode::Long;
             else if (opts.one_per_line)
                 mode = directory::PrintMode::Linewise;
             dir.print(mode, std::cout, term::term_columns());
             return exitc::ok;
         }},
        {cli::Command::Connect,
         [&]() -> int {
             auto        sel = selection();
             std::size_t n   = sel.connect_all(std::cout);
             std::printf("Connected %zu devices.\n", n);
             return tally(n, sel.size());
         }},
        {cli::Command::Disconnect,
         [&]() -> int {
             auto        sel = selection();
             std::size_t n   = sel.disconnect_all(std::cout);
             std::printf("Disconnected %zu devices.\n", n);
             return tally(n, sel.size());
         }},
        {cli::Command::Info,
         [&]() -> int {
             auto sel = selection();
             if (sel.empty())
             {
                 std::fprintf(stderr, "No device matches '%s'.\n", opts.filter.c_str());
                 return exitc::no_match;
             }
             sel.print_info_all(std::cout);
             return exitc::ok;
         }},
        {cli::Command::Pair,
         [&]() -> int {
             auto        sel = selection();
             std::size_t n   = sel.pair_all(std::cout);
             std::printf("Paired %zu devices.\n", n);
             return tally(n, sel.size());
         }},
        {cli::Command::Unpair,
         [&]() -> int {
             auto        sel = selection();
             std::size_t n   = sel.unpair_all(std::cout);
             std::printf("Unpaired %zu devices.\n", n);
             return tally(n, sel.size());
         }},
    };

    LOG_DEBUG("Running command: %s", cli::command_name(opts.command));
    std::cout.flush();
    int rc = cmd_map.at(opts.command)();
    std::fflush(stdout);
    return rc;
}
}  // namespace

int main(int argc, char **argv)
{
    if (const char *lv = std::getenv("BLUELIST_LOG_LEVEL"); lv && *lv)
        bluelist::set_log_level_by_name(lv);

    if (argc < 2)
    {
        cli::print_usage(stderr);
        return exitc::bad_args;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    std::string              err;
    auto                     opts = cli::parse_args(args, err);
    if (!opts)
    {
        std::fprintf(stderr, "error: %s\n", err.c_str());
        cli::print_usage(stderr);
        return exitc::bad_args;
    }
    if (opts->help)
    {
        cli::print_usage(stdout);
        return exitc::ok;
    }

    const bool tty   = term::stdout_is_terminal();
    const bool color = opts->color == cli::ColorMode::Always ||
                       (opts->color == cli::ColorMode::Auto && tty);

    int  fail_code = exitc::no_backend;
    auto be        = make_backend(*opts, tty, fail_code);
    if (!be)
        return fail_code;

    directory::DeviceDirectory dir(be);
    dir.set_color(color);
    dir.set_quote_names(tty);
    return run_cmd(*opts, dir, *be);
}
