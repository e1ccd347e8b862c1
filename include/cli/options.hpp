#pragma once
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include "directory/device_directory.hpp"

namespace cli
{

enum class Command
{
    List,
    Connect,
    Disconnect,
    Info,
    Pair,
    Unpair
};

enum class ColorMode
{
    Auto,  // color and quoting when stdout is a terminal
    Always,
    Never
};

struct Options
{
    Command   command = Command::List;
    ColorMode color   = ColorMode::Auto;
    bool      help    = false;

    // list
    bool long_format  = false;  // -l
    bool one_per_line = false;  // -1
    bool scan_first   = false;  // -a, scan for nearby devices before listing

    // filter commands
    std::string filter;
    bool        partial    = false;  // -p / -P
    bool        regex      = false;  // -r / -R
    bool        by_address = false;  // -a

    std::optional<std::uint32_t> timeout;  // -t, overrides BT_TIMEOUT
};

// args excludes argv[0]; on failure returns nullopt and fills err
std::optional<Options> parse_args(const std::vector<std::string> &args, std::string &err);

directory::MatchMode  match_mode(const Options &o);
directory::MatchField match_field(const Options &o);

// "list", "connect", ...
const char *command_name(Command c);

void print_usage(std::FILE *to);

}  // namespace cli
