#include <cstdlib>
#include <unordered_map>

#include "cli/options.hpp"
#include "util/log.hpp"

namespace cli
{
namespace
{

static const std::unordered_map<std::string, Command> &command_table()
{
    static const std::unordered_map<std::string, Command> table = {
        {"list", Command::List},         {"ls", Command::List},
        {"connect", Command::Connect},   {"c", Command::Connect},
        {"disconnect", Command::Disconnect}, {"dc", Command::Disconnect},
        {"info", Command::Info},         {"i", Command::Info},
        {"pair", Command::Pair},         {"p", Command::Pair},
        {"unpair", Command::Unpair},     {"up", Command::Unpair},
    };
    return table;
}

static bool takes_timeout(Command c)
{
    return c == Command::List || c == Command::Connect || c == Command::Pair;
}

static bool parse_timeout(const std::string &v, std::optional<std::uint32_t> &out)
{
    if (v.empty())
        return false;
    char         *end = nullptr;
    unsigned long n   = std::strtoul(v.c_str(), &end, 10);
    if (!end || *end != '\0' || v[0] == '-' || n > 86400)
        return false;
    out = static_cast<std::uint32_t>(n);
    return true;
}

// one short flag; false when it is unknown for the command
static bool apply_short(char f, bool have_cmd, Options &o)
{
    switch (f)
    {
        case 'h':
            o.help = true;
            return true;
        case 'c':
            o.color = ColorMode::Always;
            return true;
        case 'C':
            o.color = ColorMode::Never;
            return true;
        default:
            break;
    }
    if (!have_cmd)
        return false;

    if (o.command == Command::List)
    {
        switch (f)
        {
            case 'l':
                o.long_format = true;
                return true;
            case '1':
                o.one_per_line = true;
                return true;
            case 'a':
                o.scan_first = true;
                return true;
            default:
                return false;
        }
    }
    switch (f)
    {
        case 'p':
            o.partial = true;
            return true;
        case 'P':
            o.partial = false;
            return true;
        case 'r':
            o.regex = true;
            return true;
        case 'R':
            o.regex = false;
            return true;
        case 'a':
            o.by_address = true;
            return true;
        default:
            return false;
    }
}

static bool apply_long(const std::string &name, bool have_cmd, Options &o)
{
    static const std::unordered_map<std::string, char> longs = {
        {"help", 'h'},     {"color", 'c'},     {"no-color", 'C'}, {"long", 'l'},
        {"linewise", '1'}, {"all", 'a'},       {"partial", 'p'},  {"no-partial", 'P'},
        {"regex", 'r'},    {"no-regex", 'R'},  {"address", 'a'},
    };
    auto it = longs.find(name);
    if (it == longs.end())
        return false;
    // -a is --all for list and --address everywhere else
    if (name == "all" && (!have_cmd || o.command != Command::List))
        return false;
    if (name == "address" && (!have_cmd || o.command == Command::List))
        return false;
    return apply_short(it->second, have_cmd, o);
}

}  // namespace

// ======================================================================
// Function: parse_args
// - In: arguments after the program name
// - Out: options, or nullopt with err describing the first problem
// - Note: global flags may appear before or after the command; short
//         flags may be bundled (-pr)
// ======================================================================
std::optional<Options> parse_args(const std::vector<std::string> &args, std::string &err)
{
    Options o;
    bool    have_cmd        = false;
    bool    have_filter     = false;
    bool    only_positional = false;

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string &a = args[i];

        if (!only_positional && a == "--")
        {
            only_positional = true;
            continue;
        }

        if (!only_positional && a.size() > 1 && a[0] == '-')
        {
            // timeout takes a value: -t N, --timeout N, --timeout=N
            std::string value;
            bool        is_timeout = false;
            if (a == "-t" || a == "--timeout")
            {
                is_timeout = true;
                if (i + 1 >= args.size())
                {
                    err = a + " needs a value";
                    return std::nullopt;
                }
                value = args[++i];
            }
            else if (a.rfind("--timeout=", 0) == 0)
            {
                is_timeout = true;
                value      = a.substr(10);
            }
            if (is_timeout)
            {
                if (!have_cmd || !takes_timeout(o.command))
                {
                    err = "--timeout is not valid here";
                    return std::nullopt;
                }
                if (!parse_timeout(value, o.timeout))
                {
                    err = "invalid timeout: " + value;
                    return std::nullopt;
                }
                continue;
            }

            if (a[1] == '-')
            {
                if (!apply_long(a.substr(2), have_cmd, o))
                {
                    err = "unknown option: " + a;
                    return std::nullopt;
                }
                continue;
            }
            for (std::size_t k = 1; k < a.size(); ++k)
            {
                if (!apply_short(a[k], have_cmd, o))
                {
                    err = std::string("unknown option: -") + a[k];
                    return std::nullopt;
                }
            }
            continue;
        }

        if (!have_cmd)
        {
            auto it = command_table().find(a);
            if (it == command_table().end())
            {
                err = "unknown command: " + a;
                return std::nullopt;
            }
            o.command = it->second;
            have_cmd  = true;
            continue;
        }
        if (o.command == Command::List || have_filter)
        {
            err = "unexpected argument: " + a;
            return std::nullopt;
        }
        o.filter    = a;
        have_filter = true;
    }

    if (o.help)
        return o;
    if (!have_cmd)
    {
        err = "no command given";
        return std::nullopt;
    }
    if (o.command != Command::List && !have_filter)
    {
        err = std::string(command_name(o.command)) + " needs a device filter";
        return std::nullopt;
    }
    if (o.timeout && o.command == Command::List && !o.scan_first)
        LOG_INFO("--timeout only applies to list with --all");
    return o;
}

directory::MatchMode match_mode(const Options &o)
{
    if (o.partial)
        return o.regex ? directory::MatchMode::ContainsRegex : directory::MatchMode::Contains;
    return o.regex ? directory::MatchMode::FullRegex : directory::MatchMode::Full;
}

directory::MatchField match_field(const Options &o)
{
    return o.by_address ? directory::MatchField::Address : directory::MatchField::Name;
}

const char *command_name(Command c)
{
    switch (c)
    {
        case Command::List:
            return "list";
        case Command::Connect:
            return "connect";
        case Command::Disconnect:
            return "disconnect";
        case Command::Info:
            return "info";
        case Command::Pair:
            return "pair";
        case Command::Unpair:
            return "unpair";
    }
    return "?";
}

void print_usage(std::FILE *to)
{
    std::fprintf(to, "Usage:\n"
                     "  bluelist [-c|-C] <command> [options] [filter]\n"
                     "\n"
                     "Commands:\n"
                     "  list, ls [-l] [-1] [-a [-t N]]   list known devices\n"
                     "  connect, c <filter> [-t N]       connect matching devices\n"
                     "  disconnect, dc <filter>          disconnect matching devices\n"
                     "  info, i <filter>                 show device details\n"
                     "  pair, p <filter> [-t N]          pair matching devices\n"
                     "  unpair, up <filter>              remove matching devices\n"
                     "\n"
                     "Filter options:\n"
                     "  -p, --partial     match part of the name   (-P, --no-partial)\n"
                     "  -r, --regex       filter is a regex        (-R, --no-regex)\n"
                     "  -a, --address     match the address instead of the name\n"
                     "\n"
                     "Global options:\n"
                     "  -c, --color       always use color   -C, --no-color   never\n"
                     "  -h, --help        this text\n"
                     "\n"
                     "Environment:\n"
                     "  BT_TIMEOUT, BLUELIST_BACKEND (bluez|bluetoothctl), BLUELIST_ADAPTER,\n"
                     "  BLUELIST_BLUETOOTHCTL, BLUELIST_LOG_LEVEL\n");
}

}  // namespace cli
