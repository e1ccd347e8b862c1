#include <sys/ioctl.h>
#include <unistd.h>

#include <cstdlib>

#include "term/terminal.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace term
{

std::size_t term_columns()
{
    struct winsize ws{};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;

    if (const char *e = std::getenv("COLUMNS"); e && *e)
    {
        char         *end = nullptr;
        unsigned long v   = std::strtoul(e, &end, 10);
        if (end && *end == '\0' && v > 0)
            return static_cast<std::size_t>(v);
        LOG_DEBUG("ignoring COLUMNS='%s'", e);
    }
    return constants::FALLBACK_TERM_COLS;
}

bool stdout_is_terminal()
{
    return ::isatty(STDOUT_FILENO) == 1;
}

}  // namespace term
