#include <algorithm>
#include <atomic>
#include <cctype>
#include <exception>
#include <mutex>
#include <regex>
#include <system_error>
#include <thread>
#include <utility>

#include "directory/device_directory.hpp"
#include "term/column_layout.hpp"
#include "util/log.hpp"

namespace directory
{
namespace
{

struct ActionText
{
    const char *attempt;  // "Attempting to pair with "
    const char *done;     // " paired."
    const char *failed;   // "Could not pair "
};

static std::string upper(std::string s)
{
    for (auto &c : s)
        c = (char)std::toupper((unsigned char)c);
    return s;
}

}  // namespace

DeviceDirectory::DeviceDirectory(std::shared_ptr<backend::IBackend> backend)
    : backend_(std::move(backend))
{
}

DeviceDirectory DeviceDirectory::empty_view() const
{
    DeviceDirectory out(backend_);
    out.adapters_    = adapters_;
    out.quote_names_ = quote_names_;
    out.color_       = color_;
    return out;
}

void DeviceDirectory::add_handle(DeviceHandle h, const Device &d)
{
    const std::size_t w = name_width(d.name);
    if (records_.empty())
    {
        min_width_ = w;
        max_width_ = w;
    }
    else
    {
        min_width_ = std::min(min_width_, w);
        max_width_ = std::max(max_width_, w);
    }
    any_whitespace_ = any_whitespace_ || has_whitespace(d.name);
    addresses_.insert(upper(d.address));
    records_.push_back(std::move(h));
}

bool DeviceDirectory::add(Device d)
{
    if (!valid_device(d))
    {
        LOG_WARN("rejecting device '%s': invalid address or name over %zu chars",
                 d.address.c_str(), name_width(d.name));
        return false;
    }
    if (addresses_.count(upper(d.address)))
    {
        LOG_WARN("rejecting device '%s': address already in the directory", d.address.c_str());
        return false;
    }
    Device copy = d;
    add_handle(make_handle(std::move(d)), copy);
    return true;
}

// ======================================================================
// Function: DeviceDirectory::refresh
// - In: none
// - Out: false when the backend is unreachable, contents untouched then
// - Note: builds the new record set aside and swaps it in
// ======================================================================
bool DeviceDirectory::refresh()
{
    if (!backend_)
        return false;
    backend::Snapshot snap;
    if (!backend_->refresh_snapshot(snap))
    {
        LOG_ERROR("%s backend could not enumerate devices", backend_->name().c_str());
        return false;
    }

    DeviceDirectory fresh = DeviceDirectory(backend_);
    for (auto &d : snap.devices)
        fresh.add(std::move(d));

    records_        = std::move(fresh.records_);
    addresses_      = std::move(fresh.addresses_);
    adapters_       = std::move(snap.adapters);
    any_whitespace_ = fresh.any_whitespace_;
    min_width_      = fresh.min_width_;
    max_width_      = fresh.max_width_;
    LOG_INFO("%zu devices, %zu adapters", records_.size(), adapters_.size());
    return true;
}

std::vector<Device> DeviceDirectory::devices() const
{
    std::vector<Device> out;
    out.reserve(records_.size());
    for (const auto &h : records_)
    {
        std::lock_guard<std::mutex> lk(h->mu);
        out.push_back(h->dev);
    }
    return out;
}

DeviceDirectory DeviceDirectory::filter(const Predicate &pred) const
{
    DeviceDirectory out = empty_view();
    for (const auto &h : records_)
    {
        std::unique_lock<std::mutex> lk(h->mu);
        if (!pred(h->dev))
            continue;
        const Device snapshot = h->dev;
        lk.unlock();
        out.add_handle(h, snapshot);
    }
    return out;
}

// ======================================================================
// Function: DeviceDirectory::filter_by
// - In: pattern, how to match it, which field to match it against
// - Out: view of the matching records
// - Note: plain address matching ignores case; a malformed regex yields
//         an empty view
// ======================================================================
DeviceDirectory DeviceDirectory::filter_by(const std::string &pattern,
                                           MatchMode          mode,
                                           MatchField         field) const
{
    const bool by_addr = field == MatchField::Address;
    auto       subject = [by_addr](const Device &d) -> const std::string & {
        return by_addr ? d.address : d.name;
    };

    switch (mode)
    {
        case MatchMode::Full:
        {
            const std::string want = by_addr ? upper(pattern) : pattern;
            return filter([&](const Device &d) {
                return (by_addr ? upper(d.address) : d.name) == want;
            });
        }
        case MatchMode::Contains:
        {
            const std::string want = by_addr ? upper(pattern) : pattern;
            return filter([&](const Device &d) {
                return (by_addr ? upper(d.address) : d.name).find(want) != std::string::npos;
            });
        }
        case MatchMode::FullRegex:
        case MatchMode::ContainsRegex:
            break;
    }

    std::regex re;
    try
    {
        re = std::regex(pattern, std::regex::ECMAScript);
    }
    catch (const std::regex_error &e)
    {
        LOG_WARN("invalid regex '%s': %s", pattern.c_str(), e.what());
        return empty_view();
    }
    if (mode == MatchMode::FullRegex)
        return filter([&](const Device &d) { return std::regex_match(subject(d), re); });
    return filter([&](const Device &d) { return std::regex_search(subject(d), re); });
}

std::size_t DeviceDirectory::pair_all(std::ostream &out)
{
    // nothing selected, leave the adapter's pairable state alone
    if (records_.empty())
        return 0;
    if (!backend_->set_pairable(true))
        LOG_INFO("could not make the host pairable, trying anyway");
    std::size_t n = run_all(Action::Pair, out);
    if (!backend_->set_pairable(false))
        LOG_INFO("could not turn pairable off again");
    return n;
}

std::size_t DeviceDirectory::unpair_all(std::ostream &out)
{
    return run_all(Action::Unpair, out);
}

std::size_t DeviceDirectory::connect_all(std::ostream &out)
{
    return run_all(Action::Connect, out);
}

std::size_t DeviceDirectory::disconnect_all(std::ostream &out)
{
    return run_all(Action::Disconnect, out);
}

// ======================================================================
// Function: DeviceDirectory::run_all
// - In: action, stream for per-device status lines
// - Out: number of records the action succeeded for
// - Note: one thread per record; a thread that cannot be started counts
//         as a failure for its record
// ======================================================================
std::size_t DeviceDirectory::run_all(Action act, std::ostream &out)
{
    std::atomic<std::size_t> ok{0};
    std::mutex               out_mu;
    auto say = [&out, &out_mu](const std::string &line) {
        std::lock_guard<std::mutex> lk(out_mu);
        out << line << '\n';
        out.flush();
    };

    std::vector<std::thread> workers;
    workers.reserve(records_.size());
    for (const auto &h : records_)
    {
        try
        {
            workers.emplace_back([this, act, h, &ok, &say] {
                if (run_one(act, h, say))
                    ok.fetch_add(1, std::memory_order_relaxed);
            });
        }
        catch (const std::system_error &e)
        {
            LOG_ERROR("could not start worker: %s", e.what());
        }
    }
    for (auto &t : workers)
        t.join();
    return ok.load();
}

bool DeviceDirectory::run_one(Action                                          act,
                              const DeviceHandle                             &h,
                              const std::function<void(const std::string &)> &say)
{
    static const ActionText texts[] = {
        {"Attempting to pair with ", " paired.", "Could not pair "},
        {"Attempting to remove ", " unpaired.", "Could not unpair "},
        {"Attempting to connect with ", " connected.", "Could not connect "},
        {"Attempting to disconnect from ", " disconnected.", "Could not disconnect "},
    };
    const ActionText &txt = texts[static_cast<int>(act)];

    Device copy;
    {
        std::lock_guard<std::mutex> lk(h->mu);
        copy = h->dev;
    }
    const std::string label = colored_name(copy, color_);
    say(txt.attempt + label + "...");

    bool ok = false;
    try
    {
        switch (act)
        {
            case Action::Pair:
                ok = backend_->pair(copy);
                break;
            case Action::Unpair:
                ok = backend_->unpair(copy);
                break;
            case Action::Connect:
                ok = backend_->connect(copy);
                break;
            case Action::Disconnect:
                ok = backend_->disconnect(copy);
                break;
        }
    }
    catch (const std::exception &e)
    {
        LOG_ERROR("%s: %s", copy.address.c_str(), e.what());
        ok = false;
    }

    if (ok)
    {
        std::lock_guard<std::mutex> lk(h->mu);
        switch (act)
        {
            case Action::Pair:
                h->dev.paired = true;
                break;
            case Action::Unpair:
                h->dev.paired    = false;
                h->dev.connected = false;
                break;
            case Action::Connect:
                h->dev.connected = true;
                break;
            case Action::Disconnect:
                h->dev.connected = false;
                break;
        }
    }
    say(ok ? label + txt.done : txt.failed + label + ".");
    return ok;
}

// re-read every record from the backend, lock released during the call
void DeviceDirectory::refresh_details()
{
    for (const auto &h : records_)
    {
        Device copy;
        {
            std::lock_guard<std::mutex> lk(h->mu);
            copy = h->dev;
        }
        if (!backend_->info(copy))
        {
            LOG_DEBUG("no fresh info for %s, showing last known state", copy.address.c_str());
            continue;
        }
        std::lock_guard<std::mutex> lk(h->mu);
        h->dev = std::move(copy);
    }
}

std::string DeviceDirectory::display_name(const Device &d) const
{
    return quoting() ? quoted_name(d, color_) : colored_name(d, color_);
}

// ======================================================================
// Function: DeviceDirectory::print
// - In: mode, output stream, line width for Columns
// - Out: one name per line, "address name" per line, or a grid
// - Note: detail is re-read from the backend first
// ======================================================================
void DeviceDirectory::print(PrintMode mode, std::ostream &out, std::size_t width)
{
    refresh_details();
    const std::vector<Device> devs = devices();

    if (mode == PrintMode::Linewise)
    {
        for (const auto &d : devs)
            out << display_name(d) << '\n';
        return;
    }
    if (mode == PrintMode::Long)
    {
        for (const auto &d : devs)
            out << d.address << ' ' << display_name(d) << '\n';
        return;
    }

    std::vector<std::string> cells;
    std::vector<std::size_t> widths;
    cells.reserve(devs.size());
    widths.reserve(devs.size());
    for (const auto &d : devs)
    {
        cells.push_back(display_name(d));
        widths.push_back(name_width(d.name));
    }
    const std::size_t extra  = term::COLUMN_GAP + (quoting() ? 2 : 0);
    const auto        layout = term::layout_columns(widths, width, extra);
    term::render_columns(out, cells, widths, layout);
}

void DeviceDirectory::print_info_all(std::ostream &out)
{
    refresh_details();
    for (const auto &d : devices())
        out << info_block(d, color_) << '\n';
}

}  // namespace directory
