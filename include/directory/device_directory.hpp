#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <unordered_set>
#include <vector>

#include "backend/ibackend.hpp"
#include "directory/device.hpp"

namespace directory
{

enum class MatchMode
{
    Full,          // whole string equal
    Contains,      // substring
    FullRegex,     // regex matches the whole string
    ContainsRegex  // regex matches somewhere
};

enum class MatchField
{
    Name,
    Address
};

enum class PrintMode
{
    Columns,   // as many names per row as fit (ls -x)
    Linewise,  // one name per line (ls -1)
    Long       // "address name" per line (ls -l)
};

using Predicate = std::function<bool(const Device &)>;

// ======================================================================
// Class: DeviceDirectory
// - Shared device records from one backend snapshot
// - Filtered directories are views: they hold the same records, a write
//   through one is seen by all
// - Bulk actions run one thread per record and lock only that record,
//   never across the backend call
// ======================================================================
class DeviceDirectory
{
  public:
    explicit DeviceDirectory(std::shared_ptr<backend::IBackend> backend);

    // replace the contents with a fresh backend snapshot; false on transport failure
    bool refresh();

    // append one record; false (and not added) when the record is invalid
    // or its address is already present (compared case-insensitively)
    bool add(Device d);

    DeviceDirectory filter(const Predicate &pred) const;
    // invalid regex gives an empty directory
    DeviceDirectory filter_by(const std::string &pattern, MatchMode mode, MatchField field) const;

    // each returns the number of records the action succeeded for
    std::size_t pair_all(std::ostream &out);
    std::size_t unpair_all(std::ostream &out);
    std::size_t connect_all(std::ostream &out);
    std::size_t disconnect_all(std::ostream &out);

    void print(PrintMode mode, std::ostream &out, std::size_t width);
    void print_info_all(std::ostream &out);

    void set_quote_names(bool on) { quote_names_ = on; }
    void set_color(bool on) { color_ = on; }

    std::size_t                      size() const { return records_.size(); }
    bool                             empty() const { return records_.empty(); }
    const std::vector<DeviceHandle> &records() const { return records_; }
    const std::vector<std::string>  &adapters() const { return adapters_; }
    std::vector<Device>              devices() const;  // copies, in order

    bool        any_whitespace() const { return any_whitespace_; }
    std::size_t min_name_width() const { return min_width_; }
    std::size_t max_name_width() const { return max_width_; }
    // quoting requested and some name needs it
    bool quoting() const { return quote_names_ && any_whitespace_; }

  private:
    enum class Action
    {
        Pair,
        Unpair,
        Connect,
        Disconnect
    };

    DeviceDirectory empty_view() const;
    void            add_handle(DeviceHandle h, const Device &d);
    std::size_t     run_all(Action act, std::ostream &out);
    bool            run_one(Action act, const DeviceHandle &h,
                            const std::function<void(const std::string &)> &say);
    void            refresh_details();
    std::string     display_name(const Device &d) const;

    std::shared_ptr<backend::IBackend> backend_;
    std::vector<DeviceHandle>          records_;
    std::vector<std::string>           adapters_;
    std::unordered_set<std::string>    addresses_;  // upper case

    bool        any_whitespace_ = false;
    std::size_t min_width_      = 0;
    std::size_t max_width_      = 0;

    bool quote_names_ = true;
    bool color_       = false;
};

}  // namespace directory
