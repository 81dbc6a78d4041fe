#pragma once
#include <atomic>
#include <optional>
#include <string>

#include "transport/itransport.hpp"

namespace app
{

// Finds the band: scans, matches advertised names by substring and reports the
// first match's address. Driven from the link actor thread.
class DeviceLocator
{
  public:
    DeviceLocator(transport::ITransport &t, std::string name_filter);

    bool start();
    void cancel();

    // Feed one scan result. Returns the address on the first match of this scan
    // (scanning is stopped), nullopt otherwise.
    std::optional<std::string> offer(const std::string &address, const std::string &adv_name);

    bool               scanning() const { return scanning_.load(); }
    const std::string &name_filter() const { return filter_; }
    const std::string &last_match() const { return last_match_; }

    static bool name_matches(const std::string &adv_name, const std::string &filter);

  private:
    transport::ITransport &tx_;
    std::string            filter_;
    std::string            last_match_;
    std::atomic_bool       scanning_{false};
};

}  // namespace app
