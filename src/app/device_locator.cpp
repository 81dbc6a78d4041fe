#include <optional>
#include <string>
#include <utility>

#include "app/device_locator.hpp"
#include "util/log.hpp"

namespace app
{

DeviceLocator::DeviceLocator(transport::ITransport &t, std::string name_filter)
    : tx_(t), filter_(std::move(name_filter))
{
}

bool DeviceLocator::name_matches(const std::string &adv_name, const std::string &filter)
{
    // unnamed advertisers never match, even with an empty filter
    if (adv_name.empty())
        return false;
    return adv_name.find(filter) != std::string::npos;
}

bool DeviceLocator::start()
{
    if (scanning_.load())
        return true;
    // set before start_scan(): a transport may report cached results synchronously
    scanning_.store(true);
    if (!tx_.start_scan())
    {
        scanning_.store(false);
        LOG_WARN("[LOCATOR] scan could not be started (filter='%s')", filter_.c_str());
        return false;
    }
    LOG_INFO("[LOCATOR] scanning for '%s'", filter_.c_str());
    return true;
}

void DeviceLocator::cancel()
{
    if (!scanning_.exchange(false))
        return;
    tx_.stop_scan();
    LOG_DEBUG("[LOCATOR] scan cancelled");
}

std::optional<std::string> DeviceLocator::offer(const std::string &address,
                                                const std::string &adv_name)
{
    if (!scanning_.load())
        return std::nullopt;
    if (address.empty() || !name_matches(adv_name, filter_))
    {
        LOG_DEBUG("[LOCATOR] skip %s name='%s'", address.empty() ? "?" : address.c_str(),
                  adv_name.c_str());
        return std::nullopt;
    }

    scanning_.store(false);
    tx_.stop_scan();
    last_match_ = address;
    LOG_SYSTEM("[LOCATOR] found %s addr=%s", adv_name.c_str(), address.c_str());
    return address;
}

}  // namespace app
