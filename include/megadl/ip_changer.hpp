#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace megadl {

// Blocks until the public IP address has changed.
// Throws ChangeIpError when the change cannot be confirmed.
class IpChanger {
public:
    virtual ~IpChanger() = default;

    virtual void changeIp() = 0;
};

using IpChangerPtr = std::unique_ptr<IpChanger>;

enum class RouterType {
    Fritzbox,
    Glinet,
};

struct RouterConfig {
    RouterType type{RouterType::Fritzbox};
    // Host name or address; empty selects the vendor default.
    std::string address;
    std::string username{"root"};
    std::string password;
    std::string vpn_provider{"Mullvad"};

    std::chrono::seconds request_timeout{15};
    // Wait after starting a VPN peer before its status is checked.
    std::chrono::seconds settle_time{10};
    std::chrono::seconds poll_interval{5};
    // Upper bound for the reconnect to produce a new address.
    std::chrono::seconds max_wait{300};
};

IpChangerPtr makeIpChanger(const RouterConfig& config);

// "fritzbox" or "glinet"; throws std::invalid_argument otherwise.
RouterType parseRouterType(std::string_view name);
const char* toString(RouterType type);

} // namespace megadl
