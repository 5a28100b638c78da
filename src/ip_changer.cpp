#include "megadl/ip_changer.hpp"

#include "megadl/fritzbox_ip_changer.hpp"
#include "megadl/glinet_api.hpp"
#include "megadl/vpn_peer_ip_changer.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace megadl {

IpChangerPtr makeIpChanger(const RouterConfig& config) {
    switch (config.type) {
    case RouterType::Fritzbox:
        return std::make_unique<FritzboxIpChanger>(config);
    case RouterType::Glinet:
        return std::make_unique<VpnPeerIpChanger>(std::make_unique<GlinetApi>(config),
                                                  config.vpn_provider,
                                                  config.settle_time);
    }
    throw std::invalid_argument("Unknown router type");
}

RouterType parseRouterType(std::string_view name) {
    if (name == "fritzbox") {
        return RouterType::Fritzbox;
    }
    if (name == "glinet") {
        return RouterType::Glinet;
    }
    throw std::invalid_argument(fmt::format("Unknown router '{}', expected fritzbox or glinet", name));
}

const char* toString(RouterType type) {
    switch (type) {
    case RouterType::Fritzbox:
        return "fritzbox";
    case RouterType::Glinet:
        return "glinet";
    }
    return "unknown";
}

} // namespace megadl
