#include "megadl/vpn_peer_ip_changer.hpp"

#include "megadl/errors.hpp"
#include "megadl/logging.hpp"

#include <stdexcept>
#include <thread>
#include <utility>

namespace megadl {

VpnPeerIpChanger::VpnPeerIpChanger(std::unique_ptr<VpnRouterApi> api,
                                   std::string provider,
                                   std::chrono::milliseconds settle_time,
                                   std::uint32_t seed)
    : api_(std::move(api)),
      provider_(std::move(provider)),
      settle_time_(settle_time),
      engine_(seed) {
    if (!api_) {
        throw std::invalid_argument("VpnPeerIpChanger needs a router api");
    }
}

VpnPeerIpChanger::~VpnPeerIpChanger() {
    if (!started_) {
        return;
    }
    try {
        api_->stop();
        logger()->info("Stopped the connection to the VPN server");
    } catch (const std::exception& ex) {
        logger()->warn("Could not stop the VPN connection: {}", ex.what());
    }
}

void VpnPeerIpChanger::changeIp() {
    const auto group = api_->findGroup(provider_);
    if (!group) {
        throw ChangeIpError("Failed to change ip with error: " + provider_ + " not found as vpn provider");
    }

    const auto peers = api_->listPeers(*group);
    if (peers.empty()) {
        throw ChangeIpError("Failed to change ip with error: " + provider_ + " has no vpn servers");
    }

    std::uniform_int_distribution<std::size_t> pick(0, peers.size() - 1);
    while (true) {
        api_->stop();
        const auto& peer = peers[pick(engine_)];
        api_->start(*group, peer.id);
        started_ = true;
        logger()->info("Connecting to VPN server {}...", peer.name);

        std::this_thread::sleep_for(settle_time_);
        const auto status = api_->status();
        if (status.connected) {
            logger()->info("Connected to VPN server {} with ip {}", peer.name, status.endpoint);
            return;
        }
        logger()->warn("Connecting to VPN server {} failed, selecting another random server", peer.name);
    }
}

} // namespace megadl
