#pragma once

#include "ip_changer.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace megadl {

struct VpnPeer {
    std::int64_t id{0};
    std::string name;
};

struct VpnStatus {
    bool connected{false};
    std::string endpoint;
};

// Router side of a VPN client that can be pointed at one of several peers.
// Failures are reported as ChangeIpError.
class VpnRouterApi {
public:
    virtual ~VpnRouterApi() = default;

    virtual std::optional<std::int64_t> findGroup(const std::string& provider) = 0;
    virtual std::vector<VpnPeer> listPeers(std::int64_t group_id) = 0;
    virtual void stop() = 0;
    virtual void start(std::int64_t group_id, std::int64_t peer_id) = 0;
    virtual VpnStatus status() = 0;
};

// Changes the public address by reconnecting the router's VPN client to a
// random peer of the configured provider until one connects. There is no
// retry limit.
class VpnPeerIpChanger final : public IpChanger {
public:
    VpnPeerIpChanger(std::unique_ptr<VpnRouterApi> api,
                     std::string provider,
                     std::chrono::milliseconds settle_time,
                     std::uint32_t seed = std::random_device{}());
    // Stops the VPN connection; failures are logged.
    ~VpnPeerIpChanger() override;

    void changeIp() override;

private:
    std::unique_ptr<VpnRouterApi> api_;
    std::string provider_;
    std::chrono::milliseconds settle_time_;
    std::mt19937 engine_;
    bool started_{false};
};

} // namespace megadl
