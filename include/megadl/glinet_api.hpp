#pragma once

#include "ip_changer.hpp"
#include "vpn_peer_ip_changer.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace megadl {

// GL.iNet 4.x JSON-RPC client for the WireGuard client ("wg-client").
// Logs in on first use and logs out on destruction.
class GlinetApi final : public VpnRouterApi {
public:
    explicit GlinetApi(RouterConfig config);
    ~GlinetApi() override;

    GlinetApi(const GlinetApi&) = delete;
    GlinetApi& operator=(const GlinetApi&) = delete;

    std::optional<std::int64_t> findGroup(const std::string& provider) override;
    std::vector<VpnPeer> listPeers(std::int64_t group_id) override;
    void stop() override;
    void start(std::int64_t group_id, std::int64_t peer_id) override;
    VpnStatus status() override;

private:
    void login();
    void logout();
    nlohmann::json call(const std::string& method, const nlohmann::json& params);
    nlohmann::json rpc(const std::string& method, const nlohmann::json& params);

    RouterConfig config_;
    std::string url_;
    std::string sid_;
    int next_id_{1};
};

namespace detail {

// Password digest expected by the GL.iNet login call:
// md5("<user>:<crypt(password, $alg$salt$)>:<nonce>") in hex.
std::string glinetLoginHash(const std::string& username,
                            const std::string& password,
                            int alg,
                            const std::string& salt,
                            const std::string& nonce);

std::string md5Hex(const std::string& data);

} // namespace detail

} // namespace megadl
