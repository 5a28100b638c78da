#include "megadl/glinet_api.hpp"

#include "megadl/detail/curl_utils.hpp"
#include "megadl/errors.hpp"
#include "megadl/logging.hpp"

#include <array>
#include <memory>
#include <utility>

#include <crypt.h>
#include <fmt/format.h>
#include <openssl/evp.h>

using nlohmann::json;

namespace megadl {

namespace {

constexpr const char* kDefaultAddress = "192.168.8.1";
constexpr const char* kWgClient = "wg-client";
// Returned by the router when the sid is unknown or expired.
constexpr int kAccessDenied = -32000;

int errorCode(const json& response) {
    const auto& error = response["error"];
    return error.is_object() ? error.value("code", 0) : 0;
}

// Turns JSON shape errors in router replies into ChangeIpError.
template <typename Fn>
auto parseReply(const char* what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const json::exception& ex) {
        throw ChangeIpError(fmt::format("Unexpected router reply to {}: {}", what, ex.what()));
    }
}

std::string errorMessage(const json& response) {
    const auto& error = response["error"];
    if (!error.is_object()) {
        return error.dump();
    }
    return fmt::format("{} (code {})", error.value("message", std::string{"unknown error"}), errorCode(response));
}

} // namespace

namespace detail {

std::string md5Hex(const std::string& data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_md5(), nullptr) != 1) {
        throw Error("MD5 digest failed");
    }

    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex += fmt::format("{:02x}", digest[i]);
    }
    return hex;
}

std::string glinetLoginHash(const std::string& username,
                            const std::string& password,
                            int alg,
                            const std::string& salt,
                            const std::string& nonce) {
    const std::string setting = fmt::format("${}${}$", alg, salt);
    auto data = std::make_unique<crypt_data>();
    data->initialized = 0;

    const char* cipher = crypt_r(password.c_str(), setting.c_str(), data.get());
    if (!cipher || cipher[0] == '*') {
        throw ChangeIpError(fmt::format("Router password hashing with algorithm {} is not supported", alg));
    }
    return md5Hex(fmt::format("{}:{}:{}", username, cipher, nonce));
}

} // namespace detail

GlinetApi::GlinetApi(RouterConfig config)
    : config_(std::move(config)),
      url_(fmt::format("http://{}/rpc", config_.address.empty() ? kDefaultAddress : config_.address)) {}

GlinetApi::~GlinetApi() {
    if (sid_.empty()) {
        return;
    }
    try {
        logout();
    } catch (const std::exception& ex) {
        logger()->debug("Router logout failed: {}", ex.what());
    }
}

std::optional<std::int64_t> GlinetApi::findGroup(const std::string& provider) {
    const auto result = call("get_group_list", json::object());
    return parseReply("get_group_list", [&]() -> std::optional<std::int64_t> {
        for (const auto& group : result.value("groups", json::array())) {
            if (group.value("group_name", std::string{}) == provider) {
                return group.at("group_id").get<std::int64_t>();
            }
        }
        return std::nullopt;
    });
}

std::vector<VpnPeer> GlinetApi::listPeers(std::int64_t group_id) {
    const auto result = call("get_config_list", json{{"group_id", group_id}});
    return parseReply("get_config_list", [&] {
        std::vector<VpnPeer> peers;
        for (const auto& peer : result.value("peers", json::array())) {
            peers.push_back({peer.at("peer_id").get<std::int64_t>(), peer.value("name", std::string{})});
        }
        return peers;
    });
}

void GlinetApi::stop() {
    call("stop", json::object());
}

void GlinetApi::start(std::int64_t group_id, std::int64_t peer_id) {
    call("start", json{{"group_id", group_id}, {"peer_id", peer_id}});
}

VpnStatus GlinetApi::status() {
    const auto result = call("get_status", json::object());
    return parseReply("get_status", [&] {
        VpnStatus status;
        status.connected = result.value("status", 0) == 1;
        status.endpoint = result.value("domain", std::string{});
        return status;
    });
}

void GlinetApi::login() {
    const auto challenge = rpc("challenge", json{{"username", config_.username}});
    if (challenge.contains("error")) {
        throw ChangeIpError("Router challenge failed: " + errorMessage(challenge));
    }

    const auto hash = parseReply("challenge", [&] {
        const auto& params = challenge.at("result");
        return detail::glinetLoginHash(config_.username,
                                       config_.password,
                                       params.value("alg", 1),
                                       params.value("salt", std::string{}),
                                       params.value("nonce", std::string{}));
    });

    const auto response = rpc("login", json{{"username", config_.username}, {"hash", hash}});
    if (response.contains("error")) {
        throw ChangeIpError("Router login failed: " + errorMessage(response));
    }
    sid_ = parseReply("login", [&] { return response.at("result").at("sid").get<std::string>(); });
    logger()->debug("Logged in to router at {}", url_);
}

void GlinetApi::logout() {
    const auto sid = std::exchange(sid_, std::string{});
    rpc("logout", json{{"sid", sid}});
}

json GlinetApi::call(const std::string& method, const json& params) {
    for (int attempt = 0; attempt < 2; ++attempt) {
        if (sid_.empty()) {
            login();
        }
        const auto response = rpc("call", json::array({sid_, kWgClient, method, params}));
        if (!response.contains("error")) {
            return response.value("result", json::object());
        }
        if (errorCode(response) == kAccessDenied && attempt == 0) {
            sid_.clear();
            continue;
        }
        throw ChangeIpError(fmt::format("Router call {}.{} failed: {}", kWgClient, method, errorMessage(response)));
    }
    throw ChangeIpError(fmt::format("Router call {}.{} was refused", kWgClient, method));
}

json GlinetApi::rpc(const std::string& method, const json& params) {
    const json request{{"jsonrpc", "2.0"}, {"id", next_id_++}, {"method", method}, {"params", params}};

    detail::HttpResponse response;
    try {
        response = detail::httpPost(url_, request.dump(), {"Content-Type: application/json"}, config_.request_timeout);
    } catch (const Error& ex) {
        throw ChangeIpError(ex.what());
    }
    if (response.status != 200) {
        throw ChangeIpError(fmt::format("Router returned HTTP {} for {}", response.status, method));
    }

    auto parsed = json::parse(response.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw ChangeIpError("Router returned malformed JSON for " + method);
    }
    return parsed;
}

} // namespace megadl
