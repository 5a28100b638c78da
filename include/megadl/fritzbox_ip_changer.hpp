#pragma once

#include "detail/curl_utils.hpp"
#include "ip_changer.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace megadl {

// Reconnects the WAN link of an AVM FRITZ!Box through its UPnP IGD SOAP
// service and waits for a different external address.
class FritzboxIpChanger final : public IpChanger {
public:
    explicit FritzboxIpChanger(RouterConfig config);

    void changeIp() override;

    // Empty when the router cannot be asked or has no address yet.
    [[nodiscard]] std::string externalIp() const;

private:
    detail::HttpResponse soapCall(const char* action) const;

    RouterConfig config_;
    std::string control_url_;
};

namespace detail {

std::string soapEnvelope(std::string_view action, std::string_view service);

// Text between <tag> and </tag>, ignoring namespace prefixes on the tag.
std::optional<std::string> xmlTagValue(std::string_view xml, std::string_view tag);

} // namespace detail

} // namespace megadl
