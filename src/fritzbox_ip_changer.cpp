#include "megadl/fritzbox_ip_changer.hpp"

#include "megadl/detail/text.hpp"
#include "megadl/errors.hpp"
#include "megadl/logging.hpp"

#include <thread>
#include <utility>

#include <fmt/format.h>

namespace megadl {

namespace {

constexpr const char* kDefaultAddress = "fritz.box";
constexpr int kIgdPort = 49000;
constexpr const char* kControlPath = "/igdupnp/control/WANIPConn1";
constexpr const char* kService = "urn:schemas-upnp-org:service:WANIPConnection:1";

} // namespace

namespace detail {

std::string soapEnvelope(std::string_view action, std::string_view service) {
    return fmt::format(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
        "<s:Envelope s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\" "
        "xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\">"
        "<s:Body><u:{} xmlns:u=\"{}\" /></s:Body></s:Envelope>",
        action, service);
}

std::optional<std::string> xmlTagValue(std::string_view xml, std::string_view tag) {
    const std::string needle = std::string(tag) + ">";
    std::size_t pos = 0;
    while ((pos = xml.find(needle, pos)) != std::string_view::npos) {
        // accept <tag> and <prefix:tag>, reject </tag> and <othertag>
        const auto open = xml.rfind('<', pos);
        if (open != std::string_view::npos && open + 1 < xml.size() && xml[open + 1] != '/') {
            const auto name = xml.substr(open + 1, pos + tag.size() - open - 1);
            const auto colon = name.find(':');
            const auto local = colon == std::string_view::npos ? name : name.substr(colon + 1);
            if (local == tag) {
                const auto value_begin = pos + needle.size();
                const auto value_end = xml.find("</", value_begin);
                if (value_end == std::string_view::npos) {
                    return std::nullopt;
                }
                return std::string(trim(xml.substr(value_begin, value_end - value_begin)));
            }
        }
        pos += needle.size();
    }
    return std::nullopt;
}

} // namespace detail

FritzboxIpChanger::FritzboxIpChanger(RouterConfig config)
    : config_(std::move(config)),
      control_url_(fmt::format("http://{}:{}{}",
                               config_.address.empty() ? kDefaultAddress : config_.address,
                               kIgdPort,
                               kControlPath)) {}

void FritzboxIpChanger::changeIp() {
    const auto previous = externalIp();
    logger()->info("Current IP: {}", previous.empty() ? "unknown" : previous);
    logger()->info("Changing IP address...");

    try {
        const auto response = soapCall("ForceTermination");
        if (const auto code = detail::xmlTagValue(response.body, "errorCode")) {
            const auto description = detail::xmlTagValue(response.body, "errorDescription").value_or("");
            throw ChangeIpError(fmt::format("Failed to change ip with error: {} {}", *code, description));
        }
        if (response.status >= 400) {
            throw ChangeIpError(fmt::format("Failed to change ip with error: HTTP {}", response.status));
        }
    } catch (const ChangeIpError&) {
        throw;
    } catch (const Error& ex) {
        // The router may drop the connection while it reconnects.
        logger()->debug("Reconnect request ended early: {}", ex.what());
    }

    const auto deadline = std::chrono::steady_clock::now() + config_.max_wait;
    while (std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(config_.poll_interval);
        const auto current = externalIp();
        if (!current.empty() && current != previous) {
            logger()->info("New IP: {}", current);
            return;
        }
        logger()->info("Changing IP address...");
    }
    throw ChangeIpError(fmt::format("No new IP address after {} s", config_.max_wait.count()));
}

std::string FritzboxIpChanger::externalIp() const {
    try {
        const auto response = soapCall("GetExternalIPAddress");
        if (response.status != 200) {
            return {};
        }
        return detail::xmlTagValue(response.body, "NewExternalIPAddress").value_or("");
    } catch (const Error& ex) {
        logger()->debug("External IP query failed: {}", ex.what());
        return {};
    }
}

detail::HttpResponse FritzboxIpChanger::soapCall(const char* action) const {
    const std::vector<std::string> headers{
        "Content-Type: text/xml; charset=\"utf-8\"",
        fmt::format("SoapAction: {}#{}", kService, action),
    };
    return detail::httpPost(control_url_, detail::soapEnvelope(action, kService), headers, config_.request_timeout);
}

} // namespace megadl
