#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace megadl::detail {

void ensureCurlInitialized();

struct HttpResponse {
    long status{0};
    std::string body;
};

// Throws megadl::Error when the request cannot be completed at transport level.
HttpResponse httpPost(const std::string& url,
                      const std::string& body,
                      const std::vector<std::string>& headers,
                      std::chrono::seconds timeout);

} // namespace megadl::detail
