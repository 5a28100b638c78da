#include "megadl/detail/curl_utils.hpp"

#include "megadl/errors.hpp"

#include <curl/curl.h>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace megadl::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

HttpResponse httpPost(const std::string& url,
                      const std::string& body,
                      const std::vector<std::string>& headers,
                      std::chrono::seconds timeout) {
    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
    using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

    ensureCurlInitialized();

    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw Error("Failed to allocate curl handle");
    }

    HeaderList header_list{nullptr, &curl_slist_free_all};
    for (const auto& header : headers) {
        curl_slist* appended = curl_slist_append(header_list.get(), header.c_str());
        if (!appended) {
            throw Error("Failed to build HTTP headers");
        }
        header_list.release();
        header_list.reset(appended);
    }

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,
        +[](char* ptr, size_t size, size_t nmemb, std::string* out) -> size_t {
            if (!out) {
                return 0;
            }
            out->append(ptr, size * nmemb);
            return size * nmemb;
        });
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw Error(std::string{"curl error for "} + url + ": " + curl_easy_strerror(res));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace megadl::detail
