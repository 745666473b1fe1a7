#include "podshuttle/detail/curl_utils.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace podshuttle::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeCurlHandle() {
    ensureCurlInitialized();
    return CurlHandle{curl_easy_init(), &curl_easy_cleanup};
}

std::string describeCurlError(CURLcode code, const char* error_buffer) {
    if (error_buffer && error_buffer[0] != '\0') {
        return error_buffer;
    }
    return curl_easy_strerror(code);
}

} // namespace podshuttle::detail
