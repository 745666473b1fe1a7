#pragma once

#include <memory>
#include <string>

#include <curl/curl.h>

namespace podshuttle::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlUrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

// curl_global_init is not thread-safe; every engine that talks to libcurl calls
// this first.
void ensureCurlInitialized();

[[nodiscard]] CurlHandle makeCurlHandle();

// Prefers the CURLOPT_ERRORBUFFER text when libcurl filled it in.
[[nodiscard]] std::string describeCurlError(CURLcode code, const char* error_buffer);

} // namespace podshuttle::detail
