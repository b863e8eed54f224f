/// \file HTTPTransport.cpp
/// \brief libcurl 传输实现

#include "machlink/Module/HTTPTransport.h"
#include <curl/curl.h>
#include <mutex>

namespace machlink {

namespace {

std::once_flag gCurlGlobalInitOnce;
bool gCurlGlobalInitOk = false;

bool ensureCurlGlobalInit() {
    std::call_once(gCurlGlobalInitOnce, []() {
        gCurlGlobalInitOk = (curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK);
    });
    return gCurlGlobalInitOk;
}

size_t curlWriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    if (!userdata || !ptr) {
        return 0;
    }
    std::string* body = static_cast<std::string*>(userdata);
    const size_t bytes = size * nmemb;
    body->append(ptr, bytes);
    return bytes;
}

HTTPResponse runCurlGet(const std::string& url, long timeoutMs) {
    HTTPResponse result;
    if (!ensureCurlGlobalInit()) {
        result.Error = "libcurl global initialization failed";
        return result;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        result.Error = "libcurl easy init failed";
        return result;
    }

    std::string body;
    (void)curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    (void)curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    (void)curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    (void)curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteCallback);
    (void)curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    if (timeoutMs > 0) {
        (void)curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs);
    }

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        result.Error = curl_easy_strerror(rc);
        if (rc == CURLE_UNSUPPORTED_PROTOCOL && url.rfind("https://", 0) == 0) {
            result.Error = "Unsupported protocol: HTTPS/TLS is unavailable in current libcurl build";
        }
    } else {
        long statusCode = 0L;
        if (curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusCode) != CURLE_OK) {
            statusCode = 0L;
        }
        result.TransportOk = true;
        result.Status = statusCode;
        result.Body = std::move(body);
    }

    curl_easy_cleanup(curl);
    return result;
}

} // anonymous namespace

HTTPTransport makeCurlTransport(long timeoutMs) {
    return [timeoutMs](const std::string& url) { return runCurlGet(url, timeoutMs); };
}

} // namespace machlink
