#include "s3downloader/detail/curl_utils.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace s3downloader::detail {

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
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw std::runtime_error("Failed to allocate curl handle");
    }
    return curl;
}

HeaderList::~HeaderList() { curl_slist_free_all(list_); }

void HeaderList::add(const std::string& name, const std::string& value) {
    const std::string line = name + ": " + value;
    curl_slist* appended = curl_slist_append(list_, line.c_str());
    if (!appended) {
        throw std::runtime_error("Failed to append HTTP header");
    }
    list_ = appended;
}

size_t appendToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    if (!out) {
        return 0;
    }
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

} // namespace s3downloader::detail
