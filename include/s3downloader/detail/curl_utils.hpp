#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <curl/curl.h>

namespace s3downloader::detail {

// curl_global_init once per process, cleaned up at exit.
void ensureCurlInitialized();

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

// Throws std::runtime_error when libcurl cannot allocate a handle.
[[nodiscard]] CurlHandle makeCurlHandle();

// Owning wrapper around a curl_slist of request headers.
class HeaderList {
public:
    HeaderList() = default;
    ~HeaderList();

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void add(const std::string& name, const std::string& value);
    [[nodiscard]] curl_slist* get() const noexcept { return list_; }

private:
    curl_slist* list_{nullptr};
};

// CURLOPT_WRITEFUNCTION appending into the std::string passed as userdata.
size_t appendToString(char* ptr, size_t size, size_t nmemb, void* userdata);

} // namespace s3downloader::detail
