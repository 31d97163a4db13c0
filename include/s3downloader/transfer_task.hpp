#pragma once

#include "bounded_queue.hpp"

#include <cstdint>
#include <string>

namespace s3downloader {

struct ObjectDescriptor {
    std::string key;
    std::int64_t size{0};
};

// Zero byte keys ending in '/' are folder placeholders created by consoles and
// sync tools; they carry no data.
[[nodiscard]] inline bool isDirectoryMarker(const ObjectDescriptor& object) {
    return object.size == 0 && !object.key.empty() && object.key.back() == '/';
}

using TaskQueue = BoundedQueue<ObjectDescriptor>;

} // namespace s3downloader
