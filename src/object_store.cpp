#include "s3downloader/object_store.hpp"

#include <iterator>

namespace s3downloader {

std::vector<std::string> ObjectStore::listPrefixes(const std::string& bucket, const std::string& prefix,
                                                   const CancellationToken& token) {
    if (bucket.empty()) {
        throw std::invalid_argument("S3 bucket name cannot be empty");
    }

    std::vector<std::string> prefixes;
    ListRequest request{bucket, prefix, "/", {}, 1000};
    while (true) {
        if (token.isCancelled()) {
            throw OperationCancelled{};
        }

        ListPage page = listObjects(request, token);
        prefixes.insert(prefixes.end(), std::make_move_iterator(page.common_prefixes.begin()),
                        std::make_move_iterator(page.common_prefixes.end()));

        if (!page.truncated || page.next_continuation_token.empty()) {
            break;
        }
        request.continuation_token = std::move(page.next_continuation_token);
    }
    return prefixes;
}

} // namespace s3downloader
