#pragma once

#include "cancellation.hpp"
#include "object_store.hpp"
#include "progress.hpp"
#include "transfer_config.hpp"
#include "transfer_outcome.hpp"

#include <filesystem>
#include <string>

namespace s3downloader {

// Bulk download of every object below bucket/prefix into a local directory
// tree. One lister thread feeds a bounded queue drained by a fixed pool of
// download workers; run() blocks until all of them have stopped.
class TransferEngine {
public:
    explicit TransferEngine(ObjectStorePtr store);

    // progress_sink may be null. Snapshots are offered without blocking and
    // dropped when the sink is full; a final snapshot is offered once every
    // worker has stopped. Throws std::invalid_argument for an empty bucket or
    // destination and for an invalid config.
    [[nodiscard]] TransferOutcome run(const std::string& bucket, const std::string& prefix,
                                      const std::filesystem::path& destination_root, bool overwrite,
                                      const TransferConfig& config, ProgressStream* progress_sink,
                                      const CancellationToken& token = {});

private:
    ObjectStorePtr store_;
};

} // namespace s3downloader
