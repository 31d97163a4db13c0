#pragma once

#include "progress.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace s3downloader {

// Draws the latest ProgressSnapshot as a panel redrawn in place.
class ProgressConsole {
public:
    explicit ProgressConsole(std::string title, std::ostream& out,
                             std::chrono::milliseconds redraw_interval = std::chrono::milliseconds(200));

    // Reads stream until it is closed and drained. Intermediate snapshots are
    // coalesced; the last one received is always drawn.
    void consume(ProgressStream& stream);

    [[nodiscard]] std::string buildPanel(const ProgressSnapshot& snapshot) const;
    static std::string formatSize(std::uint64_t bytes);

private:
    void redrawPanel(const std::string& panel, std::size_t& previous_lines);

    std::string title_;
    std::ostream& out_;
    std::chrono::milliseconds redraw_interval_;
};

} // namespace s3downloader
