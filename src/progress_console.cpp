#include "s3downloader/progress_console.hpp"

#include <algorithm>
#include <ostream>
#include <utility>

#include <fmt/format.h>

namespace s3downloader {

ProgressConsole::ProgressConsole(std::string title, std::ostream& out, std::chrono::milliseconds redraw_interval)
    : title_(std::move(title)), out_(out), redraw_interval_(redraw_interval) {}

void ProgressConsole::consume(ProgressStream& stream) {
    using Clock = std::chrono::steady_clock;

    std::size_t previous_lines = 0;
    ProgressSnapshot latest;
    bool pending = false;
    auto last_draw = Clock::now() - redraw_interval_;

    while (auto snapshot = stream.pop(CancellationToken{})) {
        latest = *snapshot;
        pending = true;

        if (Clock::now() - last_draw >= redraw_interval_) {
            redrawPanel(buildPanel(latest), previous_lines);
            last_draw = Clock::now();
            pending = false;
        }
    }

    if (pending || previous_lines == 0) {
        redrawPanel(buildPanel(latest), previous_lines);
    }
    out_ << std::flush;
}

std::string ProgressConsole::buildPanel(const ProgressSnapshot& snapshot) const {
    std::string panel;
    panel.reserve(512);
    panel.append("==================================================\n");
    panel += fmt::format("{}\n", title_);
    panel.append("--------------------------------------------------\n");

    const std::int64_t done = snapshot.files_downloaded + snapshot.files_skipped;
    if (snapshot.files_found > 0) {
        const double ratio = std::min(1.0, static_cast<double>(done) / static_cast<double>(snapshot.files_found));
        const int percent = static_cast<int>(ratio * 100.0);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(ratio * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? u8"█" : u8"░";
        }
        panel += fmt::format("[{}] {:>3}% ({}/{} files)\n", bar, percent, done, snapshot.files_found);
    } else {
        panel.append("[Listing...]\n");
    }

    panel += fmt::format("Found: {}  Downloaded: {}  Skipped: {}  Errors: {}\n", snapshot.files_found,
                         snapshot.files_downloaded, snapshot.files_skipped, snapshot.error_count);
    panel += fmt::format("Transferred: {}\n", formatSize(static_cast<std::uint64_t>(snapshot.total_bytes)));
    panel.append("==================================================\n");

    return panel;
}

std::string ProgressConsole::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

void ProgressConsole::redrawPanel(const std::string& panel, std::size_t& previous_lines) {
    const std::size_t current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines > 0) {
        out_ << "\033[" << previous_lines << "F\033[J";
    }
    out_ << panel;
    previous_lines = current_lines;
}

} // namespace s3downloader
