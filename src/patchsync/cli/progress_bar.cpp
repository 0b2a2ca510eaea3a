// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/cli/progress_bar.hpp>

#include <algorithm>
#include <cstdio>
#include <iostream>

namespace patchsync::cli {

namespace {

constexpr int BAR_WIDTH = 24;
constexpr std::size_t PATH_WIDTH = 32;

// Keep the tail of long paths, it names the file
std::string shorten(std::string_view path) {
    if (path.size() <= PATH_WIDTH) return std::string(path);
    return "..." + std::string(path.substr(path.size() - (PATH_WIDTH - 3)));
}

} // namespace

ProgressBar::ProgressBar(std::string_view label)
    : label_(label) {}

int ProgressBar::percent(std::uint64_t bytes_done, std::uint64_t bytes_total,
                         std::size_t files_done, std::size_t files_total) noexcept {
    if (bytes_total > 0) {
        return static_cast<int>(std::min<std::uint64_t>(bytes_done, bytes_total) * 100 / bytes_total);
    }
    if (files_total > 0) {
        return static_cast<int>(std::min(files_done, files_total) * 100 / files_total);
    }
    return 100;
}

void ProgressBar::update(std::uint64_t bytes_done, std::uint64_t bytes_total,
                         std::size_t files_done, std::size_t files_total,
                         std::string_view current_path) {
    bytes_done_ = bytes_done;
    bytes_total_ = bytes_total;
    files_done_ = files_done;
    files_total_ = files_total;

    const int pct = percent(bytes_done, bytes_total, files_done, files_total);
    // Redraw on a new percent or a finished file
    if (pct == drawn_percent_ && files_done == drawn_files_ && !finished_) return;
    drawn_percent_ = pct;
    drawn_files_ = files_done;

    auto line = render(pct, current_path);
    // Pad over whatever the previous line left behind
    const auto width = std::max(line.size(), last_line_.size());
    std::cout << '\r' << line << std::string(width - line.size(), ' ') << std::flush;
    last_line_ = std::move(line);
}

void ProgressBar::finish() {
    if (finished_) return;
    finished_ = true;
    update(bytes_total_ > 0 ? bytes_total_ : bytes_done_, bytes_total_, files_total_, files_total_);
    std::cout << std::endl;
}

std::string ProgressBar::render(int pct, std::string_view current_path) const {
    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ' ';
    }

    const int filled = BAR_WIDTH * pct / 100;
    line += '[';
    line.append(static_cast<std::size_t>(filled), '=');
    if (filled < BAR_WIDTH) {
        line += '>';
        line.append(static_cast<std::size_t>(BAR_WIDTH - filled - 1), ' ');
    }
    line += ']';

    char pct_text[8];
    std::snprintf(pct_text, sizeof(pct_text), " %3d%%", pct);
    line += pct_text;

    if (bytes_total_ > 0) {
        line += ' ';
        line += format_bytes(std::min(bytes_done_, bytes_total_));
        line += '/';
        line += format_bytes(bytes_total_);
    }
    if (files_total_ > 0) {
        line += "  files ";
        line += std::to_string(files_done_);
        line += '/';
        line += std::to_string(files_total_);
    }
    if (!current_path.empty()) {
        line += "  ";
        line += shorten(current_path);
    }
    return line;
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    char text[32];
    if (bytes >= GB) {
        std::snprintf(text, sizeof(text), "%.2f GB", static_cast<double>(bytes) / GB);
    } else if (bytes >= MB) {
        std::snprintf(text, sizeof(text), "%.1f MB", static_cast<double>(bytes) / MB);
    } else if (bytes >= KB) {
        std::snprintf(text, sizeof(text), "%.0f KB", static_cast<double>(bytes) / KB);
    } else {
        std::snprintf(text, sizeof(text), "%llu B", static_cast<unsigned long long>(bytes));
    }
    return text;
}

} // namespace patchsync::cli
