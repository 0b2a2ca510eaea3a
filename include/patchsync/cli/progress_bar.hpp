// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace patchsync::cli {

// One-line terminal status for a sync run:
//   Syncing [==========>          ]  42% 12.3 MB/29.0 MB  files 3/7  data/maps/a.pak
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {});

    void update(std::uint64_t bytes_done, std::uint64_t bytes_total,
                std::size_t files_done, std::size_t files_total,
                std::string_view current_path = {});

    // Draw the final state and end the line
    void finish();

    [[nodiscard]] const std::string& last_line() const noexcept { return last_line_; }

    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);

    // Percent by bytes when the total is known, by files otherwise
    [[nodiscard]] static int percent(std::uint64_t bytes_done, std::uint64_t bytes_total,
                                     std::size_t files_done, std::size_t files_total) noexcept;

private:
    [[nodiscard]] std::string render(int pct, std::string_view current_path) const;

    std::string label_;
    std::uint64_t bytes_done_{0};
    std::uint64_t bytes_total_{0};
    std::size_t files_done_{0};
    std::size_t files_total_{0};
    int drawn_percent_{-1};
    std::size_t drawn_files_{0};
    std::string last_line_;
    bool finished_{false};
};

} // namespace patchsync::cli
