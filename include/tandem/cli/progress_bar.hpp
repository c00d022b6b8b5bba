// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tandem/core/progress.hpp>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace tandem::cli {

// Single-line progress bar driven by transfer snapshots
class ProgressBar {
public:
    explicit ProgressBar(std::ostream& out, std::string_view label = {});

    // Redraw from a snapshot; skipped unless the whole percent or status changed
    void update(const core::ProgressSnapshot& snapshot);

    // Draw the final state and end the line
    void finish(const core::ProgressSnapshot& snapshot);

    // Clear the progress bar line
    void clear();

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) { label_ = l; }

    // false: print every redraw on its own line (several bars at once)
    void inline_mode(bool enable) noexcept { inline_ = enable; }

    // Render without printing
    [[nodiscard]] std::string render(const core::ProgressSnapshot& snapshot) const;

private:
    [[nodiscard]] static std::string render_bar(double percent);

    std::ostream& out_;
    std::string label_;
    int last_percent_{-1};
    core::TransferStatus last_status_{core::TransferStatus::pending};
    bool inline_{true};
    bool finished_{false};
};

} // namespace tandem::cli
