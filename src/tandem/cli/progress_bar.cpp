// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tandem/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace tandem::cli {

namespace {

constexpr int BAR_WIDTH = 30;

} // namespace

ProgressBar::ProgressBar(std::ostream& out, std::string_view label)
    : out_(out)
    , label_(label) {}

void ProgressBar::update(const core::ProgressSnapshot& snapshot) {
    if (finished_) return;

    // Only redraw on a new whole percent or a status change
    const int pct = static_cast<int>(std::clamp(snapshot.percent, 0.0, 100.0));
    if (pct == last_percent_ && snapshot.status == last_status_) return;
    last_percent_ = pct;
    last_status_ = snapshot.status;

    if (inline_) {
        out_ << '\r' << render(snapshot) << std::string(4, ' ') << std::flush;
    } else {
        out_ << render(snapshot) << '\n' << std::flush;
    }
}

void ProgressBar::finish(const core::ProgressSnapshot& snapshot) {
    if (finished_) return;
    if (inline_) {
        out_ << '\r' << render(snapshot) << std::string(4, ' ') << std::endl;
    } else {
        out_ << render(snapshot) << std::endl;
    }
    finished_ = true;
}

void ProgressBar::clear() {
    if (inline_) {
        out_ << '\r' << std::string(80, ' ') << '\r' << std::flush;
    }
}

std::string ProgressBar::render(const core::ProgressSnapshot& snapshot) const {
    std::ostringstream line;
    if (!label_.empty()) {
        line << label_ << ": ";
    }

    line << render_bar(snapshot.percent) << ' '
         << std::fixed << std::setprecision(1) << std::setw(5) << snapshot.percent << "% ("
         << core::format_bytes(snapshot.bytes_downloaded) << '/'
         << core::format_bytes(snapshot.total_bytes) << ')'
         << " [" << snapshot.completed_chunks << '/' << snapshot.total_chunks << ']';

    switch (snapshot.status) {
        case core::TransferStatus::downloading:
            if (snapshot.speed_bps > 0) {
                line << " @ " << snapshot.speed_formatted;
                if (snapshot.eta_seconds > 0) {
                    line << " ETA: " << snapshot.eta_formatted;
                }
            }
            break;
        case core::TransferStatus::error:
            line << " failed";
            if (snapshot.error) {
                line << ": " << *snapshot.error;
            }
            break;
        case core::TransferStatus::pending:
            break;
        default:
            line << ' ' << core::to_string(snapshot.status);
            break;
    }
    return line.str();
}

std::string ProgressBar::render_bar(double percent) {
    const int filled = std::clamp(static_cast<int>(std::round(BAR_WIDTH * percent / 100.0)), 0, BAR_WIDTH);

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < BAR_WIDTH) {
        bar += '>';
        bar.append(static_cast<std::size_t>(BAR_WIDTH - filled - 1), ' ');
    }
    bar += ']';
    return bar;
}

} // namespace tandem::cli
