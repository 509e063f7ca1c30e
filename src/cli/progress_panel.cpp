#include "progress_panel.hpp"

#include <algorithm>
#include <ostream>

#include <fmt/format.h>

#include "transferkit/url.hpp"

namespace transferkit::cli {

ProgressPanel::ProgressPanel(std::ostream& out) : out_(out) {}

void ProgressPanel::render(const std::vector<TaskSnapshot>& tasks) {
    const auto panel = buildPanel(tasks);
    const std::size_t current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

std::string ProgressPanel::buildPanel(const std::vector<TaskSnapshot>& tasks) {
    std::string panel;
    panel.reserve(tasks.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("Transfers ({})\n", tasks.size());
    panel.append("--------------------------------------------------\n");
    for (const auto& task : tasks) {
        panel += formatTaskLine(task);
        panel.push_back('\n');
    }
    panel.append("==================================================\n");
    return panel;
}

std::string ProgressPanel::formatTaskLine(const TaskSnapshot& task) {
    std::string display_name = lastPathSegment(task.url);
    if (display_name.empty()) {
        display_name = task.url;
    }
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    std::string line = fmt::format("{:<8} {:<20} ", toString(task.kind), display_name);

    if (task.expected_bytes > 0 || task.state == TransferState::Completed) {
        const double ratio = std::clamp(task.fraction, 0.0, 1.0);
        const int percent = static_cast<int>(ratio * 100.0);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(ratio * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? u8"█" : u8"░";
        }

        line += fmt::format("[{}] {:>3}% ({}/{})", bar, percent, formatSize(task.transferred_bytes),
                            formatSize(task.expected_bytes));
    } else if (task.transferred_bytes > 0) {
        line += fmt::format("[{} so far]", formatSize(task.transferred_bytes));
    } else {
        line.append("[Connecting...]");
    }

    switch (task.state) {
    case TransferState::Completed:
        line.append("  Done");
        break;
    case TransferState::Paused:
        line.append("  Paused");
        break;
    case TransferState::Cancelled:
        line.append("  Cancelled");
        break;
    case TransferState::Failed:
        line += fmt::format("  Failed: {}", task.error ? task.error->message() : std::string{"unknown error"});
        break;
    case TransferState::Idle:
    case TransferState::Running:
        break;
    }
    return line;
}

std::string ProgressPanel::formatSize(std::uint64_t bytes) {
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

} // namespace transferkit::cli
