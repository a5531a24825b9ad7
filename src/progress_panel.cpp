#include "liveprogress/progress_panel.hpp"

#include <algorithm>
#include <filesystem>
#include <ostream>

#include <fmt/format.h>

namespace liveprogress {

namespace {
constexpr int kBarWidth = 30;
constexpr std::size_t kNameWidth = 20;
} // namespace

std::string formatSize(std::uint64_t bytes) {
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

std::string formatDisplayName(const std::string& name) {
    std::string display_name;
    if (!name.empty()) {
        display_name = std::filesystem::path{name}.filename().string();
    }
    if (display_name.empty()) {
        display_name = name;
    }
    if (display_name.size() > kNameWidth) {
        display_name = display_name.substr(0, kNameWidth);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }
    return display_name;
}

std::string formatLine(const std::string& name, const NotStarted& /*start*/) {
    return fmt::format("{:<20} [Waiting to start]", formatDisplayName(name));
}

std::string formatLine(const std::string& name, const InProgress& work) {
    const auto display_name = formatDisplayName(name);
    const auto done = static_cast<std::uint64_t>(std::max<std::int64_t>(0, work.done()));

    if (work.isIndeterminate()) {
        if (done == 0) {
            return fmt::format("{:<20} [Connecting...]", display_name);
        }
        return fmt::format("{:<20} [{} received]", display_name, formatSize(done));
    }

    const double ratio = std::min(1.0, static_cast<double>(work.percentDone()));
    const int percent = static_cast<int>(ratio * 100.0);
    const int bar_pos = static_cast<int>(ratio * kBarWidth);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(kBarWidth) * 3);
    for (int i = 0; i < kBarWidth; ++i) {
        bar += (i < bar_pos) ? u8"█" : u8"░";
    }

    return fmt::format("{:<20} [{}] {:>3}% ({}/{})",
                       display_name,
                       bar,
                       percent,
                       formatSize(done),
                       formatSize(static_cast<std::uint64_t>(work.total())));
}

std::string formatLine(const std::string& name, const Failed& error) {
    const auto display_name = formatDisplayName(name);
    const std::string attempt = error.retries() >= 0 ? fmt::format(" (attempt {})", error.retries() + 1) : "";
    if (error.canRetry()) {
        return fmt::format("{:<20} ⚠️ {}{}, retrying possible", display_name, error.message(), attempt);
    }
    return fmt::format("{:<20} ❌ {}{}", display_name, error.message(), attempt);
}

std::string formatCompletedLine(const std::string& name, bool has_value) {
    return fmt::format("{:<20} ✅ Done{}", formatDisplayName(name), has_value ? "" : " (no content)");
}

ProgressPanel::ProgressPanel(std::ostream& out) : out_(out) {}

void ProgressPanel::draw(const std::string& panel) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

} // namespace liveprogress
