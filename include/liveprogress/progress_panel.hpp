#pragma once

#include "progress.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <type_traits>

namespace liveprogress {

[[nodiscard]] std::string formatSize(std::uint64_t bytes);
[[nodiscard]] std::string formatDisplayName(const std::string& name);

[[nodiscard]] std::string formatLine(const std::string& name, const NotStarted& start);
[[nodiscard]] std::string formatLine(const std::string& name, const InProgress& work);
[[nodiscard]] std::string formatLine(const std::string& name, const Failed& error);
[[nodiscard]] std::string formatCompletedLine(const std::string& name, bool has_value);

template <typename T>
[[nodiscard]] std::string formatLine(const std::string& name, const Progress<T>& state) {
    return state.visit([&name](const auto& current) -> std::string {
        using Case = std::decay_t<decltype(current)>;
        if constexpr (std::is_same_v<Case, Completed<T>>) {
            return formatCompletedLine(name, current.hasValue());
        } else {
            return formatLine(name, current);
        }
    });
}

// Redraws a block of lines in place on a terminal. Safe to call from the
// transport's callback thread.
class ProgressPanel {
public:
    explicit ProgressPanel(std::ostream& out);

    void draw(const std::string& panel);

    template <typename T>
    void update(const std::string& name, const Progress<T>& state) {
        draw(formatLine(name, state) + '\n');
    }

private:
    std::ostream& out_;
    std::mutex mutex_;
    std::size_t previous_lines_{0};
};

} // namespace liveprogress
