#pragma once

#include "transferkit/transfer_task.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace transferkit::cli {

// Redraws a block of task lines in place on an ANSI terminal.
class ProgressPanel {
public:
    explicit ProgressPanel(std::ostream& out);

    void render(const std::vector<TaskSnapshot>& tasks);

    [[nodiscard]] static std::string buildPanel(const std::vector<TaskSnapshot>& tasks);
    [[nodiscard]] static std::string formatTaskLine(const TaskSnapshot& task);
    [[nodiscard]] static std::string formatSize(std::uint64_t bytes);

private:
    std::ostream& out_;
    std::size_t previous_lines_{0};
};

} // namespace transferkit::cli
