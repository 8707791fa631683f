#pragma once

#include "progress.hpp"
#include "render_loop.hpp"
#include "transfer_source.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <ostream>

namespace surge {

struct JobOptions {
    bool progress{true};
    bool silence{false};
    std::size_t max_bar_width{62};
    // Overrides the terminal query, mostly for tests.
    std::optional<std::size_t> terminal_columns;
    std::chrono::milliseconds redraw_interval{kRedrawInterval};
};

class JobController {
public:
    JobController(TransferSource& source, JobOptions options, std::ostream& out);

    // Runs the job to completion. Transfer and render failures are rethrown
    // once the terminal is back in a usable state.
    DownloadOutcome run();

private:
    [[nodiscard]] ProgressBar makeBar() const;
    void printSummary(DownloadOutcome outcome, bool erase_frame);

    TransferSource& source_;
    JobOptions options_;
    std::ostream& out_;
};

} // namespace surge
