#include "surge/job_controller.hpp"
#include "surge/logger.hpp"
#include "surge/terminal.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace surge {

JobController::JobController(TransferSource& source, JobOptions options, std::ostream& out)
    : source_(source), options_(std::move(options)), out_(out) {}

DownloadOutcome JobController::run() {
    const bool render = options_.progress && !options_.silence;

    std::optional<terminal::CursorGuard> cursor;
    // The render loop is the only terminal writer until it is joined.
    std::optional<ConsoleMute> mute;
    if (render) {
        cursor.emplace(out_);
        mute.emplace();
    }

    // Subscribe before starting so no early progress is missed.
    std::unique_ptr<RenderLoop> loop;
    if (render) {
        loop = std::make_unique<RenderLoop>(source_, makeBar(), out_, options_.redraw_interval);
    }

    auto finished = source_.start();
    if (loop) {
        loop->start();
    }

    DownloadOutcome outcome{DownloadOutcome::Finished};
    std::exception_ptr failure;
    try {
        outcome = finished.get();
    } catch (const std::exception& ex) {
        spdlog::debug("Transfer failed: {}", ex.what());
        failure = std::current_exception();
    }

    bool frame_on_screen = false;
    if (loop) {
        // The source closes its signal before resolving, so this returns once
        // the last pending frame is out.
        loop->join();
        frame_on_screen = loop->framesRendered() > 0;
        mute.reset();
    }

    if (failure) {
        if (frame_on_screen) {
            terminal::write(out_, "\n");
        }
        std::rethrow_exception(failure);
    }

    spdlog::info("{}: {}", describe(outcome), source_.filePath().string());
    if (!options_.silence) {
        printSummary(outcome, frame_on_screen);
    }
    return outcome;
}

ProgressBar JobController::makeBar() const {
    if (options_.terminal_columns) {
        return ProgressBar{options_.max_bar_width, *options_.terminal_columns};
    }
    return ProgressBar{options_.max_bar_width};
}

void JobController::printSummary(DownloadOutcome outcome, bool erase_frame) {
    std::string text;
    if (erase_frame) {
        text += terminal::erase_frame;
    }
    text += fmt::format("{}\nSave To: {}\n", describe(outcome), source_.filePath().string());
    terminal::write(out_, text);
}

} // namespace surge
