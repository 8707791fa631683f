#include "surge/progress.hpp"

namespace surge {

const char* describe(DownloadOutcome outcome) noexcept {
    switch (outcome) {
    case DownloadOutcome::Finished:
        return "Download finished";
    case DownloadOutcome::Cancelled:
        return "Download cancelled";
    }
    return "Download ended";
}

} // namespace surge
