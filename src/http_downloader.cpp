#include "surge/http_downloader.hpp"
#include "surge/detail/curl_utils.hpp"
#include "surge/speed_tracker.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace surge {

namespace {

constexpr int kMaxRangeAttempts = 3;

} // namespace

class HttpDownloader::Impl {
public:
    Impl(std::string url, const std::filesystem::path& directory, DownloadOptions options)
        : url_(std::move(url)),
          options_(options) {
        std::string name = detail::fileNameFromUrl(url_);
        if (name.empty() || name == "." || name == "..") {
            name = "index.html";
        }
        destination_ = directory / name;
        options_.connection_count = std::max(1U, options_.connection_count);
        options_.chunk_size = std::max<std::size_t>(1, options_.chunk_size);
    }

    ~Impl() {
        cancelled_ = true;
        if (coordinator_.valid()) {
            coordinator_.wait();
        }
    }

    std::future<DownloadOutcome> start() {
        if (started_.exchange(true)) {
            throw std::logic_error("download already started");
        }
        detail::ensureCurlInitialized();

        // The coordinator runs on its own thread; the caller gets a second
        // future fed through a promise so this object can still join it.
        auto promise = std::make_shared<std::promise<DownloadOutcome>>();
        auto result = promise->get_future();
        coordinator_ = std::async(std::launch::async, [this, promise] {
            try {
                promise->set_value(run());
            } catch (const std::exception& ex) {
                spdlog::error("Download of {} failed: {}", url_, ex.what());
                discardDestination();
                promise->set_exception(std::current_exception());
            }
        });
        return result;
    }

    [[nodiscard]] ProgressReceiver subscribe() const { return signal_.subscribe(); }

    [[nodiscard]] std::optional<std::uint64_t> totalSize() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return total_bytes_;
    }

    [[nodiscard]] std::uint64_t downloadSpeed() const { return speed_.bytesPerSecond(); }

    [[nodiscard]] std::filesystem::path filePath() const { return destination_; }

    void cancel() noexcept { cancelled_ = true; }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    struct FileMetadata {
        bool supports_range{false};
        curl_off_t content_length{0};
    };

    struct ChunkRange {
        curl_off_t start{0};
        curl_off_t end{0};
    };

    struct RangeContext {
        Impl* owner{nullptr};
        curl_off_t start{0};
        curl_off_t hasWritten{0};
        // Zero for an unbounded stream.
        curl_off_t expected{0};
    };

    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

    // Closes the progress signal on every exit path of run().
    struct SignalCloser {
        ProgressSignal& signal;
        ~SignalCloser() { signal.close(); }
    };

    DownloadOutcome run() {
        SignalCloser closer{signal_};

        file_.reset(std::fopen(destination_.c_str(), "wb+"));
        if (!file_) {
            throw DownloadError("Cannot create destination file: " + destination_.string());
        }
        created_destination_ = true;

        const auto metadata = fetchMetadata();
        spdlog::debug("Metadata for {}: length={} ranges={}", url_, metadata.content_length, metadata.supports_range);

        if (!metadata.supports_range || metadata.content_length == 0) {
            if (metadata.content_length > 0) {
                std::lock_guard<std::mutex> lock(state_mutex_);
                total_bytes_ = static_cast<std::uint64_t>(metadata.content_length);
            }
            streamDownload();
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (!total_bytes_) {
                total_bytes_ = downloaded_bytes_;
            }
        } else {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                total_bytes_ = static_cast<std::uint64_t>(metadata.content_length);
            }
            if (ftruncate(fileno(file_.get()), metadata.content_length) == -1) {
                throw DownloadError("Cannot resize destination file");
            }
            rangedDownload(metadata.content_length);
        }

        if (std::fflush(file_.get()) != 0) {
            registerError("Failed to flush output file");
        }
        file_.reset();

        // Publish the final count once more so the last frame sees it with
        // the total that is now known.
        signal_.publish(downloadedBytes());

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (has_error_) {
                throw DownloadError(error_message_);
            }
        }
        if (cancelled_) {
            spdlog::info("Download of {} cancelled", url_);
            return DownloadOutcome::Cancelled;
        }
        return DownloadOutcome::Finished;
    }

    // Removes the file a failed run created. A file that could not be opened
    // is left alone, since it may predate this download.
    void discardDestination() noexcept {
        file_.reset();
        if (!created_destination_) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove(destination_, ec);
        if (ec) {
            spdlog::warn("Cannot remove partial file {}: {}", destination_.string(), ec.message());
        }
    }

    [[nodiscard]] FileMetadata fetchMetadata() const {
        FileMetadata meta;
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            return meta;
        }

        curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HEADER, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);

        std::string headers;
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,
            +[](char* ptr, size_t size, size_t nmemb, std::string* out) -> size_t {
                if (!out) {
                    return 0;
                }
                out->append(ptr, size * nmemb);
                return size * nmemb;
            });
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &headers);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            spdlog::warn("HEAD request to {} failed: {}", url_, curl_easy_strerror(res));
            return meta;
        }

        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        if (code >= 400) {
            spdlog::warn("HEAD request to {} returned {}", url_, code);
            return meta;
        }

        std::string lowered = headers;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        meta.supports_range = lowered.find("accept-ranges: bytes") != std::string::npos;

        curl_off_t length = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        // -1 when the server sent no length
        meta.content_length = std::max<curl_off_t>(0, length);
        return meta;
    }

    void rangedDownload(curl_off_t content_length) {
        std::size_t range_count = 0;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            const auto chunk = static_cast<curl_off_t>(options_.chunk_size);
            for (curl_off_t start = 0; start < content_length; start += chunk) {
                pending_.push_back({start, std::min(start + chunk, content_length)});
            }
            range_count = pending_.size();
        }

        const auto worker_count = std::min<std::size_t>(options_.connection_count, range_count);
        spdlog::debug("Downloading {} ranges over {} connections", range_count, worker_count);

        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (std::size_t i = 0; i < worker_count; ++i) {
            workers.emplace_back([this, worker_count] { rangeWorker(worker_count); });
        }
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    void rangeWorker(std::size_t worker_count) {
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            registerError("Failed to allocate curl handle");
            return;
        }
        configureHandle(curl.get(), worker_count);

        while (auto range = nextRange()) {
            if (!downloadRange(curl.get(), *range)) {
                return;
            }
        }
    }

    [[nodiscard]] std::optional<ChunkRange> nextRange() {
        if (cancelled_ || hasError()) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (pending_.empty()) {
            return std::nullopt;
        }
        const auto range = pending_.front();
        pending_.pop_front();
        return range;
    }

    bool downloadRange(CURL* curl, const ChunkRange& chunk) {
        RangeContext ctx{this, chunk.start, 0, chunk.end - chunk.start};
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);

        std::string failure;
        for (int attempt = 1; attempt <= kMaxRangeAttempts; ++attempt) {
            const std::string range = std::to_string(ctx.start + ctx.hasWritten) + "-" + std::to_string(chunk.end - 1);
            curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());

            const CURLcode res = curl_easy_perform(curl);
            if (cancelled_) {
                return false;
            }
            if (hasError()) {
                return false;
            }
            if (res == CURLE_OK && ctx.hasWritten == ctx.expected) {
                return true;
            }

            failure = res != CURLE_OK ? std::string{"curl error: "} + curl_easy_strerror(res)
                                      : std::string{"Range download incomplete"};
            spdlog::warn("Range {} of {} failed (attempt {}/{}): {}", range, url_, attempt, kMaxRangeAttempts, failure);
        }

        registerError(failure);
        return false;
    }

    void streamDownload() {
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            registerError("Failed to allocate curl handle");
            return;
        }
        configureHandle(curl.get(), 1);

        RangeContext ctx{this, 0, 0, 0};
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK && !cancelled_ && !hasError()) {
            registerError(std::string{"curl error: "} + curl_easy_strerror(res));
        }
    }

    void configureHandle(CURL* curl, std::size_t worker_count) {
        curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &Impl::transferInfoCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, this);
        if (options_.speed_limit) {
            const auto per_connection = std::max<std::uint64_t>(1, *options_.speed_limit / worker_count);
            curl_easy_setopt(curl, CURLOPT_MAX_RECV_SPEED_LARGE, static_cast<curl_off_t>(per_connection));
        }
    }

    static int transferInfoCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        const auto* self = static_cast<Impl*>(userdata);
        // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
        return self->cancelled_ || self->hasError() ? 1 : 0;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<RangeContext*>(userdata);
        if (!ctx || !ctx->owner) {
            return 0;
        }

        Impl& self = *ctx->owner;
        const size_t total = size * nmemb;
        if (total == 0) {
            return 0;
        }
        if (ctx->expected > 0 && ctx->hasWritten + static_cast<curl_off_t>(total) > ctx->expected) {
            self.registerError("Server sent more data than the requested range");
            return 0;
        }

        {
            std::lock_guard<std::mutex> file_lock(self.file_mutex_);
            FILE* file = self.file_.get();
            if (!file) {
                return 0;
            }

            if (fseeko(file, ctx->start + ctx->hasWritten, SEEK_SET) != 0) {
                self.registerError("Failed to seek output file");
                return 0;
            }

            const size_t written = std::fwrite(ptr, 1, total, file);
            if (written != total) {
                self.registerError("Failed to write output file");
                return written;
            }
        }

        ctx->hasWritten += static_cast<curl_off_t>(total);
        std::uint64_t downloaded = 0;
        {
            std::lock_guard<std::mutex> state_lock(self.state_mutex_);
            self.downloaded_bytes_ += total;
            downloaded = self.downloaded_bytes_;
        }
        self.speed_.record(downloaded);
        self.signal_.publish(downloaded);

        return total;
    }

    [[nodiscard]] std::uint64_t downloadedBytes() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return downloaded_bytes_;
    }

    [[nodiscard]] bool hasError() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return has_error_;
    }

    void registerError(std::string message) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        has_error_ = true;
        if (error_message_.empty()) {
            error_message_ = std::move(message);
        }
    }

    std::string url_;
    std::filesystem::path destination_;
    DownloadOptions options_;

    std::unique_ptr<FILE, FileDeleter> file_{};
    std::future<void> coordinator_;
    std::atomic<bool> started_{false};
    std::atomic<bool> cancelled_{false};
    bool created_destination_{false};

    ProgressSignal signal_;
    SpeedTracker speed_;

    mutable std::mutex state_mutex_;
    mutable std::mutex file_mutex_;
    std::mutex queue_mutex_;
    std::deque<ChunkRange> pending_;

    std::optional<std::uint64_t> total_bytes_;
    std::uint64_t downloaded_bytes_{0};
    bool has_error_{false};
    std::string error_message_;
};

HttpDownloader::HttpDownloader(std::string url, const std::filesystem::path& directory, DownloadOptions options)
    : impl_(std::make_unique<Impl>(std::move(url), directory, options)) {}

HttpDownloader::~HttpDownloader() = default;

std::future<DownloadOutcome> HttpDownloader::start() { return impl_->start(); }

ProgressReceiver HttpDownloader::subscribe() const { return impl_->subscribe(); }

std::optional<std::uint64_t> HttpDownloader::totalSize() const { return impl_->totalSize(); }

std::uint64_t HttpDownloader::downloadSpeed() const { return impl_->downloadSpeed(); }

std::filesystem::path HttpDownloader::filePath() const { return impl_->filePath(); }

void HttpDownloader::cancel() noexcept { impl_->cancel(); }

} // namespace surge
