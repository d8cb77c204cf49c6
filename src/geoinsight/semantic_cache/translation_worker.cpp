#include "geoinsight/semantic_cache/translation_worker.h"

#include <system_error>

#include "geoinsight/common/logger.h"

namespace geoinsight {
namespace semantic_cache {

TranslationWorker::TranslationWorker(std::shared_ptr<QueryTranslator> translator,
                                     size_t num_workers, size_t max_queue_size)
    : translator_(std::move(translator)), max_queue_size_(max_queue_size) {
    workers_.reserve(num_workers);
    for (size_t i = 0; i < num_workers; ++i) {
        try {
            workers_.emplace_back(&TranslationWorker::worker_loop, this);
        } catch (const std::system_error& e) {
            GEOINSIGHT_ERROR("Started {} of {} translation workers: {}", workers_.size(),
                             num_workers, e.what());
            break;
        }
    }
}

TranslationWorker::~TranslationWorker() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_requested_ = true;
    }
    queue_condition_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    // Workers are gone; nothing else will run what is still queued.
    for (auto& task : queue_) {
        task->promise.set_value(core::Result<StructuredQuery>(
            core::CancelledError("Translation abandoned at shutdown")));
    }
    queue_.clear();
}

core::Result<PendingTranslation> TranslationWorker::submit(const std::string& text,
                                                           const core::CallOptions& options) {
    auto task = std::make_unique<Task>();
    task->text = text;
    task->options = options;
    PendingTranslation pending = task->promise.get_future();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (workers_.empty() || shutdown_requested_) {
            rejected_++;
            return core::Result<PendingTranslation>(
                core::UpstreamUnavailableError("No translation worker is running"));
        }
        if (queue_.size() >= max_queue_size_) {
            rejected_++;
            return core::Result<PendingTranslation>(core::UpstreamUnavailableError(
                "Translator busy: " + std::to_string(queue_.size()) + " requests queued"));
        }
        queue_.push_back(std::move(task));
    }
    queue_condition_.notify_one();
    return core::Result<PendingTranslation>(std::move(pending));
}

size_t TranslationWorker::queue_size() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void TranslationWorker::worker_loop() {
    while (true) {
        std::unique_ptr<Task> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_condition_.wait(lock, [this] {
                return !queue_.empty() || shutdown_requested_;
            });
            if (shutdown_requested_) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        auto check = task->options.check("Translation");
        if (!check.ok()) {
            task->promise.set_value(core::Result<StructuredQuery>(check.error_detail()));
            continue;
        }

        try {
            task->promise.set_value(translator_->translate(task->text, task->options));
        } catch (const std::exception& e) {
            task->promise.set_value(core::Result<StructuredQuery>(
                core::UpstreamUnavailableError(std::string("Translation failed: ") + e.what())));
        }
    }
}

} // namespace semantic_cache
} // namespace geoinsight
