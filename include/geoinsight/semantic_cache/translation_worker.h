#ifndef GEOINSIGHT_SEMANTIC_CACHE_TRANSLATION_WORKER_H_
#define GEOINSIGHT_SEMANTIC_CACHE_TRANSLATION_WORKER_H_

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "geoinsight/core/call_options.h"
#include "geoinsight/core/result.h"
#include "geoinsight/semantic_cache/query_translator.h"

namespace geoinsight {
namespace semantic_cache {

using PendingTranslation = std::future<core::Result<StructuredQuery>>;

/**
 * @brief Fixed pool of threads running translator calls off the request path
 *
 * The queue is bounded: when every worker is busy and the queue is full,
 * submit() fails with UPSTREAM_UNAVAILABLE instead of growing. A queued call
 * whose deadline passed or whose caller cancelled is completed with that
 * error without reaching the translator. The destructor joins the workers,
 * so a translator must honour the deadline it is handed.
 */
class TranslationWorker {
public:
    TranslationWorker(std::shared_ptr<QueryTranslator> translator, size_t num_workers,
                      size_t max_queue_size);
    ~TranslationWorker();

    TranslationWorker(const TranslationWorker&) = delete;
    TranslationWorker& operator=(const TranslationWorker&) = delete;

    core::Result<PendingTranslation> submit(const std::string& text,
                                            const core::CallOptions& options);

    size_t workers() const { return workers_.size(); }
    size_t queue_size() const;
    uint64_t rejected() const { return rejected_.load(); }

private:
    struct Task {
        std::string text;
        core::CallOptions options;
        std::promise<core::Result<StructuredQuery>> promise;
    };

    void worker_loop();

    std::shared_ptr<QueryTranslator> translator_;
    const size_t max_queue_size_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::deque<std::unique_ptr<Task>> queue_;
    bool shutdown_requested_ = false;
    std::vector<std::thread> workers_;
    std::atomic<uint64_t> rejected_{0};
};

} // namespace semantic_cache
} // namespace geoinsight

#endif // GEOINSIGHT_SEMANTIC_CACHE_TRANSLATION_WORKER_H_
