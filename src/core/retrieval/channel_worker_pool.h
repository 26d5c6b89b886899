#pragma once

#include "core/index/chunk_store.h"

#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace qr {

// ChannelWorkerPool -- persistent worker threads serving channel queries.
//
// Queries run on a fixed set of threads behind a bounded queue. A task whose
// deadline has already passed when a worker picks it up completes with
// Timeout without touching the store. The destructor fails every queued
// task, waits for in-flight queries and joins all workers.
class ChannelWorkerPool {
public:
    static constexpr int kDefaultWorkers = 5;
    static constexpr int kDefaultQueueLimit = 64;

    explicit ChannelWorkerPool(int workerCount = kDefaultWorkers,
                               int queueLimit = kDefaultQueueLimit);
    ~ChannelWorkerPool();

    ChannelWorkerPool(const ChannelWorkerPool&) = delete;
    ChannelWorkerPool& operator=(const ChannelWorkerPool&) = delete;

    // nullopt when the queue is full.
    std::optional<std::future<ChannelQueryResult>> submit(std::shared_ptr<ChunkStore> store,
                                                          ChannelRequest request);

    int workerCount() const { return static_cast<int>(m_threads.size()); }

    // Queued plus running tasks.
    int pendingCount() const;

private:
    struct Task {
        std::shared_ptr<ChunkStore> store;
        ChannelRequest request;
        std::promise<ChannelQueryResult> promise;
    };

    void workerLoop();

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::shared_ptr<Task>> m_queue;
    std::vector<std::thread> m_threads;
    int m_queueLimit = kDefaultQueueLimit;
    int m_running = 0;
    bool m_stop = false;
};

} // namespace qr
