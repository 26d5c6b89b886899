#include "core/retrieval/channel_worker_pool.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <chrono>

namespace qr {

namespace {

ChannelQueryResult timeoutResult(Channel channel, const QString& reason)
{
    ChannelQueryResult result;
    result.status = ChannelQueryResult::Status::Timeout;
    result.errorMessage = QStringLiteral("%1 channel %2").arg(channelToString(channel), reason);
    return result;
}

} // namespace

ChannelWorkerPool::ChannelWorkerPool(int workerCount, int queueLimit)
    : m_queueLimit(std::max(1, queueLimit))
{
    const int count = std::max(1, workerCount);
    m_threads.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        m_threads.emplace_back([this]() { workerLoop(); });
    }
    LOG_DEBUG(qrRetrieval, "Channel worker pool started: %d worker(s), queue limit %d",
              count, m_queueLimit);
}

ChannelWorkerPool::~ChannelWorkerPool()
{
    std::deque<std::shared_ptr<Task>> dropped;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop = true;
        dropped.swap(m_queue);
    }
    m_cv.notify_all();

    for (const std::shared_ptr<Task>& task : dropped) {
        task->promise.set_value(timeoutResult(task->request.channel,
                                              QStringLiteral("dropped at shutdown")));
    }
    for (std::thread& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    LOG_DEBUG(qrRetrieval, "Channel worker pool stopped (%d queued task(s) dropped)",
              static_cast<int>(dropped.size()));
}

std::optional<std::future<ChannelQueryResult>> ChannelWorkerPool::submit(
    std::shared_ptr<ChunkStore> store, ChannelRequest request)
{
    auto task = std::make_shared<Task>();
    task->store = std::move(store);
    task->request = std::move(request);
    std::future<ChannelQueryResult> future = task->promise.get_future();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stop || static_cast<int>(m_queue.size()) >= m_queueLimit) {
            LOG_WARN(qrRetrieval, "Channel queue full (%d task(s)); %s query rejected",
                     static_cast<int>(m_queue.size()),
                     qUtf8Printable(channelToString(task->request.channel)));
            return std::nullopt;
        }
        m_queue.push_back(std::move(task));
    }
    m_cv.notify_one();
    return future;
}

int ChannelWorkerPool::pendingCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_queue.size()) + m_running;
}

void ChannelWorkerPool::workerLoop()
{
    for (;;) {
        std::shared_ptr<Task> task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]() { return m_stop || !m_queue.empty(); });
            if (m_stop && m_queue.empty()) {
                return;
            }
            task = m_queue.front();
            m_queue.pop_front();
            ++m_running;
        }

        ChannelQueryResult result = std::chrono::steady_clock::now() >= task->request.deadline
            ? timeoutResult(task->request.channel, QStringLiteral("expired before it started"))
            : task->store->query(task->request);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_running;
        }
        task->promise.set_value(std::move(result));
    }
}

} // namespace qr
