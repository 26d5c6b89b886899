#include <QtTest/QtTest>
#include "core/retrieval/channel_worker_pool.h"

#include <atomic>
#include <chrono>
#include <thread>

class TestChannelWorkerPool : public QObject {
    Q_OBJECT

private slots:
    void testRunsQuery();
    void testExpiredTaskSkipsStore();
    void testQueueLimitRejects();
    void testDestructorJoinsAndFailsQueued();
};

namespace {

class CountingStore : public qr::ChunkStore {
public:
    qr::ChannelQueryResult query(const qr::ChannelRequest& request) override
    {
        started.fetch_add(1);
        std::this_thread::sleep_for(delay);
        qr::ChannelQueryResult result;
        qr::ChunkRow row;
        row.filePath = QStringLiteral("docs/%1.md").arg(qr::channelToString(request.channel));
        row.score = 1.0;
        result.rows.push_back(row);
        finished.fetch_add(1);
        return result;
    }

    qr::ChannelQueryResult fetchDocumentChunks(const QString&, int) override { return {}; }

    std::chrono::milliseconds delay{0};
    std::atomic<int> started{0};
    std::atomic<int> finished{0};
};

qr::ChannelRequest request(qr::Channel channel, std::chrono::milliseconds budget)
{
    qr::ChannelRequest req;
    req.channel = channel;
    req.text = QStringLiteral("worker pool");
    req.deadline = std::chrono::steady_clock::now() + budget;
    return req;
}

} // namespace

void TestChannelWorkerPool::testRunsQuery()
{
    auto store = std::make_shared<CountingStore>();
    qr::ChannelWorkerPool pool(2);
    QCOMPARE(pool.workerCount(), 2);

    auto future = pool.submit(store, request(qr::Channel::Title, std::chrono::seconds(5)));
    QVERIFY(future.has_value());
    const qr::ChannelQueryResult result = future->get();
    QVERIFY(result.ok());
    QCOMPARE(static_cast<int>(result.rows.size()), 1);
    QCOMPARE(result.rows.front().filePath, QStringLiteral("docs/title.md"));
    QTRY_COMPARE(pool.pendingCount(), 0);
}

void TestChannelWorkerPool::testExpiredTaskSkipsStore()
{
    auto store = std::make_shared<CountingStore>();
    qr::ChannelWorkerPool pool(1);

    auto future = pool.submit(store, request(qr::Channel::Lexical, std::chrono::milliseconds(-1)));
    QVERIFY(future.has_value());
    const qr::ChannelQueryResult result = future->get();
    QCOMPARE(result.status, qr::ChannelQueryResult::Status::Timeout);
    QVERIFY(result.errorMessage.has_value());
    QCOMPARE(store->started.load(), 0);
}

void TestChannelWorkerPool::testQueueLimitRejects()
{
    auto store = std::make_shared<CountingStore>();
    store->delay = std::chrono::milliseconds(200);
    qr::ChannelWorkerPool pool(1, 1);

    auto running = pool.submit(store, request(qr::Channel::Path, std::chrono::seconds(5)));
    QVERIFY(running.has_value());
    QTRY_COMPARE(store->started.load(), 1);

    auto queued = pool.submit(store, request(qr::Channel::Short, std::chrono::seconds(5)));
    QVERIFY(queued.has_value());
    QVERIFY(!pool.submit(store, request(qr::Channel::Title, std::chrono::seconds(5))).has_value());
    QCOMPARE(pool.pendingCount(), 2);

    QVERIFY(running->get().ok());
    QVERIFY(queued->get().ok());
}

void TestChannelWorkerPool::testDestructorJoinsAndFailsQueued()
{
    auto store = std::make_shared<CountingStore>();
    store->delay = std::chrono::milliseconds(200);

    std::optional<std::future<qr::ChannelQueryResult>> running;
    std::optional<std::future<qr::ChannelQueryResult>> queued;
    {
        qr::ChannelWorkerPool pool(1, 4);
        running = pool.submit(store, request(qr::Channel::Path, std::chrono::seconds(5)));
        QVERIFY(running.has_value());
        QTRY_COMPARE(store->started.load(), 1);
        queued = pool.submit(store, request(qr::Channel::Short, std::chrono::seconds(5)));
        QVERIFY(queued.has_value());
    }

    // The in-flight query finished before the pool went away; the queued one
    // never reached the store.
    QCOMPARE(store->started.load(), 1);
    QCOMPARE(store->finished.load(), 1);
    QCOMPARE(running->wait_for(std::chrono::seconds(0)), std::future_status::ready);
    QVERIFY(running->get().ok());
    QCOMPARE(queued->wait_for(std::chrono::seconds(0)), std::future_status::ready);
    QCOMPARE(queued->get().status, qr::ChannelQueryResult::Status::Timeout);
    QCOMPARE(store.use_count(), 1L);
}

QTEST_MAIN(TestChannelWorkerPool)
#include "test_channel_worker_pool.moc"
