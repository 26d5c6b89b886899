#include <QtTest/QtTest>
#include "core/shared/candidate.h"

class TestCandidate : public QObject {
    Q_OBJECT

private slots:
    void testResolveTextPrefersTextField();
    void testResolveTextFallsThroughEmptyFields();
    void testResolveTextAllEmpty();
    void testKeyAndSource();
    void testRetrievalScorePrefersMmr();
    void testDedupeKeepsFirstOccurrence();
};

namespace {

qr::Candidate makeCandidate(const QString& path, int chunkId, double fused = 0.0)
{
    qr::Candidate candidate;
    candidate.filePath = path;
    candidate.fileName = QFileInfo(path).fileName();
    candidate.chunkId = chunkId;
    candidate.scores.fused = fused;
    return candidate;
}

} // namespace

void TestCandidate::testResolveTextPrefersTextField()
{
    qr::Candidate candidate = makeCandidate(QStringLiteral("docs/a.md"), 1);
    candidate.text = QStringLiteral("reader text");
    candidate.bm25Text = QStringLiteral("bm25 text");
    candidate.content = QStringLiteral("raw content");
    QCOMPARE(qr::resolveCandidateText(candidate), QStringLiteral("reader text"));
}

void TestCandidate::testResolveTextFallsThroughEmptyFields()
{
    qr::Candidate candidate = makeCandidate(QStringLiteral("docs/a.md"), 1);
    candidate.text = QStringLiteral("   ");
    candidate.embeddingText = QStringLiteral("embedding text");
    candidate.content = QStringLiteral("raw content");
    QCOMPARE(qr::resolveCandidateText(candidate), QStringLiteral("embedding text"));

    candidate.embeddingText.reset();
    QCOMPARE(qr::resolveCandidateText(candidate), QStringLiteral("raw content"));
}

void TestCandidate::testResolveTextAllEmpty()
{
    const qr::Candidate candidate = makeCandidate(QStringLiteral("docs/a.md"), 1);
    QVERIFY(qr::resolveCandidateText(candidate).isEmpty());
}

void TestCandidate::testKeyAndSource()
{
    qr::Candidate candidate = makeCandidate(QStringLiteral("docs/a.md"), 7);
    QCOMPARE(qr::candidateKey(candidate), QStringLiteral("docs/a.md#7"));
    QCOMPARE(qr::candidateSource(candidate), QStringLiteral("docs/a.md"));

    candidate.filePath.clear();
    QCOMPARE(qr::candidateSource(candidate), QStringLiteral("a.md"));
}

void TestCandidate::testRetrievalScorePrefersMmr()
{
    qr::Candidate candidate = makeCandidate(QStringLiteral("docs/a.md"), 1, 0.8);
    QCOMPARE(candidate.retrievalScore(), 0.8);
    candidate.scores.mmr = 0.3;
    QCOMPARE(candidate.retrievalScore(), 0.3);
}

void TestCandidate::testDedupeKeepsFirstOccurrence()
{
    std::vector<qr::Candidate> candidates = {
        makeCandidate(QStringLiteral("docs/a.md"), 1, 0.9),
        makeCandidate(QStringLiteral("docs/b.md"), 1, 0.8),
        makeCandidate(QStringLiteral("docs/a.md"), 1, 0.1),
        makeCandidate(QStringLiteral("docs/a.md"), 2, 0.7),
    };

    const std::vector<qr::Candidate> unique = qr::dedupeCandidates(candidates);
    QCOMPARE(static_cast<int>(unique.size()), 3);
    QCOMPARE(unique[0].scores.fused, 0.9);
    QCOMPARE(unique[1].filePath, QStringLiteral("docs/b.md"));
    QCOMPARE(unique[2].chunkId, 2);
}

QTEST_MAIN(TestCandidate)
#include "test_candidate.moc"
