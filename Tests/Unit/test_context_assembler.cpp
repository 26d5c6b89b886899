#include <QtTest/QtTest>
#include "core/reader/context_assembler.h"

#include <cmath>
#include <map>

class TestContextAssembler : public QObject {
    Q_OBJECT

private slots:
    void testFormatLineKeepsPercentSequences();
    void testEmptyCandidatesYieldEmptyBundle();
    void testLineFormat();
    void testPerChunkAndTotalBounds();
    void testMaxCharsBudget();
    void testOverlapScore();
    void testPhraseAndFileBonuses();
    void testSqlBonusesAndFirstLineMultiplier();
    void testTagBonus();
    void testRetrievalScoreBreaksTies();
    void testBestSentencesSelected();
    void testNegativeLimitsYieldEmptyBundle();
};

namespace {

qr::Candidate makeCandidate(const QString& path, int chunkId, const QString& text, double fused = 0.5)
{
    qr::Candidate candidate;
    candidate.filePath = path;
    candidate.fileName = QFileInfo(path).fileName();
    candidate.chunkId = chunkId;
    candidate.text = text;
    candidate.scores.fused = fused;
    return candidate;
}

} // namespace

void TestContextAssembler::testEmptyCandidatesYieldEmptyBundle()
{
    const qr::ContextAssembler assembler;
    const qr::ContextBundle bundle = assembler.assemble({}, QStringLiteral("anything"), qr::Tag::General);
    QVERIFY(bundle.isEmpty());
    QVERIFY(bundle.text.isEmpty());
}

void TestContextAssembler::testLineFormat()
{
    const qr::ContextAssembler assembler;
    const qr::ContextBundle bundle = assembler.assemble(
        {makeCandidate(QStringLiteral("docs/guide.md"), 3, QStringLiteral("Only one sentence here."))},
        QStringLiteral("sentence"), qr::Tag::General);
    QCOMPARE(static_cast<int>(bundle.picks.size()), 1);
    QCOMPARE(bundle.text, QStringLiteral("[docs/guide.md#chunk:3] Only one sentence here."));
    QCOMPARE(bundle.picks[0].filePath, QStringLiteral("docs/guide.md"));
    QCOMPARE(bundle.picks[0].chunkId, 3);
    QCOMPARE(bundle.picks[0].retrievalScore, 0.5);
}

void TestContextAssembler::testPerChunkAndTotalBounds()
{
    std::vector<qr::Candidate> candidates;
    for (int i = 0; i < 5; ++i) {
        candidates.push_back(makeCandidate(
            QStringLiteral("docs/%1.md").arg(i), i,
            QStringLiteral("Index tuning one. Index tuning two. Index tuning three. "
                           "Index tuning four. Index tuning five.")));
    }

    qr::ReaderConfig config;
    config.perChunk = 2;
    config.total = 7;
    const qr::ContextAssembler assembler(config);
    const qr::ContextBundle bundle = assembler.assemble(candidates, QStringLiteral("index tuning"),
                                                        qr::Tag::General);

    QCOMPARE(static_cast<int>(bundle.picks.size()), 7);
    std::map<QString, int> perChunk;
    for (const qr::SentencePick& pick : bundle.picks) {
        QVERIFY(++perChunk[QStringLiteral("%1#%2").arg(pick.filePath).arg(pick.chunkId)] <= 2);
    }
    QCOMPARE(bundle.text.count(QLatin1Char('\n')), 6);
}

void TestContextAssembler::testMaxCharsBudget()
{
    std::vector<qr::Candidate> candidates;
    for (int i = 0; i < 4; ++i) {
        candidates.push_back(makeCandidate(QStringLiteral("docs/%1.md").arg(i), 0,
                                           QStringLiteral("A fairly long sentence about retrieval budgets.")));
    }
    qr::ReaderConfig config;
    config.maxChars = 140;
    const qr::ContextAssembler assembler(config);
    const qr::ContextBundle bundle = assembler.assemble(candidates, QStringLiteral("retrieval budgets"),
                                                        qr::Tag::General);

    QVERIFY(bundle.text.size() <= 140);
    QCOMPARE(static_cast<int>(bundle.picks.size()), 2);
    QCOMPARE(bundle.text.split(QLatin1Char('\n')).size(), 2);
}

void TestContextAssembler::testOverlapScore()
{
    const QSet<QString> question = {QStringLiteral("configure"), QStringLiteral("vector"),
                                    QStringLiteral("index")};
    const double score = qr::ContextAssembler::scoreSentence(
        QStringLiteral("Configure the vector index carefully."), question,
        QStringLiteral("docs/misc.md"), QString(), qr::Tag::General, {});
    QVERIFY(qAbs(score - 3.0 / std::sqrt(5.0)) < 1e-9);

    const double none = qr::ContextAssembler::scoreSentence(
        QStringLiteral("Nothing shared."), question, QStringLiteral("docs/misc.md"), QString(),
        qr::Tag::General, {});
    QCOMPARE(none, 0.0);
}

void TestContextAssembler::testPhraseAndFileBonuses()
{
    const QSet<QString> question;
    const QString sentence = QStringLiteral("Tune the Vector Index nightly.");

    const double phrase = qr::ContextAssembler::scoreSentence(
        sentence, question, QStringLiteral("docs/misc.md"), QString(), qr::Tag::General,
        {QStringLiteral("vector index")});
    QVERIFY(qAbs(phrase - 0.4) < 1e-9);

    const double file = qr::ContextAssembler::scoreSentence(
        sentence, question, QStringLiteral("docs/vector_guide.md"), QString(), qr::Tag::General, {});
    QVERIFY(qAbs(file - 0.2) < 1e-9);
}

void TestContextAssembler::testSqlBonusesAndFirstLineMultiplier()
{
    const QSet<QString> question;
    const QString statement = QStringLiteral("CREATE INDEX idx ON chunks USING hnsw (embedding);");

    const double firstLine = qr::ContextAssembler::scoreSentence(
        statement, question, QStringLiteral("docs/misc.md"), statement + QStringLiteral("\nmore"),
        qr::Tag::DbWorkflows, {});
    QVERIFY(qAbs(firstLine - (0.35 + 0.10 + 0.05) * 1.15) < 1e-9);

    const double laterLine = qr::ContextAssembler::scoreSentence(
        statement, question, QStringLiteral("docs/misc.md"), QStringLiteral("Intro.\n") + statement,
        qr::Tag::DbWorkflows, {});
    QVERIFY(qAbs(laterLine - 0.50) < 1e-9);

    const double select = qr::ContextAssembler::scoreSentence(
        QStringLiteral("SELECT id FROM chunks;"), question, QStringLiteral("docs/misc.md"),
        QStringLiteral("SELECT id FROM chunks;"), qr::Tag::General, {});
    QVERIFY(qAbs(select - 0.10) < 1e-9);
}

void TestContextAssembler::testTagBonus()
{
    const QSet<QString> question;
    const QString sentence = QStringLiteral("Check the health endpoint before a rollout.");

    const double ops = qr::ContextAssembler::scoreSentence(
        sentence, question, QStringLiteral("docs/misc.md"), QString(), qr::Tag::OpsHealth, {});
    QVERIFY(qAbs(ops - 0.20) < 1e-9);
    const double meta = qr::ContextAssembler::scoreSentence(
        sentence, question, QStringLiteral("docs/misc.md"), QString(), qr::Tag::MetaOps, {});
    QVERIFY(qAbs(meta - 0.20) < 1e-9);
    const double general = qr::ContextAssembler::scoreSentence(
        sentence, question, QStringLiteral("docs/misc.md"), QString(), qr::Tag::General, {});
    QCOMPARE(general, 0.0);
}

void TestContextAssembler::testRetrievalScoreBreaksTies()
{
    const QString text = QStringLiteral("Identical sentence about failover.");
    qr::Candidate low = makeCandidate(QStringLiteral("docs/low.md"), 0, text, 0.2);
    qr::Candidate high = makeCandidate(QStringLiteral("docs/high.md"), 0, text, 0.2);
    high.scores.mmr = 0.9;

    const qr::ContextAssembler assembler;
    const qr::ContextBundle bundle = assembler.assemble({low, high}, QStringLiteral("failover"),
                                                        qr::Tag::General);
    QCOMPARE(static_cast<int>(bundle.picks.size()), 2);
    QCOMPARE(bundle.picks[0].filePath, QStringLiteral("docs/high.md"));
    QCOMPARE(bundle.picks[0].retrievalScore, 0.9);
}

void TestContextAssembler::testBestSentencesSelected()
{
    qr::ReaderConfig config;
    config.perChunk = 1;
    const qr::ContextAssembler assembler(config);
    const qr::ContextBundle bundle = assembler.assemble(
        {makeCandidate(QStringLiteral("docs/misc.md"), 0,
                       QStringLiteral("Intro text without overlap. The replica promotion runs failover. Outro."))},
        QStringLiteral("how does failover promotion work"), qr::Tag::General);
    QCOMPARE(static_cast<int>(bundle.picks.size()), 1);
    QCOMPARE(bundle.picks[0].sentence, QStringLiteral("The replica promotion runs failover."));
}

void TestContextAssembler::testNegativeLimitsYieldEmptyBundle()
{
    qr::ReaderConfig config;
    config.total = -1;
    const qr::ContextAssembler assembler(config);
    const qr::ContextBundle bundle = assembler.assemble(
        {makeCandidate(QStringLiteral("docs/misc.md"), 0, QStringLiteral("Some text."))},
        QStringLiteral("text"), qr::Tag::General);
    QVERIFY(bundle.isEmpty());
}

void TestContextAssembler::testFormatLineKeepsPercentSequences()
{
    qr::SentencePick pick;
    pick.filePath = QStringLiteral("docs/50%2off.md");
    pick.chunkId = 7;
    pick.sentence = QStringLiteral("Discount codes look like %1 or %3.");
    QCOMPARE(qr::ContextAssembler::formatLine(pick),
             QStringLiteral("[docs/50%2off.md#chunk:7] Discount codes look like %1 or %3."));
}

QTEST_MAIN(TestContextAssembler)
#include "test_context_assembler.moc"
