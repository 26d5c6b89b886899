#include <QtTest/QtTest>
#include "core/reader/doc_summary.h"

class TestDocSummary : public QObject {
    Q_OBJECT

private slots:
    void testTldrTableCell();
    void testTldrTableWithoutDataRow();
    void testTldrBlockquoteBullet();
    void testLabelledPurpose();
    void testLabelledWhatThisFileIs();
    void testHtmlCommentsIgnored();
    void testFirstSentenceWithEnoughWords();
    void testNoSummary();
    void testSummarizePicksHintedDocument();
    void testSummarizeFallsBackToReaderText();
    void testSummarizeRequiresSlug();
};

namespace {

qr::Candidate makeCandidate(const QString& path, const QString& content)
{
    qr::Candidate candidate;
    candidate.filePath = path;
    candidate.fileName = QFileInfo(path).fileName();
    candidate.content = content;
    return candidate;
}

const QString kTableDoc = QStringLiteral(
    "# Rollout guide\n"
    "| What this file is | Read when | Do next |\n"
    "|---|---|---|\n"
    "| Canary rollout playbook for the ingest fleet. | Before a deploy | Run the checklist |\n"
    "\n"
    "Purpose: something else entirely.\n");

} // namespace

void TestDocSummary::testTldrTableCell()
{
    const auto summary = qr::DocumentSummarizer::tldrTableSummary(kTableDoc);
    QVERIFY(summary.has_value());
    QCOMPARE(*summary, QStringLiteral("Canary rollout playbook for the ingest fleet"));
}

void TestDocSummary::testTldrTableWithoutDataRow()
{
    const QString markdown = QStringLiteral(
        "| What this file is | Read when | Do next |\n|---|---|---|\n\nNo rows here.");
    QVERIFY(!qr::DocumentSummarizer::tldrTableSummary(markdown).has_value());
}

void TestDocSummary::testTldrBlockquoteBullet()
{
    const QString markdown = QStringLiteral(
        "# Backups\n"
        "> TL;DR\n"
        ">\n"
        "> - Explains how backups rotate nightly.\n"
        "> - Restores are tested weekly.\n"
        "\n"
        "Body text.");
    const auto summary = qr::DocumentSummarizer::tldrBlockquoteSummary(markdown);
    QVERIFY(summary.has_value());
    QCOMPARE(*summary, QStringLiteral("Explains how backups rotate nightly"));

    QVERIFY(!qr::DocumentSummarizer::tldrBlockquoteSummary(QStringLiteral("> Just a quote.")).has_value());
}

void TestDocSummary::testLabelledPurpose()
{
    const auto summary = qr::DocumentSummarizer::textSummary(
        QStringLiteral("**Purpose**: Documents the retention policy. More text follows here."));
    QVERIFY(summary.has_value());
    QCOMPARE(*summary, QStringLiteral("Documents the retention policy."));
}

void TestDocSummary::testLabelledWhatThisFileIs()
{
    const auto summary = qr::DocumentSummarizer::textSummary(
        QStringLiteral("Intro.\nWhat this file is: a map of the schema migrations.\nPurpose: other."));
    QVERIFY(summary.has_value());
    QCOMPARE(*summary, QStringLiteral("a map of the schema migrations"));
}

void TestDocSummary::testHtmlCommentsIgnored()
{
    const auto summary = qr::DocumentSummarizer::textSummary(
        QStringLiteral("<!-- purpose: hidden note -->\nSummary: Visible summary line."));
    QVERIFY(summary.has_value());
    QCOMPARE(*summary, QStringLiteral("Visible summary line"));
}

void TestDocSummary::testFirstSentenceWithEnoughWords()
{
    const auto summary = qr::DocumentSummarizer::textSummary(
        QStringLiteral("# Notes\nShort line. This guide walks through every step of the release train."));
    QVERIFY(summary.has_value());
    QCOMPARE(*summary, QStringLiteral("This guide walks through every step of the release train."));
}

void TestDocSummary::testNoSummary()
{
    QVERIFY(!qr::DocumentSummarizer::textSummary(QStringLiteral("Tiny. Also tiny.")).has_value());
    QVERIFY(!qr::DocumentSummarizer::textSummary(QString()).has_value());
}

void TestDocSummary::testSummarizePicksHintedDocument()
{
    const std::vector<qr::Candidate> candidates = {
        makeCandidate(QStringLiteral("ops/other.md"),
                      QStringLiteral("Purpose: describes an unrelated runbook for operators.")),
        makeCandidate(QStringLiteral("docs/rollout-guide.md"), kTableDoc),
    };
    const auto summary = qr::DocumentSummarizer::summarize(candidates, QStringLiteral("Rollout-Guide"));
    QVERIFY(summary.has_value());
    QCOMPARE(*summary, QStringLiteral("Canary rollout playbook for the ingest fleet"));
}

void TestDocSummary::testSummarizeFallsBackToReaderText()
{
    qr::Candidate candidate = makeCandidate(QStringLiteral("docs/reader.md"), QStringLiteral("Short."));
    candidate.text = QStringLiteral("Purpose: Reader text explains the chunk layout.");
    const auto summary = qr::DocumentSummarizer::summarize({candidate}, QStringLiteral("reader"));
    QVERIFY(summary.has_value());
    QCOMPARE(*summary, QStringLiteral("Reader text explains the chunk layout"));
}

void TestDocSummary::testSummarizeRequiresSlug()
{
    const std::vector<qr::Candidate> candidates = {
        makeCandidate(QStringLiteral("docs/rollout-guide.md"), kTableDoc),
    };
    QVERIFY(!qr::DocumentSummarizer::summarize(candidates, QString()).has_value());
    QVERIFY(!qr::DocumentSummarizer::summarize(candidates, QStringLiteral("missing")).has_value());
}

QTEST_MAIN(TestDocSummary)
#include "test_doc_summary.moc"
