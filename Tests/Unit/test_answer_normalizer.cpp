#include <QtTest/QtTest>
#include "core/reader/answer_normalizer.h"

class TestAnswerNormalizer : public QObject {
    Q_OBJECT

private slots:
    void testEmptyBecomesUnknown();
    void testTrimAndCollapseWhitespace();
    void testTrailingSemicolonsAndBackticksStripped();
    void testDatabaseTagKeepsFirstLine();
    void testDatabaseTagPrefersShortestSchemaLine();
    void testTruncation();
    void testLengthBoundForAllTags();
    void testIdempotent();
};

namespace {

const qr::Tag kAllTags[] = {qr::Tag::General, qr::Tag::DbWorkflows, qr::Tag::OpsHealth,
                            qr::Tag::MetaOps, qr::Tag::RagQaSingle, qr::Tag::RagQaMulti};

QStringList sampleAnswers()
{
    return {
        QString(),
        QStringLiteral("   "),
        QStringLiteral(";;``"),
        QStringLiteral("docs/guide.md"),
        QStringLiteral("  CREATE INDEX foo ON bar USING gin (baz);  "),
        QStringLiteral("CREATE TABLE a (id int);\nCREATE INDEX i ON a(id);\nnotes"),
        QStringLiteral("line one\nline two\n\tline three"),
        QStringLiteral("`SELECT 1;`"),
        QString(400, QLatin1Char('x')),
        QStringLiteral("word ").repeated(60),
        QStringLiteral("a;").repeated(120),
        QStringLiteral("I don't know"),
    };
}

} // namespace

void TestAnswerNormalizer::testEmptyBecomesUnknown()
{
    QCOMPARE(qr::AnswerNormalizer::normalize(QString(), qr::Tag::General), QStringLiteral("I don't know"));
    QCOMPARE(qr::AnswerNormalizer::normalize(QStringLiteral(" \n\t "), qr::Tag::DbWorkflows),
             QStringLiteral("I don't know"));
    QCOMPARE(qr::AnswerNormalizer::normalize(QStringLiteral("; ` ;"), qr::Tag::General),
             QStringLiteral("I don't know"));
    QVERIFY(qr::AnswerNormalizer::isUnknown(qr::AnswerNormalizer::unknownAnswer()));
}

void TestAnswerNormalizer::testTrimAndCollapseWhitespace()
{
    QCOMPARE(qr::AnswerNormalizer::normalize(QStringLiteral("  Restart   the\n worker\t now  "),
                                             qr::Tag::General),
             QStringLiteral("Restart the worker now"));
}

void TestAnswerNormalizer::testTrailingSemicolonsAndBackticksStripped()
{
    QCOMPARE(qr::AnswerNormalizer::normalize(QStringLiteral("`VACUUM ANALYZE chunks;`  ;"),
                                             qr::Tag::General),
             QStringLiteral("`VACUUM ANALYZE chunks"));
}

void TestAnswerNormalizer::testDatabaseTagKeepsFirstLine()
{
    QCOMPARE(qr::AnswerNormalizer::normalize(QStringLiteral("\nUse a GIN index.\nIt speeds up search."),
                                             qr::Tag::DbWorkflows),
             QStringLiteral("Use a GIN index."));
    // Other tags keep every line, collapsed into one.
    QCOMPARE(qr::AnswerNormalizer::normalize(QStringLiteral("Use a GIN index.\nIt speeds up search."),
                                             qr::Tag::General),
             QStringLiteral("Use a GIN index. It speeds up search."));
}

void TestAnswerNormalizer::testDatabaseTagPrefersShortestSchemaLine()
{
    const QString answer = QStringLiteral(
        "Run these:\nCREATE TABLE documents (id serial primary key, path text);\n"
        "CREATE INDEX idx_path ON documents(path);");
    QCOMPARE(qr::AnswerNormalizer::normalize(answer, qr::Tag::DbWorkflows),
             QStringLiteral("CREATE INDEX idx_path ON documents(path)"));

    // A single schema line does not override the first line.
    QCOMPARE(qr::AnswerNormalizer::normalize(QStringLiteral("Run this:\nCREATE INDEX i ON t(c);"),
                                             qr::Tag::DbWorkflows),
             QStringLiteral("Run this:"));
}

void TestAnswerNormalizer::testTruncation()
{
    const QString normalized = qr::AnswerNormalizer::normalize(QString(400, QLatin1Char('x')),
                                                               qr::Tag::General);
    QCOMPARE(normalized.size(), qr::AnswerNormalizer::kMaxAnswerChars);
    QVERIFY(normalized.endsWith(QStringLiteral("...")));
    QCOMPARE(normalized.left(177), QString(177, QLatin1Char('x')));

    const QString exact(180, QLatin1Char('y'));
    QCOMPARE(qr::AnswerNormalizer::normalize(exact, qr::Tag::General), exact);
}

void TestAnswerNormalizer::testLengthBoundForAllTags()
{
    for (const QString& answer : sampleAnswers()) {
        for (qr::Tag tag : kAllTags) {
            QVERIFY(qr::AnswerNormalizer::normalize(answer, tag).size()
                    <= qr::AnswerNormalizer::kMaxAnswerChars);
        }
    }
}

void TestAnswerNormalizer::testIdempotent()
{
    for (const QString& answer : sampleAnswers()) {
        for (qr::Tag tag : kAllTags) {
            const QString once = qr::AnswerNormalizer::normalize(answer, tag);
            QCOMPARE(qr::AnswerNormalizer::normalize(once, tag), once);
        }
    }
}

QTEST_MAIN(TestAnswerNormalizer)
#include "test_answer_normalizer.moc"
