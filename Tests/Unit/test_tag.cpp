#include <QtTest/QtTest>
#include "core/shared/tag.h"

class TestTag : public QObject {
    Q_OBJECT

private slots:
    void testParseKnownLabels();
    void testParseIsCaseAndWhitespaceInsensitive();
    void testUnknownLabelMapsToGeneral();
    void testMalformedLabelsRejected();
    void testTagToStringRoundTrip();
    void testDatabaseWorkflow();
    void testBonusProfiles();
};

void TestTag::testParseKnownLabels()
{
    QCOMPARE(*qr::parseTag(QStringLiteral("db_workflows")), qr::Tag::DbWorkflows);
    QCOMPARE(*qr::parseTag(QStringLiteral("ops_health")), qr::Tag::OpsHealth);
    QCOMPARE(*qr::parseTag(QStringLiteral("meta_ops")), qr::Tag::MetaOps);
    QCOMPARE(*qr::parseTag(QStringLiteral("rag_qa_single")), qr::Tag::RagQaSingle);
    QCOMPARE(*qr::parseTag(QStringLiteral("rag_qa_multi")), qr::Tag::RagQaMulti);
}

void TestTag::testParseIsCaseAndWhitespaceInsensitive()
{
    const auto tag = qr::parseTag(QStringLiteral("  DB_Workflows \n"));
    QVERIFY(tag.has_value());
    QCOMPARE(*tag, qr::Tag::DbWorkflows);
    QCOMPARE(qr::canonicalTagLabel(QStringLiteral(" Ops_Health ")), QStringLiteral("ops_health"));
}

void TestTag::testUnknownLabelMapsToGeneral()
{
    const auto tag = qr::parseTag(QStringLiteral("research_notes"));
    QVERIFY(tag.has_value());
    QCOMPARE(*tag, qr::Tag::General);
}

void TestTag::testMalformedLabelsRejected()
{
    QVERIFY(!qr::parseTag(QString()).has_value());
    QVERIFY(!qr::parseTag(QStringLiteral("   ")).has_value());
    QVERIFY(!qr::parseTag(QStringLiteral("db-workflows")).has_value());
    QVERIFY(!qr::parseTag(QStringLiteral("ops health")).has_value());
    QVERIFY(!qr::parseTag(QStringLiteral("tag;drop")).has_value());
}

void TestTag::testTagToStringRoundTrip()
{
    for (qr::Tag tag : {qr::Tag::General, qr::Tag::DbWorkflows, qr::Tag::OpsHealth,
                        qr::Tag::MetaOps, qr::Tag::RagQaSingle, qr::Tag::RagQaMulti}) {
        const auto parsed = qr::parseTag(qr::tagToString(tag));
        QVERIFY(parsed.has_value());
        QCOMPARE(*parsed, tag);
    }
}

void TestTag::testDatabaseWorkflow()
{
    QVERIFY(qr::isDatabaseWorkflow(qr::Tag::DbWorkflows));
    QVERIFY(!qr::isDatabaseWorkflow(qr::Tag::General));
    QVERIFY(!qr::isDatabaseWorkflow(qr::Tag::OpsHealth));
}

void TestTag::testBonusProfiles()
{
    const qr::TagBonusProfile& ops = qr::tagBonusProfile(qr::Tag::OpsHealth);
    QCOMPARE(ops.bonus, 0.20);
    QVERIFY(ops.tokens.contains(QStringLiteral("health")));
    QVERIFY(ops.tokens.contains(QStringLiteral("monitoring")));

    const qr::TagBonusProfile& meta = qr::tagBonusProfile(qr::Tag::MetaOps);
    QCOMPARE(meta.bonus, 0.20);
    QVERIFY(meta.tokens.contains(QStringLiteral("rollout")));
    QVERIFY(meta.tokens.contains(QStringLiteral("deploy")));

    QCOMPARE(qr::tagBonusProfile(qr::Tag::General).bonus, 0.0);
    QVERIFY(qr::tagBonusProfile(qr::Tag::DbWorkflows).tokens.isEmpty());
}

QTEST_MAIN(TestTag)
#include "test_tag.moc"
