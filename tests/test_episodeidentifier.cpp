#include <QtTest/QtTest>
#include <QSet>
#include "../submux/src/episodeidentifier.h"

class TestEpisodeIdentifier : public QObject
{
    Q_OBJECT

private slots:
    void testDefaultIsInvalid()
    {
        EpisodeIdentifier id;
        QVERIFY(!id.isValid());
        QCOMPARE(id.toString(), QString());
    }

    void testBounds()
    {
        QVERIFY(EpisodeIdentifier(1, 1).isValid());
        QVERIFY(EpisodeIdentifier(99, 9999).isValid());
        QVERIFY(!EpisodeIdentifier(0, 1).isValid());
        QVERIFY(!EpisodeIdentifier(100, 1).isValid());
        QVERIFY(!EpisodeIdentifier(1, 0).isValid());
        QVERIFY(!EpisodeIdentifier(1, 10000).isValid());
    }

    void testCanonicalText()
    {
        QCOMPARE(EpisodeIdentifier(2, 8).toString(), QString("S02E08"));
        QCOMPARE(EpisodeIdentifier(1, 123).toString(), QString("S01E123"));
        QCOMPARE(EpisodeIdentifier(12, 1005).toString(), QString("S12E1005"));
    }

    void testPaddingIsIrrelevant()
    {
        // S2E8, S02E08 and S02E008 are the same episode
        EpisodeIdentifier a = EpisodeIdentifier::fromString("S2E8");
        EpisodeIdentifier b = EpisodeIdentifier::fromString("S02E08");
        EpisodeIdentifier c = EpisodeIdentifier::fromString("s02e008");
        QVERIFY(a.isValid());
        QVERIFY(a == b);
        QVERIFY(b == c);
        QCOMPARE(qHash(a), qHash(c));

        // Normalizing twice changes nothing
        QVERIFY(EpisodeIdentifier::fromString(c.toString()) == c);
        QCOMPARE(EpisodeIdentifier::fromString(c.toString()).toString(), c.toString());
    }

    void testFromStringRejectsGarbage()
    {
        QVERIFY(!EpisodeIdentifier::fromString("").isValid());
        QVERIFY(!EpisodeIdentifier::fromString("E08").isValid());
        QVERIFY(!EpisodeIdentifier::fromString("S00E01").isValid());
        QVERIFY(!EpisodeIdentifier::fromString("S01E01x").isValid());
    }

    void testEqualityIgnoresRankAndExplicitness()
    {
        EpisodeIdentifier explicitSeason(1, 5, 0, true);
        EpisodeIdentifier defaulted(1, 5, 21, false);
        QVERIFY(explicitSeason == defaulted);
        QVERIFY(!(explicitSeason != defaulted));

        QSet<EpisodeIdentifier> set;
        set.insert(explicitSeason);
        QVERIFY(set.contains(defaulted));
    }

    void testWithSeasonMarksExplicit()
    {
        EpisodeIdentifier defaulted(1, 1, 22, false);
        EpisodeIdentifier adopted = defaulted.withSeason(8);
        QCOMPARE(adopted.season(), 8);
        QCOMPARE(adopted.episode(), 1);
        QVERIFY(adopted.isSeasonExplicit());
        QCOMPARE(adopted.sourcePatternRank(), 22);
    }

    void testOrdering()
    {
        QVERIFY(EpisodeIdentifier(1, 10) < EpisodeIdentifier(2, 1));
        QVERIFY(EpisodeIdentifier(2, 1) < EpisodeIdentifier(2, 2));
        QVERIFY(!(EpisodeIdentifier(2, 2) < EpisodeIdentifier(2, 2)));
    }
};

QTEST_MAIN(TestEpisodeIdentifier)
#include "test_episodeidentifier.moc"
