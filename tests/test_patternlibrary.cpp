#include <QtTest/QtTest>
#include "../submux/src/patternlibrary.h"

class TestPatternLibrary : public QObject
{
    Q_OBJECT

private:
    EpisodeIdentifier applyNamed(const QString& ruleName, const QString& name)
    {
        const PatternLibrary& library = PatternLibrary::instance();
        int rank = library.rankOf(ruleName);
        if (rank < 0) {
            return EpisodeIdentifier();
        }
        return library.apply(library.rules().at(rank), name);
    }

private slots:
    void testRanksFollowTableOrder()
    {
        const PatternLibrary& library = PatternLibrary::instance();
        QVERIFY(library.ruleCount() > 20);
        for (int i = 0; i < library.ruleCount(); ++i) {
            QCOMPARE(library.rules().at(i).rank, i);
        }
    }

    void testSpecificRulesComeFirst()
    {
        const PatternLibrary& library = PatternLibrary::instance();
        QCOMPARE(library.rankOf("S##E##"), 0);

        // Season markers before episode-only markers before bare numbers
        QVERIFY(library.rankOf("S##E##") < library.rankOf("1st Season - ##"));
        QVERIFY(library.rankOf("1st Season - ##") < library.rankOf("Ep##"));
        QVERIFY(library.rankOf("Ep##") < library.rankOf("## - ##"));
        QVERIFY(library.rankOf("## - ##") < library.rankOf("- ##"));
        QVERIFY(library.rankOf("- ##") < library.rankOf("_##"));
        QCOMPARE(library.rankOf("_##"), library.ruleCount() - 1);

        QCOMPARE(library.rankOf("no such rule"), -1);
    }

    void testSeasonlessRulesDefaultToSeasonOne()
    {
        EpisodeIdentifier id = applyNamed("Ep##", "Show Episode 12");
        QVERIFY(id.isValid());
        QCOMPARE(id.season(), 1);
        QCOMPARE(id.episode(), 12);
        QVERIFY(!id.isSeasonExplicit());
        QCOMPARE(id.sourcePatternRank(), PatternLibrary::instance().rankOf("Ep##"));

        EpisodeIdentifier explicitId = applyNamed("S##E##", "Show.S03E04");
        QVERIFY(explicitId.isSeasonExplicit());
        QCOMPARE(explicitId.season(), 3);
    }

    void testIndividualRules()
    {
        EpisodeIdentifier id = applyNamed("##x##", "Show.2x05");
        QCOMPARE(id.season(), 2);
        QCOMPARE(id.episode(), 5);

        id = applyNamed("1st Season - ##", "Show 2nd Season - 03");
        QCOMPARE(id.season(), 2);
        QCOMPARE(id.episode(), 3);

        id = applyNamed("Season ## - ##", "Show Season 4 - 11");
        QCOMPARE(id.season(), 4);
        QCOMPARE(id.episode(), 11);

        id = applyNamed("[##]", "[Group] Show [07]");
        QCOMPARE(id.season(), 1);
        QCOMPARE(id.episode(), 7);
    }

    void testYearGuard()
    {
        // "- 2019" is a year, not episode 2019
        QVERIFY(!applyNamed("- ##", "Show - 2019").isValid());
        QVERIFY(!applyNamed("_##", "Show_2020").isValid());

        // A later occurrence in the same name is still tried
        EpisodeIdentifier id = applyNamed("- ##", "Show - 1999 Remaster - 05");
        QVERIFY(id.isValid());
        QCOMPARE(id.episode(), 5);
    }

    void testTechnicalNeighborGuard()
    {
        QVERIFY(!applyNamed("- ##", "Show 1080p - 05").isValid());
        QVERIFY(!applyNamed("_##", "Show_x264_12").isValid());
        QVERIFY(applyNamed("- ##", "Show - 05 [1080p]").isValid());
    }

    void testBoundsRejectOutOfRange()
    {
        QVERIFY(!applyNamed("S##E##", "Show.S00E05").isValid());
        QVERIFY(!applyNamed("S##E##", "Show.S01E00").isValid());
        QVERIFY(!applyNamed("S##E##", "Show.S100E01").isValid());
    }

    void testIsTechnicalToken()
    {
        QVERIFY(PatternLibrary::isTechnicalToken("1080p"));
        QVERIFY(PatternLibrary::isTechnicalToken("720i"));
        QVERIFY(PatternLibrary::isTechnicalToken("1920x1080"));
        QVERIFY(PatternLibrary::isTechnicalToken("4K"));
        QVERIFY(PatternLibrary::isTechnicalToken("x264"));
        QVERIFY(PatternLibrary::isTechnicalToken("HEVC"));
        QVERIFY(PatternLibrary::isTechnicalToken("10bit"));
        QVERIFY(PatternLibrary::isTechnicalToken("2019"));

        QVERIFY(!PatternLibrary::isTechnicalToken(""));
        QVERIFY(!PatternLibrary::isTechnicalToken("Show"));
        QVERIFY(!PatternLibrary::isTechnicalToken("05"));
        QVERIFY(!PatternLibrary::isTechnicalToken("1850"));
    }

    void testFinalSeasonMarker()
    {
        QVERIFY(PatternLibrary::hasFinalSeasonMarker("Boku no Hero Academia FINAL SEASON - 01"));
        QVERIFY(PatternLibrary::hasFinalSeasonMarker("Show.Final.Season.E01"));
        QVERIFY(PatternLibrary::hasFinalSeasonMarker("show_final_season_01"));
        QVERIFY(!PatternLibrary::hasFinalSeasonMarker("Show Season 1 Finale"));
        QVERIFY(!PatternLibrary::hasFinalSeasonMarker("Semifinal Season"));
    }
};

QTEST_MAIN(TestPatternLibrary)
#include "test_patternlibrary.moc"
