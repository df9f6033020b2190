#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "../submux/src/mergetoolrunner.h"

class TestMergeToolRunner : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir m_dir;

    QString script(const QString& name, const QByteArray& body)
    {
        const QString path = m_dir.filePath(name);
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly)) {
            return QString();
        }
        file.write("#!/bin/sh\n");
        file.write(body);
        file.close();
        if (!file.setPermissions(QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner)) {
            return QString();
        }
        return path;
    }

private slots:
    void initTestCase()
    {
#ifdef Q_OS_WIN
        QSKIP("Runner tests use shell scripts");
#endif
        QVERIFY(m_dir.isValid());
    }

    void testSuccessfulRun()
    {
        const QString tool = script("ok.sh", "echo \"merging $2\"\nexit 0\n");
        ProcessMergeToolRunner runner;
        MergeRunOutcome outcome = runner.run(tool, {"-o", "out.mkv"}, 10000);

        QCOMPARE(outcome.status, MergeRunStatus::Finished);
        QVERIFY(outcome.finishedWith(0));
        QVERIFY(outcome.standardOutput.contains("merging out.mkv"));
    }

    void testExitCodeAndDiagnostics()
    {
        const QString tool = script("fail.sh", "echo 'Error: no tracks' \nexit 2\n");
        ProcessMergeToolRunner runner;
        MergeRunOutcome outcome = runner.run(tool, {}, 10000);

        QCOMPARE(outcome.status, MergeRunStatus::Finished);
        QCOMPARE(outcome.exitCode, 2);
        QVERIFY(!outcome.finishedWith(0));
        // mkvmerge writes errors to stdout
        QCOMPARE(outcome.diagnostics(), QString("Error: no tracks"));
    }

    void testStandardErrorPreferred()
    {
        const QString tool = script("stderr.sh", "echo progress\necho 'disk full' >&2\nexit 2\n");
        ProcessMergeToolRunner runner;
        MergeRunOutcome outcome = runner.run(tool, {}, 10000);
        QCOMPARE(outcome.diagnostics(), QString("disk full"));
    }

    void testTimeout()
    {
        const QString tool = script("slow.sh", "sleep 30\n");
        ProcessMergeToolRunner runner;
        QElapsedTimer timer;
        timer.start();
        MergeRunOutcome outcome = runner.run(tool, {}, 300);

        QCOMPARE(outcome.status, MergeRunStatus::TimedOut);
        QVERIFY(!outcome.finishedWith(0));
        QVERIFY(timer.elapsed() < 10000);
    }

    void testMissingProgram()
    {
        ProcessMergeToolRunner runner;
        MergeRunOutcome outcome = runner.run(m_dir.filePath("no-such-tool"), {}, 1000);
        QCOMPARE(outcome.status, MergeRunStatus::FailedToStart);
        QVERIFY(!outcome.errorString.isEmpty());
        QCOMPARE(outcome.diagnostics(), outcome.errorString);
    }

    void testDiagnosticsTail()
    {
        MergeRunOutcome outcome;
        outcome.standardOutput = QString(5000, QChar('a')) + "END";
        QCOMPARE(outcome.diagnostics().size(), 2000);
        QVERIFY(outcome.diagnostics().endsWith("END"));
    }
};

QTEST_MAIN(TestMergeToolRunner)
#include "test_mergetoolrunner.moc"
