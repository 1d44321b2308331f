/**
 * @file test_consolelog.cpp
 * @brief Unit tests for ConsoleLog
 */

#include <QtTest/QtTest>
#include <QBuffer>
#include <QRegularExpression>
#include "app/consolelog.h"

using namespace FieldSync;

class TestConsoleLog : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testLevels();
    void testCounts();
    void testTimestamps();
    void testConnectedToSignals();

private:
    QStringList lines() const;

    QBuffer *m_buffer = nullptr;
    ConsoleLog *m_log = nullptr;
};

class Emitter : public QObject
{
    Q_OBJECT

signals:
    void logMessage(const QString &message);
    void errorOccurred(const QString &message);
};

void TestConsoleLog::init()
{
    m_buffer = new QBuffer();
    QVERIFY(m_buffer->open(QIODevice::ReadWrite));
    m_log = new ConsoleLog(m_buffer);
}

void TestConsoleLog::cleanup()
{
    delete m_log;
    delete m_buffer;
    m_log = nullptr;
    m_buffer = nullptr;
}

QStringList TestConsoleLog::lines() const
{
    return QString::fromUtf8(m_buffer->data()).split('\n', Qt::SkipEmptyParts);
}

void TestConsoleLog::testLevels()
{
    m_log->logInfo("Queue drained");
    m_log->logWarning("Review data not cached");
    m_log->logError("Database unavailable");

    QCOMPARE(lines(), QStringList({"[INFO] Queue drained",
                                   "[WARNING] Review data not cached",
                                   "[ERROR] Database unavailable"}));
    QVERIFY(m_buffer->data().endsWith('\n'));
}

void TestConsoleLog::testCounts()
{
    QCOMPARE(m_log->warningCount(), 0);
    QCOMPARE(m_log->errorCount(), 0);

    m_log->logInfo("a");
    m_log->logWarning("b");
    m_log->logWarning("c");
    m_log->logError("d");

    QCOMPARE(m_log->warningCount(), 2);
    QCOMPARE(m_log->errorCount(), 1);
}

void TestConsoleLog::testTimestamps()
{
    m_log->setTimestamps(true);
    m_log->logInfo("Probe ok");

    QRegularExpression pattern("^\\d{2}:\\d{2}:\\d{2}\\.\\d{3} \\[INFO\\] Probe ok$");
    QVERIFY(pattern.match(lines().first()).hasMatch());
}

void TestConsoleLog::testConnectedToSignals()
{
    Emitter emitter;
    connect(&emitter, &Emitter::logMessage, m_log, &ConsoleLog::logInfo);
    connect(&emitter, &Emitter::errorOccurred, m_log, &ConsoleLog::logError);

    emit emitter.logMessage("[SyncEngine] 2 entries synced");
    emit emitter.errorOccurred("Upload failed");

    QCOMPARE(lines().size(), 2);
    QCOMPARE(lines().at(1), QString("[ERROR] Upload failed"));
    QCOMPARE(m_log->errorCount(), 1);
}

QTEST_MAIN(TestConsoleLog)
#include "test_consolelog.moc"
