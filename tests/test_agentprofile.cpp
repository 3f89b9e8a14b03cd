/**
 * @file test_agentprofile.cpp
 * @brief Unit tests for AgentProfile
 *
 * Tests agent identity, number ranges and persistence of the profile.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QFile>
#include <QDir>

#include "agentprofile.h"

using namespace FieldSync;

class TestAgentProfile : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    // ========== NumberRange Tests ==========
    void testRangeUnconfigured();
    void testRangeRemaining();
    void testRangeExhausted();

    // ========== Construction Tests ==========
    void testDefaultConstruction();
    void testPaths();

    // ========== Numbering Tests ==========
    void testTakeReceiptNumberSequence();
    void testTakeReceiptNumberStartsAtRangeStart();
    void testReceiptRangeExhausted();
    void testTimestampNumberWithoutRange();
    void testTakenNumberIsPersisted();

    // ========== Persistence Tests ==========
    void testInitialize();
    void testSaveAndLoad();
    void testLoadMissingConfig();

    // ========== Validity Tests ==========
    void testIsValid();

private:
    QTemporaryDir *m_tempDir;
};

void TestAgentProfile::initTestCase()
{
    qDebug() << "Starting AgentProfile tests";
}

void TestAgentProfile::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());
}

void TestAgentProfile::cleanup()
{
    delete m_tempDir;
    m_tempDir = nullptr;
}

// ========== NumberRange Tests ==========

void TestAgentProfile::testRangeUnconfigured()
{
    NumberRange range;
    QVERIFY(!range.isConfigured());
    QVERIFY(!range.isExhausted());
    QCOMPARE(range.remaining(), qint64(0));
}

void TestAgentProfile::testRangeRemaining()
{
    NumberRange range;
    range.start = 100;
    range.end = 109;
    range.current = 105;

    QVERIFY(range.isConfigured());
    QCOMPARE(range.remaining(), qint64(5));
}

void TestAgentProfile::testRangeExhausted()
{
    NumberRange range;
    range.start = 1;
    range.end = 3;
    range.current = 4;

    QVERIFY(range.isExhausted());
    QCOMPARE(range.remaining(), qint64(0));
}

// ========== Construction Tests ==========

void TestAgentProfile::testDefaultConstruction()
{
    AgentProfile profile;
    QVERIFY(profile.dataFolderPath().isEmpty());
    QCOMPARE(profile.receiptSeries(), QString("CH"));
    QCOMPARE(profile.invoiceSeries(), QString("FA"));
    QVERIFY(!profile.autoSyncEnabled());
    QCOMPARE(profile.autoSyncTime(), QTime(18, 0));
    QVERIFY(!profile.isValid());
}

void TestAgentProfile::testPaths()
{
    AgentProfile profile(m_tempDir->path());
    QDir dir(m_tempDir->path());

    QCOMPARE(profile.configFilePath(), dir.filePath(".qfieldsync.conf"));
    QCOMPARE(profile.storeDirectoryPath(), dir.filePath("store"));
    QCOMPARE(profile.stateDirectoryPath(), dir.filePath(".state"));

    AgentProfile empty;
    QVERIFY(empty.configFilePath().isEmpty());
}

// ========== Numbering Tests ==========

void TestAgentProfile::testTakeReceiptNumberSequence()
{
    AgentProfile profile(m_tempDir->path());
    NumberRange range;
    range.start = 500;
    range.end = 510;
    range.current = 500;
    profile.setReceiptRange(range);

    auto first = profile.takeReceiptNumber();
    auto second = profile.takeReceiptNumber();

    QVERIFY(first.success);
    QVERIFY(second.success);
    QCOMPARE(first.value, QString("500"));
    QCOMPARE(second.value, QString("501"));
    QCOMPARE(profile.receiptRange().current, qint64(502));
}

void TestAgentProfile::testTakeReceiptNumberStartsAtRangeStart()
{
    AgentProfile profile(m_tempDir->path());
    NumberRange range;
    range.start = 20;
    range.end = 30;
    profile.setReceiptRange(range);

    auto number = profile.takeReceiptNumber();
    QVERIFY(number.success);
    QCOMPARE(number.value, QString("20"));
}

void TestAgentProfile::testReceiptRangeExhausted()
{
    AgentProfile profile(m_tempDir->path());
    NumberRange range;
    range.start = 1;
    range.end = 1;
    range.current = 1;
    profile.setReceiptRange(range);

    QVERIFY(profile.takeReceiptNumber().success);

    auto exhausted = profile.takeReceiptNumber();
    QVERIFY(!exhausted.success);
    QCOMPARE(exhausted.errorMessage, QString("Receipt number range exhausted"));

    // Invoices are numbered independently
    NumberRange invoices;
    invoices.start = 1;
    invoices.end = 1;
    invoices.current = 2;
    profile.setInvoiceRange(invoices);
    QCOMPARE(profile.takeInvoiceNumber().errorMessage, QString("Invoice number range exhausted"));
}

void TestAgentProfile::testTimestampNumberWithoutRange()
{
    AgentProfile profile;
    auto number = profile.takeInvoiceNumber();

    QVERIFY(number.success);
    QCOMPARE(number.value.length(), 14);
    QVERIFY(QDateTime::fromString(number.value, "yyyyMMddHHmmss").isValid());
}

void TestAgentProfile::testTakenNumberIsPersisted()
{
    {
        AgentProfile profile(m_tempDir->path());
        NumberRange range;
        range.start = 1000;
        range.end = 1999;
        range.current = 1000;
        profile.setReceiptRange(range);
        QVERIFY(profile.takeReceiptNumber().success);
    }

    AgentProfile reloaded(m_tempDir->path());
    QCOMPARE(reloaded.receiptRange().current, qint64(1001));
    QCOMPARE(reloaded.takeReceiptNumber().value, QString("1001"));
}

// ========== Persistence Tests ==========

void TestAgentProfile::testInitialize()
{
    QString path = m_tempDir->path() + "/agent";
    AgentProfile profile(path);

    QVERIFY(profile.initialize());
    QVERIFY(profile.exists());
    QVERIFY(QDir(profile.storeDirectoryPath()).exists());
    QVERIFY(QDir(profile.stateDirectoryPath()).exists());
}

void TestAgentProfile::testSaveAndLoad()
{
    {
        AgentProfile profile(m_tempDir->path());
        profile.setAgentName("Maria Ionescu");
        profile.setAgentCode("AG07");
        profile.setReceiptSeries("CHX");
        profile.setInvoiceSeries("FX");
        profile.setAutoSyncEnabled(true);
        profile.setAutoSyncTime(QTime(19, 45));
        QVERIFY(profile.save());
    }

    AgentProfile loaded(m_tempDir->path());
    QCOMPARE(loaded.agentName(), QString("Maria Ionescu"));
    QCOMPARE(loaded.agentCode(), QString("AG07"));
    QCOMPARE(loaded.receiptSeries(), QString("CHX"));
    QCOMPARE(loaded.invoiceSeries(), QString("FX"));
    QVERIFY(loaded.autoSyncEnabled());
    QCOMPARE(loaded.autoSyncTime(), QTime(19, 45));
}

void TestAgentProfile::testLoadMissingConfig()
{
    AgentProfile profile;
    profile.setDataFolderPath(m_tempDir->path());
    QVERIFY(!profile.exists());
    QVERIFY(!profile.load());
}

// ========== Validity Tests ==========

void TestAgentProfile::testIsValid()
{
    AgentProfile valid(m_tempDir->path());
    QVERIFY(valid.isValid());

    AgentProfile invalid("/nonexistent/path/that/does/not/exist");
    QVERIFY(!invalid.isValid());
}

QTEST_MAIN(TestAgentProfile)
#include "test_agentprofile.moc"
