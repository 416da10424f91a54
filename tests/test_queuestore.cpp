/**
 * @file test_queuestore.cpp
 * @brief Unit tests for QueueStore.
 *
 * Tests verify:
 * - A missing document loads as empty
 * - Malformed documents are reported, not silently replaced
 * - initialize() creates or quarantines documents
 * - save() replaces the whole document
 */

#include <QtTest/QtTest>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "services/queuestore.h"

class TestQueueStore : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Loading
    void testMissingFileLoadsEmpty();
    void testMalformedFileIsUnavailable();
    void testNonObjectFileIsUnavailable();
    void testLoadSaveRoundTrip();

    // Saving
    void testSaveCreatesStateDirectory();
    void testSaveReplacesDocument();
    void testSaveLeavesNoTemporaryFiles();

    // Initialization
    void testInitializeCreatesEmptyDocument();
    void testInitializeKeepsValidDocument();
    void testInitializeQuarantinesCorruptDocument();

private:
    void writeRaw(const QByteArray &bytes);

    QTemporaryDir *tempDir_ = nullptr;
    QString queuePath_;
};

void TestQueueStore::init()
{
    tempDir_ = new QTemporaryDir();
    QVERIFY(tempDir_->isValid());
    queuePath_ = tempDir_->filePath("queue.json");
}

void TestQueueStore::cleanup()
{
    delete tempDir_;
    tempDir_ = nullptr;
}

void TestQueueStore::writeRaw(const QByteArray &bytes)
{
    QFile file(queuePath_);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(bytes);
}

void TestQueueStore::testMissingFileLoadsEmpty()
{
    QueueStore store(queuePath_);
    QueueDocument doc;
    doc.paused = true;

    QVERIFY(store.load(doc));
    QVERIFY(doc.isEmpty());
    QCOMPARE(doc.paused, false);
    QCOMPARE(store.error(), QueueError::None);
    QVERIFY(!QFile::exists(queuePath_));
}

void TestQueueStore::testMalformedFileIsUnavailable()
{
    writeRaw("{\"pending\": [");

    QueueStore store(queuePath_);
    QueueDocument doc;

    QVERIFY(!store.load(doc));
    QCOMPARE(store.error(), QueueError::StoreUnavailable);
    QVERIFY(store.errorString().contains("queue.json"));

    // The broken file is left as it was
    QFile file(queuePath_);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), QByteArray("{\"pending\": ["));
}

void TestQueueStore::testNonObjectFileIsUnavailable()
{
    writeRaw("[1, 2, 3]");

    QueueStore store(queuePath_);
    QueueDocument doc;

    QVERIFY(!store.load(doc));
    QCOMPARE(store.error(), QueueError::StoreUnavailable);
}

void TestQueueStore::testLoadSaveRoundTrip()
{
    QueueStore store(queuePath_);

    QueueDocument doc;
    Job job;
    job.id = "j1";
    job.source = "remote:/a.bin";
    job.destination = "/data/a.bin";
    job.displayName = "a.bin";
    job.sizeBytes = 42;
    job.enqueuedAt = QDateTime::fromSecsSinceEpoch(1700000000);
    doc.pending << job;
    QVERIFY(store.save(doc));

    QFile file(queuePath_);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray written = file.readAll();
    file.close();

    QueueDocument loaded;
    QVERIFY(store.load(loaded));
    QVERIFY(store.save(loaded));

    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), written);
}

void TestQueueStore::testSaveCreatesStateDirectory()
{
    const QString nested = tempDir_->filePath("a/b/queue.json");
    QueueStore store(nested);

    QVERIFY(store.save(QueueDocument()));
    QVERIFY(QFile::exists(nested));
}

void TestQueueStore::testSaveReplacesDocument()
{
    QueueStore store(queuePath_);

    QueueDocument first;
    Job job;
    job.id = "old";
    first.failed << job;
    QVERIFY(store.save(first));

    QueueDocument second;
    second.paused = true;
    QVERIFY(store.save(second));

    QueueDocument loaded;
    QVERIFY(store.load(loaded));
    QVERIFY(loaded.failed.isEmpty());
    QCOMPARE(loaded.paused, true);
}

void TestQueueStore::testSaveLeavesNoTemporaryFiles()
{
    QueueStore store(queuePath_);
    QVERIFY(store.save(QueueDocument()));
    QVERIFY(store.save(QueueDocument()));

    const QStringList entries = QDir(tempDir_->path()).entryList(QDir::Files | QDir::Hidden);
    QCOMPARE(entries, QStringList{"queue.json"});
}

void TestQueueStore::testInitializeCreatesEmptyDocument()
{
    QueueStore store(queuePath_);

    QVERIFY(store.initialize());
    QVERIFY(QFile::exists(queuePath_));
    QVERIFY(store.quarantinedPath().isEmpty());

    QueueDocument doc;
    QVERIFY(store.load(doc));
    QVERIFY(doc.isEmpty());
}

void TestQueueStore::testInitializeKeepsValidDocument()
{
    writeRaw(R"({"pending":[{"id":"keep","filename":"k.bin"}],"downloading":[],)"
             R"("completed":[],"failed":[],"paused":true})");

    QueueStore store(queuePath_);
    QVERIFY(store.initialize());
    QVERIFY(store.quarantinedPath().isEmpty());

    QueueDocument doc;
    QVERIFY(store.load(doc));
    QCOMPARE(doc.pending.size(), 1);
    QCOMPARE(doc.pending.first().id, QString("keep"));
    QCOMPARE(doc.paused, true);
}

void TestQueueStore::testInitializeQuarantinesCorruptDocument()
{
    writeRaw("not json at all");

    QueueStore store(queuePath_);
    QVERIFY(store.initialize());

    const QString aside = store.quarantinedPath();
    QVERIFY(!aside.isEmpty());
    QVERIFY(aside.startsWith(queuePath_ + ".corrupt-"));
    QVERIFY(QFile::exists(aside));

    QFile broken(aside);
    QVERIFY(broken.open(QIODevice::ReadOnly));
    QCOMPARE(broken.readAll(), QByteArray("not json at all"));

    QueueDocument doc;
    QVERIFY(store.load(doc));
    QVERIFY(doc.isEmpty());
}

QTEST_MAIN(TestQueueStore)
#include "test_queuestore.moc"
