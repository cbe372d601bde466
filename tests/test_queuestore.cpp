/**
 * @file test_queuestore.cpp
 * @brief Unit tests for QueueStore.
 *
 * Tests verify:
 * - Enqueue and duplicate ids
 * - Status transitions and their guards
 * - Cancellation is refused while merging
 * - Parent status aggregation
 * - Part lookups by ordinal
 */

#include <QtTest>
#include <QSignalSpy>

#include "models/progressstore.h"
#include "models/queuestore.h"

class TestQueueStore : public QObject
{
    Q_OBJECT

private:
    ProgressStore *progress = nullptr;
    QueueStore *queue = nullptr;

    static QueueItem makeItem(const QString &downloadId, const QString &parentId = QString(),
                              int ordinal = 0)
    {
        QueueItem entry;
        entry.downloadId = downloadId;
        entry.parentId = parentId;
        entry.title = downloadId;
        entry.ordinal = ordinal;
        return entry;
    }

    QueueItem::Status statusOf(const QString &downloadId) const
    {
        auto entry = queue->item(downloadId);
        return entry ? entry->status : QueueItem::Status::Cancelled;
    }

    void enqueueBatch(int parts)
    {
        queue->enqueue(makeItem("BV1-1000"));
        for (int i = 1; i <= parts; ++i) {
            queue->enqueue(makeItem(QString("BV1-1000-p%1").arg(i), "BV1-1000", i));
        }
    }

private slots:
    void init()
    {
        progress = new ProgressStore(this);
        queue = new QueueStore(progress, this);
    }

    void cleanup()
    {
        delete queue;
        delete progress;
        queue = nullptr;
        progress = nullptr;
    }

    void testEnqueueForcesPending()
    {
        QueueItem entry = makeItem("d1");
        entry.status = QueueItem::Status::Done;
        entry.outputPath = "/tmp/x.mp4";

        QSignalSpy spy(queue, &QueueStore::queueChanged);
        QVERIFY(queue->enqueue(entry));
        QCOMPARE(spy.count(), 1);
        QCOMPARE(queue->count(), 1);
        QCOMPARE(statusOf("d1"), QueueItem::Status::Pending);
        QVERIFY(queue->item("d1")->outputPath.isEmpty());
    }

    void testEnqueueDuplicateIsNoOp()
    {
        QVERIFY(queue->enqueue(makeItem("d1")));

        QueueItem again = makeItem("d1");
        again.title = "Other";
        QVERIFY(!queue->enqueue(again));
        QCOMPARE(queue->count(), 1);
        QCOMPARE(queue->item("d1")->title, QString("d1"));
    }

    void testEnqueueWithoutIdRefused()
    {
        QVERIFY(!queue->enqueue(makeItem(QString())));
        QCOMPARE(queue->count(), 0);
    }

    void testMarkObservedIsIdempotent()
    {
        queue->enqueue(makeItem("d1"));

        QVERIFY(queue->markObserved("d1"));
        QCOMPARE(statusOf("d1"), QueueItem::Status::Running);
        QVERIFY(!queue->markObserved("d1"));
        QCOMPARE(statusOf("d1"), QueueItem::Status::Running);
        QVERIFY(!queue->markObserved("missing"));
    }

    void testUpdateOnSuccess()
    {
        queue->enqueue(makeItem("d1"));
        queue->markObserved("d1");

        QSignalSpy spy(queue, &QueueStore::itemStatusChanged);
        queue->updateOnSuccess("d1", "/videos/Intro.mp4", "Intro");

        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.at(0).at(0).toString(), QString("d1"));
        auto entry = queue->item("d1");
        QCOMPARE(entry->status, QueueItem::Status::Done);
        QCOMPARE(entry->outputPath, QString("/videos/Intro.mp4"));
        QCOMPARE(entry->title, QString("Intro"));
    }

    void testUpdateOnSuccessAfterCompletedProgress()
    {
        queue->enqueue(makeItem("d1"));
        QVERIFY(queue->markCompleted("d1"));

        // The output path still arrives with the dispatch result
        queue->updateOnSuccess("d1", "/videos/Intro.mp4", QString());
        QCOMPARE(statusOf("d1"), QueueItem::Status::Done);
        QCOMPARE(queue->item("d1")->outputPath, QString("/videos/Intro.mp4"));
    }

    void testMarkCompletedNeverOverridesTerminalFailure()
    {
        queue->enqueue(makeItem("d1"));
        queue->setError("d1", "boom");
        QVERIFY(!queue->markCompleted("d1"));
        QCOMPARE(statusOf("d1"), QueueItem::Status::Error);

        queue->enqueue(makeItem("d2"));
        queue->confirmCancelled("d2");
        QVERIFY(!queue->markCompleted("d2"));
        QCOMPARE(statusOf("d2"), QueueItem::Status::Cancelled);
    }

    void testSetErrorKeepsMessage()
    {
        queue->enqueue(makeItem("d1"));
        queue->setError("d1", "Not enough disk space.");

        auto entry = queue->item("d1");
        QCOMPARE(entry->status, QueueItem::Status::Error);
        QCOMPARE(entry->errorMessage, QString("Not enough disk space."));
        QCOMPARE(queue->data(queue->index(0), QueueStore::StatusRole).toString(), QString("error"));
    }

    void testRequestCancelFromActiveStates()
    {
        queue->enqueue(makeItem("d1"));
        QVERIFY(queue->requestCancel("d1"));
        QCOMPARE(statusOf("d1"), QueueItem::Status::Cancelling);

        // Already cancelling
        QVERIFY(!queue->requestCancel("d1"));

        queue->enqueue(makeItem("d2"));
        queue->updateOnSuccess("d2", "/videos/d2.mp4", QString());
        QVERIFY(!queue->requestCancel("d2"));
        QCOMPARE(statusOf("d2"), QueueItem::Status::Done);

        QVERIFY(!queue->requestCancel("missing"));
    }

    void testRequestCancelRefusedWhileMerging()
    {
        queue->enqueue(makeItem("d1"));
        queue->markObserved("d1");

        ProgressEntry merge;
        merge.downloadId = "d1";
        merge.stage = DownloadStage::Merge;
        merge.percentage = 10;
        progress->ingest(merge);

        QVERIFY(!queue->requestCancel("d1"));
        QCOMPARE(statusOf("d1"), QueueItem::Status::Running);
    }

    void testConfirmCancelled()
    {
        queue->enqueue(makeItem("d1"));
        queue->requestCancel("d1");
        QVERIFY(queue->confirmCancelled("d1"));
        QCOMPARE(statusOf("d1"), QueueItem::Status::Cancelled);
        QVERIFY(!queue->confirmCancelled("d1"));

        queue->enqueue(makeItem("d2"));
        queue->updateOnSuccess("d2", "/videos/d2.mp4", QString());
        QVERIFY(!queue->confirmCancelled("d2"));
        QCOMPARE(statusOf("d2"), QueueItem::Status::Done);
    }

    void testStatusChangeClearsErrorMessage()
    {
        queue->enqueue(makeItem("d1"));
        queue->setError("d1", "boom");
        queue->confirmCancelled("d1");
        QVERIFY(queue->item("d1")->errorMessage.isEmpty());
    }

    void testParentFollowsChildren()
    {
        enqueueBatch(3);
        QCOMPARE(statusOf("BV1-1000"), QueueItem::Status::Pending);

        queue->markObserved("BV1-1000-p1");
        QCOMPARE(statusOf("BV1-1000"), QueueItem::Status::Running);

        queue->updateOnSuccess("BV1-1000-p1", "/videos/1.mp4", QString());
        QCOMPARE(statusOf("BV1-1000"), QueueItem::Status::Pending);

        queue->updateOnSuccess("BV1-1000-p2", "/videos/2.mp4", QString());
        queue->confirmCancelled("BV1-1000-p3");
        QCOMPARE(statusOf("BV1-1000"), QueueItem::Status::Done);
    }

    void testParentErrorWins()
    {
        enqueueBatch(2);
        queue->markObserved("BV1-1000-p1");
        queue->setError("BV1-1000-p2", "Not enough disk space.");

        auto parentItem = queue->item("BV1-1000");
        QCOMPARE(parentItem->status, QueueItem::Status::Error);
        QCOMPARE(parentItem->errorMessage, QString("Not enough disk space."));
    }

    void testParentAllCancelled()
    {
        enqueueBatch(2);
        queue->confirmCancelled("BV1-1000-p1");
        queue->confirmCancelled("BV1-1000-p2");
        QCOMPARE(statusOf("BV1-1000"), QueueItem::Status::Cancelled);
    }

    void testClearRemovesRecordAndRefreshesParent()
    {
        enqueueBatch(2);
        queue->updateOnSuccess("BV1-1000-p1", "/videos/1.mp4", QString());

        queue->clear("BV1-1000-p2");
        QCOMPARE(queue->count(), 2);
        QVERIFY(!queue->contains("BV1-1000-p2"));
        QCOMPARE(statusOf("BV1-1000"), QueueItem::Status::Done);

        // Clearing a missing id is a no-op
        queue->clear("missing");
        QCOMPARE(queue->count(), 2);
    }

    void testParentWithoutChildrenKeepsStatus()
    {
        enqueueBatch(1);
        queue->updateOnSuccess("BV1-1000-p1", "/videos/1.mp4", QString());
        queue->clear("BV1-1000-p1");

        QCOMPARE(statusOf("BV1-1000"), QueueItem::Status::Done);
        QVERIFY(queue->childrenOf("BV1-1000").isEmpty());
    }

    void testFindCompletedForPart()
    {
        enqueueBatch(2);
        QVERIFY(!queue->findCompletedForPart(1).has_value());

        queue->updateOnSuccess("BV1-1000-p1", "/videos/1.mp4", QString());
        auto done = queue->findCompletedForPart(1);
        QVERIFY(done.has_value());
        QCOMPARE(done->downloadId, QString("BV1-1000-p1"));
        QVERIFY(!queue->findCompletedForPart(2).has_value());
    }

    void testFindForPartReturnsLatest()
    {
        enqueueBatch(1);
        queue->enqueue(makeItem("BV1-1000-r1-p1", "BV1-1000", 1));

        auto latest = queue->findForPart(1);
        QVERIFY(latest.has_value());
        QCOMPARE(latest->downloadId, QString("BV1-1000-r1-p1"));
        QVERIFY(!queue->findForPart(7).has_value());
    }

    void testHasActive()
    {
        QVERIFY(!queue->hasActive());
        queue->enqueue(makeItem("d1"));
        QVERIFY(queue->hasActive());
        queue->requestCancel("d1");
        QVERIFY(queue->hasActive());
        queue->confirmCancelled("d1");
        QVERIFY(!queue->hasActive());
    }

    void testClearAll()
    {
        enqueueBatch(2);
        queue->clearAll();
        QCOMPARE(queue->count(), 0);
        QCOMPARE(queue->rowCount(), 0);
    }

    void testProgressRole()
    {
        enqueueBatch(2);

        ProgressEntry complete;
        complete.downloadId = "BV1-1000-p1";
        complete.parentId = "BV1-1000";
        complete.stage = DownloadStage::Complete;
        complete.percentage = 100;
        complete.isComplete = true;
        progress->ingest(complete);

        // Row 0 is the parent, only p1 reported progress so far
        QCOMPARE(queue->data(queue->index(0), QueueStore::ProgressRole).toDouble(), 1.0);
        QCOMPARE(queue->data(queue->index(1), QueueStore::ProgressRole).toDouble(), 1.0);
        QCOMPARE(queue->data(queue->index(2), QueueStore::ProgressRole).toDouble(), 0.0);
    }
};

QTEST_MAIN(TestQueueStore)
#include "test_queuestore.moc"
