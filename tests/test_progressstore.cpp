/**
 * @file test_progressstore.cpp
 * @brief Unit tests for ProgressStore.
 *
 * Tests verify:
 * - Upsert by (downloadId, stage) and idempotent re-delivery
 * - Completed stages never move backwards
 * - Current stage ordering
 * - Parent aggregation with exact ratios and stage weights
 */

#include <QtTest>
#include <QSignalSpy>

#include "models/progressstore.h"

class TestProgressStore : public QObject
{
    Q_OBJECT

private:
    ProgressStore *store = nullptr;

    static ProgressEntry makeEvent(const QString &downloadId, DownloadStage stage,
                                   double percentage, bool complete = false)
    {
        ProgressEntry event;
        event.downloadId = downloadId;
        event.parentId = "BV1-1000";
        event.stage = stage;
        event.percentage = percentage;
        event.isComplete = complete;
        return event;
    }

private slots:
    void init()
    {
        store = new ProgressStore(this);
    }

    void cleanup()
    {
        delete store;
        store = nullptr;
    }

    void testIngestCreatesEntryPerStage()
    {
        QVERIFY(store->ingest(makeEvent("BV1-1000-p1", DownloadStage::Video, 10)));
        QVERIFY(store->ingest(makeEvent("BV1-1000-p1", DownloadStage::Audio, 20)));
        QVERIFY(store->ingest(makeEvent("BV1-1000-p1", DownloadStage::Video, 50)));

        QCOMPARE(store->count(), 2);
        QCOMPARE(store->entriesFor("BV1-1000-p1").size(), 2);

        auto video = store->entry("BV1-1000-p1", DownloadStage::Video);
        QVERIFY(video.has_value());
        QCOMPARE(video->percentage, 50.0);
        QCOMPARE(video->internalId, QString("BV1-1000-p1:video"));
    }

    void testInternalIdWithoutStage()
    {
        QCOMPARE(ProgressStore::internalIdFor("d1", DownloadStage::None), QString("d1"));
        QCOMPARE(ProgressStore::internalIdFor("d1", DownloadStage::Merge), QString("d1:merge"));
    }

    void testIdenticalRedeliveryIsNoOp()
    {
        ProgressEntry event = makeEvent("BV1-1000-p1", DownloadStage::Video, 40);
        event.filesize = 100.0;
        event.downloaded = 40.0;

        QVERIFY(store->ingest(event));
        double before = store->aggregateParent("BV1-1000");

        QSignalSpy spy(store, &ProgressStore::progressChanged);
        QVERIFY(!store->ingest(event));
        QCOMPARE(spy.count(), 0);
        QCOMPARE(store->count(), 1);
        QCOMPARE(store->aggregateParent("BV1-1000"), before);
    }

    void testEventWithoutDownloadIdIgnored()
    {
        QVERIFY(!store->ingest(makeEvent(QString(), DownloadStage::Video, 10)));
        QCOMPARE(store->count(), 0);
    }

    void testCompletedStageNeverRegresses()
    {
        QVERIFY(store->ingest(makeEvent("d1", DownloadStage::Video, 100, true)));
        QVERIFY(!store->ingest(makeEvent("d1", DownloadStage::Video, 60)));

        auto video = store->entry("d1", DownloadStage::Video);
        QVERIFY(video->isComplete);
        QCOMPARE(video->percentage, 100.0);
    }

    void testLateEventKeepsParentLink()
    {
        store->ingest(makeEvent("d1", DownloadStage::Video, 10));

        ProgressEntry late = makeEvent("d1", DownloadStage::Video, 30);
        late.parentId.clear();
        QVERIFY(store->ingest(late));

        QCOMPARE(store->entry("d1", DownloadStage::Video)->parentId, QString("BV1-1000"));
    }

    void testCurrentStage()
    {
        QCOMPARE(store->currentStage("d1"), DownloadStage::None);

        store->ingest(makeEvent("d1", DownloadStage::Video, 10));
        QCOMPARE(store->currentStage("d1"), DownloadStage::Video);

        store->ingest(makeEvent("d1", DownloadStage::Audio, 10));
        QCOMPARE(store->currentStage("d1"), DownloadStage::Audio);

        store->ingest(makeEvent("d1", DownloadStage::Merge, 0));
        QCOMPARE(store->currentStage("d1"), DownloadStage::Merge);

        // Warnings do not change the lifecycle stage
        store->ingest(makeEvent("d1", DownloadStage::WarnAudioQualityFallback, 0));
        QCOMPARE(store->currentStage("d1"), DownloadStage::Merge);

        // A late video event does not move the stage back
        store->ingest(makeEvent("d1", DownloadStage::Video, 90));
        QCOMPARE(store->currentStage("d1"), DownloadStage::Merge);

        store->ingest(makeEvent("d1", DownloadStage::Complete, 100, true));
        QCOMPARE(store->currentStage("d1"), DownloadStage::Complete);
    }

    void testAggregateWithoutChildrenIsZero()
    {
        QCOMPARE(store->aggregateParent("BV1-1000"), 0.0);
        QCOMPARE(store->aggregateParent("unknown"), 0.0);
    }

    void testAggregateUsesExactRatio()
    {
        ProgressEntry video = makeEvent("d1", DownloadStage::Video, 50);
        video.filesize = 200.0;
        video.downloaded = 100.0;
        store->ingest(video);

        QVERIFY(qFuzzyCompare(store->childRatio("d1"), 0.5));

        ProgressEntry audio = makeEvent("d1", DownloadStage::Audio, 0);
        audio.filesize = 50.0;
        audio.downloaded = 0.0;
        store->ingest(audio);

        // Bytes are summed across stages: 100 of 250
        QVERIFY(qFuzzyCompare(store->childRatio("d1"), 0.4));
    }

    void testCompletedStreamsWithTotalsReachOne()
    {
        ProgressEntry video = makeEvent("d1", DownloadStage::Video, 100, true);
        video.filesize = 100.0;
        video.downloaded = 100.0;
        store->ingest(video);

        ProgressEntry audio = makeEvent("d1", DownloadStage::Audio, 100, true);
        audio.filesize = 10.0;
        audio.downloaded = 10.0;
        store->ingest(audio);

        QVERIFY(qFuzzyCompare(store->childRatio("d1"), 1.0));
        QVERIFY(qFuzzyCompare(store->aggregateParent("BV1-1000"), 1.0));
    }

    void testAggregateUsesStageWeightsWithoutTotals()
    {
        store->ingest(makeEvent("d1", DownloadStage::Video, 100));
        store->ingest(makeEvent("d1", DownloadStage::Audio, 100));
        QVERIFY(qFuzzyCompare(store->childRatio("d1"), 0.66));

        store->ingest(makeEvent("d1", DownloadStage::Merge, 0));
        QVERIFY(qFuzzyCompare(store->childRatio("d1"), 1.0));
    }

    void testAggregateAveragesChildren()
    {
        store->ingest(makeEvent("d1", DownloadStage::Complete, 100, true));
        store->ingest(makeEvent("d2", DownloadStage::Video, 100));

        QCOMPARE(store->childrenOf("BV1-1000"), QStringList({"d1", "d2"}));
        QVERIFY(qFuzzyCompare(store->aggregateParent("BV1-1000"), (1.0 + 0.33) / 2.0));
    }

    void testAggregateIsOneWhenAllChildrenComplete()
    {
        store->ingest(makeEvent("d1", DownloadStage::Video, 30));
        store->ingest(makeEvent("d2", DownloadStage::Audio, 70));
        store->ingest(makeEvent("d1", DownloadStage::Complete, 100, true));
        store->ingest(makeEvent("d2", DownloadStage::Merge, 100, true));

        QCOMPARE(store->aggregateParent("BV1-1000"), 1.0);
    }

    void testStagelessEventUsesPercentage()
    {
        store->ingest(makeEvent("d1", DownloadStage::None, 25));
        QVERIFY(qFuzzyCompare(store->childRatio("d1"), 0.25));
    }

    void testClearFor()
    {
        store->ingest(makeEvent("d1", DownloadStage::Video, 10));
        store->ingest(makeEvent("d1", DownloadStage::Audio, 10));
        store->ingest(makeEvent("d2", DownloadStage::Video, 10));

        store->clearFor("d1");
        QCOMPARE(store->count(), 1);
        QVERIFY(store->entriesFor("d1").isEmpty());
        QCOMPARE(store->rowCount(), 1);
    }

    void testClearAll()
    {
        store->ingest(makeEvent("d1", DownloadStage::Video, 10));

        QSignalSpy spy(store, &ProgressStore::progressCleared);
        store->clearAll();
        QCOMPARE(spy.count(), 1);
        QCOMPARE(store->count(), 0);
    }

    void testModelData()
    {
        ProgressEntry event = makeEvent("d1", DownloadStage::Audio, 42);
        event.transferRate = 512.0;
        store->ingest(event);

        QModelIndex idx = store->index(0);
        QCOMPARE(store->data(idx, ProgressStore::StageRole).toString(), QString("audio"));
        QCOMPARE(store->data(idx, ProgressStore::PercentageRole).toDouble(), 42.0);
        QCOMPARE(store->data(idx, ProgressStore::TransferRateRole).toDouble(), 512.0);
        QVERIFY(!store->data(idx, ProgressStore::FilesizeRole).isValid());
        QVERIFY(store->roleNames().contains(ProgressStore::InternalIdRole));
    }
};

QTEST_MAIN(TestProgressStore)
#include "test_progressstore.moc"
