/**
 * @file test_errorclassifier.cpp
 * @brief Unit tests for ErrorClassifier.
 */

#include <QtTest>

#include "services/errorclassifier.h"

Q_DECLARE_METATYPE(ErrorKind)

class TestErrorClassifier : public QObject
{
    Q_OBJECT

private slots:
    void testClassify_data()
    {
        QTest::addColumn<QString>("raw");
        QTest::addColumn<ErrorKind>("kind");
        QTest::addColumn<QString>("key");

        QTest::newRow("not found") << "ERR::VIDEO_NOT_FOUND" << ErrorKind::NotFound
                                   << "video.video_not_found";
        QTest::newRow("cookie") << "ERR::COOKIE_MISSING" << ErrorKind::AuthMissing
                                << "video.cookie_missing";
        QTest::newRow("api") << "ERR::API_ERROR" << ErrorKind::UpstreamApiError
                             << "video.api_error";
        QTest::newRow("exists") << "ERR::FILE_EXISTS" << ErrorKind::OutputConflict
                                << "video.file_exists";
        QTest::newRow("disk") << "ERR::DISK_FULL" << ErrorKind::DiskFull << "video.disk_full";
        QTest::newRow("merge") << "ERR::MERGE_FAILED" << ErrorKind::MergeFailed
                               << "video.merge_failed";
        QTest::newRow("quality") << "ERR::QUALITY_NOT_FOUND" << ErrorKind::QualityUnavailable
                                 << "video.quality_not_found";
        QTest::newRow("rate") << "ERR::RATE_LIMITED" << ErrorKind::RateLimited
                              << "video.rate_limited";
        QTest::newRow("network") << "ERR::NETWORK::timeout" << ErrorKind::NetworkError
                                 << "video.network_error";
        QTest::newRow("cancelled") << "ERR::CANCELLED" << ErrorKind::Cancelled
                                   << "video.cancelled";
        QTest::newRow("wrapped") << "Error: ERR::DISK_FULL (os error 28)" << ErrorKind::DiskFull
                                 << "video.disk_full";
    }

    void testClassify()
    {
        QFETCH(QString, raw);
        QFETCH(ErrorKind, kind);
        QFETCH(QString, key);

        ClassifiedError result = ErrorClassifier::classify(raw);
        QCOMPARE(result.kind, kind);
        QCOMPARE(result.messageKey, key);
        QCOMPARE(result.raw, raw);
        QVERIFY(!result.message.isEmpty());
        QVERIFY(result.message != raw);
    }

    void testDiskFullMessage()
    {
        QCOMPARE(ErrorClassifier::classify("ERR::DISK_FULL").message,
                 QString("Not enough disk space."));
    }

    void testNetworkDetail()
    {
        ClassifiedError result = ErrorClassifier::classify("ERR::NETWORK::connection reset");
        QCOMPARE(result.detail, QString("connection reset"));
        QVERIFY(result.message.contains("connection reset"));

        ClassifiedError bare = ErrorClassifier::classify("ERR::NETWORK");
        QCOMPARE(bare.kind, ErrorKind::NetworkError);
        QVERIFY(bare.detail.isEmpty());
    }

    void testUnclassifiedPassesThrough()
    {
        ClassifiedError result = ErrorClassifier::classify("something odd happened");
        QCOMPARE(result.kind, ErrorKind::Unclassified);
        QCOMPARE(result.message, QString("something odd happened"));
        QVERIFY(result.messageKey.isEmpty());
        QVERIFY(!result.isCancelled());
    }

    void testFirstMatchWins()
    {
        // Both codes appear, the earlier pattern decides
        ClassifiedError result = ErrorClassifier::classify("ERR::CANCELLED after ERR::DISK_FULL");
        QCOMPARE(result.kind, ErrorKind::DiskFull);
    }

    void testCancelled()
    {
        QVERIFY(ErrorClassifier::classify("ERR::CANCELLED").isCancelled());
    }

    void testErrorCode()
    {
        QCOMPARE(ErrorClassifier::errorCode("ERR::DISK_FULL"), QString("DISK_FULL"));
        QCOMPARE(ErrorClassifier::errorCode("ERR::NETWORK::timeout"), QString("NETWORK"));
        QCOMPARE(ErrorClassifier::errorCode("prefix ERR::API_ERROR"), QString("API_ERROR"));
        QVERIFY(ErrorClassifier::errorCode("plain failure").isEmpty());
    }

    void testKindToString()
    {
        QCOMPARE(QString(ErrorClassifier::kindToString(ErrorKind::DiskFull)), QString("disk-full"));
        QCOMPARE(QString(ErrorClassifier::kindToString(ErrorKind::Unclassified)),
                 QString("unclassified"));
    }
};

QTEST_MAIN(TestErrorClassifier)
#include "test_errorclassifier.moc"
