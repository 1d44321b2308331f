/**
 * @file test_cachemanager.cpp
 * @brief Unit tests for CacheManager and CacheDirectory
 *
 * Tests the endpoint set, best-effort fetching, the side table and the
 * background worker path.
 */

#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QSignalSpy>
#include "faketransport.h"
#include "cache/cachemanager.h"

using namespace FieldSync;

class TestCacheManager : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ========== Endpoint Tests ==========
    void testRequestsForReview();
    void testRequestsWithQuestionnaires();
    void testSanitize();

    // ========== Fetch Tests ==========
    void testFetchStoresAllResponses();
    void testFailedEndpointsSkipped();
    void testCachedRequiresReview();
    void testNoTransport();

    // ========== Side Table Tests ==========
    void testCachedReviewsListed();
    void testClearReviewCache();
    void testSharedRoot();

    // ========== Worker Tests ==========
    void testWorkerCachesInBackground();
    void testStopWorker();

private:
    QTemporaryDir *m_tempDir = nullptr;
    FakeTransport *m_transport = nullptr;
    CacheManager *m_cache = nullptr;
};

void TestCacheManager::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());

    m_transport = new FakeTransport();
    m_cache = new CacheManager(m_tempDir->filePath("cache"), m_transport);
}

void TestCacheManager::cleanup()
{
    delete m_cache;
    delete m_transport;
    delete m_tempDir;
    m_cache = nullptr;
    m_transport = nullptr;
    m_tempDir = nullptr;
}

// ========== Endpoint Tests ==========

void TestCacheManager::testRequestsForReview()
{
    QList<CacheRequest> requests = CacheDirectory::requestsFor("review-1", QStringList());
    QCOMPARE(requests.size(), 4);
    QCOMPARE(requests.at(0).key, QString("review"));
    QCOMPARE(requests.at(0).procedure, QString("review.getById"));
    QCOMPARE(requests.at(0).input["id"].toString(), QString("review-1"));
    QCOMPARE(requests.at(1).procedure, QString("fieldwork.getChecklistTemplate"));
    QCOMPARE(requests.at(2).procedure, QString("review.getTeamMembers"));
    QCOMPARE(requests.at(3).procedure, QString("document.listByReview"));
    QCOMPARE(requests.at(3).input["reviewId"].toString(), QString("review-1"));
}

void TestCacheManager::testRequestsWithQuestionnaires()
{
    QList<CacheRequest> requests = CacheDirectory::requestsFor("review-1", {"ANS_USOAP_CMA", "SMS_CANSO_SOE"});
    QCOMPARE(requests.size(), 6);
    QCOMPARE(requests.at(4).procedure, QString("questionnaire.getStructure"));
    QCOMPARE(requests.at(4).key, QString("questionnaire-ans_usoap_cma"));
    QCOMPARE(requests.at(5).input["questionnaireType"].toString(), QString("SMS_CANSO_SOE"));
}

void TestCacheManager::testSanitize()
{
    QCOMPARE(CacheDirectory::sanitize("review/../1"), QString("review_.._1"));
    QCOMPARE(CacheDirectory::sanitize(".."), QString("_"));
    QCOMPARE(CacheDirectory::sanitize("abc-1.2_x"), QString("abc-1.2_x"));
}

// ========== Fetch Tests ==========

void TestCacheManager::testFetchStoresAllResponses()
{
    QJsonObject review;
    review["id"] = "review-1";
    review["status"] = "IN_PROGRESS";
    m_transport->script("review.getById", FakeTransport::ok(review));

    QSignalSpy spy(m_cache, &CacheManager::reviewCached);
    QCOMPARE(m_cache->fetchReviewNow("review-1"), 4);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(1).toInt(), 4);
    QCOMPARE(spy.at(0).at(2).toInt(), 4);

    QVERIFY(m_cache->isCachedForOffline("review-1"));
    QJsonObject cached = QJsonDocument::fromJson(m_cache->cachedResponse("review-1", "review")).object();
    QCOMPARE(cached["status"].toString(), QString("IN_PROGRESS"));

    for (const RecordedCall &call : m_transport->calls) {
        QCOMPARE(call.kind, QString("query"));
    }
}

void TestCacheManager::testFailedEndpointsSkipped()
{
    m_transport->script("review.getTeamMembers", FakeTransport::status(500));
    m_transport->script("document.listByReview", FakeTransport::networkFailure());

    QSignalSpy logSpy(m_cache, &CacheManager::logMessage);
    QCOMPARE(m_cache->fetchReviewNow("review-1"), 2);
    QVERIFY(m_cache->isCachedForOffline("review-1"));
    QVERIFY(m_cache->cachedResponse("review-1", "team-members").isEmpty());
    QVERIFY(logSpy.count() >= 3);
}

void TestCacheManager::testCachedRequiresReview()
{
    m_transport->script("review.getById", FakeTransport::status(404));

    QVERIFY(!m_cache->cacheReviewForOffline("review-1"));
    QVERIFY(!m_cache->isCachedForOffline("review-1"));
    QVERIFY(!m_cache->cachedResponse("review-1", "checklist-template").isEmpty());
}

void TestCacheManager::testNoTransport()
{
    CacheManager cache(m_tempDir->filePath("other"), nullptr);
    QSignalSpy errorSpy(&cache, &CacheManager::errorOccurred);
    QCOMPARE(cache.fetchReviewNow("review-1"), 0);
    QCOMPARE(errorSpy.count(), 1);
    QVERIFY(!cache.cacheReviewForOffline(QString()));
}

// ========== Side Table Tests ==========

void TestCacheManager::testCachedReviewsListed()
{
    QVERIFY(m_cache->getCachedReviews().isEmpty());

    m_cache->fetchReviewNow("review-1");
    m_cache->fetchReviewNow("review-2");

    QList<CachedReview> reviews = m_cache->getCachedReviews();
    QCOMPARE(reviews.size(), 2);
    QCOMPARE(reviews.first().entries, 4);
    QVERIFY(reviews.first().cachedAt.isValid());
}

void TestCacheManager::testClearReviewCache()
{
    m_cache->fetchReviewNow("review-1");
    QVERIFY(m_cache->clearReviewCache("review-1"));
    QVERIFY(!m_cache->isCachedForOffline("review-1"));
    QVERIFY(m_cache->getCachedReviews().isEmpty());

    // Clearing something never cached is fine
    QVERIFY(m_cache->clearReviewCache("review-9"));
}

void TestCacheManager::testSharedRoot()
{
    m_cache->fetchReviewNow("review-1");

    CacheDirectory other(m_cache->cacheRoot());
    QVERIFY(other.contains("review-1", CacheDirectory::REVIEW_KEY));
    QCOMPARE(other.keys("review-1").size(), 4);
    QCOMPARE(other.cachedReviews().size(), 1);
}

// ========== Worker Tests ==========

void TestCacheManager::testWorkerCachesInBackground()
{
    m_cache->setQuestionnaireTypes({"ANS_USOAP_CMA"});
    m_cache->startWorker([]() { return new FakeTransport(); });
    QVERIFY(m_cache->isWorkerRunning());

    QSignalSpy spy(m_cache, &CacheManager::reviewCached);
    QVERIFY(m_cache->cacheReviewForOffline("review-1"));

    QTRY_COMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), QString("review-1"));
    QCOMPARE(spy.at(0).at(1).toInt(), 5);
    QCOMPARE(spy.at(0).at(2).toInt(), 5);
    QVERIFY(m_cache->isCachedForOffline("review-1"));

    // The worker used its own transport
    QVERIFY(m_transport->calls.isEmpty());
}

void TestCacheManager::testStopWorker()
{
    m_cache->startWorker([]() { return new FakeTransport(); });
    m_cache->stopWorker();
    QVERIFY(!m_cache->isWorkerRunning());

    // Falls back to the caller's thread
    QVERIFY(m_cache->cacheReviewForOffline("review-1"));
    QCOMPARE(m_transport->calls.size(), 4);
}

QTEST_MAIN(TestCacheManager)
#include "test_cachemanager.moc"
