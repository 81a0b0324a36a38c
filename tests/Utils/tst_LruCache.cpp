#include <QtTest/QtTest>
#include "utils/LruCache.h"

/**
 * @brief Tests for the LruCache template
 *
 * Covers:
 * - Capacity bound under repeated insertion
 * - Least-recently-used (not oldest-inserted) eviction
 * - peek() not touching recency
 * - Replacing values, remove and clear
 * - Shrinking capacity and the eviction callback
 */
class TestLruCache : public QObject
{
    Q_OBJECT

private slots:
    void testPut_StaysWithinCapacity();
    void testPut_EvictsLeastRecentlyInserted();
    void testGet_RefreshesRecency();
    void testGet_MissingKey();
    void testPeek_DoesNotRefreshRecency();
    void testPut_ExistingKeyReplacesValue();
    void testRemove();
    void testClear();
    void testSetCapacity_ShrinkEvictsOldest();
    void testConstructor_NonPositiveCapacity();
    void testEvictionCallback();
    void testKeys_OrderedLeastRecentFirst();
};

void TestLruCache::testPut_StaysWithinCapacity()
{
    for (int capacity = 1; capacity <= 8; ++capacity) {
        LruCache<int, QString> cache(capacity);
        for (int i = 0; i < capacity * 3 + 1; ++i) {
            cache.put(i, QString::number(i));
            QVERIFY(cache.size() <= capacity);
        }
        QCOMPARE(cache.size(), capacity);
    }
}

void TestLruCache::testPut_EvictsLeastRecentlyInserted()
{
    LruCache<QString, int> cache(2);
    cache.put("a", 1);
    cache.put("b", 2);
    cache.put("c", 3);

    QVERIFY(!cache.contains("a"));
    QVERIFY(cache.contains("b"));
    QVERIFY(cache.contains("c"));
}

void TestLruCache::testGet_RefreshesRecency()
{
    LruCache<QString, int> cache(2);
    cache.put("a", 1);
    cache.put("b", 2);

    // "a" is older but was used last, so "b" goes
    QVERIFY(cache.get("a") != nullptr);
    cache.put("c", 3);

    QVERIFY(cache.contains("a"));
    QVERIFY(!cache.contains("b"));
    QVERIFY(cache.contains("c"));
}

void TestLruCache::testGet_MissingKey()
{
    LruCache<QString, int> cache(2);
    QCOMPARE(cache.get("missing"), static_cast<int*>(nullptr));
}

void TestLruCache::testPeek_DoesNotRefreshRecency()
{
    LruCache<QString, int> cache(2);
    cache.put("a", 1);
    cache.put("b", 2);

    QVERIFY(cache.peek("a") != nullptr);
    QCOMPARE(*cache.peek("a"), 1);
    cache.put("c", 3);

    QVERIFY(!cache.contains("a"));
    QVERIFY(cache.contains("b"));
}

void TestLruCache::testPut_ExistingKeyReplacesValue()
{
    LruCache<QString, int> cache(2);
    cache.put("a", 1);
    cache.put("b", 2);
    cache.put("a", 10);

    QCOMPARE(cache.size(), 2);
    QCOMPARE(*cache.peek("a"), 10);

    // Replacing also counts as a use
    cache.put("c", 3);
    QVERIFY(cache.contains("a"));
    QVERIFY(!cache.contains("b"));
}

void TestLruCache::testRemove()
{
    LruCache<QString, int> cache(3);
    cache.put("a", 1);

    QVERIFY(cache.remove("a"));
    QVERIFY(!cache.remove("a"));
    QVERIFY(cache.isEmpty());
}

void TestLruCache::testClear()
{
    LruCache<int, int> cache(4);
    for (int i = 0; i < 4; ++i) {
        cache.put(i, i);
    }
    cache.clear();

    QCOMPARE(cache.size(), 0);
    QCOMPARE(cache.capacity(), 4);
}

void TestLruCache::testSetCapacity_ShrinkEvictsOldest()
{
    LruCache<int, int> cache(5);
    for (int i = 0; i < 5; ++i) {
        cache.put(i, i);
    }
    cache.get(0);
    cache.setCapacity(2);

    QCOMPARE(cache.size(), 2);
    QVERIFY(cache.contains(0));
    QVERIFY(cache.contains(4));
}

void TestLruCache::testConstructor_NonPositiveCapacity()
{
    LruCache<int, int> cache(0);
    QCOMPARE(cache.capacity(), 1);

    cache.put(1, 1);
    cache.put(2, 2);
    QCOMPARE(cache.size(), 1);
    QVERIFY(cache.contains(2));
}

void TestLruCache::testEvictionCallback()
{
    LruCache<QString, int> cache(1);
    QStringList evicted;
    cache.setEvictionCallback([&evicted](const QString& key, const int&) {
        evicted.append(key);
    });

    cache.put("a", 1);
    cache.put("b", 2);
    cache.put("c", 3);

    QCOMPARE(evicted, QStringList({"a", "b"}));

    // Explicit removal is not an eviction
    cache.remove("c");
    QCOMPARE(evicted.size(), 2);
}

void TestLruCache::testKeys_OrderedLeastRecentFirst()
{
    LruCache<QString, int> cache(3);
    cache.put("a", 1);
    cache.put("b", 2);
    cache.put("c", 3);
    cache.get("a");

    QCOMPARE(cache.keys(), QList<QString>({"b", "c", "a"}));
}

QTEST_MAIN(TestLruCache)
#include "tst_LruCache.moc"
