#include <QtTest/QtTest>
#include <QtCore/QThread>
#include <atomic>
#include <memory>

#include "../src/core/common/ConcurrentQueue.hpp"

using namespace Parley;

class TestConcurrentQueue : public QObject {
    Q_OBJECT

private slots:
    void testFifoOrder() {
        BoundedQueue<int> queue(4);
        QVERIFY(queue.push(1));
        QVERIFY(queue.push(2));
        QVERIFY(queue.push(3));

        int value = 0;
        QVERIFY(queue.pop(value));
        QCOMPARE(value, 1);
        QVERIFY(queue.pop(value));
        QCOMPARE(value, 2);
        QCOMPARE(queue.size(), size_t(1));
    }

    void testCloseDrainsRemainingItems() {
        BoundedQueue<int> queue(4);
        queue.push(7);
        queue.push(8);
        queue.close();

        QVERIFY(!queue.push(9));

        int value = 0;
        QVERIFY(queue.pop(value));
        QCOMPARE(value, 7);
        QVERIFY(queue.pop(value));
        QCOMPARE(value, 8);
        QVERIFY(!queue.pop(value));
    }

    void testFullQueueBlocksProducer() {
        BoundedQueue<int> queue(2);
        std::atomic<int> pushed{0};

        std::unique_ptr<QThread> producer(QThread::create([&]() {
            for (int i = 0; i < 10; ++i) {
                if (!queue.push(int(i))) {
                    return;
                }
                ++pushed;
            }
        }));
        producer->start();

        QTest::qWait(100);
        QCOMPARE(pushed.load(), 2);
        QVERIFY(queue.blockedPushes() >= 1);

        // Everything arrives once the consumer catches up
        QList<int> received;
        int value = 0;
        while (received.size() < 10 && queue.pop(value)) {
            received.append(value);
        }
        QVERIFY(producer->wait(2000));
        QCOMPARE(int(received.size()), 10);
        for (int i = 0; i < 10; ++i) {
            QCOMPARE(received[i], i);
        }
    }

    void testCloseReleasesBlockedProducer() {
        BoundedQueue<int> queue(1);
        queue.push(1);
        std::atomic<bool> result{true};

        std::unique_ptr<QThread> producer(QThread::create([&]() {
            result = queue.push(2);
        }));
        producer->start();
        QTest::qWait(50);

        queue.close();
        QVERIFY(producer->wait(2000));
        QVERIFY(!result);
    }

    void testCloseReleasesBlockedConsumer() {
        BoundedQueue<int> queue(1);
        std::atomic<bool> result{true};

        std::unique_ptr<QThread> consumer(QThread::create([&]() {
            int value = 0;
            result = queue.pop(value);
        }));
        consumer->start();
        QTest::qWait(50);

        queue.close();
        QVERIFY(consumer->wait(2000));
        QVERIFY(!result);
    }

    void testResetReopens() {
        BoundedQueue<int> queue(2);
        queue.push(1);
        queue.close();
        queue.reset();

        QVERIFY(!queue.isClosed());
        QCOMPARE(queue.size(), size_t(0));
        QVERIFY(queue.push(5));
    }

    void testOutboxDrainsInPostOrder() {
        EventOutbox<QString> outbox;
        QVERIFY(outbox.isEmpty());
        outbox.post("a");
        outbox.post("b");

        const auto drained = outbox.drain();
        QCOMPARE(drained.size(), size_t(2));
        QCOMPARE(drained[0], QString("a"));
        QCOMPARE(drained[1], QString("b"));
        QVERIFY(outbox.isEmpty());
    }
};

int runTestConcurrentQueue(int argc, char** argv) {
    TestConcurrentQueue test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_concurrent_queue.moc"
