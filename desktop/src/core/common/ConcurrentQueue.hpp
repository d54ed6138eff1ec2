#pragma once

#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QWaitCondition>
#include <deque>
#include <iterator>
#include <vector>

namespace Parley {

// Capacity-limited FIFO between one producer thread (audio capture) and
// one consumer thread (recognition).
// push() blocks while the queue is full: a stalled recognizer slows the
// capture path down instead of losing audio.
// close() rejects further pushes; pop() keeps draining what is left and
// only fails once the queue is both closed and empty.
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity = 256)
        : capacity_(capacity > 0 ? capacity : 1) {}

    bool push(T&& item) {
        QMutexLocker locker(&mutex_);
        while (items_.size() >= capacity_ && !closed_) {
            ++blockedPushes_;
            notFull_.wait(&mutex_);
        }
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        notEmpty_.wakeOne();
        return true;
    }

    bool pop(T& item) {
        QMutexLocker locker(&mutex_);
        while (items_.empty() && !closed_) {
            notEmpty_.wait(&mutex_);
        }
        if (items_.empty()) {
            return false;
        }
        item = std::move(items_.front());
        items_.pop_front();
        notFull_.wakeOne();
        return true;
    }

    void close() {
        QMutexLocker locker(&mutex_);
        closed_ = true;
        notEmpty_.wakeAll();
        notFull_.wakeAll();
    }

    // Re-arms a closed queue for the next run; leftover items are discarded.
    void reset() {
        QMutexLocker locker(&mutex_);
        items_.clear();
        closed_ = false;
        blockedPushes_ = 0;
    }

    bool isClosed() const {
        QMutexLocker locker(&mutex_);
        return closed_;
    }

    size_t size() const {
        QMutexLocker locker(&mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

    size_t blockedPushes() const {
        QMutexLocker locker(&mutex_);
        return blockedPushes_;
    }

private:
    mutable QMutex mutex_;
    QWaitCondition notEmpty_;
    QWaitCondition notFull_;
    std::deque<T> items_;
    const size_t capacity_;
    size_t blockedPushes_ = 0;
    bool closed_ = false;
};

// Unbounded hand-off from worker threads to the single UI-thread consumer.
// Workers only ever post immutable values; the consumer drains on its own
// schedule.
template<typename T>
class EventOutbox {
public:
    void post(T item) {
        QMutexLocker locker(&mutex_);
        items_.push_back(std::move(item));
    }

    std::vector<T> drain() {
        QMutexLocker locker(&mutex_);
        std::vector<T> drained(std::make_move_iterator(items_.begin()),
                               std::make_move_iterator(items_.end()));
        items_.clear();
        return drained;
    }

    bool isEmpty() const {
        QMutexLocker locker(&mutex_);
        return items_.empty();
    }

    void clear() {
        QMutexLocker locker(&mutex_);
        items_.clear();
    }

private:
    mutable QMutex mutex_;
    std::deque<T> items_;
};

} // namespace Parley
