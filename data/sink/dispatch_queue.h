/**
 * @file dispatch_queue.h
 * @brief 스레드 안전 유한 큐 (생산자 비차단)
 *
 * 가득 차면 가장 오래된 항목을 버리고 새 항목을 넣음.
 * 소비자는 pop 에서 대기하며 stop 이후 남은 항목을 모두 꺼낸 뒤 false 반환
 */

#ifndef DISPATCH_QUEUE_H
#define DISPATCH_QUEUE_H

#include <condition_variable>
#include <deque>
#include <mutex>

template <typename T>
class DispatchQueue {
public:
    explicit DispatchQueue(size_t max_items = 1024) : max_items_(max_items > 0 ? max_items : 1) {}

    /**
     * @brief 항목 추가 (차단하지 않음)
     * @return 공간 확보를 위해 항목을 버렸으면 true
     */
    bool push(T item) {
        bool dropped = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.size() >= max_items_) {
                queue_.pop_front();
                dropped = true;
            }
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
        return dropped;
    }

    /**
     * @brief 항목 꺼내기 (비어 있으면 대기)
     * @return stop 되고 큐가 비었으면 false
     */
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return !queue_.empty() || stopped_; });
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    size_t max_items_;
    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
};

#endif // DISPATCH_QUEUE_H
