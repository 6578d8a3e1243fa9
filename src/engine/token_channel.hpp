#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <string>

namespace verity::engine {

    /**
     * @brief Single-producer, single-consumer queue of streamed text.
     *
     * The producer pushes and finally closes; the consumer pops until pop
     * returns false. cancel() is raised by the consumer and polled by the
     * producer through cancelled().
     */
    class TokenChannel {
    public:
        void push(std::string token) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_closed || m_cancelled) return;
                m_queue.push(std::move(token));
            }
            m_cv.notify_one();
        }

        /**
         * @brief Blocks for the next item. False once closed and drained, or cancelled.
         */
        bool pop(std::string& token) {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_queue.empty() || m_closed || m_cancelled; });

            if (m_cancelled || m_queue.empty()) return false;

            token = std::move(m_queue.front());
            m_queue.pop();
            return true;
        }

        void close() {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_closed = true;
            }
            m_cv.notify_all();
        }

        void cancel() {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_cancelled = true;
            }
            m_cv.notify_all();
        }

        bool cancelled() const { return m_cancelled; }
        const std::atomic<bool>& cancel_flag() const { return m_cancelled; }

        size_t size() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.size();
        }

    private:
        std::queue<std::string> m_queue;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_closed = false;
        std::atomic<bool> m_cancelled{false};
    };

}
