#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>


namespace gelfmover::utils {
    /**
     * The @c BoundedQueue is the channel between two pipeline stages. It holds at most @c capacity items; producers
     * choose between @c try_push (drop on saturation, used by UDP paths) and @c push (wait for room, used by TCP paths).
     * Items are moved in and out, so ownership passes from producer to consumer. Once closed, pushes fail and @c pop
     * keeps returning the remaining items until the queue is empty, then returns an empty optional.
     */
    template <typename T>
    class BoundedQueue {
        std::size_t m_capacity;
        std::deque<T> m_items;
        bool m_closed = false;
        mutable std::mutex m_mutex;
        std::condition_variable m_not_empty;
        std::condition_variable m_not_full;

    public:
        explicit BoundedQueue(const std::size_t capacity) :
            m_capacity(capacity == 0 ? 1 : capacity) {
        }

        BoundedQueue(const BoundedQueue &) = delete;
        auto operator=(const BoundedQueue &) -> BoundedQueue& = delete;

        [[nodiscard]]
        auto try_push(T &&item) -> bool {
            {
                std::scoped_lock lock(m_mutex);
                if (m_closed or m_items.size() >= m_capacity) {
                    return false;
                }
                m_items.push_back(std::move(item));
            }
            m_not_empty.notify_one();
            return true;
        }

        [[nodiscard]]
        auto push(T &&item) -> bool {
            {
                std::unique_lock lock(m_mutex);
                m_not_full.wait(lock, [this] { return m_closed or m_items.size() < m_capacity; });
                if (m_closed) {
                    return false;
                }
                m_items.push_back(std::move(item));
            }
            m_not_empty.notify_one();
            return true;
        }

        [[nodiscard]]
        auto pop() -> std::optional<T> {
            auto item = std::optional<T>();
            {
                std::unique_lock lock(m_mutex);
                m_not_empty.wait(lock, [this] { return m_closed or not m_items.empty(); });
                if (m_items.empty()) {
                    return std::nullopt;
                }
                item.emplace(std::move(m_items.front()));
                m_items.pop_front();
            }
            m_not_full.notify_one();
            return item;
        }

        auto close() -> void {
            {
                std::scoped_lock lock(m_mutex);
                m_closed = true;
            }
            m_not_empty.notify_all();
            m_not_full.notify_all();
        }

        [[nodiscard]]
        auto size() const -> std::size_t {
            std::scoped_lock lock(m_mutex);
            return m_items.size();
        }

        [[nodiscard]]
        auto capacity() const -> std::size_t {
            return m_capacity;
        }

        [[nodiscard]]
        auto closed() const -> bool {
            std::scoped_lock lock(m_mutex);
            return m_closed;
        }
    };
}
