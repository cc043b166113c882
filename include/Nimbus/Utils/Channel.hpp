#pragma once

#include <chrono> // std::chrono::duration

#include "Definitions.hpp"
#include "Types.hpp"

namespace nimbus::utils::sync {
  namespace {
    using types::CondVar;
    using types::Deque;
    using types::LockGuard;
    using types::Mutex;
    using types::None;
    using types::Option;
    using types::UniqueLock;
    using types::usize;
  } // namespace

  /**
   * @brief Unbounded multiple-producer/single-consumer FIFO queue.
   *
   * Any number of threads may push concurrently; one thread pops. Items pushed
   * by the same producer are popped in the order they were pushed, and nothing
   * pushed is ever dropped.
   *
   * @tparam T The item type. Must be move-constructible.
   */
  template <typename T>
  class Channel {
   public:
    Channel() = default;

    Channel(const Channel&)                = delete;
    Channel(Channel&&)                     = delete;
    fn operator=(const Channel&)->Channel& = delete;
    fn operator=(Channel&&)->Channel&      = delete;

    ~Channel() = default;

    /**
     * @brief Enqueues an item and wakes the consumer.
     * @param item The item to enqueue.
     */
    fn push(T item) -> void {
      {
        const LockGuard lock(m_mutex);
        m_items.push_back(std::move(item));
      }

      m_ready.notify_one();
    }

    /**
     * @brief Blocks until an item is available, then dequeues it.
     * @return The oldest queued item.
     */
    fn pop() -> T {
      UniqueLock lock(m_mutex);

      m_ready.wait(lock, [this] { return !m_items.empty(); });

      T item = std::move(m_items.front());
      m_items.pop_front();

      return item;
    }

    /**
     * @brief Waits up to @p timeout for an item.
     * @return The oldest queued item, or None if the wait timed out.
     */
    template <typename Rep, typename Period>
    fn popFor(const std::chrono::duration<Rep, Period>& timeout) -> Option<T> {
      UniqueLock lock(m_mutex);

      if (!m_ready.wait_for(lock, timeout, [this] { return !m_items.empty(); }))
        return None;

      T item = std::move(m_items.front());
      m_items.pop_front();

      return item;
    }

    [[nodiscard]] fn size() const -> usize {
      const LockGuard lock(m_mutex);
      return m_items.size();
    }

   private:
    mutable Mutex m_mutex;
    CondVar       m_ready;
    Deque<T>      m_items;
  };
} // namespace nimbus::utils::sync
