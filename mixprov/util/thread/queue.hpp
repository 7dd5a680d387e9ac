#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string_view>

namespace mixprov::thread
{
  enum class QueueReturn
  {
    Success,
    QueueDisabled,
    QueueEmpty,
    QueueFull
  };

  inline constexpr std::string_view
  to_string(QueueReturn val)
  {
    switch (val)
    {
      case QueueReturn::Success:
        return "Success";
      case QueueReturn::QueueDisabled:
        return "QueueDisabled";
      case QueueReturn::QueueEmpty:
        return "QueueEmpty";
      case QueueReturn::QueueFull:
        return "QueueFull";
    }
    return "Unknown";
  }

  /// A thread-safe FIFO work queue for a single consumer.
  ///
  /// A capacity of 0 makes the queue unbounded: pushes never fail for lack of space, at the price
  /// of no backpressure on producers.  With a non-zero capacity tryPushBack() rejects with
  /// QueueFull once that many elements are waiting.
  ///
  /// Disabling the queue makes every push fail fast with QueueDisabled; popFront() keeps handing
  /// out the elements that were accepted before the queue was disabled and returns an empty
  /// optional once the queue is both disabled and empty.
  template <typename Type>
  class Queue
  {
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<Type> _items;
    const size_t _capacity;
    bool _enabled{true};

   public:
    explicit Queue(size_t capacity = 0) : _capacity{capacity}
    {}

    Queue(const Queue&) = delete;
    Queue&
    operator=(const Queue&) = delete;

    QueueReturn
    tryPushBack(Type&& value)
    {
      {
        std::lock_guard lock{_mutex};
        if (not _enabled)
          return QueueReturn::QueueDisabled;
        if (_capacity != 0 and _items.size() >= _capacity)
          return QueueReturn::QueueFull;
        _items.push_back(std::move(value));
      }
      _cv.notify_one();
      return QueueReturn::Success;
    }

    /// Remove an element from the queue, blocking until one is available.  Returns nullopt once
    /// the queue has been disabled and fully drained.
    std::optional<Type>
    popFront()
    {
      std::unique_lock lock{_mutex};
      _cv.wait(lock, [this] { return not _items.empty() or not _enabled; });
      if (_items.empty())
        return std::nullopt;
      std::optional<Type> ret{std::move(_items.front())};
      _items.pop_front();
      return ret;
    }

    std::optional<Type>
    tryPopFront()
    {
      std::lock_guard lock{_mutex};
      if (_items.empty())
        return std::nullopt;
      std::optional<Type> ret{std::move(_items.front())};
      _items.pop_front();
      return ret;
    }

    void
    disable()
    {
      {
        std::lock_guard lock{_mutex};
        _enabled = false;
      }
      _cv.notify_all();
    }

    bool
    enabled() const
    {
      std::lock_guard lock{_mutex};
      return _enabled;
    }

    size_t
    capacity() const
    {
      return _capacity;
    }

    size_t
    size() const
    {
      std::lock_guard lock{_mutex};
      return _items.size();
    }

    bool
    empty() const
    {
      return size() == 0;
    }
  };
}  // namespace mixprov::thread
