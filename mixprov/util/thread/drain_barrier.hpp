#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace mixprov::util
{
  /// Counts units of in-flight work and lets a single closer wait for all of them to finish.
  ///
  /// enter() registers a unit of work and fails once the barrier has been closed; leave() retires
  /// one.  close_and_wait() stops further entries and blocks until the count drops to zero.
  class DrainBarrier
  {
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    size_t _inflight{0};
    bool _closed{false};

   public:
    DrainBarrier() = default;

    DrainBarrier(const DrainBarrier&) = delete;
    DrainBarrier&
    operator=(const DrainBarrier&) = delete;

    bool
    enter()
    {
      std::lock_guard lock{_mutex};
      if (_closed)
        return false;
      ++_inflight;
      return true;
    }

    /// Notifies under the lock; the barrier may be destroyed as soon as close_and_wait() returns.
    void
    leave()
    {
      std::lock_guard lock{_mutex};
      if (--_inflight == 0)
        _cv.notify_all();
    }

    /// Returns false if the barrier was already closed by an earlier call (which has then already
    /// waited, or is waiting, for the drain).
    bool
    close_and_wait()
    {
      std::unique_lock lock{_mutex};
      const bool first = not _closed;
      _closed = true;
      _cv.wait(lock, [this] { return _inflight == 0; });
      return first;
    }

    bool
    closed() const
    {
      std::lock_guard lock{_mutex};
      return _closed;
    }

    size_t
    inflight() const
    {
      std::lock_guard lock{_mutex};
      return _inflight;
    }
  };

  /// RAII helper pairing a successful DrainBarrier::enter() with its leave().
  class DrainGuard
  {
    DrainBarrier* _barrier;

   public:
    explicit DrainGuard(DrainBarrier& barrier)
        : _barrier{barrier.enter() ? &barrier : nullptr}
    {}

    ~DrainGuard()
    {
      if (_barrier)
        _barrier->leave();
    }

    DrainGuard(const DrainGuard&) = delete;
    DrainGuard&
    operator=(const DrainGuard&) = delete;

    explicit operator bool() const
    {
      return _barrier != nullptr;
    }
  };
}  // namespace mixprov::util
