/**
 * @file timer.hpp
 * @brief Periodic task scheduler driven by one background thread.
 *
 * Paces the discovery broadcast and the client keep-alive ping. Deadlines
 * use the monotonic clock; a task that falls several periods behind fires
 * once and is re-aligned instead of bursting.
 *
 * All public methods are thread-safe. A callback may Add() or Remove()
 * tasks (including itself). Once Remove() or Stop() returns, the removed
 * callbacks are not running and will not run again.
 */

#ifndef HIDREM_TIMER_HPP_
#define HIDREM_TIMER_HPP_

#include "hidrem/platform.hpp"
#include "hidrem/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace hidrem {

/**
 * @brief Callback invoked on each period tick with the context given to Add().
 */
using TimerTaskFn = void (*)(void* ctx);

class TimerScheduler final {
 public:
  /** @param max_tasks Capacity; Add() beyond it reports kSlotsFull. */
  explicit TimerScheduler(uint32_t max_tasks = 8) : slots_(max_tasks) {}

  ~TimerScheduler() { Stop(); }

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;

  /**
   * @brief Register @p fn to fire every @p period_ms, first after one period.
   * @return kInvalidPeriod for a zero period, kSlotsFull at capacity.
   */
  expected<TimerTaskId, TimerError> Add(uint32_t period_ms, TimerTaskFn fn,
                                        void* ctx = nullptr) {
    if (period_ms == 0U || fn == nullptr) {
      return expected<TimerTaskId, TimerError>::error(TimerError::kInvalidPeriod);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (TaskSlot& slot : slots_) {
      if (slot.active) {
        continue;
      }
      slot.fn = fn;
      slot.ctx = ctx;
      slot.period_ms = period_ms;
      slot.next_fire_ms = SteadyNowMs() + period_ms;
      slot.id = next_id_++;
      slot.active = true;
      cv_.notify_all();
      return expected<TimerTaskId, TimerError>::success(TimerTaskId(slot.id));
    }
    return expected<TimerTaskId, TimerError>::error(TimerError::kSlotsFull);
  }

  /**
   * @brief Cancel a task.
   * @return kNotRunning if @p task_id is not registered.
   */
  expected<void, TimerError> Remove(TimerTaskId task_id) {
    std::lock_guard<std::recursive_mutex> firing(fire_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    for (TaskSlot& slot : slots_) {
      if (slot.active && slot.id == task_id.value()) {
        slot.active = false;
        return expected<void, TimerError>::success();
      }
    }
    return expected<void, TimerError>::error(TimerError::kNotRunning);
  }

  expected<void, TimerError> Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    running_ = true;
    worker_ = std::thread(&TimerScheduler::ScheduleLoop, this);
    return expected<void, TimerError>::success();
  }

  /** @brief Stop and join the scheduler thread. Safe when not running. */
  void Stop() {
    std::thread worker;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_ = false;
      worker = std::move(worker_);
      cv_.notify_all();
    }
    if (worker.joinable()) {
      if (worker.get_id() == std::this_thread::get_id()) {
        worker.detach();
      } else {
        worker.join();
      }
    }
  }

  bool IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
  }

  uint32_t TaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0U;
    for (const TaskSlot& slot : slots_) {
      if (slot.active) {
        ++count;
      }
    }
    return count;
  }

 private:
  struct TaskSlot {
    TimerTaskFn fn = nullptr;
    void* ctx = nullptr;
    uint64_t period_ms = 0;
    uint64_t next_fire_ms = 0;
    uint32_t id = 0;
    bool active = false;
  };

  struct DueTask {
    TimerTaskFn fn;
    void* ctx;
    uint32_t id;
  };

  void ScheduleLoop() {
    std::vector<DueTask> due;
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
      const uint64_t now = SteadyNowMs();
      uint64_t next_deadline = now + kIdleWaitMs;
      due.clear();
      for (TaskSlot& slot : slots_) {
        if (!slot.active) {
          continue;
        }
        if (now >= slot.next_fire_ms) {
          due.push_back(DueTask{slot.fn, slot.ctx, slot.id});
          slot.next_fire_ms += slot.period_ms;
          if (slot.next_fire_ms <= now) {
            slot.next_fire_ms = now + slot.period_ms;
          }
        }
        if (slot.next_fire_ms < next_deadline) {
          next_deadline = slot.next_fire_ms;
        }
      }

      if (!due.empty()) {
        lock.unlock();
        {
          std::lock_guard<std::recursive_mutex> firing(fire_mutex_);
          for (const DueTask& task : due) {
            if (IsActive(task.id)) {
              task.fn(task.ctx);
            }
          }
        }
        lock.lock();
        continue;
      }

      const uint64_t wait_ms = next_deadline - now;
      cv_.wait_for(lock, std::chrono::milliseconds(wait_ms));
    }
  }

  bool IsActive(uint32_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const TaskSlot& slot : slots_) {
      if (slot.active && slot.id == id) {
        return true;
      }
    }
    return false;
  }

  static constexpr uint64_t kIdleWaitMs = 50U;

  std::vector<TaskSlot> slots_;
  uint32_t next_id_ = 1;
  bool running_ = false;
  std::thread worker_;
  mutable std::mutex mutex_;            // guards slots_, next_id_, running_
  std::recursive_mutex fire_mutex_;     // held while callbacks run
  std::condition_variable cv_;
};

}  // namespace hidrem

#endif  // HIDREM_TIMER_HPP_
