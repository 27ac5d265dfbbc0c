#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace infu
{

enum class WorkKind : int8_t
{
  Reconstruction,
  Inference,
  Maintenance,
};

struct WorkItem
{
  WorkKind kind{WorkKind::Inference};
  std::string label;
  std::move_only_function<void()> task;
};

/**
 * @brief Single-lane FIFO executor for everything that touches the device
 *
 * One worker thread runs the items in submission order, one at a time.
 * The queue is unbounded. An item cannot be cancelled once submitted.
 */
class AccessScheduler
{
public:
  explicit AccessScheduler(int device = 0);
  ~AccessScheduler();
  AccessScheduler(const AccessScheduler&) = delete;
  AccessScheduler& operator=(const AccessScheduler&) = delete;

  void start();
  // Runs what is already queued, then joins the lane.
  void stop();
  bool running() const;

  // Both return the number of items queued ahead of the (first) new one.
  // A group is queued contiguously: nothing submitted concurrently can run
  // between its items.
  std::size_t submit(WorkItem item);
  std::size_t submit(std::vector<WorkItem> items);

  template <typename F>
  auto run(WorkKind kind, std::string label, F&& f) -> std::future<std::invoke_result_t<F>>
  {
    std::packaged_task<std::invoke_result_t<F>()> task{std::forward<F>(f)};
    auto future = task.get_future();
    submit(WorkItem{kind, std::move(label), std::move(task)});
    return future;
  }

  std::size_t pending() const;
  int64_t completed() const;
  int device() const noexcept { return m_device; }

  // True when called from the lane thread itself.
  bool in_lane() const noexcept;

private:
  void worker_loop();

  int m_device{0};

  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  std::deque<WorkItem> m_queue;
  bool m_accepting{false};
  bool m_stop{false};
  int64_t m_completed{0};

  std::thread m_worker;
  // Cleared once the lane has been joined.
  std::atomic<std::thread::id> m_lane_id{};
};

}
