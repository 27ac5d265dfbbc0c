#include "AccessScheduler.hpp"

#include <QDebug>

#include <exception>
#include <stdexcept>

namespace infu
{

static std::string_view to_string(WorkKind kind) noexcept
{
  switch (kind)
  {
    case WorkKind::Reconstruction:
      return "reconstruction";
    case WorkKind::Inference:
      return "inference";
    case WorkKind::Maintenance:
      return "maintenance";
  }
  return "work";
}

AccessScheduler::AccessScheduler(int device)
    : m_device{device}
{
}

AccessScheduler::~AccessScheduler()
{
  stop();
}

void AccessScheduler::start()
{
  std::lock_guard lock{m_mutex};
  if (m_lane_id.load() != std::thread::id{})
    return;

  m_stop = false;
  m_accepting = true;
  m_worker = std::thread{&AccessScheduler::worker_loop, this};
  m_lane_id = m_worker.get_id();
  qDebug() << "AccessScheduler: lane started for device" << m_device;
}

void AccessScheduler::stop()
{
  std::thread worker;
  {
    std::unique_lock lock{m_mutex};
    if (in_lane())
      throw std::logic_error{"AccessScheduler: stop() called from the lane"};
    if (!m_worker.joinable())
    {
      // Another caller may be joining the lane
      m_cv.wait(lock, [this] { return m_lane_id.load() == std::thread::id{}; });
      return;
    }
    m_accepting = false;
    m_stop = true;
    worker = std::move(m_worker);
  }
  m_cv.notify_all();
  worker.join();

  int64_t completed{};
  {
    std::lock_guard lock{m_mutex};
    m_lane_id = std::thread::id{};
    completed = m_completed;
  }
  m_cv.notify_all();
  qDebug() << "AccessScheduler: lane stopped after" << completed << "items";
}

bool AccessScheduler::running() const
{
  std::lock_guard lock{m_mutex};
  return m_accepting;
}

std::size_t AccessScheduler::submit(WorkItem item)
{
  std::vector<WorkItem> items;
  items.push_back(std::move(item));
  return submit(std::move(items));
}

std::size_t AccessScheduler::submit(std::vector<WorkItem> items)
{
  std::size_t position{};
  {
    std::lock_guard lock{m_mutex};
    if (!m_accepting)
      throw std::logic_error{"AccessScheduler: lane is not running"};

    position = m_queue.size();
    for (auto& item : items)
      m_queue.push_back(std::move(item));
  }
  m_cv.notify_one();
  return position;
}

std::size_t AccessScheduler::pending() const
{
  std::lock_guard lock{m_mutex};
  return m_queue.size();
}

int64_t AccessScheduler::completed() const
{
  std::lock_guard lock{m_mutex};
  return m_completed;
}

bool AccessScheduler::in_lane() const noexcept
{
  return m_lane_id.load() == std::this_thread::get_id();
}

void AccessScheduler::worker_loop()
{
  for (;;)
  {
    WorkItem item;
    {
      std::unique_lock lock{m_mutex};
      m_cv.wait(lock, [this] { return m_stop || !m_queue.empty(); });
      if (m_queue.empty())
        return;

      item = std::move(m_queue.front());
      m_queue.pop_front();
    }

    try
    {
      if (item.task)
        item.task();
    }
    catch (const std::exception& e)
    {
      qWarning() << "AccessScheduler:" << to_string(item.kind).data() << "item"
                 << item.label.c_str() << "threw:" << e.what();
    }
    catch (...)
    {
      qWarning() << "AccessScheduler:" << to_string(item.kind).data() << "item"
                 << item.label.c_str() << "threw a non-standard exception";
    }

    std::lock_guard lock{m_mutex};
    m_completed++;
  }
}

}
