#include "AdapterSet.hpp"

#include <QDebug>

#include <boost/container/small_vector.hpp>
#include <fmt/format.h>

#include <exception>

namespace infu
{

Expected<AdapterChanges> AdapterSet::attach(Pipeline& pipeline, const AdapterSpec& adapter)
{
  AdapterChanges changes;
  if (auto it = m_attached.find(adapter.name); it != m_attached.end())
  {
    if (it->second == adapter.weight)
      return changes;

    auto res = detach(pipeline, adapter.name);
    if (!res)
      return res;
    changes.detached = res->detached;
  }

  try
  {
    if (auto res = pipeline.load_adapter(adapter); !res)
      return std::unexpected(std::move(res.error()));
  }
  catch (const std::exception& e)
  {
    return fail(
        ErrorKind::ConstructionFailed,
        fmt::format("loading add-on '{}' failed: {}", adapter.name, e.what()));
  }
  catch (...)
  {
    return fail(
        ErrorKind::ConstructionFailed,
        fmt::format("loading add-on '{}' failed: unknown exception", adapter.name));
  }

  qDebug() << "AdapterSet: attached" << adapter.name.c_str() << "weight" << adapter.weight;
  m_attached.emplace(adapter.name, adapter.weight);
  changes.attached = 1;
  return changes;
}

Expected<AdapterChanges> AdapterSet::detach(Pipeline& pipeline, const std::string& id)
{
  auto it = m_attached.find(id);
  if (it == m_attached.end())
    return AdapterChanges{};

  try
  {
    if (auto res = pipeline.delete_adapter(id); !res)
      return std::unexpected(std::move(res.error()));
  }
  catch (const std::exception& e)
  {
    return fail(
        ErrorKind::ConstructionFailed,
        fmt::format("removing add-on '{}' failed: {}", id, e.what()));
  }
  catch (...)
  {
    return fail(
        ErrorKind::ConstructionFailed,
        fmt::format("removing add-on '{}' failed: unknown exception", id));
  }

  qDebug() << "AdapterSet: detached" << id.c_str();
  m_attached.erase(it);
  return AdapterChanges{.detached = 1};
}

Expected<AdapterChanges> AdapterSet::detach_all(Pipeline& pipeline)
{
  AdapterChanges total;
  while (!m_attached.empty())
  {
    auto res = detach(pipeline, m_attached.begin()->first);
    if (!res)
      return res;
    total.detached += res->detached;
  }
  return total;
}

Expected<AdapterChanges>
AdapterSet::apply(Pipeline& pipeline, const AddOnSet& wanted, const ModelStore& store)
{
  // Resolve every file first so that a missing one does not leave a
  // half-applied set behind.
  boost::container::small_vector<AdapterSpec, 4> to_attach;
  for (const auto& [id, weight] : wanted)
  {
    auto cur = m_attached.find(id);
    if (cur != m_attached.end() && cur->second == weight)
      continue;

    auto spec = store.adapter(id, weight);
    if (!spec)
      return std::unexpected(std::move(spec.error()));
    to_attach.push_back(std::move(*spec));
  }

  boost::container::small_vector<std::string, 4> to_detach;
  for (const auto& [id, weight] : m_attached)
  {
    auto w = wanted.find(id);
    if (w == wanted.end() || w->second != weight)
      to_detach.push_back(id);
  }

  AdapterChanges total;
  for (const auto& id : to_detach)
  {
    auto res = detach(pipeline, id);
    if (!res)
      return res;
    total.detached += res->detached;
  }

  for (const auto& spec : to_attach)
  {
    auto res = attach(pipeline, spec);
    if (!res)
      return res;
    total.attached += res->attached;
    total.detached += res->detached;
  }
  return total;
}

}
