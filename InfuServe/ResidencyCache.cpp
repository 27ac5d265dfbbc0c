#include "ResidencyCache.hpp"

#include <QDebug>

#include <fmt/format.h>

#include <exception>

namespace infu
{

ResidencyCache::ResidencyCache(PipelineBackend& backend, ModelStore store, int device)
    : m_backend{backend}
    , m_store{std::move(store)}
    , m_device{device}
{
}

ResidencyCache::~ResidencyCache()
{
  release();
}

Expected<ResidentPipeline*> ResidencyCache::prepare(const PipelineConfig& config)
{
  if (m_resident && m_resident->can_serve(config))
  {
    auto changes = m_resident->adapters.apply(
        *m_resident->pipeline, config.enabled_addons(), m_store);
    if (!changes)
    {
      // The pipeline itself is fine; the adapter set reflects what is
      // actually attached and the next prepare() reconciles again.
      m_stats.failures++;
      qWarning() << "ResidencyCache: add-on swap failed:"
                 << changes.error().describe().c_str();
      return std::unexpected(std::move(changes.error()));
    }

    if (changes->empty())
      m_stats.hits++;
    else
      m_stats.adapter_swaps++;
    return m_resident.get();
  }

  if (m_resident)
  {
    qDebug() << "ResidencyCache: switching model to" << config.to_string().c_str();
    // Both pipelines do not fit on the device at once
    release();
  }

  return reconstruct(config);
}

Expected<ResidentPipeline*> ResidencyCache::reconstruct(const PipelineConfig& config)
{
  auto desc = m_store.describe(config, m_device);
  if (!desc)
  {
    m_stats.failures++;
    qWarning() << "ResidencyCache:" << desc.error().describe().c_str();
    return std::unexpected(std::move(desc.error()));
  }

  qDebug() << "ResidencyCache: loading model from" << desc->infu_model_path;

  auto resident = std::make_unique<ResidentPipeline>();
  resident->variant = config.variant();
  resident->quantized = config.quantized();
  resident->cpu_offload = config.cpu_offload();

  try
  {
    auto built = m_backend.build(*desc);
    if (!built)
    {
      m_stats.failures++;
      m_backend.reclaim_device_memory(m_device);
      qWarning() << "ResidencyCache:" << built.error().describe().c_str();
      return std::unexpected(std::move(built.error()));
    }
    resident->pipeline = std::move(*built);
  }
  catch (const std::exception& e)
  {
    m_stats.failures++;
    m_backend.reclaim_device_memory(m_device);
    qWarning() << "ResidencyCache: pipeline construction threw:" << e.what();
    return fail(
        ErrorKind::ConstructionFailed,
        fmt::format("building {} failed: {}", to_string(config.variant()), e.what()));
  }
  catch (...)
  {
    m_stats.failures++;
    m_backend.reclaim_device_memory(m_device);
    qWarning() << "ResidencyCache: pipeline construction threw a non-standard exception";
    return fail(
        ErrorKind::ConstructionFailed,
        fmt::format("building {} failed: unknown exception", to_string(config.variant())));
  }

  if (!resident->pipeline)
  {
    m_stats.failures++;
    return fail(
        ErrorKind::ConstructionFailed,
        fmt::format("backend returned no pipeline for {}", to_string(config.variant())));
  }

  // Add-ons are not part of the base construction
  auto changes = resident->adapters.apply(
      *resident->pipeline, config.enabled_addons(), m_store);
  if (!changes)
  {
    m_stats.failures++;
    qWarning() << "ResidencyCache: discarding new pipeline, add-ons failed:"
               << changes.error().describe().c_str();
    resident.reset();
    m_backend.reclaim_device_memory(m_device);
    return std::unexpected(std::move(changes.error()));
  }

  m_stats.reconstructions++;
  m_resident = std::move(resident);
  return m_resident.get();
}

void ResidencyCache::release() noexcept
{
  if (!m_resident)
    return;

  qDebug() << "ResidencyCache: releasing" << to_string(m_resident->variant).data();
  m_resident.reset();
  m_backend.reclaim_device_memory(m_device);
  m_stats.releases++;
}

}
