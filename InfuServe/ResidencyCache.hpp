#pragma once
#include "AdapterSet.hpp"
#include "ModelStore.hpp"
#include "Pipeline.hpp"
#include "PipelineConfig.hpp"

#include <cstdint>
#include <memory>

namespace infu
{

struct ResidentPipeline
{
  Variant variant{default_variant};
  bool quantized{};
  bool cpu_offload{};
  std::unique_ptr<Pipeline> pipeline;
  AdapterSet adapters;

  bool can_serve(const PipelineConfig& config) const noexcept
  {
    return variant == config.variant() && quantized == config.quantized()
           && cpu_offload == config.cpu_offload();
  }

  PipelineConfig config() const
  {
    return PipelineConfig{variant, quantized, cpu_offload, adapters.attached()};
  }
};

struct CacheStatistics
{
  int64_t hits{0};
  int64_t adapter_swaps{0};
  int64_t reconstructions{0};
  int64_t releases{0};
  int64_t failures{0};
};

/**
 * @brief Owns the single pipeline resident on the device
 *
 * Not thread-safe: every call must come from the access scheduler lane.
 */
class ResidencyCache
{
public:
  ResidencyCache(PipelineBackend& backend, ModelStore store, int device);
  ~ResidencyCache();
  ResidencyCache(const ResidencyCache&) = delete;
  ResidencyCache& operator=(const ResidencyCache&) = delete;

  // Returns a pipeline able to serve `config`, doing the least work needed:
  // nothing, an add-on swap, or a full reconstruction. The pointer stays
  // valid until the next call to prepare() or release().
  Expected<ResidentPipeline*> prepare(const PipelineConfig& config);

  // Destroys the resident pipeline, if any, and reclaims device memory.
  void release() noexcept;

  bool empty() const noexcept { return m_resident == nullptr; }
  const ResidentPipeline* resident() const noexcept { return m_resident.get(); }
  const CacheStatistics& statistics() const noexcept { return m_stats; }
  int device() const noexcept { return m_device; }

private:
  Expected<ResidentPipeline*> reconstruct(const PipelineConfig& config);

  PipelineBackend& m_backend;
  ModelStore m_store;
  int m_device{0};

  std::unique_ptr<ResidentPipeline> m_resident;
  CacheStatistics m_stats;
};

}
