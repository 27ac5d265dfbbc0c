#pragma once
#include "CallParameters.hpp"
#include "Error.hpp"
#include "PipelineConfig.hpp"

#include <QImage>
#include <QString>

#include <memory>
#include <string>

namespace infu
{

// Everything needed to construct a pipeline. Produced by ModelStore.
struct PipelineDescription
{
  Variant variant{default_variant};
  bool quantize_8bit{true};
  bool cpu_offload{true};
  int device{0};
  QString base_model_path;
  QString infu_model_path;
  QString insightface_root_path;
  int image_proj_num_tokens{8};
  std::string infu_flux_version{"v1.0"};
};

struct AdapterSpec
{
  std::string name;
  QString path;
  float weight{1.f};
};

/**
 * @brief A constructed, device-resident generation pipeline
 *
 * Implementations may throw from any member; callers convert exceptions
 * into structured errors.
 */
class Pipeline
{
public:
  virtual ~Pipeline();

  virtual Expected<void> load_adapter(const AdapterSpec& adapter) = 0;
  virtual Expected<void> delete_adapter(const std::string& name) = 0;

  virtual Expected<QImage> generate(const CallParameters& params, uint64_t seed) = 0;
};

class PipelineBackend
{
public:
  virtual ~PipelineBackend();

  virtual Expected<std::unique_ptr<Pipeline>> build(const PipelineDescription& desc) = 0;

  // Called after a pipeline was destroyed, before the next build.
  virtual void reclaim_device_memory(int device) noexcept = 0;
};

}
