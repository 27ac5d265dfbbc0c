#pragma once
#include "Pipeline.hpp"
#include "infu_pipeline_api.h"

#include <memory>
#include <string>

namespace infu
{

/**
 * @brief Pipeline plugin opened at runtime with dlopen
 */
class PipelineLibrary
{
public:
  explicit PipelineLibrary(const std::string& path);
  ~PipelineLibrary();
  PipelineLibrary(const PipelineLibrary&) = delete;
  PipelineLibrary& operator=(const PipelineLibrary&) = delete;

  bool available{false};
  std::string load_error;

  infu_pipeline_create_fn pipeline_create{};
  infu_pipeline_destroy_fn pipeline_destroy{};
  infu_pipeline_load_lora_fn pipeline_load_lora{};
  infu_pipeline_delete_adapter_fn pipeline_delete_adapter{};
  infu_pipeline_generate_fn pipeline_generate{};
  infu_image_free_fn image_free{};
  infu_device_empty_cache_fn device_empty_cache{};
  infu_last_error_fn last_error{};

  std::string error_string(infu_status_t status) const;

private:
  void* m_handle{};
};

class PluginPipeline final : public Pipeline
{
public:
  PluginPipeline(const PipelineLibrary& lib, infu_pipeline_handle handle, bool cpu_offload);
  ~PluginPipeline() override;
  PluginPipeline(const PluginPipeline&) = delete;
  PluginPipeline& operator=(const PluginPipeline&) = delete;

  infu_pipeline_handle get() const noexcept { return m_handle; }

  Expected<void> load_adapter(const AdapterSpec& adapter) override;
  Expected<void> delete_adapter(const std::string& name) override;
  Expected<QImage> generate(const CallParameters& params, uint64_t seed) override;

private:
  const PipelineLibrary& m_lib;
  infu_pipeline_handle m_handle{nullptr};
  bool m_cpu_offload{};
};

class DynamicBackend final : public PipelineBackend
{
public:
  explicit DynamicBackend(const std::string& library_path);

  bool available() const noexcept { return m_lib->available; }
  const std::string& load_error() const noexcept { return m_lib->load_error; }

  Expected<std::unique_ptr<Pipeline>> build(const PipelineDescription& desc) override;
  void reclaim_device_memory(int device) noexcept override;

private:
  std::unique_ptr<PipelineLibrary> m_lib;
};

}
