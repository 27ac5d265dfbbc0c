#include "DynamicBackend.hpp"

#include "ImageTensor.hpp"

#include <QDebug>

#include <fmt/format.h>

#include <dlfcn.h>

namespace infu
{

template <typename F>
static bool load_symbol(void* handle, const char* name, F& fn, std::string& err)
{
  fn = reinterpret_cast<F>(dlsym(handle, name));
  if (!fn)
    err = fmt::format("missing symbol {}", name);
  return fn != nullptr;
}

PipelineLibrary::PipelineLibrary(const std::string& path)
{
  m_handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (!m_handle)
  {
    const char* err = dlerror();
    load_error = fmt::format("cannot open '{}': {}", path, err ? err : "unknown error");
    return;
  }

  available = load_symbol(m_handle, "infu_pipeline_create", pipeline_create, load_error)
              && load_symbol(m_handle, "infu_pipeline_destroy", pipeline_destroy, load_error)
              && load_symbol(
                  m_handle, "infu_pipeline_load_lora", pipeline_load_lora, load_error)
              && load_symbol(
                  m_handle, "infu_pipeline_delete_adapter", pipeline_delete_adapter,
                  load_error)
              && load_symbol(m_handle, "infu_pipeline_generate", pipeline_generate, load_error)
              && load_symbol(m_handle, "infu_image_free", image_free, load_error)
              && load_symbol(
                  m_handle, "infu_device_empty_cache", device_empty_cache, load_error)
              && load_symbol(m_handle, "infu_last_error", last_error, load_error);
}

PipelineLibrary::~PipelineLibrary()
{
  if (m_handle)
    dlclose(m_handle);
}

std::string PipelineLibrary::error_string(infu_status_t status) const
{
  const char* detail = last_error ? last_error() : nullptr;
  return fmt::format(
      "status {}{}{}", static_cast<int>(status), detail ? ": " : "", detail ? detail : "");
}

PluginPipeline::PluginPipeline(
    const PipelineLibrary& lib, infu_pipeline_handle handle, bool cpu_offload)
    : m_lib{lib}
    , m_handle{handle}
    , m_cpu_offload{cpu_offload}
{
}

PluginPipeline::~PluginPipeline()
{
  if (m_handle)
  {
    m_lib.pipeline_destroy(m_handle);
    m_handle = nullptr;
  }
}

Expected<void> PluginPipeline::load_adapter(const AdapterSpec& adapter)
{
  const auto path = adapter.path.toStdString();
  auto err = m_lib.pipeline_load_lora(
      m_handle, path.c_str(), adapter.name.c_str(), adapter.weight);
  if (err == INFU_SUCCESS)
    return {};

  return fail(
      err == INFU_ERROR_NOT_FOUND ? ErrorKind::ResourceUnavailable
                                  : ErrorKind::ConstructionFailed,
      fmt::format("loading add-on '{}': {}", adapter.name, m_lib.error_string(err)));
}

Expected<void> PluginPipeline::delete_adapter(const std::string& name)
{
  auto err = m_lib.pipeline_delete_adapter(m_handle, name.c_str());
  if (err == INFU_SUCCESS)
    return {};

  return fail(
      ErrorKind::ConstructionFailed,
      fmt::format("removing add-on '{}': {}", name, m_lib.error_string(err)));
}

Expected<QImage> PluginPipeline::generate(const CallParameters& params, uint64_t seed)
{
  const auto id_tensor = to_tensor(params.id_image);
  // No control image means a black one: no control
  const auto control_tensor = params.control_image.isNull()
                                  ? black_tensor(id_tensor.width, id_tensor.height)
                                  : to_tensor(params.control_image);

  infu_generate_params_t p{};
  p.id_image = {id_tensor.data.data(), id_tensor.width, id_tensor.height};
  p.control_image = {control_tensor.data.data(), control_tensor.width, control_tensor.height};
  p.prompt = params.prompt.c_str();
  p.seed = seed;
  p.width = params.width;
  p.height = params.height;
  p.guidance_scale = params.guidance_scale;
  p.num_steps = params.num_steps;
  p.infusenet_conditioning_scale = params.conditioning.conditioning_scale;
  p.infusenet_guidance_start = params.conditioning.guidance_start;
  p.infusenet_guidance_end = params.conditioning.guidance_end;
  p.cpu_offload = m_cpu_offload ? 1 : 0;

  float* out{};
  int out_w{};
  int out_h{};
  auto err = m_lib.pipeline_generate(m_handle, &p, &out, &out_w, &out_h);
  if (err != INFU_SUCCESS)
  {
    if (out)
      m_lib.image_free(out);
    return fail(ErrorKind::InferenceFailed, m_lib.error_string(err));
  }

  QImage image = to_image(out, out_w, out_h);
  m_lib.image_free(out);
  if (image.isNull())
    return fail(
        ErrorKind::InferenceFailed,
        fmt::format("plugin returned an invalid {}x{} image", out_w, out_h));
  return image;
}

DynamicBackend::DynamicBackend(const std::string& library_path)
    : m_lib{std::make_unique<PipelineLibrary>(library_path)}
{
  if (!m_lib->available)
    qWarning() << "DynamicBackend:" << m_lib->load_error.c_str();
}

Expected<std::unique_ptr<Pipeline>> DynamicBackend::build(const PipelineDescription& desc)
{
  if (!m_lib->available)
    return fail(ErrorKind::ConstructionFailed, m_lib->load_error);

  const auto base = desc.base_model_path.toStdString();
  const auto infu = desc.infu_model_path.toStdString();
  const auto insightface = desc.insightface_root_path.toStdString();
  const auto version = std::string{to_string(desc.variant)};

  infu_pipeline_desc_t d{};
  d.base_model_path = base.c_str();
  d.infu_model_path = infu.c_str();
  d.insightface_root_path = insightface.c_str();
  d.image_proj_num_tokens = desc.image_proj_num_tokens;
  d.infu_flux_version = desc.infu_flux_version.c_str();
  d.model_version = version.c_str();
  d.quantize_8bit = desc.quantize_8bit ? 1 : 0;
  d.cpu_offload = desc.cpu_offload ? 1 : 0;
  d.device = desc.device;

  infu_pipeline_handle handle{};
  auto err = m_lib->pipeline_create(&d, &handle);
  if (err != INFU_SUCCESS || !handle)
  {
    if (handle)
      m_lib->pipeline_destroy(handle);
    return fail(
        err == INFU_ERROR_NOT_FOUND ? ErrorKind::ResourceUnavailable
                                    : ErrorKind::ConstructionFailed,
        fmt::format("creating {} pipeline: {}", version, m_lib->error_string(err)));
  }

  return std::make_unique<PluginPipeline>(*m_lib, handle, desc.cpu_offload);
}

void DynamicBackend::reclaim_device_memory(int device) noexcept
{
  if (m_lib->available)
    m_lib->device_empty_cache(device);
}

}
