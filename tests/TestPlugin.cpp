// Pipeline plugin used by the DynamicBackend tests.
// Produces a flat red image and counts every call. The infu_test_* entry
// points let a test inject failures and read the counters back.
#include "infu_pipeline_api.h"

#include <cstdlib>
#include <cstring>
#include <map>
#include <string>

#define INFU_TEST_EXPORT extern "C" __attribute__((visibility("default")))

struct infu_pipeline_s
{
  int device{};
  std::map<std::string, float> adapters;
};

namespace
{
std::map<std::string, int> g_counters;
std::map<std::string, int> g_failures;
std::string g_last_error;

infu_status_t injected(const char* op)
{
  g_counters[op]++;
  auto it = g_failures.find(op);
  if (it == g_failures.end())
    return INFU_SUCCESS;
  g_last_error = std::string{op} + " rejected";
  return static_cast<infu_status_t>(it->second);
}

bool all_black(const infu_image_t& img)
{
  if (!img.data)
    return false;
  const int n = 3 * img.width * img.height;
  for (int i = 0; i < n; i++)
    if (img.data[i] != -1.f)
      return false;
  return n > 0;
}

float* red_image(int width, int height)
{
  const int plane = width * height;
  auto* chw = static_cast<float*>(std::malloc(sizeof(float) * 3 * plane));
  for (int i = 0; i < plane; i++)
  {
    chw[i] = 1.f;
    chw[plane + i] = -1.f;
    chw[2 * plane + i] = -1.f;
  }
  return chw;
}
}

INFU_TEST_EXPORT void infu_test_reset()
{
  g_counters.clear();
  g_failures.clear();
  g_last_error.clear();
}

// Makes the next calls of `op` return `status`. A negative status clears it.
INFU_TEST_EXPORT void infu_test_fail(const char* op, int status)
{
  if (status < 0)
    g_failures.erase(op);
  else
    g_failures[op] = status;
}

INFU_TEST_EXPORT int infu_test_counter(const char* name)
{
  auto it = g_counters.find(name);
  return it == g_counters.end() ? 0 : it->second;
}

INFU_TEST_EXPORT infu_status_t
infu_pipeline_create(const infu_pipeline_desc_t* desc, infu_pipeline_handle* out)
{
  const auto err = injected("create");
  g_counters["last_quantize"] = desc->quantize_8bit;
  g_counters["last_cpu_offload"] = desc->cpu_offload;
  g_counters["last_device"] = desc->device;

  // "create_partial" hands out a handle together with the error
  if (err != INFU_SUCCESS && !g_failures.contains("create_partial"))
    return err;

  auto* p = new infu_pipeline_s;
  p->device = desc->device;
  g_counters["live"]++;
  *out = p;
  return err;
}

INFU_TEST_EXPORT void infu_pipeline_destroy(infu_pipeline_handle pipeline)
{
  g_counters["destroy"]++;
  g_counters["live"]--;
  delete pipeline;
}

INFU_TEST_EXPORT infu_status_t infu_pipeline_load_lora(
    infu_pipeline_handle pipeline, const char* path, const char* name, float weight)
{
  const auto err = injected("load_lora");
  if (err != INFU_SUCCESS)
    return err;
  if (!path || std::strlen(path) == 0)
  {
    g_last_error = "empty path";
    return INFU_ERROR_INVALID_ARGUMENT;
  }
  pipeline->adapters[name] = weight;
  g_counters["adapters"] = static_cast<int>(pipeline->adapters.size());
  return INFU_SUCCESS;
}

INFU_TEST_EXPORT infu_status_t
infu_pipeline_delete_adapter(infu_pipeline_handle pipeline, const char* name)
{
  const auto err = injected("delete_adapter");
  if (err != INFU_SUCCESS)
    return err;
  if (pipeline->adapters.erase(name) == 0)
  {
    g_last_error = std::string{"no adapter "} + name;
    return INFU_ERROR_NOT_FOUND;
  }
  g_counters["adapters"] = static_cast<int>(pipeline->adapters.size());
  return INFU_SUCCESS;
}

INFU_TEST_EXPORT infu_status_t infu_pipeline_generate(
    infu_pipeline_handle, const infu_generate_params_t* params, float** out_chw,
    int* out_width, int* out_height)
{
  const auto err = injected("generate");
  g_counters["last_seed"] = static_cast<int>(params->seed);
  g_counters["last_control_black"] = all_black(params->control_image) ? 1 : 0;
  g_counters["last_generate_cpu_offload"] = params->cpu_offload;

  // "generate_partial" leaves a buffer behind together with the error
  if (err != INFU_SUCCESS && !g_failures.contains("generate_partial"))
    return err;

  *out_chw = red_image(params->width, params->height);
  *out_width = params->width;
  *out_height = params->height;
  return err;
}

INFU_TEST_EXPORT void infu_image_free(float* chw)
{
  g_counters["image_free"]++;
  std::free(chw);
}

INFU_TEST_EXPORT void infu_device_empty_cache(int device)
{
  g_counters["empty_cache"]++;
  g_counters["last_empty_cache_device"] = device;
}

INFU_TEST_EXPORT const char* infu_last_error(void)
{
  return g_last_error.c_str();
}
