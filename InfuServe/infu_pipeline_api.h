/*
 * C interface exported by pipeline plugins loaded by infu::DynamicBackend.
 *
 * Images are planar RGB floats in [-1, 1], channel-major (CHW).
 * All functions returning infu_status_t report details via infu_last_error().
 */
#ifndef INFU_PIPELINE_API_H
#define INFU_PIPELINE_API_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct infu_pipeline_s* infu_pipeline_handle;

typedef enum
{
  INFU_SUCCESS = 0,
  INFU_ERROR_NOT_FOUND = 1,
  INFU_ERROR_INVALID_ARGUMENT = 2,
  INFU_ERROR_OUT_OF_MEMORY = 3,
  INFU_ERROR_DEVICE = 4,
  INFU_ERROR_INTERNAL = 5,
} infu_status_t;

typedef struct
{
  const char* base_model_path;
  const char* infu_model_path;
  const char* insightface_root_path;
  int image_proj_num_tokens;
  const char* infu_flux_version;
  const char* model_version;
  int quantize_8bit;
  int cpu_offload;
  int device;
} infu_pipeline_desc_t;

typedef struct
{
  const float* data;
  int width;
  int height;
} infu_image_t;

typedef struct
{
  infu_image_t id_image;
  infu_image_t control_image;
  const char* prompt;
  uint64_t seed;
  int width;
  int height;
  float guidance_scale;
  int num_steps;
  float infusenet_conditioning_scale;
  float infusenet_guidance_start;
  float infusenet_guidance_end;
  int cpu_offload;
} infu_generate_params_t;

typedef infu_status_t (*infu_pipeline_create_fn)(
    const infu_pipeline_desc_t* desc, infu_pipeline_handle* out);
typedef void (*infu_pipeline_destroy_fn)(infu_pipeline_handle pipeline);
typedef infu_status_t (*infu_pipeline_load_lora_fn)(
    infu_pipeline_handle pipeline, const char* path, const char* name, float weight);
typedef infu_status_t (*infu_pipeline_delete_adapter_fn)(
    infu_pipeline_handle pipeline, const char* name);
typedef infu_status_t (*infu_pipeline_generate_fn)(
    infu_pipeline_handle pipeline, const infu_generate_params_t* params, float** out_chw,
    int* out_width, int* out_height);
typedef void (*infu_image_free_fn)(float* chw);
typedef void (*infu_device_empty_cache_fn)(int device);
typedef const char* (*infu_last_error_fn)(void);

#ifdef __cplusplus
}
#endif

#endif
