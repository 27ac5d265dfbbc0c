#pragma once
#include "CallParameters.hpp"

#include <QString>

namespace infu
{

// Values used when a request leaves a field out.
struct RequestDefaults
{
  QString model_version{QStringLiteral("aes_stage2")};
  bool quantize_8bit{true};
  bool cpu_offload{true};
  QString addons;
  int width{864};
  int height{1152};
  float guidance_scale{3.5f};
  int num_steps{30};
  ConditioningSchedule conditioning;
};

/**
 * @brief Service configuration
 *
 * INI layout:
 *
 * [paths]
 * models=./models
 * results=./results
 * backend=libinfu_flux_pipeline.so
 * [device]
 * index=0
 * [output]
 * format=png
 * [defaults]
 * model_version=aes_stage2
 * quantize_8bit=true
 * ...
 */
struct Settings
{
  QString models_root{QStringLiteral("./models")};
  QString results_dir{QStringLiteral("./results")};
  QString backend_library{QStringLiteral("libinfu_flux_pipeline.so")};
  int device{0};
  QString image_format{QStringLiteral("png")};
  RequestDefaults defaults;

  // Keys absent from the file keep their current value.
  void load(const QString& ini_path);
};

}
