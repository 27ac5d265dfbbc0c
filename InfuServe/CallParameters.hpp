#pragma once
#include "Error.hpp"

#include <QImage>

#include <cstdint>
#include <string>

namespace infu
{

struct ConditioningSchedule
{
  float conditioning_scale{1.0f};
  float guidance_start{0.0f};
  float guidance_end{1.0f};
};

/**
 * @brief Per-request generation inputs
 *
 * A seed of 0 asks for a fresh random seed, drawn when the request reaches
 * the accelerator.
 */
struct CallParameters
{
  QImage id_image;
  QImage control_image;
  std::string prompt;
  uint64_t seed{0};
  int width{864};
  int height{1152};
  float guidance_scale{3.5f};
  int num_steps{30};
  ConditioningSchedule conditioning;
};

Expected<void> validate(const CallParameters& params);

}
