#include "CallParameters.hpp"

#include <fmt/format.h>

#include <cmath>

namespace infu
{

static bool unit_range(float v) noexcept
{
  return std::isfinite(v) && v >= 0.f && v <= 1.f;
}

Expected<void> validate(const CallParameters& params)
{
  if (params.id_image.isNull())
    return fail(ErrorKind::ConfigRejected, "an identity image is required");
  if (params.width <= 0 || params.height <= 0)
    return fail(
        ErrorKind::ConfigRejected,
        fmt::format("invalid output size {}x{}", params.width, params.height));
  if (params.num_steps <= 0)
    return fail(
        ErrorKind::ConfigRejected,
        fmt::format("invalid number of steps {}", params.num_steps));
  if (!std::isfinite(params.guidance_scale))
    return fail(ErrorKind::ConfigRejected, "guidance scale must be finite");

  const auto& c = params.conditioning;
  if (!unit_range(c.conditioning_scale))
    return fail(
        ErrorKind::ConfigRejected,
        fmt::format("conditioning scale {} outside [0, 1]", c.conditioning_scale));
  if (!unit_range(c.guidance_start) || !unit_range(c.guidance_end))
    return fail(
        ErrorKind::ConfigRejected,
        fmt::format(
            "conditioning guidance [{}, {}] outside [0, 1]", c.guidance_start,
            c.guidance_end));
  if (c.guidance_start > c.guidance_end)
    return fail(
        ErrorKind::ConfigRejected,
        fmt::format(
            "conditioning guidance starts after it ends ({} > {})", c.guidance_start,
            c.guidance_end));
  return {};
}

}
