#pragma once
#include "CallParameters.hpp"
#include "ResidencyCache.hpp"

#include <QImage>

#include <cstdint>
#include <mutex>
#include <random>

namespace infu
{

// Process-wide source for seeds that callers left at 0.
class SeedSource
{
public:
  SeedSource();
  explicit SeedSource(uint64_t state);

  // Never returns 0, and fits in 32 bits.
  uint64_t draw();

private:
  std::mutex m_mutex;
  std::mt19937_64 m_engine;
};

struct Invocation
{
  Expected<QImage> artifact;
  uint64_t seed_used{0};
};

class InferenceInvoker
{
public:
  explicit InferenceInvoker(SeedSource& seeds);

  uint64_t resolve_seed(uint64_t requested);

  // Runs one generation. Never mutates the pipeline's residency: a failure
  // is attributed to this call's parameters.
  Invocation run(ResidentPipeline& pipeline, const CallParameters& params);

private:
  SeedSource& m_seeds;
};

}
