#include "InferenceInvoker.hpp"

#include <QDebug>

#include <fmt/format.h>

#include <exception>

namespace infu
{

SeedSource::SeedSource()
    : m_engine{std::random_device{}()}
{
}

SeedSource::SeedSource(uint64_t state)
    : m_engine{state}
{
}

uint64_t SeedSource::draw()
{
  std::lock_guard lock{m_mutex};
  uint64_t seed{};
  do
  {
    seed = m_engine() & 0xFFFFFFFF;
  } while (seed == 0);
  return seed;
}

InferenceInvoker::InferenceInvoker(SeedSource& seeds)
    : m_seeds{seeds}
{
}

uint64_t InferenceInvoker::resolve_seed(uint64_t requested)
{
  return requested != 0 ? requested : m_seeds.draw();
}

Invocation InferenceInvoker::run(ResidentPipeline& pipeline, const CallParameters& params)
{
  const uint64_t seed = resolve_seed(params.seed);

  if (!pipeline.pipeline)
    return {fail(ErrorKind::InferenceFailed, "no pipeline is resident"), seed};

  try
  {
    auto image = pipeline.pipeline->generate(params, seed);
    if (!image)
    {
      qWarning() << "InferenceInvoker: generation failed with seed" << seed << ":"
                 << image.error().message.c_str();
      return {fail(ErrorKind::InferenceFailed, std::move(image.error().message)), seed};
    }
    if (image->isNull())
      return {fail(ErrorKind::InferenceFailed, "pipeline produced an empty image"), seed};

    return {std::move(*image), seed};
  }
  catch (const std::exception& e)
  {
    qWarning() << "InferenceInvoker: generation threw with seed" << seed << ":" << e.what();
    return {
        fail(ErrorKind::InferenceFailed, fmt::format("generation failed: {}", e.what())),
        seed};
  }
  catch (...)
  {
    qWarning() << "InferenceInvoker: generation threw a non-standard exception with seed"
               << seed;
    return {fail(ErrorKind::InferenceFailed, "generation failed: unknown exception"), seed};
  }
}

}
