#pragma once
#include "AccessScheduler.hpp"
#include "CallParameters.hpp"
#include "InferenceInvoker.hpp"
#include "ModelStore.hpp"
#include "OutputPersister.hpp"
#include "PipelineConfig.hpp"
#include "ResidencyCache.hpp"

#include <QImage>
#include <QString>

#include <future>

namespace infu
{

struct GenerationRequest
{
  PipelineConfig config;
  CallParameters params;
};

struct Generation
{
  QImage image;
  QString path;
};

struct GenerationResult
{
  Expected<Generation> outcome;
  uint64_t seed_used{0};
};

struct ServiceOptions
{
  QString models_root;
  QString results_dir;
  int device{0};
  QString image_format{QStringLiteral("png")};
};

/**
 * @brief Request surface of the service
 *
 * Owns the residency cache and the lane it is accessed from. init() and
 * shutdown() bracket the lifetime of the resident pipeline.
 *
 * Validation runs on the calling thread; each accepted request then queues
 * a reconstruction item followed by an inference item, back to back.
 */
class GenerationService
{
public:
  GenerationService(PipelineBackend& backend, ServiceOptions options);
  ~GenerationService();
  GenerationService(const GenerationService&) = delete;
  GenerationService& operator=(const GenerationService&) = delete;

  void init();
  void shutdown();
  bool running() const { return m_scheduler.running(); }

  std::future<GenerationResult> submit(GenerationRequest request);
  GenerationResult generate(GenerationRequest request);

  CacheStatistics statistics();
  std::size_t pending() const { return m_scheduler.pending(); }

private:
  ServiceOptions m_options;
  SeedSource m_seeds;
  ResidencyCache m_cache;
  InferenceInvoker m_invoker;
  OutputPersister m_persister;
  AccessScheduler m_scheduler;
};

}
