#include "GenerationService.hpp"

#include <QDebug>

#include <fmt/format.h>

#include <exception>
#include <memory>
#include <optional>

namespace infu
{

namespace
{
struct PendingGeneration
{
  GenerationRequest request;
  std::promise<GenerationResult> promise;
  ResidentPipeline* pipeline{};
  std::optional<Error> prepare_error;
};
}

GenerationService::GenerationService(PipelineBackend& backend, ServiceOptions options)
    : m_options{std::move(options)}
    , m_cache{backend, ModelStore{m_options.models_root}, m_options.device}
    , m_invoker{m_seeds}
    , m_persister{m_options.results_dir, m_options.image_format}
    , m_scheduler{m_options.device}
{
}

GenerationService::~GenerationService()
{
  shutdown();
}

void GenerationService::init()
{
  qInfo() << "GenerationService: models in" << m_options.models_root << ", results in"
          << m_options.results_dir << ", device" << m_options.device;
  m_scheduler.start();
}

void GenerationService::shutdown()
{
  if (m_scheduler.running())
  {
    // Queued requests still complete before the pipeline goes away
    m_scheduler.submit(WorkItem{
        WorkKind::Maintenance, "release", [this] { m_cache.release(); }});
  }
  m_scheduler.stop();
  m_cache.release();
}

std::future<GenerationResult> GenerationService::submit(GenerationRequest request)
{
  auto state = std::make_shared<PendingGeneration>();
  state->request = std::move(request);
  auto future = state->promise.get_future();

  const auto& params = state->request.params;
  if (auto ok = validate(params); !ok)
  {
    qDebug() << "GenerationService: rejected request:" << ok.error().message.c_str();
    state->promise.set_value({std::unexpected(std::move(ok.error())), params.seed});
    return future;
  }

  const auto label = state->request.config.to_string();

  std::vector<WorkItem> items;
  items.push_back(WorkItem{WorkKind::Reconstruction, label, [this, state] {
                             try
                             {
                               auto res = m_cache.prepare(state->request.config);
                               if (res)
                                 state->pipeline = *res;
                               else
                                 state->prepare_error = std::move(res.error());
                             }
                             catch (const std::exception& e)
                             {
                               state->prepare_error = Error{
                                   ErrorKind::ConstructionFailed,
                                   fmt::format("preparing pipeline failed: {}", e.what())};
                             }
                             catch (...)
                             {
                               state->prepare_error = Error{
                                   ErrorKind::ConstructionFailed,
                                   "preparing pipeline failed: unknown exception"};
                             }
                           }});

  items.push_back(WorkItem{WorkKind::Inference, label, [this, state] {
                             const auto& params = state->request.params;
                             if (state->prepare_error)
                             {
                               state->promise.set_value(
                                   {std::unexpected(std::move(*state->prepare_error)),
                                    params.seed});
                               return;
                             }
                             if (!state->pipeline)
                             {
                               state->promise.set_value(
                                   {fail(
                                        ErrorKind::ConstructionFailed,
                                        "pipeline was not prepared"),
                                    params.seed});
                               return;
                             }

                             auto inv = m_invoker.run(*state->pipeline, params);
                             if (!inv.artifact)
                             {
                               state->promise.set_value(
                                   {std::unexpected(std::move(inv.artifact.error())),
                                    inv.seed_used});
                               return;
                             }

                             auto path = m_persister.save(
                                 *inv.artifact, params.prompt, inv.seed_used);
                             if (!path)
                             {
                               state->promise.set_value(
                                   {std::unexpected(std::move(path.error())),
                                    inv.seed_used});
                               return;
                             }

                             state->promise.set_value(
                                 {Generation{std::move(*inv.artifact), std::move(*path)},
                                  inv.seed_used});
                           }});

  const auto position = m_scheduler.submit(std::move(items));
  if (position > 0)
    qDebug() << "GenerationService: request queued behind" << position << "items";
  return future;
}

GenerationResult GenerationService::generate(GenerationRequest request)
{
  return submit(std::move(request)).get();
}

CacheStatistics GenerationService::statistics()
{
  if (!m_scheduler.running())
    return m_cache.statistics();

  return m_scheduler
      .run(WorkKind::Maintenance, "statistics", [this] { return m_cache.statistics(); })
      .get();
}

}
