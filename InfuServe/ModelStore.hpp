#pragma once
#include "Pipeline.hpp"

#include <QString>

namespace infu
{

/**
 * @brief Resolves already-downloaded model archives under a models root
 *
 * <root>/FLUX.1-dev
 * <root>/InfiniteYou/infu_flux_v1.0/<variant>
 * <root>/InfiniteYou/supports/insightface
 * <root>/InfiniteYou/supports/optional_loras/<add-on file>
 *
 * Fetching the archives is not done here; a missing path is reported as
 * ResourceUnavailable.
 */
class ModelStore
{
public:
  explicit ModelStore(QString root);

  const QString& root() const noexcept { return m_root; }

  Expected<PipelineDescription> describe(const PipelineConfig& config, int device) const;
  Expected<AdapterSpec> adapter(const std::string& id, float weight) const;

  QString base_model_path() const;
  QString infu_model_path(Variant v) const;
  QString insightface_root_path() const;
  QString adapter_path(const AddOnInfo& addon) const;

private:
  QString m_root;
};

}
