#pragma once
#include "ModelStore.hpp"
#include "Pipeline.hpp"
#include "PipelineConfig.hpp"

namespace infu
{

struct AdapterChanges
{
  int attached{0};
  int detached{0};

  bool empty() const noexcept { return attached == 0 && detached == 0; }
};

/**
 * @brief Add-ons currently blended into one resident pipeline
 *
 * Only records what the pipeline confirmed: after a failed operation the set
 * still matches the pipeline state.
 */
class AdapterSet
{
public:
  const AddOnSet& attached() const noexcept { return m_attached; }
  bool contains(const std::string& id) const { return m_attached.find(id) != m_attached.end(); }

  // No-op when the add-on is already attached with the same weight.
  Expected<AdapterChanges> attach(Pipeline& pipeline, const AdapterSpec& adapter);
  Expected<AdapterChanges> detach(Pipeline& pipeline, const std::string& id);
  Expected<AdapterChanges> detach_all(Pipeline& pipeline);

  // Detaches what `wanted` does not list (or lists with another weight),
  // then attaches what is missing.
  Expected<AdapterChanges>
  apply(Pipeline& pipeline, const AddOnSet& wanted, const ModelStore& store);

private:
  AddOnSet m_attached;
};

}
