#include "Pipeline.hpp"

namespace infu
{
Pipeline::~Pipeline() = default;
PipelineBackend::~PipelineBackend() = default;
}
