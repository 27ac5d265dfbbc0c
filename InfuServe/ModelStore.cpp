#include "ModelStore.hpp"

#include <QDir>
#include <QFileInfo>

#include <fmt/format.h>

namespace infu
{

static Expected<void> require_dir(const QString& path, std::string_view what)
{
  if (!QFileInfo{path}.isDir())
    return fail(
        ErrorKind::ResourceUnavailable,
        fmt::format("{} not found at '{}'", what, path.toStdString()));
  return {};
}

ModelStore::ModelStore(QString root)
    : m_root{std::move(root)}
{
}

QString ModelStore::base_model_path() const
{
  return QDir{m_root}.filePath("FLUX.1-dev");
}

QString ModelStore::infu_model_path(Variant v) const
{
  return QDir{m_root}.filePath(
      QStringLiteral("InfiniteYou/infu_flux_v1.0/%1")
          .arg(QString::fromUtf8(to_string(v).data(), to_string(v).size())));
}

QString ModelStore::insightface_root_path() const
{
  return QDir{m_root}.filePath("InfiniteYou/supports/insightface");
}

QString ModelStore::adapter_path(const AddOnInfo& addon) const
{
  return QDir{m_root}.filePath(
      QStringLiteral("InfiniteYou/supports/optional_loras/%1")
          .arg(QString::fromUtf8(addon.file_name.data(), addon.file_name.size())));
}

Expected<PipelineDescription>
ModelStore::describe(const PipelineConfig& config, int device) const
{
  PipelineDescription desc;
  desc.variant = config.variant();
  desc.quantize_8bit = config.quantized();
  desc.cpu_offload = config.cpu_offload();
  desc.device = device;
  desc.base_model_path = base_model_path();
  desc.infu_model_path = infu_model_path(config.variant());
  desc.insightface_root_path = insightface_root_path();

  if (auto ok = require_dir(desc.base_model_path, "base model"); !ok)
    return std::unexpected(std::move(ok.error()));
  if (auto ok = require_dir(desc.infu_model_path, "identity network"); !ok)
    return std::unexpected(std::move(ok.error()));
  if (auto ok = require_dir(desc.insightface_root_path, "face analysis models"); !ok)
    return std::unexpected(std::move(ok.error()));

  return desc;
}

Expected<AdapterSpec> ModelStore::adapter(const std::string& id, float weight) const
{
  const auto* addon = find_addon(id);
  if (!addon)
    return fail(ErrorKind::ConfigRejected, fmt::format("unknown add-on '{}'", id));

  AdapterSpec spec{id, adapter_path(*addon), weight};
  if (!QFileInfo{spec.path}.isFile())
    return fail(
        ErrorKind::ResourceUnavailable,
        fmt::format("add-on '{}' weights not found at '{}'", id, spec.path.toStdString()));
  return spec;
}

}
