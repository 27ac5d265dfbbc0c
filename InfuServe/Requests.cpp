#include "Requests.hpp"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>

#include <ctre.hpp>
#include <fmt/format.h>

namespace infu
{

static constexpr auto size_pattern = ctre::match<"\\s*(\\d+)\\s*[xX]\\s*(\\d+)\\s*">;

std::optional<Size> parse_size(std::string_view str)
{
  if (auto m = size_pattern(str))
  {
    if (m.get<1>().size() > 6 || m.get<2>().size() > 6)
      return std::nullopt;
    return Size{m.get<1>().to_number(10), m.get<2>().to_number(10)};
  }
  return std::nullopt;
}

static Expected<QImage>
load_image(const QJsonObject& obj, const QString& key, const QString& base_dir)
{
  const auto path = obj.value(key).toString();
  if (path.isEmpty())
    return QImage{};

  const auto full = QDir{base_dir}.filePath(path);
  QImage img{full};
  if (img.isNull())
    return fail(
        ErrorKind::ConfigRejected,
        fmt::format("cannot read {} '{}'", key.toStdString(), full.toStdString()));
  return img;
}

static Expected<uint64_t> read_seed(const QJsonValue& v)
{
  if (v.isUndefined() || v.isNull())
    return 0;

  if (v.isString())
  {
    bool ok{};
    const auto seed = v.toString().trimmed().toULongLong(&ok);
    if (!ok)
      return fail(
          ErrorKind::ConfigRejected,
          fmt::format("invalid seed '{}'", v.toString().toStdString()));
    return seed;
  }

  if (!v.isDouble() || v.toDouble() < 0)
    return fail(ErrorKind::ConfigRejected, "seed must be a non-negative integer");
  return static_cast<uint64_t>(v.toInteger());
}

Expected<GenerationRequest> request_from_json(
    const QJsonObject& obj, const RequestDefaults& defaults, const QString& base_dir)
{
  const auto addon_text = obj.value("addons").toString(defaults.addons).toStdString();
  auto addons = parse_addon_list(addon_text);
  if (!addons)
    return fail(ErrorKind::ConfigRejected, fmt::format("invalid add-on list '{}'", addon_text));

  auto config = PipelineConfig::create(
      obj.value("model_version").toString(defaults.model_version).toStdString(),
      obj.value("quantize_8bit").toBool(defaults.quantize_8bit),
      obj.value("cpu_offload").toBool(defaults.cpu_offload), *addons);
  if (!config)
    return std::unexpected(std::move(config.error()));

  GenerationRequest req{std::move(*config), {}};
  auto& p = req.params;

  auto id_image = load_image(obj, QStringLiteral("id_image"), base_dir);
  if (!id_image)
    return std::unexpected(std::move(id_image.error()));
  p.id_image = std::move(*id_image);

  auto control_image = load_image(obj, QStringLiteral("control_image"), base_dir);
  if (!control_image)
    return std::unexpected(std::move(control_image.error()));
  p.control_image = std::move(*control_image);

  auto seed = read_seed(obj.value("seed"));
  if (!seed)
    return std::unexpected(std::move(seed.error()));
  p.seed = *seed;

  p.prompt = obj.value("prompt").toString().toStdString();

  p.width = defaults.width;
  p.height = defaults.height;
  if (obj.contains("size"))
  {
    const auto text = obj.value("size").toString().toStdString();
    auto sz = parse_size(text);
    if (!sz)
      return fail(ErrorKind::ConfigRejected, fmt::format("invalid size '{}'", text));
    p.width = sz->width;
    p.height = sz->height;
  }
  p.width = obj.value("width").toInt(p.width);
  p.height = obj.value("height").toInt(p.height);

  p.guidance_scale = obj.value("guidance_scale").toDouble(defaults.guidance_scale);
  p.num_steps = obj.value("num_steps").toInt(defaults.num_steps);

  const auto& c = defaults.conditioning;
  p.conditioning.conditioning_scale
      = obj.value("conditioning_scale").toDouble(c.conditioning_scale);
  p.conditioning.guidance_start = obj.value("guidance_start").toDouble(c.guidance_start);
  p.conditioning.guidance_end = obj.value("guidance_end").toDouble(c.guidance_end);

  return req;
}

Expected<std::vector<QJsonObject>> load_batch(const QString& path)
{
  QFile f{path};
  if (!f.open(QIODevice::ReadOnly))
    return fail(
        ErrorKind::ConfigRejected,
        fmt::format(
            "cannot open batch '{}': {}", path.toStdString(), f.errorString().toStdString()));

  QJsonParseError err{};
  const auto doc = QJsonDocument::fromJson(f.readAll(), &err);
  if (err.error != QJsonParseError::NoError)
    return fail(
        ErrorKind::ConfigRejected,
        fmt::format(
            "batch '{}' at offset {}: {}", path.toStdString(), err.offset,
            err.errorString().toStdString()));
  if (!doc.isArray())
    return fail(
        ErrorKind::ConfigRejected,
        fmt::format("batch '{}' is not a JSON array", path.toStdString()));

  std::vector<QJsonObject> res;
  for (const auto& v : doc.array())
  {
    if (!v.isObject())
      return fail(
          ErrorKind::ConfigRejected,
          fmt::format("batch '{}' holds a non-object entry", path.toStdString()));
    res.push_back(v.toObject());
  }
  return res;
}

}
