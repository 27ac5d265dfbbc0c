#include "DynamicBackend.hpp"
#include "GenerationService.hpp"
#include "Requests.hpp"
#include "Settings.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QHash>
#include <QJsonObject>

#include <fmt/format.h>

#include <future>
#include <optional>
#include <vector>

namespace
{
struct Option
{
  const char* name;
  const char* description;
  const char* value_name;
};

// Command line options that map one-to-one onto request keys
constexpr Option request_options[] = {
    {"prompt", "Text prompt.", "text"},
    {"id-image", "Identity image containing a face.", "path"},
    {"control-image", "Optional control image (facial keypoints).", "path"},
    {"seed", "Seed, 0 for random.", "n"},
    {"size", "Output size, e.g. 864x1152.", "WxH"},
    {"guidance", "Guidance scale.", "f"},
    {"steps", "Number of steps.", "n"},
    {"conditioning-scale", "InfuseNet conditioning scale.", "f"},
    {"guidance-start", "InfuseNet guidance start.", "f"},
    {"guidance-end", "InfuseNet guidance end.", "f"},
    {"variant", "Model version: sim_stage1 or aes_stage2.", "name"},
    {"addons", "Add-ons, e.g. \"(realism: 1.0), (anti_blur: 0.5)\".", "list"},
};

QString json_key(const char* option)
{
  static const QHash<QString, QString> keys{
      {"id-image", "id_image"},
      {"control-image", "control_image"},
      {"guidance", "guidance_scale"},
      {"steps", "num_steps"},
      {"conditioning-scale", "conditioning_scale"},
      {"guidance-start", "guidance_start"},
      {"guidance-end", "guidance_end"},
      {"variant", "model_version"},
  };
  const QString name = QString::fromLatin1(option);
  return keys.value(name, name);
}

QJsonObject request_from_options(const QCommandLineParser& parser)
{
  QJsonObject obj;
  for (const auto& opt : request_options)
  {
    const QString name = QString::fromLatin1(opt.name);
    if (!parser.isSet(name))
      continue;

    const auto value = parser.value(name);
    const auto key = json_key(opt.name);
    if (key == "num_steps")
      obj.insert(key, value.toInt());
    else if (
        key == "guidance_scale" || key == "conditioning_scale" || key == "guidance_start"
        || key == "guidance_end")
      obj.insert(key, value.toDouble());
    else
      obj.insert(key, value);
  }
  if (parser.isSet("no-quantize"))
    obj.insert("quantize_8bit", false);
  if (parser.isSet("no-cpu-offload"))
    obj.insert("cpu_offload", false);
  return obj;
}
}

int main(int argc, char** argv)
{
  QCoreApplication app{argc, argv};
  QCoreApplication::setApplicationName("infu-generate");

  QCommandLineParser parser;
  parser.setApplicationDescription(
      "Identity-preserving image generation on a single accelerator.");
  const auto help = parser.addHelpOption();
  parser.addOptions({
      {"config", "INI configuration file.", "path"},
      {"models", "Root of the downloaded model archives.", "dir"},
      {"results", "Directory generated images are saved to.", "dir"},
      {"device", "Accelerator device index.", "n"},
      {"backend", "Pipeline plugin library.", "path"},
      {"batch", "JSON array of requests, submitted concurrently.", "path"},
      {"no-quantize", "Disable 8-bit quantization."},
      {"no-cpu-offload", "Disable CPU offloading."},
  });
  for (const auto& opt : request_options)
    parser.addOption({QString::fromLatin1(opt.name), opt.description, opt.value_name});

  if (!parser.parse(QCoreApplication::arguments()))
  {
    fmt::print(stderr, "{}\n", parser.errorText().toStdString());
    return 2;
  }
  if (parser.isSet(help))
    parser.showHelp(0);

  infu::Settings settings;
  if (parser.isSet("config"))
  {
    const auto path = parser.value("config");
    if (!QFileInfo::exists(path))
    {
      fmt::print(stderr, "configuration file '{}' not found\n", path.toStdString());
      return 2;
    }
    settings.load(path);
  }
  if (parser.isSet("models"))
    settings.models_root = parser.value("models");
  if (parser.isSet("results"))
    settings.results_dir = parser.value("results");
  if (parser.isSet("backend"))
    settings.backend_library = parser.value("backend");
  if (parser.isSet("device"))
  {
    bool ok{};
    settings.device = parser.value("device").toInt(&ok);
    if (!ok || settings.device < 0)
    {
      fmt::print(stderr, "invalid device '{}'\n", parser.value("device").toStdString());
      return 2;
    }
  }

  std::vector<QJsonObject> raw_requests;
  QString base_dir = QDir::currentPath();
  if (parser.isSet("batch"))
  {
    auto batch = infu::load_batch(parser.value("batch"));
    if (!batch)
    {
      fmt::print(stderr, "{}\n", batch.error().describe());
      return 2;
    }
    raw_requests = std::move(*batch);
    base_dir = QFileInfo{parser.value("batch")}.absolutePath();

    // Command line values act as defaults for the whole batch
    const auto overrides = request_from_options(parser);
    for (auto& obj : raw_requests)
      for (auto it = overrides.begin(); it != overrides.end(); ++it)
        if (!obj.contains(it.key()))
          obj.insert(it.key(), it.value());
  }
  else
  {
    if (!parser.isSet("id-image"))
    {
      fmt::print(stderr, "--id-image or --batch is required\n");
      parser.showHelp(2);
    }
    raw_requests.push_back(request_from_options(parser));
  }

  infu::DynamicBackend backend{settings.backend_library.toStdString()};
  infu::GenerationService service{
      backend,
      infu::ServiceOptions{
          settings.models_root, settings.results_dir, settings.device,
          settings.image_format}};
  service.init();

  // Requests that fail validation are reported in place, in input order
  std::vector<std::future<infu::GenerationResult>> futures;
  std::vector<std::optional<infu::Error>> rejected;
  for (const auto& obj : raw_requests)
  {
    auto req = infu::request_from_json(obj, settings.defaults, base_dir);
    if (!req)
    {
      rejected.push_back(std::move(req.error()));
      futures.emplace_back();
      continue;
    }
    rejected.emplace_back();
    futures.push_back(service.submit(std::move(*req)));
  }

  int failures = 0;
  for (std::size_t i = 0; i < futures.size(); i++)
  {
    if (rejected[i])
    {
      failures++;
      fmt::print("[{}] error: {}\n", i, rejected[i]->describe());
      continue;
    }

    auto res = futures[i].get();
    if (res.outcome)
    {
      fmt::print(
          "[{}] saved {} (seed {})\n", i, res.outcome->path.toStdString(), res.seed_used);
    }
    else
    {
      failures++;
      fmt::print("[{}] error: {} (seed {})\n", i, res.outcome.error().describe(), res.seed_used);
    }
  }

  const auto stats = service.statistics();
  qInfo() << "infu-generate:" << stats.reconstructions << "reconstructions,"
          << stats.adapter_swaps << "add-on swaps," << stats.hits << "cache hits";

  service.shutdown();
  return failures == 0 ? 0 : 1;
}
