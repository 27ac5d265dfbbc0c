#include "Settings.hpp"

#include <QDebug>
#include <QSettings>

namespace infu
{

void Settings::load(const QString& ini_path)
{
  QSettings ini{ini_path, QSettings::IniFormat};
  if (ini.status() != QSettings::NoError)
  {
    qWarning() << "Settings: cannot read" << ini_path;
    return;
  }

  ini.beginGroup(QStringLiteral("paths"));
  models_root = ini.value(QStringLiteral("models"), models_root).toString();
  results_dir = ini.value(QStringLiteral("results"), results_dir).toString();
  backend_library = ini.value(QStringLiteral("backend"), backend_library).toString();
  ini.endGroup();

  ini.beginGroup(QStringLiteral("device"));
  device = ini.value(QStringLiteral("index"), device).toInt();
  ini.endGroup();

  ini.beginGroup(QStringLiteral("output"));
  image_format = ini.value(QStringLiteral("format"), image_format).toString();
  ini.endGroup();

  auto& d = defaults;
  ini.beginGroup(QStringLiteral("defaults"));
  d.model_version = ini.value(QStringLiteral("model_version"), d.model_version).toString();
  d.quantize_8bit = ini.value(QStringLiteral("quantize_8bit"), d.quantize_8bit).toBool();
  d.cpu_offload = ini.value(QStringLiteral("cpu_offload"), d.cpu_offload).toBool();
  d.addons = ini.value(QStringLiteral("addons"), d.addons).toString();
  d.width = ini.value(QStringLiteral("width"), d.width).toInt();
  d.height = ini.value(QStringLiteral("height"), d.height).toInt();
  d.guidance_scale = ini.value(QStringLiteral("guidance_scale"), d.guidance_scale).toFloat();
  d.num_steps = ini.value(QStringLiteral("num_steps"), d.num_steps).toInt();
  d.conditioning.conditioning_scale
      = ini.value(QStringLiteral("conditioning_scale"), d.conditioning.conditioning_scale)
            .toFloat();
  d.conditioning.guidance_start
      = ini.value(QStringLiteral("guidance_start"), d.conditioning.guidance_start).toFloat();
  d.conditioning.guidance_end
      = ini.value(QStringLiteral("guidance_end"), d.conditioning.guidance_end).toFloat();
  ini.endGroup();
}

}
