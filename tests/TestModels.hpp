#pragma once
#include "ModelStore.hpp"
#include "PipelineConfig.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QImage>
#include <QTemporaryDir>

#include <stdexcept>

namespace infu::test
{

// A models root laid out like the downloaded archives, with empty files.
class TestModels
{
public:
  explicit TestModels(bool with_addons = true)
  {
    QDir root{m_dir.path()};
    root.mkpath("FLUX.1-dev");
    for (auto v : {Variant::Stage1, Variant::Stage2})
      root.mkpath(QStringLiteral("InfiniteYou/infu_flux_v1.0/%1")
                      .arg(QString::fromLatin1(to_string(v).data(), to_string(v).size())));
    root.mkpath("InfiniteYou/supports/insightface");
    root.mkpath("InfiniteYou/supports/optional_loras");

    if (with_addons)
      for (const auto& addon : known_addons())
        touch(ModelStore{path()}.adapter_path(addon));
  }

  QString path() const { return m_dir.path(); }
  ModelStore store() const { return ModelStore{path()}; }

  void remove(const QString& relative) const
  {
    QDir root{m_dir.path()};
    if (QFileInfo{root.filePath(relative)}.isDir())
      QDir{root.filePath(relative)}.removeRecursively();
    else
      root.remove(relative);
  }

  static void touch(const QString& file)
  {
    QFile f{file};
    if (!f.open(QIODevice::WriteOnly))
      throw std::runtime_error{"cannot create " + file.toStdString()};
  }

private:
  QTemporaryDir m_dir;
};

inline QImage test_face(int w = 16, int h = 16)
{
  QImage img{w, h, QImage::Format_RGB888};
  img.fill(Qt::gray);
  return img;
}

inline PipelineConfig config_with(Variant v, AddOnSet addons = {})
{
  return PipelineConfig{v, true, true, std::move(addons)};
}

}
