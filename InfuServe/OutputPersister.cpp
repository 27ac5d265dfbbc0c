#include "OutputPersister.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>

#include <fmt/format.h>

#include <string>

namespace infu
{

OutputPersister::OutputPersister(QString results_dir, QString extension)
    : m_dir{std::move(results_dir)}
    , m_extension{std::move(extension)}
{
}

QString OutputPersister::sanitize_prompt(std::string_view prompt)
{
  const auto code_points
      = QString::fromUtf8(prompt.data(), static_cast<qsizetype>(prompt.size())).toUcs4();

  std::u32string res;
  for (qsizetype i = 0; i < code_points.size() && i < prompt_prefix_length; i++)
  {
    const char32_t c = code_points[i];
    if (c == U'_' || c == U'-' || QChar::isLetterOrNumber(c))
      res.push_back(c);
    else
      res.push_back(U'_');
  }

  const auto first = res.find_first_not_of(U'_');
  if (first == std::u32string::npos)
    return {};
  const auto last = res.find_last_not_of(U'_');
  res = res.substr(first, last - first + 1);

  return QString::fromUcs4(res.data(), static_cast<qsizetype>(res.size()));
}

QString OutputPersister::file_name(int index, std::string_view prompt, uint64_t seed) const
{
  return QStringLiteral("%1_%2_seed%3.%4")
      .arg(index, 5, 10, QLatin1Char('0'))
      .arg(sanitize_prompt(prompt))
      .arg(seed)
      .arg(m_extension);
}

Expected<QString>
OutputPersister::save(const QImage& artifact, std::string_view prompt, uint64_t seed)
{
  if (artifact.isNull())
    return fail(ErrorKind::PersistFailed, "nothing to save: empty image");

  QDir dir{m_dir};
  if (!dir.mkpath(QStringLiteral(".")))
    return fail(
        ErrorKind::PersistFailed,
        fmt::format("cannot create results directory '{}'", m_dir.toStdString()));

  const auto existing = dir.entryList(
      QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System);

  // The count is only a starting point: if an earlier file was removed the
  // counted name may already be taken, and it must never be overwritten.
  const auto format = m_extension.toUpper().toLatin1();
  for (int index = existing.size(), end = index + existing.size() + 1; index <= end; index++)
  {
    const auto path = dir.filePath(file_name(index, prompt, seed));
    QFile file{path};
    if (!file.open(QIODevice::WriteOnly | QIODevice::NewOnly))
    {
      if (file.exists())
        continue;
      return fail(
          ErrorKind::PersistFailed,
          fmt::format(
              "cannot create '{}': {}", path.toStdString(),
              file.errorString().toStdString()));
    }

    if (!artifact.save(&file, format.constData()))
    {
      file.close();
      file.remove();
      return fail(
          ErrorKind::PersistFailed, fmt::format("cannot encode '{}'", path.toStdString()));
    }

    qDebug() << "OutputPersister: saved" << path;
    return path;
  }

  return fail(
      ErrorKind::PersistFailed,
      fmt::format("no free file name left in '{}'", m_dir.toStdString()));
}

}
