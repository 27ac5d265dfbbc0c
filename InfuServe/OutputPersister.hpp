#pragma once
#include "Error.hpp"

#include <QImage>
#include <QString>

#include <cstdint>
#include <string_view>

namespace infu
{

/**
 * @brief Writes generated images to a flat results directory
 *
 * Files are named <5-digit index>_<prompt prefix>_seed<seed>.<ext>, where the
 * index is the number of entries already in the directory. Meant to be called
 * from the access scheduler lane so that two saves never count the same
 * directory state.
 */
class OutputPersister
{
public:
  static constexpr int prompt_prefix_length = 50;

  explicit OutputPersister(QString results_dir, QString extension = QStringLiteral("png"));

  const QString& results_dir() const noexcept { return m_dir; }

  Expected<QString> save(const QImage& artifact, std::string_view prompt, uint64_t seed);

  static QString sanitize_prompt(std::string_view prompt);
  QString file_name(int index, std::string_view prompt, uint64_t seed) const;

private:
  QString m_dir;
  QString m_extension;
};

}
