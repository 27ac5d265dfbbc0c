#pragma once
#include "GenerationService.hpp"
#include "Settings.hpp"

#include <QJsonObject>
#include <QString>

#include <string_view>
#include <vector>

namespace infu
{

struct Size
{
  int width{};
  int height{};
};

// "864x1152", "864 X 1152"
std::optional<Size> parse_size(std::string_view str);

/**
 * Builds a request from a JSON object such as
 *
 * { "prompt": "A man, portrait, cinematic", "id_image": "man.jpg",
 *   "seed": 42, "model_version": "aes_stage2", "addons": "realism" }
 *
 * Relative image paths are resolved against `base_dir`. Missing keys take
 * their value from `defaults`.
 */
Expected<GenerationRequest> request_from_json(
    const QJsonObject& obj, const RequestDefaults& defaults, const QString& base_dir);

// A batch file holds a JSON array of request objects.
Expected<std::vector<QJsonObject>> load_batch(const QString& path);

}
