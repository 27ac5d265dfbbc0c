#pragma once
#include "Error.hpp"

#include <boost/container/flat_map.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace infu
{

enum class Variant : int8_t
{
  Stage1,
  Stage2,
};

// Names used on disk and on the command line
std::string_view to_string(Variant v) noexcept;
std::optional<Variant> parse_variant(std::string_view name) noexcept;
inline constexpr Variant default_variant = Variant::Stage2;

struct AddOnInfo
{
  std::string_view id;
  std::string_view file_name;
};

// Optional LoRA modules that may be blended into the resident pipeline.
std::span<const AddOnInfo> known_addons() noexcept;
const AddOnInfo* find_addon(std::string_view id) noexcept;

struct WeightedAddOn
{
  std::string id;
  double weight{1.0};
};

/**
 * Parses an add-on list. Both forms may be mixed:
 *
 * (realism: 1.0), (anti_blur: 0.5)
 * realism, anti_blur
 *
 * A bare id has weight 1. An empty or blank string is an empty list.
 */
std::optional<std::vector<WeightedAddOn>> parse_addon_list(std::string_view str);

// Sorted by id, so that equal sets compare equal regardless of request order.
using AddOnSet = boost::container::flat_map<std::string, float>;

Expected<AddOnSet> make_addon_set(std::span<const WeightedAddOn> addons);

class PipelineConfig
{
public:
  PipelineConfig() = default;
  PipelineConfig(Variant variant, bool quantized, bool cpu_offload, AddOnSet addons = {});

  // Boundary constructor: rejects unknown variant names and add-on ids.
  static Expected<PipelineConfig> create(
      std::string_view variant, bool quantized, bool cpu_offload,
      std::span<const WeightedAddOn> addons);

  Variant variant() const noexcept { return m_variant; }
  bool quantized() const noexcept { return m_quantized; }
  bool cpu_offload() const noexcept { return m_cpu_offload; }
  const AddOnSet& enabled_addons() const noexcept { return m_addons; }

  // True when a pipeline built for `other` can serve this configuration
  // after at most an add-on swap.
  bool same_construction(const PipelineConfig& other) const noexcept
  {
    return m_variant == other.m_variant && m_quantized == other.m_quantized
           && m_cpu_offload == other.m_cpu_offload;
  }

  bool operator==(const PipelineConfig& other) const = default;

  std::string to_string() const;

private:
  Variant m_variant{default_variant};
  bool m_quantized{true};
  bool m_cpu_offload{true};
  AddOnSet m_addons;
};

}
