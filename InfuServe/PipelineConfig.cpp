#include "PipelineConfig.hpp"

#include <boost/fusion/include/adapt_struct.hpp>
#include <boost/spirit/home/x3.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cmath>

BOOST_FUSION_ADAPT_STRUCT(infu::WeightedAddOn, (std::string, id)(double, weight))

namespace infu
{

namespace x3 = boost::spirit::x3;

struct AddOnIdTag;
struct WeightedItemTag;
struct BareItemTag;
struct AddOnListTag;

const x3::rule<AddOnIdTag, std::string> addon_id = "addon_id";
const x3::rule<WeightedItemTag, WeightedAddOn> weighted_item = "weighted_item";
const x3::rule<BareItemTag, WeightedAddOn> bare_item = "bare_item";
const x3::rule<AddOnListTag, std::vector<WeightedAddOn>> addon_list = "addon_list";

auto const addon_id_def = x3::lexeme[+(x3::alnum | x3::char_('_') | x3::char_('-'))];
auto const weighted_item_def = '(' >> addon_id >> ':' >> x3::double_ >> ')';
auto const bare_item_def = addon_id >> x3::attr(1.0);
auto const addon_list_def = (weighted_item | bare_item) % ',';

BOOST_SPIRIT_DEFINE(addon_id, weighted_item, bare_item, addon_list);

std::optional<std::vector<WeightedAddOn>> parse_addon_list(std::string_view str)
{
  std::vector<WeightedAddOn> result_data;
  if (std::ranges::all_of(str, [](char c) { return c == ' ' || c == '\t' || c == '\n'; }))
    return result_data;

  auto iterator = str.begin();
  auto const end_iterator = str.end();

  const auto success = x3::phrase_parse(
      iterator, end_iterator, addon_list, x3::ascii::space, result_data);

  if (success && iterator == end_iterator)
    return result_data;

  return std::nullopt;
}

static constexpr std::array<AddOnInfo, 2> addon_catalog{{
    {"realism", "flux_realism_lora.safetensors"},
    {"anti_blur", "flux_anti_blur_lora.safetensors"},
}};

std::span<const AddOnInfo> known_addons() noexcept
{
  return addon_catalog;
}

const AddOnInfo* find_addon(std::string_view id) noexcept
{
  auto it = std::ranges::find(addon_catalog, id, &AddOnInfo::id);
  return it != addon_catalog.end() ? &*it : nullptr;
}

std::string_view to_string(Variant v) noexcept
{
  switch (v)
  {
    case Variant::Stage1:
      return "sim_stage1";
    case Variant::Stage2:
      return "aes_stage2";
  }
  return "unknown";
}

std::optional<Variant> parse_variant(std::string_view name) noexcept
{
  if (name == "sim_stage1")
    return Variant::Stage1;
  if (name == "aes_stage2")
    return Variant::Stage2;
  return std::nullopt;
}

Expected<AddOnSet> make_addon_set(std::span<const WeightedAddOn> addons)
{
  AddOnSet set;
  set.reserve(addons.size());
  for (const auto& [id, weight] : addons)
  {
    if (!find_addon(id))
      return fail(ErrorKind::ConfigRejected, fmt::format("unknown add-on '{}'", id));
    if (!std::isfinite(weight))
      return fail(
          ErrorKind::ConfigRejected, fmt::format("add-on '{}' has a non-finite weight", id));
    if (!set.emplace(id, static_cast<float>(weight)).second)
      return fail(ErrorKind::ConfigRejected, fmt::format("add-on '{}' listed twice", id));
  }
  return set;
}

PipelineConfig::PipelineConfig(
    Variant variant, bool quantized, bool cpu_offload, AddOnSet addons)
    : m_variant{variant}
    , m_quantized{quantized}
    , m_cpu_offload{cpu_offload}
    , m_addons{std::move(addons)}
{
}

Expected<PipelineConfig> PipelineConfig::create(
    std::string_view variant, bool quantized, bool cpu_offload,
    std::span<const WeightedAddOn> addons)
{
  auto v = parse_variant(variant);
  if (!v)
    return fail(
        ErrorKind::ConfigRejected, fmt::format("unknown model version '{}'", variant));

  auto set = make_addon_set(addons);
  if (!set)
    return std::unexpected(std::move(set.error()));

  return PipelineConfig{*v, quantized, cpu_offload, std::move(*set)};
}

std::string PipelineConfig::to_string() const
{
  std::string addons;
  for (const auto& [id, weight] : m_addons)
  {
    if (!addons.empty())
      addons += ", ";
    addons += fmt::format("{}:{}", id, weight);
  }
  return fmt::format(
      "{} (quantize_8bit={}, cpu_offload={}, add-ons=[{}])", infu::to_string(m_variant),
      m_quantized, m_cpu_offload, addons);
}

}
