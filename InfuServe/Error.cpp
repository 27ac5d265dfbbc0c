#include "Error.hpp"

#include <fmt/format.h>

namespace infu
{

std::string_view to_string(ErrorKind kind) noexcept
{
  switch (kind)
  {
    case ErrorKind::ConfigRejected:
      return "ConfigRejected";
    case ErrorKind::ResourceUnavailable:
      return "ResourceUnavailable";
    case ErrorKind::ConstructionFailed:
      return "ConstructionFailed";
    case ErrorKind::InferenceFailed:
      return "InferenceFailed";
    case ErrorKind::PersistFailed:
      return "PersistFailed";
  }
  return "Unknown";
}

std::string Error::describe() const
{
  return fmt::format("{}: {}", to_string(kind), message);
}

}
