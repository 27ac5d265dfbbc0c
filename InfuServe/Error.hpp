#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace infu
{

enum class ErrorKind : int8_t
{
  ConfigRejected,
  ResourceUnavailable,
  ConstructionFailed,
  InferenceFailed,
  PersistFailed,
};

std::string_view to_string(ErrorKind kind) noexcept;

struct Error
{
  ErrorKind kind{ErrorKind::ConfigRejected};
  std::string message;

  std::string describe() const;
};

template <typename T>
using Expected = std::expected<T, Error>;

inline std::unexpected<Error> fail(ErrorKind kind, std::string message)
{
  return std::unexpected<Error>{Error{kind, std::move(message)}};
}

}
