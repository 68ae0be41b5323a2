#pragma once

#include <cstdio>
#include <fmt/core.h>
#include <string_view>

namespace uuid_autopsy::core {

/// Writes rendered text to a C stream, stdout unless told otherwise.
class default_printer
{
public:
  default_printer() = default;

  explicit default_printer(std::FILE *stream) : stream_(stream) {}

  auto print(std::string_view text) const -> void { fmt::print(stream_, "{}", text); }

private:
  std::FILE *stream_{ stdout };
};

}// namespace uuid_autopsy::core
