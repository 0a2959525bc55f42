#pragma once
#include <optional>
#include <string>
#include <string_view>

#include "pw/orchestrator/execution_context.h"

namespace pw::orchestrator {

// Command marker embedded in the job's log stream:
//   ##vso[<area>.<event> <k>=<v>;<k>=<v>]<data>
struct Command {
  std::string area;
  std::string event;
  std::string data;
  StringMap properties;

  // Re-escaped marker form.
  std::string ToString() const;
};

inline constexpr std::string_view kCommandMarkerPrefix{"##vso["};

std::optional<Command> ParseCommandMarker(std::string_view line);

std::string UnescapeCommandValue(std::string_view value);
std::string EscapeCommandValue(std::string_view value);

} // namespace pw::orchestrator
