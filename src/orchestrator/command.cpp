#include "pw/orchestrator/command.h"

#include <array>
#include <utility>

namespace pw::orchestrator {

namespace {

struct EscapeMapping {
  std::string_view token;
  std::string_view replacement;
};

// "%AZP25" stands for a literal '%' and is expanded last.
constexpr std::array<EscapeMapping, 5> kEscapeMappings{{
    {"%3B", ";"},
    {"%0D", "\r"},
    {"%0A", "\n"},
    {"%5D", "]"},
    {"%AZP25", "%"},
}};

std::string ReplaceAll(std::string text, std::string_view from, std::string_view to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

std::string_view Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t");
  return text.substr(first, last - first + 1);
}

} // namespace

std::string UnescapeCommandValue(std::string_view value) {
  std::string out(value);
  for (const auto& mapping : kEscapeMappings) {
    out = ReplaceAll(std::move(out), mapping.token, mapping.replacement);
  }
  return out;
}

std::string EscapeCommandValue(std::string_view value) {
  std::string out = ReplaceAll(std::string(value), "%", "%AZP25");
  for (const auto& mapping : kEscapeMappings) {
    if (mapping.replacement != "%") {
      out = ReplaceAll(std::move(out), mapping.replacement, mapping.token);
    }
  }
  return out;
}

std::optional<Command> ParseCommandMarker(std::string_view line) {
  const auto prefix = line.find(kCommandMarkerPrefix);
  if (prefix == std::string_view::npos) {
    return std::nullopt;
  }
  const auto body_start = prefix + kCommandMarkerPrefix.size();
  const auto close = line.find(']', body_start);
  if (close == std::string_view::npos) {
    return std::nullopt;
  }

  const auto body = line.substr(body_start, close - body_start);
  const auto space = body.find(' ');
  const auto name = body.substr(0, space);
  const auto dot = name.find('.');
  if (dot == std::string_view::npos) {
    return std::nullopt;
  }

  Command command;
  command.area = std::string(Trim(name.substr(0, dot)));
  command.event = std::string(Trim(name.substr(dot + 1)));
  if (command.area.empty() || command.event.empty()) {
    return std::nullopt;
  }

  if (space != std::string_view::npos) {
    auto rest = body.substr(space + 1);
    while (!rest.empty()) {
      const auto separator = rest.find(';');
      const auto pair = Trim(rest.substr(0, separator));
      rest = separator == std::string_view::npos ? std::string_view{} : rest.substr(separator + 1);
      if (pair.empty()) {
        continue;
      }
      const auto eq = pair.find('=');
      if (eq == std::string_view::npos || eq == 0) {
        continue;  // properties without a name are dropped
      }
      command.properties[std::string(Trim(pair.substr(0, eq)))] =
          UnescapeCommandValue(pair.substr(eq + 1));
    }
  }

  command.data = UnescapeCommandValue(line.substr(close + 1));
  return command;
}

std::string Command::ToString() const {
  std::string out(kCommandMarkerPrefix);
  out += area;
  out.push_back('.');
  out += event;
  bool first = true;
  for (const auto& [name, value] : properties) {
    out.push_back(first ? ' ' : ';');
    first = false;
    out += name;
    out.push_back('=');
    out += EscapeCommandValue(value);
  }
  out.push_back(']');
  out += EscapeCommandValue(data);
  return out;
}

} // namespace pw::orchestrator
