#include "otelpipe/level_filter.h"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <utility>

#include "otelpipe/setup_error.h"

namespace otelpipe {

namespace {

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
    s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
    s.remove_suffix(1);
  return s;
}

bool IsValidModule(std::string_view module) {
  if (module.empty())
    return false;
  return std::all_of(module.begin(), module.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '-' || c == '.' || c == ':';
  });
}

bool IsOff(std::string_view text) {
  return text.size() == 3 && std::tolower(static_cast<unsigned char>(text[0])) == 'o' &&
         std::tolower(static_cast<unsigned char>(text[1])) == 'f' &&
         std::tolower(static_cast<unsigned char>(text[2])) == 'f';
}

// Parses "off" or a severity name. Returns false if neither.
bool ParseLevel(std::string_view text, std::optional<Severity>& out) {
  if (IsOff(text)) {
    out = std::nullopt;
    return true;
  }
  auto severity = ParseSeverity(text);
  if (!severity)
    return false;
  out = *severity;
  return true;
}

}  // namespace

LevelFilter::LevelFilter(std::vector<Directive> directives) : directives_(std::move(directives)) {}

LevelFilter LevelFilter::Parse(std::string_view expression) {
  std::vector<Directive> directives;

  auto upsert = [&directives](std::string module, std::optional<Severity> level) {
    for (auto& d : directives) {
      if (d.module == module) {
        d.level = level;
        return;
      }
    }
    directives.push_back(Directive{std::move(module), level});
  };

  std::size_t pos = 0;
  while (pos <= expression.size()) {
    const std::size_t comma = expression.find(',', pos);
    const std::size_t end = comma == std::string_view::npos ? expression.size() : comma;
    const std::string_view part = Trim(expression.substr(pos, end - pos));
    pos = end + 1;

    if (part.empty()) {
      if (comma == std::string_view::npos)
        break;
      continue;
    }

    const std::size_t eq = part.find('=');
    if (eq == std::string_view::npos) {
      std::optional<Severity> level;
      if (ParseLevel(part, level)) {
        upsert("", level);
      } else if (IsValidModule(part)) {
        upsert(std::string(part), Severity::Trace);
      } else {
        throw SetupError(fmt::format("invalid level directive '{}' in '{}'", part, expression));
      }
    } else {
      const std::string_view module = Trim(part.substr(0, eq));
      const std::string_view level_text = Trim(part.substr(eq + 1));

      if (!IsValidModule(module)) {
        throw SetupError(fmt::format("invalid module name '{}' in '{}'", module, expression));
      }

      std::optional<Severity> level;
      if (!ParseLevel(level_text, level)) {
        throw SetupError(fmt::format("invalid level '{}' for module '{}' in '{}'", level_text,
                                     module, expression));
      }
      upsert(std::string(module), level);
    }

    if (comma == std::string_view::npos)
      break;
  }

  if (directives.empty()) {
    directives.push_back(Directive{"", Severity::Error});
  }

  std::stable_sort(directives.begin(), directives.end(), [](const Directive& a, const Directive& b) {
    return a.module.size() < b.module.size();
  });

  return LevelFilter(std::move(directives));
}

bool LevelFilter::Enabled(std::string_view module, Severity severity) const noexcept {
  for (auto it = directives_.rbegin(); it != directives_.rend(); ++it) {
    if (!it->module.empty() && module.substr(0, it->module.size()) != it->module) {
      continue;
    }
    return it->level && severity >= *it->level;
  }
  return false;
}

std::optional<Severity> LevelFilter::MostVerbose() const noexcept {
  std::optional<Severity> most;
  for (const auto& d : directives_) {
    if (d.level && (!most || *d.level < *most)) {
      most = d.level;
    }
  }
  return most;
}

}  // namespace otelpipe
