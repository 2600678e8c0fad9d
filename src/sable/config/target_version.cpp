#include "sable/config/target_version.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace sable::config {

namespace {

constexpr std::array<TargetVersion, 11> kVersions = {
    TargetVersion::kPy33,  TargetVersion::kPy34,  TargetVersion::kPy35,
    TargetVersion::kPy36,  TargetVersion::kPy37,  TargetVersion::kPy38,
    TargetVersion::kPy39,  TargetVersion::kPy310, TargetVersion::kPy311,
    TargetVersion::kPy312, TargetVersion::kPy313,
};

using Release = std::vector<uint32_t>;

auto Trim(std::string_view s) -> std::string_view {
  auto start = s.find_first_not_of(" \t");
  if (start == std::string_view::npos) {
    return {};
  }
  auto end = s.find_last_not_of(" \t");
  return s.substr(start, end - start + 1);
}

// "3.8.1" -> {3, 8, 1}. Anything but dot-separated digits is rejected.
auto ParseRelease(std::string_view text) -> std::optional<Release> {
  if (text.empty()) {
    return std::nullopt;
  }
  Release release;
  while (true) {
    auto dot = text.find('.');
    std::string_view part = text.substr(0, dot);
    if (part.empty() || !std::ranges::all_of(part, [](char c) {
          return c >= '0' && c <= '9';
        })) {
      return std::nullopt;
    }
    uint32_t value = 0;
    auto result =
        std::from_chars(part.data(), part.data() + part.size(), value);
    if (result.ec != std::errc{}) {
      return std::nullopt;
    }
    release.push_back(value);
    if (dot == std::string_view::npos) {
      break;
    }
    text.remove_prefix(dot + 1);
  }
  return release;
}

// Three-way comparison with zero padding: 3.8 == 3.8.0.
auto Compare(const Release& a, const Release& b) -> int {
  size_t n = std::max(a.size(), b.size());
  for (size_t i = 0; i < n; ++i) {
    uint32_t x = i < a.size() ? a[i] : 0;
    uint32_t y = i < b.size() ? b[i] : 0;
    if (x != y) {
      return x < y ? -1 : 1;
    }
  }
  return 0;
}

auto PrefixMatches(const Release& candidate, const Release& prefix) -> bool {
  for (size_t i = 0; i < prefix.size(); ++i) {
    uint32_t c = i < candidate.size() ? candidate[i] : 0;
    if (c != prefix[i]) {
      return false;
    }
  }
  return true;
}

// Evaluates one specifier clause against a candidate release.
// Returns nullopt when the clause is malformed.
auto ClauseMatches(const Release& candidate, std::string_view clause)
    -> std::optional<bool> {
  static constexpr std::array<std::string_view, 8> kOperators = {
      "===", "~=", "==", "!=", "<=", ">=", "<", ">"};

  clause = Trim(clause);
  auto op = std::ranges::find_if(
      kOperators, [&](std::string_view o) { return clause.starts_with(o); });
  if (op == kOperators.end()) {
    return std::nullopt;
  }
  std::string_view rest = Trim(clause.substr(op->size()));

  if (*op == "===") {
    return rest == std::format("{}.{}", candidate[0], candidate[1]);
  }

  bool wildcard = rest.ends_with(".*");
  if (wildcard) {
    if (*op != "==" && *op != "!=") {
      return std::nullopt;
    }
    rest.remove_suffix(2);
  }
  auto version = ParseRelease(rest);
  if (!version) {
    return std::nullopt;
  }

  if (*op == "==" || *op == "!=") {
    bool equal = wildcard ? PrefixMatches(candidate, *version)
                          : Compare(candidate, *version) == 0;
    return *op == "==" ? equal : !equal;
  }
  if (*op == "~=") {
    if (version->size() < 2) {
      return std::nullopt;
    }
    Release prefix(version->begin(), version->end() - 1);
    return Compare(candidate, *version) >= 0 &&
           PrefixMatches(candidate, prefix);
  }

  int cmp = Compare(candidate, *version);
  if (*op == "<=") return cmp <= 0;
  if (*op == ">=") return cmp >= 0;
  if (*op == "<") return cmp < 0;
  return cmp > 0;
}

}  // namespace

auto AllTargetVersions() -> std::span<const TargetVersion> {
  return kVersions;
}

auto ParseTargetVersion(std::string_view token)
    -> std::optional<TargetVersion> {
  std::string lowered(token);
  std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  for (TargetVersion v : kVersions) {
    if (TargetVersionName(v) == lowered) {
      return v;
    }
  }
  return std::nullopt;
}

auto TargetVersionName(TargetVersion version) -> std::string {
  return std::format("py3{}", static_cast<int>(version));
}

auto InferTargetVersions(std::string_view requires_python)
    -> std::optional<std::vector<TargetVersion>> {
  std::string_view text = Trim(requires_python);

  // Plain version: "3.8" selects exactly py38.
  if (auto release = ParseRelease(text)) {
    if ((*release)[0] != 3 || release->size() < 2) {
      return std::nullopt;
    }
    for (TargetVersion v : kVersions) {
      if (static_cast<uint32_t>(v) == (*release)[1]) {
        return std::vector<TargetVersion>{v};
      }
    }
    return std::nullopt;
  }

  std::vector<std::string_view> clauses;
  while (true) {
    auto comma = text.find(',');
    std::string_view clause = Trim(text.substr(0, comma));
    if (clause.empty()) {
      return std::nullopt;
    }
    clauses.push_back(clause);
    if (comma == std::string_view::npos) {
      break;
    }
    text.remove_prefix(comma + 1);
  }

  std::vector<TargetVersion> selected;
  for (TargetVersion v : kVersions) {
    Release candidate = {3, static_cast<uint32_t>(v)};
    bool all = true;
    for (std::string_view clause : clauses) {
      auto matches = ClauseMatches(candidate, clause);
      if (!matches) {
        return std::nullopt;
      }
      all = all && *matches;
    }
    if (all) {
      selected.push_back(v);
    }
  }
  if (selected.empty()) {
    return std::nullopt;
  }
  return selected;
}

}  // namespace sable::config
