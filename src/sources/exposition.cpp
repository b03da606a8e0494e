#include "sources/exposition.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string>

namespace sla_agent::sources {
namespace {

bool is_blank(const char c) { return c == ' ' || c == '\t' || c == '\r'; }

// Returns the position just past the closing brace, honouring quoted label
// values, or npos when the block is unterminated.
std::size_t skip_label_block(std::string_view line, std::size_t pos) {
  bool in_quotes = false;
  for (++pos; pos < line.size(); ++pos) {
    const char c = line[pos];
    if (in_quotes) {
      if (c == '\\') {
        ++pos;
      } else if (c == '"') {
        in_quotes = false;
      }
      continue;
    }
    if (c == '"') {
      in_quotes = true;
    } else if (c == '}') {
      return pos + 1;
    }
  }
  return std::string_view::npos;
}

std::optional<double> sample_value(std::string_view line, const std::string& metric_name) {
  if (line.size() <= metric_name.size() || line.compare(0, metric_name.size(), metric_name) != 0) {
    return std::nullopt;
  }

  std::size_t pos = metric_name.size();
  if (line[pos] == '{') {
    pos = skip_label_block(line, pos);
    if (pos == std::string_view::npos) {
      return std::nullopt;
    }
  }

  // The name must end here, otherwise this is a longer metric sharing the prefix.
  if (pos >= line.size() || !is_blank(line[pos])) {
    return std::nullopt;
  }
  while (pos < line.size() && is_blank(line[pos])) {
    ++pos;
  }

  std::size_t end = pos;
  while (end < line.size() && !is_blank(line[end])) {
    ++end;
  }
  if (end == pos) {
    return std::nullopt;
  }

  const std::string token(line.substr(pos, end - pos));
  char* parsed_end = nullptr;
  errno = 0;
  const double value = std::strtod(token.c_str(), &parsed_end);
  if (errno != 0 || parsed_end != token.c_str() + token.size() || !std::isfinite(value)) {
    return std::nullopt;
  }
  // Counter totals are never negative.
  if (value < 0.0) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<double> parse_metric_value(const std::string_view exposition, const std::string& metric_name) {
  if (metric_name.empty()) {
    return std::nullopt;
  }

  std::size_t start = 0;
  while (start < exposition.size()) {
    std::size_t stop = exposition.find('\n', start);
    if (stop == std::string_view::npos) {
      stop = exposition.size();
    }
    const std::string_view line = exposition.substr(start, stop - start);
    start = stop + 1;

    if (line.empty() || line.front() == '#') {
      continue;
    }

    if (const auto value = sample_value(line, metric_name); value.has_value()) {
      return value;
    }
  }

  return std::nullopt;
}

}  // namespace sla_agent::sources
