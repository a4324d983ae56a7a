#include "scenecast/compose/layout.hpp"

#include "scenecast/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace scenecast::compose {

namespace {

constexpr std::size_t MAX_ROW_INPUTS = 3;
constexpr std::size_t MAX_TEMPLATE_PANE = 99;

std::vector<std::string> split(const std::string &value, char separator) {
  std::vector<std::string> parts;
  std::size_t begin = 0;
  while (true) {
    const std::size_t end = value.find(separator, begin);
    parts.push_back(value.substr(begin, end == std::string::npos ? std::string::npos : end - begin));
    if (end == std::string::npos) {
      return parts;
    }
    begin = end + 1;
  }
}

common::Result<GridTemplate> parse_grid_template(const std::string &value) {
  using TemplateResult = common::Result<GridTemplate>;
  GridTemplate grid;
  for (const auto &row_text : split(value, '/')) {
    std::vector<int> row;
    for (const auto &cell_text : split(row_text, ',')) {
      const std::string cell = common::trim(cell_text);
      const bool numeric = !cell.empty() && cell.size() <= 2 &&
                           std::all_of(cell.begin(), cell.end(), [](unsigned char c) {
                             return std::isdigit(c) != 0;
                           });
      if (!numeric || static_cast<std::size_t>(std::stoi(cell)) > MAX_TEMPLATE_PANE) {
        return TemplateResult::failure("invalid template cell '" + cell_text + "'");
      }
      row.push_back(std::stoi(cell));
    }
    if (row.empty()) {
      return TemplateResult::failure("empty template row");
    }
    if (!grid.empty() && row.size() != grid.front().size()) {
      return TemplateResult::failure("template rows must have the same number of cells");
    }
    grid.push_back(std::move(row));
  }
  if (grid.empty()) {
    return TemplateResult::failure("empty template");
  }
  return TemplateResult::success(std::move(grid));
}

} // namespace

common::Result<LayoutSpec> parse_layout(const std::string &value) {
  const std::string lowered = common::to_lower(common::trim(value));
  if (lowered.empty() || lowered == "auto") {
    return common::Result<LayoutSpec>::success({LayoutKind::Auto, std::nullopt});
  }
  if (lowered == "row") {
    return common::Result<LayoutSpec>::success({LayoutKind::Row, std::nullopt});
  }
  if (lowered == "column") {
    return common::Result<LayoutSpec>::success({LayoutKind::Column, std::nullopt});
  }
  if (lowered == "grid") {
    return common::Result<LayoutSpec>::success({LayoutKind::Grid, std::nullopt});
  }
  if (common::starts_with(lowered, "template:")) {
    auto grid = parse_grid_template(lowered.substr(9));
    if (!grid.ok()) {
      return common::Result<LayoutSpec>::failure("invalid layout '" + value + "': " + grid.error());
    }
    return common::Result<LayoutSpec>::success(
        {LayoutKind::Template, std::nullopt, std::move(grid.value())});
  }
  for (const char *prefix : {"cols:", "grid:"}) {
    if (!common::starts_with(lowered, prefix)) {
      continue;
    }
    const std::string digits = lowered.substr(5);
    const bool numeric = !digits.empty() && digits.size() <= 3 &&
                         std::all_of(digits.begin(), digits.end(), [](unsigned char c) {
                           return std::isdigit(c) != 0;
                         });
    if (numeric && std::stoi(digits) > 0) {
      return common::Result<LayoutSpec>::success({LayoutKind::Grid, std::stoi(digits)});
    }
    break;
  }
  return common::Result<LayoutSpec>::failure("unknown layout '" + value +
                                             "' (expected auto|row|column|grid|cols:N|template:ROWS)");
}

std::string layout_name(const LayoutSpec &spec) {
  if (spec.kind == LayoutKind::Template) {
    std::string name = "template:";
    for (std::size_t r = 0; r < spec.grid_template.size(); ++r) {
      if (r > 0) {
        name += "/";
      }
      for (std::size_t c = 0; c < spec.grid_template[r].size(); ++c) {
        if (c > 0) {
          name += ",";
        }
        name += std::to_string(spec.grid_template[r][c]);
      }
    }
    return name;
  }
  if (spec.cols.has_value()) {
    return "cols:" + std::to_string(*spec.cols);
  }
  switch (spec.kind) {
  case LayoutKind::Auto:
    return "auto";
  case LayoutKind::Row:
    return "row";
  case LayoutKind::Column:
    return "column";
  case LayoutKind::Grid:
    return "grid";
  case LayoutKind::Template:
    break;
  }
  return "auto";
}

std::optional<ResolvedLayout> resolve_layout(const LayoutSpec &spec, std::size_t count) {
  if (count <= 1) {
    return std::nullopt;
  }
  const int n = static_cast<int>(count);

  LayoutKind kind = spec.kind;
  if (spec.cols.has_value()) {
    kind = LayoutKind::Grid;
  } else if (kind == LayoutKind::Auto || kind == LayoutKind::Template) {
    kind = count <= MAX_ROW_INPUTS ? LayoutKind::Row : LayoutKind::Grid;
  }

  switch (kind) {
  case LayoutKind::Row:
    return ResolvedLayout{LayoutKind::Row, n, 1};
  case LayoutKind::Column:
    return ResolvedLayout{LayoutKind::Column, 1, n};
  case LayoutKind::Grid:
  case LayoutKind::Auto:
  case LayoutKind::Template:
    break;
  }
  const int cols =
      spec.cols.value_or(static_cast<int>(std::ceil(std::sqrt(static_cast<double>(n)))));
  return ResolvedLayout{LayoutKind::Grid, cols, (n + cols - 1) / cols};
}

} // namespace scenecast::compose
