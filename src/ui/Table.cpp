#include "ui/Table.hpp"
#include "ui/Formatting.hpp"
#include <algorithm>
#include <utility>

namespace netsnap::ui {

TextTable::TextTable(std::vector<std::string> headers, bool unicode)
    : headers_(std::move(headers)), unicode_(unicode) {}

void TextTable::add_row(std::vector<std::string> row) {
  row.resize(headers_.size());
  rows_.push_back(std::move(row));
}

std::vector<std::string> TextTable::render() const {
  std::vector<int> widths;
  widths.reserve(headers_.size());
  for (const auto& h : headers_) widths.push_back(display_cols(h));
  for (const auto& r : rows_)
    for (size_t c = 0; c < r.size(); ++c) widths[c] = std::max(widths[c], display_cols(r[c]));

  const std::string H = unicode_ ? "─" : "-";
  const std::string V = unicode_ ? "│" : "|";
  // corners/junctions for top, middle and bottom rules
  struct Rule { const char* left; const char* mid; const char* right; };
  const Rule top = unicode_ ? Rule{"┌", "┬", "┐"} : Rule{"+", "+", "+"};
  const Rule sep = unicode_ ? Rule{"├", "┼", "┤"} : Rule{"+", "+", "+"};
  const Rule bot = unicode_ ? Rule{"└", "┴", "┘"} : Rule{"+", "+", "+"};

  auto rule = [&](const Rule& r) {
    std::string line = r.left;
    for (size_t c = 0; c < widths.size(); ++c) {
      if (c) line += r.mid;
      line += repeat_str(H, widths[c] + 2);
    }
    return line + r.right;
  };
  auto row_line = [&](const std::vector<std::string>& cells) {
    std::string line = V;
    for (size_t c = 0; c < widths.size(); ++c)
      line += " " + pad_right(cells[c], widths[c]) + " " + V;
    return line;
  };

  std::vector<std::string> out;
  out.push_back(rule(top));
  out.push_back(row_line(headers_));
  out.push_back(rule(sep));
  for (const auto& r : rows_) out.push_back(row_line(r));
  out.push_back(rule(bot));
  return out;
}

} // namespace netsnap::ui
