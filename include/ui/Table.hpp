#pragma once

#include <string>
#include <vector>

namespace netsnap::ui {

// Fixed-width, left-aligned text table with a header row:
//
//   +------+----------+
//   | Name | Address  |
//   +------+----------+
//   | eth0 | 10.0.0.2 |
//   +------+----------+
//
// Column width is the widest cell (in display columns) plus one space of
// padding on each side.
class TextTable {
public:
  explicit TextTable(std::vector<std::string> headers, bool unicode = false);

  void add_row(std::vector<std::string> row);

  [[nodiscard]] std::vector<std::string> render() const;

private:
  std::vector<std::string> headers_;
  std::vector<std::vector<std::string>> rows_;
  bool unicode_;
};

} // namespace netsnap::ui
