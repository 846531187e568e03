#pragma once

#include <iomanip>
#include <ios>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace batch_newton {

/**
 * @brief Fixed-width progress table written to a stream.
 * @details Each column has a name, a width and a printf-like kind: integers are
 *          zero-padded, reals use scientific notation with the given precision.
 */
class TablePrinter {
public:
  struct Column {
    std::string name;
    int width = 10;
    int precision = 4; ///< Digits after the point; negative for an integer column.
  };

  TablePrinter(std::vector<Column> columns, std::string prefix = "", std::ostream &out = std::cout)
      : _columns(std::move(columns)), _prefix(std::move(prefix)), _out(&out) {}

  /// @brief Column names, framed by rules.
  void header() const {
    rule();
    std::ostringstream line;
    line << _prefix << "|";
    for (const Column &c : _columns)
      line << " " << std::setw(c.width) << c.name << " |";
    *_out << line.str() << "\n";
    rule();
  }

  /// @brief One row of values, in column order.
  void row(const std::vector<double> &values) const {
    std::ostringstream line;
    line << _prefix << "|";
    for (size_t i = 0; i < _columns.size(); ++i) {
      const Column &c = _columns[i];
      const double v = i < values.size() ? values[i] : 0.0;
      line << " ";
      if (c.precision < 0)
        line << std::setw(c.width) << std::setfill('0') << static_cast<long long>(v) << std::setfill(' ');
      else
        line << std::setw(c.width) << std::scientific << std::setprecision(c.precision) << v << std::defaultfloat;
      line << " |";
    }
    *_out << line.str() << "\n";
  }

  /// @brief Closing rule.
  void footer() const { rule(); }

private:
  void rule() const {
    int total = 1;
    for (const Column &c : _columns)
      total += c.width + 3;
    *_out << _prefix << std::string(static_cast<size_t>(total), '-') << "\n";
  }

  std::vector<Column> _columns;
  std::string _prefix;
  std::ostream *_out;
};

} // namespace batch_newton
