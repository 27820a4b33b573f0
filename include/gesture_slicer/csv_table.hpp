/**
 * @file csv_table.hpp
 * @brief Header-aware CSV reading and CSV field escaping
 *
 * @details The recorders wrote their logs with either ',' or ';' as the
 *          separator, so the delimiter is sniffed from the header line.
 *          Double-quoted fields (with "" escapes) are supported; blank lines
 *          and trailing '\r' are ignored.
 */

#ifndef GESTURE_SLICER_CSV_TABLE_HPP
#define GESTURE_SLICER_CSV_TABLE_HPP

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gesture_slicer {

/**
 * @class CsvTable
 * @brief Parsed CSV content: one header row plus data rows.
 */
class CsvTable {
public:
  using Row = std::vector<std::string>;

  /**
   * @brief Parse CSV text. The first non-blank line is the header.
   * @note An input without any non-blank line yields an empty header.
   */
  static CsvTable parse(std::string_view text);

  /**
   * @brief Map a file and parse it.
   * @param path File to read
   * @param table Output table
   * @return false when the file is absent or empty
   */
  static bool load(const std::string &path, CsvTable &table);

  const Row &header() const { return header_; }
  const std::vector<Row> &rows() const { return rows_; }
  size_t row_count() const { return rows_.size(); }
  char delimiter() const { return delimiter_; }

  /**
   * @brief Find a column by any of its accepted names.
   * @note Comparison is case-insensitive and ignores surrounding blanks.
   */
  std::optional<size_t>
  column(std::initializer_list<std::string_view> names) const;

private:
  Row header_;
  std::vector<Row> rows_;
  char delimiter_ = ',';
};

/**
 * @brief Quote a field for CSV output when it contains a delimiter, quote
 *        or line break.
 */
std::string csv_escape(std::string_view field);

} // namespace gesture_slicer

#endif // GESTURE_SLICER_CSV_TABLE_HPP
