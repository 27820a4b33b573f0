/**
 * @file csv_table.cpp
 * @brief CSV reading implementation
 */

#include "gesture_slicer/csv_table.hpp"

#include <algorithm>
#include <cctype>

#include "gesture_slicer/memory_io.hpp"

namespace gesture_slicer {

namespace {

std::string_view next_line(std::string_view text, size_t &pos) {
  size_t end = text.find('\n', pos);
  if (end == std::string_view::npos)
    end = text.size();
  std::string_view line = text.substr(pos, end - pos);
  pos = end + 1;
  if (!line.empty() && line.back() == '\r')
    line.remove_suffix(1);
  return line;
}

bool is_blank(std::string_view line) {
  return std::all_of(line.begin(), line.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c));
  });
}

/// Prefer ';' only when the header has no ',' at all
char sniff_delimiter(std::string_view header) {
  bool has_comma = header.find(',') != std::string_view::npos;
  bool has_semicolon = header.find(';') != std::string_view::npos;
  return (has_semicolon && !has_comma) ? ';' : ',';
}

CsvTable::Row split_fields(std::string_view line, char delim) {
  CsvTable::Row fields;
  std::string field;
  bool quoted = false;

  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          field += '"';
          ++i;
        } else {
          quoted = false;
        }
      } else {
        field += c;
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == delim) {
      fields.push_back(std::move(field));
      field.clear();
    } else {
      field += c;
    }
  }
  fields.push_back(std::move(field));
  return fields;
}

std::string normalize(std::string_view name) {
  size_t first = 0;
  while (first < name.size() &&
         std::isspace(static_cast<unsigned char>(name[first])))
    ++first;
  size_t last = name.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(name[last - 1])))
    --last;

  std::string out(name.substr(first, last - first));
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

} // anonymous namespace

CsvTable CsvTable::parse(std::string_view text) {
  CsvTable table;
  size_t pos = 0;

  /// Skip a UTF-8 byte order mark written by spreadsheet exports
  if (text.size() >= 3 && text.substr(0, 3) == "\xEF\xBB\xBF")
    pos = 3;

  while (pos < text.size()) {
    std::string_view line = next_line(text, pos);
    if (is_blank(line))
      continue;
    table.delimiter_ = sniff_delimiter(line);
    table.header_ = split_fields(line, table.delimiter_);
    break;
  }

  while (pos < text.size()) {
    std::string_view line = next_line(text, pos);
    if (is_blank(line))
      continue;
    table.rows_.push_back(split_fields(line, table.delimiter_));
  }
  return table;
}

bool CsvTable::load(const std::string &path, CsvTable &table) {
  MappedFile file;
  if (!MemoryLoader::load_file(path, file))
    return false;
  table = parse(file.text());
  return true;
}

std::optional<size_t>
CsvTable::column(std::initializer_list<std::string_view> names) const {
  for (std::string_view name : names) {
    std::string wanted = normalize(name);
    for (size_t i = 0; i < header_.size(); ++i) {
      if (normalize(header_[i]) == wanted)
        return i;
    }
  }
  return std::nullopt;
}

std::string csv_escape(std::string_view field) {
  if (field.find_first_of(",;\"\r\n") == std::string_view::npos)
    return std::string(field);

  std::string out;
  out.reserve(field.size() + 2);
  out += '"';
  for (char c : field) {
    if (c == '"')
      out += '"';
    out += c;
  }
  out += '"';
  return out;
}

} // namespace gesture_slicer
