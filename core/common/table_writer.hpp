/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <list>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace xm {
  /// Plain text table with named columns, width fitted to the content
  struct TableWriter {
    struct Column {
      std::string name;
      // note: (l)eft or (r)ight
      char align;
      // NOLINTNEXTLINE(google-explicit-constructor)
      Column(const char *name, char align = 'l') : name{name}, align{align} {}
    };

    using Rows = std::list<std::vector<std::string>>;

    struct Row {
      const TableWriter &table;
      Rows::iterator row;

      std::string &operator[](std::string_view name) {
        return row->at(table.index(name));
      }
    };

    std::vector<Column> columns;
    Rows rows;

    explicit TableWriter(std::initializer_list<Column> columns)
        : columns{columns} {}

    size_t index(std::string_view name) const {
      const auto it{std::find_if(
          columns.begin(), columns.end(), [&](const Column &column) {
            return column.name == name;
          })};
      return it - columns.begin();
    }

    Row row() {
      return Row{*this, rows.emplace(rows.end(), columns.size())};
    }

    void write(std::ostream &os) const {
      std::vector<size_t> width(columns.size());
      for (size_t i{0}; i < columns.size(); ++i) {
        width.at(i) = columns.at(i).name.size();
        for (const auto &row : rows) {
          width.at(i) = std::max(width.at(i), row.at(i).size());
        }
      }
      const auto writeColumns{[&](const std::vector<std::string> &row) {
        for (size_t i{0}; i < columns.size(); ++i) {
          if (i != 0) {
            os << "  ";
          }
          const std::string pad(width.at(i) - row.at(i).size(), ' ');
          if (columns.at(i).align == 'r') {
            os << pad << row.at(i);
          } else {
            os << row.at(i) << pad;
          }
        }
        os << "\n";
      }};
      std::vector<std::string> header;
      for (const auto &column : columns) {
        header.emplace_back(column.name);
      }
      writeColumns(header);
      for (const auto &row : rows) {
        writeColumns(row);
      }
    }
  };
}  // namespace xm
