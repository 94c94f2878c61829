#include <algorithm>

#include "table.hpp"

static size_t MaxFieldLength(const TTuple &fields) {
    size_t len = 0;
    for (auto &field: fields)
        len = std::max(len, StringLength(field));
    return len;
}

size_t TableColumnWidth(const TTuple &header, const std::vector<TTuple> &rows) {
    size_t len = MaxFieldLength(header);

    for (auto &row: rows)
        len = std::max(len, MaxFieldLength(row));

    return len + 2;
}

std::string FormatTableLine(const TTuple &fields, size_t width) {
    std::string line;

    for (auto &field: fields)
        line += StringPadRight(field, width);

    return line;
}

std::vector<std::string> RenderTable(const TTuple &header, const std::vector<TTuple> &rows) {
    size_t width = TableColumnWidth(header, rows);
    std::vector<std::string> lines;

    lines.push_back(FormatTableLine(header, width));
    for (auto &row: rows)
        lines.push_back(FormatTableLine(row, width));

    return lines;
}
