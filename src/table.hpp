#pragma once

#include <string>
#include <vector>

#include "util/string.hpp"

/* One width for every column: longest field of header and rows plus 2 */
size_t TableColumnWidth(const TTuple &header, const std::vector<TTuple> &rows);

std::string FormatTableLine(const TTuple &fields, size_t width);

std::vector<std::string> RenderTable(const TTuple &header, const std::vector<TTuple> &rows);
