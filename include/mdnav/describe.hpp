#pragma once

#include "mdnav/element.hpp"
#include "mdnav/navigator.hpp"
#include "mdnav/table_grid.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace mdnav
{

// Spreadsheet style column letters: 0 -> "A", 25 -> "Z", 26 -> "AA".
std::string columnLabel(std::size_t column);

// Short description of a reached element, e.g. "heading level 2: Install" or "checked check box".
std::string describeElement(const Element &element, std::string_view text);

// "B3: text" for data cells (the header is row 1), "header A: text" for header cells.
std::string describeCell(const TableCell &cell);

std::string noMatchMessage(const NavigationRequest &request);

} // namespace mdnav
