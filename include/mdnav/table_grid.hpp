#pragma once

#include "mdnav/element.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mdnav
{

// Raw text between two pipes, whitespace included.
struct CellRange
{
    std::size_t start = 0;
    std::size_t end = 0;
};

struct TableCell
{
    std::size_t row = 0;
    std::size_t column = 0;
    std::size_t start = 0;
    std::size_t end = 0;
    std::size_t contentStart = 0;
    std::size_t contentEnd = 0;
    std::string text;
    bool padded = false;
    bool header = false;

    // Where the caret goes when the cell is reached.
    std::size_t target() const noexcept { return contentStart; }
};

enum class CellDirection
{
    Left,
    Right,
    Up,
    Down
};

// A cell address. Header cells sit above data row 0 and ignore `row`.
struct CellPosition
{
    bool header = false;
    std::size_t row = 0;
    std::size_t column = 0;

    bool operator==(const CellPosition &other) const noexcept = default;
};

class TableGrid
{
public:
    TableGrid() = default;

    ElementId tableId() const noexcept { return table; }
    std::size_t rowCount() const noexcept { return rows.size(); }
    std::size_t columnCount() const noexcept { return columns; }

    // Data cells. Throws std::out_of_range outside [0, rowCount) x [0, columnCount).
    const TableCell &cellAt(std::size_t row, std::size_t column) const;
    const TableCell &headerCell(std::size_t column) const;
    const std::vector<TableCell> &header() const noexcept { return headerCells; }
    const TableCell &cell(const CellPosition &position) const;

    // Maps an offset inside the table to a cell. The separator row maps to the header.
    std::optional<CellPosition> locate(std::size_t offset) const;
    // Up stops at data row 0. Down from the header enters data row 0.
    std::optional<CellPosition> move(const CellPosition &from, CellDirection direction) const noexcept;

private:
    friend TableGrid resolveGrid(const Element &table, std::string_view text);

    struct RowLine
    {
        std::size_t start = 0;
        std::size_t end = 0;
        bool header = false;
        std::size_t row = 0;
        std::vector<std::size_t> cellStarts;
    };

    ElementId table = kNoElement;
    std::size_t columns = 0;
    std::vector<TableCell> headerCells;
    std::vector<std::vector<TableCell>> rows;
    std::vector<RowLine> lines;
};

// Splits the line [start, end) on unescaped pipes. Leading and trailing pipes are optional.
std::vector<CellRange> splitPipeRow(std::string_view text, std::size_t start, std::size_t end);

TableGrid resolveGrid(const Element &table, std::string_view text);

// Returns nullptr at the edge of the grid.
const TableCell *moveCell(const TableGrid &grid, std::size_t row, std::size_t column, CellDirection direction);

} // namespace mdnav
