#include "mdnav/table_grid.hpp"

#include "mdnav/line_classifier.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <stdexcept>

namespace mdnav
{
namespace
{
bool isSpace(char ch) noexcept
{
    return ch == ' ' || ch == '\t';
}

TableCell makeCell(std::string_view text, std::size_t start, std::size_t end)
{
    TableCell cell;
    cell.start = start;
    cell.end = end;
    std::size_t contentStart = start;
    std::size_t contentEnd = end;
    while (contentStart < contentEnd && isSpace(text[contentStart]))
        ++contentStart;
    while (contentEnd > contentStart && isSpace(text[contentEnd - 1]))
        --contentEnd;
    if (contentStart == contentEnd)
        contentStart = contentEnd = start;
    cell.contentStart = contentStart;
    cell.contentEnd = contentEnd;
    cell.text = std::string(text.substr(contentStart, contentEnd - contentStart));
    return cell;
}

TableCell paddedCell(std::size_t lineEnd)
{
    TableCell cell;
    cell.start = cell.end = lineEnd;
    cell.contentStart = cell.contentEnd = lineEnd;
    cell.padded = true;
    return cell;
}

} // namespace

std::vector<CellRange> splitPipeRow(std::string_view text, std::size_t start, std::size_t end)
{
    std::vector<CellRange> cells;
    end = std::min(end, text.size());
    while (start < end && isSpace(text[start]))
        ++start;
    while (end > start && isSpace(text[end - 1]))
        --end;
    if (start >= end)
        return cells;

    std::vector<std::size_t> pipes;
    for (std::size_t i = start; i < end; ++i)
    {
        if (text[i] == '\\' && i + 1 < end)
        {
            ++i;
            continue;
        }
        if (text[i] == '|')
            pipes.push_back(i);
    }

    std::size_t cellStart = start;
    for (std::size_t pipe : pipes)
    {
        cells.push_back(CellRange{cellStart, pipe});
        cellStart = pipe + 1;
    }
    cells.push_back(CellRange{cellStart, end});

    bool trailing = !pipes.empty() && pipes.back() == end - 1;
    bool leading = !pipes.empty() && pipes.front() == start;
    if (trailing)
        cells.pop_back();
    if (leading && !cells.empty())
        cells.erase(cells.begin());
    return cells;
}

TableGrid resolveGrid(const Element &table, std::string_view text)
{
    TableGrid grid;
    grid.table = table.id;

    std::size_t limit = std::min(table.span.end, text.size());
    std::size_t lineStart = table.span.start;
    std::size_t lineIndex = 0;
    while (lineStart < limit)
    {
        std::size_t next = 0;
        std::size_t lineEnd = std::min(findLineEnd(text, lineStart, next), limit);
        std::vector<CellRange> ranges = splitPipeRow(text, lineStart, lineEnd);
        std::size_t trimmedEnd = lineEnd;
        while (trimmedEnd > lineStart && isSpace(text[trimmedEnd - 1]))
            --trimmedEnd;

        if (lineIndex == 0)
            grid.columns = std::max<std::size_t>(ranges.size(), 1);

        TableGrid::RowLine rowLine;
        rowLine.start = lineStart;
        rowLine.end = lineEnd;
        rowLine.header = lineIndex <= 1;
        rowLine.row = lineIndex >= 2 ? lineIndex - 2 : 0;
        for (std::size_t i = 0; i < ranges.size() && i < grid.columns; ++i)
            rowLine.cellStarts.push_back(ranges[i].start);
        grid.lines.push_back(std::move(rowLine));

        if (lineIndex != 1)
        {
            std::vector<TableCell> cells;
            for (std::size_t column = 0; column < grid.columns; ++column)
            {
                TableCell cell;
                if (column >= ranges.size())
                    cell = paddedCell(trimmedEnd);
                else if (column + 1 == grid.columns)
                    cell = makeCell(text, ranges[column].start, ranges.back().end);
                else
                    cell = makeCell(text, ranges[column].start, ranges[column].end);
                cell.column = column;
                cell.header = lineIndex == 0;
                cell.row = lineIndex == 0 ? 0 : lineIndex - 2;
                cells.push_back(std::move(cell));
            }
            if (lineIndex == 0)
                grid.headerCells = std::move(cells);
            else
                grid.rows.push_back(std::move(cells));
        }

        if (next == lineEnd)
            break;
        lineStart = next;
        ++lineIndex;
    }

    PLOGV << "resolved grid for table " << table.id << ": " << grid.rows.size() << " rows, " << grid.columns
          << " columns";
    return grid;
}

const TableCell &TableGrid::cellAt(std::size_t row, std::size_t column) const
{
    if (row >= rows.size() || column >= columns)
        throw std::out_of_range("table cell out of range");
    return rows[row][column];
}

const TableCell &TableGrid::headerCell(std::size_t column) const
{
    if (column >= headerCells.size())
        throw std::out_of_range("header cell out of range");
    return headerCells[column];
}

const TableCell &TableGrid::cell(const CellPosition &position) const
{
    if (position.header)
        return headerCell(position.column);
    return cellAt(position.row, position.column);
}

std::optional<CellPosition> TableGrid::locate(std::size_t offset) const
{
    const RowLine *line = nullptr;
    for (const auto &candidate : lines)
    {
        if (candidate.start > offset)
            break;
        line = &candidate;
    }
    if (!line || columns == 0)
        return std::nullopt;

    CellPosition position;
    position.header = line->header;
    position.row = line->header ? 0 : line->row;
    for (std::size_t i = 0; i < line->cellStarts.size(); ++i)
    {
        if (line->cellStarts[i] <= offset + 1)
            position.column = i;
    }
    position.column = std::min(position.column, columns - 1);
    return position;
}

std::optional<CellPosition> TableGrid::move(const CellPosition &from, CellDirection direction) const noexcept
{
    CellPosition to = from;
    switch (direction)
    {
    case CellDirection::Left:
        if (from.column == 0)
            return std::nullopt;
        --to.column;
        break;
    case CellDirection::Right:
        if (from.column + 1 >= columns)
            return std::nullopt;
        ++to.column;
        break;
    case CellDirection::Up:
        if (from.header || from.row == 0)
            return std::nullopt;
        --to.row;
        break;
    case CellDirection::Down:
        if (from.header)
        {
            if (rows.empty())
                return std::nullopt;
            to.header = false;
            to.row = 0;
        }
        else if (from.row + 1 >= rows.size())
        {
            return std::nullopt;
        }
        else
        {
            ++to.row;
        }
        break;
    }
    return to;
}

const TableCell *moveCell(const TableGrid &grid, std::size_t row, std::size_t column, CellDirection direction)
{
    if (row >= grid.rowCount() || column >= grid.columnCount())
        throw std::out_of_range("table cell out of range");
    auto target = grid.move(CellPosition{false, row, column}, direction);
    if (!target)
        return nullptr;
    return &grid.cell(*target);
}

} // namespace mdnav
