#include <gtest/gtest.h>

#include "mdnav/element_extractor.hpp"
#include "mdnav/table_grid.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using mdnav::Category;
using mdnav::CellDirection;
using mdnav::CellPosition;
using mdnav::CellRange;
using mdnav::Element;
using mdnav::ElementExtractor;
using mdnav::TableCell;
using mdnav::TableGrid;

namespace
{

Element firstTable(const std::string &text)
{
    for (const auto &element : ElementExtractor().extract(text))
    {
        if (element.category == Category::Table)
            return element;
    }
    ADD_FAILURE() << "no table in: " << text;
    return Element{};
}

TableGrid gridOf(const std::string &text)
{
    return mdnav::resolveGrid(firstTable(text), text);
}

std::vector<std::string> cellTexts(const std::string &text, const std::vector<CellRange> &ranges)
{
    std::vector<std::string> result;
    for (const auto &range : ranges)
        result.push_back(text.substr(range.start, range.end - range.start));
    return result;
}

} // namespace

TEST(TableGrid, SplitsOnPipesWithOptionalBorders)
{
    const std::string bordered = "| a | b |";
    EXPECT_EQ(cellTexts(bordered, mdnav::splitPipeRow(bordered, 0, bordered.size())),
              (std::vector<std::string>{" a ", " b "}));

    const std::string bare = "a | b";
    EXPECT_EQ(cellTexts(bare, mdnav::splitPipeRow(bare, 0, bare.size())), (std::vector<std::string>{"a ", " b"}));

    const std::string leadingOnly = "| a | b";
    EXPECT_EQ(mdnav::splitPipeRow(leadingOnly, 0, leadingOnly.size()).size(), 2u);
}

TEST(TableGrid, EscapedPipesStayInsideTheCell)
{
    const std::string text = "| a \\| b | c |";
    EXPECT_EQ(cellTexts(text, mdnav::splitPipeRow(text, 0, text.size())),
              (std::vector<std::string>{" a \\| b ", " c "}));
}

TEST(TableGrid, EmptyLineHasNoCells)
{
    EXPECT_TRUE(mdnav::splitPipeRow("   ", 0, 3).empty());
}

TEST(TableGrid, MovesRightAndStopsAtTheLastRow)
{
    const std::string text = "| A | B |\n|---|---|\n| 1 | 2 |\n";
    TableGrid grid = gridOf(text);
    ASSERT_EQ(grid.rowCount(), 1u);
    ASSERT_EQ(grid.columnCount(), 2u);

    auto position = grid.locate(text.find('1'));
    ASSERT_TRUE(position.has_value());
    EXPECT_EQ(*position, (CellPosition{false, 0, 0}));

    const TableCell *right = mdnav::moveCell(grid, 0, 0, CellDirection::Right);
    ASSERT_NE(right, nullptr);
    EXPECT_EQ(right->text, "2");
    EXPECT_EQ(right->target(), text.find('2'));

    EXPECT_EQ(mdnav::moveCell(grid, 0, 0, CellDirection::Down), nullptr);
    EXPECT_EQ(mdnav::moveCell(grid, 0, 1, CellDirection::Right), nullptr);
    EXPECT_EQ(mdnav::moveCell(grid, 0, 0, CellDirection::Left), nullptr);
    EXPECT_EQ(mdnav::moveCell(grid, 0, 0, CellDirection::Up), nullptr);
    EXPECT_EQ(mdnav::moveCell(grid, 0, 1, CellDirection::Up), nullptr);
}

TEST(TableGrid, ShortRowsArePaddedAtTheLineEnd)
{
    const std::string text = "| A | B | C |\n|---|---|---|\n| 1 |  \n";
    TableGrid grid = gridOf(text);
    ASSERT_EQ(grid.rowCount(), 1u);

    const TableCell &filled = grid.cellAt(0, 0);
    EXPECT_FALSE(filled.padded);
    EXPECT_EQ(filled.text, "1");

    const TableCell &padded = grid.cellAt(0, 2);
    EXPECT_TRUE(padded.padded);
    EXPECT_TRUE(padded.text.empty());
    EXPECT_EQ(padded.target(), text.find("|  \n") + 1);
}

TEST(TableGrid, ExtraCellsMergeIntoTheLastColumn)
{
    const std::string text = "| A | B |\n|---|---|\n| 1 | 2 | 3 |\n";
    TableGrid grid = gridOf(text);
    ASSERT_EQ(grid.columnCount(), 2u);
    EXPECT_EQ(grid.cellAt(0, 1).text, "2 | 3");
}

TEST(TableGrid, EveryRowHasEveryColumn)
{
    const std::string text = "| A | B | C |\n|---|---|---|\n| 1 |\n| 1 | 2 | 3 | 4 |\n|\n| x | y |\n";
    TableGrid grid = gridOf(text);
    ASSERT_EQ(grid.rowCount(), 4u);
    for (std::size_t row = 0; row < grid.rowCount(); ++row)
    {
        for (std::size_t column = 0; column < grid.columnCount(); ++column)
        {
            const TableCell &cell = grid.cellAt(row, column);
            EXPECT_EQ(cell.row, row);
            EXPECT_EQ(cell.column, column);
        }
    }
    EXPECT_EQ(grid.header().size(), 3u);
}

TEST(TableGrid, CellAtRejectsOutOfRange)
{
    TableGrid grid = gridOf("| A |\n|---|\n| 1 |");
    EXPECT_NO_THROW(grid.cellAt(0, 0));
    EXPECT_THROW(grid.cellAt(1, 0), std::out_of_range);
    EXPECT_THROW(grid.cellAt(0, 1), std::out_of_range);
    EXPECT_THROW(grid.headerCell(1), std::out_of_range);
    EXPECT_THROW(mdnav::moveCell(grid, 3, 0, CellDirection::Right), std::out_of_range);
    EXPECT_THROW(mdnav::moveCell(grid, 0, 1, CellDirection::Left), std::out_of_range);
}

TEST(TableGrid, HeaderAndSeparatorLocateToTheHeader)
{
    const std::string text = "| Name | Age |\n|------|-----|\n| Ann  | 30  |\n";
    TableGrid grid = gridOf(text);

    auto onHeader = grid.locate(text.find("Age"));
    ASSERT_TRUE(onHeader.has_value());
    EXPECT_EQ(*onHeader, (CellPosition{true, 0, 1}));

    auto onSeparator = grid.locate(text.find("|-") + 2);
    ASSERT_TRUE(onSeparator.has_value());
    EXPECT_TRUE(onSeparator->header);
    EXPECT_EQ(onSeparator->column, 0u);

    EXPECT_EQ(grid.headerCell(0).text, "Name");
    EXPECT_TRUE(grid.headerCell(0).header);
}

TEST(TableGrid, UpStopsAtTheFirstDataRow)
{
    const std::string text = "| A | B |\n|---|---|\n| 1 | 2 |\n| 3 | 4 |\n";
    TableGrid grid = gridOf(text);

    EXPECT_FALSE(grid.move(CellPosition{false, 0, 1}, CellDirection::Up).has_value());
    EXPECT_EQ(mdnav::moveCell(grid, 0, 1, CellDirection::Up), nullptr);

    const TableCell *up = mdnav::moveCell(grid, 1, 1, CellDirection::Up);
    ASSERT_NE(up, nullptr);
    EXPECT_EQ(up->text, "2");
    EXPECT_FALSE(up->header);

    EXPECT_FALSE(grid.move(CellPosition{true, 0, 1}, CellDirection::Up).has_value());
}

TEST(TableGrid, DownFromTheHeaderEntersTheFirstRow)
{
    const std::string text = "| A | B |\n|---|---|\n| 1 | 2 |\n| 3 | 4 |\n";
    TableGrid grid = gridOf(text);

    auto down = grid.move(CellPosition{true, 0, 1}, CellDirection::Down);
    ASSERT_TRUE(down.has_value());
    EXPECT_EQ(*down, (CellPosition{false, 0, 1}));

    auto last = grid.move(*down, CellDirection::Down);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(grid.cell(*last).text, "4");
    EXPECT_FALSE(grid.move(*last, CellDirection::Down).has_value());
}

TEST(TableGrid, OffsetOnAPipeBelongsToTheNextCell)
{
    const std::string text = "| A | B |\n|---|---|\n| 1 | 2 |\n";
    TableGrid grid = gridOf(text);
    std::size_t pipe = text.find("| 2");
    auto position = grid.locate(pipe);
    ASSERT_TRUE(position.has_value());
    EXPECT_EQ(position->column, 1u);

    auto lineStart = grid.locate(text.find("| 1"));
    ASSERT_TRUE(lineStart.has_value());
    EXPECT_EQ(lineStart->column, 0u);
}

TEST(TableGrid, OffsetBeforeTheTableIsNotLocated)
{
    const std::string text = "intro\n\n| A |\n|---|\n| 1 |";
    TableGrid grid = gridOf(text);
    EXPECT_FALSE(grid.locate(0).has_value());
}

TEST(TableGrid, HeaderOnlyTableHasNoRows)
{
    const std::string text = "| A | B |\n|---|---|";
    TableGrid grid = gridOf(text);
    EXPECT_EQ(grid.rowCount(), 0u);
    EXPECT_FALSE(grid.move(CellPosition{true, 0, 0}, CellDirection::Down).has_value());
    auto right = grid.move(CellPosition{true, 0, 0}, CellDirection::Right);
    ASSERT_TRUE(right.has_value());
    EXPECT_EQ(grid.cell(*right).text, "B");
}
