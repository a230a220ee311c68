#include "mdnav/describe.hpp"

#include <sstream>

namespace mdnav
{
namespace
{
std::string_view messageNoun(Category category)
{
    switch (category)
    {
    case Category::Image:
        return "graphic";
    case Category::Blockquote:
        return "block quote";
    case Category::Checkbox:
        return "check box";
    default:
        return categoryName(category);
    }
}

bool isCodeJump(const std::vector<Category> &categories)
{
    if (categories.size() != 2)
        return false;
    bool block = false;
    bool inlineCode = false;
    for (Category category : categories)
    {
        block = block || category == Category::CodeBlock;
        inlineCode = inlineCode || category == Category::InlineCode;
    }
    return block && inlineCode;
}

std::string_view headingText(const Element &element, std::string_view text)
{
    if (element.span.end > text.size())
        return {};
    std::string_view line = text.substr(element.span.start, element.span.length());
    std::size_t pos = 0;
    while (pos < line.size() && line[pos] == '#')
        ++pos;
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t'))
        ++pos;
    return line.substr(pos);
}

} // namespace

std::string columnLabel(std::size_t column)
{
    std::string label;
    std::size_t value = column + 1;
    while (value > 0)
    {
        --value;
        label.insert(label.begin(), static_cast<char>('A' + value % 26));
        value /= 26;
    }
    return label;
}

std::string describeElement(const Element &element, std::string_view text)
{
    std::ostringstream out;
    switch (element.category)
    {
    case Category::Heading:
    {
        out << "heading level " << element.level;
        std::string_view title = headingText(element, text);
        if (!title.empty())
            out << ": " << title;
        break;
    }
    case Category::Table:
        out << "table with " << element.columnCount << (element.columnCount == 1 ? " column" : " columns");
        break;
    case Category::List:
        out << (element.ordered ? "ordered list" : "list");
        break;
    case Category::ListItem:
    case Category::Blockquote:
        out << categoryName(element.category);
        if (element.depth > 1)
            out << " level " << element.depth;
        break;
    case Category::CodeBlock:
        out << "code block";
        if (!element.info.empty())
            out << " (" << element.info << ')';
        break;
    case Category::Checkbox:
        out << (element.checked ? "checked check box" : "not checked check box");
        break;
    case Category::Link:
    case Category::Image:
        out << messageNoun(element.category);
        if (!element.info.empty())
            out << ": " << element.info;
        break;
    case Category::Footnote:
        out << (element.definition ? "footnote definition " : "footnote ") << element.info;
        break;
    case Category::Math:
        out << (element.display ? "display math formula" : "math formula");
        break;
    default:
        out << categoryName(element.category);
        break;
    }
    return out.str();
}

std::string describeCell(const TableCell &cell)
{
    std::ostringstream out;
    if (cell.header)
        out << "header " << columnLabel(cell.column);
    else
        out << columnLabel(cell.column) << cell.row + 2;
    out << ": " << (cell.text.empty() ? std::string("blank") : cell.text);
    return out.str();
}

std::string noMatchMessage(const NavigationRequest &request)
{
    switch (request.kind)
    {
    case RequestKind::BlockBoundary:
        return "Not inside a block";
    case RequestKind::CellMove:
        return "Edge of table";
    case RequestKind::CategoryJump:
        break;
    }

    const char *direction = request.direction == Direction::Next ? "next" : "previous";
    std::ostringstream out;
    if (request.level > 0)
    {
        out << "No " << direction << " heading at level " << request.level;
        return out.str();
    }

    out << "no " << direction << ' ';
    if (isCodeJump(request.categories))
        out << "code";
    else if (request.categories.size() == 1)
        out << messageNoun(request.categories.front());
    else
        out << "element";
    return out.str();
}

} // namespace mdnav
