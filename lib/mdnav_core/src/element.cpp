#include "mdnav/element.hpp"

namespace mdnav
{

bool isBlock(Category category) noexcept
{
    switch (category)
    {
    case Category::Heading:
    case Category::Table:
    case Category::List:
    case Category::ListItem:
    case Category::Blockquote:
    case Category::CodeBlock:
    case Category::Separator:
    case Category::Checkbox:
        return true;
    default:
        return false;
    }
}

int nestingRank(Category category) noexcept
{
    switch (category)
    {
    case Category::List:
    case Category::Blockquote:
    case Category::Table:
    case Category::CodeBlock:
        return 0;
    case Category::Heading:
    case Category::Separator:
        return 1;
    case Category::ListItem:
        return 2;
    case Category::Checkbox:
        return 3;
    default:
        return 4;
    }
}

std::string_view categoryName(Category category) noexcept
{
    switch (category)
    {
    case Category::Heading:
        return "heading";
    case Category::Table:
        return "table";
    case Category::List:
        return "list";
    case Category::ListItem:
        return "list item";
    case Category::Blockquote:
        return "blockquote";
    case Category::CodeBlock:
        return "code block";
    case Category::InlineCode:
        return "inline code";
    case Category::Separator:
        return "separator";
    case Category::Checkbox:
        return "checkbox";
    case Category::Link:
        return "link";
    case Category::Image:
        return "image";
    case Category::Bold:
        return "bold";
    case Category::Emphasis:
        return "italic";
    case Category::Strikethrough:
        return "strikethrough";
    case Category::Footnote:
        return "footnote";
    case Category::Math:
        return "math formula";
    }
    return "element";
}

std::optional<Category> parseCategory(std::string_view name) noexcept
{
    for (std::size_t i = 0; i < kCategoryCount; ++i)
    {
        auto category = static_cast<Category>(i);
        if (categoryName(category) == name)
            return category;
    }
    return std::nullopt;
}

} // namespace mdnav
