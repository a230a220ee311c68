#include <gtest/gtest.h>

#include "mdnav/element_extractor.hpp"

#include <string>
#include <vector>

using mdnav::Category;
using mdnav::Element;
using mdnav::ElementExtractor;
using mdnav::kNoElement;
using mdnav::Span;

namespace
{

std::vector<Element> ofCategory(const std::vector<Element> &elements, Category category)
{
    std::vector<Element> result;
    for (const auto &element : elements)
    {
        if (element.category == category)
            result.push_back(element);
    }
    return result;
}

std::string textOf(const std::string &text, const Element &element)
{
    return text.substr(element.span.start, element.span.length());
}

} // namespace

TEST(ElementExtractor, HeadingEmphasisAndBold)
{
    const std::string text = "# Title\n\nSome *italic* and **bold** text.\n";
    auto elements = ElementExtractor().extract(text);

    auto headings = ofCategory(elements, Category::Heading);
    ASSERT_EQ(headings.size(), 1u);
    EXPECT_EQ(headings[0].level, 1);
    EXPECT_EQ(textOf(text, headings[0]), "# Title");

    auto emphasis = ofCategory(elements, Category::Emphasis);
    ASSERT_EQ(emphasis.size(), 1u);
    EXPECT_EQ(textOf(text, emphasis[0]), "*italic*");

    auto bold = ofCategory(elements, Category::Bold);
    ASSERT_EQ(bold.size(), 1u);
    EXPECT_EQ(textOf(text, bold[0]), "**bold**");

    EXPECT_EQ(elements.size(), 3u);
}

TEST(ElementExtractor, UnclosedFenceRunsToEndOfDocument)
{
    const std::string text = "```\ncode\nmore code";
    auto elements = ElementExtractor().extract(text);

    ASSERT_EQ(elements.size(), 1u);
    EXPECT_EQ(elements[0].category, Category::CodeBlock);
    EXPECT_EQ(elements[0].span, (Span{0, text.size()}));
    EXPECT_FALSE(elements[0].closed);
}

TEST(ElementExtractor, ClosedFenceKeepsLanguage)
{
    const std::string text = "intro\n```python\nprint(1)\n```\nafter";
    auto blocks = ofCategory(ElementExtractor().extract(text), Category::CodeBlock);
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(textOf(text, blocks[0]), "```python\nprint(1)\n```");
    EXPECT_EQ(blocks[0].info, "python");
    EXPECT_TRUE(blocks[0].closed);
}

TEST(ElementExtractor, CodeContentIsNotScanned)
{
    const std::string text = "```\n# heading\n**bold** [link](url)\n```";
    auto elements = ElementExtractor().extract(text);
    ASSERT_EQ(elements.size(), 1u);
    EXPECT_EQ(elements[0].category, Category::CodeBlock);
}

TEST(ElementExtractor, BoldInNestedItemBelongsToThatItem)
{
    const std::string text = "- outer\n  - inner **bold**\n";
    auto elements = ElementExtractor().extract(text);

    auto bold = ofCategory(elements, Category::Bold);
    ASSERT_EQ(bold.size(), 1u);
    ASSERT_TRUE(bold[0].hasParent());
    const Element &parent = elements[bold[0].parent];
    EXPECT_EQ(parent.category, Category::ListItem);
    EXPECT_EQ(textOf(text, parent), "- inner **bold**");
    EXPECT_EQ(parent.depth, 2);

    ASSERT_TRUE(parent.hasParent());
    EXPECT_EQ(elements[parent.parent].category, Category::List);
}

TEST(ElementExtractor, OnlyOutermostListIsAnElement)
{
    const std::string text = "1. one\n   - nested\n2. two\n\nparagraph";
    auto elements = ElementExtractor().extract(text);

    auto lists = ofCategory(elements, Category::List);
    ASSERT_EQ(lists.size(), 1u);
    EXPECT_EQ(textOf(text, lists[0]), "1. one\n   - nested\n2. two");
    EXPECT_TRUE(lists[0].ordered);
    EXPECT_EQ(lists[0].depth, 2);

    auto items = ofCategory(elements, Category::ListItem);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].depth, 1);
    EXPECT_EQ(items[1].depth, 2);
    EXPECT_EQ(items[2].depth, 1);
    EXPECT_EQ(textOf(text, items[0]), "1. one");
}

TEST(ElementExtractor, ContinuationLinesExtendTheItem)
{
    const std::string text = "- first line\n  wrapped line\n- second";
    auto items = ofCategory(ElementExtractor().extract(text), Category::ListItem);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(textOf(text, items[0]), "- first line\n  wrapped line");
}

TEST(ElementExtractor, BlankLineEndsList)
{
    const std::string text = "- a\n\n- b";
    auto lists = ofCategory(ElementExtractor().extract(text), Category::List);
    EXPECT_EQ(lists.size(), 2u);
}

TEST(ElementExtractor, TaskItemsProduceCheckboxes)
{
    const std::string text = "- [ ] todo\n- [x] done";
    auto elements = ElementExtractor().extract(text);
    auto boxes = ofCategory(elements, Category::Checkbox);
    ASSERT_EQ(boxes.size(), 2u);
    EXPECT_FALSE(boxes[0].checked);
    EXPECT_TRUE(boxes[1].checked);
    EXPECT_EQ(textOf(text, boxes[1]), "[x]");
    EXPECT_EQ(elements[boxes[0].parent].category, Category::ListItem);
}

TEST(ElementExtractor, BlockquoteRunIsOneElement)
{
    const std::string text = "> first\n> > nested *em*\n> last\n\n> again";
    auto elements = ElementExtractor().extract(text);
    auto quotes = ofCategory(elements, Category::Blockquote);
    ASSERT_EQ(quotes.size(), 2u);
    EXPECT_EQ(textOf(text, quotes[0]), "> first\n> > nested *em*\n> last");
    EXPECT_EQ(quotes[0].depth, 2);
    EXPECT_EQ(quotes[1].depth, 1);

    auto emphasis = ofCategory(elements, Category::Emphasis);
    ASSERT_EQ(emphasis.size(), 1u);
    EXPECT_EQ(elements[emphasis[0].parent].category, Category::Blockquote);
}

TEST(ElementExtractor, TableSpansHeaderThroughLastRow)
{
    const std::string text = "| A | B | C |\n|---|---|---|\n| 1 | 2 |\n| **x** | y | z |\nafter";
    auto elements = ElementExtractor().extract(text);
    auto tables = ofCategory(elements, Category::Table);
    ASSERT_EQ(tables.size(), 1u);
    EXPECT_EQ(textOf(text, tables[0]), "| A | B | C |\n|---|---|---|\n| 1 | 2 |\n| **x** | y | z |");
    EXPECT_EQ(tables[0].columnCount, 3u);

    auto bold = ofCategory(elements, Category::Bold);
    ASSERT_EQ(bold.size(), 1u);
    EXPECT_EQ(elements[bold[0].parent].category, Category::Table);
}

TEST(ElementExtractor, InlineElementsStayInsideTheirCell)
{
    const std::string text = "| *a | b* |\n|---|---|\n| `x | y` | *c* |\n";
    auto elements = ElementExtractor().extract(text);
    ASSERT_EQ(ofCategory(elements, Category::Table).size(), 1u);
    EXPECT_TRUE(ofCategory(elements, Category::InlineCode).empty());

    auto emphasis = ofCategory(elements, Category::Emphasis);
    ASSERT_EQ(emphasis.size(), 1u);
    EXPECT_EQ(textOf(text, emphasis[0]), "*c*");
    EXPECT_EQ(elements[emphasis[0].parent].category, Category::Table);
}

TEST(ElementExtractor, PipeLineWithoutSeparatorIsNoTable)
{
    auto elements = ElementExtractor().extract("a | b\nc | d");
    EXPECT_TRUE(ofCategory(elements, Category::Table).empty());
}

TEST(ElementExtractor, SeparatorsAndHeadingLevels)
{
    const std::string text = "## Two\n***\n###### Six";
    auto elements = ElementExtractor().extract(text);
    auto separators = ofCategory(elements, Category::Separator);
    ASSERT_EQ(separators.size(), 1u);
    EXPECT_EQ(textOf(text, separators[0]), "***");

    auto headings = ofCategory(elements, Category::Heading);
    ASSERT_EQ(headings.size(), 2u);
    EXPECT_EQ(headings[0].level, 2);
    EXPECT_EQ(headings[1].level, 6);
}

TEST(ElementExtractor, DisplayMathBlock)
{
    const std::string text = "$$\na + b\n$$\ntext";
    auto math = ofCategory(ElementExtractor().extract(text), Category::Math);
    ASSERT_EQ(math.size(), 1u);
    EXPECT_TRUE(math[0].display);
    EXPECT_TRUE(math[0].closed);
    EXPECT_EQ(textOf(text, math[0]), "$$\na + b\n$$");
}

TEST(ElementExtractor, ElementsAreOrderedWithPositionalIds)
{
    const std::string text = "- [ ] **a** and `b`\n\n# H\n> q [l](u)";
    auto elements = ElementExtractor().extract(text);
    ASSERT_FALSE(elements.empty());
    for (std::size_t i = 0; i < elements.size(); ++i)
    {
        EXPECT_EQ(elements[i].id, i);
        if (i > 0)
        {
            const Span &previous = elements[i - 1].span;
            const Span &current = elements[i].span;
            EXPECT_TRUE(previous.start < current.start ||
                        (previous.start == current.start && previous.end >= current.end));
        }
        if (elements[i].hasParent())
        {
            EXPECT_LT(elements[i].parent, elements[i].id);
            EXPECT_TRUE(elements[elements[i].parent].span.encloses(elements[i].span));
        }
    }
}

TEST(ElementExtractor, ListAndItemWithSameSpanNestInOrder)
{
    const std::string text = "- only";
    auto elements = ElementExtractor().extract(text);
    ASSERT_EQ(elements.size(), 2u);
    EXPECT_EQ(elements[0].category, Category::List);
    EXPECT_EQ(elements[1].category, Category::ListItem);
    EXPECT_EQ(elements[1].parent, elements[0].id);
    EXPECT_EQ(elements[0].parent, kNoElement);
}

TEST(ElementExtractor, ExtractionIsDeterministic)
{
    const std::string text = "# A\n- [x] *b* __c__\n| x | y |\n|---|---|\n| 1 | 2 |\n```\ncode\n```\n> [^1] $m$\n";
    ElementExtractor extractor;
    EXPECT_EQ(extractor.extract(text), extractor.extract(text));
}

TEST(ElementExtractor, SameCategoryNestingKeepsOuterElement)
{
    const std::string text = "*a *b* c*";
    auto emphasis = ofCategory(ElementExtractor().extract(text), Category::Emphasis);
    ASSERT_EQ(emphasis.size(), 1u);
}

TEST(ElementExtractor, FinalizeDropsEmptySpans)
{
    std::vector<Element> elements(2);
    elements[0].category = Category::Link;
    elements[0].span = Span{3, 3};
    elements[1].category = Category::Heading;
    elements[1].span = Span{0, 5};
    mdnav::finalizeElements(elements);
    ASSERT_EQ(elements.size(), 1u);
    EXPECT_EQ(elements[0].category, Category::Heading);
    EXPECT_EQ(elements[0].id, 0u);
}
