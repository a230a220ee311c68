#include "mdnav/element_extractor.hpp"

#include "inline_scanner.hpp"
#include "mdnav/line_classifier.hpp"
#include "mdnav/table_grid.hpp"

#include <algorithm>
#include <optional>
#include <tuple>

namespace mdnav
{
namespace
{
Element blockElement(Category category, std::size_t start, std::size_t end)
{
    Element element;
    element.category = category;
    element.span = Span{start, end};
    return element;
}

class ExtractionPass
{
public:
    ExtractionPass(std::string_view text, const ParseOptions &options)
        : text(text),
          scanner(options)
    {
    }

    void feed(const ClassifiedLine &line);
    std::vector<Element> finish();

private:
    struct OpenList
    {
        Element list;
        std::optional<Element> item;
        std::vector<std::size_t> indents;
    };

    void scanInline(std::size_t from, std::size_t to) { scanner.scan(text, from, to, elements); }
    void closeList();
    void closeQuote();
    void closeTable();
    void closeAll();
    void addListItem(const ClassifiedLine &line);

    std::string_view text;
    detail::InlineScanner scanner;
    std::vector<Element> elements;

    std::optional<Element> fence;
    std::optional<Element> math;
    std::optional<Element> quote;
    std::optional<Element> table;
    std::optional<ClassifiedLine> pendingHeader;
    std::optional<OpenList> list;
};

void ExtractionPass::closeList()
{
    if (!list)
        return;
    if (list->item)
        elements.push_back(std::move(*list->item));
    elements.push_back(std::move(list->list));
    list.reset();
}

void ExtractionPass::closeQuote()
{
    if (!quote)
        return;
    elements.push_back(std::move(*quote));
    quote.reset();
}

void ExtractionPass::closeTable()
{
    if (!table)
        return;
    elements.push_back(std::move(*table));
    table.reset();
}

void ExtractionPass::closeAll()
{
    closeList();
    closeQuote();
    closeTable();
}

void ExtractionPass::addListItem(const ClassifiedLine &line)
{
    if (!list)
    {
        list.emplace();
        list->list = blockElement(Category::List, line.markerStart, line.contentEnd);
        list->list.ordered = line.ordered;
        list->list.depth = 1;
        list->indents.push_back(line.indent);
    }
    else
    {
        auto &indents = list->indents;
        while (indents.size() > 1 && line.indent < indents.back())
            indents.pop_back();
        if (line.indent > indents.back())
            indents.push_back(line.indent);
        else if (indents.size() == 1)
            indents.back() = line.indent;
        list->list.span.end = line.contentEnd;
        if (list->item)
            elements.push_back(std::move(*list->item));
    }

    Element item = blockElement(Category::ListItem, line.markerStart, line.contentEnd);
    item.ordered = line.ordered;
    item.depth = static_cast<int>(list->indents.size());
    list->list.depth = std::max(list->list.depth, item.depth);
    list->item = std::move(item);

    if (line.isTask)
    {
        Element checkbox = blockElement(Category::Checkbox, line.taskStart, line.taskStart + 3);
        checkbox.checked = line.taskChecked;
        elements.push_back(std::move(checkbox));
    }
    scanInline(line.contentStart, line.contentEnd);
}

void ExtractionPass::feed(const ClassifiedLine &line)
{
    if (line.kind != LineKind::TableSeparator && !(line.kind == LineKind::TableRow && line.isTableHeader))
        pendingHeader.reset();

    switch (line.kind)
    {
    case LineKind::Blank:
        closeAll();
        break;
    case LineKind::FenceOpen:
        closeAll();
        fence = blockElement(Category::CodeBlock, line.markerStart, line.contentEnd);
        fence->info = line.language;
        fence->closed = false;
        break;
    case LineKind::FencedCode:
        break;
    case LineKind::FenceClose:
        if (fence)
        {
            fence->span.end = line.contentEnd;
            fence->closed = true;
            elements.push_back(std::move(*fence));
            fence.reset();
        }
        break;
    case LineKind::MathOpen:
        closeAll();
        math = blockElement(Category::Math, line.markerStart, line.contentEnd);
        math->display = true;
        math->closed = false;
        break;
    case LineKind::MathContent:
        break;
    case LineKind::MathClose:
        if (math)
        {
            math->span.end = line.contentEnd;
            math->closed = true;
            elements.push_back(std::move(*math));
            math.reset();
        }
        break;
    case LineKind::Heading:
    {
        closeAll();
        Element heading = blockElement(Category::Heading, line.markerStart, line.contentEnd);
        heading.level = line.headingLevel;
        elements.push_back(std::move(heading));
        scanInline(line.contentStart, line.contentEnd);
        break;
    }
    case LineKind::HorizontalRule:
        closeAll();
        elements.push_back(blockElement(Category::Separator, line.markerStart, line.contentEnd));
        break;
    case LineKind::Blockquote:
        closeList();
        closeTable();
        if (!quote)
            quote = blockElement(Category::Blockquote, line.markerStart, line.contentEnd);
        quote->span.end = line.contentEnd;
        quote->depth = std::max(quote->depth, line.quoteDepth);
        scanInline(line.contentStart, line.contentEnd);
        break;
    case LineKind::TableRow:
        closeList();
        closeQuote();
        if (line.isTableHeader)
        {
            closeTable();
            pendingHeader = line;
        }
        else if (table)
        {
            table->span.end = line.contentEnd;
        }
        for (const CellRange &cell : splitPipeRow(text, line.contentStart, line.contentEnd))
            scanInline(cell.start, cell.end);
        break;
    case LineKind::TableSeparator:
        if (pendingHeader)
        {
            table = blockElement(Category::Table, pendingHeader->markerStart, line.contentEnd);
            table->columnCount =
                std::max<std::size_t>(splitPipeRow(text, pendingHeader->start, pendingHeader->end).size(), 1);
            pendingHeader.reset();
        }
        break;
    case LineKind::ListItem:
        closeQuote();
        closeTable();
        addListItem(line);
        break;
    case LineKind::Paragraph:
        if (list && line.indent > list->indents.front())
        {
            list->list.span.end = line.contentEnd;
            if (list->item)
                list->item->span.end = line.contentEnd;
        }
        else
        {
            closeAll();
        }
        scanInline(line.contentStart, line.contentEnd);
        break;
    }
}

std::vector<Element> ExtractionPass::finish()
{
    closeAll();
    if (fence)
    {
        fence->span.end = text.size();
        elements.push_back(std::move(*fence));
        fence.reset();
    }
    if (math)
    {
        math->span.end = text.size();
        elements.push_back(std::move(*math));
        math.reset();
    }
    finalizeElements(elements);
    return std::move(elements);
}

auto orderKey(const Element &element)
{
    return std::make_tuple(element.span.start, ~element.span.end, nestingRank(element.category),
                           categoryIndex(element.category));
}

} // namespace

ElementExtractor::ElementExtractor(ParseOptions options)
    : parseOptions(options)
{
}

std::vector<Element> ElementExtractor::extract(std::string_view text) const
{
    LineClassifier classifier(parseOptions);
    LineReader reader(text, classifier);
    ExtractionPass pass(text, parseOptions);
    ClassifiedLine line;
    while (reader.next(line))
        pass.feed(line);
    return pass.finish();
}

void finalizeElements(std::vector<Element> &elements)
{
    elements.erase(std::remove_if(elements.begin(), elements.end(),
                                  [](const Element &element) { return element.span.start >= element.span.end; }),
                   elements.end());

    std::stable_sort(elements.begin(), elements.end(), [](const Element &a, const Element &b) {
        return orderKey(a) < orderKey(b);
    });

    std::vector<bool> dropped(elements.size(), false);
    std::size_t lastEnd[kCategoryCount] = {};
    for (std::size_t i = 0; i < elements.size(); ++i)
    {
        std::size_t slot = categoryIndex(elements[i].category);
        if (elements[i].span.start < lastEnd[slot])
            dropped[i] = true;
        else
            lastEnd[slot] = elements[i].span.end;
    }

    std::vector<Element> kept;
    kept.reserve(elements.size());
    for (std::size_t i = 0; i < elements.size(); ++i)
    {
        if (!dropped[i])
            kept.push_back(std::move(elements[i]));
    }
    elements = std::move(kept);

    std::vector<std::size_t> open;
    for (std::size_t i = 0; i < elements.size(); ++i)
    {
        Element &element = elements[i];
        element.id = static_cast<ElementId>(i);
        while (!open.empty() && !elements[open.back()].span.encloses(element.span))
            open.pop_back();
        element.parent = open.empty() ? kNoElement : elements[open.back()].id;
        if (isBlock(element.category))
            open.push_back(i);
    }
}

} // namespace mdnav
