#include "mdnav/navigator.hpp"

#include "mdnav/describe.hpp"
#include "mdnav/element_extractor.hpp"

#include <plog/Log.h>

#include <chrono>
#include <sstream>

namespace mdnav
{
namespace
{
[[noreturn]] void fail(ErrorCode code, const std::string &message)
{
    PLOGW << message;
    throw NavigationError(code, message);
}

void validate(const NavigationRequest &request)
{
    if (request.kind != RequestKind::CategoryJump)
        return;
    if (request.categories.empty())
        fail(ErrorCode::InvalidRequest, "category jump without categories");
    if (request.level == 0)
        return;
    if (request.level < 1 || request.level > 6)
        fail(ErrorCode::InvalidRequest, "heading level must be between 1 and 6, got " + std::to_string(request.level));
    if (request.categories.size() != 1 || request.categories.front() != Category::Heading)
        fail(ErrorCode::InvalidRequest, "a level only applies to heading jumps");
}

} // namespace

NavigationRequest NavigationRequest::jump(Category category, Direction direction)
{
    return jump(std::vector<Category>{category}, direction);
}

NavigationRequest NavigationRequest::jump(std::vector<Category> categories, Direction direction)
{
    NavigationRequest request;
    request.kind = RequestKind::CategoryJump;
    request.categories = std::move(categories);
    request.direction = direction;
    return request;
}

NavigationRequest NavigationRequest::heading(int level, Direction direction)
{
    NavigationRequest request = jump(Category::Heading, direction);
    request.level = level;
    return request;
}

NavigationRequest NavigationRequest::blockBoundary(Boundary boundary)
{
    NavigationRequest request;
    request.kind = RequestKind::BlockBoundary;
    request.boundary = boundary;
    return request;
}

NavigationRequest NavigationRequest::cell(CellDirection direction)
{
    NavigationRequest request;
    request.kind = RequestKind::CellMove;
    request.cellDirection = direction;
    return request;
}

NavigationError::NavigationError(ErrorCode code, const std::string &message)
    : std::runtime_error(message),
      errorCode(code)
{
}

IndexedDocument::IndexedDocument(std::string text, StructuralIndex index)
    : documentText(std::move(text)),
      structuralIndex(std::move(index)),
      lineMap(documentText)
{
}

std::shared_ptr<const TableGrid> IndexedDocument::grid(const Element &table) const
{
    std::lock_guard<std::mutex> lock(gridMutex);
    auto it = grids.find(table.id);
    if (it != grids.end())
        return it->second;
    auto resolved = std::make_shared<const TableGrid>(resolveGrid(table, documentText));
    grids.emplace(table.id, resolved);
    return resolved;
}

IndexCache::Lookup IndexCache::lookup(std::uint64_t revision)
{
    std::lock_guard<std::mutex> lock(mutex);
    if (cached && cached->revision() == revision)
        return Lookup{cached, 0};
    return Lookup{nullptr, ++issued};
}

bool IndexCache::store(std::uint64_t ticket, std::shared_ptr<const IndexedDocument> document)
{
    std::lock_guard<std::mutex> lock(mutex);
    ++rebuilds;
    if (ticket <= landed)
        return false;
    cached = std::move(document);
    landed = ticket;
    return true;
}

void IndexCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex);
    cached.reset();
    landed = issued;
}

std::size_t IndexCache::rebuildCount() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return rebuilds;
}

Navigator::Navigator(ParseOptions options)
    : parseOptions(options)
{
}

std::shared_ptr<const IndexedDocument> Navigator::index(const DocumentSnapshot &snapshot)
{
    IndexCache::Lookup found = cache.lookup(snapshot.revision);
    if (found.document)
        return found.document;

    auto started = std::chrono::steady_clock::now();
    ElementExtractor extractor(parseOptions);
    std::vector<Element> elements = extractor.extract(snapshot.text);
    std::size_t count = elements.size();
    auto document = std::make_shared<const IndexedDocument>(
        std::string(snapshot.text), StructuralIndex::build(snapshot.revision, std::move(elements)));
    auto elapsed =
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
    PLOGD << "indexed revision " << snapshot.revision << ": " << count << " elements in " << elapsed.count() << " us";

    if (!cache.store(found.ticket, document))
        PLOGD << "revision " << snapshot.revision << " was superseded before it could be cached";
    return document;
}

void Navigator::invalidate()
{
    cache.clear();
}

std::size_t Navigator::rebuildCount() const
{
    return cache.rebuildCount();
}

std::optional<std::size_t> Navigator::navigate(const DocumentSnapshot &snapshot, std::size_t cursor,
                                               const NavigationRequest &request)
{
    return resolve(snapshot, cursor, request).offset;
}

NavigationResult Navigator::resolve(const DocumentSnapshot &snapshot, std::size_t cursor,
                                    const NavigationRequest &request)
{
    if (cursor > snapshot.text.size())
    {
        std::ostringstream message;
        message << "cursor offset " << cursor << " is outside the document (length " << snapshot.text.size() << ')';
        fail(ErrorCode::InvalidOffset, message.str());
    }
    validate(request);

    std::shared_ptr<const IndexedDocument> document = index(snapshot);
    switch (request.kind)
    {
    case RequestKind::BlockBoundary:
        return boundary(*document, cursor, request);
    case RequestKind::CellMove:
        return cellMove(*document, cursor, request);
    case RequestKind::CategoryJump:
        break;
    }
    return jump(*document, cursor, request);
}

NavigationResult Navigator::jump(const IndexedDocument &document, std::size_t cursor,
                                 const NavigationRequest &request) const
{
    const StructuralIndex &structure = document.index();
    const Element *target = request.level > 0 ? structure.findHeading(request.level, cursor, request.direction)
                                              : structure.findAny(request.categories, cursor, request.direction);
    NavigationResult result;
    if (!target)
    {
        result.label = noMatchMessage(request);
        return result;
    }
    result.offset = target->span.start;
    result.element = *target;
    result.line = document.lines().lineOf(target->span.start);
    result.label = describeElement(*target, document.text());
    return result;
}

NavigationResult Navigator::boundary(const IndexedDocument &document, std::size_t cursor,
                                     const NavigationRequest &request) const
{
    NavigationResult result;
    const Element *block = document.index().innermostBlock(cursor);
    if (!block)
    {
        result.label = noMatchMessage(request);
        return result;
    }
    std::size_t target = request.boundary == Boundary::End ? block->span.end : block->span.start;
    result.offset = target;
    result.element = *block;
    result.line = document.lines().lineOf(target);
    result.label = (request.boundary == Boundary::End ? "end of " : "start of ") +
                   std::string(categoryName(block->category));
    return result;
}

NavigationResult Navigator::cellMove(const IndexedDocument &document, std::size_t cursor,
                                     const NavigationRequest &request) const
{
    const Element *table = document.index().enclosing(Category::Table, cursor);
    if (!table)
        fail(ErrorCode::UnresolvableGrid, "Not inside a table");

    std::shared_ptr<const TableGrid> grid = document.grid(*table);
    std::optional<CellPosition> position = grid->locate(cursor);
    if (!position)
        fail(ErrorCode::UnresolvableGrid, "no table cell at offset " + std::to_string(cursor));

    NavigationResult result;
    result.element = *table;
    std::optional<CellPosition> target = grid->move(*position, request.cellDirection);
    if (!target)
    {
        result.label = noMatchMessage(request);
        return result;
    }
    const TableCell &cell = grid->cell(*target);
    result.offset = cell.target();
    result.cell = cell;
    result.line = document.lines().lineOf(cell.target());
    result.label = describeElement(*table, document.text()) + ", " + describeCell(cell);
    return result;
}

} // namespace mdnav
