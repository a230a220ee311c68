#pragma once

#include "mdnav/element.hpp"
#include "mdnav/parse_options.hpp"
#include "mdnav/structural_index.hpp"
#include "mdnav/table_grid.hpp"
#include "mdnav/text_offsets.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace mdnav
{

enum class RequestKind
{
    CategoryJump,
    BlockBoundary,
    CellMove
};

struct NavigationRequest
{
    RequestKind kind = RequestKind::CategoryJump;
    std::vector<Category> categories;
    int level = 0; // heading level for a Heading jump, 0 for any level
    Direction direction = Direction::Next;
    Boundary boundary = Boundary::End;
    CellDirection cellDirection = CellDirection::Right;

    static NavigationRequest jump(Category category, Direction direction);
    static NavigationRequest jump(std::vector<Category> categories, Direction direction);
    static NavigationRequest heading(int level, Direction direction);
    static NavigationRequest blockBoundary(Boundary boundary);
    static NavigationRequest cell(CellDirection direction);

    bool operator==(const NavigationRequest &other) const = default;
};

enum class ErrorCode
{
    InvalidOffset,
    UnresolvableGrid,
    InvalidRequest
};

class NavigationError : public std::runtime_error
{
public:
    NavigationError(ErrorCode code, const std::string &message);

    ErrorCode code() const noexcept { return errorCode; }

private:
    ErrorCode errorCode;
};

struct NavigationResult
{
    std::optional<std::size_t> offset;
    std::optional<Element> element;
    std::optional<TableCell> cell;
    std::size_t line = 0;
    std::string label; // what was reached, or why nothing was

    bool found() const noexcept { return offset.has_value(); }
};

// One revision of a document: its text, index and lazily resolved table grids.
class IndexedDocument
{
public:
    IndexedDocument(std::string text, StructuralIndex index);

    std::uint64_t revision() const noexcept { return structuralIndex.revision(); }
    std::string_view text() const noexcept { return documentText; }
    const StructuralIndex &index() const noexcept { return structuralIndex; }
    const LineMap &lines() const noexcept { return lineMap; }

    // Resolved on first use and cached for the lifetime of the document.
    std::shared_ptr<const TableGrid> grid(const Element &table) const;

private:
    std::string documentText;
    StructuralIndex structuralIndex;
    LineMap lineMap;
    mutable std::mutex gridMutex;
    mutable std::unordered_map<ElementId, std::shared_ptr<const TableGrid>> grids;
};

// Single-slot document cache. Builds run outside the lock, so each miss takes a
// ticket and a finished build only lands if no later ticket has landed first.
class IndexCache
{
public:
    struct Lookup
    {
        std::shared_ptr<const IndexedDocument> document; // null on a miss
        std::uint64_t ticket = 0;
    };

    Lookup lookup(std::uint64_t revision);
    // Returns false when a newer request already filled the slot, or the cache was cleared meanwhile.
    bool store(std::uint64_t ticket, std::shared_ptr<const IndexedDocument> document);
    void clear();
    std::size_t rebuildCount() const;

private:
    mutable std::mutex mutex;
    std::shared_ptr<const IndexedDocument> cached;
    std::uint64_t issued = 0;
    std::uint64_t landed = 0;
    std::size_t rebuilds = 0;
};

// Answers navigation requests against a single cached index per document.
class Navigator
{
public:
    explicit Navigator(ParseOptions options = {});

    const ParseOptions &options() const noexcept { return parseOptions; }

    // Target offset, or nullopt when nothing qualifies. Throws NavigationError.
    std::optional<std::size_t> navigate(const DocumentSnapshot &snapshot, std::size_t cursor,
                                        const NavigationRequest &request);
    NavigationResult resolve(const DocumentSnapshot &snapshot, std::size_t cursor, const NavigationRequest &request);

    // Cached document for the snapshot's revision, rebuilt when the revision changes.
    std::shared_ptr<const IndexedDocument> index(const DocumentSnapshot &snapshot);
    void invalidate();
    std::size_t rebuildCount() const;

private:
    NavigationResult jump(const IndexedDocument &document, std::size_t cursor, const NavigationRequest &request) const;
    NavigationResult boundary(const IndexedDocument &document, std::size_t cursor,
                              const NavigationRequest &request) const;
    NavigationResult cellMove(const IndexedDocument &document, std::size_t cursor,
                              const NavigationRequest &request) const;

    ParseOptions parseOptions;
    IndexCache cache;
};

} // namespace mdnav
