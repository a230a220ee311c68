#pragma once

#include "mdnav/element.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace mdnav
{

enum class Direction
{
    Next,
    Previous
};

enum class Boundary
{
    Start,
    End
};

// Per-category, start-ordered element sequences answering nearest-neighbor queries.
class StructuralIndex
{
public:
    StructuralIndex() = default;

    // Elements must carry ids equal to their position, as ElementExtractor produces them.
    static StructuralIndex build(std::uint64_t revision, std::vector<Element> elements);

    std::uint64_t revision() const noexcept { return documentRevision; }
    std::size_t size() const noexcept { return elements.size(); }
    const std::vector<Element> &all() const noexcept { return elements; }
    const Element *element(ElementId id) const noexcept;
    const Element *parentOf(const Element &element) const noexcept;

    // Ids of one category, strictly increasing by start and never overlapping.
    const std::vector<ElementId> &partition(Category category) const noexcept;

    // Next: first start > from. Previous: last start < from. nullptr when nothing qualifies.
    const Element *find(Category category, std::size_t from, Direction direction) const noexcept;
    const Element *findHeading(int level, std::size_t from, Direction direction) const noexcept;
    const Element *findAny(std::span<const Category> categories, std::size_t from,
                           Direction direction) const noexcept;

    // Deepest block with start <= offset <= end.
    const Element *innermostBlock(std::size_t offset) const noexcept;
    // Nearest enclosing element of the given category, starting from the innermost block.
    const Element *enclosing(Category category, std::size_t offset) const noexcept;

private:
    const Element *search(const std::vector<ElementId> &ids, std::size_t from, Direction direction) const noexcept;

    std::uint64_t documentRevision = 0;
    std::vector<Element> elements;
    std::array<std::vector<ElementId>, kCategoryCount> byCategory;
    std::array<std::vector<ElementId>, 6> headingsByLevel;
    std::vector<ElementId> blocks;
};

} // namespace mdnav
