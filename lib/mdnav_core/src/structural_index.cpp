#include "mdnav/structural_index.hpp"

#include <algorithm>

namespace mdnav
{
namespace
{
const std::vector<ElementId> kEmptyPartition;
}

StructuralIndex StructuralIndex::build(std::uint64_t revision, std::vector<Element> elements)
{
    StructuralIndex index;
    index.documentRevision = revision;
    index.elements = std::move(elements);

    const auto &stored = index.elements;
    auto byStart = [&stored](ElementId a, ElementId b) { return stored[a].span.start < stored[b].span.start; };

    for (const auto &element : stored)
    {
        if (element.id >= stored.size())
            continue;
        index.byCategory[categoryIndex(element.category)].push_back(element.id);
        if (isBlock(element.category))
            index.blocks.push_back(element.id);
    }

    for (auto &ids : index.byCategory)
    {
        std::stable_sort(ids.begin(), ids.end(), byStart);
        std::vector<ElementId> kept;
        kept.reserve(ids.size());
        for (ElementId id : ids)
        {
            if (!kept.empty() && stored[id].span.start < stored[kept.back()].span.end)
                continue;
            kept.push_back(id);
        }
        ids = std::move(kept);
    }
    std::stable_sort(index.blocks.begin(), index.blocks.end(), byStart);

    for (ElementId id : index.byCategory[categoryIndex(Category::Heading)])
    {
        int level = stored[id].level;
        if (level >= 1 && level <= 6)
            index.headingsByLevel[static_cast<std::size_t>(level - 1)].push_back(id);
    }
    return index;
}

const Element *StructuralIndex::element(ElementId id) const noexcept
{
    if (id >= elements.size())
        return nullptr;
    return &elements[id];
}

const Element *StructuralIndex::parentOf(const Element &child) const noexcept
{
    return element(child.parent);
}

const std::vector<ElementId> &StructuralIndex::partition(Category category) const noexcept
{
    std::size_t slot = categoryIndex(category);
    if (slot >= byCategory.size())
        return kEmptyPartition;
    return byCategory[slot];
}

const Element *StructuralIndex::search(const std::vector<ElementId> &ids, std::size_t from,
                                       Direction direction) const noexcept
{
    if (direction == Direction::Next)
    {
        auto it = std::upper_bound(ids.begin(), ids.end(), from,
                                   [this](std::size_t offset, ElementId id) { return offset < elements[id].span.start; });
        return it == ids.end() ? nullptr : &elements[*it];
    }
    auto it = std::lower_bound(ids.begin(), ids.end(), from,
                               [this](ElementId id, std::size_t offset) { return elements[id].span.start < offset; });
    return it == ids.begin() ? nullptr : &elements[*(it - 1)];
}

const Element *StructuralIndex::find(Category category, std::size_t from, Direction direction) const noexcept
{
    return search(partition(category), from, direction);
}

const Element *StructuralIndex::findHeading(int level, std::size_t from, Direction direction) const noexcept
{
    if (level < 1 || level > 6)
        return nullptr;
    return search(headingsByLevel[static_cast<std::size_t>(level - 1)], from, direction);
}

const Element *StructuralIndex::findAny(std::span<const Category> categories, std::size_t from,
                                        Direction direction) const noexcept
{
    const Element *best = nullptr;
    for (Category category : categories)
    {
        const Element *candidate = find(category, from, direction);
        if (!candidate)
            continue;
        if (!best)
        {
            best = candidate;
            continue;
        }
        bool better = direction == Direction::Next ? candidate->span.start < best->span.start
                                                   : candidate->span.start > best->span.start;
        if (better || (candidate->span.start == best->span.start && candidate->id < best->id))
            best = candidate;
    }
    return best;
}

const Element *StructuralIndex::innermostBlock(std::size_t offset) const noexcept
{
    auto it = std::upper_bound(blocks.begin(), blocks.end(), offset,
                               [this](std::size_t value, ElementId id) { return value < elements[id].span.start; });
    if (it == blocks.begin())
        return nullptr;

    const Element *candidate = &elements[*(it - 1)];
    while (candidate)
    {
        if (candidate->span.start <= offset && offset <= candidate->span.end)
            return candidate;
        candidate = parentOf(*candidate);
    }
    return nullptr;
}

const Element *StructuralIndex::enclosing(Category category, std::size_t offset) const noexcept
{
    const Element *candidate = innermostBlock(offset);
    while (candidate && candidate->category != category)
        candidate = parentOf(*candidate);
    return candidate;
}

} // namespace mdnav
