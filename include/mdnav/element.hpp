#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace mdnav
{

enum class Category
{
    Heading,
    Table,
    List,
    ListItem,
    Blockquote,
    CodeBlock,
    InlineCode,
    Separator,
    Checkbox,
    Link,
    Image,
    Bold,
    Emphasis,
    Strikethrough,
    Footnote,
    Math
};

inline constexpr std::size_t kCategoryCount = 16;

using ElementId = std::uint32_t;
inline constexpr ElementId kNoElement = std::numeric_limits<ElementId>::max();

// Half-open range of byte offsets into the document text.
struct Span
{
    std::size_t start = 0;
    std::size_t end = 0;

    std::size_t length() const noexcept { return end - start; }
    bool contains(std::size_t offset) const noexcept { return start <= offset && offset < end; }
    bool encloses(const Span &other) const noexcept { return start <= other.start && other.end <= end; }
    bool overlaps(const Span &other) const noexcept { return start < other.end && other.start < end; }
    bool operator==(const Span &other) const noexcept = default;
};

struct Element
{
    ElementId id = kNoElement;
    Category category = Category::Heading;
    Span span;
    int level = 0;
    ElementId parent = kNoElement;

    // Category specific fields. Unused ones keep their defaults.
    bool checked = false;        // Checkbox
    std::size_t columnCount = 0; // Table
    int depth = 0;               // List, ListItem, Blockquote
    bool ordered = false;        // List, ListItem
    bool definition = false;     // Footnote
    bool display = false;        // Math
    bool closed = true;          // CodeBlock, display Math
    std::string info;            // CodeBlock language, Link/Image url, Footnote label

    bool hasParent() const noexcept { return parent != kNoElement; }
    bool operator==(const Element &other) const = default;
};

struct DocumentSnapshot
{
    std::string_view text;
    std::uint64_t revision = 0;
};

constexpr std::size_t categoryIndex(Category category) noexcept
{
    return static_cast<std::size_t>(category);
}

bool isBlock(Category category) noexcept;

// Orders blocks sharing a span: List before ListItem before Checkbox.
int nestingRank(Category category) noexcept;

std::string_view categoryName(Category category) noexcept;
std::optional<Category> parseCategory(std::string_view name) noexcept;

} // namespace mdnav
