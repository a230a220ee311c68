#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace mdnav
{

// Line start offsets of a text. Breaks are "\n", "\r\n" and a lone "\r".
class LineMap
{
public:
    LineMap() = default;
    explicit LineMap(std::string_view text);

    std::size_t lineCount() const noexcept { return starts.size(); }
    std::size_t lineStart(std::size_t line) const noexcept;
    // End of the line, line break excluded.
    std::size_t lineEnd(std::size_t line) const noexcept;
    std::size_t lineOf(std::size_t offset) const noexcept;

private:
    std::vector<std::size_t> starts{0};
    std::vector<std::size_t> ends{0};
};

// Converts between UTF-8 byte offsets and UTF-16 code unit offsets.
class Utf16OffsetMap
{
public:
    explicit Utf16OffsetMap(std::string_view text);

    std::size_t byteLength() const noexcept { return bytes; }
    std::size_t utf16Length() const noexcept { return units; }

    // A byte offset inside a multi-byte sequence maps to the start of the sequence.
    std::size_t toUtf16(std::size_t byteOffset) const noexcept;
    // A unit offset inside a surrogate pair maps to the start of the code point.
    std::size_t fromUtf16(std::size_t unitOffset) const noexcept;

private:
    struct CodePoint
    {
        std::size_t byte;
        std::size_t unit;
    };

    std::vector<CodePoint> points;
    std::size_t bytes = 0;
    std::size_t units = 0;
};

} // namespace mdnav
