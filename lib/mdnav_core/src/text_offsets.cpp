#include "mdnav/text_offsets.hpp"

#include "mdnav/line_classifier.hpp"

#include <algorithm>

namespace mdnav
{
namespace
{
// Length of the well-formed UTF-8 sequence at pos, or 0 if the bytes there are invalid.
std::size_t sequenceLength(std::string_view text, std::size_t pos) noexcept
{
    auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t length = 0;
    if (lead < 0x80)
        return 1;
    if ((lead & 0xE0) == 0xC0 && lead >= 0xC2)
        length = 2;
    else if ((lead & 0xF0) == 0xE0)
        length = 3;
    else if ((lead & 0xF8) == 0xF0 && lead <= 0xF4)
        length = 4;
    else
        return 0;

    if (pos + length > text.size())
        return 0;
    for (std::size_t i = 1; i < length; ++i)
    {
        if ((static_cast<unsigned char>(text[pos + i]) & 0xC0) != 0x80)
            return 0;
    }
    return length;
}

} // namespace

LineMap::LineMap(std::string_view text)
{
    starts.clear();
    ends.clear();
    std::size_t start = 0;
    while (true)
    {
        std::size_t next = 0;
        std::size_t end = findLineEnd(text, start, next);
        starts.push_back(start);
        ends.push_back(end);
        if (next == end)
            break;
        start = next;
    }
}

std::size_t LineMap::lineStart(std::size_t line) const noexcept
{
    if (line >= starts.size())
        return ends.back();
    return starts[line];
}

std::size_t LineMap::lineEnd(std::size_t line) const noexcept
{
    if (line >= ends.size())
        return ends.back();
    return ends[line];
}

std::size_t LineMap::lineOf(std::size_t offset) const noexcept
{
    auto it = std::upper_bound(starts.begin(), starts.end(), offset);
    return static_cast<std::size_t>(it - starts.begin()) - 1;
}

Utf16OffsetMap::Utf16OffsetMap(std::string_view text)
    : bytes(text.size())
{
    points.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size())
    {
        points.push_back(CodePoint{pos, units});
        std::size_t length = sequenceLength(text, pos);
        if (length == 0)
        {
            ++pos;
            ++units;
            continue;
        }
        units += length == 4 ? 2 : 1;
        pos += length;
    }
}

std::size_t Utf16OffsetMap::toUtf16(std::size_t byteOffset) const noexcept
{
    if (byteOffset >= bytes)
        return units;
    auto it = std::upper_bound(points.begin(), points.end(), byteOffset,
                               [](std::size_t value, const CodePoint &point) { return value < point.byte; });
    return (it - 1)->unit;
}

std::size_t Utf16OffsetMap::fromUtf16(std::size_t unitOffset) const noexcept
{
    if (unitOffset >= units)
        return bytes;
    auto it = std::upper_bound(points.begin(), points.end(), unitOffset,
                               [](std::size_t value, const CodePoint &point) { return value < point.unit; });
    return (it - 1)->byte;
}

} // namespace mdnav
