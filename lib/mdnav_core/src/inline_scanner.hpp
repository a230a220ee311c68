#pragma once

#include "mdnav/element.hpp"
#include "mdnav/parse_options.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace mdnav::detail
{

// Finds inline elements inside one line of text. Offsets are absolute.
class InlineScanner
{
public:
    explicit InlineScanner(ParseOptions options);

    void scan(std::string_view text, std::size_t from, std::size_t to, std::vector<Element> &out);

private:
    struct Delimiter
    {
        char ch;
        std::size_t position;
        std::size_t count;
    };

    bool isProtected(std::size_t offset) const noexcept { return mask[offset - base] != 0; }
    bool isEscaped(std::size_t offset) const noexcept { return escaped[offset - base] != 0; }
    void protect(std::size_t start, std::size_t end) noexcept;
    char at(std::size_t offset) const noexcept;

    void markEscapes();
    void scanCodeSpans(std::vector<Element> &out);
    void scanMath(std::vector<Element> &out);
    void scanBrackets(std::vector<Element> &out);
    void scanDelimiterRuns(std::vector<Element> &out);

    // Pairs every bracket and parenthesis on the line in one pass.
    void pairBrackets();
    std::size_t matchBracket(std::size_t open) const noexcept;
    std::size_t matchParen(std::size_t open) const noexcept;

    ParseOptions options;
    std::string_view line;
    std::size_t base = 0;
    std::size_t limit = 0;
    std::vector<unsigned char> mask;
    std::vector<unsigned char> escaped;
    std::vector<std::size_t> bracketPartner;
    std::vector<std::size_t> parenPartner;
};

} // namespace mdnav::detail
