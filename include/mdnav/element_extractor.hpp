#pragma once

#include "mdnav/element.hpp"
#include "mdnav/parse_options.hpp"

#include <string_view>
#include <vector>

namespace mdnav
{

// Turns document text into the flat, ordered element list the index is built from.
class ElementExtractor
{
public:
    explicit ElementExtractor(ParseOptions options = {});

    const ParseOptions &options() const noexcept { return parseOptions; }

    // Elements come back ordered by (start ascending, end descending, nesting rank),
    // with ids equal to their position and parents resolved.
    std::vector<Element> extract(std::string_view text) const;

private:
    ParseOptions parseOptions;
};

// Drops empty spans and nested same-category elements, then orders the list
// and assigns ids and parent links.
void finalizeElements(std::vector<Element> &elements);

} // namespace mdnav
