#pragma once

namespace mdnav
{

struct ParseOptions
{
    bool tildeFences = true;
    bool mathDelimiters = true;
    bool underscoreEmphasis = true;
    bool tableRequiresLeadingPipe = false;

    bool operator==(const ParseOptions &other) const noexcept = default;
};

} // namespace mdnav
