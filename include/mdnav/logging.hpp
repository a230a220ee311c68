#pragma once

#include "mdnav/options.hpp"

#include <plog/Severity.h>

#include <string_view>

namespace mdnav::logging
{

// Sends engine diagnostics to stderr. Calling it again only changes the severity.
void init(plog::Severity severity);
void initFromOptions(const config::OptionRegistry &registry);

// Accepts "none", "fatal", "error", "warning", "info", "debug" and "verbose", in any case.
plog::Severity severityFromName(std::string_view name, plog::Severity fallback = plog::warning);
std::string_view severityName(plog::Severity severity) noexcept;

} // namespace mdnav::logging
