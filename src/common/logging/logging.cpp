#include "mdnav/logging.hpp"

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

#include <array>
#include <cctype>
#include <string>

namespace mdnav::logging
{
namespace
{
struct SeverityName
{
    plog::Severity severity;
    std::string_view name;
};

constexpr std::array<SeverityName, 7> kSeverityNames{{
    {plog::none, "none"},
    {plog::fatal, "fatal"},
    {plog::error, "error"},
    {plog::warning, "warning"},
    {plog::info, "info"},
    {plog::debug, "debug"},
    {plog::verbose, "verbose"},
}};

} // namespace

void init(plog::Severity severity)
{
    static plog::ConsoleAppender<plog::TxtFormatter> appender(plog::streamStdErr);
    if (auto *logger = plog::get())
    {
        logger->setMaxSeverity(severity);
        return;
    }
    plog::init(severity, &appender);
}

void initFromOptions(const config::OptionRegistry &registry)
{
    init(severityFromName(registry.getString(config::kLogLevel, "warning")));
}

plog::Severity severityFromName(std::string_view name, plog::Severity fallback)
{
    std::string lower;
    lower.reserve(name.size());
    for (char ch : name)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    if (lower == "warn")
        return plog::warning;
    for (const auto &entry : kSeverityNames)
    {
        if (entry.name == lower)
            return entry.severity;
    }
    return fallback;
}

std::string_view severityName(plog::Severity severity) noexcept
{
    for (const auto &entry : kSeverityNames)
    {
        if (entry.severity == severity)
            return entry.name;
    }
    return "none";
}

} // namespace mdnav::logging
