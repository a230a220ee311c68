#include "mdnav/options.hpp"

namespace mdnav::config
{

void registerEngineOptions(OptionRegistry &registry)
{
    const ParseOptions defaults;
    registry.registerOption({kTildeFences, OptionKind::Boolean, defaults.tildeFences,
                             "Treat ~~~ lines as code fences"});
    registry.registerOption({kMathDelimiters, OptionKind::Boolean, defaults.mathDelimiters,
                             "Recognize $...$ and $$...$$ math"});
    registry.registerOption({kUnderscoreEmphasis, OptionKind::Boolean, defaults.underscoreEmphasis,
                             "Recognize _ and __ as emphasis and bold"});
    registry.registerOption({kTableRequiresLeadingPipe, OptionKind::Boolean, defaults.tableRequiresLeadingPipe,
                             "Only lines starting with | can be table rows"});
    registry.registerOption({kLogLevel, OptionKind::String, OptionValue("warning"),
                             "Diagnostic log level (none, fatal, error, warning, info, debug, verbose)"});
}

ParseOptions parseOptionsFrom(const OptionRegistry &registry)
{
    const ParseOptions defaults;
    ParseOptions options;
    options.tildeFences = registry.getBool(kTildeFences, defaults.tildeFences);
    options.mathDelimiters = registry.getBool(kMathDelimiters, defaults.mathDelimiters);
    options.underscoreEmphasis = registry.getBool(kUnderscoreEmphasis, defaults.underscoreEmphasis);
    options.tableRequiresLeadingPipe = registry.getBool(kTableRequiresLeadingPipe, defaults.tableRequiresLeadingPipe);
    return options;
}

void storeParseOptions(OptionRegistry &registry, const ParseOptions &options)
{
    registry.set(kTildeFences, options.tildeFences);
    registry.set(kMathDelimiters, options.mathDelimiters);
    registry.set(kUnderscoreEmphasis, options.underscoreEmphasis);
    registry.set(kTableRequiresLeadingPipe, options.tableRequiresLeadingPipe);
}

} // namespace mdnav::config
