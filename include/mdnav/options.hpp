#pragma once

#include "mdnav/parse_options.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace mdnav::config
{

enum class OptionKind
{
    Boolean,
    String
};

class OptionValue
{
public:
    OptionValue() = default;
    OptionValue(bool value);
    OptionValue(std::string value);
    OptionValue(const char *value);

    bool isNull() const noexcept;
    bool isBool() const noexcept;
    bool toBool(bool fallback = false) const noexcept;
    std::string toString(const std::string &fallback = std::string()) const;

    bool operator==(const OptionValue &other) const = default;

private:
    std::variant<std::monostate, bool, std::string> value;
};

struct OptionDefinition
{
    std::string key;
    OptionKind kind = OptionKind::String;
    OptionValue defaultValue;
    std::string description;
};

class OptionRegistry
{
public:
    void registerOption(const OptionDefinition &definition);
    bool hasOption(const std::string &key) const noexcept;
    const OptionDefinition *definition(const std::string &key) const;
    std::vector<std::string> keys() const;

    // Unknown keys are rejected. Values are normalized to the declared kind.
    bool set(const std::string &key, const OptionValue &value);
    void reset(const std::string &key);
    void resetToDefaults() noexcept;

    OptionValue get(const std::string &key) const;
    bool getBool(const std::string &key, bool fallback = false) const;
    std::string getString(const std::string &key, const std::string &fallback = std::string()) const;

    bool loadFromFile(const std::filesystem::path &filePath);
    bool saveToFile(const std::filesystem::path &filePath) const;
    bool loadDefaults();
    bool saveDefaults() const;

    // $XDG_CONFIG_HOME/mdnav, falling back to $HOME/.config/mdnav.
    static std::filesystem::path configRoot();
    // MDNAV_OPTIONS_CONFIG when set, otherwise configRoot()/options.json.
    static std::filesystem::path defaultOptionsPath();

private:
    OptionValue normalize(const OptionDefinition &definition, const OptionValue &value) const;

    std::map<std::string, OptionDefinition> definitions;
    std::unordered_map<std::string, OptionValue> overrides;
};

inline constexpr const char *kTildeFences = "tildeFences";
inline constexpr const char *kMathDelimiters = "mathDelimiters";
inline constexpr const char *kUnderscoreEmphasis = "underscoreEmphasis";
inline constexpr const char *kTableRequiresLeadingPipe = "tableRequiresLeadingPipe";
inline constexpr const char *kLogLevel = "logLevel";

// Declares the engine's options with their defaults.
void registerEngineOptions(OptionRegistry &registry);
ParseOptions parseOptionsFrom(const OptionRegistry &registry);
void storeParseOptions(OptionRegistry &registry, const ParseOptions &options);

} // namespace mdnav::config
