#include "mdnav/options.hpp"

#include <plog/Log.h>

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <nlohmann/json.hpp>

namespace mdnav::config
{
namespace
{
std::optional<bool> parseBool(const std::string &value)
{
    std::string lower;
    lower.reserve(value.size());
    for (char ch : value)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on")
        return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off")
        return false;
    return std::nullopt;
}

OptionValue fromJson(const OptionDefinition &definition, const nlohmann::json &jsonValue)
{
    if (definition.kind == OptionKind::Boolean)
    {
        if (jsonValue.is_boolean())
            return OptionValue(jsonValue.get<bool>());
        if (jsonValue.is_number_integer())
            return OptionValue(jsonValue.get<std::int64_t>() != 0);
        if (jsonValue.is_string())
            return OptionValue(jsonValue.get<std::string>());
        return definition.defaultValue;
    }
    if (jsonValue.is_string())
        return OptionValue(jsonValue.get<std::string>());
    if (jsonValue.is_boolean())
        return OptionValue(jsonValue.get<bool>());
    return definition.defaultValue;
}

std::filesystem::path pathFromEnvironment(const char *name)
{
    if (const char *value = std::getenv(name))
    {
        if (value[0] != '\0')
            return std::filesystem::path(value);
    }
    return {};
}

} // namespace

OptionValue::OptionValue(bool value)
    : value(value)
{
}

OptionValue::OptionValue(std::string value)
    : value(std::move(value))
{
}

OptionValue::OptionValue(const char *value)
    : value(std::string(value ? value : ""))
{
}

bool OptionValue::isNull() const noexcept
{
    return std::holds_alternative<std::monostate>(value);
}

bool OptionValue::isBool() const noexcept
{
    return std::holds_alternative<bool>(value);
}

bool OptionValue::toBool(bool fallback) const noexcept
{
    if (auto *flag = std::get_if<bool>(&value))
        return *flag;
    if (auto *text = std::get_if<std::string>(&value))
        return parseBool(*text).value_or(fallback);
    return fallback;
}

std::string OptionValue::toString(const std::string &fallback) const
{
    if (auto *text = std::get_if<std::string>(&value))
        return *text;
    if (auto *flag = std::get_if<bool>(&value))
        return *flag ? "true" : "false";
    return fallback;
}

void OptionRegistry::registerOption(const OptionDefinition &definition)
{
    definitions[definition.key] = definition;
    auto it = overrides.find(definition.key);
    if (it != overrides.end())
        it->second = normalize(definition, it->second);
}

bool OptionRegistry::hasOption(const std::string &key) const noexcept
{
    return definitions.find(key) != definitions.end();
}

const OptionDefinition *OptionRegistry::definition(const std::string &key) const
{
    auto it = definitions.find(key);
    if (it == definitions.end())
        return nullptr;
    return &it->second;
}

std::vector<std::string> OptionRegistry::keys() const
{
    std::vector<std::string> result;
    result.reserve(definitions.size());
    for (const auto &entry : definitions)
        result.push_back(entry.first);
    return result;
}

bool OptionRegistry::set(const std::string &key, const OptionValue &value)
{
    const OptionDefinition *declared = definition(key);
    if (!declared)
        return false;
    overrides[key] = normalize(*declared, value);
    return true;
}

void OptionRegistry::reset(const std::string &key)
{
    overrides.erase(key);
}

void OptionRegistry::resetToDefaults() noexcept
{
    overrides.clear();
}

OptionValue OptionRegistry::get(const std::string &key) const
{
    auto it = overrides.find(key);
    if (it != overrides.end())
        return it->second;
    if (const OptionDefinition *declared = definition(key))
        return declared->defaultValue;
    return OptionValue();
}

bool OptionRegistry::getBool(const std::string &key, bool fallback) const
{
    return get(key).toBool(fallback);
}

std::string OptionRegistry::getString(const std::string &key, const std::string &fallback) const
{
    return get(key).toString(fallback);
}

bool OptionRegistry::loadFromFile(const std::filesystem::path &filePath)
{
    std::ifstream in(filePath);
    if (!in)
        return false;

    nlohmann::json data;
    try
    {
        in >> data;
    }
    catch (const nlohmann::json::exception &error)
    {
        PLOGW << "ignoring unreadable options file " << filePath.string() << ": " << error.what();
        return false;
    }
    if (!data.is_object())
    {
        PLOGW << "ignoring options file " << filePath.string() << ": top level is not an object";
        return false;
    }

    for (auto it = data.begin(); it != data.end(); ++it)
    {
        const OptionDefinition *declared = definition(it.key());
        if (!declared)
            continue;
        overrides[it.key()] = normalize(*declared, fromJson(*declared, it.value()));
    }
    return true;
}

bool OptionRegistry::saveToFile(const std::filesystem::path &filePath) const
{
    nlohmann::json data = nlohmann::json::object();
    for (const auto &[key, declared] : definitions)
    {
        OptionValue current = get(key);
        if (current.isNull())
            data[key] = nullptr;
        else if (declared.kind == OptionKind::Boolean)
            data[key] = current.toBool();
        else
            data[key] = current.toString();
    }

    std::error_code ec;
    if (filePath.has_parent_path())
        std::filesystem::create_directories(filePath.parent_path(), ec);

    std::ofstream out(filePath);
    if (!out)
        return false;
    out << data.dump(2) << std::endl;
    return static_cast<bool>(out);
}

bool OptionRegistry::loadDefaults()
{
    std::filesystem::path path = defaultOptionsPath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return false;
    return loadFromFile(path);
}

bool OptionRegistry::saveDefaults() const
{
    return saveToFile(defaultOptionsPath());
}

std::filesystem::path OptionRegistry::configRoot()
{
    std::filesystem::path xdg = pathFromEnvironment("XDG_CONFIG_HOME");
    if (!xdg.empty())
        return xdg / "mdnav";
    std::filesystem::path home = pathFromEnvironment("HOME");
    if (!home.empty())
        return home / ".config" / "mdnav";
    return std::filesystem::path(".config") / "mdnav";
}

std::filesystem::path OptionRegistry::defaultOptionsPath()
{
    std::filesystem::path overridePath = pathFromEnvironment("MDNAV_OPTIONS_CONFIG");
    if (!overridePath.empty())
        return overridePath;
    return configRoot() / "options.json";
}

OptionValue OptionRegistry::normalize(const OptionDefinition &definition, const OptionValue &value) const
{
    if (definition.kind == OptionKind::Boolean)
        return OptionValue(value.toBool(definition.defaultValue.toBool()));
    return OptionValue(value.toString(definition.defaultValue.toString()));
}

} // namespace mdnav::config
