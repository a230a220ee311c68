#include "mdnav/key_table.hpp"

#include "mdnav/options.hpp"

#include <plog/Log.h>

#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <vector>

namespace
{

std::string directionName(mdnav::Direction direction)
{
    return direction == mdnav::Direction::Next ? "next" : "previous";
}

mdnav::Direction parseDirection(const std::string &name)
{
    if (name == "next")
        return mdnav::Direction::Next;
    if (name == "previous")
        return mdnav::Direction::Previous;
    throw std::invalid_argument("unknown direction '" + name + "'");
}

std::string boundaryName(mdnav::Boundary boundary)
{
    return boundary == mdnav::Boundary::Start ? "start" : "end";
}

mdnav::Boundary parseBoundary(const std::string &name)
{
    if (name == "start")
        return mdnav::Boundary::Start;
    if (name == "end")
        return mdnav::Boundary::End;
    throw std::invalid_argument("unknown block boundary '" + name + "'");
}

constexpr std::array<std::pair<mdnav::CellDirection, const char *>, 4> kCellDirections{{
    {mdnav::CellDirection::Left, "left"},
    {mdnav::CellDirection::Right, "right"},
    {mdnav::CellDirection::Up, "up"},
    {mdnav::CellDirection::Down, "down"},
}};

std::string cellDirectionName(mdnav::CellDirection direction)
{
    for (const auto &[value, name] : kCellDirections)
    {
        if (value == direction)
            return name;
    }
    return "right";
}

mdnav::CellDirection parseCellDirection(const std::string &name)
{
    for (const auto &[value, label] : kCellDirections)
    {
        if (name == label)
            return value;
    }
    throw std::invalid_argument("unknown cell direction '" + name + "'");
}

} // namespace

namespace nlohmann
{
template <>
struct adl_serializer<mdnav::NavigationRequest>
{
    static void to_json(json &j, const mdnav::NavigationRequest &request)
    {
        switch (request.kind)
        {
        case mdnav::RequestKind::CategoryJump:
        {
            json categories = json::array();
            for (mdnav::Category category : request.categories)
                categories.push_back(std::string(mdnav::categoryName(category)));
            j = json{{"kind", "jump"}, {"categories", categories}, {"direction", directionName(request.direction)}};
            if (request.level > 0)
                j["level"] = request.level;
            break;
        }
        case mdnav::RequestKind::BlockBoundary:
            j = json{{"kind", "blockBoundary"}, {"boundary", boundaryName(request.boundary)}};
            break;
        case mdnav::RequestKind::CellMove:
            j = json{{"kind", "cellMove"}, {"direction", cellDirectionName(request.cellDirection)}};
            break;
        }
    }

    static void from_json(const json &j, mdnav::NavigationRequest &request)
    {
        const std::string kind = j.at("kind").get<std::string>();
        if (kind == "jump")
        {
            std::vector<mdnav::Category> categories;
            for (const auto &name : j.at("categories"))
            {
                auto category = mdnav::parseCategory(name.get<std::string>());
                if (!category)
                    throw std::invalid_argument("unknown category '" + name.get<std::string>() + "'");
                categories.push_back(*category);
            }
            request = mdnav::NavigationRequest::jump(std::move(categories),
                                                     parseDirection(j.at("direction").get<std::string>()));
            request.level = j.value("level", 0);
        }
        else if (kind == "blockBoundary")
        {
            request = mdnav::NavigationRequest::blockBoundary(parseBoundary(j.at("boundary").get<std::string>()));
        }
        else if (kind == "cellMove")
        {
            request = mdnav::NavigationRequest::cell(parseCellDirection(j.at("direction").get<std::string>()));
        }
        else
        {
            throw std::invalid_argument("unknown request kind '" + kind + "'");
        }
    }
};
} // namespace nlohmann

namespace mdnav::keys
{
namespace
{
std::string lowerTrimmed(std::string_view part)
{
    std::size_t start = 0;
    std::size_t end = part.size();
    while (start < end && std::isspace(static_cast<unsigned char>(part[start])))
        ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(part[end - 1])))
        --end;
    std::string result;
    result.reserve(end - start);
    for (std::size_t i = start; i < end; ++i)
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(part[i]))));
    return result;
}

void bindPair(KeyTable &table, std::string_view key, NavigationRequest next)
{
    NavigationRequest previous = next;
    previous.direction = Direction::Previous;
    table.bind(key, std::move(next));
    table.bind("shift+" + std::string(key), std::move(previous));
}

} // namespace

std::string normalizeGesture(std::string_view gesture)
{
    bool control = false;
    bool alt = false;
    bool shift = false;
    std::string key;

    std::size_t start = 0;
    while (start <= gesture.size())
    {
        std::size_t plus = gesture.find('+', start);
        if (plus == start && plus + 1 == gesture.size())
        {
            key = "+";
            break;
        }
        if (plus == std::string_view::npos)
            plus = gesture.size();
        std::string part = lowerTrimmed(gesture.substr(start, plus - start));
        start = plus + 1;
        if (part.empty())
            continue;
        if (part == "control" || part == "ctrl")
            control = true;
        else if (part == "alt")
            alt = true;
        else if (part == "shift")
            shift = true;
        else
            key = part;
    }

    std::string normalized;
    if (control)
        normalized += "control+";
    if (alt)
        normalized += "alt+";
    if (shift)
        normalized += "shift+";
    normalized += key;
    return normalized;
}

KeyTable KeyTable::defaults()
{
    KeyTable table;
    bindPair(table, "h", NavigationRequest::jump(Category::Heading, Direction::Next));
    for (int level = 1; level <= 6; ++level)
        bindPair(table, std::to_string(level), NavigationRequest::heading(level, Direction::Next));
    bindPair(table, "t", NavigationRequest::jump(Category::Table, Direction::Next));
    bindPair(table, "k", NavigationRequest::jump(Category::Link, Direction::Next));
    bindPair(table, "g", NavigationRequest::jump(Category::Image, Direction::Next));
    bindPair(table, "m", NavigationRequest::jump(Category::Math, Direction::Next));
    bindPair(table, "i", NavigationRequest::jump(Category::ListItem, Direction::Next));
    bindPair(table, "l", NavigationRequest::jump(Category::List, Direction::Next));
    bindPair(table, "q", NavigationRequest::jump(Category::Blockquote, Direction::Next));
    bindPair(table, "c", NavigationRequest::jump({Category::CodeBlock, Category::InlineCode}, Direction::Next));
    bindPair(table, "s", NavigationRequest::jump(Category::Separator, Direction::Next));
    bindPair(table, "x", NavigationRequest::jump(Category::Checkbox, Direction::Next));
    bindPair(table, "e", NavigationRequest::jump(Category::Emphasis, Direction::Next));
    bindPair(table, "b", NavigationRequest::jump(Category::Bold, Direction::Next));
    bindPair(table, "d", NavigationRequest::jump(Category::Strikethrough, Direction::Next));
    bindPair(table, "f", NavigationRequest::jump(Category::Footnote, Direction::Next));

    table.bind(",", NavigationRequest::blockBoundary(Boundary::End));
    table.bind("shift+,", NavigationRequest::blockBoundary(Boundary::Start));

    table.bind("control+alt+leftArrow", NavigationRequest::cell(CellDirection::Left));
    table.bind("control+alt+rightArrow", NavigationRequest::cell(CellDirection::Right));
    table.bind("control+alt+upArrow", NavigationRequest::cell(CellDirection::Up));
    table.bind("control+alt+downArrow", NavigationRequest::cell(CellDirection::Down));
    return table;
}

void KeyTable::bind(std::string_view gesture, NavigationRequest request)
{
    table[normalizeGesture(gesture)] = std::move(request);
}

bool KeyTable::unbind(std::string_view gesture)
{
    return table.erase(normalizeGesture(gesture)) > 0;
}

const NavigationRequest *KeyTable::lookup(std::string_view gesture) const
{
    auto it = table.find(normalizeGesture(gesture));
    if (it == table.end())
        return nullptr;
    return &it->second;
}

bool KeyTable::loadFromFile(const std::filesystem::path &filePath)
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
        PLOGW << "ignoring unreadable key table " << filePath.string() << ": " << error.what();
        return false;
    }
    if (!data.is_object() || !data.contains("bindings") || !data["bindings"].is_object())
    {
        PLOGW << "ignoring key table " << filePath.string() << ": no bindings object";
        return false;
    }

    std::map<std::string, NavigationRequest> loaded;
    const nlohmann::json &bindings = data["bindings"];
    for (auto it = bindings.begin(); it != bindings.end(); ++it)
    {
        try
        {
            loaded[normalizeGesture(it.key())] = it.value().get<NavigationRequest>();
        }
        catch (const std::exception &error)
        {
            PLOGW << "skipping key binding '" << it.key() << "': " << error.what();
        }
    }
    table = std::move(loaded);
    return true;
}

bool KeyTable::saveToFile(const std::filesystem::path &filePath) const
{
    nlohmann::json bindings = nlohmann::json::object();
    for (const auto &[gesture, request] : table)
        bindings[gesture] = request;
    nlohmann::json data;
    data["bindings"] = bindings;

    std::error_code ec;
    if (filePath.has_parent_path())
        std::filesystem::create_directories(filePath.parent_path(), ec);

    std::ofstream out(filePath);
    if (!out)
        return false;
    out << data.dump(2) << std::endl;
    return static_cast<bool>(out);
}

std::filesystem::path KeyTable::defaultPath()
{
    if (const char *overridePath = std::getenv("MDNAV_KEYS_CONFIG"))
    {
        if (overridePath[0] != '\0')
            return std::filesystem::path(overridePath);
    }
    return config::OptionRegistry::configRoot() / "keys.json";
}

} // namespace mdnav::keys
