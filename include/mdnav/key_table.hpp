#pragma once

#include "mdnav/navigator.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace mdnav::keys
{

// Lower case, modifiers first in the order control, alt, shift: "Shift+Ctrl+H" -> "control+shift+h".
std::string normalizeGesture(std::string_view gesture);

// Maps gestures to navigation requests. Capturing the keys is left to the host.
class KeyTable
{
public:
    static KeyTable defaults();

    void bind(std::string_view gesture, NavigationRequest request);
    bool unbind(std::string_view gesture);
    const NavigationRequest *lookup(std::string_view gesture) const;

    const std::map<std::string, NavigationRequest> &bindings() const noexcept { return table; }
    std::size_t size() const noexcept { return table.size(); }
    bool empty() const noexcept { return table.empty(); }

    // Replaces the bindings with the file's. Malformed entries are skipped.
    bool loadFromFile(const std::filesystem::path &filePath);
    bool saveToFile(const std::filesystem::path &filePath) const;

    // MDNAV_KEYS_CONFIG when set, otherwise keys.json under the option registry's config root.
    static std::filesystem::path defaultPath();

private:
    std::map<std::string, NavigationRequest> table;
};

} // namespace mdnav::keys
