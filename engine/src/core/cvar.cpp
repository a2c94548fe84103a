#include "kiln/core/cvar.hpp"
#include "kiln/core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kiln::core {

static std::unordered_map<std::string, ICVar*>& getCVarMap() {
    static std::unordered_map<std::string, ICVar*> map;
    return map;
}

static std::string trim(std::string_view text) {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto first = std::find_if_not(text.begin(), text.end(), isSpace);
    auto last = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    if (first >= last) {
        return {};
    }
    return {first, last};
}

bool parseBool(std::string_view text) {
    std::string lowered = trim(text);
    std::ranges::transform(lowered, lowered.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "1" || lowered == "true" || lowered == "on" || lowered == "yes") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "off" || lowered == "no") {
        return false;
    }
    throw std::invalid_argument("not a boolean: " + std::string(text));
}

void CVarSystem::registerCVar(ICVar* cvar) {
    if (cvar == nullptr) {
        return;
    }
    auto& map = getCVarMap();
    if (map.contains(cvar->name)) {
        return;
    }
    map[cvar->name] = cvar;
}

ICVar* CVarSystem::find(const std::string& name) {
    auto& map = getCVarMap();
    auto it = map.find(name);
    if (it != map.end()) {
        return it->second;
    }
    return nullptr;
}

std::unordered_map<std::string, ICVar*>& CVarSystem::getAll() {
    return getCVarMap();
}

bool CVarSystem::set(const std::string& name, const std::string& value) {
    ICVar* cvar = find(name);
    if (cvar == nullptr) {
        core::Logger::warn("Unknown CVar: {}", name);
        return false;
    }
    if (cvar->flags & CVarFlags::read_only) {
        core::Logger::warn("CVar {} is read-only", name);
        return false;
    }
    try {
        cvar->setFromString(value);
    } catch (const std::invalid_argument&) {
        core::Logger::warn("Failed to set CVar {} from string value: {}", name, value);
        return false;
    } catch (const std::out_of_range&) {
        core::Logger::warn("Value out of range for CVar {}: {}", name, value);
        return false;
    }
    return true;
}

bool CVarSystem::saveToIni(const std::filesystem::path& path) {
    auto& map = getCVarMap();

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    core::Logger::info("Saving CVars to: {}", std::filesystem::absolute(path).string());
    std::ofstream f(path, std::ios::trunc);
    if (!f) {
        core::Logger::error("Failed to open CVar file for writing: {}", path.string());
        return false;
    }

    // Sorted so the file diffs cleanly between runs
    std::vector<std::pair<std::string, ICVar*>> sorted(map.begin(), map.end());
    std::ranges::sort(sorted, {}, &std::pair<std::string, ICVar*>::first);

    int savedCount = 0;
    for (auto const& [name, cvar] : sorted) {
        if (cvar->flags & CVarFlags::save) {
            f << "; " << cvar->description << "\n";
            f << name << "=" << cvar->toString() << "\n";
            savedCount++;
        }
    }
    core::Logger::info("Successfully saved {} CVars", savedCount);
    return true;
}

int CVarSystem::loadFromIni(const std::filesystem::path& path) {
    core::Logger::info("Loading CVars from: {}", std::filesystem::absolute(path).string());
    std::ifstream f(path);
    if (!f) {
        core::Logger::warn("CVar file not found: {}", path.string());
        return -1;
    }

    int loadedCount = 0;
    std::string line;
    while (std::getline(f, line)) {
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == ';' || stripped[0] == '#') {
            continue;
        }
        size_t eq = stripped.find('=');
        if (eq == std::string::npos) {
            core::Logger::warn("Ignoring malformed CVar line: {}", stripped);
            continue;
        }

        std::string name = trim(std::string_view(stripped).substr(0, eq));
        std::string val = trim(std::string_view(stripped).substr(eq + 1));

        if (set(name, val)) {
            loadedCount++;
        }
    }
    core::Logger::info("Successfully loaded {} CVars", loadedCount);
    return loadedCount;
}

}
