#include "map_catalog.hpp"
#include "common/errors.hpp"
#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Keeps the key order of the file
using json = nlohmann::ordered_json;

namespace hllrcon::registry {

bool MapCatalog::load_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "MapCatalog::load_file: Failed to open %s", path.c_str());
        return false;
    }

    json j;
    try {
        j = json::parse(f);
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "MapCatalog::load_file: Error parsing %s: %s",
                     path.c_str(), e.what());
        return false;
    }

    if (!j.is_object() || !j.contains("maps") || !j["maps"].is_object()) {
        throw ConfigError(path + ": expected an object named \"maps\"");
    }

    std::vector<ModeEntry> modes;
    size_t variant_count = 0;
    try {
        for (const auto& [mode_name, mode_maps] : j["maps"].items()) {
            if (!mode_maps.is_object()) {
                throw ConfigError(path + ": maps." + mode_name + " is not an object");
            }

            ModeEntry mode{mode_name, {}};
            for (const auto& [map_name, variants] : mode_maps.items()) {
                const std::string where = path + ": maps." + mode_name + "." + map_name;
                if (!variants.is_array()) {
                    throw ConfigError(where + " is not a list");
                }

                MapEntry map{map_name, {}};
                for (const auto& v : variants) {
                    MapVariant variant;
                    variant.id = v.at("id").get<std::string>();
                    variant.variant = v.at("variant").get<std::string>();
                    if (variant.id.empty()) {
                        throw ConfigError(where + " has a variant without an id");
                    }
                    map.variants.push_back(std::move(variant));
                }
                variant_count += map.variants.size();
                mode.maps.push_back(std::move(map));
            }
            modes.push_back(std::move(mode));
        }
    } catch (const json::exception& e) {
        throw ConfigError(path + ": " + e.what());
    }

    modes_ = std::move(modes);

    SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION,
                "MapCatalog::load_file: Loaded %zu map variant(s) in %zu mode(s) from %s",
                variant_count, modes_.size(), path.c_str());
    return true;
}

const MapCatalog::ModeEntry* MapCatalog::find_mode(const std::string& mode) const {
    for (const auto& m : modes_) {
        if (m.name == mode) return &m;
    }
    return nullptr;
}

const MapCatalog::MapEntry* MapCatalog::find_map(const std::string& mode, const std::string& map) const {
    const ModeEntry* m = find_mode(mode);
    if (!m) return nullptr;
    for (const auto& entry : m->maps) {
        if (entry.name == map) return &entry;
    }
    return nullptr;
}

std::vector<std::string> MapCatalog::modes() const {
    std::vector<std::string> names;
    for (const auto& m : modes_) {
        names.push_back(m.name);
    }
    return names;
}

std::vector<std::string> MapCatalog::maps_for_mode(const std::string& mode) const {
    std::vector<std::string> names;
    if (const ModeEntry* m = find_mode(mode)) {
        for (const auto& entry : m->maps) {
            names.push_back(entry.name);
        }
    }
    return names;
}

std::vector<MapVariant> MapCatalog::variants_for_map(const std::string& mode, const std::string& map) const {
    if (const MapEntry* entry = find_map(mode, map)) {
        return entry->variants;
    }
    return {};
}

std::optional<std::string> MapCatalog::map_id(const std::string& mode, const std::string& map,
                                              const std::string& variant) const {
    const MapEntry* entry = find_map(mode, map);
    if (!entry) return std::nullopt;
    for (const auto& v : entry->variants) {
        if (v.variant == variant) return v.id;
    }
    return std::nullopt;
}

} // namespace hllrcon::registry
