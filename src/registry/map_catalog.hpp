#pragma once

#include <optional>
#include <string>
#include <vector>

namespace hllrcon::registry {

struct MapVariant {
    std::string id;       // what ChangeMap takes, e.g. "foy_offensive_us"
    std::string variant;  // label shown to users, e.g. "US Attack"
};

// Game mode -> map -> variants, read from a JSON file such as data/maps.json:
//   {"maps": {"warfare": {"Foy": [{"id": "foy_warfare", "variant": "Day"}]}}}
// Modes, maps and variants keep the order of the file.
class MapCatalog {
public:
    // Returns false (and logs) when the file is missing or not valid JSON.
    // Throws ConfigError when the structure is wrong; the catalog is left
    // unchanged in both cases.
    bool load_file(const std::string& path);

    bool empty() const { return modes_.empty(); }

    std::vector<std::string> modes() const;

    // Empty for an unknown mode
    std::vector<std::string> maps_for_mode(const std::string& mode) const;

    // Empty for an unknown mode or map
    std::vector<MapVariant> variants_for_map(const std::string& mode, const std::string& map) const;

    // Exact, case-sensitive match on all three names
    std::optional<std::string> map_id(const std::string& mode, const std::string& map,
                                      const std::string& variant) const;

private:
    struct MapEntry {
        std::string name;
        std::vector<MapVariant> variants;
    };

    struct ModeEntry {
        std::string name;
        std::vector<MapEntry> maps;
    };

    const ModeEntry* find_mode(const std::string& mode) const;
    const MapEntry* find_map(const std::string& mode, const std::string& map) const;

    std::vector<ModeEntry> modes_;
};

} // namespace hllrcon::registry
