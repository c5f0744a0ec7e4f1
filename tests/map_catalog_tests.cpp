// Map catalog loading and lookups, against small fixtures and the shipped
// data/maps.json.

#include "common/errors.hpp"
#include "registry/map_catalog.hpp"
#include "test_harness.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace hllrcon;
using namespace hllrcon::registry;

namespace {

// Temporary JSON file removed on scope exit
struct TempFile {
    std::filesystem::path path;

    explicit TempFile(const std::string& contents) {
        static int counter = 0;
        path = std::filesystem::temp_directory_path()
            / ("hllrcon_maps_test_" + std::to_string(++counter) + ".json");
        std::ofstream(path) << contents;
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

const char* const SMALL_CATALOG = R"({
    "updated_at": 0,
    "maps": {
        "warfare": {
            "Utah Beach": [
                {"id": "utahbeach_warfare", "variant": "Day"},
                {"id": "utahbeach_warfare_night", "variant": "Night"}
            ],
            "Foy": [
                {"id": "foy_warfare", "variant": "Day"}
            ]
        },
        "offensive": {
            "Foy": [
                {"id": "foy_offensive_ger", "variant": "GER Attack"},
                {"id": "foy_offensive_us", "variant": "US Attack"}
            ]
        }
    }
})";

} // namespace

// ============================================================================
// Lookups
// ============================================================================

TEST(modes_and_maps_keep_file_order) {
    TempFile file(SMALL_CATALOG);
    MapCatalog catalog;
    ASSERT_TRUE(catalog.load_file(file.path.string()));

    std::vector<std::string> modes = {"warfare", "offensive"};
    ASSERT_TRUE(catalog.modes() == modes);

    std::vector<std::string> maps = {"Utah Beach", "Foy"};
    ASSERT_TRUE(catalog.maps_for_mode("warfare") == maps);
}

TEST(variants_for_map) {
    TempFile file(SMALL_CATALOG);
    MapCatalog catalog;
    ASSERT_TRUE(catalog.load_file(file.path.string()));

    auto variants = catalog.variants_for_map("offensive", "Foy");
    ASSERT_EQ(variants.size(), size_t{2});
    ASSERT_EQ(variants[0].variant, std::string("GER Attack"));
    ASSERT_EQ(variants[0].id, std::string("foy_offensive_ger"));
    ASSERT_EQ(variants[1].id, std::string("foy_offensive_us"));
}

TEST(map_id_exact_match) {
    TempFile file(SMALL_CATALOG);
    MapCatalog catalog;
    ASSERT_TRUE(catalog.load_file(file.path.string()));

    ASSERT_TRUE(catalog.map_id("warfare", "Utah Beach", "Night") == std::string("utahbeach_warfare_night"));
    ASSERT_TRUE(catalog.map_id("offensive", "Foy", "US Attack") == std::string("foy_offensive_us"));
    ASSERT_FALSE(catalog.map_id("warfare", "Utah Beach", "night").has_value());
    ASSERT_FALSE(catalog.map_id("warfare", "Utah Beach", "Dusk").has_value());
    ASSERT_FALSE(catalog.map_id("skirmish", "Foy", "Day").has_value());
}

TEST(unknown_names_give_empty_results) {
    TempFile file(SMALL_CATALOG);
    MapCatalog catalog;
    ASSERT_TRUE(catalog.load_file(file.path.string()));

    ASSERT_TRUE(catalog.maps_for_mode("skirmish").empty());
    ASSERT_TRUE(catalog.variants_for_map("warfare", "Kursk").empty());
    ASSERT_TRUE(catalog.variants_for_map("control", "Foy").empty());
}

// ============================================================================
// Loading
// ============================================================================

TEST(missing_file_returns_false) {
    MapCatalog catalog;
    ASSERT_FALSE(catalog.load_file("/nonexistent/hllrcon/maps.json"));
    ASSERT_TRUE(catalog.empty());
}

TEST(malformed_file_returns_false) {
    TempFile file("{\"maps\": {");
    MapCatalog catalog;
    ASSERT_FALSE(catalog.load_file(file.path.string()));
}

TEST(bad_structure_throws_and_keeps_catalog) {
    TempFile good(SMALL_CATALOG);
    MapCatalog catalog;
    ASSERT_TRUE(catalog.load_file(good.path.string()));

    TempFile no_maps(R"({"warfare": {}})");
    ASSERT_THROWS(catalog.load_file(no_maps.path.string()), ConfigError);

    TempFile not_a_list(R"({"maps": {"warfare": {"Foy": {"id": "foy_warfare"}}}})");
    ASSERT_THROWS(catalog.load_file(not_a_list.path.string()), ConfigError);

    TempFile no_variant(R"({"maps": {"warfare": {"Foy": [{"id": "foy_warfare"}]}}})");
    ASSERT_THROWS(catalog.load_file(no_variant.path.string()), ConfigError);

    TempFile empty_id(R"({"maps": {"warfare": {"Foy": [{"id": "", "variant": "Day"}]}}})");
    ASSERT_THROWS(catalog.load_file(empty_id.path.string()), ConfigError);

    ASSERT_EQ(catalog.modes().size(), size_t{2});
    ASSERT_TRUE(catalog.map_id("warfare", "Foy", "Day") == std::string("foy_warfare"));
}

// ============================================================================
// Shipped catalog
// ============================================================================

TEST(shipped_catalog_covers_all_modes) {
    MapCatalog catalog;
    ASSERT_TRUE(catalog.load_file(std::string(HLLRCON_DATA_DIR) + "/maps.json"));

    std::vector<std::string> modes = {"warfare", "offensive", "skirmish"};
    ASSERT_TRUE(catalog.modes() == modes);
    ASSERT_EQ(catalog.maps_for_mode("warfare").size(), size_t{18});
    ASSERT_EQ(catalog.maps_for_mode("offensive").size(), size_t{18});
    ASSERT_EQ(catalog.maps_for_mode("skirmish").size(), size_t{10});

    ASSERT_TRUE(catalog.map_id("warfare", "Foy", "Night") == std::string("foy_warfare_night"));
    ASSERT_TRUE(catalog.map_id("offensive", "Foy", "GER Attack") == std::string("foy_offensive_ger"));
    ASSERT_TRUE(catalog.map_id("skirmish", "Tobruk", "Dawn") == std::string("tobruk_skirmish_morning"));
}

int main() {
    std::printf("\n  Map catalog tests\n\n");

    RUN_TEST(modes_and_maps_keep_file_order);
    RUN_TEST(variants_for_map);
    RUN_TEST(map_id_exact_match);
    RUN_TEST(unknown_names_give_empty_results);

    RUN_TEST(missing_file_returns_false);
    RUN_TEST(malformed_file_returns_false);
    RUN_TEST(bad_structure_throws_and_keeps_catalog);

    RUN_TEST(shipped_catalog_covers_all_modes);

    return print_results("Map catalog");
}
