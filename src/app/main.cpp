#include "common/errors.hpp"
#include "registry/map_catalog.hpp"
#include "registry/rcon_config.hpp"
#include "registry/server_registry.hpp"
#include <SDL3/SDL_log.h>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* pname) {
    std::cout
        << pname << " [OPTIONS] COMMAND [ARGS]\n"
        "Controls the map rotation of game servers over RCON V2.\n\n"
        "Commands:\n"
        "  list                                       list configured servers\n"
        "  maps [mode]                                list game modes, or the maps of a mode\n"
        "  map <index>                                print the current map of a server\n"
        "  change-map <index> <map_id>                change the map of a server\n"
        "  change-map <index> <mode> <map> <variant>  same, with the id looked up in the catalog\n\n"
        "Options:\n"
        "  -c <file>  load servers from a JSON file instead of the environment\n"
        "  -m <file>  map catalog (default data/maps.json)\n"
        "  -t <ms>    I/O timeout in milliseconds\n"
        "  -v         verbose protocol logging\n"
        "  -h         this message\n"
        << std::flush;
}

bool parse_index(const std::string& s, size_t& index) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos || s.size() > 9) {
        std::cerr << "Error: '" << s << "' is not a server index" << std::endl;
        return false;
    }
    index = static_cast<size_t>(std::stoul(s));
    return true;
}

// -m path, or data/maps.json relative to the working directory or its parent
bool load_catalog(hllrcon::registry::MapCatalog& catalog, const std::string& path) {
    if (!path.empty()) {
        return catalog.load_file(path);
    }
    if (!catalog.load_file("data/maps.json")) {
        SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Trying ../data/maps.json");
        return catalog.load_file("../data/maps.json");
    }
    return true;
}

int print_maps(const hllrcon::registry::MapCatalog& catalog, const std::vector<std::string>& args) {
    if (args.size() == 1) {
        for (const auto& mode : catalog.modes()) {
            std::cout << mode << std::endl;
        }
        return 0;
    }

    auto maps = catalog.maps_for_mode(args[1]);
    if (maps.empty()) {
        std::cerr << "Error: unknown game mode '" << args[1] << "'" << std::endl;
        return 1;
    }
    for (const auto& map : maps) {
        std::cout << map << std::endl;
        for (const auto& v : catalog.variants_for_map(args[1], map)) {
            std::cout << "    " << v.variant << "  (" << v.id << ")" << std::endl;
        }
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string catalog_path;
    std::string timeout_arg;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            SDL_SetLogPriorities(SDL_LOG_PRIORITY_DEBUG);
        } else if (std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "-m") == 0
                   || std::strcmp(argv[i], "-t") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Error: option " << argv[i] << " requires an argument." << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            switch (argv[i][1]) {
                case 'c': config_path = argv[i + 1]; break;
                case 'm': catalog_path = argv[i + 1]; break;
                default:  timeout_arg = argv[i + 1]; break;
            }
            ++i;
        } else {
            args.emplace_back(argv[i]);
        }
    }

    if (args.empty()) {
        std::cerr << "Error: no command given." << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    try {
        const std::string& command = args[0];

        // The catalog needs no server connection
        hllrcon::registry::MapCatalog catalog;
        const bool by_name = command == "change-map" && args.size() == 5;
        if ((command == "maps" && args.size() <= 2) || by_name) {
            if (!load_catalog(catalog, catalog_path)) {
                std::cerr << "Failed to load the map catalog" << std::endl;
                return 1;
            }
            if (command == "maps") {
                return print_maps(catalog, args);
            }
        }

        hllrcon::registry::RconConfig config;
        if (!config_path.empty()) {
            if (!config.load_file(config_path)) {
                std::cerr << "Failed to load server config from " << config_path << std::endl;
                return 1;
            }
        } else {
            config.load_environment();
        }
        if (!timeout_arg.empty()) {
            config.set_timeout(hllrcon::registry::RconConfig::parse_timeout(timeout_arg, "-t"));
        }

        hllrcon::registry::ServerRegistry registry(config);

        if (command == "list" && args.size() == 1) {
            registry.fetch_display_names();
            for (const auto& entry : registry.list_servers()) {
                std::cout << entry.index << "  " << entry.name << std::endl;
            }
            return 0;
        }

        if (command == "map" && args.size() == 2) {
            size_t index = 0;
            if (!parse_index(args[1], index)) return 1;
            std::cout << registry.server_name(index) << ": " << registry.current_map(index) << std::endl;
            return 0;
        }

        if (command == "change-map" && (args.size() == 3 || by_name)) {
            size_t index = 0;
            if (!parse_index(args[1], index)) return 1;

            std::string map_id = args[2];
            if (by_name) {
                auto id = catalog.map_id(args[2], args[3], args[4]);
                if (!id) {
                    std::cerr << "Error: no map '" << args[3] << "' with variant '" << args[4]
                              << "' in mode '" << args[2] << "'" << std::endl;
                    return 1;
                }
                map_id = *id;
            }

            auto result = registry.change_map(index, map_id);
            (result.success ? std::cout : std::cerr) << result.message << std::endl;
            return result.success ? 0 : 1;
        }

        std::cerr << "Error: unknown command or wrong number of arguments." << std::endl;
        print_usage(argv[0]);
        return 1;

    } catch (const hllrcon::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
