#include "commands.hpp"
#include "client/session.hpp"
#include "protocol/command_name.hpp"
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace hllrcon::client {

void Commands::change_map(const std::string& map_id) {
    session_.send_command(protocol::command::ChangeMap, map_id);
}

json Commands::server_information(const std::string& name, const std::string& value) {
    json content = session_.send_command(protocol::command::ServerInformation,
                                         json{{"Name", name}, {"Value", value}});
    if (content.is_object()) {
        return content;
    }
    return json::object();
}

} // namespace hllrcon::client
