#include "ipc/payload.hpp"

using json = nlohmann::json;

namespace dockbox::ipc {

std::string dump_payload(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<std::string> try_dump_payload(const json& j, std::string& error) {
    try {
        return j.dump();
    } catch (const json::type_error& e) {
        error = e.what();
        return std::nullopt;
    }
}

} // namespace dockbox::ipc
