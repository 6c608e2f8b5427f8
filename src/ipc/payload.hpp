/**
 * JSON payload encoding
 *
 * Engine text is carried through verbatim and need not be valid UTF-8,
 * which nlohmann::json refuses to serialize by default.
 */
#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace dockbox::ipc {

// Invalid UTF-8 sequences become U+FFFD; never throws
std::string dump_payload(const nlohmann::json& j);

// nullopt (with `error` set) when a string is not valid UTF-8
std::optional<std::string> try_dump_payload(const nlohmann::json& j, std::string& error);

} // namespace dockbox::ipc
