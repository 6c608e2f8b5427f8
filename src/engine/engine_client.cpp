#include "engine/engine_client.hpp"

namespace dockbox::engine {

DrainResult drain_stream(PullStream& stream) {
    DrainResult result;
    std::string chunk;

    while (true) {
        chunk.clear();
        std::string error;
        StreamStatus status = stream.read(chunk, error);

        if (status == StreamStatus::DATA) {
            result.text += chunk;
            continue;
        }
        if (status == StreamStatus::END) {
            result.success = true;
            return result;
        }

        result.error = error.empty() ? "stream read failed" : error;
        return result;
    }
}

} // namespace dockbox::engine
