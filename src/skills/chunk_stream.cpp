#include <exception>
#include <memory>
#include <utility>
#include "skills/skill_contract.hpp"

namespace a2a::skills {

ChunkStream::ChunkStream(NextFn next) : next_(std::move(next)) {}

ChunkStream ChunkStream::from_chunks(std::vector<std::string> chunks) {
    auto pending = std::make_shared<std::vector<std::string>>(std::move(chunks));
    auto position = std::make_shared<std::size_t>(0);
    return ChunkStream(
        [pending, position]() -> core::errors::Result<std::optional<std::string>> {
            if (*position >= pending->size()) {
                return std::optional<std::string>{};
            }
            return std::optional<std::string>{(*pending)[(*position)++]};
        });
}

core::errors::Result<std::optional<std::string>> ChunkStream::next() {
    if (done_ || !next_) {
        done_ = true;
        return std::optional<std::string>{};
    }

    core::errors::Result<std::optional<std::string>> chunk = std::optional<std::string>{};
    try {
        chunk = next_();
    } catch (const std::exception& e) {
        done_ = true;
        return core::errors::internal_error(e.what());
    } catch (...) {
        done_ = true;
        return core::errors::internal_error("Unknown error");
    }

    if (core::errors::is_error(chunk) || !core::errors::get_value(chunk).has_value()) {
        done_ = true;
    }
    return chunk;
}

}  // namespace a2a::skills
