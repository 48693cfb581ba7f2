#pragma once

#include <entt/entity/entity.hpp>
#include <cstdint>

namespace auras {

// Host objects are identified by an entity id; the aura core never looks
// inside it, only hashes, compares and forwards it to appliers
using ObjectHandle = entt::entity;

constexpr ObjectHandle NullObject = entt::null;

inline uint32_t object_id(ObjectHandle object) {
    return static_cast<uint32_t>(entt::to_integral(object));
}

} // namespace auras
