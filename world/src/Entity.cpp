/**
 * @file Entity.cpp
 * @brief Entity helpers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <pxv/world/Entity.hpp>

namespace pxv::world {

std::string_view toString(EntityKind kind) noexcept
{
    return kind == EntityKind::kAgent ? "Agent" : "Resource";
}

} // namespace pxv::world
