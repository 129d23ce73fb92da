/**
 * @file EntityStore.hpp
 * @brief Owner of the canonical entity records.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_WORLD_ENTITYSTORE_HPP
    #define PXV_WORLD_ENTITYSTORE_HPP

#include <pxv/world/Entity.hpp>
#include <pxv/world/EntityId.hpp>
#include <pxv/world/Inventory.hpp>
#include <pxv/core/Types.hpp>
#include <pxv/core/Expected.hpp>
#include <pxv/core/NonCopyable.hpp>

#include <functional>
#include <initializer_list>
#include <memory>
#include <vector>

namespace pxv::world {

/**
 * @class EntityStore
 * @brief Entity records keyed by id, iterated in ascending id order.
 *
 * Source of truth for positions, inventories and quantities. Every
 * mutation that touches a count checks non-negativity first and fails
 * with InsufficientResource without applying anything.
 */
class EntityStore final : public core::NonCopyable<EntityStore>
{
public:
    EntityStore();
    ~EntityStore();

    EntityStore(EntityStore &&) noexcept;
    EntityStore &operator=(EntityStore &&) noexcept;

    /**
     * @brief Looks an entity up.
     * @return Pointer to the record (stable until removal), or NotFound.
     */
    [[nodiscard]] core::Expected<Entity *> get(EntityId id);
    [[nodiscard]] core::Expected<const Entity *> get(EntityId id) const;

    [[nodiscard]] bool contains(EntityId id) const noexcept;

    /**
     * @brief Inserts or replaces the record with the same id.
     * @return @c true if the id was not present before.
     */
    bool upsert(Entity entity);

    /** @brief Erases a record, or NotFound. */
    [[nodiscard]] core::Expected<void> remove(EntityId id);

    /** @brief Adds items to an agent's inventory. */
    [[nodiscard]] core::Expected<void> credit(EntityId agentId, ItemKind kind, core::u32 amount);

    /**
     * @brief Removes every listed cost from an agent's inventory at once.
     * @return InsufficientResource (nothing applied) if any count would go
     *         negative; NotFound / InvalidArgument for a bad id.
     */
    [[nodiscard]] core::Expected<void> debit(EntityId agentId, std::initializer_list<ItemCount> costs);

    /**
     * @brief Takes up to @p amount from a resource's quantity.
     * @return Amount actually taken, min(amount, quantity).
     */
    [[nodiscard]] core::Expected<core::u32> drawResource(EntityId resourceId, core::u32 amount);

    /** @brief Visits every record in ascending id order. */
    void forEach(const std::function<void(const Entity &)> &callback) const;

    /** @brief Ids of every agent in ascending order. */
    [[nodiscard]] std::vector<EntityId> agentIds() const;

    [[nodiscard]] core::usize size() const noexcept;
    [[nodiscard]] core::usize agentCount() const noexcept;
    [[nodiscard]] core::usize resourceCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace pxv::world

#endif // PXV_WORLD_ENTITYSTORE_HPP
