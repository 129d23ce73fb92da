/**
 * @file Mailbox.hpp
 * @brief Bounded SPSC outbound channel backed by boost::lockfree::spsc_queue.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PXV_SESSION_MAILBOX_HPP
    #define PXV_SESSION_MAILBOX_HPP

#include <pxv/session/IOutboundChannel.hpp>
#include <pxv/core/Types.hpp>
#include <pxv/core/NonCopyable.hpp>

#include <boost/lockfree/spsc_queue.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace pxv::session {

/**
 * @class Mailbox
 * @brief Per-agent queue between the tick engine (single producer) and
 *        the connection's writer thread (single consumer).
 *
 * push is wait-free; the consumer may block in waitPop() until an update
 * arrives or the mailbox is closed. A full mailbox rejects the update
 * instead of dropping an older one, so a reader never sees a gap it was
 * not told about.
 */
class Mailbox final : public IOutboundChannel, public core::NonMovable<Mailbox>
{
public:
    /** @param capacity Maximum buffered updates (power of two). */
    explicit Mailbox(core::u32 capacity);
    ~Mailbox() override;

    [[nodiscard]] core::Expected<void> deliver(const AgentUpdate &update) override;
    [[nodiscard]] bool isOpen() const noexcept override;
    void close() noexcept override;

    /**
     * @brief Consumer side: takes the oldest update without blocking.
     * @return @c true if @p out was filled.
     */
    [[nodiscard]] bool tryPop(AgentUpdate &out);

    /**
     * @brief Consumer side: waits up to @p timeout for an update.
     * @return @c true if @p out was filled; @c false on timeout or once
     *         the mailbox is closed and empty.
     */
    [[nodiscard]] bool waitPop(AgentUpdate &out, std::chrono::milliseconds timeout);

    /** @brief Number of buffered updates (consumer side). */
    [[nodiscard]] core::usize size() const noexcept;

    [[nodiscard]] core::u32 capacity() const noexcept { return _capacity; }

private:
    core::u32                                  _capacity;
    boost::lockfree::spsc_queue<AgentUpdate>   _queue;
    std::atomic<bool>                          _open{true};
    std::mutex                                 _waitMutex;
    std::condition_variable                    _ready;
};

} // namespace pxv::session

#endif // PXV_SESSION_MAILBOX_HPP
