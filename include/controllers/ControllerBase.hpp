/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTROLLER_BASE_HPP
#define CONTROLLER_BASE_HPP

/**
 * @file ControllerBase.hpp
 * @brief Base class for session-scoped gameplay controllers
 *
 * Controllers apply gameplay rules to entities they do NOT own: the
 * EntityStore owns the data, the controller mutates it and reports what
 * happened by appending SimEvents to the session's output queue.
 *
 * Key characteristics:
 * - Owned by GameSession (not singletons)
 * - Bound to one EntityStore and one EventQueue for their whole lifetime
 * - Minimal state of their own
 */

#include "events/SimEvent.hpp"
#include <string_view>
#include <utility>

namespace Cosmic
{

class EntityStore;

class ControllerBase
{
public:
    virtual ~ControllerBase() = default;

    // Non-copyable, non-movable (bound to the session's store and queue)
    ControllerBase(const ControllerBase&) = delete;
    ControllerBase& operator=(const ControllerBase&) = delete;

    /**
     * @brief Get controller name for debugging
     */
    [[nodiscard]] virtual std::string_view getName() const = 0;

protected:
    ControllerBase(EntityStore& store, EventQueue& events)
        : m_store(store), m_events(events)
    {
    }

    /**
     * @brief Append an output event for this tick
     */
    void emit(SimEvent event) { m_events.push_back(std::move(event)); }

    [[nodiscard]] EntityStore& getStore() { return m_store; }
    [[nodiscard]] const EntityStore& getStore() const { return m_store; }

private:
    EntityStore& m_store;
    EventQueue& m_events;
};

} // namespace Cosmic

#endif // CONTROLLER_BASE_HPP
