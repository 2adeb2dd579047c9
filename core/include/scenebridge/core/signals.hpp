/**
 * @file signals.hpp
 * @brief Lightweight signal-slot system for engine callbacks
 *
 * Engines, nodes and media elements publish their events ("loaded",
 * "error", time changes) through Signal members. Subscribers keep a
 * ScopedConnection so a slot never outlives the object it captured.
 *
 * Signals belong to the event-loop thread: connect, disconnect and fire
 * from that thread only. Work produced on other threads reaches a signal
 * through EventLoop::post().
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace scenebridge {

namespace detail {

/// Slot table shared between a Signal and its Connections
template<typename... Args>
struct SlotTable {
    struct Slot {
        uint64_t id;
        std::function<void(Args...)> func;
    };

    std::vector<Slot> slots;
    uint64_t nextId = 1;

    void remove(uint64_t id) {
        slots.erase(
            std::remove_if(slots.begin(), slots.end(),
                [id](const Slot& s) { return s.id == id; }),
            slots.end());
    }

    bool contains(uint64_t id) const {
        return std::any_of(slots.begin(), slots.end(),
            [id](const Slot& s) { return s.id == id; });
    }
};

} // namespace detail

/**
 * @brief Handle to one connected slot
 *
 * Copyable; disconnecting through any copy removes the slot. Safe to use
 * after the signal is gone.
 */
class Connection {
public:
    Connection() = default;

    [[nodiscard]] bool connected() const {
        return m_connected && m_connected();
    }

    void disconnect() {
        if (m_disconnect) {
            m_disconnect();
            m_disconnect = nullptr;
            m_connected = nullptr;
        }
    }

private:
    template<typename... Args>
    friend class Signal;

    Connection(std::function<void()> disconnect, std::function<bool()> connected)
        : m_disconnect(std::move(disconnect)), m_connected(std::move(connected)) {}

    std::function<void()> m_disconnect;
    std::function<bool()> m_connected;
};

/**
 * @brief Connection that disconnects when it goes out of scope
 */
class ScopedConnection {
public:
    ScopedConnection() = default;

    ScopedConnection(Connection conn)
        : m_connection(std::move(conn)) {}

    ~ScopedConnection() {
        m_connection.disconnect();
    }

    ScopedConnection(ScopedConnection&& other) noexcept
        : m_connection(std::move(other.m_connection)) {
        other.m_connection = Connection();
    }

    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            m_connection.disconnect();
            m_connection = std::move(other.m_connection);
            other.m_connection = Connection();
        }
        return *this;
    }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    void disconnect() { m_connection.disconnect(); }

    [[nodiscard]] bool connected() const { return m_connection.connected(); }

private:
    Connection m_connection;
};

/**
 * @brief Type-safe signal
 *
 * @code
 *   Signal<double> timeUpdated;
 *   ScopedConnection c = timeUpdated.connect([](double t) { ... });
 *   timeUpdated.fire(1.5);
 * @endcode
 */
template<typename... Args>
class Signal {
public:
    using SlotType = std::function<void(Args...)>;

    Signal() : m_table(std::make_shared<Table>()) {}

    // Connections point at this signal's table
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    [[nodiscard]] Connection connect(SlotType slot) {
        uint64_t id = m_table->nextId++;
        m_table->slots.push_back({id, std::move(slot)});

        std::weak_ptr<Table> weak = m_table;
        return Connection(
            [weak, id]() {
                if (auto table = weak.lock()) {
                    table->remove(id);
                }
            },
            [weak, id]() {
                auto table = weak.lock();
                return table && table->contains(id);
            });
    }

    /**
     * @brief Invoke every connected slot
     *
     * Slots are copied first, so a slot may connect, disconnect or destroy
     * the emitter. A slot disconnected during emission is skipped.
     */
    void fire(Args... args) {
        auto table = m_table;
        auto snapshot = table->slots;
        for (auto& slot : snapshot) {
            if (slot.func && table->contains(slot.id)) {
                slot.func(args...);
            }
        }
    }

    void disconnectAll() {
        m_table->slots.clear();
    }

    [[nodiscard]] size_t slotCount() const {
        return m_table->slots.size();
    }

private:
    using Table = detail::SlotTable<Args...>;
    std::shared_ptr<Table> m_table;
};

using VoidSignal = Signal<>;

} // namespace scenebridge
