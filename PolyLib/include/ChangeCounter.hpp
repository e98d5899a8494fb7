#ifndef CHANGE_COUNTER_HPP_INCLUDED
#define CHANGE_COUNTER_HPP_INCLUDED

#include <cstdint>
#include <memory>

/**
 * @brief Shared pointer to a ChangeCounter.
 */
class ChangeCounter;
using ChangeCounterPtr = std::shared_ptr<ChangeCounter>;

/**
 * @brief Tracks changes using an internal version counter.
 *
 * Each call to `change()` increments the counter. Consumers never read the
 * raw value directly; they hold a ChangeMonitor that remembers the value it
 * last synchronized with.
 */
class ChangeCounter
{
public:
    ChangeCounter() = default;

    /**
     * @brief Increments the change counter.
     */
    void change() noexcept;

    /**
     * @brief Returns the current counter value.
     * @return The internal version number.
     */
    [[nodiscard]] uint64_t value() const noexcept;

private:
    uint64_t m_value{0};
};

/**
 * @brief Monitors a ChangeCounter for modifications over time.
 *
 * A freshly constructed monitor is synchronized with the counter, so it only
 * reports changes made after construction.
 */
class ChangeMonitor
{
public:
    /**
     * @brief Constructs a monitor for the given counter.
     * @param counter The counter to monitor.
     */
    explicit ChangeMonitor(ChangeCounterPtr counter);

    /**
     * @brief Checks if the counter has changed since the last sync and syncs.
     * @return True if the counter's value differs from the remembered one.
     */
    [[nodiscard]] bool changed() noexcept;

    /**
     * @brief Checks for a change without consuming it.
     */
    [[nodiscard]] bool pending() const noexcept;

    /**
     * @brief Remembers the current counter value (drops any pending change).
     */
    void sync() noexcept;

    /**
     * @brief Forces the next pending()/changed() query to report a change.
     */
    void invalidate() noexcept;

private:
    ChangeCounterPtr m_counter;
    uint64_t         m_prevValue;
    bool             m_forced = false;
};

#endif // CHANGE_COUNTER_HPP_INCLUDED
