#include "ChangeCounter.hpp"

#include <stdexcept>
#include <utility>

void ChangeCounter::change() noexcept
{
    ++m_value;
}

uint64_t ChangeCounter::value() const noexcept
{
    return m_value;
}

/// ---------------------------------------------
/// ChangeMonitor implementation
/// ---------------------------------------------

ChangeMonitor::ChangeMonitor(ChangeCounterPtr counter) : m_counter{std::move(counter)}, m_prevValue{0}
{
    if (!m_counter)
        throw std::invalid_argument("ChangeMonitor::ChangeMonitor(): counter is null.");

    m_prevValue = m_counter->value();
}

bool ChangeMonitor::changed() noexcept
{
    const bool result = pending();
    sync();
    return result;
}

bool ChangeMonitor::pending() const noexcept
{
    return m_forced || m_counter->value() != m_prevValue;
}

void ChangeMonitor::sync() noexcept
{
    m_prevValue = m_counter->value();
    m_forced    = false;
}

void ChangeMonitor::invalidate() noexcept
{
    m_forced = true;
}
