#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

#include "ChangeCounter.hpp"

TEST(ChangeMonitor, StartsSynchronized)
{
    auto counter = std::make_shared<ChangeCounter>();
    counter->change();

    ChangeMonitor monitor(counter);
    EXPECT_FALSE(monitor.pending());
    EXPECT_FALSE(monitor.changed());
}

TEST(ChangeMonitor, PendingDoesNotConsume)
{
    auto          counter = std::make_shared<ChangeCounter>();
    ChangeMonitor monitor(counter);

    counter->change();
    counter->change();

    EXPECT_TRUE(monitor.pending());
    EXPECT_TRUE(monitor.pending());
    EXPECT_TRUE(monitor.changed());
    EXPECT_FALSE(monitor.pending());
}

TEST(ChangeMonitor, InvalidateForcesOneChange)
{
    auto          counter = std::make_shared<ChangeCounter>();
    ChangeMonitor monitor(counter);

    monitor.invalidate();
    EXPECT_TRUE(monitor.pending());

    monitor.sync();
    EXPECT_FALSE(monitor.pending());

    monitor.invalidate();
    EXPECT_TRUE(monitor.changed());
    EXPECT_FALSE(monitor.changed());
}

TEST(ChangeMonitor, NullCounterIsRejected)
{
    EXPECT_THROW(ChangeMonitor{nullptr}, std::invalid_argument);
}
