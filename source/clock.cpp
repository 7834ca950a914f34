// clock.cpp - hybrid logical clock

#include <lager_delta/clock.h>

#include <algorithm>
#include <chrono>

namespace lager_delta {

std::string to_string(const Timestamp& ts)
{
    return std::to_string(ts.wall) + "." + std::to_string(ts.logical) + "@" + ts.node;
}

namespace {

int64_t system_wall_ms()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

LogicalClock::LogicalClock(std::string node, WallSource wall_source)
    : node_(std::move(node))
    , wall_source_(wall_source ? std::move(wall_source) : WallSource{system_wall_ms})
{
}

Timestamp LogicalClock::now()
{
    return reserve(1);
}

Timestamp LogicalClock::reserve(uint32_t count)
{
    std::lock_guard lock(mutex_);
    int64_t physical = wall_source_();
    if (physical > wall_) {
        wall_ = physical;
        logical_ = 0;
    } else {
        ++logical_;
    }
    Timestamp first{wall_, logical_, node_};
    if (count > 1) {
        logical_ += count - 1;
    }
    return first;
}

Timestamp LogicalClock::update(const Timestamp& remote)
{
    std::lock_guard lock(mutex_);
    int64_t physical = wall_source_();
    int64_t wall = std::max({physical, wall_, remote.wall});

    if (wall == wall_ && wall == remote.wall) {
        logical_ = std::max(logical_, remote.logical) + 1;
    } else if (wall == wall_) {
        ++logical_;
    } else if (wall == remote.wall) {
        logical_ = remote.logical + 1;
    } else {
        logical_ = 0;
    }
    wall_ = wall;
    return Timestamp{wall_, logical_, node_};
}

Timestamp LogicalClock::last() const
{
    std::lock_guard lock(mutex_);
    return Timestamp{wall_, logical_, node_};
}

} // namespace lager_delta
