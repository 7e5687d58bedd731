// /////////////////////////////////////////////////////////////////////////////
/// @file Team.cpp
/// @brief Team implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <sbr/scoreboard/Team.hpp>

namespace sbr::scoreboard {

Team::Team(std::string name)
    : name_{std::move(name)}
{}

Team::~Team() = default;

const std::string& Team::name() const noexcept { return name_; }

core::u32 Team::addEntities(std::span<const std::string> entities)
{
    std::lock_guard<std::mutex> lock{mutex_};
    core::u32 added = 0;
    for (const auto& entity : entities)
    {
        if (entities_.insert(entity).second)
        {
            ++added;
        }
    }
    return added;
}

core::u32 Team::addEntities(std::initializer_list<std::string> entities)
{
    return addEntities(std::span<const std::string>{entities.begin(), entities.size()});
}

core::u32 Team::removeEntities(std::span<const std::string> entities)
{
    std::lock_guard<std::mutex> lock{mutex_};
    core::u32 removed = 0;
    for (const auto& entity : entities)
    {
        removed += static_cast<core::u32>(entities_.erase(entity));
    }
    return removed;
}

core::u32 Team::removeEntities(std::initializer_list<std::string> entities)
{
    return removeEntities(std::span<const std::string>{entities.begin(), entities.size()});
}

bool Team::hasEntity(const std::string& entity) const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return entities_.contains(entity);
}

std::unordered_set<std::string> Team::entities() const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return entities_;
}

void Team::setPrefix(std::string prefix)
{
    std::lock_guard<std::mutex> lock{mutex_};
    if (prefix_ == prefix)
    {
        return;
    }
    prefix_ = std::move(prefix);
    revision_.fetch_add(1, std::memory_order_release);
}

void Team::setSuffix(std::string suffix)
{
    std::lock_guard<std::mutex> lock{mutex_};
    if (suffix_ == suffix)
    {
        return;
    }
    suffix_ = std::move(suffix);
    revision_.fetch_add(1, std::memory_order_release);
}

std::string Team::displayName(std::string_view entity) const
{
    std::lock_guard<std::mutex> lock{mutex_};
    std::string out;
    out.reserve(prefix_.size() + entity.size() + suffix_.size());
    out += prefix_;
    out += entity;
    out += suffix_;
    return out;
}

core::u64 Team::revision() const noexcept { return revision_.load(std::memory_order_acquire); }

void Team::flagForRemoval() noexcept      { remove_.store(true, std::memory_order_release); }
bool Team::shouldRemove() const noexcept  { return remove_.load(std::memory_order_acquire); }

} // namespace sbr::scoreboard
