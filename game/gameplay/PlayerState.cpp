#include "game/gameplay/PlayerState.hpp"

namespace trisolar::gameplay
{
bool PlayerState::IsAssigned(const std::string& taskId) const
{
    for (const std::string& assigned : assignedTasks)
    {
        if (assigned == taskId)
        {
            return true;
        }
    }
    return false;
}

void PlayerState::RefreshSpeed()
{
    speedMultiplier = frozenBy.empty() ? baseSpeedMultiplier : 0.0F;
}
} // namespace trisolar::gameplay
