#pragma once

#include <string>
#include <vector>

#include "game/maze/MazeTypes.hpp"

namespace trisolar::maze
{
enum class TaskVisualCategory
{
    Scanner,
    Container,
    Panel,
    Turret,
    Terminal,
    Pedestal,
    Engine
};

struct TaskDefinition
{
    const char* taskType;
    const char* displayName;
    TaskDifficulty difficulty;
    TaskVisualCategory visualCategory;
};

/// All task types in registry order (easy, medium, hard).
[[nodiscard]] const std::vector<TaskDefinition>& TaskRegistry();
[[nodiscard]] const TaskDefinition* FindTaskDefinition(const std::string& taskType);
[[nodiscard]] std::vector<std::string> TaskTypesByDifficulty(TaskDifficulty difficulty);

[[nodiscard]] const char* DifficultyToText(TaskDifficulty difficulty);
[[nodiscard]] const char* VisualCategoryToText(TaskVisualCategory category);
} // namespace trisolar::maze
