#include "game/maze/TaskRegistry.hpp"

namespace trisolar::maze
{
const std::vector<TaskDefinition>& TaskRegistry()
{
    using D = TaskDifficulty;
    using V = TaskVisualCategory;
    static const std::vector<TaskDefinition> kRegistry = {
        // Easy
        {"scanner_bioidentificacao", "Bio-ID Scanner", D::Easy, V::Scanner},
        {"esvaziar_lixo", "Empty Trash", D::Easy, V::Container},
        {"amostra_sangue", "Blood Sample", D::Easy, V::Scanner},
        {"limpar_filtro", "Clean Filter", D::Easy, V::Container},
        {"registrar_temperatura", "Log Temperature", D::Easy, V::Panel},
        {"alinhar_antena", "Align Antenna", D::Easy, V::Pedestal},
        {"verificar_oxigenio", "Check Oxygen", D::Easy, V::Container},
        {"enviar_relatorio", "Send Report", D::Easy, V::Terminal},
        {"inspecionar_traje", "Inspect Suit", D::Easy, V::Scanner},
        {"etiquetar_carga", "Label Cargo", D::Easy, V::Container},
        // Medium
        {"painel_energia", "Power Panel", D::Medium, V::Panel},
        {"canhao_asteroides", "Asteroid Cannon", D::Medium, V::Turret},
        {"leitor_cartao", "Card Reader", D::Medium, V::Pedestal},
        {"motores", "Engines", D::Medium, V::Engine},
        {"generic", "Maintenance Terminal", D::Medium, V::Terminal},
        {"calibrar_bussola", "Calibrate Compass", D::Medium, V::Pedestal},
        {"soldar_circuito", "Solder Circuit", D::Medium, V::Terminal},
        {"consertar_tubulacao", "Fix Pipes", D::Medium, V::Container},
        {"decodificar_mensagem", "Decode Message", D::Medium, V::Terminal},
        {"reabastecer_combustivel", "Refuel", D::Medium, V::Engine},
        {"classificar_minerais", "Sort Minerals", D::Medium, V::Container},
        {"ajustar_frequencia", "Tune Frequency", D::Medium, V::Panel},
        {"reconectar_fios", "Reconnect Wires", D::Medium, V::Panel},
        {"analisar_dados", "Analyze Data", D::Medium, V::Terminal},
        {"equilibrar_carga", "Balance Cargo", D::Medium, V::Pedestal},
        // Hard
        {"desativar_bomba", "Defuse Bomb", D::Hard, V::Panel},
        {"navegar_asteroide", "Navigate Asteroid Field", D::Hard, V::Turret},
        {"reparar_reator", "Repair Reactor", D::Hard, V::Engine},
        {"hackear_terminal", "Hack Terminal", D::Hard, V::Terminal},
        {"sincronizar_motores", "Sync Engines", D::Hard, V::Engine},
    };
    return kRegistry;
}

const TaskDefinition* FindTaskDefinition(const std::string& taskType)
{
    for (const TaskDefinition& definition : TaskRegistry())
    {
        if (taskType == definition.taskType)
        {
            return &definition;
        }
    }
    return nullptr;
}

std::vector<std::string> TaskTypesByDifficulty(TaskDifficulty difficulty)
{
    std::vector<std::string> types;
    for (const TaskDefinition& definition : TaskRegistry())
    {
        if (definition.difficulty == difficulty)
        {
            types.emplace_back(definition.taskType);
        }
    }
    return types;
}

const char* DifficultyToText(TaskDifficulty difficulty)
{
    switch (difficulty)
    {
        case TaskDifficulty::Easy: return "easy";
        case TaskDifficulty::Medium: return "medium";
        case TaskDifficulty::Hard: return "hard";
        default: return "easy";
    }
}

const char* VisualCategoryToText(TaskVisualCategory category)
{
    switch (category)
    {
        case TaskVisualCategory::Scanner: return "scanner";
        case TaskVisualCategory::Container: return "container";
        case TaskVisualCategory::Panel: return "panel";
        case TaskVisualCategory::Turret: return "turret";
        case TaskVisualCategory::Terminal: return "terminal";
        case TaskVisualCategory::Pedestal: return "pedestal";
        case TaskVisualCategory::Engine: return "engine";
        default: return "terminal";
    }
}
} // namespace trisolar::maze
