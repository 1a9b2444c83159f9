#include "game/maze/MazeGenerator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <glm/geometric.hpp>
#include <glm/gtc/constants.hpp>

#include "game/maze/MazeRandom.hpp"
#include "game/maze/TaskRegistry.hpp"

namespace trisolar::maze
{
namespace
{
constexpr int kCenterMin = 8;
constexpr int kCenterMax = 9;

const std::vector<std::string>& RoomNamePool()
{
    static const std::vector<std::string> kPool = {
        // Core station rooms
        "Reactor", "Laboratory", "Infirmary", "Armory", "Communications",
        "Control", "Archive", "Generator", "Cafeteria", "Observatory",
        "Storage", "Cold Chamber", "Machinery", "Workshop", "Terminal",
        "Quarantine", "Medical Center", "Warehouse", "Security", "Greenhouse",
        "Server Room", "Dormitory", "Decontamination", "North Wing",
        "South Wing", "Sector Alpha", "Sector Beta", "Meeting Room", "Hangar", "Cryogenics",
        // Engineering and utility
        "Propulsion", "Navigation", "Bridge", "Arsenal", "Hydroponics",
        "Recycling", "Oxygen", "Hatch", "Airlock", "Hab Module",
        "Terrace", "Deck", "Med Bay", "Garage", "Silo",
        "Studio", "Library", "Dark Chamber", "Furnace", "Dock",
        "East Wing", "West Wing", "Sector Gamma", "Sector Delta", "Substation",
        "Antenna", "Radar", "Pod Bay", "Refuge", "Incinerator",
        "Shielding", "Boiler", "Extraction", "Compressor", "Distillery",
        // Extended wings
        "Sector Epsilon", "Sector Zeta", "Sector Eta", "Sector Theta",
        "Central Wing", "Upper Wing", "Lower Wing", "Outer Wing",
        "Turbine", "Fusion", "Ventilation", "Filters", "Collection",
        "Foundry", "Assembly", "Conveyor", "Press", "Welding",
        "Docking", "Cargo", "Unloading", "Storehouse", "Vault",
        "Catwalk", "Lookout", "Watch Tower", "Beacon", "Sentinel",
        "Cistern", "Aqueduct", "Thermal Chamber", "Solar Panel", "Battery",
        "Zone Zero", "Prototype", "Testing", "Simulator", "Holodeck",
        "Vivarium", "Aviary", "Herbarium", "Aquarium", "Seedbed",
        "Infirmary B", "Chem Lab", "Physics Lab", "Bio Lab",
        "Storage B", "Terminal B", "Corridor 7", "Corridor 12",
        "Ext Module", "Cabin", "Capsule", "Nursery", "Stockroom",
    };
    return kPool;
}

/// Themed rooms always host the matching task type.
const std::unordered_map<std::string, std::string>& RoomTaskMap()
{
    static const std::unordered_map<std::string, std::string> kMap = {
        {"Infirmary", "scanner_bioidentificacao"},
        {"Medical Center", "scanner_bioidentificacao"},
        {"Quarantine", "scanner_bioidentificacao"},
        {"Decontamination", "scanner_bioidentificacao"},
        {"Med Bay", "scanner_bioidentificacao"},
        {"Cafeteria", "esvaziar_lixo"},
        {"Storage", "esvaziar_lixo"},
        {"Warehouse", "esvaziar_lixo"},
        {"Cold Chamber", "esvaziar_lixo"},
        {"Recycling", "esvaziar_lixo"},
        {"Incinerator", "esvaziar_lixo"},
        {"Generator", "painel_energia"},
        {"Substation", "painel_energia"},
        {"Boiler", "painel_energia"},
        {"Solar Panel", "painel_energia"},
        {"Battery", "painel_energia"},
        {"Armory", "canhao_asteroides"},
        {"Hangar", "canhao_asteroides"},
        {"Archive", "leitor_cartao"},
        {"Control", "leitor_cartao"},
        {"Security", "leitor_cartao"},
        {"Meeting Room", "leitor_cartao"},
        {"Navigation", "leitor_cartao"},
        {"Machinery", "motores"},
        {"Workshop", "motores"},
        {"Cryogenics", "motores"},
        {"Vivarium", "amostra_sangue"},
        {"Infirmary B", "amostra_sangue"},
        {"Filters", "limpar_filtro"},
        {"Ventilation", "limpar_filtro"},
        {"Thermal Chamber", "registrar_temperatura"},
        {"Beacon", "alinhar_antena"},
        {"Sentinel", "alinhar_antena"},
        {"Oxygen", "verificar_oxigenio"},
        {"Bridge", "enviar_relatorio"},
        {"Communications", "enviar_relatorio"},
        {"Dormitory", "inspecionar_traje"},
        {"Cabin", "inspecionar_traje"},
        {"Cargo", "etiquetar_carga"},
        {"Unloading", "etiquetar_carga"},
        {"Storehouse", "etiquetar_carga"},
        {"Observatory", "calibrar_bussola"},
        {"Welding", "soldar_circuito"},
        {"Assembly", "soldar_circuito"},
        {"Cistern", "consertar_tubulacao"},
        {"Aqueduct", "consertar_tubulacao"},
        {"Hydroponics", "consertar_tubulacao"},
        {"Library", "decodificar_mensagem"},
        {"Terminal B", "decodificar_mensagem"},
        {"Propulsion", "reabastecer_combustivel"},
        {"Foundry", "classificar_minerais"},
        {"Collection", "classificar_minerais"},
        {"Radar", "ajustar_frequencia"},
        {"Chem Lab", "reconectar_fios"},
        {"Laboratory", "reconectar_fios"},
        {"Conveyor", "analisar_dados"},
        {"Press", "equilibrar_carga"},
        {"Arsenal", "desativar_bomba"},
        {"Shielding", "desativar_bomba"},
        {"Lookout", "navegar_asteroide"},
        {"Watch Tower", "navegar_asteroide"},
        {"Reactor", "reparar_reator"},
        {"Fusion", "reparar_reator"},
        {"Server Room", "hackear_terminal"},
        {"Prototype", "hackear_terminal"},
        {"Turbine", "sincronizar_motores"},
        {"Compressor", "sincronizar_motores"},
    };
    return kMap;
}

struct ThemedDecor
{
    std::vector<std::string> types;
    int minCount = 0;
    int maxCount = 0;
};

const std::vector<std::string>& GenericDecorTypes()
{
    static const std::vector<std::string> kTypes = {"boneco_desmontavel", "pop_it", "pelucia", "blocos_montar"};
    return kTypes;
}

const std::unordered_map<std::string, ThemedDecor>& ThemedDecorMap()
{
    static const std::unordered_map<std::string, ThemedDecor> kMap = {
        {"Library", ThemedDecor{{"bookshelf", "book_stack"}, 2, 3}},
        {"Infirmary", ThemedDecor{{"medical_bed", "iv_stand", "medicine_cabinet"}, 2, 3}},
    };
    return kMap;
}

const std::unordered_set<std::string>& OxygenRoomNames()
{
    static const std::unordered_set<std::string> kNames = {
        "Oxygen", "Generator", "Reactor", "Machinery", "Ventilation",
        "Filters", "Airlock", "Propulsion", "Substation", "Compressor",
        "Boiler", "Server Room", "Extraction",
    };
    return kNames;
}

struct Edge
{
    int cellA = 0;
    int cellB = 0;
    int row = 0;
    int col = 0;
    Side side = Side::South;
};

struct RoomCandidate
{
    int idx = 0;
    int row = 0;
    int col = 0;
    Side openSide = Side::North;
};

[[nodiscard]] int CellIndex(int row, int col)
{
    return row * kGridSize + col;
}

[[nodiscard]] bool IsCenterCell(int row, int col)
{
    return row >= kCenterMin && row <= kCenterMax && col >= kCenterMin && col <= kCenterMax;
}

[[nodiscard]] std::string EdgeKey(int row, int col, char side)
{
    return std::to_string(row) + "_" + std::to_string(col) + "_" + side;
}

[[nodiscard]] std::string CellSuffix(int row, int col)
{
    return std::to_string(row) + "_" + std::to_string(col);
}

[[nodiscard]] float RoundHalfUp(float value)
{
    return std::floor(value + 0.5F);
}

void ClearEdge(std::vector<MazeCell>& cells, int row, int col, Side side)
{
    MazeCell& cell = cells[CellIndex(row, col)];
    switch (side)
    {
        case Side::North:
            cell.wallNorth = false;
            if (row > 0)
            {
                cells[CellIndex(row - 1, col)].wallSouth = false;
            }
            break;
        case Side::South:
            cell.wallSouth = false;
            if (row < kGridSize - 1)
            {
                cells[CellIndex(row + 1, col)].wallNorth = false;
            }
            break;
        case Side::East:
            cell.wallEast = false;
            if (col < kGridSize - 1)
            {
                cells[CellIndex(row, col + 1)].wallWest = false;
            }
            break;
        case Side::West:
            cell.wallWest = false;
            if (col > 0)
            {
                cells[CellIndex(row, col - 1)].wallEast = false;
            }
            break;
    }
}

void CarveCenterPlaza(std::vector<MazeCell>& cells)
{
    // Internal walls of the 2x2 block.
    for (int row = kCenterMin; row <= kCenterMax; ++row)
    {
        for (int col = kCenterMin; col <= kCenterMax; ++col)
        {
            if (row + 1 <= kCenterMax)
            {
                ClearEdge(cells, row, col, Side::South);
            }
            if (col + 1 <= kCenterMax)
            {
                ClearEdge(cells, row, col, Side::East);
            }
        }
    }

    // Two openings on every side of the block.
    ClearEdge(cells, kCenterMin, kCenterMin, Side::North);
    ClearEdge(cells, kCenterMin, kCenterMax, Side::North);
    ClearEdge(cells, kCenterMax, kCenterMin, Side::South);
    ClearEdge(cells, kCenterMax, kCenterMax, Side::South);
    ClearEdge(cells, kCenterMin, kCenterMin, Side::West);
    ClearEdge(cells, kCenterMax, kCenterMin, Side::West);
    ClearEdge(cells, kCenterMin, kCenterMax, Side::East);
    ClearEdge(cells, kCenterMax, kCenterMax, Side::East);
}

class WallBuilder
{
public:
    WallBuilder(
        MazeLayout& layout,
        const std::set<std::string>& forcedDoorEdges,
        const std::vector<bool>& roomCells,
        float dynamicRatio,
        float doorWidth,
        Mulberry32& rng)
        : m_layout(layout)
        , m_forcedDoorEdges(forcedDoorEdges)
        , m_roomCells(roomCells)
        , m_dynamicRatio(dynamicRatio)
        , m_doorWidth(doorWidth)
        , m_rng(rng)
    {
    }

    void AddSegment(int row, int col, Side side, bool isBorder)
    {
        const CellBounds bounds = CellToWorld(row, col);
        glm::vec2 start{0.0F};
        glm::vec2 end{0.0F};
        WallAxis axis = WallAxis::X;

        switch (side)
        {
            case Side::North:
                start = {bounds.minX, bounds.minZ};
                end = {bounds.maxX, bounds.minZ};
                axis = WallAxis::X;
                break;
            case Side::South:
                start = {bounds.minX, bounds.maxZ};
                end = {bounds.maxX, bounds.maxZ};
                axis = WallAxis::X;
                break;
            case Side::East:
                start = {bounds.maxX, bounds.minZ};
                end = {bounds.maxX, bounds.maxZ};
                axis = WallAxis::Z;
                break;
            case Side::West:
                start = {bounds.minX, bounds.minZ};
                end = {bounds.minX, bounds.maxZ};
                axis = WallAxis::Z;
                break;
        }

        if (!isBorder)
        {
            if (m_forcedDoorEdges.count(EdgeKey(row, col, SideToChar(side))) > 0)
            {
                AddDoorSegments(row, col, side, axis, start, end);
                return;
            }

            // Only corridor-only edges may become dynamic.
            int neighbor = -1;
            if (side == Side::South && row < kGridSize - 1)
            {
                neighbor = CellIndex(row + 1, col);
            }
            if (side == Side::East && col < kGridSize - 1)
            {
                neighbor = CellIndex(row, col + 1);
            }
            const bool touchesRoom = m_roomCells[CellIndex(row, col)] || (neighbor >= 0 && m_roomCells[neighbor]);

            if (!touchesRoom && m_rng() < m_dynamicRatio)
            {
                WallSegment wall;
                wall.id = NextWallId();
                wall.start = start;
                wall.end = end;
                wall.isDynamic = true;
                m_layout.dynamicWallIds.push_back(wall.id);
                m_layout.walls.push_back(std::move(wall));
                return;
            }
        }

        WallSegment wall;
        wall.id = NextWallId();
        wall.start = start;
        wall.end = end;
        wall.isBorder = isBorder;
        m_layout.walls.push_back(std::move(wall));
    }

private:
    std::string NextWallId()
    {
        return "wall_" + std::to_string(m_wallCounter++);
    }

    void AddDoorSegments(int row, int col, Side side, WallAxis axis, glm::vec2 start, glm::vec2 end)
    {
        const std::string doorId = "door_" + EdgeKey(row, col, SideToChar(side));
        const glm::vec2 mid = (start + end) * 0.5F;
        const float half = m_doorWidth * 0.5F;
        const glm::vec2 offset = axis == WallAxis::X ? glm::vec2{half, 0.0F} : glm::vec2{0.0F, half};

        // The door wall id is reserved before its flanking walls.
        const std::string doorWallId = NextWallId();

        DoorInfo door;
        door.id = doorId;
        door.row = row;
        door.col = col;
        door.side = side;
        door.position = glm::vec3{mid.x, 2.0F, mid.y};
        door.axis = axis;
        door.wallId = doorWallId;
        m_layout.doors.push_back(std::move(door));

        WallSegment left;
        left.id = NextWallId();
        left.start = start;
        left.end = mid - offset;
        m_layout.walls.push_back(std::move(left));

        WallSegment doorWall;
        doorWall.id = doorWallId;
        doorWall.start = mid - offset;
        doorWall.end = mid + offset;
        doorWall.hasDoor = true;
        doorWall.doorId = doorId;
        m_layout.walls.push_back(std::move(doorWall));

        WallSegment right;
        right.id = NextWallId();
        right.start = mid + offset;
        right.end = end;
        m_layout.walls.push_back(std::move(right));
    }

    MazeLayout& m_layout;
    const std::set<std::string>& m_forcedDoorEdges;
    const std::vector<bool>& m_roomCells;
    float m_dynamicRatio;
    float m_doorWidth;
    Mulberry32& m_rng;
    int m_wallCounter = 0;
};

struct PipeEdge
{
    std::size_t i = 0;
    std::size_t j = 0;
    float dist = 0.0F;
};

[[nodiscard]] float PipeDistance(const PipeNode& a, const PipeNode& b)
{
    const float dx = a.undergroundPosition.x - b.undergroundPosition.x;
    const float dz = a.undergroundPosition.z - b.undergroundPosition.z;
    return std::sqrt(dx * dx + dz * dz);
}

void SortByDistance(std::vector<PipeEdge>& edges)
{
    std::stable_sort(edges.begin(), edges.end(), [](const PipeEdge& a, const PipeEdge& b) {
        return a.dist < b.dist;
    });
}

std::vector<PipeConnection> ConnectPipeNodes(const std::vector<PipeNode>& nodes, const MazeGenerator::GenerationSettings& settings)
{
    std::vector<PipeConnection> connections;
    if (nodes.size() < 2)
    {
        return connections;
    }

    UnionFind uf(nodes.size());
    std::vector<PipeEdge> edges;
    for (std::size_t i = 0; i < nodes.size(); ++i)
    {
        for (std::size_t j = i + 1; j < nodes.size(); ++j)
        {
            const float dist = PipeDistance(nodes[i], nodes[j]);
            if (dist < settings.pipeMaxEdgeDistance)
            {
                edges.push_back(PipeEdge{i, j, dist});
            }
        }
    }
    SortByDistance(edges);

    std::vector<PipeEdge> extras;
    for (const PipeEdge& edge : edges)
    {
        if (uf.Union(edge.i, edge.j))
        {
            connections.push_back(PipeConnection{nodes[edge.i].id, nodes[edge.j].id});
        }
        else
        {
            extras.push_back(edge);
        }
    }

    // Rescue pass: isolated clusters get their shortest long-range links.
    std::vector<std::size_t> unreached;
    for (std::size_t i = 0; i < nodes.size(); ++i)
    {
        if (uf.Find(i) != uf.Find(0))
        {
            unreached.push_back(i);
        }
    }
    if (!unreached.empty())
    {
        std::vector<PipeEdge> longEdges;
        for (const std::size_t u : unreached)
        {
            for (std::size_t j = 0; j < nodes.size(); ++j)
            {
                if (uf.Find(u) == uf.Find(j))
                {
                    continue;
                }
                longEdges.push_back(PipeEdge{u, j, PipeDistance(nodes[u], nodes[j])});
            }
        }
        SortByDistance(longEdges);
        for (const PipeEdge& edge : longEdges)
        {
            if (uf.Union(edge.i, edge.j))
            {
                connections.push_back(PipeConnection{nodes[edge.i].id, nodes[edge.j].id});
            }
        }
    }

    const auto wanted = static_cast<std::size_t>(std::ceil(static_cast<float>(nodes.size()) * settings.pipeExtraEdgeRatio));
    const std::size_t extraCount = std::min(wanted, extras.size());
    for (std::size_t i = 0; i < extraCount; ++i)
    {
        connections.push_back(PipeConnection{nodes[extras[i].i].id, nodes[extras[i].j].id});
    }
    return connections;
}
} // namespace

MazeLayout MazeGenerator::Generate(std::uint32_t seed, int playerCount) const
{
    return Generate(seed, playerCount, GenerationSettings{});
}

MazeLayout MazeGenerator::Generate(std::uint32_t seed, int playerCount, const GenerationSettings& settings) const
{
    Mulberry32 rng(seed);
    MazeLayout layout;
    layout.seed = seed;

    constexpr int totalCells = kGridSize * kGridSize;
    std::vector<MazeCell>& cells = layout.cells;
    cells.reserve(totalCells);
    for (int row = 0; row < kGridSize; ++row)
    {
        for (int col = 0; col < kGridSize; ++col)
        {
            MazeCell cell;
            cell.row = row;
            cell.col = col;
            cells.push_back(cell);
        }
    }

    // Internal edges, S then E per cell so every edge appears once.
    std::vector<Edge> edges;
    for (int row = 0; row < kGridSize; ++row)
    {
        for (int col = 0; col < kGridSize; ++col)
        {
            if (row < kGridSize - 1)
            {
                edges.push_back(Edge{CellIndex(row, col), CellIndex(row + 1, col), row, col, Side::South});
            }
            if (col < kGridSize - 1)
            {
                edges.push_back(Edge{CellIndex(row, col), CellIndex(row, col + 1), row, col, Side::East});
            }
        }
    }
    Shuffle(edges, rng);

    // Kruskal: every union removes a wall, so the result is a spanning tree.
    UnionFind uf(totalCells);
    std::vector<bool> removed(edges.size(), false);
    for (std::size_t i = 0; i < edges.size(); ++i)
    {
        if (uf.Union(static_cast<std::size_t>(edges[i].cellA), static_cast<std::size_t>(edges[i].cellB)))
        {
            removed[i] = true;
        }
    }

    std::vector<std::size_t> kept;
    for (std::size_t i = 0; i < edges.size(); ++i)
    {
        if (!removed[i])
        {
            kept.push_back(i);
        }
    }
    Shuffle(kept, rng);

    const auto targetKept = static_cast<std::size_t>(std::floor(static_cast<double>(edges.size()) * settings.wallKeepRatio));
    const std::size_t extraToRemove = kept.size() > targetKept ? kept.size() - targetKept : 0;
    for (std::size_t i = 0; i < extraToRemove && i < kept.size(); ++i)
    {
        removed[kept[i]] = true;
    }

    for (std::size_t i = 0; i < edges.size(); ++i)
    {
        if (removed[i])
        {
            ClearEdge(cells, edges[i].row, edges[i].col, edges[i].side);
        }
    }

    CarveCenterPlaza(cells);

    // Rooms: non-plaza cells with 3+ walls, found before any wall is restored.
    std::vector<bool> roomCells(totalCells, false);
    std::vector<RoomCandidate> candidates;
    for (int row = 0; row < kGridSize; ++row)
    {
        for (int col = 0; col < kGridSize; ++col)
        {
            const int idx = CellIndex(row, col);
            const MazeCell& cell = cells[idx];
            const int wallCount = cell.WallCount();
            if (wallCount < 3 || IsCenterCell(row, col))
            {
                continue;
            }
            roomCells[idx] = true;

            if (wallCount == 3)
            {
                Side openSide = Side::North;
                if (!cell.wallNorth)
                {
                    openSide = Side::North;
                }
                else if (!cell.wallSouth)
                {
                    openSide = Side::South;
                }
                else if (!cell.wallEast)
                {
                    openSide = Side::East;
                }
                else if (!cell.wallWest)
                {
                    openSide = Side::West;
                }
                candidates.push_back(RoomCandidate{idx, row, col, openSide});
            }
        }
    }

    // Restore the open side of each 3-wall room as a door edge (canonical S/E key).
    std::set<std::string> forcedDoorEdges;
    for (const RoomCandidate& candidate : candidates)
    {
        MazeCell& cell = cells[candidate.idx];
        if (cell.HasWall(candidate.openSide))
        {
            continue; // a neighbouring room already closed it
        }

        const int row = candidate.row;
        const int col = candidate.col;
        switch (candidate.openSide)
        {
            case Side::North:
                cell.wallNorth = true;
                if (row > 0)
                {
                    cells[CellIndex(row - 1, col)].wallSouth = true;
                    forcedDoorEdges.insert(EdgeKey(row - 1, col, 'S'));
                }
                break;
            case Side::South:
                cell.wallSouth = true;
                if (row < kGridSize - 1)
                {
                    cells[CellIndex(row + 1, col)].wallNorth = true;
                }
                forcedDoorEdges.insert(EdgeKey(row, col, 'S'));
                break;
            case Side::East:
                cell.wallEast = true;
                if (col < kGridSize - 1)
                {
                    cells[CellIndex(row, col + 1)].wallWest = true;
                }
                forcedDoorEdges.insert(EdgeKey(row, col, 'E'));
                break;
            case Side::West:
                cell.wallWest = true;
                if (col > 0)
                {
                    cells[CellIndex(row, col - 1)].wallEast = true;
                    forcedDoorEdges.insert(EdgeKey(row, col - 1, 'E'));
                }
                break;
        }
    }

    // Wall segments, one per physical edge.
    WallBuilder builder(layout, forcedDoorEdges, roomCells, settings.dynamicRatio, settings.doorWidth, rng);
    std::unordered_set<std::string> processed;
    for (int row = 0; row < kGridSize; ++row)
    {
        for (int col = 0; col < kGridSize; ++col)
        {
            const MazeCell& cell = cells[CellIndex(row, col)];
            if (row == 0 && cell.wallNorth)
            {
                builder.AddSegment(row, col, Side::North, true);
            }
            if (col == 0 && cell.wallWest)
            {
                builder.AddSegment(row, col, Side::West, true);
            }
            if (cell.wallSouth && processed.insert(EdgeKey(row, col, 'S')).second)
            {
                if (row < kGridSize - 1)
                {
                    processed.insert(EdgeKey(row + 1, col, 'N'));
                }
                builder.AddSegment(row, col, Side::South, row == kGridSize - 1);
            }
            if (cell.wallEast && processed.insert(EdgeKey(row, col, 'E')).second)
            {
                if (col < kGridSize - 1)
                {
                    processed.insert(EdgeKey(row, col + 1, 'W'));
                }
                builder.AddSegment(row, col, Side::East, col == kGridSize - 1);
            }
        }
    }

    // Lights, one per room cell in row-major order.
    for (int idx = 0; idx < totalCells; ++idx)
    {
        if (!roomCells[idx])
        {
            continue;
        }
        const int row = idx / kGridSize;
        const int col = idx % kGridSize;
        const glm::vec2 center = CellToWorld(row, col).Center();
        LightInfo light;
        light.id = "light_" + CellSuffix(row, col);
        light.row = row;
        light.col = col;
        light.position = glm::vec3{center.x, settings.lightHeight, center.y};
        layout.lights.push_back(std::move(light));
    }

    // Room names and door ownership.
    std::vector<std::string> names = RoomNamePool();
    Shuffle(names, rng);

    std::unordered_map<int, std::string> cellDoor;
    for (const DoorInfo& door : layout.doors)
    {
        const int idx = CellIndex(door.row, door.col);
        if (roomCells[idx])
        {
            cellDoor[idx] = door.id;
            continue;
        }
        int neighbor = -1;
        if (door.side == Side::South && door.row < kGridSize - 1)
        {
            neighbor = CellIndex(door.row + 1, door.col);
        }
        if (door.side == Side::East && door.col < kGridSize - 1)
        {
            neighbor = CellIndex(door.row, door.col + 1);
        }
        if (neighbor >= 0 && roomCells[neighbor])
        {
            cellDoor[neighbor] = door.id;
        }
    }

    std::size_t nameIdx = 0;
    for (int idx = 0; idx < totalCells; ++idx)
    {
        if (!roomCells[idx])
        {
            continue;
        }
        const int row = idx / kGridSize;
        const int col = idx % kGridSize;
        const glm::vec2 center = CellToWorld(row, col).Center();
        RoomInfo room;
        room.id = "room_" + CellSuffix(row, col);
        room.row = row;
        room.col = col;
        room.name = names[nameIdx % names.size()];
        room.position = glm::vec3{center.x, 0.0F, center.y};
        const auto doorIt = cellDoor.find(idx);
        if (doorIt != cellDoor.end())
        {
            room.doorId = doorIt->second;
        }
        layout.rooms.push_back(std::move(room));
        ++nameIdx;
    }
    const std::vector<RoomInfo>& rooms = layout.rooms;

    // Task stations scale with the player count.
    const int wantedTasks = std::max(settings.minTasks, playerCount * settings.tasksPerPlayer);
    const auto totalTasks = std::min(rooms.size(), static_cast<std::size_t>(std::max(0, wantedTasks)));
    const auto easyCount = static_cast<std::size_t>(RoundHalfUp(static_cast<float>(totalTasks) * 0.4F));
    const auto hardCount = static_cast<std::size_t>(RoundHalfUp(static_cast<float>(totalTasks) * 0.2F));
    const std::size_t mediumCount = totalTasks - easyCount - hardCount;

    std::vector<std::string> easyTypes = TaskTypesByDifficulty(TaskDifficulty::Easy);
    std::vector<std::string> mediumTypes = TaskTypesByDifficulty(TaskDifficulty::Medium);
    std::vector<std::string> hardTypes = TaskTypesByDifficulty(TaskDifficulty::Hard);
    Shuffle(easyTypes, rng);
    Shuffle(mediumTypes, rng);
    Shuffle(hardTypes, rng);

    std::vector<std::string> typePool;
    for (std::size_t i = 0; i < easyCount; ++i)
    {
        typePool.push_back(easyTypes[i % easyTypes.size()]);
    }
    for (std::size_t i = 0; i < mediumCount; ++i)
    {
        typePool.push_back(mediumTypes[i % mediumTypes.size()]);
    }
    for (std::size_t i = 0; i < hardCount; ++i)
    {
        typePool.push_back(hardTypes[i % hardTypes.size()]);
    }
    Shuffle(typePool, rng);

    std::vector<RoomInfo> roomsShuffled = rooms;
    Shuffle(roomsShuffled, rng);
    std::vector<const RoomInfo*> taskRooms;
    for (const RoomInfo& room : roomsShuffled)
    {
        if (RoomTaskMap().count(room.name) > 0)
        {
            taskRooms.push_back(&room);
        }
    }
    for (const RoomInfo& room : roomsShuffled)
    {
        if (RoomTaskMap().count(room.name) == 0)
        {
            taskRooms.push_back(&room);
        }
    }
    taskRooms.resize(std::min(taskRooms.size(), totalTasks));

    std::size_t poolCursor = 0;
    for (const RoomInfo* room : taskRooms)
    {
        std::string taskType;
        const auto themed = RoomTaskMap().find(room->name);
        if (themed != RoomTaskMap().end())
        {
            taskType = themed->second;
        }
        else
        {
            taskType = typePool[poolCursor++ % typePool.size()];
        }

        const TaskDefinition* definition = FindTaskDefinition(taskType);
        const double angle = rng() * glm::two_pi<double>();
        TaskStation task;
        task.id = "task_" + CellSuffix(room->row, room->col);
        task.roomId = room->id;
        task.row = room->row;
        task.col = room->col;
        task.taskType = taskType;
        task.difficulty = definition != nullptr ? definition->difficulty : TaskDifficulty::Medium;
        task.displayName = definition != nullptr ? definition->displayName : taskType;
        task.position = glm::vec3{
            room->position.x + static_cast<float>(std::cos(angle)) * settings.taskOffset,
            0.0F,
            room->position.z + static_cast<float>(std::sin(angle)) * settings.taskOffset};
        layout.tasks.push_back(std::move(task));
    }

    // Decorations: 0-2 generic props, or 2-3 themed ones.
    int decoIdx = 0;
    for (const RoomInfo& room : rooms)
    {
        const auto themedIt = ThemedDecorMap().find(room.name);
        const bool themed = themedIt != ThemedDecorMap().end();
        int count = 0;
        if (themed)
        {
            const int span = themedIt->second.maxCount - themedIt->second.minCount + 1;
            count = themedIt->second.minCount + static_cast<int>(std::floor(rng() * span));
        }
        else
        {
            count = static_cast<int>(std::floor(rng() * 3.0));
        }
        const std::vector<std::string>& pool = themed ? themedIt->second.types : GenericDecorTypes();

        for (int d = 0; d < count; ++d)
        {
            const double angle = rng() * glm::two_pi<double>();
            const double dist = 1.0 + rng() * 2.0;
            Decoration decoration;
            decoration.id = "deco_" + CellSuffix(room.row, room.col) + "_" + std::to_string(decoIdx++);
            decoration.roomId = room.id;
            decoration.position = glm::vec3{
                room.position.x + static_cast<float>(std::cos(angle) * dist),
                0.0F,
                room.position.z + static_cast<float>(std::sin(angle) * dist)};
            decoration.decoType = pool[static_cast<std::size_t>(std::floor(rng() * static_cast<double>(pool.size())))];
            decoration.scale = static_cast<float>(themed ? 0.8 + rng() * 0.4 : 0.5 + rng());
            decoration.rotationY = static_cast<float>(rng() * glm::two_pi<double>());
            layout.decorations.push_back(std::move(decoration));
        }
    }

    // Shelter zones.
    const std::size_t shelterCount = std::min<std::size_t>(
        4, std::max<std::size_t>(3, static_cast<std::size_t>(std::floor(static_cast<double>(rooms.size()) * 0.3))));
    std::vector<RoomInfo> shelterCandidates = rooms;
    Shuffle(shelterCandidates, rng);
    for (std::size_t i = 0; i < shelterCount && i < shelterCandidates.size(); ++i)
    {
        ShelterZone zone;
        zone.position = shelterCandidates[i].position;
        zone.radius = settings.shelterRadius;
        zone.roomId = shelterCandidates[i].id;
        layout.shelterZones.push_back(std::move(zone));
    }

    // Oxygen generators prefer machinery-themed rooms.
    std::vector<RoomInfo> oxygenCandidates;
    for (const RoomInfo& room : rooms)
    {
        if (OxygenRoomNames().count(room.name) > 0)
        {
            oxygenCandidates.push_back(room);
        }
    }
    if (oxygenCandidates.size() < 2)
    {
        std::vector<RoomInfo> fallback = rooms;
        Shuffle(fallback, rng);
        for (const RoomInfo& room : fallback)
        {
            const bool duplicate = std::any_of(oxygenCandidates.begin(), oxygenCandidates.end(), [&](const RoomInfo& c) {
                return c.id == room.id;
            });
            if (!duplicate)
            {
                oxygenCandidates.push_back(room);
                if (oxygenCandidates.size() >= 3)
                {
                    break;
                }
            }
        }
    }
    const std::size_t oxygenCount = std::min<std::size_t>(3, oxygenCandidates.size());
    Shuffle(oxygenCandidates, rng);
    for (std::size_t i = 0; i < oxygenCount; ++i)
    {
        const RoomInfo& room = oxygenCandidates[i];
        const double angle = rng() * glm::two_pi<double>();
        OxygenGenerator generator;
        generator.id = "oxy_" + CellSuffix(room.row, room.col);
        generator.roomId = room.id;
        generator.roomName = room.name;
        generator.position = glm::vec3{
            room.position.x + static_cast<float>(std::cos(angle)) * settings.generatorOffset,
            0.0F,
            room.position.z + static_cast<float>(std::sin(angle)) * settings.generatorOffset};
        layout.oxygenGenerators.push_back(std::move(generator));
    }

    // Pipe entries sit in the corner opposite the room's door.
    std::unordered_map<std::string, Side> doorSides;
    for (const DoorInfo& door : layout.doors)
    {
        doorSides[door.id] = door.side;
    }
    for (const RoomInfo& room : rooms)
    {
        const MazeCell& cell = cells[CellIndex(room.row, room.col)];
        const float rx = room.position.x;
        const float rz = room.position.z;
        const float edge = settings.pipeCornerInset;

        std::optional<Side> doorSide;
        if (room.doorId.has_value())
        {
            const auto it = doorSides.find(*room.doorId);
            if (it != doorSides.end())
            {
                doorSide = it->second;
            }
        }
        if (!doorSide.has_value())
        {
            if (!cell.wallNorth)
            {
                doorSide = Side::North;
            }
            else if (!cell.wallSouth)
            {
                doorSide = Side::South;
            }
            else if (!cell.wallEast)
            {
                doorSide = Side::East;
            }
            else if (!cell.wallWest)
            {
                doorSide = Side::West;
            }
        }

        const float cornerSign = (room.row + room.col) % 2 == 0 ? 1.0F : -1.0F;
        float sx = rx + edge;
        float sz = rz + edge;
        if (doorSide.has_value())
        {
            switch (*doorSide)
            {
                case Side::North:
                    sz = rz + edge;
                    sx = rx + cornerSign * edge;
                    break;
                case Side::South:
                    sz = rz - edge;
                    sx = rx + cornerSign * edge;
                    break;
                case Side::East:
                    sx = rx - edge;
                    sz = rz + cornerSign * edge;
                    break;
                case Side::West:
                    sx = rx + edge;
                    sz = rz + cornerSign * edge;
                    break;
            }
        }

        PipeNode node;
        node.id = "pipe_" + CellSuffix(room.row, room.col);
        node.roomId = room.id;
        node.roomName = room.name;
        node.surfacePosition = glm::vec3{sx, 0.0F, sz};
        node.undergroundPosition = glm::vec3{rx, kUndergroundY, rz};
        layout.pipeNodes.push_back(std::move(node));
    }

    layout.pipeConnections = ConnectPipeNodes(layout.pipeNodes, settings);
    layout.pipeWalls = GeneratePipeWalls(layout.pipeNodes, layout.pipeConnections, settings.pipeTunnelRadius);

    layout.BuildLookups();

    std::cout << "[MazeGen] Seed=" << seed
              << " rooms=" << layout.rooms.size()
              << " doors=" << layout.doors.size()
              << " walls=" << layout.walls.size()
              << " dynamic=" << layout.dynamicWallIds.size()
              << " tasks=" << layout.tasks.size()
              << " pipes=" << layout.pipeNodes.size() << "/" << layout.pipeConnections.size()
              << "\n";
    return layout;
}

MazeLayout GenerateMaze(std::uint32_t seed, int playerCount)
{
    return MazeGenerator{}.Generate(seed, playerCount);
}

std::vector<PipeWall> GeneratePipeWalls(
    const std::vector<PipeNode>& nodes,
    const std::vector<PipeConnection>& connections,
    float tunnelRadius)
{
    std::vector<PipeWall> walls;
    if (nodes.empty())
    {
        return walls;
    }

    struct Opening
    {
        glm::vec2 dir{0.0F};
        float angle = 0.0F;
    };

    std::unordered_map<std::string, const PipeNode*> nodeMap;
    std::unordered_map<std::string, std::vector<Opening>> openings;
    for (const PipeNode& node : nodes)
    {
        nodeMap[node.id] = &node;
        openings[node.id];
    }

    const float r = tunnelRadius;
    for (const PipeConnection& connection : connections)
    {
        const auto aIt = nodeMap.find(connection.nodeA);
        const auto bIt = nodeMap.find(connection.nodeB);
        if (aIt == nodeMap.end() || bIt == nodeMap.end())
        {
            continue;
        }

        const glm::vec2 a{aIt->second->undergroundPosition.x, aIt->second->undergroundPosition.z};
        const glm::vec2 b{bIt->second->undergroundPosition.x, bIt->second->undergroundPosition.z};
        const glm::vec2 delta = b - a;
        const float len = glm::length(delta);
        if (len < r * 2.5F)
        {
            continue;
        }

        const glm::vec2 dir = delta / len;
        const glm::vec2 perp{-dir.y, dir.x};
        openings[connection.nodeA].push_back(Opening{dir, std::atan2(dir.y, dir.x)});
        openings[connection.nodeB].push_back(Opening{-dir, std::atan2(-dir.y, -dir.x)});

        // Pulled back by r at both ends to leave a junction around each node.
        const glm::vec2 sa = a + dir * r;
        const glm::vec2 sb = b - dir * r;
        walls.push_back(PipeWall{sa + perp * r, sb + perp * r});
        walls.push_back(PipeWall{sa - perp * r, sb - perp * r});
    }

    for (const PipeNode& node : nodes)
    {
        std::vector<Opening>& list = openings[node.id];
        if (list.empty())
        {
            continue;
        }

        const glm::vec2 center{node.undergroundPosition.x, node.undergroundPosition.z};
        std::stable_sort(list.begin(), list.end(), [](const Opening& a, const Opening& b) {
            return a.angle < b.angle;
        });

        for (std::size_t i = 0; i < list.size(); ++i)
        {
            const Opening& curr = list[i];
            const Opening& next = list[(i + 1) % list.size()];
            const glm::vec2 currLeft = center + curr.dir * r + glm::vec2{-curr.dir.y, curr.dir.x} * r;
            const glm::vec2 nextRight = center + next.dir * r + glm::vec2{next.dir.y, -next.dir.x} * r;
            const glm::vec2 gap = nextRight - currLeft;
            if (glm::dot(gap, gap) < 0.01F)
            {
                continue;
            }
            walls.push_back(PipeWall{currLeft, nextRight});
        }
    }
    return walls;
}
} // namespace trisolar::maze
