#pragma once

#include <array>
#include <optional>
#include <string>
#include <utility>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

namespace trisolar::cosmos
{
enum class InitialConfig
{
    Triangle,     // tilted Lagrange triangle, long-lived but unstable
    Hierarchical, // tight binary plus a distant satellite
    Figure8       // Chenciner-Montgomery choreography
};

[[nodiscard]] const char* InitialConfigToText(InitialConfig config);
[[nodiscard]] bool TryParseInitialConfig(const std::string& text, InitialConfig& outConfig);

struct Body
{
    glm::dvec3 position{0.0};
    glm::dvec3 velocity{0.0};
    double mass = 1.0;
};

struct SimulationEvents
{
    bool isBinary = false;
    std::optional<std::pair<int, int>> binaryPair;
    bool isEjection = false;
    std::optional<int> ejectedIndex;
    double totalEnergy = 0.0;
};

/// Integrator and event-detection constants. Tests switch damping and the
/// boundary off to check energy conservation.
struct SimulationParameters
{
    double gravity = 800.0;
    double softening = 25.0;
    double damping = 0.99995;       // applied to velocities after each RK4 step
    double boundaryRadius = 600.0;
    double boundaryK = 0.5;
    double step = 0.001;
    int maxStepsPerTick = 60;
    double skyDistance = 250.0;
    double binaryRatio = 0.3;
    int binaryTicks = 40;
    double ejectionRatio = 2.5;
    double orbitalRadius = 300.0;
};

/// Three softened point masses integrated with fixed-step RK4.
class SunSimulation
{
public:
    using Masses = std::array<double, 3>;

    explicit SunSimulation(
        Masses masses = {1.0, 1.0, 1.0},
        InitialConfig config = InitialConfig::Triangle,
        SimulationParameters parameters = SimulationParameters{});

    /// Integrates min(ceil(dt / step), maxStepsPerTick) steps, reprojects the
    /// sky positions and updates the event flags. dt = 0 only re-runs detection.
    void Advance(double dtSeconds);

    /// Replace body state directly, keeping counters. Used by tests and replays.
    void SetBodies(const std::array<Body, 3>& bodies);

    [[nodiscard]] const std::array<Body, 3>& Bodies() const { return m_bodies; }
    [[nodiscard]] const std::array<glm::dvec3, 3>& SunPositions() const { return m_sunPositions; }
    [[nodiscard]] const SimulationEvents& Events() const { return m_events; }
    [[nodiscard]] const std::array<int, 3>& BinaryCounters() const { return m_binaryCounter; }
    [[nodiscard]] const SimulationParameters& Parameters() const { return m_parameters; }
    [[nodiscard]] double ElapsedSeconds() const { return m_elapsedSeconds; }
    [[nodiscard]] double ComputeTotalEnergy() const;

private:
    using StateVector = std::array<double, 18>;

    [[nodiscard]] StateVector ToStateVector() const;
    void FromStateVector(const StateVector& state);
    [[nodiscard]] StateVector Derivative(const StateVector& state) const;
    [[nodiscard]] StateVector IntegrateRk4(const StateVector& state, double dt) const;
    [[nodiscard]] glm::dvec3 ProjectToSky(const Body& body) const;
    void DetectEvents();

    SimulationParameters m_parameters;
    std::array<Body, 3> m_bodies{};
    std::array<glm::dvec3, 3> m_sunPositions{};
    std::array<int, 3> m_binaryCounter{0, 0, 0};
    SimulationEvents m_events;
    double m_elapsedSeconds = 0.0;
};

/// Elevation above which a sun counts as overhead; only shelter blocks it.
constexpr double kOverheadElevation = 0.78539816339744830962; // pi / 4

[[nodiscard]] inline bool IsSunVisible(const glm::dvec3& sunPosition)
{
    return sunPosition.y > 0.0;
}

[[nodiscard]] double SunElevation(const glm::dvec3& sunPosition);

/// Normalized XZ direction from a point toward a sun; (0, 1) when degenerate.
[[nodiscard]] glm::vec2 SunDirection2D(float fromX, float fromZ, const glm::dvec3& sunPosition);
} // namespace trisolar::cosmos
