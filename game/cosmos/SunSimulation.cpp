#include "game/cosmos/SunSimulation.hpp"

#include <algorithm>
#include <cmath>

#include <glm/geometric.hpp>
#include <glm/gtc/constants.hpp>

namespace trisolar::cosmos
{
namespace
{
void ShiftToCenterOfMass(std::array<Body, 3>& bodies)
{
    double totalMass = 0.0;
    glm::dvec3 center{0.0};
    glm::dvec3 momentum{0.0};
    for (const Body& body : bodies)
    {
        totalMass += body.mass;
        center += body.position * body.mass;
        momentum += body.velocity * body.mass;
    }
    center /= totalMass;
    momentum /= totalMass;
    for (Body& body : bodies)
    {
        body.position -= center;
        body.velocity -= momentum;
    }
}

std::array<Body, 3> CreateTriangle(const SunSimulation::Masses& masses, const SimulationParameters& p)
{
    const double r = p.orbitalRadius;
    const double totalMass = masses[0] + masses[1] + masses[2];
    const double v = std::sqrt(p.gravity * totalMass / (r * 1.73));

    // Tilted ~30 degrees so suns cross the horizon.
    const double tilt = glm::pi<double>() / 6.0;
    const double cosT = std::cos(tilt);
    const double sinT = std::sin(tilt);
    const std::array<double, 3> angles = {0.0, glm::two_pi<double>() / 3.0, 2.0 * glm::two_pi<double>() / 3.0};

    std::array<Body, 3> bodies{};
    for (int i = 0; i < 3; ++i)
    {
        const double a = angles[i];
        const double pyz = r * std::sin(a);
        const double vyz = v * std::cos(a);
        bodies[i].position = glm::dvec3{r * std::cos(a), pyz * sinT, pyz * cosT};
        bodies[i].velocity = glm::dvec3{-v * std::sin(a), vyz * sinT, vyz * cosT};
        bodies[i].mass = masses[i];
    }
    ShiftToCenterOfMass(bodies);
    return bodies;
}

std::array<Body, 3> CreateHierarchical(const SunSimulation::Masses& masses, const SimulationParameters& p)
{
    const double binaryR = 80.0;
    const double satelliteR = p.orbitalRadius * 1.3;
    const double binaryMass = masses[0] + masses[1];
    const double vBinary = std::sqrt(p.gravity * binaryMass / (binaryR * 2.0)) * 0.8;
    const double vSatellite = std::sqrt(p.gravity * (binaryMass + masses[2]) / satelliteR) * 0.7;
    const double tilt = glm::pi<double>() / 5.0;

    std::array<Body, 3> bodies{};
    bodies[0] = Body{{binaryR, 0.0, 0.0}, {0.0, vBinary * std::sin(tilt), vBinary * std::cos(tilt)}, masses[0]};
    bodies[1] = Body{{-binaryR, 0.0, 0.0}, {0.0, -vBinary * std::sin(tilt), -vBinary * std::cos(tilt)}, masses[1]};
    bodies[2] = Body{
        {0.0, satelliteR * std::sin(tilt * 0.5), satelliteR * std::cos(tilt * 0.5)},
        {-vSatellite, 0.0, 0.0},
        masses[2]};
    ShiftToCenterOfMass(bodies);
    return bodies;
}

std::array<Body, 3> CreateFigure8(const SunSimulation::Masses& masses, const SimulationParameters& p)
{
    const double s = p.orbitalRadius * 0.8;
    const double avgMass = (masses[0] + masses[1] + masses[2]) / 3.0;
    const double vScale = std::sqrt(p.gravity * avgMass / s) * 0.35;

    std::array<Body, 3> bodies{};
    bodies[0] = Body{{-s * 0.97, s * 0.24, 0.0}, {vScale * 0.466, vScale * 0.432, 0.0}, masses[0]};
    bodies[1] = Body{{s * 0.97, -s * 0.24, 0.0}, {vScale * 0.466, vScale * 0.432, 0.0}, masses[1]};
    bodies[2] = Body{{0.0, 0.0, 0.0}, {-vScale * 0.932, -vScale * 0.864, 0.0}, masses[2]};

    const double tilt = glm::pi<double>() / 8.0;
    const double c = std::cos(tilt);
    const double sn = std::sin(tilt);
    for (Body& body : bodies)
    {
        const glm::dvec3 pos = body.position;
        body.position.y = pos.y * c - pos.z * sn;
        body.position.z = pos.y * sn + pos.z * c;
        const glm::dvec3 vel = body.velocity;
        body.velocity.y = vel.y * c - vel.z * sn;
        body.velocity.z = vel.y * sn + vel.z * c;
    }
    ShiftToCenterOfMass(bodies);
    return bodies;
}
} // namespace

const char* InitialConfigToText(InitialConfig config)
{
    switch (config)
    {
        case InitialConfig::Triangle: return "triangle";
        case InitialConfig::Hierarchical: return "hierarchical";
        case InitialConfig::Figure8: return "figure8";
        default: return "triangle";
    }
}

bool TryParseInitialConfig(const std::string& text, InitialConfig& outConfig)
{
    if (text == "triangle")
    {
        outConfig = InitialConfig::Triangle;
        return true;
    }
    if (text == "hierarchical")
    {
        outConfig = InitialConfig::Hierarchical;
        return true;
    }
    if (text == "figure8")
    {
        outConfig = InitialConfig::Figure8;
        return true;
    }
    return false;
}

SunSimulation::SunSimulation(Masses masses, InitialConfig config, SimulationParameters parameters)
    : m_parameters(parameters)
{
    switch (config)
    {
        case InitialConfig::Hierarchical:
            m_bodies = CreateHierarchical(masses, m_parameters);
            break;
        case InitialConfig::Figure8:
            m_bodies = CreateFigure8(masses, m_parameters);
            break;
        case InitialConfig::Triangle:
        default:
            m_bodies = CreateTriangle(masses, m_parameters);
            break;
    }

    for (std::size_t i = 0; i < m_bodies.size(); ++i)
    {
        m_sunPositions[i] = ProjectToSky(m_bodies[i]);
    }
    m_events.totalEnergy = ComputeTotalEnergy();
}

void SunSimulation::Advance(double dtSeconds)
{
    const int steps = std::min(
        static_cast<int>(std::ceil(std::max(0.0, dtSeconds) / m_parameters.step)),
        m_parameters.maxStepsPerTick);

    StateVector state = ToStateVector();
    for (int i = 0; i < steps; ++i)
    {
        state = IntegrateRk4(state, m_parameters.step);
    }
    FromStateVector(state);
    m_elapsedSeconds += dtSeconds;

    for (std::size_t i = 0; i < m_bodies.size(); ++i)
    {
        m_sunPositions[i] = ProjectToSky(m_bodies[i]);
    }
    DetectEvents();
}

void SunSimulation::SetBodies(const std::array<Body, 3>& bodies)
{
    m_bodies = bodies;
    for (std::size_t i = 0; i < m_bodies.size(); ++i)
    {
        m_sunPositions[i] = ProjectToSky(m_bodies[i]);
    }
}

double SunSimulation::ComputeTotalEnergy() const
{
    const double softeningSq = m_parameters.softening * m_parameters.softening;
    double kinetic = 0.0;
    double potential = 0.0;
    for (std::size_t i = 0; i < m_bodies.size(); ++i)
    {
        const Body& a = m_bodies[i];
        kinetic += 0.5 * a.mass * glm::dot(a.velocity, a.velocity);
        for (std::size_t j = i + 1; j < m_bodies.size(); ++j)
        {
            const Body& b = m_bodies[j];
            const glm::dvec3 d = a.position - b.position;
            const double r = std::sqrt(glm::dot(d, d) + softeningSq);
            potential -= m_parameters.gravity * a.mass * b.mass / r;
        }
    }
    return kinetic + potential;
}

SunSimulation::StateVector SunSimulation::ToStateVector() const
{
    StateVector state{};
    for (std::size_t i = 0; i < 3; ++i)
    {
        const Body& body = m_bodies[i];
        state[i * 6 + 0] = body.position.x;
        state[i * 6 + 1] = body.position.y;
        state[i * 6 + 2] = body.position.z;
        state[i * 6 + 3] = body.velocity.x;
        state[i * 6 + 4] = body.velocity.y;
        state[i * 6 + 5] = body.velocity.z;
    }
    return state;
}

void SunSimulation::FromStateVector(const StateVector& state)
{
    for (std::size_t i = 0; i < 3; ++i)
    {
        Body& body = m_bodies[i];
        body.position = glm::dvec3{state[i * 6 + 0], state[i * 6 + 1], state[i * 6 + 2]};
        body.velocity = glm::dvec3{state[i * 6 + 3], state[i * 6 + 4], state[i * 6 + 5]};
    }
}

SunSimulation::StateVector SunSimulation::Derivative(const StateVector& state) const
{
    const double softeningSq = m_parameters.softening * m_parameters.softening;
    StateVector dsdt{};

    for (std::size_t i = 0; i < 3; ++i)
    {
        const std::size_t ix = i * 6;
        dsdt[ix + 0] = state[ix + 3];
        dsdt[ix + 1] = state[ix + 4];
        dsdt[ix + 2] = state[ix + 5];

        const glm::dvec3 pi{state[ix + 0], state[ix + 1], state[ix + 2]};
        glm::dvec3 accel{0.0};
        for (std::size_t j = 0; j < 3; ++j)
        {
            if (i == j)
            {
                continue;
            }
            const std::size_t jx = j * 6;
            const glm::dvec3 d = glm::dvec3{state[jx + 0], state[jx + 1], state[jx + 2]} - pi;
            const double r2 = glm::dot(d, d) + softeningSq;
            const double r = std::sqrt(r2);
            accel += d * (m_parameters.gravity * m_bodies[j].mass / (r2 * r));
        }

        // Quadratic pull back toward the origin outside the soft boundary.
        const double dist = glm::length(pi);
        if (dist > m_parameters.boundaryRadius)
        {
            const double excess = (dist - m_parameters.boundaryRadius) / m_parameters.boundaryRadius;
            const double restore = -m_parameters.boundaryK * excess * excess;
            accel += pi * (restore / dist);
        }

        dsdt[ix + 3] = accel.x;
        dsdt[ix + 4] = accel.y;
        dsdt[ix + 5] = accel.z;
    }
    return dsdt;
}

SunSimulation::StateVector SunSimulation::IntegrateRk4(const StateVector& state, double dt) const
{
    auto addScaled = [](const StateVector& a, const StateVector& b, double scale) {
        StateVector result{};
        for (std::size_t i = 0; i < result.size(); ++i)
        {
            result[i] = a[i] + b[i] * scale;
        }
        return result;
    };

    const StateVector k1 = Derivative(state);
    const StateVector k2 = Derivative(addScaled(state, k1, dt * 0.5));
    const StateVector k3 = Derivative(addScaled(state, k2, dt * 0.5));
    const StateVector k4 = Derivative(addScaled(state, k3, dt));

    StateVector result{};
    for (std::size_t i = 0; i < result.size(); ++i)
    {
        result[i] = state[i] + (dt / 6.0) * (k1[i] + 2.0 * k2[i] + 2.0 * k3[i] + k4[i]);
    }

    for (std::size_t i = 0; i < 3; ++i)
    {
        result[i * 6 + 3] *= m_parameters.damping;
        result[i * 6 + 4] *= m_parameters.damping;
        result[i * 6 + 5] *= m_parameters.damping;
    }
    return result;
}

glm::dvec3 SunSimulation::ProjectToSky(const Body& body) const
{
    const double dist = glm::length(body.position);
    if (dist < 0.001)
    {
        return glm::dvec3{m_parameters.skyDistance, 0.0, 0.0};
    }
    return body.position * (m_parameters.skyDistance / dist);
}

void SunSimulation::DetectEvents()
{
    const double d01 = glm::distance(m_bodies[0].position, m_bodies[1].position);
    const double d02 = glm::distance(m_bodies[0].position, m_bodies[2].position);
    const double d12 = glm::distance(m_bodies[1].position, m_bodies[2].position);
    const double avgDist = (d01 + d02 + d12) / 3.0;

    // Hysteresis: +1 per near tick (capped), -2 per far tick.
    const double binaryThreshold = avgDist * m_parameters.binaryRatio;
    const std::array<std::pair<int, int>, 3> pairs = {{{0, 1}, {0, 2}, {1, 2}}};
    const std::array<double, 3> distances = {d01, d02, d12};
    const int counterCap = m_parameters.binaryTicks + 10;

    m_events.isBinary = false;
    m_events.binaryPair.reset();
    for (std::size_t p = 0; p < pairs.size(); ++p)
    {
        if (distances[p] < binaryThreshold)
        {
            m_binaryCounter[p] = std::min(m_binaryCounter[p] + 1, counterCap);
        }
        else
        {
            m_binaryCounter[p] = std::max(m_binaryCounter[p] - 2, 0);
        }

        if (m_binaryCounter[p] >= m_parameters.binaryTicks && !m_events.isBinary)
        {
            m_events.isBinary = true;
            m_events.binaryPair = pairs[p];
        }
    }

    double totalMass = 0.0;
    glm::dvec3 com{0.0};
    for (const Body& body : m_bodies)
    {
        totalMass += body.mass;
        com += body.position * body.mass;
    }
    com /= totalMass;

    const double ejectionThreshold = avgDist * m_parameters.ejectionRatio;
    m_events.isEjection = false;
    m_events.ejectedIndex.reset();
    for (int i = 0; i < 3; ++i)
    {
        if (glm::distance(m_bodies[static_cast<std::size_t>(i)].position, com) > ejectionThreshold)
        {
            m_events.isEjection = true;
            m_events.ejectedIndex = i;
            break;
        }
    }

    m_events.totalEnergy = ComputeTotalEnergy();
}

double SunElevation(const glm::dvec3& sunPosition)
{
    const double horizontal = std::sqrt(sunPosition.x * sunPosition.x + sunPosition.z * sunPosition.z);
    return std::atan2(sunPosition.y, horizontal);
}

glm::vec2 SunDirection2D(float fromX, float fromZ, const glm::dvec3& sunPosition)
{
    const double dx = sunPosition.x - fromX;
    const double dz = sunPosition.z - fromZ;
    const double len = std::sqrt(dx * dx + dz * dz);
    if (len < 0.001)
    {
        return glm::vec2{0.0F, 1.0F};
    }
    return glm::vec2{static_cast<float>(dx / len), static_cast<float>(dz / len)};
}
} // namespace trisolar::cosmos
