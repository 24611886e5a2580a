#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "Eigen/Core"
#include "domain/grid_world.hh"

namespace sentinel::mission {

// Each capability gets its own interface so that a consumer depends only on the readings it uses.

class TelemetrySensor {
   public:
    virtual ~TelemetrySensor() = default;
    // Position in grid units
    virtual Eigen::Vector2d position() const = 0;
    // Remaining battery as a percentage in [0, 100]
    virtual double battery_level_pct() const = 0;
};

class ChemicalSensor {
   public:
    virtual ~ChemicalSensor() = default;
    // Concentration in ppm of each detected contaminant, keyed by name
    virtual std::unordered_map<std::string, double> contamination_reading() const = 0;
};

class ProximitySensor {
   public:
    virtual ~ProximitySensor() = default;
    // Obstacle cells whose Euclidean distance from the sensor is at most radius
    virtual std::vector<Eigen::Vector2d> obstacles_nearby(const double radius) const = 0;
};

class VisionSensor {
   public:
    virtual ~VisionSensor() = default;
    // Encoded image bytes
    virtual std::vector<std::uint8_t> capture_image() const = 0;
    // Surface water temperature in degrees Celsius
    virtual double thermal_reading() const = 0;
};

class SimulatedTelemetry : public TelemetrySensor {
   public:
    SimulatedTelemetry(const Eigen::Vector2d &initial_position, const double initial_battery_pct);

    Eigen::Vector2d position() const override { return position_; }
    double battery_level_pct() const override { return battery_pct_; }

    void set_position(const Eigen::Vector2d &position) { position_ = position; }
    // The battery level never drops below zero
    void consume_battery(const double amount_pct);

   private:
    Eigen::Vector2d position_;
    double battery_pct_;
};

class SimulatedChemical : public ChemicalSensor {
   public:
    // Healthy water: no mercury or lead and 6.5 ppm of dissolved oxygen
    SimulatedChemical();
    explicit SimulatedChemical(std::unordered_map<std::string, double> readings);

    std::unordered_map<std::string, double> contamination_reading() const override {
        return readings_;
    }

    // Overwrites the named readings and keeps the rest
    void set_contamination(const std::unordered_map<std::string, double> &readings);

   private:
    std::unordered_map<std::string, double> readings_;
};

// A camera whose frame and water temperature are set by the simulation.
class SimulatedVision : public VisionSensor {
   public:
    explicit SimulatedVision(const double temperature_c);

    std::vector<std::uint8_t> capture_image() const override { return frame_; }
    double thermal_reading() const override { return temperature_c_; }

    void set_frame(std::vector<std::uint8_t> frame) { frame_ = std::move(frame); }
    void set_temperature(const double temperature_c) { temperature_c_ = temperature_c; }

   private:
    std::vector<std::uint8_t> frame_;
    double temperature_c_;
};

// Reports the obstacle cells of a grid around a settable position.
class GridProximitySensor : public ProximitySensor {
   public:
    GridProximitySensor(domain::GridConfig config, const domain::Position &position);

    std::vector<Eigen::Vector2d> obstacles_nearby(const double radius) const override;

    void set_position(const domain::Position &position) { position_ = position; }

   private:
    domain::GridConfig config_;
    domain::Position position_;
};

}  // namespace sentinel::mission
