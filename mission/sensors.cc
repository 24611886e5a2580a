#include "mission/sensors.hh"

#include <algorithm>
#include <utility>

namespace sentinel::mission {

SimulatedTelemetry::SimulatedTelemetry(const Eigen::Vector2d &initial_position,
                                       const double initial_battery_pct)
    : position_(initial_position), battery_pct_(initial_battery_pct) {}

void SimulatedTelemetry::consume_battery(const double amount_pct) {
    battery_pct_ = std::max(0.0, battery_pct_ - amount_pct);
}

SimulatedChemical::SimulatedChemical()
    : SimulatedChemical({{"mercury", 0.0}, {"lead", 0.0}, {"dissolved_oxygen", 6.5}}) {}

SimulatedChemical::SimulatedChemical(std::unordered_map<std::string, double> readings)
    : readings_(std::move(readings)) {}

void SimulatedChemical::set_contamination(
    const std::unordered_map<std::string, double> &readings) {
    for (const auto &[name, value] : readings) {
        readings_[name] = value;
    }
}

SimulatedVision::SimulatedVision(const double temperature_c) : temperature_c_(temperature_c) {}

GridProximitySensor::GridProximitySensor(domain::GridConfig config,
                                         const domain::Position &position)
    : config_(std::move(config)), position_(position) {}

std::vector<Eigen::Vector2d> GridProximitySensor::obstacles_nearby(const double radius) const {
    const Eigen::Vector2d sensor_in_grid{static_cast<double>(position_.x),
                                          static_cast<double>(position_.y)};
    std::vector<Eigen::Vector2d> out;
    for (const auto &obstacle : config_.obstacles) {
        const Eigen::Vector2d obstacle_in_grid{static_cast<double>(obstacle.x),
                                                static_cast<double>(obstacle.y)};
        if ((obstacle_in_grid - sensor_in_grid).norm() <= radius) {
            out.push_back(obstacle_in_grid);
        }
    }
    return out;
}

}  // namespace sentinel::mission
