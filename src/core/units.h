#pragma once

namespace gang::core {

constexpr double k_points_per_inch = 72.0;
constexpr double k_default_raster_dpi = 300.0;

// Slack used by every floor/ceil on point values so that 4.5in worth of
// points does not come out as 4.4999999 after a division.
constexpr double k_geometry_epsilon = 1e-6;

constexpr double inches_to_points(double inches) {
    return inches * k_points_per_inch;
}

constexpr double points_to_inches(double points) {
    return points / k_points_per_inch;
}

constexpr double pixels_to_points(double pixels, double dpi) {
    return pixels / dpi * k_points_per_inch;
}

} // namespace gang::core
