#pragma once

namespace krishi {

enum class MetricKind {
    HeatStressIndex,
    SoilMoistureCategory,
    GrowingDegreeDays,
    SoilTemperatureStatus
};

enum class HeatStressLevel {
    None,
    Moderate,
    Severe,
    Extreme
};

enum class SoilMoistureCategory {
    Dry,
    Optimal,
    Saturated
};

enum class SoilTemperatureStatus {
    Cold,
    Optimal,
    Hot
};

enum class Trend {
    Stable,
    Increasing,
    Decreasing
};

// Declaration order is the evaluation priority of the alert rules.
enum class AlertCategory {
    FloodRisk,
    HeatAdvisory,
    FrostWarning,
    IrrigationAdvisory,
    DiseaseRisk
};

enum class AlertSeverity {
    Low,
    Medium,
    High,
    Extreme
};

enum class AlertState {
    Active,
    Resolved
};

} // namespace krishi
