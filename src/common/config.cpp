#include "common/config.hpp"

#include <QFile>

#include <cmath>
#include <limits>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace krishi {

namespace {

// Bounds keep every duration representable as steady_clock offsets in
// milliseconds.
constexpr std::chrono::seconds kMaxTtl{30LL * 24 * 3600};
constexpr std::chrono::milliseconds kMaxRequestTimeout{3600LL * 1000};

std::chrono::seconds secondsValue(const nlohmann::json &j, const char *key,
                                  std::chrono::seconds fallback)
{
    if (!j.contains(key)) {
        return fallback;
    }
    if (!j.at(key).is_number_integer()) {
        throw InvalidConfigurationError(std::string(key) + " must be an integer number of seconds");
    }
    if (j.at(key).is_number_unsigned()
        && j.at(key).get<unsigned long long>()
            > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        throw InvalidConfigurationError(std::string(key) + " is out of range");
    }
    return std::chrono::seconds(j.at(key).get<long long>());
}

double numberValue(const nlohmann::json &j, const char *key, double fallback)
{
    if (!j.contains(key)) {
        return fallback;
    }
    if (!j.at(key).is_number()) {
        throw InvalidConfigurationError(std::string(key) + " must be a number");
    }
    return j.at(key).get<double>();
}

int intValue(const nlohmann::json &j, const char *key, int fallback)
{
    if (!j.contains(key)) {
        return fallback;
    }
    if (!j.at(key).is_number_integer()) {
        throw InvalidConfigurationError(std::string(key) + " must be an integer");
    }
    const auto &value = j.at(key);
    if (value.is_number_unsigned()
        && value.get<unsigned long long>()
            > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
        throw InvalidConfigurationError(std::string(key) + " is out of range");
    }
    const long long wide = value.get<long long>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        throw InvalidConfigurationError(std::string(key) + " is out of range");
    }
    return static_cast<int>(wide);
}

bool boolValue(const nlohmann::json &j, const char *key, bool fallback)
{
    if (!j.contains(key)) {
        return fallback;
    }
    if (!j.at(key).is_boolean()) {
        throw InvalidConfigurationError(std::string(key) + " must be a boolean");
    }
    return j.at(key).get<bool>();
}

void applyEnvSeconds(const char *name, std::chrono::seconds &target)
{
    if (!qEnvironmentVariableIsSet(name)) {
        return;
    }
    bool ok = false;
    const qlonglong value = qEnvironmentVariable(name).toLongLong(&ok);
    if (!ok) {
        throw InvalidConfigurationError(std::string(name) + " is not an integer");
    }
    target = std::chrono::seconds(value);
}

void applyEnvInt(const char *name, int &target)
{
    if (!qEnvironmentVariableIsSet(name)) {
        return;
    }
    bool ok = false;
    const int value = qEnvironmentVariable(name).toInt(&ok);
    if (!ok) {
        throw InvalidConfigurationError(std::string(name) + " is not an integer");
    }
    target = value;
}

void applyEnvBool(const char *name, bool &target)
{
    if (!qEnvironmentVariableIsSet(name)) {
        return;
    }
    target = qEnvironmentVariableIntValue(name) == 1;
}

void requireTtl(std::chrono::seconds value, const char *name)
{
    if (value.count() < 0) {
        throw InvalidConfigurationError(std::string(name) + " must not be negative");
    }
    if (value > kMaxTtl) {
        throw InvalidConfigurationError(std::string(name) + " must not exceed "
                                        + std::to_string(kMaxTtl.count()) + " seconds");
    }
}

} // namespace

void validateConfig(const EngineConfig &config)
{
    requireTtl(config.currentTtl, "currentTtlSeconds");
    requireTtl(config.forecastTtl, "forecastTtlSeconds");
    requireTtl(config.historyTtl, "historyTtlSeconds");
    requireTtl(config.locationTtl, "locationTtlSeconds");
    requireTtl(config.metricsTtl, "metricsTtlSeconds");

    if (config.maxForecastHorizonDays < 1) {
        throw InvalidConfigurationError("maxForecastHorizonDays must be at least 1");
    }
    if (config.requestTimeout.count() <= 0) {
        throw InvalidConfigurationError("requestTimeoutMs must be positive");
    }
    if (config.requestTimeout > kMaxRequestTimeout) {
        throw InvalidConfigurationError("requestTimeoutMs must not exceed "
                                        + std::to_string(kMaxRequestTimeout.count()));
    }
    if (config.loaderThreads < 1) {
        throw InvalidConfigurationError("loaderThreads must be at least 1");
    }
    if (!std::isfinite(config.defaultRadiusKm) || config.defaultRadiusKm < 0.0) {
        throw InvalidConfigurationError("defaultRadiusKm must be a non-negative number");
    }
    if (!(config.forecastDecayPerDay > 0.0 && config.forecastDecayPerDay < 1.0)) {
        throw InvalidConfigurationError("forecastDecayPerDay must be in (0, 1)");
    }

    const AlertThresholds &t = config.alertThresholds;
    if (t.floodRainfallMm <= 0.0) {
        throw InvalidConfigurationError("floodRainfallMm must be positive");
    }
    if (t.lowTemperatureCelsius > t.frostWarningCelsius) {
        throw InvalidConfigurationError(
            "lowTemperatureCelsius must not exceed frostWarningCelsius");
    }
    if (t.highHumidityPercent < 0.0 || t.highHumidityPercent > 100.0) {
        throw InvalidConfigurationError("highHumidityPercent must be within 0..100");
    }
    if (t.dryConsecutiveDays < 1) {
        throw InvalidConfigurationError("dryConsecutiveDays must be at least 1");
    }
}

EngineConfig configFromJson(const nlohmann::json &j, EngineConfig config)
{
    if (!j.is_object()) {
        throw InvalidConfigurationError("configuration root must be a JSON object");
    }

    config.currentTtl = secondsValue(j, "currentTtlSeconds", config.currentTtl);
    config.forecastTtl = secondsValue(j, "forecastTtlSeconds", config.forecastTtl);
    config.historyTtl = secondsValue(j, "historyTtlSeconds", config.historyTtl);
    config.locationTtl = secondsValue(j, "locationTtlSeconds", config.locationTtl);
    config.metricsTtl = secondsValue(j, "metricsTtlSeconds", config.metricsTtl);
    config.maxForecastHorizonDays =
        intValue(j, "maxForecastHorizonDays", config.maxForecastHorizonDays);
    config.degradedAvailabilityOnBackendFailure =
        boolValue(j, "degradedAvailabilityOnBackendFailure",
                  config.degradedAvailabilityOnBackendFailure);
    config.requestTimeout = std::chrono::milliseconds(
        intValue(j, "requestTimeoutMs", static_cast<int>(config.requestTimeout.count())));
    config.loaderThreads = intValue(j, "loaderThreads", config.loaderThreads);
    config.defaultRadiusKm = numberValue(j, "defaultRadiusKm", config.defaultRadiusKm);
    config.forecastDecayPerDay =
        numberValue(j, "forecastDecayPerDay", config.forecastDecayPerDay);
    config.alertHistoryEnabled =
        boolValue(j, "alertHistoryEnabled", config.alertHistoryEnabled);

    if (j.contains("alertThresholds")) {
        const auto &t = j.at("alertThresholds");
        if (!t.is_object()) {
            throw InvalidConfigurationError("alertThresholds must be an object");
        }
        AlertThresholds &out = config.alertThresholds;
        out.floodRainfallMm = numberValue(t, "floodRainfallMm", out.floodRainfallMm);
        out.frostWarningCelsius = numberValue(t, "frostWarningCelsius", out.frostWarningCelsius);
        out.lowTemperatureCelsius =
            numberValue(t, "lowTemperatureCelsius", out.lowTemperatureCelsius);
        out.highHumidityPercent = numberValue(t, "highHumidityPercent", out.highHumidityPercent);
        out.diseaseMinTemperatureCelsius =
            numberValue(t, "diseaseMinTemperatureCelsius", out.diseaseMinTemperatureCelsius);
        out.dryConsecutiveDays = intValue(t, "dryConsecutiveDays", out.dryConsecutiveDays);
    }

    return config;
}

nlohmann::json configToJson(const EngineConfig &config)
{
    const AlertThresholds &t = config.alertThresholds;
    return nlohmann::json{
        {"currentTtlSeconds", config.currentTtl.count()},
        {"forecastTtlSeconds", config.forecastTtl.count()},
        {"historyTtlSeconds", config.historyTtl.count()},
        {"locationTtlSeconds", config.locationTtl.count()},
        {"metricsTtlSeconds", config.metricsTtl.count()},
        {"maxForecastHorizonDays", config.maxForecastHorizonDays},
        {"degradedAvailabilityOnBackendFailure", config.degradedAvailabilityOnBackendFailure},
        {"requestTimeoutMs", config.requestTimeout.count()},
        {"loaderThreads", config.loaderThreads},
        {"defaultRadiusKm", config.defaultRadiusKm},
        {"forecastDecayPerDay", config.forecastDecayPerDay},
        {"alertHistoryEnabled", config.alertHistoryEnabled},
        {"alertThresholds", nlohmann::json{
            {"floodRainfallMm", t.floodRainfallMm},
            {"frostWarningCelsius", t.frostWarningCelsius},
            {"lowTemperatureCelsius", t.lowTemperatureCelsius},
            {"highHumidityPercent", t.highHumidityPercent},
            {"diseaseMinTemperatureCelsius", t.diseaseMinTemperatureCelsius},
            {"dryConsecutiveDays", t.dryConsecutiveDays}
        }}
    };
}

EngineConfig loadEngineConfig(const QString &path)
{
    EngineConfig config;

    if (!path.isEmpty()) {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            throw InvalidConfigurationError("cannot open config file " + path.toStdString());
        }
        try {
            const auto parsed = nlohmann::json::parse(file.readAll().toStdString());
            config = configFromJson(parsed, config);
        } catch (const nlohmann::json::parse_error &e) {
            throw InvalidConfigurationError("config file " + path.toStdString()
                                            + " is not valid JSON: " + e.what());
        }
    }

    applyEnvSeconds("KRISHI_CURRENT_TTL_SECONDS", config.currentTtl);
    applyEnvSeconds("KRISHI_FORECAST_TTL_SECONDS", config.forecastTtl);
    applyEnvSeconds("KRISHI_HISTORY_TTL_SECONDS", config.historyTtl);
    applyEnvInt("KRISHI_MAX_FORECAST_DAYS", config.maxForecastHorizonDays);
    applyEnvBool("KRISHI_DEGRADED_AVAILABILITY", config.degradedAvailabilityOnBackendFailure);
    applyEnvBool("KRISHI_ALERT_HISTORY", config.alertHistoryEnabled);

    validateConfig(config);

    KRLOG_DEBUG(QStringLiteral("Config"),
                QStringLiteral("loadEngineConfig"),
                QStringLiteral("config_loaded"),
                QStringLiteral("startup"),
                path.isEmpty() ? QStringLiteral("defaults_env") : QStringLiteral("json_file_env"),
                configToJson(config));
    return config;
}

} // namespace krishi
