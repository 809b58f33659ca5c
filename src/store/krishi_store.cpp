#include "store/krishi_store.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <mutex>

#include <sqlite3.h>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"

namespace krishi {

namespace {

constexpr const char *kSchemaVersion = "1";

constexpr const char *kCreateLocationsTable =
    "CREATE TABLE IF NOT EXISTS locations ("
    "    id TEXT PRIMARY KEY,"
    "    name TEXT NOT NULL,"
    "    district TEXT,"
    "    region TEXT,"
    "    latitude REAL NOT NULL,"
    "    longitude REAL NOT NULL,"
    "    elevation REAL"
    ");";

constexpr const char *kCreateReadingsTable =
    "CREATE TABLE IF NOT EXISTS readings ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    location_id TEXT NOT NULL,"
    "    timestamp INTEGER NOT NULL,"
    "    data_source TEXT,"
    "    temperature REAL,"
    "    humidity REAL,"
    "    rainfall REAL,"
    "    wind_speed REAL,"
    "    wind_direction REAL,"
    "    soil_temperature REAL,"
    "    soil_moisture REAL,"
    "    solar_radiation REAL"
    ");";

constexpr const char *kCreateReadingsIndex =
    "CREATE INDEX IF NOT EXISTS idx_readings_location_time "
    "ON readings (location_id, timestamp);";

constexpr const char *kCreateForecastTable =
    "CREATE TABLE IF NOT EXISTS forecast_points ("
    "    location_id TEXT NOT NULL,"
    "    source TEXT NOT NULL,"
    "    forecast_date INTEGER NOT NULL,"
    "    issued_at INTEGER NOT NULL,"
    "    confidence REAL NOT NULL,"
    "    temperature REAL,"
    "    humidity REAL,"
    "    rainfall REAL,"
    "    wind_speed REAL,"
    "    wind_direction REAL,"
    "    soil_temperature REAL,"
    "    soil_moisture REAL,"
    "    solar_radiation REAL,"
    "    PRIMARY KEY (location_id, source, forecast_date, issued_at)"
    ");";

constexpr const char *kCreateAlertsTable =
    "CREATE TABLE IF NOT EXISTS alerts ("
    "    id TEXT PRIMARY KEY,"
    "    location_id TEXT NOT NULL,"
    "    category TEXT NOT NULL,"
    "    severity TEXT NOT NULL,"
    "    condition TEXT,"
    "    recommended_action TEXT,"
    "    state TEXT NOT NULL,"
    "    created_at INTEGER NOT NULL,"
    "    updated_at INTEGER NOT NULL,"
    "    resolved_at INTEGER,"
    "    resolution_notes TEXT"
    ");";

// Backs the single-Active-alert rule at the storage level.
constexpr const char *kCreateActiveAlertIndex =
    "CREATE UNIQUE INDEX IF NOT EXISTS idx_alerts_single_active "
    "ON alerts (location_id, category) WHERE state = 'active';";

constexpr const char *kCreateAlertTransitionsTable =
    "CREATE TABLE IF NOT EXISTS alert_transitions ("
    "    id TEXT PRIMARY KEY,"
    "    alert_id TEXT NOT NULL,"
    "    location_id TEXT NOT NULL,"
    "    category TEXT NOT NULL,"
    "    from_state TEXT NOT NULL,"
    "    to_state TEXT NOT NULL,"
    "    severity TEXT NOT NULL,"
    "    reason TEXT,"
    "    timestamp INTEGER NOT NULL"
    ");";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr const char *kMeasurementColumns =
    "temperature, humidity, rainfall, wind_speed, wind_direction, "
    "soil_temperature, soil_moisture, solar_radiation";

using MeasurementField = std::optional<double> Measurements::*;

const MeasurementField kMeasurementFields[] = {
    &Measurements::temperature,
    &Measurements::humidity,
    &Measurements::rainfall,
    &Measurements::windSpeed,
    &Measurements::windDirection,
    &Measurements::soilTemperature,
    &Measurements::soilMoisture,
    &Measurements::solarRadiation,
};

constexpr int kMeasurementCount = 8;

class Statement {
public:
    Statement(sqlite3 *db, const std::string &sql)
        : m_db(db)
    {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw BackendUnavailableError(std::string("sqlite prepare failed: ")
                                          + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return m_stmt;
    }

    bool step()
    {
        const int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw BackendUnavailableError(std::string("sqlite step failed: ") + sqlite3_errmsg(m_db));
    }

    // For writes. Constraint violations are caller errors, not outages.
    void execute(const char *what)
    {
        const int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_DONE) {
            return;
        }
        if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
            throw InvalidArgumentError(std::string(what) + " violates a constraint: "
                                       + sqlite3_errmsg(m_db));
        }
        throw BackendUnavailableError(std::string(what) + " failed: " + sqlite3_errmsg(m_db));
    }

private:
    sqlite3 *m_db = nullptr;
    sqlite3_stmt *m_stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw BackendUnavailableError(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    if (value.empty()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, value);
}

void bindOptionalReal(sqlite3_stmt *stmt, int index, const std::optional<double> &value)
{
    if (!value) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    sqlite3_bind_double(stmt, index, *value);
}

void bindTime(sqlite3_stmt *stmt, int index, std::chrono::system_clock::time_point value)
{
    sqlite3_bind_int64(stmt, index, toEpochSeconds(value));
}

// Binds the eight measurement columns starting at `first`.
void bindMeasurements(sqlite3_stmt *stmt, int first, const Measurements &measurements)
{
    int index = first;
    for (MeasurementField field : kMeasurementFields) {
        bindOptionalReal(stmt, index++, measurements.*field);
    }
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

std::optional<double> columnOptionalReal(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_double(stmt, index);
}

std::chrono::system_clock::time_point columnTime(sqlite3_stmt *stmt, int index)
{
    return fromEpochSeconds(sqlite3_column_int64(stmt, index));
}

Measurements columnMeasurements(sqlite3_stmt *stmt, int first)
{
    Measurements measurements;
    int index = first;
    for (MeasurementField field : kMeasurementFields) {
        measurements.*field = columnOptionalReal(stmt, index++);
    }
    return measurements;
}

std::string placeholders(int count)
{
    std::string out;
    for (int i = 0; i < count; ++i) {
        out += i == 0 ? "?" : ", ?";
    }
    return out;
}

Location readLocation(sqlite3_stmt *stmt)
{
    Location location;
    location.id = columnText(stmt, 0);
    location.name = columnText(stmt, 1);
    location.district = columnText(stmt, 2);
    location.region = columnText(stmt, 3);
    location.latitude = sqlite3_column_double(stmt, 4);
    location.longitude = sqlite3_column_double(stmt, 5);
    location.elevationMeters = columnOptionalReal(stmt, 6);
    return location;
}

Reading readReading(sqlite3_stmt *stmt)
{
    Reading reading;
    reading.locationId = columnText(stmt, 0);
    reading.timestamp = columnTime(stmt, 1);
    reading.dataSource = columnText(stmt, 2);
    reading.measurements = columnMeasurements(stmt, 3);
    return reading;
}

ForecastPoint readForecastPoint(sqlite3_stmt *stmt)
{
    ForecastPoint point;
    point.locationId = columnText(stmt, 0);
    point.source = columnText(stmt, 1);
    point.forecastDate = columnTime(stmt, 2);
    point.issuedAt = columnTime(stmt, 3);
    point.confidence = sqlite3_column_double(stmt, 4);
    point.measurements = columnMeasurements(stmt, 5);
    return point;
}

Alert readAlert(sqlite3_stmt *stmt)
{
    Alert alert;
    alert.id = columnText(stmt, 0);
    alert.locationId = columnText(stmt, 1);
    alert.category = parseAlertCategoryString(columnText(stmt, 2));
    alert.severity = parseAlertSeverityString(columnText(stmt, 3));
    alert.condition = columnText(stmt, 4);
    alert.recommendedAction = columnText(stmt, 5);
    alert.state = parseAlertStateString(columnText(stmt, 6));
    alert.createdAt = columnTime(stmt, 7);
    alert.updatedAt = columnTime(stmt, 8);
    if (sqlite3_column_type(stmt, 9) != SQLITE_NULL) {
        alert.resolvedAt = columnTime(stmt, 9);
    }
    alert.resolutionNotes = columnText(stmt, 10);
    return alert;
}

constexpr const char *kLocationSelect =
    "SELECT id, name, district, region, latitude, longitude, elevation FROM locations";

constexpr const char *kAlertSelect =
    "SELECT id, location_id, category, severity, condition, recommended_action, state, "
    "created_at, updated_at, resolved_at, resolution_notes FROM alerts";

std::string readingSelect()
{
    return std::string("SELECT location_id, timestamp, data_source, ") + kMeasurementColumns
        + " FROM readings";
}

std::string forecastSelect()
{
    return std::string("SELECT location_id, source, forecast_date, issued_at, confidence, ")
        + kMeasurementColumns + " FROM forecast_points";
}

} // namespace

struct KrishiStore::Impl {
    sqlite3 *db = nullptr;
    mutable std::mutex mutex;
};

KrishiStore::KrishiStore()
    : impl(std::make_unique<Impl>())
{
    open(defaultDatabasePath());
}

KrishiStore::KrishiStore(const std::string &databasePath)
    : impl(std::make_unique<Impl>())
{
    open(databasePath);
}

KrishiStore::~KrishiStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

std::string KrishiStore::defaultDatabasePath()
{
    const char *home = std::getenv("HOME");
    std::filesystem::path basePath = home ? home : ".";
    basePath /= ".local/share/krishi";
    return (basePath / "krishi.db").string();
}

void KrishiStore::open(const std::string &databasePath)
{
    if (databasePath != ":memory:") {
        const std::filesystem::path parent = std::filesystem::path(databasePath).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw BackendUnavailableError("cannot create database directory "
                                              + parent.string() + ": " + ec.message());
            }
        }
    }

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(databasePath.c_str(), &impl->db, flags, nullptr) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        if (impl->db) {
            sqlite3_close(impl->db);
            impl->db = nullptr;
        }
        throw BackendUnavailableError("failed to open krishi database " + databasePath + ": "
                                      + message);
    }
    sqlite3_busy_timeout(impl->db, 5000);

    execOrThrow(impl->db, kCreateLocationsTable);
    execOrThrow(impl->db, kCreateReadingsTable);
    execOrThrow(impl->db, kCreateReadingsIndex);
    execOrThrow(impl->db, kCreateForecastTable);
    execOrThrow(impl->db, kCreateAlertsTable);
    execOrThrow(impl->db, kCreateActiveAlertIndex);
    execOrThrow(impl->db, kCreateAlertTransitionsTable);
    execOrThrow(impl->db, kCreateMetaTable);

    if (!getMeta("schema_version")) {
        setMeta("schema_version", kSchemaVersion);
    }

    KRLOG_INFO(QStringLiteral("KrishiStore"),
               QStringLiteral("open"),
               QStringLiteral("store_opened"),
               QStringLiteral("startup"),
               QStringLiteral("sqlite"),
               nlohmann::json{{"path", databasePath}});
}

std::vector<Location> KrishiStore::listLocations()
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, std::string(kLocationSelect) + " ORDER BY id ASC;");
    std::vector<Location> locations;
    while (stmt.step()) {
        locations.push_back(readLocation(stmt.get()));
    }
    return locations;
}

std::optional<Location> KrishiStore::getLocation(const std::string &locationId)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, std::string(kLocationSelect) + " WHERE id = ?;");
    bindText(stmt.get(), 1, locationId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readLocation(stmt.get());
}

void KrishiStore::upsertLocation(const Location &location)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO locations (id, name, district, region, latitude, "
                   "longitude, elevation) VALUES (?, ?, ?, ?, ?, ?, ?);");
    bindText(stmt.get(), 1, location.id);
    bindText(stmt.get(), 2, location.name);
    bindText(stmt.get(), 3, location.district);
    bindText(stmt.get(), 4, location.region);
    sqlite3_bind_double(stmt.get(), 5, location.latitude);
    sqlite3_bind_double(stmt.get(), 6, location.longitude);
    bindOptionalReal(stmt.get(), 7, location.elevationMeters);
    stmt.execute("upsert location");
}

std::optional<Reading> KrishiStore::latestReading(const std::string &locationId)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, readingSelect()
                   + " WHERE location_id = ? ORDER BY timestamp DESC, id DESC LIMIT 1;");
    bindText(stmt.get(), 1, locationId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readReading(stmt.get());
}

std::vector<Reading> KrishiStore::readingsBetween(
    const std::string &locationId,
    std::chrono::system_clock::time_point from,
    std::chrono::system_clock::time_point to)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, readingSelect()
                   + " WHERE location_id = ? AND timestamp >= ? AND timestamp <= ?"
                     " ORDER BY timestamp ASC, id ASC;");
    bindText(stmt.get(), 1, locationId);
    bindTime(stmt.get(), 2, from);
    bindTime(stmt.get(), 3, to);

    std::vector<Reading> readings;
    while (stmt.step()) {
        readings.push_back(readReading(stmt.get()));
    }
    return readings;
}

void KrishiStore::addReading(const Reading &reading)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, std::string("INSERT INTO readings (location_id, timestamp, "
                                         "data_source, ")
                   + kMeasurementColumns + ") VALUES ("
                   + placeholders(3 + kMeasurementCount) + ");");
    bindText(stmt.get(), 1, reading.locationId);
    bindTime(stmt.get(), 2, reading.timestamp);
    bindOptionalText(stmt.get(), 3, reading.dataSource);
    bindMeasurements(stmt.get(), 4, reading.measurements);
    stmt.execute("insert reading");
}

std::vector<ForecastPoint> KrishiStore::forecastPointsFrom(
    const std::string &locationId,
    std::chrono::system_clock::time_point fromDate)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, forecastSelect()
                   + " WHERE location_id = ? AND forecast_date >= ?"
                     " ORDER BY forecast_date ASC, source ASC, issued_at ASC;");
    bindText(stmt.get(), 1, locationId);
    bindTime(stmt.get(), 2, fromDate);

    std::vector<ForecastPoint> points;
    while (stmt.step()) {
        points.push_back(readForecastPoint(stmt.get()));
    }
    return points;
}

void KrishiStore::upsertForecastPoints(const std::vector<ForecastPoint> &points)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    execOrThrow(impl->db, "BEGIN IMMEDIATE;");
    try {
        Statement stmt(impl->db, std::string("INSERT OR REPLACE INTO forecast_points "
                                             "(location_id, source, forecast_date, issued_at, "
                                             "confidence, ")
                       + kMeasurementColumns + ") VALUES ("
                       + placeholders(5 + kMeasurementCount) + ");");
        for (const auto &point : points) {
            sqlite3_reset(stmt.get());
            sqlite3_clear_bindings(stmt.get());
            bindText(stmt.get(), 1, point.locationId);
            bindText(stmt.get(), 2, point.source);
            bindTime(stmt.get(), 3, point.forecastDate);
            bindTime(stmt.get(), 4, point.issuedAt);
            sqlite3_bind_double(stmt.get(), 5, point.confidence);
            bindMeasurements(stmt.get(), 6, point.measurements);
            stmt.execute("upsert forecast point");
        }
    } catch (const KrishiError &) {
        sqlite3_exec(impl->db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
    execOrThrow(impl->db, "COMMIT;");
}

std::vector<Alert> KrishiStore::listAlerts(const std::string &locationId,
                                           std::optional<AlertState> state)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    std::string sql = std::string(kAlertSelect) + " WHERE location_id = ?";
    if (state) {
        sql += " AND state = ?";
    }
    sql += " ORDER BY created_at ASC, id ASC;";

    Statement stmt(impl->db, sql);
    bindText(stmt.get(), 1, locationId);
    if (state) {
        bindText(stmt.get(), 2, toAlertStateString(*state));
    }

    std::vector<Alert> alerts;
    while (stmt.step()) {
        alerts.push_back(readAlert(stmt.get()));
    }
    return alerts;
}

std::optional<Alert> KrishiStore::getAlert(const std::string &alertId)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, std::string(kAlertSelect) + " WHERE id = ?;");
    bindText(stmt.get(), 1, alertId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readAlert(stmt.get());
}

void KrishiStore::saveAlert(const Alert &alert)
{
    // Not INSERT OR REPLACE: REPLACE would delete a conflicting Active row
    // instead of failing on the single-active index.
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT INTO alerts (id, location_id, category, severity, "
                   "condition, recommended_action, state, created_at, updated_at, "
                   "resolved_at, resolution_notes) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
                   "ON CONFLICT (id) DO UPDATE SET location_id = excluded.location_id, "
                   "category = excluded.category, severity = excluded.severity, "
                   "condition = excluded.condition, "
                   "recommended_action = excluded.recommended_action, "
                   "state = excluded.state, created_at = excluded.created_at, "
                   "updated_at = excluded.updated_at, resolved_at = excluded.resolved_at, "
                   "resolution_notes = excluded.resolution_notes;");
    bindText(stmt.get(), 1, alert.id);
    bindText(stmt.get(), 2, alert.locationId);
    bindText(stmt.get(), 3, toAlertCategoryString(alert.category));
    bindText(stmt.get(), 4, toAlertSeverityString(alert.severity));
    bindOptionalText(stmt.get(), 5, alert.condition);
    bindOptionalText(stmt.get(), 6, alert.recommendedAction);
    bindText(stmt.get(), 7, toAlertStateString(alert.state));
    bindTime(stmt.get(), 8, alert.createdAt);
    bindTime(stmt.get(), 9, alert.updatedAt);
    if (alert.resolvedAt) {
        bindTime(stmt.get(), 10, *alert.resolvedAt);
    } else {
        sqlite3_bind_null(stmt.get(), 10);
    }
    bindOptionalText(stmt.get(), 11, alert.resolutionNotes);
    stmt.execute("save alert");
}

void KrishiStore::addAlertTransition(const AlertTransition &transition)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT INTO alert_transitions (id, alert_id, location_id, category, "
                   "from_state, to_state, severity, reason, timestamp) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
    bindText(stmt.get(), 1, transition.id);
    bindText(stmt.get(), 2, transition.alertId);
    bindText(stmt.get(), 3, transition.locationId);
    bindText(stmt.get(), 4, toAlertCategoryString(transition.category));
    bindText(stmt.get(), 5, transition.fromState);
    bindText(stmt.get(), 6, transition.toState);
    bindText(stmt.get(), 7, toAlertSeverityString(transition.severity));
    bindOptionalText(stmt.get(), 8, transition.reason);
    bindTime(stmt.get(), 9, transition.timestamp);
    stmt.execute("insert alert transition");
}

std::vector<AlertTransition> KrishiStore::alertTransitions(const std::string &alertId)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT id, alert_id, location_id, category, from_state, to_state, "
                   "severity, reason, timestamp FROM alert_transitions "
                   "WHERE alert_id = ? ORDER BY timestamp ASC, rowid ASC;");
    bindText(stmt.get(), 1, alertId);

    std::vector<AlertTransition> transitions;
    while (stmt.step()) {
        AlertTransition transition;
        transition.id = columnText(stmt.get(), 0);
        transition.alertId = columnText(stmt.get(), 1);
        transition.locationId = columnText(stmt.get(), 2);
        transition.category = parseAlertCategoryString(columnText(stmt.get(), 3));
        transition.fromState = columnText(stmt.get(), 4);
        transition.toState = columnText(stmt.get(), 5);
        transition.severity = parseAlertSeverityString(columnText(stmt.get(), 6));
        transition.reason = columnText(stmt.get(), 7);
        transition.timestamp = columnTime(stmt.get(), 8);
        transitions.push_back(transition);
    }
    return transitions;
}

std::optional<std::string> KrishiStore::getMeta(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "SELECT value FROM meta WHERE key = ?;");
    bindText(stmt.get(), 1, key);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return columnText(stmt.get(), 0);
}

void KrishiStore::setMeta(const std::string &key, const std::string &value)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);
    stmt.execute("set meta");
}

} // namespace krishi
