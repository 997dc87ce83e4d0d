#include "StateStore.hpp"
#include "../common/Log.hpp"

#include <cstdlib>

namespace netscout::monitor
{
    namespace
    {
        void BindOptionalText(sqlite3_stmt *stmt, int index, const std::optional<std::string> &value)
        {
            if (value)
                sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
            else
                sqlite3_bind_null(stmt, index);
        }

        std::optional<std::string> ColumnOptionalText(sqlite3_stmt *stmt, int column)
        {
            if (sqlite3_column_type(stmt, column) == SQLITE_NULL)
                return std::nullopt;
            const unsigned char *text = sqlite3_column_text(stmt, column);
            if (!text)
                return std::nullopt;
            return std::string(reinterpret_cast<const char *>(text));
        }
    }

    StateStore::StateStore() : db_(nullptr) {}

    StateStore::~StateStore()
    {
        Close();
    }

    bool StateStore::Exec(const char *sql)
    {
        char *err_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            common::LogError("DB") << "SQL error: " << (err_msg ? err_msg : "unknown");
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    bool StateStore::Open(const std::string &db_path)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);

        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }

        if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK)
        {
            common::LogError("DB") << "Open failed: " << sqlite3_errmsg(db_);
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }

        sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

        const char *sql_tables =
            "CREATE TABLE IF NOT EXISTS devices ("
            "position INTEGER NOT NULL, "
            "ip TEXT PRIMARY KEY, "
            "mac TEXT, "
            "response_time_ms REAL, "
            "hostname TEXT, "
            "vendor TEXT, "
            "device_type TEXT"
            ");"

            "CREATE TABLE IF NOT EXISTS settings ("
            "key TEXT PRIMARY KEY, "
            "value TEXT NOT NULL"
            ");";

        if (!Exec(sql_tables))
        {
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }
        return true;
    }

    void StateStore::Close()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    bool StateStore::IsOpen()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        return db_ != nullptr;
    }

    SchedulerState StateStore::Load()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        SchedulerState state;
        if (!db_)
            return state;

        const char *sql_devices =
            "SELECT ip, mac, response_time_ms, hostname, vendor, device_type "
            "FROM devices ORDER BY position;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql_devices, -1, &stmt, nullptr) == SQLITE_OK)
        {
            while (sqlite3_step(stmt) == SQLITE_ROW)
            {
                common::Device device;
                device.ip = ColumnOptionalText(stmt, 0).value_or("");
                device.mac = ColumnOptionalText(stmt, 1);
                if (sqlite3_column_type(stmt, 2) != SQLITE_NULL)
                    device.response_time_ms = sqlite3_column_double(stmt, 2);
                device.hostname = ColumnOptionalText(stmt, 3);
                device.vendor = ColumnOptionalText(stmt, 4);
                auto type = ColumnOptionalText(stmt, 5);
                if (type)
                    device.device_type = common::ParseDeviceType(*type);

                if (!device.ip.empty())
                    state.known_devices.push_back(device);
            }
            sqlite3_finalize(stmt);
        }
        else
        {
            common::LogWarn("DB") << "Device query failed: " << sqlite3_errmsg(db_);
        }

        const char *sql_settings = "SELECT key, value FROM settings;";
        if (sqlite3_prepare_v2(db_, sql_settings, -1, &stmt, nullptr) == SQLITE_OK)
        {
            while (sqlite3_step(stmt) == SQLITE_ROW)
            {
                std::string key = ColumnOptionalText(stmt, 0).value_or("");
                std::uint64_t value = std::strtoull(ColumnOptionalText(stmt, 1).value_or("0").c_str(), nullptr, 10);

                if (key == "last_scan_time")
                    state.last_scan_time = value;
                else if (key == "scan_interval_seconds" && value > 0)
                    state.scan_interval_seconds = ClampInterval(value);
                else if (key == "health_check_interval_seconds" && value > 0)
                    state.health_check_interval_seconds = ClampInterval(value);
            }
            sqlite3_finalize(stmt);
        }
        else
        {
            common::LogWarn("DB") << "Settings query failed: " << sqlite3_errmsg(db_);
        }

        return state;
    }

    bool StateStore::SaveSetting(const char *key, const std::string &value)
    {
        const char *sql = "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?);";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
            return false;

        sqlite3_bind_text(stmt, 1, key, -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        return success;
    }

    bool StateStore::Save(const SchedulerState &state)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            return false;

        if (!Exec("BEGIN TRANSACTION;"))
            return false;

        bool ok = Exec("DELETE FROM devices;");

        const char *sql =
            "INSERT OR REPLACE INTO devices (position, ip, mac, response_time_ms, hostname, vendor, device_type) "
            "VALUES (?, ?, ?, ?, ?, ?, ?);";
        sqlite3_stmt *stmt = nullptr;
        if (ok && sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            common::LogError("DB") << "Prepare failed: " << sqlite3_errmsg(db_);
            ok = false;
        }

        int position = 0;
        for (const auto &device : state.known_devices)
        {
            if (!ok)
                break;

            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
            sqlite3_bind_int(stmt, 1, position++);
            sqlite3_bind_text(stmt, 2, device.ip.c_str(), -1, SQLITE_TRANSIENT);
            BindOptionalText(stmt, 3, device.mac);
            if (device.response_time_ms)
                sqlite3_bind_double(stmt, 4, *device.response_time_ms);
            else
                sqlite3_bind_null(stmt, 4);
            BindOptionalText(stmt, 5, device.hostname);
            BindOptionalText(stmt, 6, device.vendor);
            if (device.device_type)
                sqlite3_bind_text(stmt, 7, common::DeviceTypeName(*device.device_type), -1, SQLITE_STATIC);
            else
                sqlite3_bind_null(stmt, 7);

            if (sqlite3_step(stmt) != SQLITE_DONE)
            {
                common::LogError("DB") << "Insert failed for " << device.ip << ": " << sqlite3_errmsg(db_);
                ok = false;
            }
        }
        if (stmt)
            sqlite3_finalize(stmt);

        ok = ok && SaveSetting("last_scan_time", std::to_string(state.last_scan_time));
        ok = ok && SaveSetting("scan_interval_seconds", std::to_string(state.scan_interval_seconds));
        ok = ok && SaveSetting("health_check_interval_seconds", std::to_string(state.health_check_interval_seconds));

        if (!ok)
        {
            Exec("ROLLBACK;");
            return false;
        }
        return Exec("COMMIT;");
    }

    bool StateStore::Clear()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            return false;
        return Exec("DELETE FROM devices;") && Exec("DELETE FROM settings;");
    }
}
