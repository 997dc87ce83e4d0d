#pragma once

#include "SchedulerState.hpp"

#include <mutex>
#include <string>
#include <sqlite3.h>

namespace netscout::monitor
{
    // SQLite persistence for the scheduler: the known device set plus the
    // scan bookkeeping in a key/value settings table.
    class StateStore
    {
    private:
        sqlite3 *db_;
        std::mutex db_mutex_;

        bool Exec(const char *sql);
        bool SaveSetting(const char *key, const std::string &value);

    public:
        StateStore();
        ~StateStore();

        StateStore(const StateStore &) = delete;
        StateStore &operator=(const StateStore &) = delete;

        // ":memory:" gives a private in-memory database.
        bool Open(const std::string &db_path);
        void Close();
        bool IsOpen();

        // Defaults for anything missing or unreadable.
        SchedulerState Load();

        // Replaces the stored state in one transaction.
        bool Save(const SchedulerState &state);

        bool Clear();
    };
}
