#pragma once

#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id = 0;            // assigned by the database
    std::string timestamp;     // assigned by the database
    uint64_t session_id = 0;
    std::string text;
    double audio_duration = 0.0;
    double processing_time = 0.0;
    std::string backend;
    std::string outcome;       // pasted, discarded or failed
    std::string error;
};

// Written from transcription workers, read from the event loop.
class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const;

    // Ignores entry.id and entry.timestamp.
    bool insert(const HistoryEntry& entry);

    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    mutable std::mutex mu_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
