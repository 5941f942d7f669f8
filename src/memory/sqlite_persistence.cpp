/*
 * agentmem - SQLite Snapshot Persistence Implementation
 */
#include <agentmem/memory/sqlite_persistence.hpp>
#include <agentmem/memory/serialization.hpp>
#include <agentmem/core/utils.hpp>
#include <agentmem/core/logger.hpp>
#include <stdexcept>

namespace agentmem {

SqlitePersistence::SqlitePersistence()
    : db_(nullptr)
{
}

SqlitePersistence::~SqlitePersistence() {
    close();
}

bool SqlitePersistence::open(const std::string& db_path) {
    if (db_) {
        close();
    }
    
    std::string dir = dirname(db_path);
    if (!dir.empty() && dir != "." && !mkdir_p(dir)) {
        set_error("cannot create directory " + dir);
        return false;
    }
    
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        set_error_from_db();
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("SqlitePersistence: cannot open %s: %s", db_path.c_str(), last_error_.c_str());
        return false;
    }
    
    if (!exec("PRAGMA journal_mode=WAL") || !exec("PRAGMA synchronous=NORMAL")) {
        LOG_WARN("SqlitePersistence: pragma setup failed: %s", last_error_.c_str());
    }
    
    if (!ensure_schema()) {
        LOG_ERROR("SqlitePersistence: schema setup failed: %s", last_error_.c_str());
        close();
        return false;
    }
    return true;
}

void SqlitePersistence::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqlitePersistence::is_open() const {
    return db_ != nullptr;
}

bool SqlitePersistence::ensure_schema() {
    if (!exec(
        "CREATE TABLE IF NOT EXISTS meta ("
        "  key TEXT PRIMARY KEY,"
        "  value TEXT"
        ")"
    )) return false;
    
    if (!exec(
        "CREATE TABLE IF NOT EXISTS memories ("
        "  id TEXT PRIMARY KEY,"
        "  tier TEXT NOT NULL,"
        "  timestamp INTEGER NOT NULL,"
        "  source TEXT,"
        "  content TEXT,"
        "  payload TEXT"
        ")"
    )) return false;
    
    if (!exec("CREATE INDEX IF NOT EXISTS idx_memories_tier ON memories(tier, timestamp)")) return false;
    
    return set_meta("schema_version", std::to_string(SNAPSHOT_FORMAT_VERSION));
}

bool SqlitePersistence::insert_item(sqlite3_stmt* stmt, const MemoryItem& item) {
    Json payload = tier_attributes_to_json(item);
    payload.set("metadata", item.metadata);
    
    std::string tier = memory_tier_to_string(item.tier);
    std::string payload_str = payload.dump();
    
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    sqlite3_bind_text(stmt, 1, item.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, tier.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, item.timestamp);
    sqlite3_bind_text(stmt, 4, item.source.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, item.content.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, payload_str.c_str(), -1, SQLITE_TRANSIENT);
    
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

bool SqlitePersistence::save_all(const std::vector<MemoryItem>& items) {
    if (!db_) {
        set_error("Database not open");
        return false;
    }
    
    if (!exec("BEGIN IMMEDIATE")) return false;
    
    bool ok = exec("DELETE FROM memories");
    
    sqlite3_stmt* stmt = nullptr;
    if (ok) {
        const char* sql =
            "INSERT INTO memories (id, tier, timestamp, source, content, payload) "
            "VALUES (?, ?, ?, ?, ?, ?)";
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            set_error_from_db();
            ok = false;
        }
    }
    
    for (size_t i = 0; ok && i < items.size(); ++i) {
        ok = insert_item(stmt, items[i]);
    }
    if (stmt) {
        sqlite3_finalize(stmt);
    }
    
    if (ok) {
        ok = set_meta("saved_at", std::to_string(current_timestamp_ms())) && exec("COMMIT");
    }
    if (!ok) {
        std::string error = last_error_;
        if (!exec("ROLLBACK")) {
            LOG_WARN("SqlitePersistence: rollback failed: %s", last_error_.c_str());
        }
        last_error_ = error;
        LOG_ERROR("SqlitePersistence: snapshot save failed: %s", error.c_str());
        return false;
    }
    
    LOG_DEBUG("SqlitePersistence: saved %d items", static_cast<int>(items.size()));
    return true;
}

bool SqlitePersistence::load_all(std::vector<MemoryItem>& items) {
    if (!db_) {
        set_error("Database not open");
        return false;
    }
    
    const char* sql =
        "SELECT id, tier, timestamp, source, content, payload FROM memories "
        "ORDER BY timestamp, rowid";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    
    std::vector<MemoryItem> loaded;
    bool ok = true;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        MemoryItem item;
        const char* id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        const char* tier = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        const char* source = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3));
        const char* content = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 4));
        const char* payload = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 5));
        
        std::string tier_str = tier ? tier : "";
        if (!string_to_memory_tier(tier_str, item.tier)) {
            set_error("row has unknown tier '" + tier_str + "'");
            ok = false;
            break;
        }
        item.id = id ? id : "";
        item.timestamp = sqlite3_column_int64(stmt, 2);
        item.source = source ? source : "";
        item.content = content ? content : "";
        
        Json attrs;
        try {
            attrs = Json::parse(payload ? payload : "{}");
        } catch (const std::exception& e) {
            set_error("corrupt payload for " + item.id + ": " + e.what());
            ok = false;
            break;
        }
        tier_attributes_from_json(attrs, item);
        if (attrs["metadata"].is_object()) {
            item.metadata = attrs["metadata"];
        }
        loaded.push_back(item);
    }
    if (ok && rc != SQLITE_DONE) {
        set_error_from_db();
        ok = false;
    }
    sqlite3_finalize(stmt);
    
    if (!ok) {
        LOG_ERROR("SqlitePersistence: snapshot load failed: %s", last_error_.c_str());
        return false;
    }
    items.swap(loaded);
    return true;
}

bool SqlitePersistence::clear() {
    if (!db_) {
        set_error("Database not open");
        return false;
    }
    return exec("DELETE FROM memories");
}

int64_t SqlitePersistence::count() {
    if (!db_) return -1;
    
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM memories", -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return -1;
    }
    int64_t n = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        n = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return n;
}

bool SqlitePersistence::set_meta(const std::string& key, const std::string& value) {
    if (!db_) return false;
    
    const char* sql = "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?)";
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

std::string SqlitePersistence::get_meta(const std::string& key, const std::string& default_val) {
    if (!db_) return default_val;
    
    const char* sql = "SELECT value FROM meta WHERE key = ?";
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return default_val;
    
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    
    std::string result = default_val;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* val = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        if (val) result = val;
    }
    sqlite3_finalize(stmt);
    return result;
}

std::string SqlitePersistence::last_error() const {
    return last_error_;
}

bool SqlitePersistence::exec(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        if (err_msg) {
            last_error_ = err_msg;
            sqlite3_free(err_msg);
        } else {
            set_error_from_db();
        }
        return false;
    }
    return true;
}

void SqlitePersistence::set_error(const std::string& error) {
    last_error_ = error;
}

void SqlitePersistence::set_error_from_db() {
    if (db_) {
        last_error_ = sqlite3_errmsg(db_);
    }
}

} // namespace agentmem
