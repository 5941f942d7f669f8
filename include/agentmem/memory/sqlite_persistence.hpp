/*
 * agentmem - SQLite Snapshot Persistence
 * 
 * One row per memory item. Header fields get their own columns, the
 * tier attributes and metadata travel as a JSON payload.
 */
#ifndef AGENTMEM_MEMORY_SQLITE_PERSISTENCE_HPP
#define AGENTMEM_MEMORY_SQLITE_PERSISTENCE_HPP

#include "persistence.hpp"
#include <string>
#include <vector>
#include <sqlite3.h>

namespace agentmem {

class SqlitePersistence : public MemoryPersistence {
public:
    SqlitePersistence();
    ~SqlitePersistence();
    
    // Opens (creating if needed) and ensures the schema
    bool open(const std::string& db_path);
    void close();
    bool is_open() const;
    
    bool save_all(const std::vector<MemoryItem>& items) override;
    bool load_all(std::vector<MemoryItem>& items) override;
    bool clear() override;
    std::string last_error() const override;
    
    // Number of stored rows, -1 on error
    int64_t count();
    
    bool set_meta(const std::string& key, const std::string& value);
    std::string get_meta(const std::string& key, const std::string& default_val = "");

private:
    sqlite3* db_;
    std::string last_error_;
    
    SqlitePersistence(const SqlitePersistence&);
    SqlitePersistence& operator=(const SqlitePersistence&);
    
    bool ensure_schema();
    bool insert_item(sqlite3_stmt* stmt, const MemoryItem& item);
    bool exec(const std::string& sql);
    void set_error(const std::string& error);
    void set_error_from_db();
};

} // namespace agentmem

#endif // AGENTMEM_MEMORY_SQLITE_PERSISTENCE_HPP
