#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

class Statement;

// Owns one SQLite connection shared by every room. Callers hold `acquire()`
// for the duration of a statement sequence; rooms never see each other's rows.
class Database {
public:
    explicit Database(const std::string &path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    std::unique_lock<std::mutex> acquire();

    void execute(std::string_view sql);
    Statement prepare(std::string_view sql);
    std::int64_t last_insert_id() const;
    std::size_t changes() const;
    // Moves WAL content into the main database file.
    void checkpoint();


private:
    friend class Statement;
    [[noreturn]] void fail(std::string_view what) const;

    std::string m_path;
    sqlite3 *m_db = nullptr;
    std::mutex m_mutex;
};

class Statement {
public:
    Statement(Database &db, std::string_view sql);
    ~Statement();

    Statement(Statement &&other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement& operator=(Statement&&) = delete;

    Statement &bind(int index, std::string_view value);
    Statement &bind(int index, std::int64_t value);

    // true while a row is available
    bool step();
    void run();

    std::string column_text(int index) const;
    std::int64_t column_int(int index) const;

private:
    Database *m_db;
    sqlite3_stmt *m_stmt = nullptr;
};

// BEGIN IMMEDIATE on construction, ROLLBACK unless commit() was called.
class Transaction {
public:
    explicit Transaction(Database &db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database &m_db;
    bool m_done = false;
};
