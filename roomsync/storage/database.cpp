#include "storage/database.hpp"
#include <filesystem>
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include "errors.hpp"

namespace {

constexpr std::string_view schema = R"sql(
CREATE TABLE IF NOT EXISTS rooms (
    id TEXT PRIMARY KEY,
    name TEXT NOT NULL,
    created_at INTEGER NOT NULL,
    max_players INTEGER DEFAULT 4,
    is_custom INTEGER DEFAULT 0
);
CREATE TABLE IF NOT EXISTS chat_messages (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    room_id TEXT NOT NULL,
    player_id TEXT NOT NULL,
    player_name TEXT NOT NULL,
    message TEXT NOT NULL,
    timestamp INTEGER NOT NULL,
    FOREIGN KEY(room_id) REFERENCES rooms(id)
);
CREATE TABLE IF NOT EXISTS canvas_snapshots (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    room_id TEXT NOT NULL,
    snapshot_data TEXT NOT NULL,
    timestamp INTEGER NOT NULL,
    FOREIGN KEY(room_id) REFERENCES rooms(id)
);
CREATE TABLE IF NOT EXISTS drawing_events (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    room_id TEXT NOT NULL,
    player_id TEXT NOT NULL,
    event_type TEXT NOT NULL,
    event_data TEXT NOT NULL,
    timestamp INTEGER NOT NULL,
    FOREIGN KEY(room_id) REFERENCES rooms(id)
);
CREATE INDEX IF NOT EXISTS idx_messages_room ON chat_messages(room_id, timestamp);
CREATE INDEX IF NOT EXISTS idx_drawing_room ON drawing_events(room_id, timestamp);
CREATE UNIQUE INDEX IF NOT EXISTS idx_snapshots_room ON canvas_snapshots(room_id);
)sql";

bool is_memory(const std::string &path) {
    return path.empty() || path == ":memory:";
}

}

Database::Database(const std::string &path)
    : m_path(path) {
    if(!is_memory(m_path)){
        auto parent = std::filesystem::path(m_path).parent_path();
        std::error_code ec;
        if(!parent.empty()) std::filesystem::create_directories(parent, ec);
        if(ec) throw PersistenceError("cannot create " + parent.string() + ": " + ec.message());
    }
    int rc = sqlite3_open_v2(
        is_memory(m_path) ? ":memory:" : m_path.c_str(),
        &m_db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr);
    if(rc != SQLITE_OK){
        std::string message = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
        sqlite3_close(m_db);
        m_db = nullptr;
        throw PersistenceError("cannot open database " + m_path + ": " + message);
    }
    sqlite3_busy_timeout(m_db, 5000);
    if(!is_memory(m_path)){
        execute("PRAGMA journal_mode=WAL");
    }
    execute(schema);
    spdlog::info("[DB] Opened {}", is_memory(m_path) ? ":memory:" : m_path);
}

Database::~Database() {
    if(m_db){
        sqlite3_close(m_db);
    }
}

std::unique_lock<std::mutex> Database::acquire() {
    return std::unique_lock(m_mutex);
}

void Database::execute(std::string_view sql) {
    char *error = nullptr;
    std::string text(sql);
    if(sqlite3_exec(m_db, text.c_str(), nullptr, nullptr, &error) != SQLITE_OK){
        std::string message = error ? error : "unknown error";
        sqlite3_free(error);
        throw PersistenceError(message);
    }
}

Statement Database::prepare(std::string_view sql) {
    return Statement(*this, sql);
}

std::int64_t Database::last_insert_id() const {
    return sqlite3_last_insert_rowid(m_db);
}

std::size_t Database::changes() const {
    return static_cast<std::size_t>(sqlite3_changes(m_db));
}

void Database::checkpoint() {
    if(is_memory(m_path)) return;
    if(sqlite3_wal_checkpoint_v2(m_db, nullptr, SQLITE_CHECKPOINT_PASSIVE, nullptr, nullptr) != SQLITE_OK){
        fail("checkpoint");
    }
}


void Database::fail(std::string_view what) const {
    throw PersistenceError(std::string(what) + ": " + sqlite3_errmsg(m_db));
}

Statement::Statement(Database &db, std::string_view sql)
    : m_db(&db) {
    if(sqlite3_prepare_v2(db.m_db, sql.data(), static_cast<int>(sql.size()), &m_stmt, nullptr) != SQLITE_OK){
        db.fail("prepare");
    }
}

Statement::~Statement() {
    sqlite3_finalize(m_stmt);
}

Statement::Statement(Statement &&other) noexcept
    : m_db(other.m_db), m_stmt(other.m_stmt) {
    other.m_stmt = nullptr;
}

Statement &Statement::bind(int index, std::string_view value) {
    if(sqlite3_bind_text(m_stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK){
        m_db->fail("bind");
    }
    return *this;
}

Statement &Statement::bind(int index, std::int64_t value) {
    if(sqlite3_bind_int64(m_stmt, index, value) != SQLITE_OK){
        m_db->fail("bind");
    }
    return *this;
}

bool Statement::step() {
    switch(sqlite3_step(m_stmt)){
        case SQLITE_ROW: return true;
        case SQLITE_DONE: return false;
        default: m_db->fail("step");
    }
}

void Statement::run() {
    while(step()){}
}

std::string Statement::column_text(int index) const {
    auto text = reinterpret_cast<const char *>(sqlite3_column_text(m_stmt, index));
    if(!text) return {};
    return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(m_stmt, index)));
}

std::int64_t Statement::column_int(int index) const {
    return sqlite3_column_int64(m_stmt, index);
}

Transaction::Transaction(Database &db)
    : m_db(db) {
    m_db.execute("BEGIN IMMEDIATE");
}

Transaction::~Transaction() {
    if(m_done) return;
    try{
        m_db.execute("ROLLBACK");
    }catch(const PersistenceError &e){
        spdlog::error("[DB] Rollback failed: {}", e.what());
    }
}

void Transaction::commit() {
    m_db.execute("COMMIT");
    m_done = true;
}
