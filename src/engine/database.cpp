#include "database.hpp"
#include "log.hpp"
#include "verity/error.hpp"
#include <cstring>

namespace verity::engine {

    namespace {
        struct Statement {
            sqlite3_stmt* stmt = nullptr;
            ~Statement() { if (stmt) sqlite3_finalize(stmt); }
        };
    }

    Database::Database() = default;
    Database::~Database() { close(); }

    void Database::open(const std::filesystem::path& path) {
        close();
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        if (sqlite3_open(path.c_str(), &m_db) != SQLITE_OK) {
            std::string msg = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            close();
            throw Error(ErrorKind::Connectivity, "cannot open index database '" + path.string() + "': " + msg);
        }
        sqlite3_busy_timeout(m_db, 5000);

        const char* sql =
            "PRAGMA journal_mode=WAL;"
            "CREATE TABLE IF NOT EXISTS collections ("
            "  name TEXT PRIMARY KEY,"
            "  dimension INTEGER NOT NULL,"
            "  metric TEXT NOT NULL"
            ");"
            "CREATE TABLE IF NOT EXISTS points ("
            "  label INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  collection TEXT NOT NULL,"
            "  id TEXT NOT NULL,"
            "  vector BLOB NOT NULL,"
            "  payload TEXT NOT NULL,"
            "  UNIQUE(collection, id)"
            ");"
            "CREATE INDEX IF NOT EXISTS idx_points_collection ON points(collection);";
        try {
            exec(sql);
        } catch (const Error& e) {
            close();
            throw e.wrap(ErrorKind::Connectivity, "index schema");
        }
        log::debug("Database", "Opened " + path.string());
    }

    void Database::close() {
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    void Database::fail(const std::string& what) {
        throw Error(ErrorKind::Index, what + ": " + (m_db ? sqlite3_errmsg(m_db) : "database not open"));
    }

    void Database::exec(const char* sql) {
        if (!m_db) fail("exec");
        char* err_msg = nullptr;
        if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string msg = err_msg ? err_msg : "unknown error";
            sqlite3_free(err_msg);
            throw Error(ErrorKind::Index, "SQL error: " + msg);
        }
    }

    sqlite3_stmt* Database::prepare(const char* sql) {
        if (!m_db) fail("prepare");
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) fail("prepare");
        return stmt;
    }

    void Database::begin() { exec("BEGIN IMMEDIATE;"); }
    void Database::commit() { exec("COMMIT;"); }

    void Database::rollback() {
        if (m_db) sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
    }

    void Database::ping() {
        if (!m_db) throw Error(ErrorKind::Connectivity, "index database not open");
        try {
            Statement s{prepare("SELECT 1;")};
            if (sqlite3_step(s.stmt) != SQLITE_ROW) fail("ping");
        } catch (const Error& e) {
            throw e.wrap(ErrorKind::Connectivity, "index unreachable");
        }
    }

    std::optional<CollectionInfo> Database::get_collection(const std::string& name) {
        Statement s{prepare("SELECT dimension, metric FROM collections WHERE name = ?;")};
        sqlite3_bind_text(s.stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(s.stmt) != SQLITE_ROW) return std::nullopt;
        CollectionInfo info;
        info.dimension = static_cast<size_t>(sqlite3_column_int64(s.stmt, 0));
        info.metric = reinterpret_cast<const char*>(sqlite3_column_text(s.stmt, 1));
        return info;
    }

    void Database::create_collection(const std::string& name, const CollectionInfo& info) {
        Statement s{prepare("INSERT INTO collections (name, dimension, metric) VALUES (?, ?, ?);")};
        sqlite3_bind_text(s.stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(s.stmt, 2, static_cast<sqlite3_int64>(info.dimension));
        sqlite3_bind_text(s.stmt, 3, info.metric.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(s.stmt) != SQLITE_DONE) fail("create collection");
    }

    int64_t Database::upsert_point(const std::string& collection, const std::string& id,
                                   const std::vector<float>& vector, const std::string& payload_json) {
        {
            Statement s{prepare(
                "INSERT INTO points (collection, id, vector, payload) VALUES (?, ?, ?, ?) "
                "ON CONFLICT(collection, id) DO UPDATE SET "
                "vector = excluded.vector, payload = excluded.payload;")};
            sqlite3_bind_text(s.stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(s.stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_blob(s.stmt, 3, vector.data(), static_cast<int>(vector.size() * sizeof(float)), SQLITE_TRANSIENT);
            sqlite3_bind_text(s.stmt, 4, payload_json.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(s.stmt) != SQLITE_DONE) fail("upsert point");
        }

        // last_insert_rowid is not set on the update path.
        Statement s{prepare("SELECT label FROM points WHERE collection = ? AND id = ?;")};
        sqlite3_bind_text(s.stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s.stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(s.stmt) != SQLITE_ROW) fail("read back label");
        return sqlite3_column_int64(s.stmt, 0);
    }

    std::vector<int64_t> Database::delete_where(const std::string& collection, const std::string& field,
                                                const std::string& value) {
        std::vector<int64_t> labels;
        const std::string json_path = "$." + field;
        {
            Statement s{prepare("SELECT label FROM points WHERE collection = ? AND json_extract(payload, ?) = ?;")};
            sqlite3_bind_text(s.stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(s.stmt, 2, json_path.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(s.stmt, 3, value.c_str(), -1, SQLITE_TRANSIENT);
            int rc;
            while ((rc = sqlite3_step(s.stmt)) == SQLITE_ROW) {
                labels.push_back(sqlite3_column_int64(s.stmt, 0));
            }
            if (rc != SQLITE_DONE) fail("select for delete");
        }
        if (labels.empty()) return labels;

        Statement s{prepare("DELETE FROM points WHERE collection = ? AND json_extract(payload, ?) = ?;")};
        sqlite3_bind_text(s.stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s.stmt, 2, json_path.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s.stmt, 3, value.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(s.stmt) != SQLITE_DONE) fail("delete points");
        return labels;
    }

    std::optional<StoredPoint> Database::get_point(const std::string& collection, int64_t label) {
        Statement s{prepare("SELECT id, payload FROM points WHERE collection = ? AND label = ?;")};
        sqlite3_bind_text(s.stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(s.stmt, 2, label);
        if (sqlite3_step(s.stmt) != SQLITE_ROW) return std::nullopt;
        StoredPoint point;
        point.label = label;
        point.id = reinterpret_cast<const char*>(sqlite3_column_text(s.stmt, 0));
        point.payload_json = reinterpret_cast<const char*>(sqlite3_column_text(s.stmt, 1));
        return point;
    }

    size_t Database::count(const std::string& collection) {
        Statement s{prepare("SELECT COUNT(*) FROM points WHERE collection = ?;")};
        sqlite3_bind_text(s.stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(s.stmt) != SQLITE_ROW) fail("count");
        return static_cast<size_t>(sqlite3_column_int64(s.stmt, 0));
    }

    void Database::for_each_vector(const std::string& collection,
                                   const std::function<void(int64_t, const std::vector<float>&)>& callback) {
        Statement s{prepare("SELECT label, vector FROM points WHERE collection = ?;")};
        sqlite3_bind_text(s.stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
        while (sqlite3_step(s.stmt) == SQLITE_ROW) {
            int64_t label = sqlite3_column_int64(s.stmt, 0);
            const void* blob = sqlite3_column_blob(s.stmt, 1);
            int bytes = sqlite3_column_bytes(s.stmt, 1);

            if (blob && bytes > 0) {
                std::vector<float> vec(bytes / sizeof(float));
                std::memcpy(vec.data(), blob, vec.size() * sizeof(float));
                callback(label, vec);
            }
        }
    }

}
