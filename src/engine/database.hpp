#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <functional>
#include <sqlite3.h>

namespace verity::engine {

    struct CollectionInfo {
        size_t dimension = 0;
        std::string metric;
    };

    struct StoredPoint {
        int64_t label = 0;
        std::string id;
        std::string payload_json;
    };

    /**
     * @brief SQLite persistence for collections and their points.
     * Every point gets a stable integer label that the graph uses as its key.
     */
    class Database {
    public:
        Database();
        ~Database();

        Database(const Database&) = delete;
        Database& operator=(const Database&) = delete;

        /**
         * @throws verity::Error (Connectivity)
         */
        void open(const std::filesystem::path& path);
        void close();

        std::optional<CollectionInfo> get_collection(const std::string& name);
        void create_collection(const std::string& name, const CollectionInfo& info);

        void begin();
        void commit();
        void rollback();

        /**
         * @brief Inserts the point or replaces the one with the same id.
         * @return The label of the stored row.
         */
        int64_t upsert_point(const std::string& collection, const std::string& id,
                             const std::vector<float>& vector, const std::string& payload_json);

        /**
         * @brief Deletes points whose JSON payload field equals value.
         * @return Labels of the removed rows.
         */
        std::vector<int64_t> delete_where(const std::string& collection, const std::string& field,
                                          const std::string& value);

        std::optional<StoredPoint> get_point(const std::string& collection, int64_t label);

        size_t count(const std::string& collection);

        /**
         * @brief Callback for iterating all vectors of a collection.
         * Function signature: (label, vector)
         */
        void for_each_vector(const std::string& collection,
                             const std::function<void(int64_t, const std::vector<float>&)>& callback);

        /**
         * @brief Runs a trivial query; throws Connectivity when it fails.
         */
        void ping();

    private:
        sqlite3* m_db = nullptr;

        void exec(const char* sql);
        sqlite3_stmt* prepare(const char* sql);
        [[noreturn]] void fail(const std::string& what);
    };

}
