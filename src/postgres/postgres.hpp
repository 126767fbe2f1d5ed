#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <pqxx/pqxx>
#include "utils.hpp"

// Shared PostgreSQL connection. libpqxx connections are not thread-safe,
// so every use goes through run() under one lock. A broken connection is
// dropped and reopened on the next call.
class Postgres {
    private:
        std::string conninfo;
        std::unique_ptr<pqxx::connection> conn;
        std::mutex mutex;

        pqxx::connection& connection();

    public:
        explicit Postgres(const std::string& conninfo);

        ~Postgres();

        Postgres(const Postgres&) = delete;
        Postgres& operator=(const Postgres&) = delete;

        template <typename F>
        auto run(F&& f) -> decltype(f(std::declval<pqxx::connection&>())) {
            std::lock_guard<std::mutex> lock(mutex);
            try {
                return f(connection());
            } catch (const pqxx::broken_connection&) {
                conn.reset();
                throw;
            }
        }

        // Creates the vector extension and the rollcall tables if absent.
        void ensure_schema(size_t embedding_dim);
};
