// File: DatabaseManager.hpp
// Description: Hands out PostgreSQL connections to the repositories.
// One connection per unit of work; the repositories run on worker threads
// so a slow query never blocks the network loop.
#pragma once

#include <pqxx/pqxx>
#include <string>
#include <memory>
#include <stdexcept>
#include <iostream>

class DatabaseManager {
private:
    std::string connection_string_;

public:
    explicit DatabaseManager(const std::string& conn_str)
        : connection_string_(conn_str) {
        try {
            // Fail at startup rather than on the first save
            pqxx::connection C(connection_string_);
            std::cout << "[DB] Connected to database: " << C.dbname() << std::endl;
        }
        catch (const std::exception& e) {
            std::cerr << "[DB] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    pqxx::connection get_connection() {
        try {
            return pqxx::connection(connection_string_);
        }
        catch (const std::exception& e) {
            std::cerr << "[DB] Failed to open connection: " << e.what() << std::endl;
            throw std::runtime_error("Could not connect to database.");
        }
    }

    // Creates the campaign tables if they are missing
    void ensure_schema(const std::string& ddl) {
        pqxx::connection C = get_connection();
        pqxx::work W(C);
        W.exec(ddl);
        W.commit();
        std::cout << "[DB] Schema verified." << std::endl;
    }
};
