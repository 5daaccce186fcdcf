/**
 * @file basic_usage.cpp
 * @brief Basic usage example for bulkstream
 */

#include <iostream>

#include <boost/asio/io_context.hpp>

#include <bulkstream/bulkstream.hpp>

int main() {
    std::cout << "bulkstream v" << bulkstream::version() << "\n\n";

    try {
        boost::asio::io_context io;

        // Open a private in-memory database
        bulkstream::SqliteStorage storage(io);
        auto status = storage.open(":memory:");
        if (status.ok()) {
            status = storage.create_schema();
        }
        if (!status.ok()) {
            std::cerr << "Open error: " << status.to_string() << "\n";
            return 1;
        }

        // Two stored patients
        const char* documents[] = {
            R"({"resourceType":"Patient","id":"0b3a1f4e-6c2d-4e8f-9a1b-2c3d4e5f6a7b"})",
            R"({"resourceType":"Patient","id":"7f6e5d4c-3b2a-4190-8f7e-6d5c4b3a2910"})",
        };
        for (const char* json : documents) {
            status = storage.insert_resource({"Patient", json, "2020-01-01T00:00:00Z", ""});
            if (!status.ok()) {
                std::cerr << "Insert error: " << status.to_string() << "\n";
                return 1;
            }
        }

        // Ask for five records: the two stored ones, then replays
        bulkstream::StreamRequest request;
        status = bulkstream::StreamRequest::from_params(
            "1.Patient.ndjson", {{"limit", "5"}, {"m", "3"}},
            bulkstream::process_config(), &request);
        if (!status.ok()) {
            std::cerr << "Request error: " << status.to_string() << "\n";
            return 1;
        }

        bulkstream::ResourceStream stream(io, storage, request);
        stream.on_data([](std::string_view text) { std::cout << text; });
        stream.on_end([&stream]() {
            std::cout << "\n\nStreamed " << stream.rows_emitted() << " records, "
                      << stream.pagination().overflow << " replay round(s)\n";
        });
        stream.on_error([](const bulkstream::Status& error) {
            std::cerr << "Stream error: " << error.to_string() << "\n";
        });
        stream.resume();

        io.run();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
