#ifndef SERPENT_SERIALIZATION_JSON_SERIALIZATION_HPP
#define SERPENT_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace serpent::json {

// Bumped whenever a command's output layout changes
constexpr const char* SERIALIZATION_VERSION = "1.0.0";

// Document written by the dumping commands:
//   { version, step, timestamp?, config?, stats?, data }
// The config section is itself a valid run configuration, so a dump can be
// passed back with -c to replay the run.
struct SerializedData {
    std::string version = SERIALIZATION_VERSION;
    std::string step;
    std::string timestamp;
    nlohmann::json config;
    nlohmann::json stats;
    nlohmann::json data;

    // True for anything that looks like one of our dumps
    static bool is_envelope(const nlohmann::json& j) {
        return j.is_object() && j.contains("step") && j.contains("data");
    }

    nlohmann::json to_json() const {
        nlohmann::json j = {{"version", version}, {"step", step}};
        if (!timestamp.empty()) {
            j["timestamp"] = timestamp;
        }
        if (!config.is_null()) {
            j["config"] = config;
        }
        if (!stats.is_null()) {
            j["stats"] = stats;
        }
        j["data"] = data;
        return j;
    }

    // Throws std::runtime_error when the data section is missing
    static SerializedData from_json(const nlohmann::json& j) {
        if (!j.is_object() || !j.contains("data")) {
            throw std::runtime_error("Serialized document has no data section");
        }
        SerializedData doc;
        doc.version = j.value("version", std::string("unknown"));
        doc.step = j.value("step", std::string("unknown"));
        doc.timestamp = j.value("timestamp", std::string());
        doc.config = j.value("config", nlohmann::json());
        doc.stats = j.value("stats", nlohmann::json());
        doc.data = j.at("data");
        return doc;
    }
};

// UTC, ISO 8601 with a trailing Z
inline std::string get_timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::ostringstream out;
    out << std::put_time(std::gmtime(&now), "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    out << j.dump(2) << "\n";
    if (!out) {
        throw std::runtime_error("Failed while writing: " + path);
    }
}

// Parse errors surface as nlohmann::json::parse_error
inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    return nlohmann::json::parse(in);
}

inline void write_serialized(const std::string& path, const SerializedData& doc) {
    write_json_file(path, doc.to_json());
}

}  // namespace serpent::json

#endif // SERPENT_SERIALIZATION_JSON_SERIALIZATION_HPP
