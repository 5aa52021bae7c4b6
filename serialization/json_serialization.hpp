#ifndef NETDECLUTTER_SERIALIZATION_JSON_SERIALIZATION_HPP
#define NETDECLUTTER_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include "config_json.hpp"
#include "network_graph_json.hpp"
#include "diagnostics_json.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace netdeclutter::json {

// Bumped whenever a document field changes meaning
constexpr const char* FORMAT_VERSION = "1";

enum class DocumentKind {
    Config,
    Layout
};

NLOHMANN_JSON_SERIALIZE_ENUM(DocumentKind, {
    {DocumentKind::Config, "config"},
    {DocumentKind::Layout, "layout"},
})

// Everything needed to reproduce a run
struct RunConfig {
    NetworkBuildConfig build;
    DeclutterParams params;
    double visual_radius = 0.0;   // Applied to every node before solving
};

// Outcome of a run, as stored next to the layout
struct RunSummary {
    size_t node_count = 0;
    size_t edge_count = 0;
    StopReason stop_reason = StopReason::Running;
    int steps = 0;
    double initial_energy = 0.0;
    double final_energy = 0.0;
    DiagnosticsSample final_sample;
};

// A relaxed network together with how it was produced
struct LayoutDocument {
    std::string version = FORMAT_VERSION;
    std::string timestamp;
    RunConfig config;
    RunSummary summary;
    NetworkGraph graph;
    std::vector<DiagnosticsSample> diagnostics;
};

inline void to_json(nlohmann::json& j, const RunConfig& config) {
    j = {
        {"build", config.build},
        {"params", config.params},
        {"visual_radius", config.visual_radius}
    };
}

inline void from_json(const nlohmann::json& j, RunConfig& config) {
    if (j.contains("build")) {
        config.build = j["build"].get<NetworkBuildConfig>();
    }
    if (j.contains("params")) {
        config.params = j["params"].get<DeclutterParams>();
    }
    config.visual_radius = j.value("visual_radius", 0.0);
}

inline void to_json(nlohmann::json& j, const RunSummary& summary) {
    j = {
        {"node_count", summary.node_count},
        {"edge_count", summary.edge_count},
        {"stop_reason", summary.stop_reason},
        {"steps", summary.steps},
        {"initial_energy", summary.initial_energy},
        {"final_energy", summary.final_energy},
        {"final", summary.final_sample}
    };
}

inline void from_json(const nlohmann::json& j, RunSummary& summary) {
    summary.node_count = j.value("node_count", size_t{0});
    summary.edge_count = j.value("edge_count", size_t{0});
    summary.stop_reason = j.value("stop_reason", StopReason::Running);
    summary.steps = j.value("steps", 0);
    summary.initial_energy = j.value("initial_energy", 0.0);
    summary.final_energy = j.value("final_energy", 0.0);
    if (j.contains("final")) {
        summary.final_sample = j["final"].get<DiagnosticsSample>();
    }
}

// Get current timestamp in ISO 8601 format
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline nlohmann::json config_to_json(const RunConfig& config) {
    nlohmann::json j = config;
    j["kind"] = DocumentKind::Config;
    j["version"] = FORMAT_VERSION;
    return j;
}

// Accepts a config document, a layout document (its embedded config), or
// an untagged file with any of the config sections
inline RunConfig config_from_json(const nlohmann::json& j) {
    if (j.contains("kind") && j["kind"].get<DocumentKind>() == DocumentKind::Layout) {
        if (!j.contains("config")) {
            throw std::runtime_error("Layout document has no \"config\" section");
        }
        return j["config"].get<RunConfig>();
    }
    return j.get<RunConfig>();
}

inline nlohmann::json layout_to_json(const LayoutDocument& doc) {
    nlohmann::json j;
    j["kind"] = DocumentKind::Layout;
    j["version"] = doc.version;
    if (!doc.timestamp.empty()) j["timestamp"] = doc.timestamp;
    j["config"] = doc.config;
    j["summary"] = doc.summary;
    j["graph"] = network_graph_to_json(doc.graph);
    j["diagnostics"] = diagnostics_to_json(doc.diagnostics);
    return j;
}

inline LayoutDocument layout_from_json(const nlohmann::json& j) {
    if (!j.contains("kind") || j["kind"].get<DocumentKind>() != DocumentKind::Layout) {
        throw std::runtime_error("Not a layout document (kind = " +
                                 j.value("kind", std::string("missing")) + ")");
    }
    if (!j.contains("graph")) {
        throw std::runtime_error("Layout document has no \"graph\" section");
    }

    LayoutDocument doc;
    doc.version = j.value("version", std::string("unknown"));
    doc.timestamp = j.value("timestamp", std::string());
    if (j.contains("config")) {
        doc.config = j["config"].get<RunConfig>();
    }
    if (j.contains("summary")) {
        doc.summary = j["summary"].get<RunSummary>();
    }
    doc.graph = network_graph_from_json(j["graph"]);
    if (j.contains("diagnostics")) {
        for (const auto& sample : j["diagnostics"]) {
            doc.diagnostics.push_back(sample.get<DiagnosticsSample>());
        }
    }
    return doc;
}

// Write JSON to file
inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2);
}

inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    nlohmann::json j;
    file >> j;
    return j;
}

inline void write_layout(const std::string& path, const LayoutDocument& doc) {
    write_json_file(path, layout_to_json(doc));
}

inline LayoutDocument read_layout(const std::string& path) {
    return layout_from_json(read_json_file(path));
}

inline RunConfig read_config(const std::string& path) {
    return config_from_json(read_json_file(path));
}

}  // namespace netdeclutter::json

#endif // NETDECLUTTER_SERIALIZATION_JSON_SERIALIZATION_HPP
