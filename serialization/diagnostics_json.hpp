#ifndef NETDECLUTTER_SERIALIZATION_DIAGNOSTICS_JSON_HPP
#define NETDECLUTTER_SERIALIZATION_DIAGNOSTICS_JSON_HPP

#include <nlohmann/json.hpp>
#include <declutter/diagnostics.hpp>
#include <cmath>
#include <limits>
#include <vector>

namespace netdeclutter {

// EnergyBreakdown serialization
inline void to_json(nlohmann::json& j, const EnergyBreakdown& e) {
    j = {
        {"spring", e.spring},
        {"repulsion", e.repulsion},
        {"center", e.center},
        {"kinetic", e.kinetic},
        {"total", e.total()}
    };
}

inline void from_json(const nlohmann::json& j, EnergyBreakdown& e) {
    e.spring = j.value("spring", 0.0);
    e.repulsion = j.value("repulsion", 0.0);
    e.center = j.value("center", 0.0);
    e.kinetic = j.value("kinetic", 0.0);
}

// DiagnosticsSample serialization
// JSON has no infinity; an undefined minimum separation is written as null
inline void to_json(nlohmann::json& j, const DiagnosticsSample& s) {
    j = {
        {"step", s.step},
        {"energy", s.energy},
        {"mean_speed", s.mean_speed},
        {"rms_force", s.rms_force},
        {"clamp_hit_fraction", s.clamp_hit_fraction},
        {"force_speed_ratio", s.force_speed_ratio()}
    };
    if (std::isfinite(s.min_pair_separation)) {
        j["min_pair_separation"] = s.min_pair_separation;
    } else {
        j["min_pair_separation"] = nullptr;
    }
}

inline void from_json(const nlohmann::json& j, DiagnosticsSample& s) {
    s.step = j.value("step", 0);
    if (j.contains("energy")) {
        s.energy = j["energy"].get<EnergyBreakdown>();
    }
    s.mean_speed = j.value("mean_speed", 0.0);
    s.rms_force = j.value("rms_force", 0.0);
    s.clamp_hit_fraction = j.value("clamp_hit_fraction", 0.0);
    if (j.contains("min_pair_separation") && !j["min_pair_separation"].is_null()) {
        s.min_pair_separation = j["min_pair_separation"].get<double>();
    } else {
        s.min_pair_separation = std::numeric_limits<double>::infinity();
    }
}

inline nlohmann::json diagnostics_to_json(const std::vector<DiagnosticsSample>& samples) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& s : samples) {
        j.push_back(s);
    }
    return j;
}

}  // namespace netdeclutter

#endif // NETDECLUTTER_SERIALIZATION_DIAGNOSTICS_JSON_HPP
