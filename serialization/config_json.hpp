#ifndef NETDECLUTTER_SERIALIZATION_CONFIG_JSON_HPP
#define NETDECLUTTER_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec2.hpp>
#include <network/network_builder.hpp>
#include <declutter/declutter_params.hpp>
#include <declutter/convergence.hpp>

namespace netdeclutter {

// Vec2 serialization
inline void to_json(nlohmann::json& j, const Vec2& v) {
    j = nlohmann::json::array({v.x, v.y});
}

inline void from_json(const nlohmann::json& j, Vec2& v) {
    v.x = j.at(0).get<double>();
    v.y = j.at(1).get<double>();
}

// NetworkCounts serialization
inline void to_json(nlohmann::json& j, const NetworkCounts& counts) {
    j = {
        {"server_count", counts.server_count},
        {"client_count", counts.client_count},
        {"printer_count", counts.printer_count}
    };
}

inline void from_json(const nlohmann::json& j, NetworkCounts& counts) {
    NetworkCounts defaults;
    counts.server_count = j.value("server_count", defaults.server_count);
    counts.client_count = j.value("client_count", defaults.client_count);
    counts.printer_count = j.value("printer_count", defaults.printer_count);
}

// NetworkBuildConfig serialization
inline void to_json(nlohmann::json& j, const NetworkBuildConfig& config) {
    j = {
        {"counts", config.counts},
        {"random_seed", config.random_seed}
    };
}

inline void from_json(const nlohmann::json& j, NetworkBuildConfig& config) {
    if (j.contains("counts")) {
        config.counts = j["counts"].get<NetworkCounts>();
    }
    config.random_seed = j.value("random_seed", 42u);
}

// DeclutterParams serialization
inline void to_json(nlohmann::json& j, const DeclutterParams& p) {
    j = {
        {"spring_k", p.spring_k},
        {"rest_length", p.rest_length},
        {"printer_k_boost", p.printer_k_boost},
        {"printer_r_boost", p.printer_r_boost},
        {"repulsion_c", p.repulsion_c},
        {"server_repulsion", p.server_repulsion},
        {"overlap_boost", p.overlap_boost},
        {"center_k", p.center_k},
        {"damping", p.damping},
        {"dt", p.dt},
        {"vmax", p.vmax},
        {"min_steps", p.min_steps},
        {"max_steps", p.max_steps},
        {"settle_force", p.settle_force},
        {"repulsion_eps", p.repulsion_eps},
        {"spring_eps", p.spring_eps},
        {"overlap_pad", p.overlap_pad},
        {"clamp_tolerance", p.clamp_tolerance},
        {"diagnostics_interval", p.diagnostics_interval},
        {"progress_interval", p.progress_interval},
        {"refresh_interval", p.refresh_interval}
    };
}

inline void from_json(const nlohmann::json& j, DeclutterParams& p) {
    DeclutterParams d;
    p.spring_k = j.value("spring_k", d.spring_k);
    p.rest_length = j.value("rest_length", d.rest_length);
    p.printer_k_boost = j.value("printer_k_boost", d.printer_k_boost);
    p.printer_r_boost = j.value("printer_r_boost", d.printer_r_boost);
    p.repulsion_c = j.value("repulsion_c", d.repulsion_c);
    p.server_repulsion = j.value("server_repulsion", d.server_repulsion);
    p.overlap_boost = j.value("overlap_boost", d.overlap_boost);
    p.center_k = j.value("center_k", d.center_k);
    p.damping = j.value("damping", d.damping);
    p.dt = j.value("dt", d.dt);
    p.vmax = j.value("vmax", d.vmax);
    p.min_steps = j.value("min_steps", d.min_steps);
    p.max_steps = j.value("max_steps", d.max_steps);
    p.settle_force = j.value("settle_force", d.settle_force);
    p.repulsion_eps = j.value("repulsion_eps", d.repulsion_eps);
    p.spring_eps = j.value("spring_eps", d.spring_eps);
    p.overlap_pad = j.value("overlap_pad", d.overlap_pad);
    p.clamp_tolerance = j.value("clamp_tolerance", d.clamp_tolerance);
    p.diagnostics_interval = j.value("diagnostics_interval", d.diagnostics_interval);
    p.progress_interval = j.value("progress_interval", d.progress_interval);
    p.refresh_interval = j.value("refresh_interval", d.refresh_interval);
}

// StopReason serialization
NLOHMANN_JSON_SERIALIZE_ENUM(StopReason, {
    {StopReason::Running, "running"},
    {StopReason::Settled, "settled"},
    {StopReason::Canceled, "canceled"},
    {StopReason::StepLimitReached, "step_limit_reached"},
})

}  // namespace netdeclutter

#endif // NETDECLUTTER_SERIALIZATION_CONFIG_JSON_HPP
