#include "kata.hpp"

void to_json(nlohmann::json& j, const Kata& k) {
    j = nlohmann::json{
        {"id", k.id},
        {"phase", k.phase},
        {"phase_title", k.phase_title},
        {"sequence", k.sequence},
        {"title", k.title},
        {"hints", k.hints},
        {"description", k.description},
        {"broken_code", k.broken_code},
        {"correct_code", k.correct_code},
        {"explanation", k.explanation},
        {"compiler_error_interpretation", k.compiler_error_interpretation}
    };
}

void to_json(nlohmann::json& j, const KataSummary& s) {
    j = nlohmann::json{{"id", s.id}, {"sequence", s.sequence}, {"title", s.title}};
}

void to_json(nlohmann::json& j, const PhaseGroup& g) {
    j = nlohmann::json{{"phase", g.phase}, {"title", g.title}, {"katas", g.katas}};
}

void to_json(nlohmann::json& j, const KataListResponse& r) {
    j = nlohmann::json{{"phases", r.phases}};
}
