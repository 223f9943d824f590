#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

struct Kata {
    std::string id;
    uint32_t phase{0};
    std::string phase_title;
    uint32_t sequence{0};
    std::string title;
    std::vector<std::string> hints;
    std::string description;
    std::string broken_code;
    std::string correct_code;
    std::string explanation;
    std::string compiler_error_interpretation;
};

struct KataSummary {
    std::string id;
    uint32_t sequence{0};
    std::string title;
};

struct PhaseGroup {
    uint32_t phase{0};
    std::string title;
    std::vector<KataSummary> katas;
};

struct KataListResponse {
    std::vector<PhaseGroup> phases;
};

void to_json(nlohmann::json& j, const Kata& k);
void to_json(nlohmann::json& j, const KataSummary& s);
void to_json(nlohmann::json& j, const PhaseGroup& g);
void to_json(nlohmann::json& j, const KataListResponse& r);
