#pragma once
#include "kata.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

// Read-only snapshot of the kata list, built once and shared between workers.
class Catalog {
public:
    explicit Catalog(std::vector<Kata> katas);

    static std::shared_ptr<const Catalog> load(const std::filesystem::path& katas_dir);

    const std::vector<Kata>& katas() const { return katas_; }
    const Kata* find(const std::string& id) const;

    // Katas grouped by phase, phases and katas ordered by number.
    KataListResponse list() const;

private:
    std::vector<Kata> katas_;
};
