#include "catalog.hpp"
#include "kata_loader.hpp"
#include <algorithm>

Catalog::Catalog(std::vector<Kata> katas) : katas_(std::move(katas)) {}

std::shared_ptr<const Catalog> Catalog::load(const std::filesystem::path& katas_dir) {
    return std::make_shared<const Catalog>(load_all_katas(katas_dir));
}

const Kata* Catalog::find(const std::string& id) const {
    auto it = std::find_if(katas_.begin(), katas_.end(), [&](const Kata& k) { return k.id == id; });
    return it == katas_.end() ? nullptr : &*it;
}

KataListResponse Catalog::list() const {
    KataListResponse resp;
    for (const auto& k : katas_) {
        auto group = std::find_if(resp.phases.begin(), resp.phases.end(),
                                  [&](const PhaseGroup& g) { return g.phase == k.phase; });
        KataSummary summary{k.id, k.sequence, k.title};
        if (group != resp.phases.end()) {
            group->katas.push_back(std::move(summary));
        } else {
            resp.phases.push_back(PhaseGroup{k.phase, k.phase_title, {std::move(summary)}});
        }
    }

    std::stable_sort(resp.phases.begin(), resp.phases.end(),
                     [](const PhaseGroup& a, const PhaseGroup& b) { return a.phase < b.phase; });
    for (auto& g : resp.phases) {
        std::stable_sort(g.katas.begin(), g.katas.end(),
                         [](const KataSummary& a, const KataSummary& b) { return a.sequence < b.sequence; });
    }
    return resp;
}
