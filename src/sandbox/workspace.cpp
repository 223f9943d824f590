#include "workspace.hpp"
#include "../digest.hpp"
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

static constexpr int kMaxNameAttempts = 8;

Workspace::Acquired Workspace::acquire(const fs::path& root) {
    Acquired out;
    std::error_code ec;

    if (!fs::is_directory(root, ec)) {
        out.error = "workspace root " + root.string() + " is not a directory";
        return out;
    }

    for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
        std::string suffix = random_hex(8);
        if (suffix.empty()) {
            out.error = "random name generation failed";
            return out;
        }
        fs::path candidate = root / ("katadojo-" + suffix);

        // create_directory reports false without error when the name is taken.
        ec.clear();
        bool created = fs::create_directory(candidate, ec);
        if (ec) {
            out.error = ec.message();
            return out;
        }
        if (created) {
            out.workspace.emplace(Workspace(candidate));
            return out;
        }
    }

    out.error = "no unique directory name after " + std::to_string(kMaxNameAttempts) + " attempts";
    return out;
}

Workspace::Workspace(Workspace&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

Workspace::~Workspace() {
    release();
}

void Workspace::release() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        std::cerr << "[workspace] Failed to remove " << path_ << ": " << ec.message() << std::endl;
    }
    path_.clear();
}
