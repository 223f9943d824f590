#pragma once
#include <filesystem>
#include <optional>
#include <string>

// Directory owned by exactly one execution attempt. The tree is removed when
// the owning Workspace is destroyed.
class Workspace {
public:
    struct Acquired;

    // Creates a fresh, uniquely named directory under `root`. On failure the
    // returned Acquired carries no workspace and a reason in `error`.
    static Acquired acquire(const std::filesystem::path& root);

    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;
    ~Workspace();

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path file(const std::string& name) const { return path_ / name; }

    // Removes the directory now. Safe to call more than once.
    void release();

private:
    explicit Workspace(std::filesystem::path p) : path_(std::move(p)) {}

    std::filesystem::path path_;
};

struct Workspace::Acquired {
    std::optional<Workspace> workspace;
    std::string error;
};
