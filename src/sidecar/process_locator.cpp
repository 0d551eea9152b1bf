#include "sidecar/process_locator.hpp"

#include <filesystem>

namespace fs = std::filesystem;

ProcessLocator::ProcessLocator(LocatorPaths paths) : paths_(std::move(paths)) {}

const char* ProcessLocator::executable_suffix() {
#ifdef _WIN32
    return ".exe";
#else
    return "";
#endif
}

std::vector<BackendCandidate> ProcessLocator::candidates() const {
    std::vector<BackendCandidate> out;
    const std::string binary = paths_.binary_name + executable_suffix();

    auto add = [&out](const fs::path& p, CandidateKind kind) {
        out.push_back({p.lexically_normal().string(), kind});
    };

    // Packaged binaries first
    if (!paths_.binary_name.empty()) {
        if (!paths_.cwd.empty()) {
            fs::path cwd(paths_.cwd);
            add(cwd / ".." / "backend" / "dist" / binary, CandidateKind::Binary);
            add(cwd / "backend" / "dist" / binary, CandidateKind::Binary);
        }
        if (!paths_.resource_dir.empty()) {
            fs::path res(paths_.resource_dir);
            add(res / binary, CandidateKind::Binary);
            add(res / "backend" / binary, CandidateKind::Binary);
        }
    }

    if (!paths_.script_name.empty()) {
        if (!paths_.cwd.empty()) {
            fs::path cwd(paths_.cwd);
            add(cwd / ".." / "backend" / paths_.script_name, CandidateKind::Script);
            add(cwd / "backend" / paths_.script_name, CandidateKind::Script);
        }
        if (!paths_.resource_dir.empty()) {
            fs::path res(paths_.resource_dir);
            add(res / "backend" / paths_.script_name, CandidateKind::Script);
            add(res / paths_.script_name, CandidateKind::Script);
        }
    }

    return out;
}

std::vector<BackendCandidate> ProcessLocator::find_all() const {
    std::vector<BackendCandidate> found;
    for (auto& candidate : candidates()) {
        std::error_code ec;
        if (fs::is_regular_file(candidate.path, ec)) {
            found.push_back(std::move(candidate));
        }
    }
    return found;
}

std::optional<BackendCandidate> ProcessLocator::find_first() const {
    for (auto& candidate : candidates()) {
        std::error_code ec;
        if (fs::is_regular_file(candidate.path, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}
