#pragma once

#include <optional>
#include <string>
#include <vector>

enum class CandidateKind {
    Binary,  // packaged native executable
    Script,  // run through an interpreter
};

struct BackendCandidate {
    std::string path;
    CandidateKind kind = CandidateKind::Binary;
};

struct LocatorPaths {
    std::string cwd;           // empty = skip cwd-relative candidates
    std::string resource_dir;  // empty = skip bundled-resource candidates
    std::string binary_name = "stocksbot-backend";
    std::string script_name = "app.py";
};

class ProcessLocator {
public:
    explicit ProcessLocator(LocatorPaths paths);

    /// All candidate paths in search order, binaries before scripts
    std::vector<BackendCandidate> candidates() const;

    /// First candidate that exists and is a regular file
    std::optional<BackendCandidate> find_first() const;

    /// Every existing candidate, in search order
    std::vector<BackendCandidate> find_all() const;

    const LocatorPaths& paths() const { return paths_; }

    /// Platform executable suffix (".exe" on Windows, empty elsewhere)
    static const char* executable_suffix();

private:
    LocatorPaths paths_;
};
