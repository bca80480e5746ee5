#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

// Lexically normalized absolute path. Separators are canonicalized to '/',
// "." and ".." segments are collapsed (".." never climbs above the root).
// Windows drive paths keep their drive as the root ("C:/").
struct NormalizedPath {
    std::string root;                 // "/" or "C:/"
    std::vector<std::string> parts;

    bool has_drive() const { return root.size() > 1; }
    std::string str() const;
};

// Normalize `raw` against `base` (used when raw is relative). Touches no
// filesystem state.
NormalizedPath normalize_path(const std::string& raw, const std::filesystem::path& base);

// True when `path` equals `prefix` or is nested under it, compared by
// whole segments. Drive paths compare case-insensitively.
bool path_within(const NormalizedPath& path, const NormalizedPath& prefix);

struct PathVerdict {
    ErrorKind error = ErrorKind::None;   // None, PathRestricted or PathTraversal
    std::string reason;
    std::filesystem::path resolved;      // normalized directory to run in

    bool ok() const { return error == ErrorKind::None; }
};

// Validate a requested working directory. Relative paths resolve against
// `base`. Both the lexical form and, when it exists, the symlink-resolved
// form must stay clear of restricted paths and inside `project_root`.
PathVerdict check_working_directory(const std::string& raw, const std::filesystem::path& base,
                                    const ValidationPolicy& policy,
                                    const std::optional<std::filesystem::path>& project_root);
