#include "path_guard.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

std::string NormalizedPath::str() const {
    std::string out = root;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += '/';
        out += parts[i];
    }
    return out;
}

static bool is_drive_prefix(const std::string& s) {
    return s.size() >= 2 && std::isalpha(static_cast<unsigned char>(s[0])) && s[1] == ':';
}

static void push_segments(NormalizedPath& out, const std::string& rest) {
    size_t i = 0;
    while (i <= rest.size()) {
        size_t next = rest.find('/', i);
        if (next == std::string::npos) next = rest.size();
        std::string seg = rest.substr(i, next - i);
        if (seg == "..") {
            if (!out.parts.empty()) out.parts.pop_back();
        } else if (!seg.empty() && seg != ".") {
            out.parts.push_back(seg);
        }
        i = next + 1;
    }
}

NormalizedPath normalize_path(const std::string& raw, const fs::path& base) {
    std::string s = raw;
    for (auto& c : s) {
        if (c == '\\') c = '/';
    }

    NormalizedPath out;
    if (is_drive_prefix(s)) {
        out.root = std::string(1, static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])))) + ":/";
        push_segments(out, s.substr(2));
    } else if (!s.empty() && s[0] == '/') {
        out.root = "/";
        push_segments(out, s);
    } else {
        std::string base_str = base.string();
        if (base_str.empty()) base_str = platform::current_dir().string();
        out = normalize_path(base_str, fs::path("/"));
        push_segments(out, s);
    }
    return out;
}

static bool segment_equal(const std::string& a, const std::string& b, bool fold_case) {
    return fold_case ? to_lower(a) == to_lower(b) : a == b;
}

bool path_within(const NormalizedPath& path, const NormalizedPath& prefix) {
    bool fold_case = path.has_drive() || prefix.has_drive() || platform::case_insensitive_paths();
    if (!segment_equal(path.root, prefix.root, fold_case)) return false;
    if (prefix.parts.size() > path.parts.size()) return false;
    for (size_t i = 0; i < prefix.parts.size(); i++) {
        if (!segment_equal(path.parts[i], prefix.parts[i], fold_case)) return false;
    }
    return true;
}

// Symlink-resolved form of an existing path; nullopt when it cannot be resolved.
static std::optional<NormalizedPath> resolved_form(const NormalizedPath& lexical) {
    std::error_code ec;
    fs::path p(lexical.str());
    if (!fs::exists(p, ec)) return std::nullopt;
    auto canon = fs::weakly_canonical(p, ec);
    if (ec) return std::nullopt;
    return normalize_path(canon.string(), fs::path("/"));
}

static PathVerdict check_form(const NormalizedPath& dir, const ValidationPolicy& policy,
                              const std::optional<NormalizedPath>& root) {
    PathVerdict verdict;
    for (const auto& restricted : policy.restricted_paths) {
        if (restricted.empty()) continue;
        if (path_within(dir, normalize_path(restricted, fs::path("/")))) {
            verdict.error = ErrorKind::PathRestricted;
            verdict.reason = fmt::format("Access to restricted path: {}", restricted);
            return verdict;
        }
    }
    if (root && !path_within(dir, *root)) {
        verdict.error = ErrorKind::PathTraversal;
        verdict.reason = fmt::format("Working directory {} escapes project root {}",
                                     dir.str(), root->str());
    }
    return verdict;
}

PathVerdict check_working_directory(const std::string& raw, const fs::path& base,
                                    const ValidationPolicy& policy,
                                    const std::optional<fs::path>& project_root) {
    NormalizedPath dir = normalize_path(raw.empty() ? "." : raw, base);

    std::optional<NormalizedPath> root;
    if (project_root) root = normalize_path(project_root->string(), base);

    PathVerdict verdict = check_form(dir, policy, root);
    if (!verdict.ok()) return verdict;

    // Second pass on the real location, so a symlink cannot smuggle the
    // directory somewhere the lexical form does not show.
    if (auto real = resolved_form(dir)) {
        std::optional<NormalizedPath> real_root = root;
        if (root) {
            if (auto r = resolved_form(*root)) real_root = r;
        }
        verdict = check_form(*real, policy, real_root);
        if (!verdict.ok()) return verdict;
    }

    verdict.resolved = fs::path(dir.str());
    return verdict;
}
