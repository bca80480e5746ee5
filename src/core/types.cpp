#include "types.hpp"
#include "constants.hpp"
#include <algorithm>

const char* category_name(ToolCategory category) {
    switch (category) {
        case ToolCategory::Npm:       return "npm";
        case ToolCategory::Python:    return "python";
        case ToolCategory::Terraform: return "terraform";
        case ToolCategory::Git:       return "git";
        case ToolCategory::Generic:   return "generic";
    }
    return "generic";
}

std::optional<ToolCategory> parse_category(const std::string& name) {
    for (auto c : ALL_CATEGORIES) {
        if (name == category_name(c)) return c;
    }
    return std::nullopt;
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:             return "None";
        case ErrorKind::UnknownCommand:   return "UnknownCommand";
        case ErrorKind::InjectionAttempt: return "InjectionAttempt";
        case ErrorKind::SubshellAttempt:  return "SubshellAttempt";
        case ErrorKind::PathRestricted:   return "PathRestricted";
        case ErrorKind::PathTraversal:    return "PathTraversal";
        case ErrorKind::SpawnError:       return "SpawnError";
        case ErrorKind::TimedOut:         return "TimedOut";
        case ErrorKind::ToolFailure:      return "ToolFailure";
    }
    return "None";
}

int ValidationPolicy::timeout_for(ToolCategory category, std::optional<int> override_secs) const {
    int64_t base = (override_secs && *override_secs > 0) ? *override_secs : base_timeout_secs;
    auto it = tools.find(category);
    int64_t multiplier = (it != tools.end()) ? it->second.timeout_multiplier : 1;
    int64_t deadline = base * multiplier;
    int64_t ceiling = std::min<int64_t>(timeout_ceiling_secs, MAX_TIMEOUT_SECS);
    return static_cast<int>(std::min<int64_t>(deadline, ceiling));
}
