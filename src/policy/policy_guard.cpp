#include "policy/policy_guard.hpp"

#include <cctype>
#include <utility>

namespace toolpilot::policy {

using core::errors::AgentError;
using core::errors::ErrorCategory;

core::errors::Result<PermissionPolicy> PermissionPolicy::parse(
    const std::string& flags) {
    PermissionPolicy policy;
    policy.allowed.clear();
    for (const char raw : flags) {
        const char flag = static_cast<char>(
            std::tolower(static_cast<unsigned char>(raw)));
        if (flag != 'r' && flag != 'w' && flag != 'x' && flag != 'n') {
            return AgentError{ErrorCategory::Configuration,
                              "Unknown permission flag: " + std::string(1, raw),
                              "invalid_permission_flag",
                              "Use a combination of r, w, x and n."};
        }
        if (policy.allowed.find(flag) == std::string::npos) {
            policy.allowed.push_back(flag);
        }
    }
    return policy;
}

bool PermissionPolicy::allows(const char flag) const {
    return allowed.find(flag) != std::string::npos;
}

PolicyGuard::PolicyGuard(PermissionPolicy policy) : policy_(std::move(policy)) {}

core::errors::Result<std::string> PolicyGuard::check(
    const tools::ToolDescriptor& descriptor) const {
    std::string missing;
    for (const char flag : descriptor.permissions()) {
        if (!policy_.allows(flag)) {
            missing.push_back(flag);
        }
    }
    if (!missing.empty()) {
        return AgentError{ErrorCategory::Policy,
                          "Tool '" + descriptor.name() + "' requires permission '" +
                              missing + "' which is not granted (allowed: '" +
                              policy_.allowed + "')",
                          "permission_denied"};
    }
    return descriptor.permissions();
}

}  // namespace toolpilot::policy
