#pragma once

#include <string>
#include "core/errors/agent_errors.hpp"
#include "tools/tool_registry.hpp"

namespace toolpilot::policy {

// Permission flags a session grants to tools: r(ead), w(rite), (e)x(ecute),
// n(etwork).
struct PermissionPolicy {
    std::string allowed = "rwxn";

    static core::errors::Result<PermissionPolicy> parse(const std::string& flags);
    static PermissionPolicy read_only() { return PermissionPolicy{"r"}; }

    bool allows(char flag) const;
};

class PolicyGuard {
public:
    explicit PolicyGuard(PermissionPolicy policy = {});

    // Returns the descriptor's permission string when every declared flag is
    // granted, otherwise a Policy error naming the missing flags.
    core::errors::Result<std::string> check(
        const tools::ToolDescriptor& descriptor) const;

    const PermissionPolicy& policy() const { return policy_; }

private:
    PermissionPolicy policy_;
};

}  // namespace toolpilot::policy
