#pragma once
#include "../security_rules.hpp"
#include <string>
#include <vector>

namespace toolguard {

// secret-detection, destructive-command, sensitive-file-protection,
// credential-url, git-secret-commit
void register_default_rules(SecurityRuleEngine& engine);

const std::vector<std::string>& default_rule_ids();

SecurityRule make_secret_detection_rule();
SecurityRule make_destructive_command_rule();
SecurityRule make_sensitive_file_rule();
SecurityRule make_credential_url_rule();
SecurityRule make_git_secret_commit_rule();

} // namespace toolguard
