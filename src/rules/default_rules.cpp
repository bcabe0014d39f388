#include "default_rules.hpp"
#include "../tool_input.hpp"
#include "../utils.hpp"
#include <regex>

namespace toolguard {

namespace {

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

struct SecretPattern {
    std::string name;
    std::regex re;
    Severity severity;
    std::vector<std::string> keywords;  // any must appear in the text, case-insensitive
};

struct CommandPattern {
    std::string source;
    std::regex re;
    Severity severity;
    std::string description;
};

struct FilePattern {
    std::string source;
    std::regex re;
    Severity severity;
};

// Checked in order; the first match wins
const std::vector<SecretPattern>& secret_patterns() {
    static const std::vector<SecretPattern> patterns = {
        {"Generic API Key", std::regex(R"(\b([A-Za-z0-9_-]{20,})\b)"), Severity::high,
         {"api_key", "apikey", "api-key", "key"}},
        {"AWS Access Key", std::regex(R"(AKIA[0-9A-Z]{16})"), Severity::critical, {}},
        {"AWS Secret Key", std::regex(R"([A-Za-z0-9/+=]{40})"), Severity::critical,
         {"aws_secret", "secret_access_key"}},
        {"Google API Key", std::regex(R"(AIza[0-9A-Za-z_-]{35})"), Severity::critical, {}},
        {"GitHub Token", std::regex(R"(gh[pousr]_[A-Za-z0-9_]{36,})"), Severity::critical, {}},
        {"GitHub Classic Token", std::regex(R"(ghp_[A-Za-z0-9]{36})"), Severity::critical, {}},
        {"Stripe API Key", std::regex(R"(sk_live_[0-9a-zA-Z]{24,})"), Severity::critical, {}},
        {"Slack Token", std::regex(R"(xox[baprs]-[0-9]{10,13}-[0-9]{10,13}-[a-zA-Z0-9]{24,})"),
         Severity::high, {}},
        {"JWT Token", std::regex(R"(eyJ[A-Za-z0-9_-]*\.eyJ[A-Za-z0-9_-]*\.[A-Za-z0-9_-]*)"),
         Severity::medium, {}},
        {"Password Assignment", std::regex(R"(password\s*[=:]\s*["']([^"']{6,})["'])", kIcase),
         Severity::high, {}},
        {"Database Connection String", std::regex(R"((postgres|mysql|mongodb)://[^:]+:[^@]+@)", kIcase),
         Severity::critical, {}},
        {"Private Key", std::regex(R"(-----BEGIN (RSA|DSA|EC|OPENSSH) PRIVATE KEY-----)"),
         Severity::critical, {}},
    };
    return patterns;
}

const std::vector<CommandPattern>& command_patterns() {
    static const std::vector<CommandPattern> patterns = [] {
        struct Def { const char* src; bool icase; Severity sev; const char* desc; };
        static const Def defs[] = {
            {R"(rm\s+-rf\s+\/)", false, Severity::critical, "Recursive force delete from root"},
            {R"(rm\s+-rf\s+~)", false, Severity::critical, "Recursive force delete from home"},
            {R"(rm\s+-rf\s+\*)", false, Severity::high, "Recursive force delete all files"},
            {R"(:\(\)\{\s*:\|:&\s*\};:)", false, Severity::critical, "Fork bomb"},
            {R"(DROP\s+(DATABASE|TABLE|SCHEMA))", true, Severity::critical, "Database DROP operation"},
            {R"(TRUNCATE\s+TABLE)", true, Severity::high, "Table truncation"},
            {R"(DELETE\s+FROM\s+\w+\s*;)", true, Severity::high, "Unfiltered DELETE"},
            {R"(shutdown|reboot|halt)", true, Severity::critical, "System shutdown command"},
            {R"(mkfs|dd\s+if=)", true, Severity::critical, "Disk formatting command"},
            {R"(chmod\s+777)", true, Severity::medium, "Overly permissive file permissions"},
            {R"(npm\s+publish\s+--force)", false, Severity::high, "Force npm publish"},
            {R"(pip\s+install\s+--force-reinstall)", false, Severity::medium, "Force pip reinstall"},
        };
        std::vector<CommandPattern> out;
        for (auto& d : defs) {
            out.push_back({d.src, std::regex(d.src, d.icase ? kIcase : std::regex::ECMAScript),
                           d.sev, d.desc});
        }
        return out;
    }();
    return patterns;
}

const std::vector<FilePattern>& file_patterns() {
    static const std::vector<FilePattern> patterns = [] {
        struct Def { const char* src; bool icase; Severity sev; };
        static const Def defs[] = {
            {R"(\.env(\.local|\.production)?$)", false, Severity::critical},
            {R"(\.env\.[a-z]+$)", false, Severity::critical},
            {R"(credentials?(\.json|\.yaml|\.yml)?$)", true, Severity::critical},
            {R"(secrets?(\.json|\.yaml|\.yml)?$)", true, Severity::critical},
            {R"(\.password$)", true, Severity::critical},
            {R"(id_rsa|id_dsa|id_ed25519$)", true, Severity::critical},
            {R"(\.pem$)", false, Severity::high},
            {R"(\.key$)", false, Severity::high},
            {R"(\.crt$)", false, Severity::medium},
            {R"(\.aws/credentials$)", true, Severity::critical},
            {R"(\.kube/config$)", true, Severity::critical},
            {R"(gcloud/credentials\.json$)", true, Severity::critical},
            {R"(\.sqlite3?$)", true, Severity::medium},
            {R"(database\.yml$)", true, Severity::high},
        };
        std::vector<FilePattern> out;
        for (auto& d : defs) {
            out.push_back({d.src, std::regex(d.src, d.icase ? kIcase : std::regex::ECMAScript), d.sev});
        }
        return out;
    }();
    return patterns;
}

bool contains_keyword(const std::string& lower_text, const std::vector<std::string>& keywords) {
    for (auto& kw : keywords) {
        if (lower_text.find(kw) != std::string::npos) return true;
    }
    return false;
}

} // namespace

SecurityRule make_secret_detection_rule() {
    SecurityRule rule;
    rule.id = "secret-detection";
    rule.name = "Secret Detection";
    rule.description = "Detects API keys, tokens and credentials in file writes";
    rule.priority = 90;
    rule.evaluate = [](const ToolCallContext& ctx) -> std::optional<RuleResult> {
        if (!ctx.is_write_operation) return std::nullopt;

        std::string text = join_strings(extract_string_content(ctx.tool_input), "\n");
        if (text.empty()) return std::nullopt;
        std::string lower = to_lower(text);

        for (auto& p : secret_patterns()) {
            if (!p.keywords.empty() && !contains_keyword(lower, p.keywords)) continue;
            std::smatch m;
            if (!bounded_regex_search(text, p.re, &m)) continue;

            RuleResult r;
            r.action = SecurityAction::block;
            r.rule_name = "secret-detection";
            r.reason = "Detected potential " + p.name + " in file write";
            r.severity = p.severity;
            r.matched_pattern = m.str(0).substr(0, 20) + "...";
            r.recommendation = "Use environment variables or secure secret management instead";
            return r;
        }
        return std::nullopt;
    };
    return rule;
}

SecurityRule make_destructive_command_rule() {
    SecurityRule rule;
    rule.id = "destructive-command";
    rule.name = "Destructive Command Prevention";
    rule.description = "Blocks or warns on dangerous shell and database commands";
    rule.priority = 85;
    rule.evaluate = [](const ToolCallContext& ctx) -> std::optional<RuleResult> {
        if (!ctx.is_command_execution) return std::nullopt;

        std::string command = join_strings(extract_string_content(ctx.tool_input), " ");
        if (command.empty()) return std::nullopt;

        for (auto& p : command_patterns()) {
            if (!bounded_regex_search(command, p.re)) continue;

            bool block = p.severity == Severity::critical;
            RuleResult r;
            r.action = block ? SecurityAction::block : SecurityAction::warn;
            r.rule_name = "destructive-command";
            r.reason = "Detected destructive command: " + p.description;
            r.severity = p.severity;
            r.matched_pattern = p.source;
            r.recommendation = block
                ? "This command is blocked for safety. Review and execute manually if needed."
                : "Review this command carefully before execution.";
            return r;
        }
        return std::nullopt;
    };
    return rule;
}

SecurityRule make_sensitive_file_rule() {
    SecurityRule rule;
    rule.id = "sensitive-file-protection";
    rule.name = "Sensitive File Protection";
    rule.description = "Protects env files, keys and credential stores from modification";
    rule.priority = 80;
    rule.evaluate = [](const ToolCallContext& ctx) -> std::optional<RuleResult> {
        if (!ctx.is_write_operation) return std::nullopt;

        auto paths = ctx.file_paths.empty() ? extract_file_paths(ctx.tool_input) : ctx.file_paths;
        for (auto& path : paths) {
            for (auto& p : file_patterns()) {
                if (!bounded_regex_search(path, p.re)) continue;

                bool block = p.severity == Severity::critical;
                RuleResult r;
                r.action = block ? SecurityAction::block : SecurityAction::warn;
                r.rule_name = "sensitive-file-protection";
                r.reason = "Attempting to modify sensitive file: " + path;
                r.severity = p.severity;
                r.matched_pattern = p.source;
                r.recommendation = block
                    ? "Sensitive files should be edited manually with proper verification."
                    : "Verify changes to sensitive files carefully.";
                return r;
            }
        }
        return std::nullopt;
    };
    return rule;
}

SecurityRule make_credential_url_rule() {
    SecurityRule rule;
    rule.id = "credential-url";
    rule.name = "Credential URL Detection";
    rule.description = "Detects URLs with embedded user:password credentials";
    rule.priority = 88;
    rule.evaluate = [](const ToolCallContext& ctx) -> std::optional<RuleResult> {
        if (!ctx.is_write_operation) return std::nullopt;

        static const std::regex url_re(R"(https?://[^:]+:[^@]+@)", kIcase);
        std::string text = join_strings(extract_string_content(ctx.tool_input), "\n");
        if (!bounded_regex_search(text, url_re)) return std::nullopt;

        RuleResult r;
        r.action = SecurityAction::block;
        r.rule_name = "credential-url";
        r.reason = "Detected URL with embedded credentials";
        r.severity = Severity::critical;
        r.matched_pattern = "http(s)://user:password@host";
        r.recommendation = "Use environment variables or authentication tokens instead";
        return r;
    };
    return rule;
}

SecurityRule make_git_secret_commit_rule() {
    SecurityRule rule;
    rule.id = "git-secret-commit";
    rule.name = "Git Secret Commit Prevention";
    rule.description = "Warns when git add or commit names secret-bearing files";
    rule.priority = 75;
    rule.evaluate = [](const ToolCallContext& ctx) -> std::optional<RuleResult> {
        if (!ctx.is_command_execution) return std::nullopt;

        static const std::regex git_re(R"(\bgit\s+(add|commit)\b)");
        static const std::regex file_re(
            R"((^|[\s/"'])(\.env(\.[A-Za-z]+)?|id_rsa|id_dsa|id_ed25519|credentials?(\.json|\.ya?ml)?|secrets?(\.json|\.ya?ml)?|[^\s"'/]+\.(pem|key))(?=$|[\s"']))",
            kIcase);

        std::string command = join_strings(extract_string_content(ctx.tool_input), " ");
        if (!bounded_regex_search(command, git_re)) return std::nullopt;

        std::smatch m;
        if (!bounded_regex_search(command, file_re, &m)) return std::nullopt;

        RuleResult r;
        r.action = SecurityAction::warn;
        r.rule_name = "git-secret-commit";
        r.reason = "Git operation includes a secret-bearing file: " + m.str(2);
        r.severity = Severity::high;
        r.matched_pattern = m.str(2);
        r.recommendation = "Add the file to .gitignore and keep secrets out of version control.";
        return r;
    };
    return rule;
}

const std::vector<std::string>& default_rule_ids() {
    static const std::vector<std::string> ids = {
        "secret-detection", "destructive-command", "sensitive-file-protection",
        "credential-url", "git-secret-commit",
    };
    return ids;
}

void register_default_rules(SecurityRuleEngine& engine) {
    engine.register_rule(make_secret_detection_rule());
    engine.register_rule(make_destructive_command_rule());
    engine.register_rule(make_sensitive_file_rule());
    engine.register_rule(make_credential_url_rule());
    engine.register_rule(make_git_secret_commit_rule());
}

} // namespace toolguard
