#include <codebox/filter.h>

#include <cctype>
#include <fstream>
#include <algorithm>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace {

inline std::string ToLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

constexpr char kDefaultReason[] = "blocked pattern";

} // namespace

DenyRuleSet::DenyRuleSet(const std::vector<DenyRule>& rules) {
  rules_.reserve(rules.size());
  for (auto& rule : rules) {
    CompiledRule compiled{rule, "", {}};
    switch (rule.type) {
      case MatchType::SUBSTRING: compiled.lowered = ToLower(rule.pattern); break;
      case MatchType::REGEX: {
        compiled.regex = std::regex(rule.pattern,
            std::regex_constants::ECMAScript | std::regex_constants::icase);
        break;
      }
    }
    rules_.push_back(std::move(compiled));
  }
}

long DenyRuleSet::FirstMatch(const std::string& source) const {
  // lowered lazily; most rule sets are substring-only
  std::string lowered;
  bool has_lowered = false;
  for (size_t i = 0; i < rules_.size(); i++) {
    const CompiledRule& rule = rules_[i];
    switch (rule.rule.type) {
      case MatchType::SUBSTRING: {
        if (!has_lowered) lowered = ToLower(source), has_lowered = true;
        if (lowered.find(rule.lowered) != std::string::npos) return i;
        break;
      }
      case MatchType::REGEX: {
        if (std::regex_search(source, rule.regex)) return i;
        break;
      }
    }
  }
  return -1;
}

std::vector<DenyRule> DefaultDenyRules() {
  constexpr char kProcess[] = "process and OS interaction";
  constexpr char kEval[] = "dynamic evaluation";
  constexpr char kFile[] = "filesystem access";
  constexpr char kInput[] = "interactive input";
  constexpr char kNetwork[] = "network access";
  constexpr char kShell[] = "shell and privilege commands";
  return {
    {MatchType::SUBSTRING, "import os", kProcess},
    {MatchType::SUBSTRING, "import subprocess", kProcess},
    {MatchType::SUBSTRING, "import sys", kProcess},
    {MatchType::SUBSTRING, "__import__", kProcess},
    {MatchType::SUBSTRING, "eval(", kEval},
    {MatchType::SUBSTRING, "exec(", kEval},
    {MatchType::SUBSTRING, "compile(", kEval},
    {MatchType::SUBSTRING, "open(", kFile},
    {MatchType::SUBSTRING, "file(", kFile},
    {MatchType::SUBSTRING, "input(", kInput},
    {MatchType::SUBSTRING, "raw_input(", kInput},
    {MatchType::SUBSTRING, "socket", kNetwork},
    {MatchType::SUBSTRING, "urllib", kNetwork},
    {MatchType::SUBSTRING, "requests", kNetwork},
    {MatchType::SUBSTRING, "http", kNetwork},
    {MatchType::SUBSTRING, "rm -rf", kShell},
    {MatchType::SUBSTRING, "sudo", kShell},
    {MatchType::SUBSTRING, "chmod", kShell},
    {MatchType::SUBSTRING, "chown", kShell},
  };
}

std::optional<std::vector<DenyRule>> LoadDenyRules(const std::filesystem::path& path) {
  std::ifstream fin(path);
  if (!fin) {
    spdlog::error("Failed to open deny rule file {}", path.c_str());
    return std::nullopt;
  }
  nlohmann::json doc = nlohmann::json::parse(fin, nullptr, false);
  if (doc.is_discarded() || !doc.is_array()) {
    spdlog::error("Deny rule file {} is not a JSON array", path.c_str());
    return std::nullopt;
  }
  std::vector<DenyRule> rules;
  for (size_t i = 0; i < doc.size(); i++) {
    const auto& item = doc[i];
    if (!item.is_object() || !item.contains("pattern") || !item["pattern"].is_string()) {
      spdlog::error("Deny rule #{} in {}: missing string field \"pattern\"", i, path.c_str());
      return std::nullopt;
    }
    DenyRule rule{MatchType::SUBSTRING, item["pattern"].get<std::string>(), kDefaultReason};
    if (rule.pattern.empty()) {
      spdlog::error("Deny rule #{} in {}: empty pattern", i, path.c_str());
      return std::nullopt;
    }
    if (auto it = item.find("reason"); it != item.end() && it->is_string()) {
      rule.reason = it->get<std::string>();
    }
    if (auto it = item.find("type"); it != item.end()) {
      auto type = it->is_string() ? GetMatchType(it->get<std::string>()) : std::nullopt;
      if (!type) {
        spdlog::error("Deny rule #{} in {}: unknown type {}", i, path.c_str(), it->dump());
        return std::nullopt;
      }
      rule.type = *type;
    }
    if (rule.type == MatchType::REGEX) {
      try {
        std::regex test(rule.pattern, std::regex_constants::ECMAScript);
      } catch (const std::regex_error& err) {
        spdlog::error("Deny rule #{} in {}: invalid regex {}: {}", i, path.c_str(), rule.pattern, err.what());
        return std::nullopt;
      }
    }
    rules.push_back(std::move(rule));
  }
  spdlog::info("Loaded {} deny rules from {}", rules.size(), path.c_str());
  return rules;
}

FilterVerdict PatternFilter::Check(const std::string& source) const {
  FilterVerdict ret;
  if (!rules_) return ret;
  long idx = rules_->FirstMatch(source);
  if (idx < 0) return ret;
  ret.rejected = true;
  ret.rule = (*rules_)[idx];
  ret.reason = fmt::format("Dangerous pattern detected: {}", ret.rule.pattern);
  return ret;
}
