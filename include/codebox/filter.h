#ifndef INCLUDE_CODEBOX_FILTER_H_
#define INCLUDE_CODEBOX_FILTER_H_

#include <regex>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#define ENUM_MATCH_TYPE_ \
  X(SUBSTRING, "substring") \
  X(REGEX, "regex")
enum class MatchType {
#define X(name, str) name,
  ENUM_MATCH_TYPE_
#undef X
};

struct DenyRule {
  MatchType type;
  std::string pattern;
  std::string reason; // human-readable category of the blocked construct
};

// Ordered and immutable once built; shared read-only by every worker.
class DenyRuleSet {
  struct CompiledRule {
    DenyRule rule;
    std::string lowered; // for SUBSTRING
    std::regex regex; // for REGEX
  };
  std::vector<CompiledRule> rules_;
 public:
  DenyRuleSet() {}
  // throws std::regex_error if a REGEX rule does not compile
  explicit DenyRuleSet(const std::vector<DenyRule>& rules);

  size_t size() const { return rules_.size(); }
  bool empty() const { return rules_.empty(); }
  const DenyRule& operator[](size_t i) const { return rules_[i].rule; }
  // index of the first rule matching source, or -1
  long FirstMatch(const std::string& source) const;
};

std::vector<DenyRule> DefaultDenyRules();
// JSON array of {"pattern", "reason", "type"}; nullopt (logged) on any error
std::optional<std::vector<DenyRule>> LoadDenyRules(const std::filesystem::path&);

struct FilterVerdict {
  bool rejected;
  DenyRule rule; // valid only if rejected
  std::string reason;

  FilterVerdict() : rejected(false), rule{MatchType::SUBSTRING, "", ""} {}
};

class PatternFilter {
  std::shared_ptr<const DenyRuleSet> rules_;
 public:
  explicit PatternFilter(std::shared_ptr<const DenyRuleSet> rules) : rules_(std::move(rules)) {}
  // first rule in declaration order wins
  FilterVerdict Check(const std::string& source) const;
};

const char* MatchTypeName(MatchType);
std::optional<MatchType> GetMatchType(const std::string&);

#endif  // INCLUDE_CODEBOX_FILTER_H_
