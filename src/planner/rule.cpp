#include "tributary/planner/rule.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace tributary::planner {

namespace {

using PatternIterator = std::vector<LogicalOperatorKind>::const_iterator;

bool matches_pattern(PatternIterator begin, PatternIterator end, const LogicalOperator* root) noexcept
{
    if (root == nullptr || begin == end) {
        return false;
    }
    if (root->kind != *begin) {
        return false;
    }
    if (std::next(begin) == end) {
        return true;
    }
    const auto children = root->children();
    if (children.empty()) {
        return false;
    }
    return matches_pattern(std::next(begin), end, children.front());
}

}  // namespace

Rule::Rule(std::string name,
           std::vector<LogicalOperatorKind> pattern,
           RuleCategory category,
           RuleTransform transform,
           int priority)
    : name_{std::move(name)}
    , pattern_{std::move(pattern)}
    , category_{category}
    , priority_{priority}
    , transform_{std::move(transform)}
{
}

const std::string& Rule::name() const noexcept
{
    return name_;
}

const std::vector<LogicalOperatorKind>& Rule::pattern() const noexcept
{
    return pattern_;
}

RuleCategory Rule::category() const noexcept
{
    return category_;
}

int Rule::priority() const noexcept
{
    return priority_;
}

bool Rule::matches(const LogicalOperator& root) const noexcept
{
    return matches_pattern(pattern_.begin(), pattern_.end(), &root);
}

RuleOutcome Rule::apply(const RuleContext& context, LogicalOperatorPtr& root) const
{
    if (!root || !matches(*root)) {
        return {};
    }

    if (!transform_) {
        return {};
    }

    return transform_(context, root);
}

RuleContext::RuleContext(const PlannerContext* planner_context) noexcept
    : planner_context_{planner_context}
{
}

const PlannerContext* RuleContext::planner_context() const noexcept
{
    return planner_context_;
}

void RuleRegistry::register_rule(std::shared_ptr<Rule> rule)
{
    if (!rule) {
        throw std::invalid_argument{"rule must not be null"};
    }
    rules_.push_back(std::move(rule));
    std::stable_sort(rules_.begin(), rules_.end(), [](const auto& lhs, const auto& rhs) {
        return lhs->priority() > rhs->priority();
    });
}

const std::vector<std::shared_ptr<Rule>>& RuleRegistry::rules() const noexcept
{
    return rules_;
}

RuleEngine::RuleEngine(const RuleRegistry* registry, PlannerRuleOptions options)
    : registry_{registry}
    , options_{std::move(options)}
{
}

RuleOutcome RuleEngine::apply_rules(const RuleContext& context,
                                    LogicalOperatorPtr& root,
                                    RuleTrace* trace,
                                    RuleEngineStats* stats) const
{
    RuleOutcome combined{};
    if (registry_ == nullptr || !root) {
        return combined;
    }

    for (const auto& rule : registry_->rules()) {
        if (!rule_enabled(*rule) || !rule->matches(*root)) {
            continue;
        }

        if (stats) {
            ++stats->rules_attempted;
        }
        if (trace) {
            trace->applications.push_back({rule->name(), logical_operator_kind_name(root->kind), false});
        }

        auto outcome = rule->apply(context, root);
        if (outcome.failed()) {
            return outcome;
        }
        if (outcome.transformed) {
            combined.transformed = true;
            if (stats) {
                ++stats->rules_applied;
            }
            if (trace) {
                trace->applications.back().success = true;
            }
        }
        if (!root) {
            break;
        }
    }

    return combined;
}

PlanResult<LogicalOperatorPtr> RuleEngine::rewrite_bottom_up(const RuleContext& context,
                                                             LogicalOperatorPtr root,
                                                             RuleTrace* trace,
                                                             RuleEngineStats* stats) const
{
    if (!root) {
        throw std::invalid_argument{"plan root must not be null"};
    }

    if (root->kind == LogicalOperatorKind::Extension) {
        const auto& extension = static_cast<const LogicalExtension&>(*root);
        if (extension.node && extension.node->sealed()) {
            return PlanResult<LogicalOperatorPtr>::ok(std::move(root));
        }
    }

    auto children = take_children(*root);
    std::vector<LogicalOperatorPtr> rewritten;
    rewritten.reserve(children.size());
    for (auto& child : children) {
        auto result = rewrite_bottom_up(context, std::move(child), trace, stats);
        if (!result.success()) {
            return result;
        }
        rewritten.push_back(std::move(*result.value));
    }

    auto rebuilt = with_new_children(std::move(root), std::move(rewritten));
    if (!rebuilt.success()) {
        return rebuilt;
    }

    auto node = std::move(*rebuilt.value);
    auto outcome = apply_rules(context, node, trace, stats);
    if (outcome.failed()) {
        return PlanResult<LogicalOperatorPtr>::failure(std::move(outcome.diagnostics));
    }
    return PlanResult<LogicalOperatorPtr>::ok(std::move(node));
}

bool RuleEngine::rule_enabled(const Rule& rule) const noexcept
{
    switch (rule.category()) {
    case RuleCategory::StreamingJoin:
        return options_.enable_streaming_join_rewrite;
    case RuleCategory::Generic:
    default:
        return true;
    }
}

}  // namespace tributary::planner
