#include "tributary/planner/extensions/key_calculation.hpp"

#include <algorithm>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tributary::planner {

PlanResult<std::unique_ptr<KeyCalculationNode>> KeyCalculationNode::try_new(LogicalOperatorPtr input,
                                                                            std::vector<std::size_t> keys,
                                                                            std::string side,
                                                                            bool trimmed)
{
    using Result = PlanResult<std::unique_ptr<KeyCalculationNode>>;
    if (!input) {
        throw std::invalid_argument{"key calculation input must not be null"};
    }

    auto materialized = input->schema();
    for (const auto key : keys) {
        if (key >= materialized.size()) {
            return Result::failure(make_plan_diagnostic(
                PlanErrc::UpstreamConstruction,
                "Key index " + std::to_string(key) + " is out of range for a schema of " +
                    std::to_string(materialized.size()) + " fields"));
        }
    }

    LogicalSchema logical = materialized;
    if (trimmed) {
        std::vector<QualifiedField> remaining;
        remaining.reserve(materialized.size());
        for (std::size_t index = 0U; index < materialized.size(); ++index) {
            if (std::find(keys.begin(), keys.end(), index) == keys.end()) {
                remaining.push_back(materialized.field(index));
            }
        }
        auto schema = LogicalSchema::try_new(std::move(remaining), materialized.metadata());
        if (!schema.success()) {
            return Result::failure(std::move(schema.diagnostics));
        }
        logical = std::move(*schema.value);
    }

    return Result::ok(std::make_unique<KeyCalculationNode>(ConstructionKey{},
                                                           std::move(input),
                                                           std::move(keys),
                                                           std::move(side),
                                                           trimmed,
                                                           std::move(materialized),
                                                           std::move(logical)));
}

KeyCalculationNode::KeyCalculationNode(ConstructionKey,
                                       LogicalOperatorPtr input,
                                       std::vector<std::size_t> keys,
                                       std::string side,
                                       bool trimmed,
                                       LogicalSchema materialized_schema,
                                       LogicalSchema schema)
    : input_{std::move(input)}
    , keys_{std::move(keys)}
    , side_{std::move(side)}
    , trimmed_{trimmed}
    , materialized_schema_{std::move(materialized_schema)}
    , schema_{std::move(schema)}
{
}

std::string_view KeyCalculationNode::name() const noexcept
{
    return kKeyCalculationName;
}

const LogicalSchema& KeyCalculationNode::schema() const noexcept
{
    return schema_;
}

std::vector<const LogicalOperator*> KeyCalculationNode::inputs() const
{
    if (!input_) {
        return {};
    }
    return {input_.get()};
}

std::string KeyCalculationNode::describe() const
{
    std::ostringstream stream;
    stream << kKeyCalculationName << ": side=" << side_ << " keys=[";
    for (std::size_t index = 0U; index < keys_.size(); ++index) {
        if (index > 0U) {
            stream << ", ";
        }
        stream << keys_[index];
    }
    stream << "]";
    if (trimmed_) {
        stream << " trimmed";
    }
    return stream.str();
}

std::vector<LogicalOperatorPtr> KeyCalculationNode::take_inputs()
{
    std::vector<LogicalOperatorPtr> inputs;
    if (input_) {
        inputs.push_back(std::move(input_));
    }
    return inputs;
}

PlanResult<std::unique_ptr<ExtensionNode>> KeyCalculationNode::with_new_inputs(
    std::vector<LogicalOperatorPtr> inputs) const
{
    using Result = PlanResult<std::unique_ptr<ExtensionNode>>;
    if (inputs.size() != 1U) {
        return Result::failure(make_plan_diagnostic(
            PlanErrc::UpstreamConstruction,
            std::string{kKeyCalculationName} + " expects 1 input but was given " + std::to_string(inputs.size())));
    }

    auto rebuilt = try_new(std::move(inputs.front()), keys_, side_, trimmed_);
    if (!rebuilt.success()) {
        return Result::failure(std::move(rebuilt.diagnostics));
    }
    return Result::ok(std::move(*rebuilt.value));
}

const LogicalSchema& KeyCalculationNode::materialized_schema() const noexcept
{
    return materialized_schema_;
}

const LogicalOperator* KeyCalculationNode::input() const noexcept
{
    return input_.get();
}

const std::vector<std::size_t>& KeyCalculationNode::keys() const noexcept
{
    return keys_;
}

const std::string& KeyCalculationNode::side() const noexcept
{
    return side_;
}

bool KeyCalculationNode::trimmed() const noexcept
{
    return trimmed_;
}

const KeyCalculationNode* as_key_calculation(const LogicalOperator* node) noexcept
{
    if (node == nullptr || node->kind != LogicalOperatorKind::Extension) {
        return nullptr;
    }
    return dynamic_cast<const KeyCalculationNode*>(static_cast<const LogicalExtension*>(node)->node.get());
}

}  // namespace tributary::planner
