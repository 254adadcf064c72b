#include "tributary/planner/plan_errors.hpp"

namespace tributary::planner {

namespace {

class PlanErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "tributary.planner";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<PlanErrc>(condition)) {
        case PlanErrc::Success:
            return "success";
        case PlanErrc::UnsupportedJoinShape:
            return "unsupported join shape";
        case PlanErrc::UnsupportedUpdatingInput:
            return "unsupported updating join input";
        case PlanErrc::MissingEquijoin:
            return "missing equijoin condition";
        case PlanErrc::MalformedTimestamps:
            return "malformed timestamp columns";
        case PlanErrc::UpstreamConstruction:
            return "plan construction failed";
        case PlanErrc::EvaluationFailed:
            return "expression evaluation failed";
        case PlanErrc::InvalidPlanText:
            return "invalid plan text";
        default:
            return "unknown planner error";
        }
    }
};

const PlanErrorCategory kCategory{};

}  // namespace

const std::error_category& plan_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(PlanErrc value) noexcept
{
    return {static_cast<int>(value), plan_error_category()};
}

PlanDiagnostic make_plan_diagnostic(PlanErrc code,
                                    std::string message,
                                    std::vector<std::string> remediation_hints)
{
    PlanDiagnostic diagnostic{};
    diagnostic.code = make_error_code(code);
    diagnostic.message = std::move(message);
    diagnostic.remediation_hints = std::move(remediation_hints);
    return diagnostic;
}

}  // namespace tributary::planner
