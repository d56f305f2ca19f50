#pragma once

#include "stubscan/core/Violation.h"

#include <string>
#include <string_view>
#include <utility>

namespace stubscan {

class AnalysisContext;
struct Symbol;

struct RuleVerdict {
    bool violated = false;
    std::string message;

    static RuleVerdict pass() { return {}; }
    static RuleVerdict fail(std::string msg) { return {true, std::move(msg)}; }
};

class Rule {
public:
    virtual ~Rule() = default;

    virtual std::string_view getID() const = 0;
    virtual std::string_view getTitle() const = 0;
    virtual ViolationCategory getCategory() const = 0;

    // Evaluate a single symbol. Implementations must not keep state between
    // calls: the same symbol always yields the same verdict. A symbol with
    // a null member stands for its type.
    virtual RuleVerdict evaluate(const Symbol &S,
                                 const AnalysisContext &Ctx) const = 0;
};

} // namespace stubscan
