#include "stubscan/core/Rule.h"
#include "stubscan/engine/AnalysisContext.h"
#include "stubscan/metadata/MetadataWalker.h"
#include "stubscan/rules/BuiltinRules.h"

#include <llvm/ADT/STLExtras.h>
#include <llvm/ADT/StringRef.h>

#include <array>
#include <sstream>

namespace stubscan {

namespace {

constexpr std::array<llvm::StringLiteral, 7> kPlaceholderEnumNames = {
    "None", "Default", "Undefined", "Placeholder", "TODO", "Temp", "Unknown",
};

bool isPlaceholderName(llvm::StringRef name) {
    return llvm::any_of(kPlaceholderEnumNames,
                        [name](llvm::StringRef p) { return name.equals_insensitive(p); });
}

} // anonymous namespace

class SS008_HollowEnum : public Rule {
public:
    std::string_view getID() const override { return "SS008"; }
    std::string_view getTitle() const override { return "Hollow Enum"; }
    ViolationCategory getCategory() const override { return ViolationCategory::UnusedCode; }

    RuleVerdict evaluate(const Symbol &S, const AnalysisContext & /*Ctx*/) const override {
        if (!S.isTypeLevel() || !S.type->isEnum())
            return RuleVerdict::pass();

        std::vector<llvm::StringRef> values;
        for (const auto &M : S.type->members()) {
            if (M.kind == MemberKind::EnumValue)
                values.push_back(M.name);
        }

        if (values.size() < 2) {
            std::ostringstream os;
            os << "enum '" << S.type->name() << "' declares " << values.size()
               << " value(s)";
            if (!values.empty())
                os << " ('" << values.front().str() << "')";
            os << "; an enum needs at least two to distinguish anything";
            return RuleVerdict::fail(os.str());
        }

        if (llvm::all_of(values, isPlaceholderName))
            return RuleVerdict::fail("enum '" + S.type->name() +
                                     "' declares only placeholder values");

        return RuleVerdict::pass();
    }
};

std::unique_ptr<Rule> createHollowEnumRule() {
    return std::make_unique<SS008_HollowEnum>();
}

} // namespace stubscan
