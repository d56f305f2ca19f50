#include "stubscan/rules/RuleSupport.h"

#include <llvm/ADT/STLExtras.h>
#include <llvm/ADT/StringExtras.h>
#include <llvm/ADT/StringRef.h>

#include <array>

namespace stubscan {

namespace {

constexpr std::array<std::string_view, 19> kLifecycleMethods = {
    "Awake", "Start", "Update", "FixedUpdate", "LateUpdate",
    "OnEnable", "OnDisable", "OnDestroy", "OnApplicationQuit",
    "OnGUI", "OnDrawGizmos", "OnDrawGizmosSelected", "OnValidate", "Reset",
    "OnCollisionEnter", "OnCollisionExit", "OnTriggerEnter", "OnTriggerExit",
    "OnApplicationPause",
};

bool isLower(char c) { return c >= 'a' && c <= 'z'; }
bool isUpper(char c) { return c >= 'A' && c <= 'Z'; }

} // anonymous namespace

bool isLikelyEventHandler(const MemberDescriptor &M) {
    std::string_view name = M.name;
    if (name.size() > 2 && name.starts_with("On") && isUpper(name[2]))
        return true;
    if (name.ends_with("Handler") || name.ends_with("Callback"))
        return true;
    return M.parameters.size() == 2 &&
           std::string_view(M.parameters[1].typeName).ends_with("EventArgs");
}

bool isLifecycleMethodName(std::string_view name) {
    return llvm::is_contained(kLifecycleMethods, name);
}

bool isEntryPoint(const MemberDescriptor &M) {
    return M.isStatic && M.name == "Main";
}

bool hasNameWord(std::string_view name, std::string_view word, bool anywhere) {
    size_t pos = name.find(word);
    while (pos != std::string_view::npos) {
        if (!anywhere && pos != 0)
            return false;
        size_t end = pos + word.size();
        if (end == name.size() || !isLower(name[end]))
            return true;
        if (!anywhere)
            return false;
        pos = name.find(word, pos + 1);
    }
    return false;
}

bool containsWordInsensitive(std::string_view text, std::string_view word) {
    llvm::StringRef rest(text.data(), text.size());
    while (!rest.empty()) {
        rest = rest.drop_until([](char c) { return llvm::isAlpha(c); });
        llvm::StringRef token = rest.take_while([](char c) { return llvm::isAlpha(c); });
        if (!token.empty() && token.equals_insensitive(llvm::StringRef(word.data(), word.size())))
            return true;
        rest = rest.drop_front(token.size());
    }
    return false;
}

bool hasAnyAttribute(const std::vector<Attribute> &attrs,
                     const std::vector<std::string> &names) {
    for (const auto &attr : attrs) {
        for (const auto &name : names) {
            if (attributeNameMatches(attr.name, name))
                return true;
        }
    }
    return false;
}

std::string joinNames(const std::vector<std::string> &names) {
    return llvm::join(names, ", ");
}

} // namespace stubscan
