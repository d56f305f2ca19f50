#include "stubscan/metadata/MetadataWalker.h"
#include "stubscan/metadata/ArtifactFilter.h"

#include <llvm/ADT/STLExtras.h>
#include <llvm/ADT/StringExtras.h>
#include <llvm/ADT/StringSet.h>

#include <array>
#include <unordered_set>

namespace stubscan {

namespace {

constexpr std::array<std::string_view, 6> kSystemPrefixes = {
    "system", "microsoft", "mscorlib", "netstandard", "mono.", "nunit",
};

constexpr std::array<std::string_view, 3> kHostFrameworkPrefixes = {
    "unity", "unityengine", "unityeditor",
};

std::string lowered(std::string_view s) {
    std::string out(s);
    for (char &c : out)
        c = llvm::toLower(c);
    return out;
}

bool containsInsensitive(std::string_view haystack, std::string_view needle) {
    return lowered(haystack).find(lowered(needle)) != std::string::npos;
}

template <size_t N>
bool startsWithAny(std::string_view name, const std::array<std::string_view, N> &prefixes) {
    std::string lower = lowered(name);
    std::string_view view(lower);
    return llvm::any_of(prefixes, [view](std::string_view p) { return view.starts_with(p); });
}

struct Pending {
    const TypeDescriptor *type;
    bool allowed; // inside a type named by the custom allow-list
};

} // anonymous namespace

MetadataWalker::MetadataWalker(const Config &cfg) : config_(cfg) {}

bool MetadataWalker::isSystemAssembly(std::string_view name) {
    return startsWithAny(name, kSystemPrefixes);
}

bool MetadataWalker::isHostFrameworkAssembly(std::string_view name) {
    return startsWithAny(name, kHostFrameworkPrefixes);
}

bool MetadataWalker::isTestAssembly(std::string_view name) {
    return name.ends_with(".Tests") || name.ends_with(".Test");
}

bool MetadataWalker::acceptsAssembly(std::string_view name) const {
    if (isSystemAssembly(name) || isTestAssembly(name))
        return false;
    if (!config_.includeHostFrameworkAssemblies && isHostFrameworkAssembly(name))
        return false;

    for (const auto &ex : config_.assemblyExcludes) {
        if (containsInsensitive(name, ex))
            return false;
    }

    if (config_.assemblyFilters.empty())
        return true;
    return llvm::any_of(config_.assemblyFilters,
                        [name](const std::string &f) { return containsInsensitive(name, f); });
}

bool MetadataWalker::isAllowListed(const TypeDescriptor &T) const {
    return llvm::is_contained(config_.customTypeAllowList, T.fullName());
}

WalkResult MetadataWalker::walk(llvm::ArrayRef<AssemblyHandle> assemblies,
                                std::stop_token stop) const {
    WalkResult result;
    const bool restricted = !config_.customTypeAllowList.empty();
    llvm::StringSet<> found;
    std::unordered_set<AssemblyHandle> seen;

    for (AssemblyHandle A : assemblies) {
        if (!A || !seen.insert(A).second)
            continue;
        if (!acceptsAssembly(A->name()))
            continue;

        for (const auto &failure : A->loadFailures()) {
            result.notes.push_back("assembly '" + A->name() + "': could not load type '" +
                                   failure.typeName + "': " + failure.reason);
        }

        std::vector<Pending> stack;
        const auto &top = A->types();
        for (auto it = top.rbegin(); it != top.rend(); ++it)
            stack.push_back({it->get(), !restricted});

        while (!stack.empty()) {
            if (stop.stop_requested()) {
                result.cancelled = true;
                return result;
            }

            Pending cur = stack.back();
            stack.pop_back();
            const TypeDescriptor *T = cur.type;

            if (restricted && isAllowListed(*T)) {
                found.insert(T->fullName());
                cur.allowed = true;
            }

            if (ArtifactFilter::shouldSkipType(T))
                continue;

            if (cur.allowed) {
                result.symbols.push_back({A, T, nullptr});
                for (const auto &M : T->members()) {
                    if (stop.stop_requested()) {
                        result.cancelled = true;
                        return result;
                    }
                    if (ArtifactFilter::shouldSkipMember(&M))
                        continue;
                    result.symbols.push_back({A, T, &M});
                }
            }

            const auto &nested = T->nestedTypes();
            for (auto it = nested.rbegin(); it != nested.rend(); ++it)
                stack.push_back({it->get(), cur.allowed});
        }
    }

    for (const auto &name : config_.customTypeAllowList) {
        if (!found.contains(name))
            result.notes.push_back("custom type '" + name + "' was not found in any selected assembly");
    }
    return result;
}

} // namespace stubscan
