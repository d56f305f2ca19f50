#include "stubscan/metadata/Metadata.h"

#include <algorithm>

namespace stubscan {

namespace {

constexpr std::string_view kAttributeSuffix = "Attribute";

std::string_view stripAttributeSuffix(std::string_view name) {
    if (name.size() > kAttributeSuffix.size() && name.ends_with(kAttributeSuffix))
        name.remove_suffix(kAttributeSuffix.size());
    // Drop any namespace qualification.
    auto dot = name.rfind('.');
    if (dot != std::string_view::npos)
        name.remove_prefix(dot + 1);
    return name;
}

const Attribute *findIn(const std::vector<Attribute> &attrs, std::string_view name) {
    auto it = std::find_if(attrs.begin(), attrs.end(), [name](const Attribute &a) {
        return attributeNameMatches(a.name, name);
    });
    return it != attrs.end() ? &*it : nullptr;
}

} // anonymous namespace

bool attributeNameMatches(std::string_view attrName, std::string_view wanted) {
    if (attrName.empty() || wanted.empty())
        return false;
    return stripAttributeSuffix(attrName) == stripAttributeSuffix(wanted);
}

const Attribute *MemberDescriptor::findAttribute(std::string_view name) const {
    return findIn(attributes, name);
}

// --- TypeDescriptor ---

TypeDescriptor::TypeDescriptor(std::string name, std::string ns, TypeKind kind)
    : name_(std::move(name)), namespace_(std::move(ns)), kind_(kind) {}

std::string TypeDescriptor::fullName() const {
    if (enclosing_)
        return enclosing_->fullName() + "+" + name_;
    if (namespace_.empty())
        return name_;
    return namespace_ + "." + name_;
}

MemberDescriptor &TypeDescriptor::addMember(MemberDescriptor member) {
    member.declaringType = this;
    members_.push_back(std::move(member));
    return members_.back();
}

TypeDescriptor &TypeDescriptor::addNestedType(std::unique_ptr<TypeDescriptor> type) {
    type->enclosing_ = this;
    if (type->namespace_.empty())
        type->namespace_ = namespace_;
    nested_.push_back(std::move(type));
    return *nested_.back();
}

const MemberDescriptor *TypeDescriptor::findMember(std::string_view name) const {
    auto it = std::find_if(members_.begin(), members_.end(),
                           [name](const MemberDescriptor &m) { return m.name == name; });
    return it != members_.end() ? &*it : nullptr;
}

const Attribute *TypeDescriptor::findAttribute(std::string_view name) const {
    if (attributesUnreadable)
        return nullptr;
    return findIn(attributes, name);
}

// --- Assembly ---

Assembly::Assembly(std::string name, std::string location)
    : name_(std::move(name)), location_(std::move(location)) {}

TypeDescriptor &Assembly::addType(std::unique_ptr<TypeDescriptor> type) {
    types_.push_back(std::move(type));
    return *types_.back();
}

void Assembly::recordLoadFailure(TypeLoadFailure failure) {
    loadFailures_.push_back(std::move(failure));
}

const TypeDescriptor *Assembly::findType(std::string_view fullName) const {
    std::vector<const TypeDescriptor *> stack;
    for (auto it = types_.rbegin(); it != types_.rend(); ++it)
        stack.push_back(it->get());

    while (!stack.empty()) {
        const TypeDescriptor *T = stack.back();
        stack.pop_back();
        if (T->fullName() == fullName)
            return T;
        for (const auto &N : T->nestedTypes())
            stack.push_back(N.get());
    }
    return nullptr;
}

} // namespace stubscan
