#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stubscan {

class TypeDescriptor;

struct Attribute {
    std::string name;
    std::optional<std::string> argument; // first positional string argument, if any
};

struct Parameter {
    std::string name;
    std::string typeName;
};

enum class TypeKind : uint8_t {
    Class,
    Interface,
    Struct,
    Enum,
};

enum class MemberKind : uint8_t {
    Method,
    Constructor,
    Property,
    Field,
    EnumValue,
    Event,
};

enum class Visibility : uint8_t {
    Private,
    Internal,
    Protected,
    Public,
};

constexpr std::string_view memberKindName(MemberKind k) {
    switch (k) {
        case MemberKind::Method:      return "method";
        case MemberKind::Constructor: return "constructor";
        case MemberKind::Property:    return "property";
        case MemberKind::Field:       return "field";
        case MemberKind::EnumValue:   return "enum-value";
        case MemberKind::Event:       return "event";
    }
    return "method";
}

constexpr std::string_view kVoidTypeName = "System.Void";

struct MemberDescriptor {
    MemberKind kind = MemberKind::Method;
    std::string name;
    uint32_t token = 0;
    const TypeDescriptor *declaringType = nullptr;

    Visibility visibility = Visibility::Private;
    bool isStatic       = false;
    bool isAbstract     = false;
    bool isVirtual      = false;
    bool isSpecialName  = false; // accessors, operators
    bool isLiteral      = false; // const fields
    bool isInitOnly     = false; // readonly fields
    bool isAutoImplemented = false; // compiler-supplied property accessors

    // Methods and constructors.
    std::string returnType = std::string(kVoidTypeName);
    std::vector<Parameter> parameters;
    std::optional<std::vector<uint8_t>> body; // absent for abstract/extern

    // Properties.
    uint32_t getterToken = 0;
    uint32_t setterToken = 0;

    std::vector<Attribute> attributes;
    std::string summary; // XML doc summary, when the loader has one

    bool isMethodLike() const {
        return kind == MemberKind::Method || kind == MemberKind::Constructor;
    }
    bool returnsVoid() const { return returnType == kVoidTypeName || returnType == "void"; }
    bool hasBody() const { return body.has_value(); }

    const Attribute *findAttribute(std::string_view name) const;
};

class TypeDescriptor {
public:
    TypeDescriptor(std::string name, std::string ns, TypeKind kind);

    TypeDescriptor(const TypeDescriptor &) = delete;
    TypeDescriptor &operator=(const TypeDescriptor &) = delete;

    const std::string &name() const { return name_; }
    const std::string &getNamespace() const { return namespace_; }
    TypeKind kind() const { return kind_; }

    // Namespace.Outer+Inner, matching the runtime's reflection naming.
    std::string fullName() const;

    bool isInterface() const { return kind_ == TypeKind::Interface; }
    bool isEnum() const { return kind_ == TypeKind::Enum; }
    bool isValueType() const { return kind_ == TypeKind::Struct || kind_ == TypeKind::Enum; }
    bool isClass() const { return kind_ == TypeKind::Class; }

    bool isAbstract = false;
    bool isSealed = false;

    // Set by the loader when the custom attribute blob could not be decoded.
    bool attributesUnreadable = false;
    std::vector<Attribute> attributes;

    std::string baseTypeName;
    const TypeDescriptor *baseType = nullptr;

    const TypeDescriptor *enclosingType() const { return enclosing_; }
    const std::vector<MemberDescriptor> &members() const { return members_; }
    const std::vector<std::unique_ptr<TypeDescriptor>> &nestedTypes() const { return nested_; }

    MemberDescriptor &addMember(MemberDescriptor member);
    TypeDescriptor &addNestedType(std::unique_ptr<TypeDescriptor> type);

    const MemberDescriptor *findMember(std::string_view name) const;
    const Attribute *findAttribute(std::string_view name) const;

private:
    std::string name_;
    std::string namespace_;
    TypeKind kind_;
    const TypeDescriptor *enclosing_ = nullptr;
    std::vector<MemberDescriptor> members_;
    std::vector<std::unique_ptr<TypeDescriptor>> nested_;
};

struct TypeLoadFailure {
    std::string typeName;
    std::string reason;
};

class Assembly {
public:
    Assembly(std::string name, std::string location = {});

    Assembly(const Assembly &) = delete;
    Assembly &operator=(const Assembly &) = delete;

    const std::string &name() const { return name_; }
    const std::string &location() const { return location_; }

    const std::vector<std::unique_ptr<TypeDescriptor>> &types() const { return types_; }
    const std::vector<TypeLoadFailure> &loadFailures() const { return loadFailures_; }

    TypeDescriptor &addType(std::unique_ptr<TypeDescriptor> type);
    void recordLoadFailure(TypeLoadFailure failure);

    // Searches top-level and nested types.
    const TypeDescriptor *findType(std::string_view fullName) const;

private:
    std::string name_;
    std::string location_;
    std::vector<std::unique_ptr<TypeDescriptor>> types_;
    std::vector<TypeLoadFailure> loadFailures_;
};

using AssemblyHandle = const Assembly *;

// Attribute names match with or without the conventional "Attribute" suffix.
bool attributeNameMatches(std::string_view attrName, std::string_view wanted);

} // namespace stubscan
