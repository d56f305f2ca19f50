#include "stubscan/metadata/ManifestLoader.h"

#include <llvm/ADT/StringExtras.h>
#include <llvm/ADT/StringMap.h>
#include <llvm/ADT/Twine.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/SourceMgr.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>

namespace stubscan {
namespace manifest {

// Plain mirrors of the manifest layout; converted to descriptors after the
// whole document has parsed.

struct AttributeEntry {
    std::string name;
    std::string argument;
};

struct ParameterEntry {
    std::string name;
    std::string type;
};

struct MemberEntry {
    MemberKind kind = MemberKind::Method;
    std::string name;
    llvm::yaml::Hex32 token = 0;
    Visibility visibility = Visibility::Private;
    bool isStatic = false;
    bool isAbstract = false;
    bool isVirtual = false;
    bool isSpecialName = false;
    bool isLiteral = false;
    bool isInitOnly = false;
    bool isAutoImplemented = false;
    std::string returnType = std::string(kVoidTypeName);
    std::vector<ParameterEntry> parameters;
    std::string body;
    llvm::yaml::Hex32 getter = 0;
    llvm::yaml::Hex32 setter = 0;
    std::vector<AttributeEntry> attributes;
    std::string summary;
};

struct TypeEntry {
    std::string name;
    std::string ns;
    TypeKind kind = TypeKind::Class;
    bool isAbstract = false;
    bool isSealed = false;
    bool attributesUnreadable = false;
    std::string base;
    std::vector<AttributeEntry> attributes;
    std::vector<MemberEntry> members;
    std::vector<TypeEntry> nested;
};

struct LoadFailureEntry {
    std::string type;
    std::string reason;
};

struct AssemblyEntry {
    std::string name;
    std::string location;
    std::vector<LoadFailureEntry> loadFailures;
    std::vector<TypeEntry> types;
};

struct Document {
    std::vector<AssemblyEntry> assemblies;
};

} // namespace manifest
} // namespace stubscan

LLVM_YAML_IS_SEQUENCE_VECTOR(stubscan::manifest::AttributeEntry)
LLVM_YAML_IS_SEQUENCE_VECTOR(stubscan::manifest::ParameterEntry)
LLVM_YAML_IS_SEQUENCE_VECTOR(stubscan::manifest::MemberEntry)
LLVM_YAML_IS_SEQUENCE_VECTOR(stubscan::manifest::TypeEntry)
LLVM_YAML_IS_SEQUENCE_VECTOR(stubscan::manifest::LoadFailureEntry)
LLVM_YAML_IS_SEQUENCE_VECTOR(stubscan::manifest::AssemblyEntry)

namespace llvm {
namespace yaml {

template <>
struct ScalarEnumerationTraits<stubscan::TypeKind> {
    static void enumeration(IO &io, stubscan::TypeKind &k) {
        io.enumCase(k, "class",     stubscan::TypeKind::Class);
        io.enumCase(k, "interface", stubscan::TypeKind::Interface);
        io.enumCase(k, "struct",    stubscan::TypeKind::Struct);
        io.enumCase(k, "enum",      stubscan::TypeKind::Enum);
    }
};

template <>
struct ScalarEnumerationTraits<stubscan::MemberKind> {
    static void enumeration(IO &io, stubscan::MemberKind &k) {
        io.enumCase(k, "method",      stubscan::MemberKind::Method);
        io.enumCase(k, "constructor", stubscan::MemberKind::Constructor);
        io.enumCase(k, "property",    stubscan::MemberKind::Property);
        io.enumCase(k, "field",       stubscan::MemberKind::Field);
        io.enumCase(k, "enum-value",  stubscan::MemberKind::EnumValue);
        io.enumCase(k, "event",       stubscan::MemberKind::Event);
    }
};

template <>
struct ScalarEnumerationTraits<stubscan::Visibility> {
    static void enumeration(IO &io, stubscan::Visibility &v) {
        io.enumCase(v, "private",   stubscan::Visibility::Private);
        io.enumCase(v, "internal",  stubscan::Visibility::Internal);
        io.enumCase(v, "protected", stubscan::Visibility::Protected);
        io.enumCase(v, "public",    stubscan::Visibility::Public);
    }
};

template <>
struct MappingTraits<stubscan::manifest::AttributeEntry> {
    static void mapping(IO &io, stubscan::manifest::AttributeEntry &a) {
        io.mapRequired("name", a.name);
        io.mapOptional("argument", a.argument);
    }
};

template <>
struct MappingTraits<stubscan::manifest::ParameterEntry> {
    static void mapping(IO &io, stubscan::manifest::ParameterEntry &p) {
        io.mapRequired("name", p.name);
        io.mapOptional("type", p.type);
    }
};

template <>
struct MappingTraits<stubscan::manifest::MemberEntry> {
    static void mapping(IO &io, stubscan::manifest::MemberEntry &m) {
        io.mapRequired("name",             m.name);
        io.mapOptional("kind",             m.kind);
        io.mapOptional("token",            m.token);
        io.mapOptional("visibility",       m.visibility);
        io.mapOptional("static",           m.isStatic);
        io.mapOptional("abstract",         m.isAbstract);
        io.mapOptional("virtual",          m.isVirtual);
        io.mapOptional("special_name",     m.isSpecialName);
        io.mapOptional("literal",          m.isLiteral);
        io.mapOptional("init_only",        m.isInitOnly);
        io.mapOptional("auto_implemented", m.isAutoImplemented);
        io.mapOptional("return_type",      m.returnType);
        io.mapOptional("parameters",       m.parameters);
        io.mapOptional("body",             m.body);
        io.mapOptional("getter",           m.getter);
        io.mapOptional("setter",           m.setter);
        io.mapOptional("attributes",       m.attributes);
        io.mapOptional("summary",          m.summary);
    }
};

template <>
struct MappingTraits<stubscan::manifest::TypeEntry> {
    static void mapping(IO &io, stubscan::manifest::TypeEntry &t) {
        io.mapRequired("name",                  t.name);
        io.mapOptional("namespace",             t.ns);
        io.mapOptional("kind",                  t.kind);
        io.mapOptional("abstract",              t.isAbstract);
        io.mapOptional("sealed",                t.isSealed);
        io.mapOptional("attributes_unreadable", t.attributesUnreadable);
        io.mapOptional("base",                  t.base);
        io.mapOptional("attributes",            t.attributes);
        io.mapOptional("members",               t.members);
        io.mapOptional("nested",                t.nested);
    }
};

template <>
struct MappingTraits<stubscan::manifest::LoadFailureEntry> {
    static void mapping(IO &io, stubscan::manifest::LoadFailureEntry &f) {
        io.mapRequired("type",   f.type);
        io.mapOptional("reason", f.reason);
    }
};

template <>
struct MappingTraits<stubscan::manifest::AssemblyEntry> {
    static void mapping(IO &io, stubscan::manifest::AssemblyEntry &a) {
        io.mapRequired("name",          a.name);
        io.mapOptional("location",      a.location);
        io.mapOptional("load_failures", a.loadFailures);
        io.mapOptional("types",         a.types);
    }
};

template <>
struct MappingTraits<stubscan::manifest::Document> {
    static void mapping(IO &io, stubscan::manifest::Document &d) {
        io.mapRequired("assemblies", d.assemblies);
    }
};

} // namespace yaml
} // namespace llvm

namespace stubscan {

namespace {

void captureDiagnostic(const llvm::SMDiagnostic &diag, void *ctx) {
    auto *out = static_cast<std::string *>(ctx);
    if (out->empty())
        *out = diag.getMessage().str();
}

std::vector<Attribute> convertAttributes(const std::vector<manifest::AttributeEntry> &in) {
    std::vector<Attribute> out;
    out.reserve(in.size());
    for (const auto &a : in) {
        Attribute attr;
        attr.name = a.name;
        if (!a.argument.empty())
            attr.argument = a.argument;
        out.push_back(std::move(attr));
    }
    return out;
}

llvm::Expected<MemberDescriptor> convertMember(const manifest::MemberEntry &in,
                                               llvm::StringRef where) {
    MemberDescriptor m;
    m.kind              = in.kind;
    m.name              = in.name;
    m.token             = in.token;
    m.visibility        = in.visibility;
    m.isStatic          = in.isStatic;
    m.isAbstract        = in.isAbstract;
    m.isVirtual         = in.isVirtual;
    m.isSpecialName     = in.isSpecialName;
    m.isLiteral         = in.isLiteral;
    m.isInitOnly        = in.isInitOnly;
    m.isAutoImplemented = in.isAutoImplemented;
    m.returnType        = in.returnType;
    m.getterToken       = in.getter;
    m.setterToken       = in.setter;
    m.summary           = in.summary;
    m.attributes        = convertAttributes(in.attributes);

    for (const auto &p : in.parameters)
        m.parameters.push_back({p.name, p.type});

    if (!llvm::StringRef(in.body).trim().empty()) {
        auto bytes = ManifestLoader::parseHexBody(in.body);
        if (!bytes)
            return llvm::createStringError(std::make_error_code(std::errc::invalid_argument),
                                           "%s: member '%s': %s", where.str().c_str(),
                                           in.name.c_str(),
                                           llvm::toString(bytes.takeError()).c_str());
        m.body = std::move(*bytes);
    }
    return m;
}

llvm::Expected<std::unique_ptr<TypeDescriptor>>
convertType(const manifest::TypeEntry &in, llvm::StringRef where) {
    auto T = std::make_unique<TypeDescriptor>(in.name, in.ns, in.kind);
    T->isAbstract = in.isAbstract;
    T->isSealed = in.isSealed;
    T->attributesUnreadable = in.attributesUnreadable;
    T->attributes = convertAttributes(in.attributes);
    T->baseTypeName = in.base;

    for (const auto &m : in.members) {
        auto member = convertMember(m, where);
        if (!member)
            return member.takeError();
        T->addMember(std::move(*member));
    }
    for (const auto &n : in.nested) {
        auto nested = convertType(n, where);
        if (!nested)
            return nested.takeError();
        T->addNestedType(std::move(*nested));
    }
    return T;
}

void collectTypes(TypeDescriptor &T, llvm::StringMap<TypeDescriptor *> &byName) {
    byName.try_emplace(T.fullName(), &T);
    for (const auto &N : T.nestedTypes())
        collectTypes(*N, byName);
}

} // anonymous namespace

llvm::Expected<std::vector<uint8_t>> ManifestLoader::parseHexBody(llvm::StringRef text) {
    std::vector<uint8_t> out;
    int high = -1;
    for (char c : text) {
        if (llvm::isSpace(c))
            continue;
        unsigned v = llvm::hexDigitValue(c);
        if (v == ~0U)
            return llvm::createStringError(std::make_error_code(std::errc::invalid_argument),
                                           "invalid hex digit '%c' in body", c);
        if (high < 0) {
            high = static_cast<int>(v);
        } else {
            out.push_back(static_cast<uint8_t>((high << 4) | v));
            high = -1;
        }
    }
    if (high >= 0)
        return llvm::createStringError(std::make_error_code(std::errc::invalid_argument),
                                       "odd number of hex digits in body");
    return out;
}

llvm::Error ManifestLoader::loadFile(const std::string &path) {
    auto bufOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufOrErr)
        return llvm::createStringError(bufOrErr.getError(),
                                       "cannot open manifest '%s'", path.c_str());
    return loadBuffer(bufOrErr.get()->getBuffer(), path);
}

llvm::Error ManifestLoader::loadBuffer(llvm::StringRef yaml, llvm::StringRef sourceName) {
    manifest::Document doc;
    std::string diagnostic;
    llvm::yaml::Input yin(yaml, nullptr, captureDiagnostic, &diagnostic);
    yin >> doc;

    if (yin.error()) {
        return llvm::createStringError(yin.error(), "manifest parse error in '%s': %s",
                                       sourceName.str().c_str(), diagnostic.c_str());
    }

    // Convert everything before publishing so a bad manifest adds nothing.
    std::vector<std::unique_ptr<Assembly>> loaded;
    for (const auto &a : doc.assemblies) {
        auto A = std::make_unique<Assembly>(a.name, a.location.empty() ? sourceName.str()
                                                                        : a.location);
        for (const auto &f : a.loadFailures)
            A->recordLoadFailure({f.type, f.reason});
        for (const auto &t : a.types) {
            auto T = convertType(t, sourceName);
            if (!T)
                return T.takeError();
            A->addType(std::move(*T));
        }
        loaded.push_back(std::move(A));
    }

    for (auto &A : loaded)
        assemblies_.push_back(std::move(A));
    return llvm::Error::success();
}

void ManifestLoader::resolveBaseTypes() {
    llvm::StringMap<TypeDescriptor *> byName;
    for (const auto &A : assemblies_) {
        for (const auto &T : A->types())
            collectTypes(*T, byName);
    }

    for (auto &entry : byName) {
        TypeDescriptor *T = entry.second;
        if (T->baseTypeName.empty())
            continue;
        auto it = byName.find(T->baseTypeName);
        if (it != byName.end() && it->second != T)
            T->baseType = it->second;
    }
}

std::vector<AssemblyHandle> ManifestLoader::handles() const {
    std::vector<AssemblyHandle> out;
    out.reserve(assemblies_.size());
    for (const auto &A : assemblies_)
        out.push_back(A.get());
    return out;
}

} // namespace stubscan
