#pragma once

#include "stubscan/metadata/Metadata.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <memory>
#include <string>
#include <vector>

namespace stubscan {

// Builds the assembly graph from YAML metadata manifests.
//
//   assemblies:
//     - name: Game.Core
//       load_failures: [{ type: Game.Broken, reason: "missing dependency" }]
//       types:
//         - { name: Player, namespace: Game, kind: class, base: Game.Actor,
//             members: [...], nested: [...] }
//
// Members carry `kind`, `name`, `token` (0x-prefixed), visibility and flag
// keys, `return_type`, `parameters`, a hex-string `body`, `getter` /
// `setter` tokens for properties, `attributes` and `summary`. An absent or
// empty body means the method has none.
class ManifestLoader {
public:
    llvm::Error loadFile(const std::string &path);
    llvm::Error loadBuffer(llvm::StringRef yaml, llvm::StringRef sourceName);

    // Links base types by full name across everything loaded so far.
    // Names that match no loaded type keep only their baseTypeName.
    void resolveBaseTypes();

    std::vector<AssemblyHandle> handles() const;
    const std::vector<std::unique_ptr<Assembly>> &assemblies() const { return assemblies_; }

    // Parses "73 01 00 00 0A 7A" or "730100000a7a".
    static llvm::Expected<std::vector<uint8_t>> parseHexBody(llvm::StringRef text);

private:
    std::vector<std::unique_ptr<Assembly>> assemblies_;
};

} // namespace stubscan
