#pragma once

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/SmallVector.h>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace stubscan::il {

enum class ThrowShape : uint8_t {
    None,               // no construct-and-throw pair in the body
    PlaceholderStub,    // throws with little or no logic in front of it
    ArgumentValidation, // guarded throw, treated as real validation
    Inconclusive,       // raw pair present but the decoded walk disagrees
};

constexpr std::string_view throwShapeName(ThrowShape s) {
    switch (s) {
        case ThrowShape::None:               return "none";
        case ThrowShape::PlaceholderStub:    return "placeholder-stub";
        case ThrowShape::ArgumentValidation: return "argument-validation";
        case ThrowShape::Inconclusive:       return "inconclusive";
    }
    return "none";
}

struct ThrowAnalysis {
    ThrowShape shape = ThrowShape::None;
    unsigned weight = 0;      // meaningful-operation weight before the throw
    size_t throwOffset = 0;   // offset of the decoded throw, if reached
};

// Pattern queries over raw CIL method bodies.
class BodyPatternAnalyzer {
public:
    static constexpr unsigned kDefaultStubWeightThreshold = 3;
    static constexpr size_t   kDefaultReturnMaxBytes = 8;

    explicit BodyPatternAnalyzer(unsigned stubWeightThreshold = kDefaultStubWeightThreshold)
        : stubWeightThreshold_(stubWeightThreshold) {}

    unsigned stubWeightThreshold() const { return stubWeightThreshold_; }

    // newobj <token> throw, anywhere in the raw bytes.
    static bool containsConstructAndThrow(llvm::ArrayRef<uint8_t> body);

    // Weight contributed by one opcode to the stub-throw disambiguation.
    static unsigned opcodeWeight(uint8_t op);

    ThrowAnalysis analyzeThrow(llvm::ArrayRef<uint8_t> body) const;
    bool isPlaceholderStub(llvm::ArrayRef<uint8_t> body) const {
        return analyzeThrow(body).shape == ThrowShape::PlaceholderStub;
    }

    // ldnull / ldc.i4.0 / ldc.i4.1 followed by ret in a short non-void body.
    static bool returnsOnlyDefault(llvm::ArrayRef<uint8_t> body, bool returnsVoid);

    // Any ldc.i4.* (including short and full forms) immediately before ret.
    static bool returnsConstant(llvm::ArrayRef<uint8_t> body);

    // Body decodes to nothing but nops and a single ret.
    static bool isSingleReturn(llvm::ArrayRef<uint8_t> body);

    // Calls, branches, field or array access, object construction, stores
    // and throws count as meaningful. A malformed body counts as meaningful.
    static bool hasMeaningfulOpcodes(llvm::ArrayRef<uint8_t> body);

    // Argument slots read, address-taken or stored anywhere in the body.
    // Returns false if the body could not be decoded.
    static bool collectArgumentReferences(llvm::ArrayRef<uint8_t> body,
                                          llvm::SmallVectorImpl<unsigned> &slots);

    // Heuristic in [0, 1]; higher means more likely unfinished.
    static double incompletenessScore(llvm::ArrayRef<uint8_t> body, bool returnsVoid);

private:
    unsigned stubWeightThreshold_;
};

} // namespace stubscan::il
