#include "stubscan/il/BodyPatternAnalyzer.h"
#include "stubscan/il/InstructionDecoder.h"

#include <algorithm>

namespace stubscan::il {

namespace {

constexpr size_t kNewObjOperandBytes = 4;

bool isConstantLoad(const Instruction &I) {
    if (I.isTwoByte())
        return false;
    uint8_t op = I.leadByte();
    return op == byteOf(Opcode::LdNull) || (op >= 0x15 && op <= 0x23);
}

bool isMeaningful(const Instruction &I) {
    if (I.isTwoByte()) {
        switch (static_cast<Opcode>(I.opcode)) {
            case Opcode::LdFtn:
            case Opcode::LdVirtFtn:
            case Opcode::StArg:
            case Opcode::Rethrow:
                return true;
            default:
                break;
        }
        uint8_t second = static_cast<uint8_t>(I.opcode & 0xFF);
        // ceq / cgt / clt families, initobj, cpblk, initblk
        return (second >= 0x01 && second <= 0x05) || second == 0x15 ||
               second == 0x17 || second == 0x18;
    }

    uint8_t op = I.leadByte();
    if (op == byteOf(Opcode::Call) || op == byteOf(Opcode::CallI) ||
        op == byteOf(Opcode::CallVirt))
        return true;
    if (op >= byteOf(Opcode::BrS) && op <= byteOf(Opcode::Switch))
        return true;
    if (op == byteOf(Opcode::Leave) || op == byteOf(Opcode::LeaveS))
        return true;
    if (op == byteOf(Opcode::NewObj) || op == byteOf(Opcode::NewArr))
        return true;
    if (op == byteOf(Opcode::Throw) || op == byteOf(Opcode::StArgS))
        return true;
    if (op >= byteOf(Opcode::LdFld) && op <= byteOf(Opcode::StsFld))
        return true;
    if (op >= 0x46 && op <= 0x57) // ldind / stind
        return true;
    if (op >= 0x58 && op <= 0x66) // arithmetic and bitwise
        return true;
    if (op >= 0x8F && op <= 0xA4) // element access
        return true;
    return false;
}

} // anonymous namespace

bool BodyPatternAnalyzer::containsConstructAndThrow(llvm::ArrayRef<uint8_t> body) {
    const size_t span = 1 + kNewObjOperandBytes;
    if (body.size() <= span)
        return false;
    for (size_t i = 0; i + span < body.size(); ++i) {
        if (body[i] == byteOf(Opcode::NewObj) && body[i + span] == byteOf(Opcode::Throw))
            return true;
    }
    return false;
}

unsigned BodyPatternAnalyzer::opcodeWeight(uint8_t op) {
    if (isBranchFamily(op))
        return 2; // branches usually mean a real guard condition
    if (isLoadArgumentFamily(op))
        return 1;
    if (isCallFamily(op))
        return 1;
    return 0;
}

ThrowAnalysis BodyPatternAnalyzer::analyzeThrow(llvm::ArrayRef<uint8_t> body) const {
    ThrowAnalysis result;
    if (!containsConstructAndThrow(body))
        return result;

    InstructionDecoder decoder(body);
    while (auto I = decoder.next()) {
        if (I->is(Opcode::Throw)) {
            result.throwOffset = I->offset;
            result.shape = result.weight <= stubWeightThreshold_
                               ? ThrowShape::PlaceholderStub
                               : ThrowShape::ArgumentValidation;
            return result;
        }
        if (!I->isTwoByte())
            result.weight += opcodeWeight(I->leadByte());
    }

    // Malformed body, or the raw pair sat inside operand bytes.
    result.shape = ThrowShape::Inconclusive;
    return result;
}

bool BodyPatternAnalyzer::returnsOnlyDefault(llvm::ArrayRef<uint8_t> body, bool returnsVoid) {
    if (returnsVoid || body.empty() || body.size() > kDefaultReturnMaxBytes)
        return false;

    for (size_t i = 0; i + 1 < body.size(); ++i) {
        uint8_t op = body[i];
        bool loadsDefault = op == byteOf(Opcode::LdNull) ||
                            op == byteOf(Opcode::LdcI4_0) ||
                            op == byteOf(Opcode::LdcI4_1);
        if (loadsDefault && body[i + 1] == byteOf(Opcode::Ret))
            return true;
    }
    return false;
}

bool BodyPatternAnalyzer::returnsConstant(llvm::ArrayRef<uint8_t> body) {
    auto insts = InstructionDecoder::decodeAll(body);
    if (!insts)
        return false;
    for (size_t i = 1; i < insts->size(); ++i) {
        if ((*insts)[i].is(Opcode::Ret) && isConstantLoad((*insts)[i - 1]))
            return true;
    }
    return false;
}

bool BodyPatternAnalyzer::isSingleReturn(llvm::ArrayRef<uint8_t> body) {
    auto insts = InstructionDecoder::decodeAll(body);
    if (!insts || insts->empty())
        return false;

    unsigned rets = 0;
    for (const auto &I : *insts) {
        if (I.is(Opcode::Ret))
            ++rets;
        else if (!I.is(Opcode::Nop))
            return false;
    }
    return rets == 1 && insts->back().is(Opcode::Ret);
}

bool BodyPatternAnalyzer::hasMeaningfulOpcodes(llvm::ArrayRef<uint8_t> body) {
    InstructionDecoder decoder(body);
    while (auto I = decoder.next()) {
        if (isMeaningful(*I))
            return true;
    }
    return decoder.malformed();
}

bool BodyPatternAnalyzer::collectArgumentReferences(llvm::ArrayRef<uint8_t> body,
                                                    llvm::SmallVectorImpl<unsigned> &slots) {
    InstructionDecoder decoder(body);
    while (auto I = decoder.next()) {
        unsigned slot = 0;
        bool refs = true;

        if (I->isTwoByte()) {
            refs = I->is(Opcode::LdArg) || I->is(Opcode::LdArga) || I->is(Opcode::StArg);
            slot = static_cast<unsigned>(I->operand);
        } else {
            uint8_t op = I->leadByte();
            if (op >= byteOf(Opcode::LdArg0) && op <= byteOf(Opcode::LdArg3))
                slot = op - byteOf(Opcode::LdArg0);
            else if (op == byteOf(Opcode::LdArgS) || op == byteOf(Opcode::LdArgaS) ||
                     op == byteOf(Opcode::StArgS))
                slot = static_cast<unsigned>(I->operand);
            else
                refs = false;
        }

        if (refs && std::find(slots.begin(), slots.end(), slot) == slots.end())
            slots.push_back(slot);
    }
    return !decoder.malformed();
}

double BodyPatternAnalyzer::incompletenessScore(llvm::ArrayRef<uint8_t> body, bool returnsVoid) {
    if (body.empty())
        return 0.8;

    double score = 0.0;
    if (body.size() <= 2)
        score += 0.4;
    else if (body.size() <= 5)
        score += 0.2;

    if (returnsOnlyDefault(body, returnsVoid))
        score += 0.3;
    if (!hasMeaningfulOpcodes(body))
        score += 0.2;
    if (returnsConstant(body))
        score += 0.15;

    return std::min(1.0, score);
}

} // namespace stubscan::il
