#pragma once

#include "stubscan/il/Opcode.h"

#include <llvm/ADT/ArrayRef.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace stubscan::il {

struct Instruction {
    size_t      offset = 0;
    uint16_t    opcode = 0;  // 0xFE00 | second byte for two-byte forms
    OperandKind operandKind = OperandKind::None;
    uint64_t    operand = 0; // little-endian immediate; switch: target count
    size_t      length = 0;  // total encoded size, including switch targets

    bool is(Opcode op) const { return opcode == static_cast<uint16_t>(op); }
    bool isTwoByte() const { return opcode > 0xFF; }

    // One-byte opcode value, or 0xFE for two-byte instructions.
    uint8_t leadByte() const {
        return isTwoByte() ? byteOf(Opcode::Prefix) : static_cast<uint8_t>(opcode);
    }

    uint32_t token() const { return static_cast<uint32_t>(operand); }
};

// Linear decoder over a CIL method body. Stops at the first byte that
// does not encode an instruction or whose operand runs past the end.
class InstructionDecoder {
public:
    explicit InstructionDecoder(llvm::ArrayRef<uint8_t> body) : body_(body) {}

    std::optional<Instruction> next();

    bool atEnd() const { return pos_ >= body_.size(); }
    bool malformed() const { return malformed_; }

    // Decodes the whole body; nullopt when it is malformed.
    static std::optional<std::vector<Instruction>> decodeAll(llvm::ArrayRef<uint8_t> body);

private:
    llvm::ArrayRef<uint8_t> body_;
    size_t pos_ = 0;
    bool malformed_ = false;
};

} // namespace stubscan::il
