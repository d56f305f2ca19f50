#include "stubscan/il/InstructionDecoder.h"

#include <llvm/Support/Endian.h>

namespace stubscan::il {

namespace {

uint64_t readOperand(const uint8_t *p, OperandKind kind) {
    using namespace llvm::support::endian;
    switch (kind) {
        case OperandKind::None:
            return 0;
        case OperandKind::Int8:
        case OperandKind::BranchTarget8:
            return *p;
        case OperandKind::Int16:
            return read16le(p);
        case OperandKind::Int32:
        case OperandKind::Token:
        case OperandKind::BranchTarget32:
        case OperandKind::SwitchTable:
            return read32le(p);
        case OperandKind::Int64:
            return read64le(p);
    }
    return 0;
}

} // anonymous namespace

std::optional<Instruction> InstructionDecoder::next() {
    if (malformed_ || atEnd())
        return std::nullopt;

    Instruction I;
    I.offset = pos_;

    size_t cursor = pos_;
    uint8_t lead = body_[cursor++];
    std::optional<OpcodeInfo> info;

    if (lead == byteOf(Opcode::Prefix)) {
        if (cursor >= body_.size()) {
            malformed_ = true;
            return std::nullopt;
        }
        uint8_t second = body_[cursor++];
        info = lookupTwoByte(second);
        I.opcode = static_cast<uint16_t>(0xFE00u | second);
    } else {
        info = lookupOneByte(lead);
        I.opcode = lead;
    }

    if (!info) {
        malformed_ = true;
        return std::nullopt;
    }

    I.operandKind = info->operand;
    unsigned width = operandWidth(info->operand);
    if (cursor + width > body_.size()) {
        malformed_ = true;
        return std::nullopt;
    }
    I.operand = readOperand(body_.data() + cursor, info->operand);
    cursor += width;

    if (info->operand == OperandKind::SwitchTable) {
        uint64_t tableBytes = I.operand * 4;
        if (tableBytes > body_.size() - cursor) {
            malformed_ = true;
            return std::nullopt;
        }
        cursor += static_cast<size_t>(tableBytes);
    }

    I.length = cursor - pos_;
    pos_ = cursor;
    return I;
}

std::optional<std::vector<Instruction>>
InstructionDecoder::decodeAll(llvm::ArrayRef<uint8_t> body) {
    InstructionDecoder decoder(body);
    std::vector<Instruction> out;
    while (auto I = decoder.next())
        out.push_back(*I);
    if (decoder.malformed())
        return std::nullopt;
    return out;
}

} // namespace stubscan::il
