#pragma once

#include <cstdint>
#include <optional>

namespace stubscan::il {

// The handful of CIL instructions the analyzers reason about, with their
// encoded byte values (ECMA-335 Partition III). Two-byte instructions are
// encoded as 0xFE00 | second byte.
enum class Opcode : uint16_t {
    Nop       = 0x00,
    LdArg0    = 0x02,
    LdArg1    = 0x03,
    LdArg2    = 0x04,
    LdArg3    = 0x05,
    LdLoc0    = 0x06,
    LdLoc3    = 0x09,
    LdArgS    = 0x0E,
    LdArgaS   = 0x0F,
    StArgS    = 0x10,
    LdNull    = 0x14,
    LdcI4_0   = 0x16,
    LdcI4_1   = 0x17,
    Call      = 0x28,
    CallI     = 0x29,
    Ret       = 0x2A,
    BrS       = 0x2B,
    BltUnS    = 0x37,
    Br        = 0x38,
    Blt       = 0x3F,
    Switch    = 0x45,
    CallVirt  = 0x6F,
    NewObj    = 0x73,
    Throw     = 0x7A,
    LdFld     = 0x7B,
    LdFlda    = 0x7C,
    StFld     = 0x7D,
    LdsFld    = 0x7E,
    LdsFlda   = 0x7F,
    StsFld    = 0x80,
    NewArr    = 0x8D,
    LdToken   = 0xD0,
    Leave     = 0xDD,
    LeaveS    = 0xDE,
    Prefix    = 0xFE,

    LdFtn     = 0xFE06,
    LdVirtFtn = 0xFE07,
    LdArg     = 0xFE09,
    LdArga    = 0xFE0A,
    StArg     = 0xFE0B,
    Rethrow   = 0xFE1A,
};

constexpr uint8_t byteOf(Opcode op) { return static_cast<uint8_t>(op); }

// Operand layout of an instruction. Switch carries a 4-byte count followed
// by that many 4-byte targets.
enum class OperandKind : uint8_t {
    None,
    Int8,
    Int16,
    Int32,
    Int64,
    Token,
    BranchTarget8,
    BranchTarget32,
    SwitchTable,
};

struct OpcodeInfo {
    const char  *mnemonic;
    OperandKind  operand;
};

// Returns nullopt for byte values that do not encode an instruction.
std::optional<OpcodeInfo> lookupOneByte(uint8_t op);
std::optional<OpcodeInfo> lookupTwoByte(uint8_t second);

// Fixed operand width in bytes; SwitchTable reports its 4-byte count only.
unsigned operandWidth(OperandKind kind);

// Families used by the stub-throw weighting. The load-argument family
// follows the historical byte range 0x02-0x09 (which also spans ldloc.0-3)
// plus ldarg.s.
constexpr bool isLoadArgumentFamily(uint8_t op) {
    return (op >= 0x02 && op <= 0x09) || op == 0x0E;
}
constexpr bool isBranchFamily(uint8_t op) { return op >= 0x38 && op <= 0x45; }
constexpr bool isCallFamily(uint8_t op) { return op == 0x28 || op == 0x6F; }

} // namespace stubscan::il
