#include "stubscan/il/Opcode.h"

namespace stubscan::il {

namespace {

using OK = OperandKind;

constexpr OpcodeInfo info(const char *m, OperandKind k = OK::None) {
    return OpcodeInfo{m, k};
}

} // anonymous namespace

std::optional<OpcodeInfo> lookupOneByte(uint8_t op) {
    // Contiguous operand-less ranges first.
    if (op >= 0x02 && op <= 0x05) return info("ldarg.n");
    if (op >= 0x06 && op <= 0x09) return info("ldloc.n");
    if (op >= 0x0A && op <= 0x0D) return info("stloc.n");
    if (op >= 0x15 && op <= 0x1E) return info("ldc.i4.n");
    if (op >= 0x2B && op <= 0x37) return info("br.s-family", OK::BranchTarget8);
    if (op >= 0x38 && op <= 0x44) return info("br-family", OK::BranchTarget32);
    if (op >= 0x46 && op <= 0x57) return info("ldind/stind");
    if (op >= 0x58 && op <= 0x6E) return info("arith/conv");
    if (op >= 0x82 && op <= 0x8B) return info("conv.ovf.un");
    if (op >= 0x90 && op <= 0xA2) return info("ldelem/stelem");
    if (op >= 0xB3 && op <= 0xBA) return info("conv.ovf");
    if (op >= 0xD1 && op <= 0xDB) return info("conv/ovf-arith");

    switch (op) {
        case 0x00: return info("nop");
        case 0x01: return info("break");
        case 0x0E: return info("ldarg.s", OK::Int8);
        case 0x0F: return info("ldarga.s", OK::Int8);
        case 0x10: return info("starg.s", OK::Int8);
        case 0x11: return info("ldloc.s", OK::Int8);
        case 0x12: return info("ldloca.s", OK::Int8);
        case 0x13: return info("stloc.s", OK::Int8);
        case 0x14: return info("ldnull");
        case 0x1F: return info("ldc.i4.s", OK::Int8);
        case 0x20: return info("ldc.i4", OK::Int32);
        case 0x21: return info("ldc.i8", OK::Int64);
        case 0x22: return info("ldc.r4", OK::Int32);
        case 0x23: return info("ldc.r8", OK::Int64);
        case 0x25: return info("dup");
        case 0x26: return info("pop");
        case 0x27: return info("jmp", OK::Token);
        case 0x28: return info("call", OK::Token);
        case 0x29: return info("calli", OK::Token);
        case 0x2A: return info("ret");
        case 0x45: return info("switch", OK::SwitchTable);
        case 0x6F: return info("callvirt", OK::Token);
        case 0x70: return info("cpobj", OK::Token);
        case 0x71: return info("ldobj", OK::Token);
        case 0x72: return info("ldstr", OK::Token);
        case 0x73: return info("newobj", OK::Token);
        case 0x74: return info("castclass", OK::Token);
        case 0x75: return info("isinst", OK::Token);
        case 0x76: return info("conv.r.un");
        case 0x79: return info("unbox", OK::Token);
        case 0x7A: return info("throw");
        case 0x7B: return info("ldfld", OK::Token);
        case 0x7C: return info("ldflda", OK::Token);
        case 0x7D: return info("stfld", OK::Token);
        case 0x7E: return info("ldsfld", OK::Token);
        case 0x7F: return info("ldsflda", OK::Token);
        case 0x80: return info("stsfld", OK::Token);
        case 0x81: return info("stobj", OK::Token);
        case 0x8C: return info("box", OK::Token);
        case 0x8D: return info("newarr", OK::Token);
        case 0x8E: return info("ldlen");
        case 0x8F: return info("ldelema", OK::Token);
        case 0xA3: return info("ldelem", OK::Token);
        case 0xA4: return info("stelem", OK::Token);
        case 0xA5: return info("unbox.any", OK::Token);
        case 0xC2: return info("refanyval", OK::Token);
        case 0xC3: return info("ckfinite");
        case 0xC6: return info("mkrefany", OK::Token);
        case 0xD0: return info("ldtoken", OK::Token);
        case 0xDC: return info("endfinally");
        case 0xDD: return info("leave", OK::BranchTarget32);
        case 0xDE: return info("leave.s", OK::BranchTarget8);
        case 0xDF: return info("stind.i");
        case 0xE0: return info("conv.u");
        default:   break;
    }
    return std::nullopt;
}

std::optional<OpcodeInfo> lookupTwoByte(uint8_t second) {
    switch (second) {
        case 0x00: return info("arglist");
        case 0x01: return info("ceq");
        case 0x02: return info("cgt");
        case 0x03: return info("cgt.un");
        case 0x04: return info("clt");
        case 0x05: return info("clt.un");
        case 0x06: return info("ldftn", OK::Token);
        case 0x07: return info("ldvirtftn", OK::Token);
        case 0x09: return info("ldarg", OK::Int16);
        case 0x0A: return info("ldarga", OK::Int16);
        case 0x0B: return info("starg", OK::Int16);
        case 0x0C: return info("ldloc", OK::Int16);
        case 0x0D: return info("ldloca", OK::Int16);
        case 0x0E: return info("stloc", OK::Int16);
        case 0x0F: return info("localloc");
        case 0x11: return info("endfilter");
        case 0x12: return info("unaligned.", OK::Int8);
        case 0x13: return info("volatile.");
        case 0x14: return info("tail.");
        case 0x15: return info("initobj", OK::Token);
        case 0x16: return info("constrained.", OK::Token);
        case 0x17: return info("cpblk");
        case 0x18: return info("initblk");
        case 0x19: return info("no.", OK::Int8);
        case 0x1A: return info("rethrow");
        case 0x1C: return info("sizeof", OK::Token);
        case 0x1D: return info("refanytype");
        case 0x1E: return info("readonly.");
        default:   break;
    }
    return std::nullopt;
}

unsigned operandWidth(OperandKind kind) {
    switch (kind) {
        case OperandKind::None:           return 0;
        case OperandKind::Int8:           return 1;
        case OperandKind::BranchTarget8:  return 1;
        case OperandKind::Int16:          return 2;
        case OperandKind::Int32:          return 4;
        case OperandKind::Token:          return 4;
        case OperandKind::BranchTarget32: return 4;
        case OperandKind::SwitchTable:    return 4;
        case OperandKind::Int64:          return 8;
    }
    return 0;
}

} // namespace stubscan::il
