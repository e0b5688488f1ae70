#include "shifter.h"

#include <vector>

// One barrel stage: shift by 2^k or pass through
static bit_vector shift_stage(const bit_vector& x, int distance, shift_op op) {
    int width = x.width();
    bool fill = (op == SHIFT_SRA) ? x.msb() : false;

    std::vector<bool> out(width);
    for (int i = 0; i < width; ++i) {
        if (op == SHIFT_SLL) {
            int src = i + distance;
            out[i] = (src < width) ? x.bit(src) : false;
        } else {
            int src = i - distance;
            out[i] = (src >= 0) ? x.bit(src) : fill;
        }
    }
    return bit_vector::from_bits(out);
}

bit_vector shift(const bit_vector& x, unsigned int amount, shift_op op) {
    if (!require_width(x, XLEN, "shifter operand")) return bit_vector(XLEN);

    switch (op) {
        case SHIFT_SLL:
        case SHIFT_SRL:
        case SHIFT_SRA:
            break;
        default:
            report_invalid_op("shifter", static_cast<int>(op));
            return x;
    }

    unsigned int shamt = amount % XLEN;
    bit_vector out = x;
    // 5-stage barrel: 16, 8, 4, 2, 1
    for (int k = 4; k >= 0; --k) {
        if ((shamt >> k) & 1u) out = shift_stage(out, 1 << k, op);
    }
    return out;
}

bit_vector shift_by(const bit_vector& x, const bit_vector& amount_bits, shift_op op) {
    unsigned int shamt = 0;
    int width = amount_bits.width();
    for (int i = (width > 5 ? width - 5 : 0); i < width; ++i) {
        shamt = (shamt << 1) | (amount_bits.bit(i) ? 1u : 0u);
    }
    return shift(x, shamt, op);
}

const char* shift_op_name(shift_op op) {
    switch (op) {
        case SHIFT_SLL: return "SLL";
        case SHIFT_SRL: return "SRL";
        case SHIFT_SRA: return "SRA";
    }
    return "?";
}
