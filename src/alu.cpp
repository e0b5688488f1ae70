#include "alu.h"
#include "shifter.h"

#include <sstream>

// ---------------- Flag helpers ----------------
static alu_result_t with_flags(const bit_vector& result, bool carry, bool overflow) {
    alu_result_t r = { result, result.msb(), result.is_zero(), carry, overflow };
    return r;
}

static alu_result_t logic_result(const bit_vector& result) {
    return with_flags(result, false, false);
}

// a + (-b): C is the raw carry-out of that single addition
static alu_result_t do_sub(const bit_vector& a, const bit_vector& b) {
    adder_out_t sum = add_with_carry(a, negate(b), false);
    bool sa = a.msb(), sb = b.msb(), sr = sum.sum.msb();
    return with_flags(sum.sum, sum.carry_out, (sa != sb) && (sr != sa));
}

// Unsigned a < b: no carry out of a + ~b + 1
static bool unsigned_less(const bit_vector& a, const bit_vector& b) {
    return !add_with_carry(a, invert(b), true).carry_out;
}

alu_result_t alu(const bit_vector& a, const bit_vector& b, alu_op op) {
    if (!require_width(a, XLEN, "alu operand a") || !require_width(b, XLEN, "alu operand b")) {
        return logic_result(bit_vector(XLEN));
    }

    alu_result_t out = logic_result(a);
    switch (op) {
        case ALU_ADD: {
            adder_out_t sum = add_with_carry(a, b, false);
            bool sa = a.msb(), sb = b.msb(), sr = sum.sum.msb();
            out = with_flags(sum.sum, sum.carry_out, (sa == sb) && (sr != sa));
            break;
        }
        case ALU_SUB:
            out = do_sub(a, b);
            break;
        case ALU_OR:
            out = logic_result(bitwise_or(a, b));
            break;
        case ALU_AND:
            out = logic_result(bitwise_and(a, b));
            break;
        case ALU_XOR:
            out = logic_result(bitwise_xor(a, b));
            break;
        case ALU_SLT:
        case ALU_SLTU: {
            alu_result_t diff = do_sub(a, b);
            bool less = (op == ALU_SLT) ? (diff.n != diff.v) : unsigned_less(a, b);
            bit_vector r = bit_vector::from_uint(less ? 1u : 0u, XLEN);
            out = with_flags(r, diff.c, diff.v);
            break;
        }
        case ALU_SLL:
            out = logic_result(shift_by(a, b, SHIFT_SLL));
            break;
        case ALU_SRL:
            out = logic_result(shift_by(a, b, SHIFT_SRL));
            break;
        case ALU_SRA:
            out = logic_result(shift_by(a, b, SHIFT_SRA));
            break;
        default:
            report_invalid_op("alu", static_cast<int>(op));
            return out;
    }

    std::ostringstream msg;
    msg << alu_op_name(op) << " " << a << ", " << b << " -> " << out.result
        << " N=" << out.n << " Z=" << out.z << " C=" << out.c << " V=" << out.v;
    SC_REPORT_INFO_VERB(RV32ARITH_MSG_ALU, msg.str().c_str(), SC_DEBUG);
    return out;
}

const char* alu_op_name(alu_op op) {
    switch (op) {
        case ALU_ADD:  return "ADD";
        case ALU_SUB:  return "SUB";
        case ALU_OR:   return "OR";
        case ALU_AND:  return "AND";
        case ALU_XOR:  return "XOR";
        case ALU_SLT:  return "SLT";
        case ALU_SLTU: return "SLTU";
        case ALU_SLL:  return "SLL";
        case ALU_SRL:  return "SRL";
        case ALU_SRA:  return "SRA";
    }
    return "?";
}
