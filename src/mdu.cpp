#include "mdu.h"

#include <iomanip>
#include <sstream>

static const int PRODUCT_WIDTH = 2 * XLEN;

// ---------------- Local bit-vector helpers ----------------
static bit_vector widen(const bit_vector& x, int width, bool as_signed) {
    bool fill = as_signed && x.msb();
    return concat(bit_vector::filled(width - x.width(), fill), x);
}

static bit_vector shl(const bit_vector& x, int distance) {
    if (distance == 0) return x;
    return concat(slice(x, distance, x.width() - distance), bit_vector(distance));
}

static bit_vector magnitude(const bit_vector& x, bool& was_negative) {
    was_negative = x.msb();
    return was_negative ? negate(x) : x;
}

//==============================================================================
//
// Multiply: 32 partial products of the 64-bit extended multiplicand.
// For a signed multiplier the top partial product has weight -2^31 and is
// subtracted instead of added.
//
mdu_mul_result_t mdu_mul(mdu_op op, const bit_vector& a, const bit_vector& b) {
    if (!require_width(a, XLEN, "mdu_mul operand a") || !require_width(b, XLEN, "mdu_mul operand b")) {
        bit_vector zero(XLEN);
        mdu_mul_result_t none = { zero, zero, zero, false, step_trace_t() };
        return none;
    }

    bool a_signed, b_signed;
    switch (op) {
        case MDU_MUL:
        case MDU_MULH:   a_signed = true;  b_signed = true;  break;
        case MDU_MULHSU: a_signed = true;  b_signed = false; break;
        case MDU_MULHU:  a_signed = false; b_signed = false; break;
        default: {
            report_invalid_op("mdu_mul", static_cast<int>(op));
            mdu_mul_result_t none = { a, a, a, false, step_trace_t() };
            return none;
        }
    }

    bit_vector mcand = widen(a, PRODUCT_WIDTH, a_signed);
    bit_vector acc(PRODUCT_WIDTH);
    step_trace_t trace;

    for (int i = 0; i < XLEN; ++i) {
        bool b_i = b.bit(XLEN - 1 - i);
        bit_vector pp = b_i ? shl(mcand, i) : bit_vector(PRODUCT_WIDTH);

        bool negative_weight = b_signed && (i == XLEN - 1);
        if (negative_weight) {
            acc = add_with_carry(acc, negate(pp), false).sum;
        } else {
            acc = add_with_carry(acc, pp, false).sum;
        }

        std::ostringstream step;
        step << "step=" << std::setw(2) << std::setfill('0') << i
             << " b[" << i << "]=" << b_i
             << " pp=0x" << format_hex(pp)
             << (negative_weight ? " sub" : " add")
             << " acc=0x" << format_hex(acc);
        trace.push_back(step.str());
    }

    bit_vector hi = slice(acc, 0, XLEN);
    bit_vector lo = slice(acc, XLEN, XLEN);

    bool overflow;
    if (op == MDU_MULHU) {
        overflow = !hi.is_zero();
    } else {
        overflow = widen(lo, PRODUCT_WIDTH, true) != acc;
    }

    mdu_mul_result_t out = { (op == MDU_MUL) ? lo : hi, lo, hi, overflow, trace };

    std::ostringstream msg;
    msg << mdu_op_name(op) << " " << a << ", " << b << " -> hi=" << hi << " lo=" << lo
        << " overflow=" << overflow;
    SC_REPORT_INFO_VERB(RV32ARITH_MSG_MDU, msg.str().c_str(), SC_DEBUG);
    return out;
}

//==============================================================================
//
// Divide: restoring long division on magnitudes, 33-bit partial remainder
//
static void restoring_divide(const bit_vector& dividend, const bit_vector& divisor,
                             bit_vector& q, bit_vector& r, step_trace_t& trace) {
    bit_vector rem(XLEN + 1);
    bit_vector quo = dividend;
    bit_vector neg_d = negate(widen(divisor, XLEN + 1, false));

    for (int step = 0; step < XLEN; ++step) {
        // Shift {rem, quo} left one position
        rem = concat(slice(rem, 1, XLEN), slice(quo, 0, 1));
        quo = shl(quo, 1);

        adder_out_t trial = add_with_carry(rem, neg_d, false);
        bool fits = trial.carry_out;   // no borrow: rem >= divisor
        if (fits) {
            rem = trial.sum;
            quo = concat(slice(quo, 0, XLEN - 1), bit_vector::filled(1, true));
        }

        std::ostringstream s;
        s << "step=" << std::setw(2) << std::setfill('0') << step
          << " r=0x" << format_hex(slice(rem, 1, XLEN))
          << " q=0x" << format_hex(quo)
          << " action=" << (fits ? "SUB" : "RESTORE");
        trace.push_back(s.str());
    }

    q = quo;
    r = slice(rem, 1, XLEN);
}

mdu_div_result_t mdu_div(mdu_op op, const bit_vector& dividend, const bit_vector& divisor) {
    if (!require_width(dividend, XLEN, "mdu_div dividend") || !require_width(divisor, XLEN, "mdu_div divisor")) {
        bit_vector zero(XLEN);
        mdu_div_result_t none = { zero, zero, zero, false, false, step_trace_t() };
        return none;
    }

    bool is_signed;
    bool wants_quotient;
    switch (op) {
        case MDU_DIV:  is_signed = true;  wants_quotient = true;  break;
        case MDU_DIVU: is_signed = false; wants_quotient = true;  break;
        case MDU_REM:  is_signed = true;  wants_quotient = false; break;
        case MDU_REMU: is_signed = false; wants_quotient = false; break;
        default: {
            report_invalid_op("mdu_div", static_cast<int>(op));
            mdu_div_result_t none = { dividend, dividend, dividend, false, false, step_trace_t() };
            return none;
        }
    }

    mdu_div_result_t out = { dividend, dividend, dividend, false, false, step_trace_t() };

    bit_vector int_min = concat(bit_vector::filled(1, true), bit_vector(XLEN - 1));

    if (divisor.is_zero()) {
        out.q_bits = bit_vector::filled(XLEN, true);
        out.r_bits = dividend;
        out.div_by_zero = true;
        out.trace.push_back("divide-by-zero: q=all-ones r=dividend");
    } else if (is_signed && dividend == int_min && divisor.is_all_ones()) {
        out.q_bits = int_min;
        out.r_bits = bit_vector(XLEN);
        out.overflow = true;
        out.trace.push_back("signed overflow INT_MIN/-1: q=INT_MIN r=0");
    } else {
        bool a_neg = false, b_neg = false;
        bit_vector a_mag = is_signed ? magnitude(dividend, a_neg) : dividend;
        bit_vector b_mag = is_signed ? magnitude(divisor, b_neg) : divisor;

        bit_vector q_mag(XLEN), r_mag(XLEN);
        restoring_divide(a_mag, b_mag, q_mag, r_mag, out.trace);

        // Truncating division: quotient sign = a^b, remainder follows the dividend
        out.q_bits = (a_neg != b_neg) ? negate(q_mag) : q_mag;
        out.r_bits = a_neg ? negate(r_mag) : r_mag;
    }

    out.rd_bits = wants_quotient ? out.q_bits : out.r_bits;

    std::ostringstream msg;
    msg << mdu_op_name(op) << " " << dividend << ", " << divisor << " -> q=" << out.q_bits
        << " r=" << out.r_bits;
    SC_REPORT_INFO_VERB(RV32ARITH_MSG_MDU, msg.str().c_str(), SC_DEBUG);
    return out;
}

const char* mdu_op_name(mdu_op op) {
    switch (op) {
        case MDU_MUL:    return "MUL";
        case MDU_MULH:   return "MULH";
        case MDU_MULHSU: return "MULHSU";
        case MDU_MULHU:  return "MULHU";
        case MDU_DIV:    return "DIV";
        case MDU_DIVU:   return "DIVU";
        case MDU_REM:    return "REM";
        case MDU_REMU:   return "REMU";
    }
    return "?";
}
