#ifndef RV32ARITH_MDU_H
#define RV32ARITH_MDU_H

#include "arith_config.h"
#include "bit_vector.h"

// Encodings follow the RV32M funct3 field
enum mdu_op {
    MDU_MUL    = 0x0,
    MDU_MULH   = 0x1,
    MDU_MULHSU = 0x2,
    MDU_MULHU  = 0x3,
    MDU_DIV    = 0x4,
    MDU_DIVU   = 0x5,
    MDU_REM    = 0x6,
    MDU_REMU   = 0x7
};

struct mdu_mul_result_t {
    bit_vector   rd_bits;   // MUL: low word, MULH*: high word
    bit_vector   lo_bits;
    bit_vector   hi_bits;
    bool         overflow;  // product does not fit one word under the variant's signedness
    step_trace_t trace;     // one entry per multiplier bit (32)
};

struct mdu_div_result_t {
    bit_vector   q_bits;
    bit_vector   r_bits;
    bit_vector   rd_bits;     // DIV/DIVU: quotient, REM/REMU: remainder
    bool         overflow;    // signed INT_MIN / -1
    bool         div_by_zero;
    step_trace_t trace;       // one entry per quotient bit (32), or one entry for a singular case
};

// mdu_mul takes MUL..MULHU and mdu_div takes DIV..REMU; any other tag raises
mdu_mul_result_t mdu_mul(mdu_op op, const bit_vector& a, const bit_vector& b);
mdu_div_result_t mdu_div(mdu_op op, const bit_vector& dividend, const bit_vector& divisor);

const char* mdu_op_name(mdu_op op);

#endif
