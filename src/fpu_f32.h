#ifndef RV32ARITH_FPU_F32_H
#define RV32ARITH_FPU_F32_H

#include "arith_config.h"
#include "bit_vector.h"

// Exception flags at their RISC-V fflags bit positions
enum fp_exceptions {
    FP_INEXACT        = 0x01,   // NX
    FP_UNDERFLOW      = 0x02,   // UF
    FP_OVERFLOW       = 0x04,   // OF
    FP_DIVIDE_BY_ZERO = 0x08,   // DZ, reserved: no FP divide here
    FP_INVALID_OP     = 0x10    // NV
};

enum fpu_op {
    FPU_FADD = 0x0,
    FPU_FSUB = 0x1,
    FPU_FMUL = 0x2
};

enum f32_category {
    F32_ZERO,
    F32_SUBNORMAL,
    F32_NORMAL,
    F32_INFINITY,
    F32_NAN
};

struct f32_class_t {
    f32_category category;
    bool         sign;
};

// Raw fields of a binary32 pattern
struct f32_fields_t {
    int        sign;       // 0 or 1
    bit_vector exponent;   // 8 bits
    bit_vector fraction;   // 23 bits
};

struct fpu_result_t {
    bit_vector   res_bits;
    sc_uint<5>   flags;    // OR of fp_exceptions
    step_trace_t trace;
};

bit_vector   pack_f32_fields(int sign, const bit_vector& exponent, const bit_vector& fraction);
f32_fields_t unpack_f32(const bit_vector& bits);

f32_class_t classify_f32(const bit_vector& bits);
bool        f32_is_nan(const bit_vector& bits);
bit_vector  flip_sign_f32(const bit_vector& bits);

fpu_result_t fadd_f32(const bit_vector& a, const bit_vector& b);
fpu_result_t fsub_f32(const bit_vector& a, const bit_vector& b);
fpu_result_t fmul_f32(const bit_vector& a, const bit_vector& b);

// Dispatch by tag; unknown tags raise /rv32arith/invalid_op
fpu_result_t fpu_execute(fpu_op op, const bit_vector& a, const bit_vector& b);

const char* f32_category_name(f32_category c);
const char* fpu_op_name(fpu_op op);

#endif
