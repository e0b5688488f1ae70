#ifndef RV32ARITH_ALU_H
#define RV32ARITH_ALU_H

#include "arith_config.h"
#include "bit_vector.h"

enum alu_op {
    ALU_ADD  = 0x0,
    ALU_SUB  = 0x1,
    ALU_OR   = 0x2,
    ALU_AND  = 0x3,
    ALU_XOR  = 0x4,
    ALU_SLT  = 0x5,
    ALU_SLTU = 0x6,
    ALU_SLL  = 0x7,
    ALU_SRL  = 0x8,
    ALU_SRA  = 0x9
};

struct alu_result_t {
    bit_vector result;
    bool n;   // result MSB
    bool z;   // result all-zero
    bool c;   // raw adder carry-out (SUB: 1 = no borrow)
    bool v;   // signed overflow
};

// a, b must both be XLEN bits wide
alu_result_t alu(const bit_vector& a, const bit_vector& b, alu_op op);

const char* alu_op_name(alu_op op);

#endif
