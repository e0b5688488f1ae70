#ifndef RV32ARITH_SHIFTER_H
#define RV32ARITH_SHIFTER_H

#include "arith_config.h"
#include "bit_vector.h"

enum shift_op {
    SHIFT_SLL = 0x0,
    SHIFT_SRL = 0x1,
    SHIFT_SRA = 0x2
};

// 32-bit shift; amount is taken modulo 32
bit_vector shift(const bit_vector& x, unsigned int amount, shift_op op);

// Register-sourced amount: only the low 5 bits of amount_bits are used
bit_vector shift_by(const bit_vector& x, const bit_vector& amount_bits, shift_op op);

const char* shift_op_name(shift_op op);

#endif
