#ifndef RV32ARITH_ARITH_UNITS_H
#define RV32ARITH_ARITH_UNITS_H

#include "arith_config.h"
#include "fcsr.h"

//==============================================================================
//
// Signal-level wrappers. Each combinational unit re-evaluates whenever an
// input changes; a tag outside the unit's enumeration raises
// /rv32arith/invalid_op from inside the process.
//

// Module: alu_unit
SC_MODULE(alu_unit) {
    sc_in<sc_uint<32>>  a;
    sc_in<sc_uint<32>>  b;
    sc_in<sc_uint<4>>   op;        // alu_op

    sc_out<sc_uint<32>> result;
    sc_out<bool>        n;
    sc_out<bool>        z;
    sc_out<bool>        c;
    sc_out<bool>        v;

    void eval();

    SC_CTOR(alu_unit) {
        SC_METHOD(eval);
        sensitive << a << b << op;
    }
};

// Module: shifter_unit
SC_MODULE(shifter_unit) {
    sc_in<sc_uint<32>>  x;
    sc_in<sc_uint<5>>   shamt;
    sc_in<sc_uint<2>>   op;        // shift_op

    sc_out<sc_uint<32>> result;

    void eval();

    SC_CTOR(shifter_unit) {
        SC_METHOD(eval);
        sensitive << x << shamt << op;
    }
};

// Module: mdu_unit
// op is the RV32M funct3: MUL MULH MULHSU MULHU DIV DIVU REM REMU
SC_MODULE(mdu_unit) {
    sc_in<sc_uint<32>>  a;
    sc_in<sc_uint<32>>  b;
    sc_in<sc_uint<3>>   op;

    sc_out<sc_uint<32>> rd;

    void eval();

    SC_CTOR(mdu_unit) {
        SC_METHOD(eval);
        sensitive << a << b << op;
    }
};

// Module: fpu_unit
SC_MODULE(fpu_unit) {
    sc_in<sc_uint<32>>  a;
    sc_in<sc_uint<32>>  b;
    sc_in<sc_uint<2>>   op;        // fpu_op

    sc_out<sc_uint<32>> result;
    sc_out<sc_uint<5>>  fflags;

    void eval();

    SC_CTOR(fpu_unit) {
        SC_METHOD(eval);
        sensitive << a << b << op;
    }
};

//==============================================================================
//
// Module: fcsr_reg
// Holds one FCSR. On a rising edge: reset restores new_fcsr(); otherwise
// clear empties the sticky bits, frm_we loads frm_in, and valid ORs
// fflags_in into the sticky bits (after a same-cycle clear).
//
SC_MODULE(fcsr_reg) {
    sc_in<bool>        clk;
    sc_in<bool>        reset;
    sc_in<bool>        valid;
    sc_in<sc_uint<5>>  fflags_in;
    sc_in<bool>        clear;
    sc_in<bool>        frm_we;
    sc_in<sc_uint<3>>  frm_in;

    sc_out<sc_uint<8>> fflags_out;   // fcsr_pack_u8
    sc_out<sc_uint<3>> frm_out;

    fcsr_t csr;

    void tick();

    const fcsr_t& state() const { return csr; }

    SC_CTOR(fcsr_reg) : csr(new_fcsr()) {
        SC_METHOD(tick);
        sensitive << clk.pos();
    }
};

#endif
