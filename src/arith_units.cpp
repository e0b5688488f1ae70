#include "arith_units.h"
#include "alu.h"
#include "fpu_f32.h"
#include "mdu.h"
#include "shifter.h"

#include <sstream>

static bit_vector word_to_bits(const sc_uint<32>& w) {
    return bit_vector::from_uint(w.to_uint64(), XLEN);
}

static sc_uint<32> bits_to_word(const bit_vector& bits) {
    return sc_uint<32>(bits.to_uint64());
}

static void trace_eval(const char* unit, const char* op, const bit_vector& result) {
    std::ostringstream msg;
    msg << unit << " " << op << " -> " << result << " @ " << sc_time_stamp();
    SC_REPORT_INFO_VERB(RV32ARITH_MSG_UNITS, msg.str().c_str(), SC_HIGH);
}

// ---------------- alu_unit ----------------
void alu_unit::eval() {
    alu_op tag = static_cast<alu_op>(op.read().to_uint());
    alu_result_t r = alu(word_to_bits(a.read()), word_to_bits(b.read()), tag);

    result.write(bits_to_word(r.result));
    n.write(r.n);
    z.write(r.z);
    c.write(r.c);
    v.write(r.v);
    trace_eval(name(), alu_op_name(tag), r.result);
}

// ---------------- shifter_unit ----------------
void shifter_unit::eval() {
    shift_op tag = static_cast<shift_op>(op.read().to_uint());
    bit_vector r = shift(word_to_bits(x.read()), shamt.read().to_uint(), tag);

    result.write(bits_to_word(r));
    trace_eval(name(), shift_op_name(tag), r);
}

// ---------------- mdu_unit ----------------
void mdu_unit::eval() {
    mdu_op funct3 = static_cast<mdu_op>(op.read().to_uint());
    bit_vector lhs = word_to_bits(a.read());
    bit_vector rhs = word_to_bits(b.read());

    bit_vector r(XLEN);
    if (funct3 < MDU_DIV) {
        r = mdu_mul(funct3, lhs, rhs).rd_bits;
    } else {
        r = mdu_div(funct3, lhs, rhs).rd_bits;
    }

    rd.write(bits_to_word(r));
    trace_eval(name(), mdu_op_name(funct3), r);
}

// ---------------- fpu_unit ----------------
void fpu_unit::eval() {
    fpu_op tag = static_cast<fpu_op>(op.read().to_uint());
    fpu_result_t r = fpu_execute(tag, word_to_bits(a.read()), word_to_bits(b.read()));

    result.write(bits_to_word(r.res_bits));
    fflags.write(r.flags);
    trace_eval(name(), fpu_op_name(tag), r.res_bits);
}

// ---------------- fcsr_reg ----------------
void fcsr_reg::tick() {
    if (reset.read()) {
        csr = new_fcsr();
    } else {
        if (clear.read())  fcsr_clear_fflags(csr);
        if (frm_we.read()) fcsr_set_rounding(csr, frm_in.read().to_uint());
        if (valid.read())  fcsr_accumulate(csr, fflags_in.read());
    }

    fflags_out.write(fcsr_pack_u8(csr));
    frm_out.write(csr.frm);
}
