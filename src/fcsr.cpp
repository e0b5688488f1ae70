#include "fcsr.h"
#include "fpu_f32.h"

#include <sstream>

fcsr_t new_fcsr() {
    fcsr_t csr;
    csr.frm = FRM_RNE;
    csr.fflags = 0;
    return csr;
}

void fcsr_accumulate(fcsr_t& csr, sc_uint<5> flags) {
    csr.fflags = csr.fflags | flags;

    std::ostringstream msg;
    msg << "accumulate 0x" << std::hex << flags.to_uint() << " -> fflags 0x" << csr.fflags.to_uint();
    SC_REPORT_INFO_VERB(RV32ARITH_MSG_FCSR, msg.str().c_str(), SC_DEBUG);
}

fcsr_flags_t fcsr_read_fflags(const fcsr_t& csr) {
    fcsr_flags_t f;
    f.nv = (csr.fflags & FP_INVALID_OP) != 0;
    f.dz = (csr.fflags & FP_DIVIDE_BY_ZERO) != 0;
    f.of = (csr.fflags & FP_OVERFLOW) != 0;
    f.uf = (csr.fflags & FP_UNDERFLOW) != 0;
    f.nx = (csr.fflags & FP_INEXACT) != 0;
    return f;
}

sc_uint<8> fcsr_pack_u8(const fcsr_t& csr) {
    return sc_uint<8>(csr.fflags);
}

void fcsr_set_rounding(fcsr_t& csr, unsigned int frm) {
    if (frm >= (1u << FRM_BITS)) {
        report_invalid_op("fcsr rounding mode", static_cast<int>(frm));
        return;
    }
    csr.frm = frm;
}

fcsr_rounding fcsr_get_rounding(const fcsr_t& csr) {
    return static_cast<fcsr_rounding>(csr.frm.to_uint());
}

void fcsr_clear_fflags(fcsr_t& csr) {
    csr.fflags = 0;
}

void fcsr_write_fflags(fcsr_t& csr, sc_uint<5> flags) {
    csr.fflags = flags;
}

sc_uint<8> fcsr_pack_csr(const fcsr_t& csr) {
    return (sc_uint<8>(csr.frm) << FFLAGS_BITS) | csr.fflags;
}

fcsr_t fcsr_unpack_csr(sc_uint<8> image) {
    fcsr_t csr;
    csr.frm    = image.range(7, FFLAGS_BITS);
    csr.fflags = image.range(FFLAGS_BITS - 1, 0);
    return csr;
}
