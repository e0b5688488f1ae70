#ifndef RV32ARITH_FCSR_H
#define RV32ARITH_FCSR_H

#include "arith_config.h"

enum fcsr_rounding {
    FRM_RNE = 0x0,
    FRM_RTZ = 0x1,
    FRM_RDN = 0x2,
    FRM_RUP = 0x3,
    FRM_RMM = 0x4
};

// Caller-owned register; the arithmetic units never create or clear one
struct fcsr_t {
    sc_uint<3> frm;      // only RNE is applied by the FPU
    sc_uint<5> fflags;   // NV DZ OF UF NX, sticky
};

struct fcsr_flags_t {
    bool nv;
    bool dz;
    bool of;
    bool uf;
    bool nx;
};

fcsr_t new_fcsr();

// Sticky OR of one operation's flags into csr.fflags
void fcsr_accumulate(fcsr_t& csr, sc_uint<5> flags);

fcsr_flags_t  fcsr_read_fflags(const fcsr_t& csr);
sc_uint<8>    fcsr_pack_u8(const fcsr_t& csr);     // [7:5] always 0

void          fcsr_set_rounding(fcsr_t& csr, unsigned int frm);
fcsr_rounding fcsr_get_rounding(const fcsr_t& csr);
void          fcsr_clear_fflags(fcsr_t& csr);
void          fcsr_write_fflags(fcsr_t& csr, sc_uint<5> flags);

// Full CSR image: [7:5] frm, [4:0] fflags
sc_uint<8> fcsr_pack_csr(const fcsr_t& csr);
fcsr_t     fcsr_unpack_csr(sc_uint<8> image);

#endif
