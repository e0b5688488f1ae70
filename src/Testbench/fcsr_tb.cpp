#include "fcsr.h"
#include "fpu_f32.h"
#include "arith_units.h"
#include "tb_check.h"

SC_MODULE(fcsr_tb) {
    sc_clock clk;
    sc_signal<bool>       reset, valid, clear, frm_we;
    sc_signal<sc_uint<5>> fflags_in;
    sc_signal<sc_uint<3>> frm_in, frm_out;
    sc_signal<sc_uint<8>> fflags_out;

    fcsr_reg* dut;
    tb_checker chk;

    void test_register() {
        cout << "\n--- Sticky accumulation ---\n";
        fcsr_t csr = new_fcsr();
        chk.check(fcsr_get_rounding(csr) == FRM_RNE, "new FCSR rounds to nearest even");
        chk.check_u64(fcsr_pack_u8(csr).to_uint64(), 0ULL, "new FCSR has no flags");

        fcsr_accumulate(csr, FP_INEXACT);
        fcsr_accumulate(csr, 0);
        fcsr_accumulate(csr, FP_OVERFLOW | FP_INEXACT);
        fcsr_flags_t f = fcsr_read_fflags(csr);
        chk.check(f.nx && f.of && !f.nv && !f.dz && !f.uf, "flags are ORed and never cleared");
        chk.check_u64(fcsr_pack_u8(csr).to_uint64(), 0x05ULL, "pack_u8 layout");

        fcsr_accumulate(csr, FP_INVALID_OP);
        chk.check_u64(fcsr_pack_u8(csr).to_uint64(), 0x15ULL, "NV lands in bit 4");

        // Flags from a sequence of real operations
        fcsr_t seq = new_fcsr();
        sc_uint<5> expect = 0;
        const sc_dt::uint64 ops[][2] = {
            { 0x3F800000, 0x3FC00000 },    // exact
            { 0x3F800000, 0x30800000 },    // NX
            { 0x7F7FFFFF, 0x7F7FFFFF },    // OF NX
            { 0x7F800000, 0xFF800000 },    // NV
        };
        for (int i = 0; i < 4; ++i) {
            fpu_result_t r = fadd_f32(word(ops[i][0]), word(ops[i][1]));
            fcsr_accumulate(seq, r.flags);
            expect = expect | r.flags;
        }
        chk.check(seq.fflags == expect, "sticky flags equal the OR over every operation");
        chk.check_u64(fcsr_pack_u8(seq).to_uint64(), 0x15ULL, "NV OF NX after the sequence");
        chk.check((fcsr_pack_u8(seq) & 0xE0) == 0, "bits 7..5 stay clear");
    }

    void test_caller_controls() {
        cout << "\n--- Caller-side controls ---\n";
        fcsr_t csr = new_fcsr();
        fcsr_set_rounding(csr, FRM_RUP);
        chk.check(fcsr_get_rounding(csr) == FRM_RUP, "rounding mode stored");
        fcsr_set_rounding(csr, 0x7);
        chk.check(csr.frm == 0x7, "reserved encodings are stored");

        fcsr_write_fflags(csr, FP_UNDERFLOW | FP_INEXACT);
        chk.check_u64(fcsr_pack_csr(csr).to_uint64(), 0xE3ULL, "full CSR image");
        chk.check_u64(fcsr_pack_u8(csr).to_uint64(), 0x03ULL, "pack_u8 drops frm");

        fcsr_t back = fcsr_unpack_csr(0x51);
        chk.check(back.frm == FRM_RDN && back.fflags == 0x11, "unpack_csr splits frm and fflags");

        fcsr_clear_fflags(csr);
        chk.check(csr.fflags == 0 && csr.frm == 0x7, "clear keeps the rounding mode");

        chk.check_raises([&] { fcsr_set_rounding(csr, 8); }, RV32ARITH_MSG_INVALID, "4-bit rounding mode");
    }

    void test_module() {
        cout << "\n--- fcsr_reg ---\n";
        reset.write(true);
        valid.write(false);
        clear.write(false);
        frm_we.write(false);
        wait(15, SC_NS);
        reset.write(false);

        fflags_in.write(FP_INEXACT);
        valid.write(true);
        wait(10, SC_NS);
        fflags_in.write(FP_UNDERFLOW);
        wait(10, SC_NS);
        valid.write(false);
        fflags_in.write(FP_INVALID_OP);
        wait(10, SC_NS);
        chk.check_u64(fflags_out.read().to_uint64(), 0x03ULL, "fcsr_reg accumulates only when valid");

        frm_in.write(FRM_RTZ);
        frm_we.write(true);
        wait(10, SC_NS);
        frm_we.write(false);
        chk.check_u64(frm_out.read().to_uint64(), FRM_RTZ, "fcsr_reg loads frm");

        clear.write(true);
        wait(10, SC_NS);
        clear.write(false);
        chk.check_u64(fflags_out.read().to_uint64(), 0ULL, "fcsr_reg clear");
        chk.check(dut->state().frm == FRM_RTZ, "clear leaves frm");
    }

    void run() {
        cout << "\n=== FCSR ===\n";
        test_register();
        test_caller_controls();
        test_module();
        chk.summary("FCSR");
        sc_stop();
    }

    SC_CTOR(fcsr_tb) : clk("clk", 10, SC_NS) {
        dut = new fcsr_reg("dut");
        dut->clk(clk);
        dut->reset(reset);
        dut->valid(valid);
        dut->fflags_in(fflags_in);
        dut->clear(clear);
        dut->frm_we(frm_we);
        dut->frm_in(frm_in);
        dut->fflags_out(fflags_out);
        dut->frm_out(frm_out);

        SC_THREAD(run);
    }

    ~fcsr_tb() {
        delete dut;
    }
};

int sc_main(int argc, char* argv[]) {
    arith_configure_from_args();
    fcsr_tb tb("tb");
    sc_start();
    return tb.chk.exit_code();
}
