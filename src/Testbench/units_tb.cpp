#include "alu.h"
#include "arith_units.h"
#include "fpu_f32.h"
#include "mdu.h"
#include "shifter.h"
#include "twos_complement.h"
#include "tb_check.h"

//==============================================================================
//
// Datapath-style integration: the execution units wired through signals,
// with the FPU's flags feeding a clocked FCSR.
//
SC_MODULE(units_tb) {
    sc_clock clk;
    sc_signal<bool> reset, fp_valid, fcsr_clear, frm_we;

    sc_signal<sc_uint<32>> alu_a, alu_b, alu_result;
    sc_signal<sc_uint<4>>  alu_op_sig;
    sc_signal<bool>        alu_n, alu_z, alu_c, alu_v;

    sc_signal<sc_uint<32>> sh_x, sh_result;
    sc_signal<sc_uint<5>>  sh_amt;
    sc_signal<sc_uint<2>>  sh_op;

    sc_signal<sc_uint<32>> mdu_a, mdu_b, mdu_rd;
    sc_signal<sc_uint<3>>  mdu_op_sig;

    sc_signal<sc_uint<32>> fp_a, fp_b, fp_result;
    sc_signal<sc_uint<2>>  fp_op;
    sc_signal<sc_uint<5>>  fp_flags;

    sc_signal<sc_uint<3>>  frm_in, frm_out;
    sc_signal<sc_uint<8>>  fcsr_flags;

    alu_unit*     alu_dut;
    shifter_unit* sh_dut;
    mdu_unit*     mdu_dut;
    fpu_unit*     fpu_dut;
    fcsr_reg*     fcsr_dut;

    tb_checker chk;

    void scenario() {
        cout << "\n--- End-to-end scenario ---\n";
        twos_encoding_t e = encode_twos(42);
        chk.check(e.bin == "00000000000000000000000000101010" && e.hex == "0000002A" && !e.overflow_flag,
                  "encode(42)");
        chk.check(decode_twos(bit_vector::from_string(e.bin)).value == 42, "decode of the binary text");

        alu_a.write(0x7FFFFFFF);
        alu_b.write(0x00000001);
        alu_op_sig.write(ALU_ADD);
        sh_x.write(0x0000000D);
        sh_amt.write(2);
        sh_op.write(SHIFT_SLL);
        wait(1, SC_NS);

        chk.check_u64(alu_result.read().to_uint64(), 0x80000000ULL, "ALU ADD 7FFFFFFF + 1");
        chk.check(alu_n.read() && !alu_z.read() && !alu_c.read() && alu_v.read(), "ALU flags N=1 Z=0 C=0 V=1");
        chk.check_u64(sh_result.read().to_uint64(), 0x34ULL, "shift 0xD left by 2");
    }

    void integer_stream() {
        cout << "\n--- Integer operations through the units ---\n";
        // rd = (a * b) / c, computed through the MDU then checked against the ALU
        mdu_a.write(1000);
        mdu_b.write(0xFFFFFFF9);     // -7
        mdu_op_sig.write(MDU_MUL);
        wait(1, SC_NS);
        sc_uint<32> product = mdu_rd.read();
        chk.check_u64(product.to_uint64(), 0xFFFFE4A8ULL, "MUL 1000 * -7");

        mdu_a.write(product);
        mdu_b.write(3);
        mdu_op_sig.write(MDU_DIV);
        wait(1, SC_NS);
        chk.check_u64(mdu_rd.read().to_uint64(), 0xFFFFF6E3ULL, "DIV -7000 / 3");

        mdu_op_sig.write(MDU_REM);
        wait(1, SC_NS);
        chk.check_u64(mdu_rd.read().to_uint64(), 0xFFFFFFFFULL, "REM -7000 % 3");

        alu_a.write(product);
        alu_b.write(0);
        alu_op_sig.write(ALU_SLT);
        wait(1, SC_NS);
        chk.check_u64(alu_result.read().to_uint64(), 1ULL, "SLT product < 0");
    }

    void float_stream() {
        cout << "\n--- FPU flags into the FCSR ---\n";
        reset.write(true);
        wait(clk.posedge_event());
        reset.write(false);

        const sc_dt::uint64 program[][3] = {
            { FPU_FADD, 0x3F800000, 0x3FC00000 },   // 2.5, exact
            { FPU_FMUL, 0x3FC00000, 0x40100000 },   // 3.375, exact
            { FPU_FADD, 0x3F800000, 0x30800000 },   // NX
            { FPU_FMUL, 0x00800000, 0x00800000 },   // UF, NX
        };
        const sc_dt::uint64 expected_result[] = { 0x40200000, 0x40580000, 0x3F800000, 0x00000000 };

        sc_uint<5> expected_flags = 0;
        for (int i = 0; i < 4; ++i) {
            wait(clk.negedge_event());
            fp_op.write(program[i][0]);
            fp_a.write(program[i][1]);
            fp_b.write(program[i][2]);
            fp_valid.write(true);
            wait(1, SC_NS);
            chk.check_u64(fp_result.read().to_uint64(), expected_result[i], "fpu_unit result");
            expected_flags = expected_flags | fp_flags.read();
        }
        wait(clk.negedge_event());
        fp_valid.write(false);
        wait(clk.negedge_event());

        chk.check_u64(fcsr_flags.read().to_uint64(), expected_flags.to_uint64(), "FCSR holds the OR of every flag");
        chk.check_u64(fcsr_flags.read().to_uint64(), FP_UNDERFLOW | FP_INEXACT, "UF and NX recorded");
        chk.check_u64(frm_out.read().to_uint64(), FRM_RNE, "rounding mode stays RNE");

        // Further exact operations never clear a sticky bit
        fp_op.write(FPU_FADD);
        fp_a.write(0x40000000);
        fp_b.write(0x40000000);
        fp_valid.write(true);
        wait(clk.negedge_event());
        fp_valid.write(false);
        chk.check_u64(fcsr_flags.read().to_uint64(), FP_UNDERFLOW | FP_INEXACT, "exact op leaves flags set");

        fcsr_clear.write(true);
        wait(clk.negedge_event());
        fcsr_clear.write(false);
        chk.check_u64(fcsr_flags.read().to_uint64(), 0ULL, "caller clears the FCSR");
    }

    void run() {
        cout << "\n=== EXECUTION UNITS INTEGRATION ===\n";
        scenario();
        integer_stream();
        float_stream();
        chk.summary("INTEGRATION");
        sc_stop();
    }

    SC_CTOR(units_tb) : clk("clk", 10, SC_NS) {
        alu_dut = new alu_unit("alu");
        alu_dut->a(alu_a);
        alu_dut->b(alu_b);
        alu_dut->op(alu_op_sig);
        alu_dut->result(alu_result);
        alu_dut->n(alu_n);
        alu_dut->z(alu_z);
        alu_dut->c(alu_c);
        alu_dut->v(alu_v);

        sh_dut = new shifter_unit("shifter");
        sh_dut->x(sh_x);
        sh_dut->shamt(sh_amt);
        sh_dut->op(sh_op);
        sh_dut->result(sh_result);

        mdu_dut = new mdu_unit("mdu");
        mdu_dut->a(mdu_a);
        mdu_dut->b(mdu_b);
        mdu_dut->op(mdu_op_sig);
        mdu_dut->rd(mdu_rd);

        fpu_dut = new fpu_unit("fpu");
        fpu_dut->a(fp_a);
        fpu_dut->b(fp_b);
        fpu_dut->op(fp_op);
        fpu_dut->result(fp_result);
        fpu_dut->fflags(fp_flags);

        fcsr_dut = new fcsr_reg("fcsr");
        fcsr_dut->clk(clk);
        fcsr_dut->reset(reset);
        fcsr_dut->valid(fp_valid);
        fcsr_dut->fflags_in(fp_flags);
        fcsr_dut->clear(fcsr_clear);
        fcsr_dut->frm_we(frm_we);
        fcsr_dut->frm_in(frm_in);
        fcsr_dut->fflags_out(fcsr_flags);
        fcsr_dut->frm_out(frm_out);

        SC_THREAD(run);
    }

    ~units_tb() {
        delete alu_dut;
        delete sh_dut;
        delete mdu_dut;
        delete fpu_dut;
        delete fcsr_dut;
    }
};

int sc_main(int argc, char* argv[]) {
    arith_configure_from_args();
    units_tb tb("tb");
    sc_start();
    return tb.chk.exit_code();
}
