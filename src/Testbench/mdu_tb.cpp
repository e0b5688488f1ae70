#include "mdu.h"
#include "arith_units.h"
#include "tb_check.h"

SC_MODULE(mdu_tb) {
    sc_signal<sc_uint<32>> a, b, rd;
    sc_signal<sc_uint<3>>  op;

    mdu_unit* dut;
    tb_checker chk;

    void test_multiply() {
        cout << "\n--- MUL / MULH / MULHSU / MULHU ---\n";
        // 12345678 * -87654321
        mdu_mul_result_t r = mdu_mul(MDU_MULH, word(12345678), word(0xFAC6804F));
        chk.check_hex(r.hi_bits, "FFFC27C9", "MULH high word");
        chk.check_hex(r.lo_bits, "D91D0712", "MULH low word");
        chk.check_hex(r.rd_bits, "FFFC27C9", "MULH returns the high word");
        chk.check(r.overflow, "MULH product exceeds one word");
        chk.check(r.trace.size() == 32, "multiply trace has 32 steps");

        r = mdu_mul(MDU_MUL, word(12345678), word(0xFAC6804F));
        chk.check_hex(r.rd_bits, "D91D0712", "MUL returns the low word");

        r = mdu_mul(MDU_MUL, word(6), word(7));
        chk.check_hex(r.rd_bits, "0000002A", "MUL 6 * 7");
        chk.check(!r.overflow, "6 * 7 fits");

        r = mdu_mul(MDU_MUL, word(0xFFFFFFFD), word(4));
        chk.check_hex(r.rd_bits, "FFFFFFF4", "MUL -3 * 4");
        chk.check(!r.overflow, "-3 * 4 fits signed");

        r = mdu_mul(MDU_MULHU, word(0xFFFFFFFF), word(0xFFFFFFFF));
        chk.check_hex(r.rd_bits, "FFFFFFFE", "MULHU max * max");
        chk.check(r.overflow, "MULHU max * max overflows");

        r = mdu_mul(MDU_MULHSU, word(0xFFFFFFFF), word(0xFFFFFFFF));
        chk.check_hex(r.hi_bits, "FFFFFFFF", "MULHSU -1 * 4294967295 high");
        chk.check_hex(r.lo_bits, "00000001", "MULHSU -1 * 4294967295 low");

        r = mdu_mul(MDU_MULH, word(0x80000000), word(0x80000000));
        chk.check_hex(r.rd_bits, "40000000", "MULH INT_MIN * INT_MIN");

        // Low word is the same under every signedness
        sc_dt::uint64 seed = 0xC0FFEE;
        bool ok = true;
        for (int i = 0; i < 40; ++i) {
            sc_dt::uint64 x = next_sample(seed), y = next_sample(seed);
            sc_dt::uint64 low = (x * y) & 0xFFFFFFFFULL;
            if (mdu_mul(MDU_MUL, word(x), word(y)).rd_bits.to_uint64() != low) ok = false;
            if (mdu_mul(MDU_MULHU, word(x), word(y)).lo_bits.to_uint64() != low) ok = false;
            if (mdu_mul(MDU_MULHU, word(x), word(y)).hi_bits.to_uint64() != ((x * y) >> 32)) ok = false;
        }
        chk.check(ok, "MUL low word matches the host product");
    }

    void test_divide() {
        cout << "\n--- DIV / DIVU / REM / REMU ---\n";
        mdu_div_result_t r = mdu_div(MDU_DIVU, word(0x80000000), word(3));
        chk.check_hex(r.q_bits, "2AAAAAAA", "DIVU 80000000 / 3 quotient");
        chk.check_hex(r.r_bits, "00000002", "DIVU 80000000 / 3 remainder");
        chk.check(r.trace.size() == 32, "divide trace has 32 steps");

        r = mdu_div(MDU_DIV, word(0xFFFFFFF9), word(3));
        chk.check_hex(r.q_bits, "FFFFFFFE", "DIV -7 / 3 truncates toward zero");
        chk.check_hex(r.r_bits, "FFFFFFFF", "DIV -7 / 3 remainder follows the dividend");

        r = mdu_div(MDU_REM, word(7), word(0xFFFFFFFE));
        chk.check_hex(r.q_bits, "FFFFFFFD", "7 / -2 quotient");
        chk.check_hex(r.rd_bits, "00000001", "REM 7 % -2");

        r = mdu_div(MDU_DIV, word(0x12345678), word(0));
        chk.check_hex(r.q_bits, "FFFFFFFF", "divide by zero quotient");
        chk.check_hex(r.r_bits, "12345678", "divide by zero remainder");
        chk.check(r.div_by_zero && !r.overflow, "divide by zero flag");
        chk.check(r.trace.size() == 1, "singular case trace has one entry");

        r = mdu_div(MDU_REMU, word(5), word(0));
        chk.check_hex(r.rd_bits, "00000005", "REMU by zero returns the dividend");

        sc_dt::uint64 zseed = 0xD1F0;
        bool zero_ok = true;
        for (int i = 0; i < 40; ++i) {
            sc_dt::uint64 x = next_sample(zseed);
            if (i == 0) x = 0x80000000;
            if (i == 1) x = 0;
            mdu_div_result_t d = mdu_div(MDU_DIV, word(x), word(0));
            if (!d.q_bits.is_all_ones() || d.r_bits.to_uint64() != x || !d.div_by_zero) zero_ok = false;
        }
        chk.check(zero_ok, "DIV x / 0 gives q = -1, r = x for sampled x");

        r = mdu_div(MDU_DIV, word(0x80000000), word(0xFFFFFFFF));
        chk.check_hex(r.q_bits, "80000000", "INT_MIN / -1 quotient");
        chk.check_hex(r.r_bits, "00000000", "INT_MIN / -1 remainder");
        chk.check(r.overflow, "INT_MIN / -1 overflow");

        r = mdu_div(MDU_REM, word(0x80000000), word(0xFFFFFFFF));
        chk.check_hex(r.rd_bits, "00000000", "REM INT_MIN % -1");

        r = mdu_div(MDU_DIVU, word(0x80000000), word(0xFFFFFFFF));
        chk.check_hex(r.q_bits, "00000000", "DIVU is not singular at INT_MIN / FFFFFFFF");
        chk.check(!r.overflow, "DIVU never overflows");

        sc_dt::uint64 seed = 0x5EED;
        bool ok = true;
        for (int i = 0; i < 40; ++i) {
            sc_dt::uint64 x = next_sample(seed), y = next_sample(seed) >> (i % 24);
            if (y == 0) continue;
            mdu_div_result_t d = mdu_div(MDU_DIVU, word(x), word(y));
            if (d.q_bits.to_uint64() != x / y || d.r_bits.to_uint64() != x % y) ok = false;
        }
        chk.check(ok, "DIVU matches host division");
    }

    void test_errors() {
        cout << "\n--- Contract violations ---\n";
        chk.check_raises([] { mdu_mul(MDU_DIVU, word(1), word(1)); },
                         RV32ARITH_MSG_INVALID, "divide tag passed to mdu_mul");
        chk.check_raises([] { mdu_div(MDU_MULH, word(1), word(1)); },
                         RV32ARITH_MSG_INVALID, "multiply tag passed to mdu_div");
        chk.check_raises([] { mdu_div(MDU_DIV, word(1), bit_vector(64)); },
                         RV32ARITH_MSG_WIDTH, "64-bit divisor");

        tb_errors_displayed displayed;
        mdu_div_result_t d = mdu_div(MDU_DIV, word(7), bit_vector::filled(64, true));
        chk.check(d.rd_bits.is_zero() && d.trace.empty(), "64-bit divisor yields zero when not thrown");
        mdu_mul_result_t m = mdu_mul(MDU_MUL, bit_vector(8), word(3));
        chk.check(m.rd_bits.width() == XLEN && m.rd_bits.is_zero(), "8-bit multiplicand yields zero");
    }

    void test_module() {
        cout << "\n--- mdu_unit ---\n";
        a.write(6);
        b.write(7);
        op.write(MDU_MUL);
        wait(1, SC_NS);
        chk.check_u64(rd.read().to_uint64(), 42ULL, "mdu_unit MUL");

        a.write(0xFFFFFFF9);
        b.write(3);
        op.write(MDU_REM);
        wait(1, SC_NS);
        chk.check_u64(rd.read().to_uint64(), 0xFFFFFFFFULL, "mdu_unit REM");

        b.write(0);
        op.write(MDU_DIVU);
        wait(1, SC_NS);
        chk.check_u64(rd.read().to_uint64(), 0xFFFFFFFFULL, "mdu_unit DIVU by zero");
    }

    void run() {
        cout << "\n=== MULTIPLY / DIVIDE UNIT ===\n";
        test_multiply();
        test_divide();
        test_errors();
        test_module();
        chk.summary("MDU");
        sc_stop();
    }

    SC_CTOR(mdu_tb) {
        dut = new mdu_unit("dut");
        dut->a(a);
        dut->b(b);
        dut->op(op);
        dut->rd(rd);

        SC_THREAD(run);
    }

    ~mdu_tb() {
        delete dut;
    }
};

int sc_main(int argc, char* argv[]) {
    arith_configure_from_args();
    mdu_tb tb("tb");
    sc_start();
    return tb.chk.exit_code();
}
