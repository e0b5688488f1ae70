#include "fpu_f32.h"
#include "arith_units.h"
#include "tb_check.h"

#include <cstdint>

static const sc_dt::uint64 F_ONE      = 0x3F800000;
static const sc_dt::uint64 F_ONE_HALF = 0x3FC00000;   // 1.5
static const sc_dt::uint64 F_TWO      = 0x40000000;
static const sc_dt::uint64 F_2_25     = 0x40100000;
static const sc_dt::uint64 F_HALF     = 0x3F000000;
static const sc_dt::uint64 F_MAX_FIN  = 0x7F7FFFFF;
static const sc_dt::uint64 F_MIN_NORM = 0x00800000;

static inline float bits_to_float(sc_dt::uint64 bits) {
    union { float f; uint32_t i; } u;
    u.i = static_cast<uint32_t>(bits);
    return u.f;
}

static inline sc_dt::uint64 float_to_bits(float f) {
    union { float f; uint32_t i; } u;
    u.f = f;
    return u.i;
}

SC_MODULE(fpu_tb) {
    sc_signal<sc_uint<32>> a, b, result;
    sc_signal<sc_uint<2>>  op;
    sc_signal<sc_uint<5>>  fflags;

    fpu_unit* dut;
    tb_checker chk;

    bool check_op(const fpu_result_t& r, const char* expected_hex, unsigned int expected_flags,
                  const std::string& name) {
        std::ostringstream d;
        d << format_hex(r.res_bits) << " flags=0x" << std::hex << r.flags.to_uint()
          << " (exp " << expected_hex << " flags=0x" << expected_flags << ")";
        return chk.record(format_hex(r.res_bits) == expected_hex && r.flags == expected_flags, name, d.str());
    }

    void test_fields() {
        cout << "\n--- Pack / unpack / classify ---\n";
        bit_vector one = pack_f32_fields(0, bit_vector::from_hex("7F", 8), bit_vector(23));
        chk.check_hex(one, "3F800000", "pack 1.0");

        f32_fields_t f = unpack_f32(word(0xC0490FDB));
        chk.check(f.sign == 1, "unpack sign");
        chk.check_hex(f.exponent, "80", "unpack exponent");
        chk.check_hex(f.fraction, "490FDB", "unpack fraction");
        chk.check(pack_f32_fields(f.sign, f.exponent, f.fraction) == word(0xC0490FDB), "pack inverts unpack");

        f32_class_t c = classify_f32(word(0x80000000));
        chk.check(c.category == F32_ZERO && c.sign, "-0 is a negative zero");
        chk.check(classify_f32(word(0x00000001)).category == F32_SUBNORMAL, "smallest subnormal");
        chk.check(classify_f32(word(F_MIN_NORM)).category == F32_NORMAL, "smallest normal");
        c = classify_f32(word(0xFF800000));
        chk.check(c.category == F32_INFINITY && c.sign, "-inf");
        chk.check(f32_is_nan(word(0x7F800001)), "signaling NaN pattern is NaN");
        chk.check(!f32_is_nan(word(0x7F800000)), "+inf is not NaN");
        chk.check_hex(flip_sign_f32(word(F_ONE)), "BF800000", "flip sign");
        chk.check(std::string(f32_category_name(classify_f32(word(0x00000001)).category)) == "Subnormal",
                  "category name of a subnormal");
        chk.check(std::string(f32_category_name(F32_INFINITY)) == "Infinity", "category name of infinity");
        chk.check(classify_f32(word(F32_NEG_0)).sign, "F32_NEG_0 carries the sign");

        chk.check_raises([] { pack_f32_fields(2, bit_vector(8), bit_vector(23)); },
                         RV32ARITH_MSG_BAD_VALUE, "sign outside 0/1");
        chk.check_raises([] { pack_f32_fields(0, bit_vector(7), bit_vector(23)); },
                         RV32ARITH_MSG_WIDTH, "7-bit exponent");
        chk.check_raises([] { unpack_f32(bit_vector(16)); }, RV32ARITH_MSG_WIDTH, "16-bit pattern");
    }

    void test_add_sub() {
        cout << "\n--- FADD / FSUB ---\n";
        check_op(fadd_f32(word(F_ONE), word(F_ONE_HALF)), "40200000", 0, "1.0 + 1.5");
        check_op(fadd_f32(word(F_ONE_HALF), word(F_2_25)), "40700000", 0, "1.5 + 2.25");
        check_op(fsub_f32(word(F_TWO), word(F_ONE_HALF)), "3F000000", 0, "2.0 - 1.5");

        check_op(fadd_f32(word(F_HALF), word(0x33000000)), "3F000000", FP_INEXACT, "0.5 + 2^-25 ties to even");
        check_op(fadd_f32(word(F_ONE), word(0x30800000)), "3F800000", FP_INEXACT, "1.0 + 2^-30 rounds down");
        check_op(fadd_f32(word(0x3F800001), word(0x33800000)), "3F800002", FP_INEXACT,
                 "odd LSB tie rounds up to even");

        check_op(fsub_f32(word(F_ONE_HALF), word(F_ONE_HALF)), "00000000", 0, "exact cancellation is +0");
        check_op(fadd_f32(word(0xBFC00000), word(F_ONE_HALF)), "00000000", 0, "-1.5 + 1.5 is +0");
        check_op(fadd_f32(word(0x00000000), word(0x80000000)), "00000000", 0, "+0 + -0");
        check_op(fadd_f32(word(0x80000000), word(0x80000000)), "80000000", 0, "-0 + -0");
        check_op(fadd_f32(word(0xC0490FDB), word(0x80000000)), "C0490FDB", 0, "x + -0 is x");

        check_op(fadd_f32(word(F_MAX_FIN), word(F_MAX_FIN)), "7F800000", FP_OVERFLOW | FP_INEXACT, "MAX + MAX overflows");
        check_op(fadd_f32(word(0x00400000), word(0x00400000)), "00800000", 0, "subnormals sum to MIN_NORM");
        check_op(fadd_f32(word(0x00000001), word(0x00000001)), "00000002", 0, "tiny exact sum raises no UF");
        check_op(fadd_f32(word(0x00000001), word(0x00000000)), "00000001", 0, "subnormal + 0");

        check_op(fadd_f32(word(F32_QNAN), word(F_ONE)), "7FC00000", FP_INVALID_OP, "quiet NaN operand");
        check_op(fadd_f32(word(F_ONE), word(0x7F800001)), "7FC00000", FP_INVALID_OP, "signaling NaN operand");
        check_op(fadd_f32(word(F32_POS_INF), word(F32_NEG_INF)), "7FC00000", FP_INVALID_OP, "inf + -inf");
        check_op(fsub_f32(word(F32_POS_INF), word(F32_POS_INF)), "7FC00000", FP_INVALID_OP, "inf - inf");
        check_op(fadd_f32(word(F32_NEG_INF), word(F_ONE)), "FF800000", 0, "-inf + 1 propagates");

        fpu_result_t r = fadd_f32(word(F_ONE), word(0x30800000));
        chk.check(r.trace.size() > 27, "alignment is traced step by step");
    }

    void test_multiply() {
        cout << "\n--- FMUL ---\n";
        check_op(fmul_f32(word(F_ONE_HALF), word(F_ONE_HALF)), "40100000", 0, "1.5 * 1.5");
        check_op(fmul_f32(word(F_ONE_HALF), word(F_2_25)), "40580000", 0, "1.5 * 2.25");
        check_op(fmul_f32(word(F_ONE), word(F_2_25)), "40100000", 0, "1.0 * 2.25");
        check_op(fmul_f32(word(0xBFC00000), word(F_ONE_HALF)), "C0100000", 0, "-1.5 * 1.5");
        check_op(fmul_f32(word(0x3F800001), word(0x3F800001)), "3F800002", FP_INEXACT, "(1+ulp)^2 rounds");

        check_op(fmul_f32(word(F_MAX_FIN), word(F_TWO)), "7F800000", FP_OVERFLOW | FP_INEXACT, "MAX * 2 overflows");
        check_op(fmul_f32(word(F_MIN_NORM), word(0x3E800000)), "00200000", 0, "MIN_NORM * 0.25 is exact");
        check_op(fmul_f32(word(0x00000001), word(F_ONE)), "00000001", 0, "smallest subnormal * 1.0 is exact");
        check_op(fmul_f32(word(0x00000003), word(F_HALF)), "00000002", FP_UNDERFLOW | FP_INEXACT,
                 "inexact subnormal product ties to even");
        // (1 - 2^-23) * (1 + 2^-23) * 2^-126 rounds to MIN_NORM at full precision: not tiny
        check_op(fmul_f32(word(0x3F7FFFFE), word(0x00800001)), "00800000", FP_INEXACT,
                 "rounds up to MIN_NORM without UF");
        // (1 - 2^-24) * 2^-126 is exact at 24 bits, so tiny, but inexact as a subnormal
        check_op(fmul_f32(word(0x3F7FFFFF), word(F_MIN_NORM)), "00800000", FP_UNDERFLOW | FP_INEXACT,
                 "tiny value rounding up to MIN_NORM keeps UF");
        check_op(fmul_f32(word(F_MIN_NORM), word(F_MIN_NORM)), "00000000", FP_UNDERFLOW | FP_INEXACT,
                 "MIN_NORM squared flushes to +0");

        check_op(fmul_f32(word(0x80000000), word(0x40A00000)), "80000000", 0, "-0 * 5");
        check_op(fmul_f32(word(0x00000000), word(F32_POS_INF)), "7FC00000", FP_INVALID_OP, "0 * inf");
        check_op(fmul_f32(word(F32_NEG_INF), word(F_TWO)), "FF800000", 0, "-inf * 2");
        check_op(fmul_f32(word(F32_QNAN), word(0x00000000)), "7FC00000", FP_INVALID_OP, "NaN * 0");

        fpu_result_t r = fmul_f32(word(F_ONE_HALF), word(F_2_25));
        chk.check(r.trace.size() >= 24, "partial products are traced");
        chk.check(r.trace[0].find("Normal") != std::string::npos, "operand category is traced");
    }

    // Host single-precision arithmetic is RNE with gradual underflow
    void test_against_host() {
        cout << "\n--- Sampled comparison with host binary32 ---\n";
        sc_dt::uint64 seed = 0xF10A7;
        int add_bad = 0, mul_bad = 0;
        for (int i = 0; i < 1500; ++i) {
            sc_dt::uint64 x = next_sample(seed);
            sc_dt::uint64 y = next_sample(seed);
            if (((x >> 23) & 0xFF) == 0xFF) x &= 0xBFFFFFFF;
            if (((y >> 23) & 0xFF) == 0xFF) y &= 0xBFFFFFFF;

            // Keep add operands within a few binades of each other
            sc_dt::uint64 near_exp = (((x >> 23) & 0xFF) + (y % 9)) & 0xFF;
            if (near_exp == 0xFF) near_exp = 0xFE;
            sc_dt::uint64 y_near = (y & 0x807FFFFF) | (near_exp << 23);

            float fx = bits_to_float(x);
            if (fadd_f32(word(x), word(y_near)).res_bits.to_uint64() != float_to_bits(fx + bits_to_float(y_near))) add_bad++;
            if (fmul_f32(word(x), word(y)).res_bits.to_uint64() != float_to_bits(fx * bits_to_float(y))) mul_bad++;
        }
        chk.check(add_bad == 0, "fadd matches host on 1500 samples");
        chk.check(mul_bad == 0, "fmul matches host on 1500 samples");
    }

    void test_errors() {
        cout << "\n--- Contract violations ---\n";
        chk.check_raises([] { fpu_execute(static_cast<fpu_op>(3), word(0), word(0)); },
                         RV32ARITH_MSG_INVALID, "undefined FPU tag");
        chk.check_raises([] { fadd_f32(bit_vector(64), word(0)); }, RV32ARITH_MSG_WIDTH, "64-bit operand");

        tb_errors_displayed displayed;
        fpu_result_t r = fmul_f32(bit_vector::filled(64, true), word(F_ONE));
        chk.check(r.res_bits.width() == F32_WIDTH && r.res_bits.is_zero() && r.flags == 0,
                  "64-bit operand yields +0 when not thrown");
        chk.check(unpack_f32(bit_vector(16)).fraction.width() == F32_FRAC_BITS, "16-bit unpack keeps field widths");
        chk.check_hex(pack_f32_fields(2, bit_vector(8), bit_vector(23)), "00000000", "bad sign packs +0");
    }

    void test_module() {
        cout << "\n--- fpu_unit ---\n";
        a.write(F_ONE_HALF);
        b.write(F_2_25);
        op.write(FPU_FADD);
        wait(1, SC_NS);
        chk.check_u64(result.read().to_uint64(), 0x40700000ULL, "fpu_unit FADD");
        chk.check_u64(fflags.read().to_uint64(), 0ULL, "fpu_unit FADD flags");

        a.write(F_MAX_FIN);
        b.write(F_TWO);
        op.write(FPU_FMUL);
        wait(1, SC_NS);
        chk.check_u64(result.read().to_uint64(), 0x7F800000ULL, "fpu_unit FMUL overflow");
        chk.check_u64(fflags.read().to_uint64(), FP_OVERFLOW | FP_INEXACT, "fpu_unit FMUL flags");

        a.write(F_TWO);
        b.write(F_ONE_HALF);
        op.write(FPU_FSUB);
        wait(1, SC_NS);
        chk.check_u64(result.read().to_uint64(), 0x3F000000ULL, "fpu_unit FSUB");
    }

    void run() {
        cout << "\n=== BINARY32 FPU ===\n";
        test_fields();
        test_add_sub();
        test_multiply();
        test_against_host();
        test_errors();
        test_module();
        chk.summary("FPU");
        sc_stop();
    }

    SC_CTOR(fpu_tb) {
        dut = new fpu_unit("dut");
        dut->a(a);
        dut->b(b);
        dut->op(op);
        dut->result(result);
        dut->fflags(fflags);

        SC_THREAD(run);
    }

    ~fpu_tb() {
        delete dut;
    }
};

int sc_main(int argc, char* argv[]) {
    arith_configure_from_args();
    fpu_tb tb("tb");
    sc_start();
    return tb.chk.exit_code();
}
