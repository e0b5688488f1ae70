#include "bit_vector.h"
#include "tb_check.h"

SC_MODULE(bit_vector_tb) {
    tb_checker chk;

    void test_adder() {
        cout << "\n--- Ripple-carry adder ---\n";
        adder_out_t r = add_with_carry(word(5), word(3), false);
        chk.check_hex(r.sum, "00000008", "5 + 3");
        chk.check(!r.carry_out, "5 + 3 no carry");

        r = add_with_carry(word(0xFFFFFFFF), word(1), false);
        chk.check(r.sum.is_zero() && r.carry_out, "FFFFFFFF + 1 wraps with carry");

        r = add_with_carry(word(0x7FFFFFFF), word(0), true);
        chk.check_hex(r.sum, "80000000", "carry_in feeds bit 31");

        adder_out_t narrow = add_with_carry(bit_vector::from_string("1111"), bit_vector::from_string("0001"), false);
        chk.check(narrow.sum.width() == 4 && narrow.carry_out, "4-bit adder keeps width");

        chk.check_hex(negate(word(1)), "FFFFFFFF", "negate 1");
        chk.check_hex(negate(word(0)), "00000000", "negate 0");
        chk.check_hex(negate(word(0x80000000)), "80000000", "negate INT_MIN");

        chk.check_raises([] { add_with_carry(word(1), bit_vector(16), false); },
                         RV32ARITH_MSG_WIDTH, "adder width mismatch");
    }

    void test_construction() {
        cout << "\n--- Construction and indexing ---\n";
        bit_vector v = bit_vector::from_string("0001_1010");
        chk.check(v.width() == 8, "underscores are ignored");
        chk.check(!v.bit(0) && v.bit(3) && !v.lsb(), "index 0 is the MSB");
        chk.check_hex(v, "1A", "binary text to hex");

        chk.check_hex(bit_vector::from_hex("0x2A", 32), "0000002A", "from_hex pads high digits");
        chk.check_hex(bit_vector::from_hex("0001F", 8), "1F", "from_hex drops zero high digits");
        chk.check(bit_vector::filled(5, true).is_all_ones(), "filled ones");
        chk.check(bit_vector(7).is_zero(), "default is zero");
        chk.check_u64(word(0xDEADBEEF).to_uint64(), 0xDEADBEEFULL, "to_uint64");
        chk.check(word(42) == bit_vector::from_hex("2A", 32), "equality");
        chk.check(word(42) != bit_vector::from_uint(42, 16), "different widths differ");

        chk.check_raises([] { bit_vector::from_string("0120"); }, RV32ARITH_MSG_BAD_VALUE, "bad binary digit");
        chk.check_raises([] { bit_vector::from_hex("1FF", 8); }, RV32ARITH_MSG_BAD_VALUE, "hex too wide");
        chk.check_raises([] { bit_vector::from_hex("G1", 8); }, RV32ARITH_MSG_BAD_VALUE, "bad hex digit");
        chk.check_raises([] { bit_vector(0); }, RV32ARITH_MSG_BAD_VALUE, "zero width");
        chk.check_raises([] { word(1).bit(32); }, RV32ARITH_MSG_BAD_VALUE, "index past the LSB");
    }

    void test_structural() {
        cout << "\n--- Structural primitives ---\n";
        bit_vector hi = bit_vector::from_hex("AB", 8);
        bit_vector lo = bit_vector::from_hex("CD", 8);
        bit_vector both = concat(hi, lo);
        chk.check_hex(both, "ABCD", "concat");
        chk.check_hex(slice(both, 4, 8), "BC", "slice middle byte");
        chk.check_hex(invert(hi), "54", "invert");
        chk.check_hex(bitwise_and(hi, lo), "89", "and");
        chk.check_hex(bitwise_or(hi, lo), "EF", "or");
        chk.check_hex(bitwise_xor(hi, lo), "66", "xor");

        chk.check_raises([&] { bitwise_or(hi, both); }, RV32ARITH_MSG_WIDTH, "or width mismatch");
        chk.check_raises([&] { slice(hi, 6, 4); }, RV32ARITH_MSG_BAD_VALUE, "slice past the end");
    }

    void test_formatting() {
        cout << "\n--- Formatting ---\n";
        chk.check_hex(bit_vector::filled(33, true), "1FFFFFFFF", "33 bits need 9 digits");
        chk.check(format_binary(bit_vector::from_uint(5, 4)) == "0101", "binary text");
        chk.check(format_binary_grouped(bit_vector::from_string("101010"), 4) == "10_1010",
                  "grouping counts from the LSB");
        chk.check(format_binary_grouped(word(0xF0), 8) == "00000000_00000000_00000000_11110000",
                  "byte grouping");
        std::ostringstream os;
        os << word(0xABC);
        chk.check(os.str() == "00000ABC", "stream prints hex");
    }

    void test_errors_displayed() {
        cout << "\n--- Errors reported without throwing ---\n";
        tb_errors_displayed displayed;

        chk.check(!word(0xFFFFFFFF).bit(32), "index past the LSB reads 0");
        chk.check(!word(0xFFFFFFFF).bit(-1), "negative index reads 0");

        adder_out_t r = add_with_carry(word(0xFFFFFFFF), bit_vector::filled(16, true), true);
        chk.check(r.sum.width() == XLEN && r.sum.is_zero() && !r.carry_out, "mismatched adder yields zero");
        chk.check_hex(bitwise_xor(word(0xFF), bit_vector(8)), "00000000", "mismatched xor yields zero");
        chk.check(slice(word(1), 30, 4).width() == 4, "slice past the end keeps the requested width");
        chk.check(bit_vector(0).width() == 1, "zero width falls back to one bit");
        chk.check_hex(bit_vector::from_hex("G1", 8), "00", "bad hex digit yields zero");
        chk.check(bit_vector::from_string("0120").width() == 1, "bad binary digit yields one bit");
    }

    void run() {
        cout << "\n=== BIT VECTOR PRIMITIVES ===\n";
        test_adder();
        test_construction();
        test_structural();
        test_formatting();
        test_errors_displayed();
        chk.summary("BIT VECTOR");
        sc_stop();
    }

    SC_CTOR(bit_vector_tb) {
        SC_THREAD(run);
    }
};

int sc_main(int argc, char* argv[]) {
    arith_configure_from_args();
    bit_vector_tb tb("tb");
    sc_start();
    return tb.chk.exit_code();
}
