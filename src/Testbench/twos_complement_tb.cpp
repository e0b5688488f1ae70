#include "twos_complement.h"
#include "tb_check.h"

SC_MODULE(twos_complement_tb) {
    tb_checker chk;

    void test_encode() {
        cout << "\n--- Encode ---\n";
        twos_encoding_t e = encode_twos(42);
        chk.check(e.bin == "00000000000000000000000000101010", "42 binary text");
        chk.check(e.hex == "0000002A", "42 hex text");
        chk.check(!e.overflow_flag, "42 in range");

        e = encode_twos(-1);
        chk.check(e.hex == "FFFFFFFF" && !e.overflow_flag, "-1 is all ones");

        e = encode_twos(-2147483648LL);
        chk.check(e.hex == "80000000" && !e.overflow_flag, "INT_MIN in range");

        e = encode_twos(2147483648LL);
        chk.check(e.hex == "80000000" && e.overflow_flag, "2^31 wraps with overflow");

        e = encode_twos(-129, 8);
        chk.check(e.hex == "7F" && e.overflow_flag, "-129 in 8 bits wraps to 7F");

        e = encode_twos(-5, 4);
        chk.check(e.bin == "1011" && !e.overflow_flag, "-5 in 4 bits");

        chk.check_raises([] { encode_twos(1, 0); }, RV32ARITH_MSG_BAD_VALUE, "width 0");
        chk.check_raises([] { encode_twos(1, 65); }, RV32ARITH_MSG_BAD_VALUE, "width 65");
    }

    void test_decode() {
        cout << "\n--- Decode ---\n";
        twos_decoding_t d = decode_twos(bit_vector::from_string("00000000000000000000000000101010"));
        chk.check(d.value == 42, "decode 42");

        d = decode_twos(word(0xFFFFFFFE));
        chk.check(d.value == -2 && d.unsigned_value == 0xFFFFFFFEULL, "decode FFFFFFFE");

        d = decode_twos(word(0x80000000));
        chk.check(d.value == -2147483648LL, "decode INT_MIN");

        // Sampled round trip over the full 32-bit range
        bool ok = true;
        for (sc_dt::int64 n = -2147483648LL; n <= 2147483647LL; n += 1000003) {
            twos_encoding_t e = encode_twos(n);
            if (e.overflow_flag || decode_twos(e.bits).value != n) ok = false;
        }
        chk.check(ok, "decode(encode(n)) == n");

        ok = true;
        const sc_dt::uint64 samples[] = { 0x0ULL, 0x1ULL, 0x7FFFFFFFULL, 0x80000000ULL, 0xDEADBEEFULL, 0xFFFFFFFFULL };
        for (sc_dt::uint64 s : samples) {
            if (encode_twos(decode_twos(word(s)).value).bits != word(s)) ok = false;
        }
        chk.check(ok, "encode(decode(v)) == v");
    }

    void test_extension() {
        cout << "\n--- Extension and truncation ---\n";
        bit_vector neg8 = bit_vector::from_hex("F6", 8);   // -10
        bit_vector pos8 = bit_vector::from_hex("76", 8);

        chk.check_hex(sign_extend(neg8, 8, 32), "FFFFFFF6", "sign_extend negative");
        chk.check(decode_twos(sign_extend(neg8, 8, 32)).value == decode_twos(neg8).value,
                  "sign_extend keeps the signed value");
        chk.check_hex(sign_extend(pos8, 8, 32), "00000076", "sign_extend positive");
        chk.check(decode_twos(zero_extend(neg8, 8, 32)).value == static_cast<sc_dt::int64>(unsigned_value(neg8)),
                  "zero_extend keeps the unsigned value");
        chk.check(sign_extend(neg8, 8, 8) == neg8, "same-width extension is identity");

        chk.check_hex(truncate(word(0x12345678), 8), "78", "truncate keeps low byte");
        chk.check_hex(truncate(word(0x12345678), 32), "12345678", "truncate to full width");

        chk.check_raises([&] { sign_extend(neg8, 8, 4); }, RV32ARITH_MSG_WIDTH, "narrowing sign_extend");
        chk.check_raises([&] { zero_extend(neg8, 16, 32); }, RV32ARITH_MSG_WIDTH, "from_width disagrees");
        chk.check_raises([] { truncate(word(1), 33); }, RV32ARITH_MSG_WIDTH, "truncate wider");
        chk.check_raises([] { truncate(word(1), 0); }, RV32ARITH_MSG_WIDTH, "truncate to zero bits");

        tb_errors_displayed displayed;
        chk.check(truncate(word(5), 33) == word(5), "truncate wider returns the input");
        chk.check(sign_extend(neg8, 16, 32) == neg8, "mismatched sign_extend returns the input");
        chk.check(decode_twos(bit_vector(70)).unsigned_value == 0, "decode past 64 bits yields 0");
        chk.check(encode_twos(5, 0).overflow_flag, "zero width encode reports overflow");
    }

    void run() {
        cout << "\n=== TWO'S-COMPLEMENT CODEC ===\n";
        test_encode();
        test_decode();
        test_extension();
        chk.summary("CODEC");
        sc_stop();
    }

    SC_CTOR(twos_complement_tb) {
        SC_THREAD(run);
    }
};

int sc_main(int argc, char* argv[]) {
    arith_configure_from_args();
    twos_complement_tb tb("tb");
    sc_start();
    return tb.chk.exit_code();
}
