#include "shifter.h"
#include "arith_units.h"
#include "tb_check.h"

SC_MODULE(shifter_tb) {
    sc_signal<sc_uint<32>> x, result;
    sc_signal<sc_uint<5>>  shamt;
    sc_signal<sc_uint<2>>  op;

    shifter_unit* dut;
    tb_checker chk;

    void test_shifts() {
        cout << "\n--- SLL / SRL / SRA ---\n";
        chk.check_hex(shift(word(0xD), 2, SHIFT_SLL), "00000034", "SLL 0xD by 2");
        chk.check_hex(shift(word(0x80000001), 1, SHIFT_SLL), "00000002", "SLL drops the MSB");
        chk.check_hex(shift(word(0x80000000), 31, SHIFT_SRL), "00000001", "SRL by 31");
        chk.check_hex(shift(word(0x80000000), 4, SHIFT_SRA), "F8000000", "SRA negative");
        chk.check_hex(shift(word(0x70000000), 4, SHIFT_SRA), "07000000", "SRA positive");
        chk.check_hex(shift(word(1), 33, SHIFT_SLL), "00000002", "amount taken modulo 32");
        chk.check_hex(shift(word(0x12345678), 32, SHIFT_SRL), "12345678", "amount 32 is amount 0");
        chk.check_hex(shift_by(word(0xF0), bit_vector::from_hex("FFFFFFE3", 32), SHIFT_SRL), "0000001E",
                      "shift_by uses the low 5 bits");
    }

    void test_laws() {
        cout << "\n--- Shift laws (sampled) ---\n";
        sc_dt::uint64 seed = 0xBADC0DE;
        bool identity = true, sign_kept = true;
        for (int i = 0; i < 64; ++i) {
            bit_vector v = word(next_sample(seed));
            if (shift(v, 0, SHIFT_SLL) != v || shift(v, 0, SHIFT_SRL) != v || shift(v, 0, SHIFT_SRA) != v) {
                identity = false;
            }
            for (unsigned int k = 0; k < 32; k += 5) {
                if (shift(v, k, SHIFT_SRA).msb() != v.msb()) sign_kept = false;
            }
        }
        chk.check(identity, "shift by 0 is the identity");
        chk.check(sign_kept, "SRA keeps the sign bit");
    }

    void test_errors() {
        cout << "\n--- Contract violations ---\n";
        chk.check_raises([] { shift(word(1), 1, static_cast<shift_op>(3)); },
                         RV32ARITH_MSG_INVALID, "undefined shift tag");
        chk.check_raises([] { shift(bit_vector(8), 1, SHIFT_SLL); },
                         RV32ARITH_MSG_WIDTH, "8-bit operand");
    }

    void test_module() {
        cout << "\n--- shifter_unit ---\n";
        x.write(0xD);
        shamt.write(2);
        op.write(SHIFT_SLL);
        wait(1, SC_NS);
        chk.check_u64(result.read().to_uint64(), 0x34ULL, "shifter_unit SLL");

        x.write(0x80000000);
        shamt.write(8);
        op.write(SHIFT_SRA);
        wait(1, SC_NS);
        chk.check_u64(result.read().to_uint64(), 0xFF800000ULL, "shifter_unit SRA");
    }

    void run() {
        cout << "\n=== SHIFTER ===\n";
        test_shifts();
        test_laws();
        test_errors();
        test_module();
        chk.summary("SHIFTER");
        sc_stop();
    }

    SC_CTOR(shifter_tb) {
        dut = new shifter_unit("dut");
        dut->x(x);
        dut->shamt(shamt);
        dut->op(op);
        dut->result(result);

        SC_THREAD(run);
    }

    ~shifter_tb() {
        delete dut;
    }
};

int sc_main(int argc, char* argv[]) {
    arith_configure_from_args();
    shifter_tb tb("tb");
    sc_start();
    return tb.chk.exit_code();
}
