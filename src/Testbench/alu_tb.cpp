#include "alu.h"
#include "arith_units.h"
#include "tb_check.h"

SC_MODULE(alu_tb) {
    sc_signal<sc_uint<32>> a, b, result;
    sc_signal<sc_uint<4>>  op;
    sc_signal<bool>        n, z, c, v;

    alu_unit* dut;
    tb_checker chk;

    bool check_flags(const alu_result_t& r, bool en, bool ez, bool ec, bool ev, const std::string& name) {
        std::ostringstream d;
        d << "N=" << r.n << " Z=" << r.z << " C=" << r.c << " V=" << r.v;
        return chk.record(r.n == en && r.z == ez && r.c == ec && r.v == ev, name, d.str());
    }

    void test_add_sub() {
        cout << "\n--- ADD / SUB ---\n";
        alu_result_t r = alu(word(0x7FFFFFFF), word(1), ALU_ADD);
        chk.check_hex(r.result, "80000000", "ADD 7FFFFFFF + 1");
        check_flags(r, true, false, false, true, "ADD positive overflow flags");

        r = alu(word(0xFFFFFFFF), word(1), ALU_ADD);
        chk.check_hex(r.result, "00000000", "ADD FFFFFFFF + 1");
        check_flags(r, false, true, true, false, "ADD unsigned wrap flags");

        r = alu(word(0x80000000), word(0x80000000), ALU_ADD);
        check_flags(r, false, true, true, true, "ADD negative overflow flags");

        r = alu(word(0x80000000), word(1), ALU_SUB);
        chk.check_hex(r.result, "7FFFFFFF", "SUB 80000000 - 1");
        check_flags(r, false, false, true, true, "SUB INT_MIN - 1 flags");

        r = alu(word(5), word(5), ALU_SUB);
        check_flags(r, false, true, true, false, "SUB equal operands flags");

        r = alu(word(3), word(5), ALU_SUB);
        chk.check_hex(r.result, "FFFFFFFE", "SUB 3 - 5");
        check_flags(r, true, false, false, false, "SUB borrow flags");
    }

    void test_logic_and_compare() {
        cout << "\n--- Logic / compare / shift ---\n";
        chk.check_hex(alu(word(0xF0F0), word(0x0F0F), ALU_OR).result, "0000FFFF", "OR");
        chk.check_hex(alu(word(0xFF00FF00), word(0x0FF00FF0), ALU_AND).result, "0F000F00", "AND");
        chk.check_hex(alu(word(0xFF00FF00), word(0x0FF00FF0), ALU_XOR).result, "F0F0F0F0", "XOR");

        alu_result_t r = alu(word(0), word(0), ALU_OR);
        check_flags(r, false, true, false, false, "OR zero sets only Z");

        chk.check_hex(alu(word(0xFFFFFFFF), word(1), ALU_SLT).result, "00000001", "SLT -1 < 1");
        chk.check_hex(alu(word(0xFFFFFFFF), word(1), ALU_SLTU).result, "00000000", "SLTU FFFFFFFF < 1");
        chk.check_hex(alu(word(0x80000000), word(1), ALU_SLT).result, "00000001", "SLT INT_MIN < 1");
        chk.check_hex(alu(word(1), word(0), ALU_SLTU).result, "00000000", "SLTU 1 < 0");
        chk.check_hex(alu(word(0), word(1), ALU_SLTU).result, "00000001", "SLTU 0 < 1");
        chk.check_hex(alu(word(7), word(7), ALU_SLT).result, "00000000", "SLT equal");

        chk.check_hex(alu(word(1), word(0x24), ALU_SLL).result, "00000010", "SLL uses low 5 bits of b");
        chk.check_hex(alu(word(0x80000000), word(31), ALU_SRA).result, "FFFFFFFF", "SRA by 31");
        chk.check_hex(alu(word(0x80000000), word(31), ALU_SRL).result, "00000001", "SRL by 31");
    }

    void test_flag_law() {
        cout << "\n--- ADD overflow law (sampled) ---\n";
        sc_dt::uint64 seed = 0x1234567;
        bool ok = true;
        for (int i = 0; i < 500; ++i) {
            sc_dt::uint64 x = next_sample(seed), y = next_sample(seed);
            alu_result_t r = alu(word(x), word(y), ALU_ADD);
            bool sa = (x >> 31) & 1, sb = (y >> 31) & 1, sr = r.result.msb();
            bool expect_v = (sa == sb) && (sr != sa);
            if (r.v != expect_v || r.result.to_uint64() != ((x + y) & 0xFFFFFFFFULL)) ok = false;
            if (r.c != (((x + y) >> 32) & 1)) ok = false;
        }
        chk.check(ok, "V iff equal operand signs and a different result sign");
    }

    void test_errors() {
        cout << "\n--- Contract violations ---\n";
        chk.check_raises([] { alu(word(1), word(2), static_cast<alu_op>(12)); },
                         RV32ARITH_MSG_INVALID, "undefined ALU tag");
        chk.check_raises([] { alu(bit_vector(16), word(2), ALU_ADD); },
                         RV32ARITH_MSG_WIDTH, "16-bit operand");

        tb_errors_displayed displayed;
        alu_result_t r = alu(bit_vector::filled(16, true), word(2), ALU_ADD);
        chk.check_hex(r.result, "00000000", "16-bit operand yields zero when not thrown");
        chk.check(r.z && !r.n && !r.c && !r.v, "zero result flags");
    }

    void test_module() {
        cout << "\n--- alu_unit ---\n";
        a.write(0x7FFFFFFF);
        b.write(1);
        op.write(ALU_ADD);
        wait(1, SC_NS);
        chk.check_u64(result.read().to_uint64(), 0x80000000ULL, "alu_unit ADD result");
        chk.check(n.read() && !z.read() && !c.read() && v.read(), "alu_unit ADD flags");

        a.write(0x80000000);
        op.write(ALU_SUB);
        wait(1, SC_NS);
        chk.check_u64(result.read().to_uint64(), 0x7FFFFFFFULL, "alu_unit SUB result");
        chk.check(!n.read() && !z.read() && c.read() && v.read(), "alu_unit SUB flags");

        op.write(ALU_SLTU);
        wait(1, SC_NS);
        chk.check_u64(result.read().to_uint64(), 0ULL, "alu_unit SLTU");
    }

    void run() {
        cout << "\n=== INTEGER ALU ===\n";
        test_add_sub();
        test_logic_and_compare();
        test_flag_law();
        test_errors();
        test_module();
        chk.summary("ALU");
        sc_stop();
    }

    SC_CTOR(alu_tb) {
        dut = new alu_unit("dut");
        dut->a(a);
        dut->b(b);
        dut->op(op);
        dut->result(result);
        dut->n(n);
        dut->z(z);
        dut->c(c);
        dut->v(v);

        SC_THREAD(run);
    }

    ~alu_tb() {
        delete dut;
    }
};

int sc_main(int argc, char* argv[]) {
    arith_configure_from_args();
    alu_tb tb("tb");
    sc_start();
    return tb.chk.exit_code();
}
