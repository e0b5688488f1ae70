#ifndef RV32ARITH_TB_CHECK_H
#define RV32ARITH_TB_CHECK_H

#include "arith_config.h"
#include "bit_vector.h"

#include <iostream>
#include <sstream>
#include <string>

// Pass/fail bookkeeping shared by the testbenches
struct tb_checker {
    int tests_passed;
    int tests_failed;

    tb_checker() : tests_passed(0), tests_failed(0) {}

    bool record(bool pass, const std::string& name, const std::string& detail = "") {
        std::cout << "[" << sc_time_stamp() << "] " << name;
        if (!detail.empty()) std::cout << ": " << detail;
        std::cout << " - " << (pass ? "PASS" : "FAIL") << "\n";
        if (pass) tests_passed++; else tests_failed++;
        return pass;
    }

    bool check(bool cond, const std::string& name) {
        return record(cond, name);
    }

    bool check_hex(const bit_vector& actual, const std::string& expected, const std::string& name) {
        std::string got = format_hex(actual);
        return record(got == expected, name, got + " (exp " + expected + ")");
    }

    bool check_u64(sc_dt::uint64 actual, sc_dt::uint64 expected, const std::string& name) {
        std::ostringstream d;
        d << std::hex << std::uppercase << actual << " (exp " << expected << ")";
        return record(actual == expected, name, d.str());
    }

    // fn must raise an SC_REPORT_ERROR of the given message type
    template <typename Fn>
    bool check_raises(Fn fn, const char* msg_type, const std::string& name) {
        std::string got = "nothing";
        try {
            fn();
        } catch (const sc_core::sc_report& r) {
            got = r.get_msg_type();
        }
        return record(got == msg_type, name, std::string("raised ") + got);
    }

    void summary(const char* title) const {
        std::cout << "\n=== " << title << " SUMMARY ===\n";
        std::cout << "Passed: " << tests_passed << "  Failed: " << tests_failed << "\n";
    }

    int exit_code() const { return tests_failed == 0 ? 0 : 1; }
};

// While alive, SC_ERROR reports are displayed and execution continues
struct tb_errors_displayed {
    sc_core::sc_actions saved;

    tb_errors_displayed()
        : saved(sc_core::sc_report_handler::set_actions(sc_core::SC_ERROR, sc_core::SC_DISPLAY)) {}
    ~tb_errors_displayed() {
        sc_core::sc_report_handler::set_actions(sc_core::SC_ERROR, saved);
    }
};

inline bit_vector word(sc_dt::uint64 value) {
    return bit_vector::from_uint(value, XLEN);
}

// xorshift32 sample generator for the sampled law checks
inline sc_dt::uint64 next_sample(sc_dt::uint64& state) {
    sc_dt::uint64 x = state & 0xFFFFFFFFULL;
    x ^= (x << 13) & 0xFFFFFFFFULL;
    x ^= x >> 17;
    x ^= (x << 5) & 0xFFFFFFFFULL;
    state = x;
    return x;
}

#endif
