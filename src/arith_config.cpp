#include "arith_config.h"
#include "bit_vector.h"

#include <cstring>
#include <sstream>

bool require_width(const bit_vector& bv, int expected, const char* what) {
    if (bv.width() == expected) return true;

    std::ostringstream msg;
    msg << what << ": expected " << expected << " bits, got " << bv.width();
    SC_REPORT_ERROR(RV32ARITH_MSG_WIDTH, msg.str().c_str());
    return false;
}

void report_invalid_op(const char* unit, int tag) {
    std::ostringstream msg;
    msg << unit << ": operation tag " << tag << " is not defined";
    SC_REPORT_ERROR(RV32ARITH_MSG_INVALID, msg.str().c_str());
}

void report_bad_value(const char* what) {
    SC_REPORT_ERROR(RV32ARITH_MSG_BAD_VALUE, what);
}

void arith_set_verbosity(int level) {
    sc_report_handler::set_verbosity_level(level);
}

int arith_configure_from_args() {
    int level = SC_MEDIUM;
    for (int i = 1; i < sc_argc(); ++i) {
        if (std::strcmp(sc_argv()[i], "-v") == 0) level = SC_DEBUG;
    }
    arith_set_verbosity(level);
    return level;
}
