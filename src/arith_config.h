#ifndef RV32ARITH_ARITH_CONFIG_H
#define RV32ARITH_ARITH_CONFIG_H

#include <systemc.h>
#include <string>
#include <vector>

// ---------------- Architectural parameters ----------------
static const int XLEN            = 32;
static const int F32_WIDTH       = 32;
static const int F32_EXP_BITS    = 8;
static const int F32_FRAC_BITS   = 23;
static const int F32_BIAS        = 127;
static const int F32_EXP_MAX     = 0xFF;
static const int FRM_BITS        = 3;
static const int FFLAGS_BITS     = 5;

static const unsigned int F32_QNAN    = 0x7FC00000u;
static const unsigned int F32_POS_INF = 0x7F800000u;
static const unsigned int F32_NEG_INF = 0xFF800000u;
static const unsigned int F32_NEG_0   = 0x80000000u;

// ---------------- Report message types ----------------
#define RV32ARITH_MSG_WIDTH     "/rv32arith/width_mismatch"
#define RV32ARITH_MSG_INVALID   "/rv32arith/invalid_op"
#define RV32ARITH_MSG_BAD_VALUE "/rv32arith/bad_value"
#define RV32ARITH_MSG_ALU       "/rv32arith/alu"
#define RV32ARITH_MSG_MDU       "/rv32arith/mdu"
#define RV32ARITH_MSG_FPU       "/rv32arith/fpu"
#define RV32ARITH_MSG_FCSR      "/rv32arith/fcsr"
#define RV32ARITH_MSG_UNITS     "/rv32arith/units"

// Per-step snapshots returned beside a result; never read back by the engine
typedef std::vector<std::string> step_trace_t;

class bit_vector;

// Raise WidthMismatch unless bv has exactly `expected` bits.
// Returns false after reporting, for SC_ERROR actions that do not throw.
bool require_width(const bit_vector& bv, int expected, const char* what);

// Raise InvalidOperationTag for a selector outside a unit's enumeration
void report_invalid_op(const char* unit, int tag);

// Raise a malformed-argument error
void report_bad_value(const char* what);

// Adjust the SystemC verbosity used by the engine's SC_REPORT_INFO_VERB calls
void arith_set_verbosity(int level);

// Pick up "-v" from sc_argv(); returns the verbosity level applied
int arith_configure_from_args();

#endif
