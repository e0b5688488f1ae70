#include "fpu_f32.h"

#include <iomanip>
#include <sstream>

static const int GRS_BITS    = 3;                      // guard, round, sticky below the fraction LSB
static const int ALIGN_LIMIT = F32_FRAC_BITS + 1 + GRS_BITS;
static const int MUL_EXTRA   = F32_FRAC_BITS;          // product bits below the fraction LSB

// ---------------- Field decomposition ----------------
struct ieee754_components {
    sc_uint<32> raw;
    bool        sign;
    sc_uint<8>  exponent;
    sc_uint<23> mantissa;
    bool is_zero;
    bool is_infinity;
    bool is_nan;
    bool is_denormalized;
    sc_int<12>  eff_exponent;          // subnormals behave as exponent 1
    sc_uint<24> effective_mantissa;    // hidden 1 when normal
};

static ieee754_components decompose(const bit_vector& bits) {
    ieee754_components comp;
    comp.raw      = bits.to_uint64();
    comp.sign     = comp.raw[31];
    comp.exponent = (comp.raw >> F32_FRAC_BITS) & F32_EXP_MAX;
    comp.mantissa = comp.raw & 0x7FFFFF;

    comp.is_zero         = (comp.exponent == 0) && (comp.mantissa == 0);
    comp.is_infinity     = (comp.exponent == F32_EXP_MAX) && (comp.mantissa == 0);
    comp.is_nan          = (comp.exponent == F32_EXP_MAX) && (comp.mantissa != 0);
    comp.is_denormalized = (comp.exponent == 0) && (comp.mantissa != 0);

    comp.eff_exponent = (comp.exponent == 0) ? sc_int<12>(1) : sc_int<12>(comp.exponent);
    comp.effective_mantissa = (comp.exponent == 0) ? sc_uint<24>(comp.mantissa)
                                                   : sc_uint<24>(comp.mantissa | 0x800000);
    return comp;
}

static sc_uint<32> make_nan() {
    return F32_QNAN;
}

static sc_uint<32> make_infinity(bool sign) {
    return (sc_uint<32>(sign) << 31) | F32_POS_INF;
}

static sc_uint<32> make_zero(bool sign) {
    return sign ? F32_NEG_0 : 0u;
}

static bit_vector to_bits(sc_uint<32> value) {
    return bit_vector::from_uint(value.to_uint64(), F32_WIDTH);
}

static std::string hex_of(sc_dt::uint64 v, int digits) {
    std::ostringstream os;
    os << std::hex << std::uppercase << std::setw(digits) << std::setfill('0') << v;
    return os.str();
}

static std::string flag_text(sc_uint<5> flags) {
    std::string s;
    if (flags & FP_INVALID_OP)     s += "NV ";
    if (flags & FP_DIVIDE_BY_ZERO) s += "DZ ";
    if (flags & FP_OVERFLOW)       s += "OF ";
    if (flags & FP_UNDERFLOW)      s += "UF ";
    if (flags & FP_INEXACT)        s += "NX ";
    if (s.empty()) return "-";
    return s.substr(0, s.size() - 1);
}

static f32_category category_of(const ieee754_components& c) {
    if (c.is_zero)         return F32_ZERO;
    if (c.is_denormalized) return F32_SUBNORMAL;
    if (c.is_infinity)     return F32_INFINITY;
    if (c.is_nan)          return F32_NAN;
    return F32_NORMAL;
}

static void trace_operand(step_trace_t& trace, const char* name, const ieee754_components& c) {
    std::ostringstream s;
    s << "unpack " << name << ": " << f32_category_name(category_of(c))
      << " s=" << c.sign << " e=0x" << hex_of(c.exponent.to_uint64(), 2)
      << " m=0x" << hex_of(c.effective_mantissa.to_uint64(), 6);
    trace.push_back(s.str());
}

// Tininess after rounding: the nonzero value rounded to 24 significant bits
// with an unbounded exponent still lies below the smallest normal.
static bool tiny_after_rounding(int exp, sc_dt::uint64 sig, int extra) {
    int lead = F32_FRAC_BITS + extra;
    while (((sig >> lead) & 1) == 0) {
        sig <<= 1;
        exp -= 1;
    }
    if (exp >= 1) return false;
    if (exp < 0)  return true;

    // One binade below MIN_NORM: only an all-ones significand rounding up escapes
    sc_dt::uint64 half = 1ULL << (extra - 1);
    sc_dt::uint64 rem  = sig & ((1ULL << extra) - 1);
    sc_dt::uint64 mant = sig >> extra;
    bool up = (rem > half) || (rem == half && (mant & 1));
    return !(up && mant == 0xFFFFFF);
}

//==============================================================================
//
// Round to nearest even and pack.
// sig carries `extra` bits below the fraction LSB; a normal value has its
// leading one at bit 23 + extra and `exp` is the biased exponent of that bit.
// UF is raised for a result that is tiny after rounding and inexact.
//
static sc_uint<32> round_and_pack(bool sign, int exp, sc_dt::uint64 sig, int extra,
                                  sc_uint<5>& flags, step_trace_t& trace) {
    bool tiny = tiny_after_rounding(exp, sig, extra);

    if (exp < 1) {
        int sh = 1 - exp;
        sc_dt::uint64 lost = (sh >= 64) ? sig : (sig & ((1ULL << sh) - 1));
        sig = (sh >= 64) ? 0 : (sig >> sh);
        if (lost != 0) sig |= 1;
        exp = 1;

        std::ostringstream s;
        s << "denormalize: shift=" << sh << " sig=0x" << hex_of(sig, 12);
        trace.push_back(s.str());
    }

    sc_dt::uint64 half = 1ULL << (extra - 1);
    sc_dt::uint64 rem  = sig & ((1ULL << extra) - 1);
    sc_dt::uint64 mant = sig >> extra;

    if (rem != 0) {
        flags |= FP_INEXACT;
        if (tiny) flags |= FP_UNDERFLOW;
    }
    bool up = (rem > half) || (rem == half && (mant & 1));
    if (up) mant += 1;
    if (mant >> (F32_FRAC_BITS + 1)) {
        mant >>= 1;
        exp += 1;
    }

    std::ostringstream s;
    s << "round: mant=0x" << hex_of(mant, 6) << " discarded=0x" << hex_of(rem, 1)
      << (up ? " up" : " down") << " exp=" << exp;
    trace.push_back(s.str());

    if (exp >= F32_EXP_MAX) {
        flags |= FP_OVERFLOW | FP_INEXACT;
        return make_infinity(sign);
    }

    // Leading one still below the hidden position: subnormal encoding
    sc_uint<8> field = ((mant >> F32_FRAC_BITS) & 1) ? exp : 0;
    return (sc_uint<32>(sign) << 31) | (sc_uint<32>(field) << F32_FRAC_BITS) | sc_uint<32>(mant & 0x7FFFFF);
}

// ---------------- Add ----------------
static sc_uint<32> do_add(const ieee754_components& a, const ieee754_components& b,
                          sc_uint<5>& flags, step_trace_t& trace) {
    if (a.is_nan || b.is_nan) {
        flags |= FP_INVALID_OP;
        return make_nan();
    }

    if (a.is_infinity || b.is_infinity) {
        if (a.is_infinity && b.is_infinity && (a.sign != b.sign)) {
            flags |= FP_INVALID_OP;
            return make_nan();
        }
        return make_infinity(a.is_infinity ? a.sign : b.sign);
    }

    if (a.is_zero && b.is_zero) return make_zero(a.sign && b.sign);
    if (b.is_zero) return a.raw;
    if (a.is_zero) return b.raw;

    // Larger magnitude first
    bool swap = (b.eff_exponent > a.eff_exponent) ||
                (b.eff_exponent == a.eff_exponent && b.effective_mantissa > a.effective_mantissa);
    const ieee754_components& big   = swap ? b : a;
    const ieee754_components& small = swap ? a : b;

    int exp  = big.eff_exponent.to_int();
    int diff = exp - small.eff_exponent.to_int();

    sc_uint<28> sig_big   = sc_uint<28>(big.effective_mantissa) << GRS_BITS;
    sc_uint<28> sig_small = sc_uint<28>(small.effective_mantissa) << GRS_BITS;

    int steps = (diff < ALIGN_LIMIT) ? diff : ALIGN_LIMIT;
    for (int i = 0; i < steps; ++i) {
        sig_small = (sig_small >> 1) | (sig_small & 1);
        std::ostringstream s;
        s << "align " << std::setw(2) << std::setfill('0') << i + 1 << ": sig=0x" << hex_of(sig_small.to_uint64(), 7);
        trace.push_back(s.str());
    }
    if (diff > steps) {
        std::ostringstream s;
        s << "align: " << diff - steps << " further shifts folded into sticky";
        trace.push_back(s.str());
    }

    sc_uint<28> sum;
    if (a.sign == b.sign) sum = sig_big + sig_small;
    else                  sum = sig_big - sig_small;

    {
        std::ostringstream s;
        s << ((a.sign == b.sign) ? "add" : "sub") << ": sum=0x" << hex_of(sum.to_uint64(), 7);
        trace.push_back(s.str());
    }

    if (sum == 0) {
        trace.push_back("exact cancellation: +0");
        return make_zero(false);
    }

    // Normalize so the leading one sits at bit 26
    if (sum[27]) {
        sum = (sum >> 1) | (sum & 1);
        exp += 1;
    } else {
        while (!sum[26] && exp > 1) {
            sum <<= 1;
            exp -= 1;
        }
    }

    std::ostringstream s;
    s << "normalize: sig=0x" << hex_of(sum.to_uint64(), 7) << " exp=" << exp;
    trace.push_back(s.str());

    return round_and_pack(big.sign, exp, sum.to_uint64(), GRS_BITS, flags, trace);
}

// ---------------- Multiply ----------------
static sc_uint<32> do_mul(const ieee754_components& a, const ieee754_components& b,
                          sc_uint<5>& flags, step_trace_t& trace) {
    if (a.is_nan || b.is_nan) { flags |= FP_INVALID_OP; return make_nan(); }
    if ((a.is_infinity && b.is_zero) || (a.is_zero && b.is_infinity)) { flags |= FP_INVALID_OP; return make_nan(); }
    if (a.is_infinity || b.is_infinity) return make_infinity(a.sign ^ b.sign);
    if (a.is_zero || b.is_zero) return make_zero(a.sign ^ b.sign);

    bool rsign = a.sign ^ b.sign;
    int  exp   = a.eff_exponent.to_int() + b.eff_exponent.to_int() - F32_BIAS;

    sc_uint<48> mcand = a.effective_mantissa;
    sc_uint<48> prod  = 0;
    for (int i = 0; i < F32_FRAC_BITS + 1; ++i) {
        bool b_i = b.effective_mantissa[i];
        if (b_i) prod = prod + (mcand << i);
        std::ostringstream s;
        s << "pp " << std::setw(2) << std::setfill('0') << i << ": b[" << i << "]=" << b_i
          << " acc=0x" << hex_of(prod.to_uint64(), 12);
        trace.push_back(s.str());
    }

    // Leading one to bit 46
    if (prod[47]) {
        prod = (prod >> 1) | (prod & 1);
        exp += 1;
    } else {
        while (!prod[46]) {
            prod <<= 1;
            exp -= 1;
        }
    }

    std::ostringstream s;
    s << "normalize: prod=0x" << hex_of(prod.to_uint64(), 12) << " exp=" << exp;
    trace.push_back(s.str());

    return round_and_pack(rsign, exp, prod.to_uint64(), MUL_EXTRA, flags, trace);
}

static fpu_result_t run_binary(const char* name, const bit_vector& a_bits, const bit_vector& b_bits,
                               sc_uint<32> (*body)(const ieee754_components&, const ieee754_components&,
                                                   sc_uint<5>&, step_trace_t&)) {
    if (!require_width(a_bits, F32_WIDTH, "fpu operand a") || !require_width(b_bits, F32_WIDTH, "fpu operand b")) {
        fpu_result_t none = { bit_vector(F32_WIDTH), 0, step_trace_t() };
        return none;
    }

    ieee754_components a = decompose(a_bits);
    ieee754_components b = decompose(b_bits);

    fpu_result_t out = { a_bits, 0, step_trace_t() };
    trace_operand(out.trace, "a", a);
    trace_operand(out.trace, "b", b);

    sc_uint<5> flags = 0;
    sc_uint<32> res = body(a, b, flags, out.trace);
    out.res_bits = to_bits(res);
    out.flags = flags;

    std::ostringstream msg;
    msg << name << " " << a_bits << ", " << b_bits << " -> " << out.res_bits
        << " flags=" << flag_text(flags) << " steps=" << out.trace.size();
    SC_REPORT_INFO_VERB(RV32ARITH_MSG_FPU, msg.str().c_str(), SC_DEBUG);
    return out;
}

//==============================================================================
//
// Public operations
//
fpu_result_t fadd_f32(const bit_vector& a, const bit_vector& b) {
    return run_binary("FADD", a, b, do_add);
}

fpu_result_t fsub_f32(const bit_vector& a, const bit_vector& b) {
    return run_binary("FSUB", a, flip_sign_f32(b), do_add);
}

fpu_result_t fmul_f32(const bit_vector& a, const bit_vector& b) {
    return run_binary("FMUL", a, b, do_mul);
}

fpu_result_t fpu_execute(fpu_op op, const bit_vector& a, const bit_vector& b) {
    switch (op) {
        case FPU_FADD: return fadd_f32(a, b);
        case FPU_FSUB: return fsub_f32(a, b);
        case FPU_FMUL: return fmul_f32(a, b);
    }
    report_invalid_op("fpu", static_cast<int>(op));
    fpu_result_t none = { to_bits(make_nan()), FP_INVALID_OP, step_trace_t() };
    return none;
}

// ---------------- Field access ----------------
bit_vector pack_f32_fields(int sign, const bit_vector& exponent, const bit_vector& fraction) {
    if (sign != 0 && sign != 1) {
        report_bad_value("pack_f32_fields: sign must be 0 or 1");
        return bit_vector(F32_WIDTH);
    }
    if (!require_width(exponent, F32_EXP_BITS, "f32 exponent field") ||
        !require_width(fraction, F32_FRAC_BITS, "f32 fraction field")) {
        return bit_vector(F32_WIDTH);
    }
    return concat(concat(bit_vector::filled(1, sign == 1), exponent), fraction);
}

f32_fields_t unpack_f32(const bit_vector& bits) {
    if (!require_width(bits, F32_WIDTH, "unpack_f32 operand")) {
        f32_fields_t none = { 0, bit_vector(F32_EXP_BITS), bit_vector(F32_FRAC_BITS) };
        return none;
    }
    f32_fields_t f = {
        bits.msb() ? 1 : 0,
        slice(bits, 1, F32_EXP_BITS),
        slice(bits, 1 + F32_EXP_BITS, F32_FRAC_BITS)
    };
    return f;
}

f32_class_t classify_f32(const bit_vector& bits) {
    if (!require_width(bits, F32_WIDTH, "classify_f32 operand")) {
        f32_class_t none = { F32_ZERO, false };
        return none;
    }
    ieee754_components c = decompose(bits);

    f32_class_t out = { category_of(c), c.sign };
    return out;
}

bool f32_is_nan(const bit_vector& bits) {
    return classify_f32(bits).category == F32_NAN;
}

bit_vector flip_sign_f32(const bit_vector& bits) {
    if (!require_width(bits, F32_WIDTH, "flip_sign_f32 operand")) return bit_vector(F32_WIDTH);
    return concat(bit_vector::filled(1, !bits.msb()), slice(bits, 1, F32_WIDTH - 1));
}

const char* f32_category_name(f32_category c) {
    switch (c) {
        case F32_ZERO:      return "Zero";
        case F32_SUBNORMAL: return "Subnormal";
        case F32_NORMAL:    return "Normal";
        case F32_INFINITY:  return "Infinity";
        case F32_NAN:       return "NaN";
    }
    return "?";
}

const char* fpu_op_name(fpu_op op) {
    switch (op) {
        case FPU_FADD: return "FADD";
        case FPU_FSUB: return "FSUB";
        case FPU_FMUL: return "FMUL";
    }
    return "?";
}
