#include "twos_complement.h"

#include <sstream>

twos_encoding_t encode_twos(sc_dt::int64 value, int width) {
    if (width <= 0 || width > 64) {
        report_bad_value("two's-complement width must be 1..64");
        bit_vector none(1);
        twos_encoding_t enc = { none, format_binary(none), format_hex(none), true };
        return enc;
    }

    bool overflow = false;
    if (width < 64) {
        sc_dt::int64 max_pos = (static_cast<sc_dt::int64>(1) << (width - 1)) - 1;
        sc_dt::int64 min_neg = -max_pos - 1;
        overflow = value > max_pos || value < min_neg;
    }

    // Reduction mod 2^width is a bit-select of the 64-bit two's-complement image
    bit_vector bits = bit_vector::from_uint(static_cast<sc_dt::uint64>(value), width);

    twos_encoding_t enc = { bits, format_binary(bits), format_hex(bits), overflow };
    return enc;
}

twos_decoding_t decode_twos(const bit_vector& bits) {
    int width = bits.width();
    if (width > 64) {
        report_bad_value("two's-complement decode supports at most 64 bits");
        twos_decoding_t none = { 0, 0 };
        return none;
    }

    sc_dt::uint64 raw = unsigned_value(bits);
    sc_dt::int64 value;
    if (width == 64 || !bits.msb()) {
        value = static_cast<sc_dt::int64>(raw);
    } else {
        // -b0*2^(w-1) + rest
        sc_dt::uint64 rest = raw & ((static_cast<sc_dt::uint64>(1) << (width - 1)) - 1);
        value = static_cast<sc_dt::int64>(rest) - (static_cast<sc_dt::int64>(1) << (width - 1));
    }

    twos_decoding_t dec = { value, raw };
    return dec;
}

sc_dt::uint64 unsigned_value(const bit_vector& bits) {
    return bits.to_uint64();
}

static bool check_extension(const bit_vector& bits, int from_width, int to_width, const char* what) {
    if (!require_width(bits, from_width, what)) return false;
    if (to_width < from_width) {
        std::ostringstream msg;
        msg << what << ": cannot extend " << from_width << " bits to " << to_width;
        SC_REPORT_ERROR(RV32ARITH_MSG_WIDTH, msg.str().c_str());
        return false;
    }
    return true;
}

bit_vector sign_extend(const bit_vector& bits, int from_width, int to_width) {
    if (!check_extension(bits, from_width, to_width, "sign_extend")) return bits;
    if (to_width == from_width) return bits;
    return concat(bit_vector::filled(to_width - from_width, bits.msb()), bits);
}

bit_vector zero_extend(const bit_vector& bits, int from_width, int to_width) {
    if (!check_extension(bits, from_width, to_width, "zero_extend")) return bits;
    if (to_width == from_width) return bits;
    return concat(bit_vector(to_width - from_width), bits);
}

bit_vector truncate(const bit_vector& bits, int to_width) {
    if (to_width <= 0 || to_width > bits.width()) {
        std::ostringstream msg;
        msg << "truncate: cannot keep " << to_width << " of " << bits.width() << " bits";
        SC_REPORT_ERROR(RV32ARITH_MSG_WIDTH, msg.str().c_str());
        return bits;
    }
    return slice(bits, bits.width() - to_width, to_width);
}
