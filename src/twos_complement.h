#ifndef RV32ARITH_TWOS_COMPLEMENT_H
#define RV32ARITH_TWOS_COMPLEMENT_H

#include "arith_config.h"
#include "bit_vector.h"

#include <string>

struct twos_encoding_t {
    bit_vector  bits;
    std::string bin;
    std::string hex;
    bool        overflow_flag;   // value outside [-2^(w-1), 2^(w-1)-1]; bits hold value mod 2^w
};

struct twos_decoding_t {
    sc_dt::int64  value;          // signed reading
    sc_dt::uint64 unsigned_value; // zero-extended reading
};

twos_encoding_t encode_twos(sc_dt::int64 value, int width = XLEN);
twos_decoding_t decode_twos(const bit_vector& bits);

sc_dt::uint64 unsigned_value(const bit_vector& bits);

bit_vector sign_extend(const bit_vector& bits, int from_width, int to_width);
bit_vector zero_extend(const bit_vector& bits, int from_width, int to_width);

// Keep the low `to_width` bits (bit-select, not a checked narrowing)
bit_vector truncate(const bit_vector& bits, int to_width);

#endif
