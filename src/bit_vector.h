#ifndef RV32ARITH_BIT_VECTOR_H
#define RV32ARITH_BIT_VECTOR_H

#include <systemc.h>
#include <memory>
#include <string>
#include <vector>

//==============================================================================
//
// bit_vector: fixed-width, immutable bit container.
//
// Index 0 is the most significant bit. Storage is a SystemC sc_bv_base whose
// own indexing is LSB-first; the mapping is kept inside this class. Copies
// share the underlying storage, every operation returns a new vector.
//
class bit_vector {
public:
    explicit bit_vector(int width);

    static bit_vector filled(int width, bool value);
    static bit_vector from_uint(sc_dt::uint64 value, int width);
    static bit_vector from_string(const std::string& text);
    static bit_vector from_hex(const std::string& text, int width);
    static bit_vector from_bits(const std::vector<bool>& msb_first);

    int  width() const { return m_width; }
    bool bit(int i) const;          // i = 0 is the MSB
    bool msb() const { return bit(0); }
    bool lsb() const { return bit(m_width - 1); }

    bool is_zero() const;
    bool is_all_ones() const;

    // Low 64 bits as an unsigned value
    sc_dt::uint64 to_uint64() const;

    const sc_dt::sc_bv_base& storage() const { return *m_bits; }

    bool operator==(const bit_vector& other) const;
    bool operator!=(const bit_vector& other) const { return !(*this == other); }

private:
    explicit bit_vector(sc_dt::sc_bv_base* owned);

    int m_width;
    std::shared_ptr<const sc_dt::sc_bv_base> m_bits;
};

// ---------------- Ripple-carry adder ----------------
struct adder_out_t {
    bit_vector sum;
    bool       carry_out;
};

adder_out_t add_with_carry(const bit_vector& a, const bit_vector& b, bool carry_in);

// Two's-complement negation: invert(a) + 1 through add_with_carry
bit_vector negate(const bit_vector& a);

// ---------------- Structural primitives ----------------
bit_vector invert(const bit_vector& a);
bit_vector bitwise_and(const bit_vector& a, const bit_vector& b);
bit_vector bitwise_or(const bit_vector& a, const bit_vector& b);
bit_vector bitwise_xor(const bit_vector& a, const bit_vector& b);

// `count` bits starting at MSB-first index `first`
bit_vector slice(const bit_vector& a, int first, int count);
bit_vector concat(const bit_vector& hi, const bit_vector& lo);

// ---------------- Formatting ----------------
std::string format_hex(const bit_vector& a);
std::string format_binary(const bit_vector& a);
std::string format_binary_grouped(const bit_vector& a, int group = 4);

std::ostream& operator<<(std::ostream& os, const bit_vector& a);

#endif
