#include "bit_vector.h"
#include "arith_config.h"

#include <cctype>

namespace {

static const char HEX_DIGITS[] = "0123456789ABCDEF";

sc_dt::sc_bv_base* alloc_storage(int width) {
    if (width <= 0) {
        report_bad_value("bit_vector width must be positive");
        return new sc_dt::sc_bv_base(1);
    }
    return new sc_dt::sc_bv_base(width);
}

// Write bit `i` (MSB-first) of a storage block still under construction
inline void put_bit(sc_dt::sc_bv_base& raw, int width, int i, bool value) {
    raw[width - 1 - i] = value;
}

inline void full_adder(bool a, bool b, bool cin, bool& sum, bool& cout) {
    bool axb = a ^ b;
    sum  = axb ^ cin;
    cout = (a && b) || (cin && axb);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

bit_vector::bit_vector(int width)
    : m_width(width > 0 ? width : 1), m_bits(alloc_storage(width)) {}

bit_vector::bit_vector(sc_dt::sc_bv_base* owned)
    : m_width(owned->length()), m_bits(owned) {}

bit_vector bit_vector::filled(int width, bool value) {
    sc_dt::sc_bv_base* raw = alloc_storage(width);
    for (int i = 0; i < width; ++i) put_bit(*raw, width, i, value);
    return bit_vector(raw);
}

bit_vector bit_vector::from_uint(sc_dt::uint64 value, int width) {
    if (width > 64) {
        report_bad_value("bit_vector::from_uint supports at most 64 bits");
        return bit_vector(width);
    }
    sc_dt::sc_bv_base* raw = alloc_storage(width);
    for (int k = 0; k < width; ++k) {
        (*raw)[k] = ((value >> k) & 1u) != 0;
    }
    return bit_vector(raw);
}

bit_vector bit_vector::from_string(const std::string& text) {
    std::vector<bool> bits;
    for (std::string::size_type i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '_') continue;
        if (c != '0' && c != '1') {
            report_bad_value("binary text may only contain '0', '1' and '_'");
            return bit_vector(1);
        }
        bits.push_back(c == '1');
    }
    if (bits.empty()) {
        report_bad_value("binary text is empty");
        return bit_vector(1);
    }
    return from_bits(bits);
}

bit_vector bit_vector::from_hex(const std::string& text, int width) {
    std::string digits = text;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.empty()) {
        report_bad_value("hex text is empty");
        return bit_vector(width);
    }

    std::vector<bool> bits;
    for (std::string::size_type i = 0; i < digits.size(); ++i) {
        int v = hex_value(digits[i]);
        if (v < 0) {
            report_bad_value("hex text contains a non-hex digit");
            return bit_vector(width);
        }
        for (int k = 3; k >= 0; --k) bits.push_back(((v >> k) & 1) != 0);
    }

    // Fit to `width`: excess high-order digits must be zero
    int have = static_cast<int>(bits.size());
    std::vector<bool> fitted;
    if (have >= width) {
        for (int i = 0; i < have - width; ++i) {
            if (bits[i]) {
                report_bad_value("hex value does not fit the requested width");
                return bit_vector(width);
            }
        }
        fitted.assign(bits.begin() + (have - width), bits.end());
    } else {
        fitted.assign(width - have, false);
        fitted.insert(fitted.end(), bits.begin(), bits.end());
    }
    return from_bits(fitted);
}

bit_vector bit_vector::from_bits(const std::vector<bool>& msb_first) {
    int width = static_cast<int>(msb_first.size());
    sc_dt::sc_bv_base* raw = alloc_storage(width);
    for (int i = 0; i < width; ++i) put_bit(*raw, width, i, msb_first[i]);
    return bit_vector(raw);
}

bool bit_vector::bit(int i) const {
    if (i < 0 || i >= m_width) {
        report_bad_value("bit_vector index out of range");
        return false;
    }
    return (*m_bits)[m_width - 1 - i].to_bool();
}

bool bit_vector::is_zero() const {
    for (int i = 0; i < m_width; ++i) {
        if (bit(i)) return false;
    }
    return true;
}

bool bit_vector::is_all_ones() const {
    for (int i = 0; i < m_width; ++i) {
        if (!bit(i)) return false;
    }
    return true;
}

sc_dt::uint64 bit_vector::to_uint64() const {
    sc_dt::uint64 value = 0;
    int first = m_width > 64 ? m_width - 64 : 0;
    for (int i = first; i < m_width; ++i) {
        value = (value << 1) | (bit(i) ? 1u : 0u);
    }
    return value;
}

bool bit_vector::operator==(const bit_vector& other) const {
    if (m_width != other.m_width) return false;
    for (int i = 0; i < m_width; ++i) {
        if (bit(i) != other.bit(i)) return false;
    }
    return true;
}

//==============================================================================
//
// Ripple-carry adder: LSB to MSB, one full adder per bit
//
adder_out_t add_with_carry(const bit_vector& a, const bit_vector& b, bool carry_in) {
    if (!require_width(b, a.width(), "add_with_carry operand b")) {
        adder_out_t none = { bit_vector(a.width()), false };
        return none;
    }

    int width = a.width();
    std::vector<bool> sum(width);
    bool carry = carry_in;
    for (int i = width - 1; i >= 0; --i) {
        bool s, c;
        full_adder(a.bit(i), b.bit(i), carry, s, c);
        sum[i] = s;
        carry = c;
    }

    adder_out_t out = { bit_vector::from_bits(sum), carry };
    return out;
}

bit_vector negate(const bit_vector& a) {
    return add_with_carry(invert(a), bit_vector(a.width()), true).sum;
}

bit_vector invert(const bit_vector& a) {
    std::vector<bool> out(a.width());
    for (int i = 0; i < a.width(); ++i) out[i] = !a.bit(i);
    return bit_vector::from_bits(out);
}

bit_vector bitwise_and(const bit_vector& a, const bit_vector& b) {
    if (!require_width(b, a.width(), "bitwise_and operand b")) return bit_vector(a.width());
    std::vector<bool> out(a.width());
    for (int i = 0; i < a.width(); ++i) out[i] = a.bit(i) && b.bit(i);
    return bit_vector::from_bits(out);
}

bit_vector bitwise_or(const bit_vector& a, const bit_vector& b) {
    if (!require_width(b, a.width(), "bitwise_or operand b")) return bit_vector(a.width());
    std::vector<bool> out(a.width());
    for (int i = 0; i < a.width(); ++i) out[i] = a.bit(i) || b.bit(i);
    return bit_vector::from_bits(out);
}

bit_vector bitwise_xor(const bit_vector& a, const bit_vector& b) {
    if (!require_width(b, a.width(), "bitwise_xor operand b")) return bit_vector(a.width());
    std::vector<bool> out(a.width());
    for (int i = 0; i < a.width(); ++i) out[i] = a.bit(i) != b.bit(i);
    return bit_vector::from_bits(out);
}

bit_vector slice(const bit_vector& a, int first, int count) {
    if (first < 0 || count <= 0 || first + count > a.width()) {
        report_bad_value("slice range outside the vector");
        return bit_vector(count > 0 ? count : 1);
    }
    std::vector<bool> out(count);
    for (int i = 0; i < count; ++i) out[i] = a.bit(first + i);
    return bit_vector::from_bits(out);
}

bit_vector concat(const bit_vector& hi, const bit_vector& lo) {
    std::vector<bool> out;
    out.reserve(hi.width() + lo.width());
    for (int i = 0; i < hi.width(); ++i) out.push_back(hi.bit(i));
    for (int i = 0; i < lo.width(); ++i) out.push_back(lo.bit(i));
    return bit_vector::from_bits(out);
}

//==============================================================================
//
// Text formatting
//
std::string format_hex(const bit_vector& a) {
    int width = a.width();
    int pad = (4 - width % 4) % 4;
    std::string out;
    int nibble = 0;
    int filled = 0;
    for (int i = -pad; i < width; ++i) {
        bool b = (i >= 0) ? a.bit(i) : false;
        nibble = (nibble << 1) | (b ? 1 : 0);
        if (++filled == 4) {
            out += HEX_DIGITS[nibble];
            nibble = 0;
            filled = 0;
        }
    }
    return out;
}

std::string format_binary(const bit_vector& a) {
    return a.storage().to_string();
}

std::string format_binary_grouped(const bit_vector& a, int group) {
    std::string flat = format_binary(a);
    if (group <= 0) return flat;

    std::string out;
    int n = static_cast<int>(flat.size());
    for (int i = 0; i < n; ++i) {
        if (i > 0 && (n - i) % group == 0) out += '_';
        out += flat[i];
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, const bit_vector& a) {
    return os << format_hex(a);
}
