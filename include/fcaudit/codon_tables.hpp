#pragma once

#include <array>
#include <string>
#include <string_view>

namespace fcaudit {

constexpr int NUM_CODONS = 64;

/**
 * Fast inline character operations
 */

inline char fast_upper(char c) {
    return (c >= 'a' && c <= 'z') ? (c - 32) : c;
}

// Convert base to index: U/T=0, C=1, A=2, G=3
inline int base_to_idx(char c) {
    switch (fast_upper(c)) {
        case 'U': case 'T': return 0;
        case 'C': return 1;
        case 'A': return 2;
        case 'G': return 3;
        default: return -1;
    }
}

// Convert codon to array index (0-63), -1 if not a codon symbol.
// Index = base1*16 + base2*4 + base3, so UUU=0, UUC=1, ... GGG=63
inline int codon_to_idx(char c1, char c2, char c3) {
    int i1 = base_to_idx(c1);
    int i2 = base_to_idx(c2);
    int i3 = base_to_idx(c3);
    if (i1 < 0 || i2 < 0 || i3 < 0) return -1;
    return i1 * 16 + i2 * 4 + i3;
}

// Accepts DNA (T) or RNA (U) spelling, any case, surrounding blanks trimmed.
int codon_to_idx(std::string_view symbol);

inline bool is_codon_symbol(std::string_view symbol) {
    return codon_to_idx(symbol) >= 0;
}

/**
 * Canonical codon order (RNA alphabet): UUU, UUC, UUA, UUG, UCU, ... GGG
 */
const std::array<std::string, NUM_CODONS>& codon_order();

inline const std::string& codon_name(int idx) {
    return codon_order()[static_cast<size_t>(idx)];
}

} // namespace fcaudit
