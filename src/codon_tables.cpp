/**
 * Codon domain tables
 *
 * Encoding: U(T)=0, C=1, A=2, G=3
 * Index = base1*16 + base2*4 + base3
 */

#include "fcaudit/codon_tables.hpp"

namespace fcaudit {

namespace {

inline bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

} // namespace

int codon_to_idx(std::string_view symbol) {
    while (!symbol.empty() && is_blank(symbol.front())) symbol.remove_prefix(1);
    while (!symbol.empty() && is_blank(symbol.back())) symbol.remove_suffix(1);
    if (symbol.size() != 3) return -1;
    return codon_to_idx(symbol[0], symbol[1], symbol[2]);
}

const std::array<std::string, NUM_CODONS>& codon_order() {
    static const std::array<std::string, NUM_CODONS> order = []() {
        static constexpr char BASES[4] = {'U', 'C', 'A', 'G'};
        std::array<std::string, NUM_CODONS> arr{};
        for (int i = 0; i < NUM_CODONS; ++i) {
            arr[static_cast<size_t>(i)] = std::string{BASES[i / 16], BASES[(i / 4) % 4], BASES[i % 4]};
        }
        return arr;
    }();
    return order;
}

} // namespace fcaudit
