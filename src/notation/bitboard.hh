#pragma once
#include <cstdint>

namespace notation {

using Bitboard = std::uint64_t;

// clang-format off
enum Square : int {
    A1, B1, C1, D1, E1, F1, G1, H1,
    A2, B2, C2, D2, E2, F2, G2, H2,
    A3, B3, C3, D3, E3, F3, G3, H3,
    A4, B4, C4, D4, E4, F4, G4, H4,
    A5, B5, C5, D5, E5, F5, G5, H5,
    A6, B6, C6, D6, E6, F6, G6, H6,
    A7, B7, C7, D7, E7, F7, G7, H7,
    A8, B8, C8, D8, E8, F8, G8, H8,
    SQ_NONE = 64
};
// clang-format on

constexpr int file(Square s)
{
    return s & 7;
}
constexpr int rank(Square s)
{
    return s >> 3;
}
constexpr Square make_square(int file, int rank)
{
    return static_cast<Square>(rank * 8 + file);
}

constexpr Bitboard square_bb(Square s)
{
    return 1ULL << s;
}

inline constexpr Bitboard RankBB[8] = {
    0x00000000000000FFULL, 0x000000000000FF00ULL, 0x0000000000FF0000ULL, 0x00000000FF000000ULL,
    0x000000FF00000000ULL, 0x0000FF0000000000ULL, 0x00FF000000000000ULL, 0xFF00000000000000ULL};

} // namespace notation
