#pragma once
#include "bitboard.hh"
#include "piece.hh"

#include <optional>

namespace notation {

// Sparse piece placement: one bitboard per colour and role. A square with no
// bit set in any of them is empty.
struct Board {
    Bitboard pieces[2][ROLE_NB]{};
    Bitboard promoted{0}; // subset of the occupied squares

    static Board startpos();

    std::optional<Piece> piece_at(Square sq) const;

    // replaces whatever stood on sq
    void put(Square sq, const Piece& p);
    void remove(Square sq);

    bool operator==(const Board& o) const;
    bool operator!=(const Board& o) const
    {
        return !(*this == o);
    }
};

inline Bitboard occupancy(const Board& b, Colour c)
{
    Bitboard occ = 0;
    for (int r = PAWN; r <= KING; ++r)
        occ |= b.pieces[c][r];
    return occ;
}
inline Bitboard occupancy(const Board& b)
{
    return occupancy(b, WHITE) | occupancy(b, BLACK);
}

} // namespace notation
