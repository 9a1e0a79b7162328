#pragma once
#include "bitboard.hh"
#include "board.hh"
#include "piece.hh"

#include <optional>

namespace notation {

// KING_SIDE scans the back rank h -> a, QUEEN_SIDE a -> h
enum CastlingSide { KING_SIDE, QUEEN_SIDE };

constexpr int back_rank(Colour c)
{
    return c == WHITE ? 0 : 7;
}

// Walks one colour's back rank from a board edge towards its king, yielding
// the own rooks met on the way. The scan ends at the first own king
// (KING_FOUND) or after the last file (DONE). Other pieces are skipped.
class BackRankScan {
public:
    enum State { SCANNING, KING_FOUND, DONE };

    BackRankScan(const Board& b, Colour c, CastlingSide side);

    std::optional<Square> next_rook();

    State state() const
    {
        return state_;
    }

private:
    const Board& board_;
    Colour colour_;
    int file_;
    int step_;
    State state_{SCANNING};
};

// every own rook between the edge of `side` and the own king
Bitboard rooks_outside_king(const Board& b, Colour c, CastlingSide side);

// the back-rank square of file `f` when it holds an own rook
std::optional<Square> castling_rook_on_file(const Board& b, Colour c, int f);

} // namespace notation
