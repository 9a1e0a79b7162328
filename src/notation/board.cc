#include "board.hh"

namespace notation {

Board Board::startpos()
{
    Board b{};

    /* White pieces */
    b.pieces[WHITE][PAWN] = 0x000000000000FF00ULL;
    b.pieces[WHITE][ROOK] = 0x0000000000000081ULL;
    b.pieces[WHITE][KNIGHT] = 0x0000000000000042ULL;
    b.pieces[WHITE][BISHOP] = 0x0000000000000024ULL;
    b.pieces[WHITE][QUEEN] = 0x0000000000000008ULL;
    b.pieces[WHITE][KING] = 0x0000000000000010ULL;

    /* Black pieces */
    b.pieces[BLACK][PAWN] = 0x00FF000000000000ULL;
    b.pieces[BLACK][ROOK] = 0x8100000000000000ULL;
    b.pieces[BLACK][KNIGHT] = 0x4200000000000000ULL;
    b.pieces[BLACK][BISHOP] = 0x2400000000000000ULL;
    b.pieces[BLACK][QUEEN] = 0x0800000000000000ULL;
    b.pieces[BLACK][KING] = 0x1000000000000000ULL;

    return b;
}

std::optional<Piece> Board::piece_at(Square sq) const
{
    const Bitboard mask = square_bb(sq);
    for (int c = WHITE; c <= BLACK; ++c)
        for (int r = PAWN; r <= KING; ++r)
            if (pieces[c][r] & mask)
                return Piece{static_cast<Role>(r), static_cast<Colour>(c), (promoted & mask) != 0};
    return std::nullopt;
}

void Board::put(Square sq, const Piece& p)
{
    remove(sq);
    pieces[p.colour][p.role] |= square_bb(sq);
    if (p.promoted)
        promoted |= square_bb(sq);
}

void Board::remove(Square sq)
{
    const Bitboard keep = ~square_bb(sq);
    for (auto& side : pieces)
        for (auto& bb : side)
            bb &= keep;
    promoted &= keep;
}

bool Board::operator==(const Board& o) const
{
    for (int c = WHITE; c <= BLACK; ++c)
        for (int r = PAWN; r <= KING; ++r)
            if (pieces[c][r] != o.pieces[c][r])
                return false;
    return promoted == o.promoted;
}

} // namespace notation
