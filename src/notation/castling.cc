#include "castling.hh"

namespace notation {

BackRankScan::BackRankScan(const Board& b, Colour c, CastlingSide side)
    : board_(b), colour_(c), file_(side == KING_SIDE ? 7 : 0), step_(side == KING_SIDE ? -1 : 1)
{
}

std::optional<Square> BackRankScan::next_rook()
{
    while (state_ == SCANNING) {
        if (file_ < 0 || file_ > 7) {
            state_ = DONE;
            break;
        }

        const Square sq = make_square(file_, back_rank(colour_));
        file_ += step_;

        auto p = board_.piece_at(sq);
        if (!p || p->colour != colour_)
            continue;
        if (p->role == KING) {
            state_ = KING_FOUND;
            break;
        }
        if (p->role == ROOK)
            return sq;
    }
    return std::nullopt;
}

Bitboard rooks_outside_king(const Board& b, Colour c, CastlingSide side)
{
    Bitboard rooks = 0;
    BackRankScan scan(b, c, side);
    while (auto sq = scan.next_rook())
        rooks |= square_bb(*sq);
    return rooks;
}

std::optional<Square> castling_rook_on_file(const Board& b, Colour c, int f)
{
    const Square sq = make_square(f, back_rank(c));
    auto p = b.piece_at(sq);
    if (p && p->colour == c && p->role == ROOK)
        return sq;
    return std::nullopt;
}

} // namespace notation
