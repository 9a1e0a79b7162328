#include "setup.hh"

namespace notation {

Setup Setup::startpos()
{
    Setup s{};
    s.board = Board::startpos();
    s.castling_rights = square_bb(A1) | square_bb(H1) | square_bb(A8) | square_bb(H8);
    return s;
}

Setup Setup::empty()
{
    return Setup{};
}

bool Setup::operator==(const Setup& o) const
{
    return board == o.board && pockets == o.pockets && turn == o.turn && castling_rights == o.castling_rights &&
           ep_square == o.ep_square && remaining_checks == o.remaining_checks && halfmoves == o.halfmoves &&
           fullmoves == o.fullmoves;
}

} // namespace notation
