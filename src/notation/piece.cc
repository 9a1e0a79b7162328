#include "piece.hh"

#include <cctype>

namespace notation {

char role_to_char(Role r)
{
    switch (r) {
    case PAWN:
        return 'p';
    case KNIGHT:
        return 'n';
    case BISHOP:
        return 'b';
    case ROOK:
        return 'r';
    case QUEEN:
        return 'q';
    case KING:
        return 'k';
    default:
        return '?';
    }
}

std::optional<Role> char_to_role(char c)
{
    switch (std::tolower(static_cast<unsigned char>(c))) {
    case 'p':
        return PAWN;
    case 'n':
        return KNIGHT;
    case 'b':
        return BISHOP;
    case 'r':
        return ROOK;
    case 'q':
        return QUEEN;
    case 'k':
        return KING;
    default:
        return std::nullopt;
    }
}

char piece_to_char(const Piece& p)
{
    char ch = role_to_char(p.role);
    return p.colour == WHITE ? static_cast<char>(std::toupper(static_cast<unsigned char>(ch))) : ch;
}

std::optional<Piece> char_to_piece(char c)
{
    auto role = char_to_role(c);
    if (!role)
        return std::nullopt;

    Colour colour = std::isupper(static_cast<unsigned char>(c)) ? WHITE : BLACK;
    return Piece{*role, colour, false};
}

} // namespace notation
