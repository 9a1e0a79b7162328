#pragma once
#include <optional>

namespace notation {

enum Colour { WHITE, BLACK };

enum Role { PAWN, KNIGHT, BISHOP, ROOK, QUEEN, KING };

constexpr int ROLE_NB = 6;

struct Piece {
    Role role{PAWN};
    Colour colour{WHITE};
    bool promoted{false}; // written as a trailing '~' in FEN

    bool operator==(const Piece& o) const
    {
        return role == o.role && colour == o.colour && promoted == o.promoted;
    }
    bool operator!=(const Piece& o) const
    {
        return !(*this == o);
    }
};

constexpr Colour opposite(Colour c)
{
    return c == WHITE ? BLACK : WHITE;
}

// lowercase role letter, "pnbrqk"
char role_to_char(Role r);

// accepts either case; nullopt for anything that is not a role letter
std::optional<Role> char_to_role(char c);

// uppercase is white, else black
char piece_to_char(const Piece& p);
std::optional<Piece> char_to_piece(char c);

} // namespace notation
