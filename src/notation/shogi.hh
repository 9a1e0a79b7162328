#pragma once
#include <optional>
#include <string>
#include <string_view>

// 9x9 drop-variant vocabulary. Squares are numbered file + 9 * rank, where
// file index 0 is named '9' and rank index 0 is named 'i', so "9i" is square
// 0 and "1a" is square 80. Kept apart from the 8x8 names on purpose.
namespace notation::shogi {

using Square = int;

constexpr int FILE_NB = 9;
constexpr int RANK_NB = 9;
constexpr Square SQUARE_NB = FILE_NB * RANK_NB;

enum Role {
    PAWN,
    LANCE,
    KNIGHT,
    SILVER,
    GOLD,
    BISHOP,
    ROOK,
    KING,

    // promoted
    TOKIN,
    PROMOTED_LANCE,
    PROMOTED_KNIGHT,
    PROMOTED_SILVER,
    HORSE,
    DRAGON
};

constexpr int square_file(Square s)
{
    return s % FILE_NB;
}
constexpr int square_rank(Square s)
{
    return s / FILE_NB;
}

std::optional<Square> parse_square(std::string_view str);
std::string make_square(Square s);

// nullopt for roles without a promoted form (gold, king, promoted roles)
std::optional<Role> promote(Role r);

// the role a piece reverts to when captured; nullopt for the king
std::optional<Role> unpromote(Role r);

// roles that may sit in a pocket and be dropped
bool is_pocket_role(Role r);

// lowercase, with a '+' prefix for promoted roles ("p", "+p", ...)
std::string role_to_string(Role r);

// inverse of role_to_string, either case
std::optional<Role> char_to_role(std::string_view str);

} // namespace notation::shogi
