#include "shogi.hh"

#include <cctype>

namespace notation::shogi {

static constexpr char FILE_NAMES[FILE_NB + 1] = "987654321";
static constexpr char RANK_NAMES[RANK_NB + 1] = "ihgfedcba";

std::optional<Square> parse_square(std::string_view str)
{
    if (str.size() != 2)
        return std::nullopt;

    const int f = '9' - str[0];
    const int r = 'i' - str[1];
    if (f < 0 || f >= FILE_NB || r < 0 || r >= RANK_NB)
        return std::nullopt;

    return f + FILE_NB * r;
}

std::string make_square(Square s)
{
    if (s < 0 || s >= SQUARE_NB)
        return "??";
    return std::string() + FILE_NAMES[square_file(s)] + RANK_NAMES[square_rank(s)];
}

std::optional<Role> promote(Role r)
{
    switch (r) {
    case PAWN:
        return TOKIN;
    case LANCE:
        return PROMOTED_LANCE;
    case KNIGHT:
        return PROMOTED_KNIGHT;
    case SILVER:
        return PROMOTED_SILVER;
    case BISHOP:
        return HORSE;
    case ROOK:
        return DRAGON;
    default:
        return std::nullopt;
    }
}

std::optional<Role> unpromote(Role r)
{
    switch (r) {
    case PAWN:
    case TOKIN:
        return PAWN;
    case LANCE:
    case PROMOTED_LANCE:
        return LANCE;
    case KNIGHT:
    case PROMOTED_KNIGHT:
        return KNIGHT;
    case SILVER:
    case PROMOTED_SILVER:
        return SILVER;
    case GOLD:
        return GOLD;
    case BISHOP:
    case HORSE:
        return BISHOP;
    case ROOK:
    case DRAGON:
        return ROOK;
    default:
        return std::nullopt;
    }
}

bool is_pocket_role(Role r)
{
    return r >= PAWN && r <= ROOK;
}

std::string role_to_string(Role r)
{
    switch (r) {
    case PAWN:
        return "p";
    case LANCE:
        return "l";
    case KNIGHT:
        return "n";
    case SILVER:
        return "s";
    case GOLD:
        return "g";
    case BISHOP:
        return "b";
    case ROOK:
        return "r";
    case KING:
        return "k";
    case TOKIN:
        return "+p";
    case PROMOTED_LANCE:
        return "+l";
    case PROMOTED_KNIGHT:
        return "+n";
    case PROMOTED_SILVER:
        return "+s";
    case HORSE:
        return "+b";
    case DRAGON:
        return "+r";
    default:
        return "?";
    }
}

static std::optional<Role> letter_to_role(char c)
{
    switch (std::tolower(static_cast<unsigned char>(c))) {
    case 'p':
        return PAWN;
    case 'l':
        return LANCE;
    case 'n':
        return KNIGHT;
    case 's':
        return SILVER;
    case 'g':
        return GOLD;
    case 'b':
        return BISHOP;
    case 'r':
        return ROOK;
    case 'k':
        return KING;
    default:
        return std::nullopt;
    }
}

std::optional<Role> char_to_role(std::string_view str)
{
    if (str.size() == 1)
        return letter_to_role(str[0]);

    if (str.size() == 2 && str[0] == '+') {
        auto base = letter_to_role(str[1]);
        if (!base)
            return std::nullopt;
        return promote(*base);
    }
    return std::nullopt;
}

} // namespace notation::shogi
