#include "square.hh"

namespace notation {

std::optional<Square> parse_square(std::string_view str)
{
    if (str.size() != 2)
        return std::nullopt;

    const int f = str[0] - 'a';
    const int r = str[1] - '1';
    if (f < 0 || f >= 8 || r < 0 || r >= 8)
        return std::nullopt;

    return make_square(f, r);
}

std::string square_name(Square sq)
{
    static constexpr char FILE_NAMES[] = "abcdefgh";
    static constexpr char RANK_NAMES[] = "12345678";

    if (sq < A1 || sq >= SQ_NONE)
        return "??";
    return std::string() + FILE_NAMES[file(sq)] + RANK_NAMES[rank(sq)];
}

} // namespace notation
