#include "usi.hh"

#include <cctype>

namespace notation::shogi {

std::optional<Move> parse_usi(std::string_view str)
{
    if (str.size() == 4 && str[1] == '*') {
        auto role = char_to_role(str.substr(0, 1));
        auto to = parse_square(str.substr(2));
        if (!role || !is_pocket_role(*role) || !to)
            return std::nullopt;
        return Move{DropMove{*role, *to}};
    }

    if (str.size() != 4 && str.size() != 5)
        return std::nullopt;
    if (str.size() == 5 && str[4] != '+')
        return std::nullopt;

    auto from = parse_square(str.substr(0, 2));
    auto to = parse_square(str.substr(2, 2));
    if (!from || !to)
        return std::nullopt;

    return Move{NormalMove{*from, *to, str.size() == 5}};
}

std::string make_usi(const Move& m)
{
    if (auto drop = std::get_if<DropMove>(&m)) {
        std::string s = role_to_string(drop->role);
        for (char& c : s)
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return s + '*' + make_square(drop->to);
    }

    const auto& mv = std::get<NormalMove>(m);
    std::string s = make_square(mv.from) + make_square(mv.to);
    if (mv.promotion)
        s += '+';
    return s;
}

} // namespace notation::shogi
