#pragma once
#include "shogi.hh"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace notation::shogi {

// board-to-board move, "7g7f" or "7g7f+"
struct NormalMove {
    Square from{0};
    Square to{0};
    bool promotion{false};

    bool operator==(const NormalMove& o) const
    {
        return from == o.from && to == o.to && promotion == o.promotion;
    }
    bool operator!=(const NormalMove& o) const
    {
        return !(*this == o);
    }
};

// pocket piece placed on an empty square, "P*5e"
struct DropMove {
    Role role{PAWN};
    Square to{0};

    bool operator==(const DropMove& o) const
    {
        return role == o.role && to == o.to;
    }
    bool operator!=(const DropMove& o) const
    {
        return !(*this == o);
    }
};

using Move = std::variant<NormalMove, DropMove>;

inline bool is_drop(const Move& m)
{
    return std::holds_alternative<DropMove>(m);
}

std::optional<Move> parse_usi(std::string_view str);
std::string make_usi(const Move& m);

} // namespace notation::shogi
