#pragma once
#include "bitboard.hh"
#include "board.hh"
#include "piece.hh"

#include <array>
#include <optional>

namespace notation {

// off-board reserve of one colour, indexed by Role
using Material = std::array<int, ROLE_NB>;

// indexed by Colour
using Pockets = std::array<Material, 2>;

// checks each colour may still give before winning, 0..3, indexed by Colour
using RemainingChecks = std::array<int, 2>;

struct Setup {
    Board board{};
    std::optional<Pockets> pockets{};
    Colour turn{WHITE};
    Bitboard castling_rights{0}; // rook squares that keep castling rights
    std::optional<Square> ep_square{};
    std::optional<RemainingChecks> remaining_checks{};
    int halfmoves{0};
    int fullmoves{1};

    static Setup startpos();
    static Setup empty();

    bool operator==(const Setup& o) const;
    bool operator!=(const Setup& o) const
    {
        return !(*this == o);
    }
};

inline Material empty_material()
{
    return Material{};
}

} // namespace notation
