#pragma once
#include "bitboard.hh"

#include <optional>
#include <string>
#include <string_view>

namespace notation {

// "a1".."h8"; nullopt unless the text is exactly a file letter and a rank digit
std::optional<Square> parse_square(std::string_view str);

// inverse of parse_square, "??" for anything off the board
std::string square_name(Square sq);

} // namespace notation
