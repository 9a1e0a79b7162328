#pragma once
#include "board.hh"
#include "setup.hh"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Extracts and converts between FEN strings and Setup objects. Besides plain
// FEN this understands pockets ("/..." or "[...]" after the board), promoted
// markers ('~'), X-FEN castling files and three-check counters.
namespace notation {

inline constexpr const char* INITIAL_BOARD_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR";
inline constexpr const char* INITIAL_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";
inline constexpr const char* EMPTY_BOARD_FEN = "8/8/8/8/8/8/8/8";
inline constexpr const char* EMPTY_FEN = "8/8/8/8/8/8/8/8 w - - 0 1";

// the field that made a parse fail
enum FenError {
    FEN_OK,
    FEN_BAD_BOARD,
    FEN_BAD_POCKETS,
    FEN_BAD_TURN,
    FEN_BAD_CASTLING,
    FEN_BAD_EP,
    FEN_BAD_CHECKS,
    FEN_BAD_HALFMOVES,
    FEN_BAD_FULLMOVES,
    FEN_TRAILING_FIELDS
};

const char* fen_error_string(FenError e);

// Either a parsed value or the error that stopped the parse, never both.
template <typename T>
struct FenResult {
    std::optional<T> value{};
    FenError error{FEN_OK};

    static FenResult ok(T v)
    {
        return FenResult{std::move(v), FEN_OK};
    }
    static FenResult fail(FenError e)
    {
        return FenResult{std::nullopt, e};
    }

    explicit operator bool() const
    {
        return value.has_value();
    }
    const T& operator*() const
    {
        return *value;
    }
    const T* operator->() const
    {
        return &*value;
    }
};

struct FenOptions {
    bool promoted{false}; // write '~' after promoted pieces
};

FenResult<Board> parse_board_fen(std::string_view board_part);
FenResult<Pockets> parse_pockets(std::string_view pocket_part);
FenResult<Bitboard> parse_castling_fen(const Board& board, std::string_view castling_part);
FenResult<RemainingChecks> parse_remaining_checks(std::string_view part);

FenResult<Setup> parse_fen(std::string_view fen);

// parse_fen for text that is known to be valid; throws std::invalid_argument
Setup from_fen(const std::string& fen);

std::string make_board_fen(const Board& board, const FenOptions& opts = {});
std::string make_pockets(const Pockets& pockets);
std::string make_castling_fen(const Board& board, Bitboard castling_rights);

std::string make_fen(const Setup& setup, const FenOptions& opts = {});

} // namespace notation
