#include "fen.hh"
#include "castling.hh"
#include "square.hh"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace notation {

static std::vector<std::string_view> split_fields(std::string_view s, char sep)
{
    std::vector<std::string_view> out;
    std::size_t start = 0;
    for (;;) {
        auto pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            out.push_back(s.substr(start));
            return out;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

// index of the n-th (1-based) occurrence of ch, npos if there are fewer
static std::size_t nth_index_of(std::string_view s, char ch, int n)
{
    std::size_t pos = std::string_view::npos;
    std::size_t from = 0;
    while (n-- > 0) {
        pos = s.find(ch, from);
        if (pos == std::string_view::npos)
            break;
        from = pos + 1;
    }
    return pos;
}

// 1 to 4 decimal digits
static std::optional<int> parse_small_uint(std::string_view s)
{
    if (s.empty() || s.size() > 4)
        return std::nullopt;

    int v = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
        v = v * 10 + (c - '0');
    }
    return v;
}

const char* fen_error_string(FenError e)
{
    switch (e) {
    case FEN_OK:
        return "ok";
    case FEN_BAD_BOARD:
        return "invalid board";
    case FEN_BAD_POCKETS:
        return "invalid pockets";
    case FEN_BAD_TURN:
        return "invalid turn";
    case FEN_BAD_CASTLING:
        return "invalid castling rights";
    case FEN_BAD_EP:
        return "invalid en passant square";
    case FEN_BAD_CHECKS:
        return "invalid remaining checks";
    case FEN_BAD_HALFMOVES:
        return "invalid halfmove clock";
    case FEN_BAD_FULLMOVES:
        return "invalid fullmove number";
    case FEN_TRAILING_FIELDS:
        return "too many fields";
    default:
        return "unknown error";
    }
}

FenResult<Board> parse_board_fen(std::string_view board_part)
{
    Board b{};
    int r = 7, f = 0;

    for (std::size_t i = 0; i < board_part.size(); ++i) {
        const char c = board_part[i];

        // end of a complete rank
        if (c == '/' && f == 8) {
            --r;
            f = 0;
            continue;
        }

        if (c >= '1' && c <= '8') {
            f += c - '0';
            if (f > 8)
                return FenResult<Board>::fail(FEN_BAD_BOARD);
            continue;
        }

        auto p = char_to_piece(c);
        if (!p || f > 7 || r < 0)
            return FenResult<Board>::fail(FEN_BAD_BOARD);

        if (i + 1 < board_part.size() && board_part[i + 1] == '~') {
            p->promoted = true;
            ++i;
        }

        b.put(make_square(f, r), *p);
        ++f;
    }

    if (r != 0 || f != 8)
        return FenResult<Board>::fail(FEN_BAD_BOARD);
    return FenResult<Board>::ok(b);
}

FenResult<Pockets> parse_pockets(std::string_view pocket_part)
{
    Pockets pockets{empty_material(), empty_material()};
    for (char c : pocket_part) {
        auto p = char_to_piece(c);
        if (!p)
            return FenResult<Pockets>::fail(FEN_BAD_POCKETS);
        ++pockets[p->colour][p->role];
    }
    return FenResult<Pockets>::ok(pockets);
}

FenResult<Bitboard> parse_castling_fen(const Board& board, std::string_view castling_part)
{
    if (castling_part == "-")
        return FenResult<Bitboard>::ok(0);

    Bitboard rights = 0;
    for (char c : castling_part) {
        const Colour colour = std::islower(static_cast<unsigned char>(c)) ? BLACK : WHITE;
        const char lc = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        if (lc != 'k' && lc != 'q' && (lc < 'a' || lc > 'h'))
            return FenResult<Bitboard>::fail(FEN_BAD_CASTLING);

        // rights need the own king on its back rank
        if (!(board.pieces[colour][KING] & RankBB[back_rank(colour)]))
            return FenResult<Bitboard>::fail(FEN_BAD_CASTLING);

        if (lc == 'k') {
            rights |= rooks_outside_king(board, colour, KING_SIDE);
        } else if (lc == 'q') {
            rights |= rooks_outside_king(board, colour, QUEEN_SIDE);
        } else {
            // an explicit file must name an own rook on the back rank
            auto sq = castling_rook_on_file(board, colour, lc - 'a');
            if (!sq)
                return FenResult<Bitboard>::fail(FEN_BAD_CASTLING);
            rights |= square_bb(*sq);
        }
    }
    return FenResult<Bitboard>::ok(rights);
}

FenResult<RemainingChecks> parse_remaining_checks(std::string_view part)
{
    // "+W+B" counts checks already given, "W+B" checks still remaining
    const bool given = !part.empty() && part.front() == '+';
    if (given)
        part.remove_prefix(1);

    auto parts = split_fields(part, '+');
    if (parts.size() != 2)
        return FenResult<RemainingChecks>::fail(FEN_BAD_CHECKS);

    auto white = parse_small_uint(parts[0]);
    auto black = parse_small_uint(parts[1]);
    if (!white || *white > 3 || !black || *black > 3)
        return FenResult<RemainingChecks>::fail(FEN_BAD_CHECKS);

    if (given)
        return FenResult<RemainingChecks>::ok({3 - *white, 3 - *black});
    return FenResult<RemainingChecks>::ok({*white, *black});
}

FenResult<Setup> parse_fen(std::string_view fen)
{
    using Result = FenResult<Setup>;

    auto parts = split_fields(fen, ' ');
    std::size_t next = 0;
    auto take = [&]() -> std::optional<std::string_view> {
        if (next >= parts.size())
            return std::nullopt;
        return parts[next++];
    };

    Setup setup{};

    // board, with an optional pocket after the 8th '/' or inside [...]
    std::string_view board_part = *take();
    std::optional<std::string_view> pocket_part;
    if (!board_part.empty() && board_part.back() == ']') {
        auto open = board_part.find('[');
        if (open == std::string_view::npos)
            return Result::fail(FEN_BAD_BOARD);
        pocket_part = board_part.substr(open + 1, board_part.size() - open - 2);
        board_part = board_part.substr(0, open);
    } else {
        auto slash = nth_index_of(board_part, '/', 8);
        if (slash != std::string_view::npos) {
            pocket_part = board_part.substr(slash + 1);
            board_part = board_part.substr(0, slash);
        }
    }

    auto board = parse_board_fen(board_part);
    if (!board)
        return Result::fail(board.error);
    setup.board = *board;

    if (pocket_part) {
        auto pockets = parse_pockets(*pocket_part);
        if (!pockets)
            return Result::fail(pockets.error);
        setup.pockets = *pockets;
    }

    auto turn_part = take();
    if (!turn_part || *turn_part == "w")
        setup.turn = WHITE;
    else if (!turn_part->empty())
        setup.turn = BLACK;
    else
        return Result::fail(FEN_BAD_TURN);

    if (auto castling_part = take()) {
        auto rights = parse_castling_fen(setup.board, *castling_part);
        if (!rights)
            return Result::fail(rights.error);
        setup.castling_rights = *rights;
    }

    auto ep_part = take();
    if (ep_part && *ep_part != "-") {
        auto ep = parse_square(*ep_part);
        if (!ep)
            return Result::fail(FEN_BAD_EP);
        setup.ep_square = *ep;
    }

    // three-check counters may come before the move counters
    auto halfmove_part = take();
    if (halfmove_part && halfmove_part->find('+') != std::string_view::npos) {
        auto checks = parse_remaining_checks(*halfmove_part);
        if (!checks)
            return Result::fail(checks.error);
        setup.remaining_checks = *checks;
        halfmove_part = take();
    }

    if (halfmove_part) {
        auto halfmoves = parse_small_uint(*halfmove_part);
        if (!halfmoves)
            return Result::fail(FEN_BAD_HALFMOVES);
        setup.halfmoves = *halfmoves;
    }

    if (auto fullmove_part = take()) {
        auto fullmoves = parse_small_uint(*fullmove_part);
        if (!fullmoves)
            return Result::fail(FEN_BAD_FULLMOVES);
        setup.fullmoves = std::max(1, *fullmoves);
    }

    // ... or after them
    if (auto checks_part = take()) {
        if (setup.remaining_checks)
            return Result::fail(FEN_BAD_CHECKS);
        auto checks = parse_remaining_checks(*checks_part);
        if (!checks)
            return Result::fail(checks.error);
        setup.remaining_checks = *checks;
    }

    if (next < parts.size())
        return Result::fail(FEN_TRAILING_FIELDS);

    return Result::ok(setup);
}

Setup from_fen(const std::string& fen)
{
    auto setup = parse_fen(fen);
    if (!setup)
        throw std::invalid_argument(std::string("Invalid FEN (") + fen_error_string(setup.error) + "): " + fen);
    return *setup;
}

std::string make_board_fen(const Board& board, const FenOptions& opts)
{
    std::string out;
    for (int r = 7; r >= 0; --r) {
        int empty = 0;
        for (int f = 0; f < 8; ++f) {
            auto p = board.piece_at(make_square(f, r));
            if (!p) {
                ++empty;
                continue;
            }
            if (empty) {
                out += char('0' + empty);
                empty = 0;
            }
            out += piece_to_char(*p);
            if (opts.promoted && p->promoted)
                out += '~';
        }
        if (empty)
            out += char('0' + empty);
        if (r)
            out += '/';
    }
    return out;
}

std::string make_pockets(const Pockets& pockets)
{
    std::string out;
    for (int c = WHITE; c <= BLACK; ++c)
        for (int r = PAWN; r <= KING; ++r) {
            const int n = pockets[c][r];
            if (n <= 0)
                continue;
            const Piece p{static_cast<Role>(r), static_cast<Colour>(c), false};
            out.append(static_cast<std::size_t>(n), piece_to_char(p));
        }
    return out;
}

std::string make_castling_fen(const Board& board, Bitboard castling_rights)
{
    std::string out;
    for (Colour c : {WHITE, BLACK}) {
        std::string side;
        bool found_king = false;

        for (CastlingSide s : {KING_SIDE, QUEEN_SIDE}) {
            // k/q only when it grants exactly the rooks the parser would collect
            const Bitboard outside = rooks_outside_king(board, c, s);
            const Bitboard granted = outside & castling_rights;

            BackRankScan scan(board, c, s);
            while (auto sq = scan.next_rook())
                if (granted != outside && (granted & square_bb(*sq)))
                    side += char('a' + file(*sq));
            if (scan.state() == BackRankScan::KING_FOUND)
                found_king = true;

            if (granted && granted == outside)
                side += s == KING_SIDE ? 'k' : 'q';
        }

        if (!found_king)
            continue;

        for (char ch : side)
            out += c == WHITE ? static_cast<char>(std::toupper(static_cast<unsigned char>(ch))) : ch;
    }
    return out.empty() ? "-" : out;
}

std::string make_fen(const Setup& setup, const FenOptions& opts)
{
    std::string out = make_board_fen(setup.board, opts);
    if (setup.pockets)
        out += "/" + make_pockets(*setup.pockets);

    out += setup.turn == WHITE ? " w " : " b ";
    out += make_castling_fen(setup.board, setup.castling_rights);
    out += ' ';
    out += setup.ep_square ? square_name(*setup.ep_square) : "-";
    out += ' ' + std::to_string(setup.halfmoves) + ' ' + std::to_string(setup.fullmoves);

    if (setup.remaining_checks) {
        const auto& rc = *setup.remaining_checks;
        out += " +" + std::to_string(3 - rc[WHITE]) + '+' + std::to_string(3 - rc[BLACK]);
    }
    return out;
}

} // namespace notation
