// tests/castling_tests.cc
#include <catch2/catch_test_macros.hpp>
#include <string>
#include "notation/castling.hh"
#include "notation/fen.hh"

using namespace notation;

static Bitboard rights_of(const char* fen)
{
    auto setup = parse_fen(fen);
    REQUIRE(setup);
    return setup->castling_rights;
}

TEST_CASE("Standard rights name the corner rooks")
{
    Bitboard rights = rights_of("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    REQUIRE(rights == (square_bb(A1) | square_bb(H1) | square_bb(A8) | square_bb(H8)));

    REQUIRE(rights_of("r3k2r/8/8/8/8/8/8/R3K2R w K - 0 1") == square_bb(H1));
    REQUIRE(rights_of("r3k2r/8/8/8/8/8/8/R3K2R w q - 0 1") == square_bb(A8));
    REQUIRE(rights_of("r3k2r/8/8/8/8/8/8/R3K2R w - - 0 1") == 0);
    REQUIRE(rights_of("r3k2r/8/8/8/8/8/8/R3K2R w  - 0 1") == 0);
}

TEST_CASE("Character order does not matter")
{
    const char* board = "r3k2r/8/8/8/8/8/8/R3K2R";
    Bitboard kq = rights_of((std::string(board) + " w KQ - 0 1").c_str());
    Bitboard qk = rights_of((std::string(board) + " w QK - 0 1").c_str());
    REQUIRE(kq == qk);

    REQUIRE(rights_of("r3k2r/8/8/8/8/8/8/R3K2R w kqKQ - 0 1") ==
            rights_of("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1"));

    auto setup = parse_fen("r3k2r/8/8/8/8/8/8/R3K2R w qQkK - 0 1");
    REQUIRE(setup);
    REQUIRE(make_castling_fen(setup->board, setup->castling_rights) == "KQkq");
}

TEST_CASE("Duplicates collapse")
{
    REQUIRE(rights_of("r3k2r/8/8/8/8/8/8/R3K2R w KKH - 0 1") == square_bb(H1));
}

TEST_CASE("File letters select shifted rooks")
{
    // rooks on b1 and f1 either side of the king on c1
    const char* by_side = "4k3/8/8/8/8/8/8/1RK2R2 w KQ - 0 1";
    const char* by_file = "4k3/8/8/8/8/8/8/1RK2R2 w FB - 0 1";

    REQUIRE(rights_of(by_side) == (square_bb(B1) | square_bb(F1)));
    REQUIRE(rights_of(by_file) == rights_of(by_side));

    auto setup = parse_fen(by_file);
    REQUIRE(make_fen(*setup) == by_side);
}

TEST_CASE("Inner rooks are written by file")
{
    const char* fen = "4k3/8/8/8/8/8/8/4K1RR w G - 0 1";
    REQUIRE(rights_of(fen) == square_bb(G1));

    auto setup = parse_fen(fen);
    REQUIRE(make_fen(*setup) == fen);

    SECTION("A side letter takes every rook outside the king")
    {
        auto both = parse_fen("4k3/8/8/8/8/8/8/4K1RR w K - 0 1");
        REQUIRE(both->castling_rights == (square_bb(G1) | square_bb(H1)));
        REQUIRE(make_castling_fen(both->board, both->castling_rights) == "K");
    }
}

TEST_CASE("Rights granted by file survive a round trip")
{
    const char* fens[] = {
        "4k3/8/8/8/8/8/8/4K1RR w H - 0 1",
        "4k3/8/8/8/8/8/8/RR2K3 w A - 0 1",
        "rr2k1rr/8/8/8/8/8/8/RR2K1RR w HAhb - 0 1",
    };
    for (const char* fen : fens) {
        auto setup = parse_fen(fen);
        REQUIRE(setup);

        auto again = parse_fen(make_fen(*setup));
        REQUIRE(again);
        REQUIRE(again->castling_rights == setup->castling_rights);
    }

    REQUIRE(make_fen(from_fen("4k3/8/8/8/8/8/8/4K1RR w H - 0 1")) == "4k3/8/8/8/8/8/8/4K1RR w H - 0 1");
    REQUIRE(make_fen(from_fen("4k3/8/8/8/8/8/8/RR2K3 w A - 0 1")) == "4k3/8/8/8/8/8/8/RR2K3 w A - 0 1");
}

TEST_CASE("Castling letters need the king on its back rank")
{
    REQUIRE(parse_fen("rb32r/8/8/8/8/8/8/R3K2R w Qkq - 0 1 +1+2").error == FEN_BAD_CASTLING);
    REQUIRE(parse_fen("4k3/8/8/8/8/8/4K3/7R w K - 0 1").error == FEN_BAD_CASTLING);
    REQUIRE(parse_fen("4k3/8/8/8/8/8/4K3/7R w H - 0 1").error == FEN_BAD_CASTLING);

    // the other colour is unaffected
    auto setup = parse_fen("rb32r/8/8/8/8/8/8/R3K2R w KQ - 0 1");
    REQUIRE(setup);
    REQUIRE(make_castling_fen(setup->board, setup->castling_rights) == "KQ");
}

TEST_CASE("The king ends the scan")
{
    // the only rook sits on the queen side
    REQUIRE(rights_of("4k3/8/8/8/8/8/8/R3K3 w K - 0 1") == 0);
    REQUIRE(rights_of("4k3/8/8/8/8/8/8/R3K3 w Q - 0 1") == square_bb(A1));
    REQUIRE(rights_of("4k3/8/8/8/8/8/8/4K3 w KQkq - 0 1") == 0);
}

TEST_CASE("Only own rooks count")
{
    REQUIRE(rights_of("4k3/8/8/8/8/8/8/4K2r w K - 0 1") == 0);
    REQUIRE(rights_of("R3k3/8/8/8/8/8/8/4K3 w q - 0 1") == 0);
}

TEST_CASE("Malformed castling fields")
{
    REQUIRE(parse_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQx - 0 1").error == FEN_BAD_CASTLING);
    REQUIRE(parse_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQ1 - 0 1").error == FEN_BAD_CASTLING);
    REQUIRE(parse_fen("r3k2r/8/8/8/8/8/8/R3K2R w -- - 0 1").error == FEN_BAD_CASTLING);

    // a file letter needs an own rook on that file
    REQUIRE(parse_fen("4k3/8/8/8/8/8/8/4K3 w A - 0 1").error == FEN_BAD_CASTLING);
    REQUIRE(parse_fen("r3k3/8/8/8/8/8/8/4K3 w A - 0 1").error == FEN_BAD_CASTLING);
}

TEST_CASE("Serializer writes nothing for a colour whose king left the back rank")
{
    Board b{};
    b.put(H1, Piece{ROOK, WHITE, false});
    b.put(E2, Piece{KING, WHITE, false});
    REQUIRE(make_castling_fen(b, square_bb(H1)) == "-");
}

TEST_CASE("Back rank scan states")
{
    Board start = Board::startpos();

    BackRankScan king_side(start, WHITE, KING_SIDE);
    REQUIRE(king_side.state() == BackRankScan::SCANNING);
    REQUIRE(king_side.next_rook() == H1);
    REQUIRE_FALSE(king_side.next_rook());
    REQUIRE(king_side.state() == BackRankScan::KING_FOUND);

    BackRankScan queen_side(start, BLACK, QUEEN_SIDE);
    REQUIRE(queen_side.next_rook() == A8);
    REQUIRE_FALSE(queen_side.next_rook());
    REQUIRE(queen_side.state() == BackRankScan::KING_FOUND);

    Board empty{};
    BackRankScan none(empty, WHITE, QUEEN_SIDE);
    REQUIRE_FALSE(none.next_rook());
    REQUIRE(none.state() == BackRankScan::DONE);

    REQUIRE(castling_rook_on_file(start, WHITE, 0) == A1);
    REQUIRE_FALSE(castling_rook_on_file(start, WHITE, 1));
    REQUIRE(rooks_outside_king(start, BLACK, KING_SIDE) == square_bb(H8));
}
