// tests/vocabulary_tests.cc
#include <catch2/catch_test_macros.hpp>
#include "notation/bitboard.hh"
#include "notation/piece.hh"
#include "notation/square.hh"

using namespace notation;

TEST_CASE("Square helpers")
{
    SECTION("File extraction")
    {
        REQUIRE(file(A1) == 0);
        REQUIRE(file(B2) == 1);
        REQUIRE(file(E5) == 4);
        REQUIRE(file(H8) == 7);
    }

    SECTION("Rank extraction")
    {
        REQUIRE(rank(A1) == 0);
        REQUIRE(rank(A2) == 1);
        REQUIRE(rank(E5) == 4);
        REQUIRE(rank(A8) == 7);
    }

    SECTION("make_square inverts file/rank")
    {
        REQUIRE(make_square(4, 3) == E4);
        REQUIRE(make_square(7, 7) == H8);
    }
}

TEST_CASE("Square names")
{
    REQUIRE(parse_square("a1") == A1);
    REQUIRE(parse_square("e4") == E4);
    REQUIRE(parse_square("h8") == H8);
    REQUIRE(square_name(C6) == "c6");
    REQUIRE(square_name(SQ_NONE) == "??");

    // every square survives a name round trip
    for (int s = A1; s <= H8; ++s) {
        auto sq = static_cast<Square>(s);
        REQUIRE(parse_square(square_name(sq)) == sq);
    }
}

TEST_CASE("Square names outside the grammar are rejected")
{
    REQUIRE_FALSE(parse_square(""));
    REQUIRE_FALSE(parse_square("a"));
    REQUIRE_FALSE(parse_square("a10"));
    REQUIRE_FALSE(parse_square("i1"));
    REQUIRE_FALSE(parse_square("a9"));
    REQUIRE_FALSE(parse_square("a0"));
    REQUIRE_FALSE(parse_square("A1"));
    REQUIRE_FALSE(parse_square("1a"));
}

TEST_CASE("Role and piece letters")
{
    REQUIRE(role_to_char(QUEEN) == 'q');
    REQUIRE(char_to_role('N') == KNIGHT);
    REQUIRE(char_to_role('k') == KING);
    REQUIRE_FALSE(char_to_role('x'));
    REQUIRE_FALSE(char_to_role('1'));

    for (int r = PAWN; r <= KING; ++r) {
        auto role = static_cast<Role>(r);
        REQUIRE(char_to_role(role_to_char(role)) == role);
    }

    SECTION("Case encodes colour")
    {
        auto white = char_to_piece('R');
        REQUIRE(white);
        REQUIRE(white->role == ROOK);
        REQUIRE(white->colour == WHITE);
        REQUIRE_FALSE(white->promoted);

        auto black = char_to_piece('p');
        REQUIRE(black);
        REQUIRE(black->role == PAWN);
        REQUIRE(black->colour == BLACK);

        REQUIRE(piece_to_char(Piece{BISHOP, WHITE, false}) == 'B');
        REQUIRE(piece_to_char(Piece{BISHOP, BLACK, true}) == 'b');
        REQUIRE_FALSE(char_to_piece('~'));
    }

    REQUIRE(opposite(WHITE) == BLACK);
    REQUIRE(opposite(BLACK) == WHITE);
}
