#include "unity.h"
#include "core/CavernDigger.hpp"
#include "core/CavernIO.hpp"
#include "core/Config.hpp"
#include "core/PathPlanner.hpp"
#include <cstdio>
#include <random>
#include <string>
#include <vector>

using namespace cavern;

void setUp() {}
void tearDown() {}

static std::vector<std::string> valid_lines() {
    return {
        "cavern 1",
        "; corredor simples",
        "size 3 4",
        "entrance 1 1",
        "target 1 2",
        "# # # #",
        "# a1:0 b2:25 #",
        "",
        "# # # #",
        "edges 1",
        "1 1 1 2 3",
        "end",
    };
}

/** @brief Retorna a linha (1-based) do FormatError, ou -1 se nada foi lançado. */
static int format_error_line(const std::vector<std::string>& lines) {
    try {
        (void)CavernIO::parse(lines);
    } catch (const FormatError& e) {
        return e.line();
    }
    return -1;
}

void test_parse_valid_cavern() {
    Cavern c = CavernIO::parse(valid_lines());
    TEST_ASSERT_EQUAL_INT(3, c.rows());
    TEST_ASSERT_EQUAL_INT(4, c.cols());
    TEST_ASSERT_EQUAL_INT(2, c.nodeCount());
    TEST_ASSERT_TRUE(c.entrance().id() == 0xa1);
    TEST_ASSERT_TRUE(c.target().id() == 0xb2);
    TEST_ASSERT_EQUAL_INT(25, c.target().tile().gold());
    TEST_ASSERT_EQUAL_INT(3, *PathPlanner::minPathLengthToTarget(c, c.entrance()));
}

void test_truncated_row_is_rejected() {
    auto lines = valid_lines();
    lines[6] = "# a1:0 b2:25";
    TEST_ASSERT_EQUAL_INT(7, format_error_line(lines));
}

void test_missing_rows_and_end_are_rejected() {
    auto lines = valid_lines();
    lines.resize(7);
    TEST_ASSERT_TRUE(format_error_line(lines) > 0);
    lines = valid_lines();
    lines.pop_back();
    TEST_ASSERT_TRUE(format_error_line(lines) > 0);
}

void test_bad_tokens_are_rejected() {
    auto lines = valid_lines();
    lines[6] = "# a1 b2:25 #";
    TEST_ASSERT_EQUAL_INT(7, format_error_line(lines));
    lines[6] = "# zz:0 b2:25 #";
    TEST_ASSERT_EQUAL_INT(7, format_error_line(lines));
    lines[6] = "# a1:-4 b2:25 #";
    TEST_ASSERT_EQUAL_INT(7, format_error_line(lines));
    lines[6] = "# a1:0 a1:25 #";
    TEST_ASSERT_EQUAL_INT(7, format_error_line(lines));
    lines = valid_lines();
    lines[0] = "cavern 2";
    TEST_ASSERT_EQUAL_INT(1, format_error_line(lines));
}

void test_oversized_dimensions_are_rejected() {
    // cabeçalho sozinho: a grade não pode ser alocada antes da validação
    TEST_ASSERT_EQUAL_INT(2, format_error_line({"cavern 1", "size 2000000 2000", "entrance 1 1", "target 1 2"}));
    auto lines = valid_lines();
    lines[2] = "size " + std::to_string(MAX_ROWS + 1) + " 4";
    TEST_ASSERT_EQUAL_INT(3, format_error_line(lines));
    lines[2] = "size 3 " + std::to_string(MAX_COLS + 1);
    TEST_ASSERT_EQUAL_INT(3, format_error_line(lines));
}

void test_bad_edges_are_rejected() {
    auto lines = valid_lines();
    lines[10] = "1 1 0 1 3";   // extremo em parede
    TEST_ASSERT_EQUAL_INT(11, format_error_line(lines));
    lines[10] = "1 1 1 2 0";   // comprimento fora da faixa
    TEST_ASSERT_EQUAL_INT(11, format_error_line(lines));
    lines[10] = "1 1 1 2 16";
    TEST_ASSERT_EQUAL_INT(11, format_error_line(lines));
    lines[10] = "1 1 1 1 2";   // laço sobre o próprio ladrilho
    TEST_ASSERT_EQUAL_INT(11, format_error_line(lines));
}

void test_unreachable_target_and_trailing_content() {
    auto lines = valid_lines();
    lines[9] = "edges 0";
    lines.erase(lines.begin() + 10);
    TEST_ASSERT_EQUAL_INT(0, format_error_line(lines));

    lines = valid_lines();
    lines.push_back("extra");
    TEST_ASSERT_EQUAL_INT(13, format_error_line(lines));

    lines = valid_lines();
    lines[4] = "target 0 0";
    TEST_ASSERT_EQUAL_INT(5, format_error_line(lines));
}

void test_file_round_trip_preserves_generated_cavern() {
    std::mt19937_64 rng(2024);
    Cavern c = CavernDigger::dig(10, 16, rng);
    const std::string path = "test_cavern_io_roundtrip.cav";
    TEST_ASSERT_TRUE(CavernIO::saveFile(path, c));
    Cavern back = CavernIO::loadFile(path);
    std::remove(path.c_str());
    TEST_ASSERT_EQUAL_INT(c.nodeCount(), back.nodeCount());
    TEST_ASSERT_EQUAL_INT((int)c.edges().size(), (int)back.edges().size());
    TEST_ASSERT_TRUE(c.entrance().id() == back.entrance().id());
    TEST_ASSERT_TRUE(c.target().id() == back.target().id());
    TEST_ASSERT_EQUAL_INT(*PathPlanner::minPathLengthToTarget(c, c.entrance()),
                          *PathPlanner::minPathLengthToTarget(back, back.entrance()));
}

void test_missing_file_raises_runtime_error() {
    bool io_error = false;
    bool format_error = false;
    try {
        (void)CavernIO::loadFile("does/not/exist.cav");
    } catch (const FormatError&) {
        format_error = true;
    } catch (const std::runtime_error&) {
        io_error = true;
    }
    TEST_ASSERT_TRUE(io_error);
    TEST_ASSERT_FALSE(format_error);
}

int main(int argc, char** argv) {
    (void)argc; (void)argv;
    UNITY_BEGIN();
    RUN_TEST(test_parse_valid_cavern);
    RUN_TEST(test_truncated_row_is_rejected);
    RUN_TEST(test_missing_rows_and_end_are_rejected);
    RUN_TEST(test_bad_tokens_are_rejected);
    RUN_TEST(test_oversized_dimensions_are_rejected);
    RUN_TEST(test_bad_edges_are_rejected);
    RUN_TEST(test_unreachable_target_and_trailing_content);
    RUN_TEST(test_file_round_trip_preserves_generated_cavern);
    RUN_TEST(test_missing_file_raises_runtime_error);
    return UNITY_END();
}
