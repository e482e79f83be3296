#include <unistd.h>
#include <filesystem>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "service/answer_store.hpp"

using namespace std;
using namespace grader;
using namespace nlohmann;
namespace fs = std::filesystem;

class AnswerStoreTest : public ::testing::Test {
protected:
    fs::path grading_dir;
    catalog problems;

    void SetUp() override {
        grading_dir = fs::temp_directory_path() / ("grader-grading-" + to_string(getpid()));
        reset_directory(grading_dir);
        problems = catalog::parse({{"problems", json::array({{{"id", "sum_pairs"}, {"time_limit_seconds", 1}, {"checker", "exact"}}})}},
                                  checker_registry::builtin());
    }

    void TearDown() override {
        fs::remove_all(grading_dir);
    }

    void write_case(const string &kind, int index, const string &content) {
        fs::create_directories(grading_dir / kind / "sum_pairs");
        write_file_content(grading_dir / kind / "sum_pairs" / (to_string(index) + ".txt"), content);
    }
};

TEST_F(AnswerStoreTest, LoadTest) {
    write_case("inputs", 1, "1 2\n");
    write_case("outputs", 1, "3\n");
    write_case("inputs", 2, "3 4\n");
    write_case("outputs", 2, "7\n");

    answer_store store = answer_store::load(problems, grading_dir);
    EXPECT_TRUE(store.contains("sum_pairs"));
    EXPECT_FALSE(store.contains("max_subarray"));
    EXPECT_EQ(store.count("sum_pairs"), 2);
    EXPECT_EQ(store.get("sum_pairs", 2).input, "3 4\n");
    EXPECT_EQ(store.get("sum_pairs", 2).expected, "7\n");
    EXPECT_THROW(store.get("sum_pairs", 0), out_of_range);
    EXPECT_THROW(store.get("sum_pairs", 3), out_of_range);
    EXPECT_THROW(store.get("max_subarray", 1), out_of_range);
}

TEST_F(AnswerStoreTest, CountMismatchTest) {
    write_case("inputs", 1, "1 2\n");
    write_case("outputs", 1, "3\n");
    write_case("inputs", 2, "3 4\n");
    EXPECT_THROW(answer_store::load(problems, grading_dir), catalog_error);
}

TEST_F(AnswerStoreTest, MissingOutputsTest) {
    write_case("inputs", 1, "1 2\n");
    EXPECT_THROW(answer_store::load(problems, grading_dir), catalog_error);
}
