#include <unistd.h>
#include <filesystem>
#include "catalog.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"

using namespace std;
using namespace grader;
using namespace nlohmann;
namespace fs = std::filesystem;

class CatalogTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("grader-catalog-" + to_string(getpid()));
        reset_directory(dir);
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    static json problem(const string &id, double time_limit = 1) {
        return {{"id", id}, {"description", "desc"}, {"difficulty", "easy"}, {"time_limit_seconds", time_limit}};
    }

    static catalog parse(const json &j) {
        return catalog::parse(j, checker_registry::builtin());
    }
};

TEST_F(CatalogTest, ParseTest) {
    json j = {{"problems", json::array({problem("sum_pairs", 2), problem("max_subarray")})}};
    j["problems"][1]["checker"] = "unordered";
    j["problems"][1]["memory_limit_mb"] = 64;

    catalog c = parse(j);
    ASSERT_EQ(c.problems().size(), 2);
    EXPECT_TRUE(c.contains("sum_pairs"));
    EXPECT_FALSE(c.contains("nonexistent"));

    const problem_spec &spec = c.find("sum_pairs");
    EXPECT_EQ(spec.time_limit_seconds, 2);
    EXPECT_EQ(spec.memory_limit_mb, 256);
    EXPECT_EQ(spec.checker, "");
    EXPECT_EQ(c.find("max_subarray").checker, "unordered");
    EXPECT_EQ(c.find("max_subarray").memory_limit_mb, 64);

    json serialized = spec;
    EXPECT_JSON_EQ(serialized, json({{"id", "sum_pairs"},
                                     {"description", "desc"},
                                     {"difficulty", "easy"},
                                     {"time_limit_seconds", 2.0},
                                     {"memory_limit_mb", 256},
                                     {"checker", "exact"}}));
}

TEST_F(CatalogTest, UnknownProblemTest) {
    catalog c = parse({{"problems", json::array({problem("sum_pairs")})}});
    EXPECT_THROW(c.find("nonexistent"), catalog_error);
}

TEST_F(CatalogTest, DuplicateIdTest) {
    EXPECT_THROW(parse({{"problems", json::array({problem("a"), problem("b"), problem("a")})}}), catalog_error);
}

TEST_F(CatalogTest, InvalidTimeLimitTest) {
    EXPECT_THROW(parse({{"problems", json::array({problem("a", 0)})}}), catalog_error);
    EXPECT_THROW(parse({{"problems", json::array({problem("a", -1)})}}), catalog_error);
}

TEST_F(CatalogTest, InvalidMemoryLimitTest) {
    json p = problem("a");
    p["memory_limit_mb"] = 0;
    EXPECT_THROW(parse({{"problems", json::array({p})}}), catalog_error);
}

TEST_F(CatalogTest, UnsafeIdTest) {
    EXPECT_THROW(parse({{"problems", json::array({problem("")})}}), catalog_error);
    EXPECT_THROW(parse({{"problems", json::array({problem("..")})}}), catalog_error);
    EXPECT_THROW(parse({{"problems", json::array({problem("../etc")})}}), catalog_error);
}

TEST_F(CatalogTest, UnknownCheckerTest) {
    json p = problem("a");
    p["checker"] = "nonexistent";
    EXPECT_THROW(parse({{"problems", json::array({p})}}), catalog_error);
}

TEST_F(CatalogTest, MalformedTest) {
    EXPECT_THROW(parse(json::array()), catalog_error);
    EXPECT_THROW(parse({{"problem", json::array()}}), catalog_error);
    EXPECT_THROW(parse({{"problems", json::array({json{{"id", "a"}}})}}), catalog_error);
    EXPECT_THROW(parse({{"problems", json::array({json{{"id", "a"}, {"time_limit_seconds", "fast"}}})}}), catalog_error);
}

TEST_F(CatalogTest, LoadTest) {
    write_file_content(dir / "catalog.json", json({{"problems", json::array({problem("sum_pairs")})}}).dump());
    catalog c = catalog::load(dir / "catalog.json", checker_registry::builtin());
    EXPECT_TRUE(c.contains("sum_pairs"));

    write_file_content(dir / "broken.json", "{\"problems\": [");
    EXPECT_THROW(catalog::load(dir / "broken.json", checker_registry::builtin()), catalog_error);
    EXPECT_THROW(catalog::load(dir / "nonexistent.json", checker_registry::builtin()), catalog_error);
}

TEST_F(CatalogTest, ListOrdinalFilesTest) {
    for (int i : {10, 2, 1, 3, 4, 5, 6, 7, 8, 9})
        write_file_content(dir / (to_string(i) + ".txt"), to_string(i));

    auto files = list_ordinal_files(dir);
    ASSERT_EQ(files.size(), 10);
    for (int i = 0; i < 10; ++i)
        EXPECT_EQ(files[i].filename().string(), to_string(i + 1) + ".txt");
}

TEST_F(CatalogTest, ListOrdinalFilesGapTest) {
    write_file_content(dir / "1.txt", "1");
    write_file_content(dir / "3.txt", "3");
    EXPECT_THROW(list_ordinal_files(dir), catalog_error);
}

TEST_F(CatalogTest, ListOrdinalFilesStartsFromOneTest) {
    write_file_content(dir / "2.txt", "2");
    EXPECT_THROW(list_ordinal_files(dir), catalog_error);

    fs::remove(dir / "2.txt");
    write_file_content(dir / "0.txt", "0");
    EXPECT_THROW(list_ordinal_files(dir), catalog_error);
}

TEST_F(CatalogTest, ListOrdinalFilesUnexpectedFileTest) {
    write_file_content(dir / "1.txt", "1");
    write_file_content(dir / "notes.md", "");
    EXPECT_THROW(list_ordinal_files(dir), catalog_error);
}

TEST_F(CatalogTest, ListOrdinalFilesEmptyTest) {
    EXPECT_THROW(list_ordinal_files(dir), catalog_error);
    EXPECT_THROW(list_ordinal_files(dir / "nonexistent"), catalog_error);
}
