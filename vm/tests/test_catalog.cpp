#include <filesystem>

#include <gtest/gtest.h>

#include "catalog.hpp"
#include "exception.hpp"
#include "sqlite_catalog.hpp"
#include "string_util.hpp"

namespace fs = std::filesystem;

static void exercise_catalog(hvctl::catalog_t &catalog) {
  ASSERT_TRUE(catalog.list().empty());
  ASSERT_FALSE(catalog.find("fc").has_value());

  ASSERT_TRUE(catalog.insert({.name = "qemu-1", .type = "qemu",
                              .data = R"({"headless":true})"}));
  ASSERT_TRUE(catalog.insert({.name = "fc", .type = "firecracker", .data = "{}"}));
  ASSERT_FALSE(
      catalog.insert({.name = "fc", .type = "qemu", .data = "{\"other\":1}"}));

  auto fc = catalog.find("fc");
  ASSERT_TRUE(fc.has_value());
  ASSERT_EQ(fc->type, "firecracker");
  ASSERT_EQ(fc->data, "{}");

  auto entries = catalog.list();
  ASSERT_EQ(entries.size(), 2u);
  ASSERT_EQ(entries[0].name, "fc");
  ASSERT_EQ(entries[1].name, "qemu-1");
  ASSERT_EQ(entries[1].data, R"({"headless":true})");

  ASSERT_TRUE(catalog.remove("fc"));
  ASSERT_FALSE(catalog.remove("fc"));
  ASSERT_FALSE(catalog.find("fc").has_value());
  ASSERT_EQ(catalog.list().size(), 1u);
}

TEST(HvctlCatalogTest, MemoryCatalog) {
  hvctl::memory_catalog_t catalog;
  exercise_catalog(catalog);
}

class HvctlSqliteCatalogTest : public ::testing::Test {
protected:
  void SetUp() override {
    path = fs::temp_directory_path() /
           ("hvctl-catalog-" + hvctl::utils::random_hex(8) + ".db");
  }

  void TearDown() override { fs::remove(path); }

  fs::path path;
};

TEST_F(HvctlSqliteCatalogTest, BehavesLikeMemoryCatalog) {
  hvctl::sqlite_catalog_t catalog(path);
  exercise_catalog(catalog);
}

TEST_F(HvctlSqliteCatalogTest, EntriesSurviveReopen) {
  {
    hvctl::sqlite_catalog_t catalog(path);
    ASSERT_TRUE(catalog.insert(
        {.name = "fc", .type = "firecracker", .data = std::string("{}\0x", 4)}));
  }
  hvctl::sqlite_catalog_t catalog(path);
  auto fc = catalog.find("fc");
  ASSERT_TRUE(fc.has_value());
  ASSERT_EQ(fc->data, std::string("{}\0x", 4));
  ASSERT_FALSE(catalog.insert({.name = "fc", .type = "qemu", .data = "{}"}));
}

TEST_F(HvctlSqliteCatalogTest, UnopenablePathThrows) {
  ASSERT_THROW(hvctl::sqlite_catalog_t(fs::path("/nonexistent/dir/x.db")),
               hvctl::exception_t<hvctl::runtime_error>);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
