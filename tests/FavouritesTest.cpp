#include <filesystem> // std::filesystem::{path, temp_directory_path, remove_all}
#include <fstream>    // std::{ifstream, ofstream}
#include <iterator>   // std::istreambuf_iterator

#include <Nimbus/Core/Favourites.hpp>
#include <Nimbus/Services/Weather.hpp>

#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Types.hpp>

#include "gtest/gtest.h"

namespace fs = std::filesystem;

using namespace nimbus::utils::types;
using nimbus::core::FavouritesStore;
using nimbus::services::weather::Location;
using enum nimbus::utils::error::NimbusErrorCode;

class FavouritesTest : public testing::Test {
 protected:
  fs::path m_dir;
  fs::path m_file;

  fn SetUp() -> void override {
    m_dir  = fs::temp_directory_path() / ("nimbus_favourites_" + String(testing::UnitTest::GetInstance()->current_test_info()->name()));
    m_file = m_dir / "favourites.json";

    fs::remove_all(m_dir);
    fs::create_directories(m_dir);
  }

  fn TearDown() -> void override {
    std::error_code errc;
    fs::remove_all(m_dir, errc);
  }

  static fn London() -> Location {
    return { .city = "London", .country = "GB", .coords = { .lat = 51.5073, .lon = -0.1276 } };
  }

  static fn Paris() -> Location {
    return { .city = "Paris", .country = "FR", .coords = { .lat = 48.8588, .lon = 2.3200 } };
  }
};

TEST_F(FavouritesTest, MissingFileLoadsAsEmpty) {
  FavouritesStore store(m_file);

  ASSERT_TRUE(store.load());
  EXPECT_TRUE(store.empty());
}

TEST_F(FavouritesTest, AddRejectsDuplicateIgnoringCase) {
  FavouritesStore store(m_file);

  ASSERT_TRUE(store.add(London()));

  Location shouted = London();
  shouted.city     = "LONDON";

  const Result<> second = store.add(shouted);

  ASSERT_FALSE(second);
  EXPECT_EQ(second.error().code, DuplicateFavourite);
  EXPECT_EQ(store.size(), 1);
}

TEST_F(FavouritesTest, RemoveAbsentCityIsNotFoundAndLeavesListUnchanged) {
  FavouritesStore store(m_file);

  ASSERT_TRUE(store.add(London()));

  const Result<Location> removed = store.remove("paris");

  ASSERT_FALSE(removed);
  EXPECT_EQ(removed.error().code, NotFound);
  ASSERT_EQ(store.size(), 1);
  EXPECT_EQ(store.entries().front(), London());
}

TEST_F(FavouritesTest, RemoveMatchesIgnoringCaseAndKeepsOrder) {
  FavouritesStore store(m_file);

  ASSERT_TRUE(store.add(London()));
  ASSERT_TRUE(store.add(Paris()));

  const Result<Location> removed = store.remove("lOnDoN");

  ASSERT_TRUE(removed);
  EXPECT_EQ(*removed, London());
  EXPECT_EQ(store.entries(), Vec<Location> { Paris() });
}

TEST_F(FavouritesTest, SaveThenLoadRestoresSameList) {
  {
    FavouritesStore store(m_file);
    ASSERT_TRUE(store.add(London()));
    ASSERT_TRUE(store.add(Paris()));
    ASSERT_TRUE(store.save());
  }

  FavouritesStore reloaded(m_file);

  ASSERT_TRUE(reloaded.load());
  EXPECT_EQ(reloaded.entries(), (Vec<Location> { London(), Paris() }));
  EXPECT_FALSE(fs::exists(fs::path(m_file.string() + ".tmp")));
}

TEST_F(FavouritesTest, SaveIsIdempotent) {
  FavouritesStore store(m_file);

  ASSERT_TRUE(store.add(Paris()));
  ASSERT_TRUE(store.save());

  std::ifstream firstFile(m_file);
  const String  first((std::istreambuf_iterator<char>(firstFile)), std::istreambuf_iterator<char>());
  firstFile.close();

  ASSERT_TRUE(store.save());

  std::ifstream secondFile(m_file);
  const String  second((std::istreambuf_iterator<char>(secondFile)), std::istreambuf_iterator<char>());

  EXPECT_EQ(first, second);
}

TEST_F(FavouritesTest, CorruptFileIsParseError) {
  {
    std::ofstream out(m_file);
    out << "{\"favourites\": [ {\"city\": ";
  }

  FavouritesStore store(m_file);

  const Result<> loaded = store.load();

  ASSERT_FALSE(loaded);
  EXPECT_EQ(loaded.error().code, ParseError);
}

TEST_F(FavouritesTest, SaveIntoUnwritableLocationIsPersistenceError) {
  // A regular file where a directory is expected cannot be written through.
  const fs::path blocker = m_dir / "blocker";
  {
    std::ofstream out(blocker);
    out << "x";
  }

  FavouritesStore store(blocker / "favourites.json");
  ASSERT_TRUE(store.add(London()));

  const Result<> saved = store.save();

  ASSERT_FALSE(saved);
  EXPECT_EQ(saved.error().code, PersistenceError);
}
