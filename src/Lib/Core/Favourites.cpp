#include "Nimbus/Core/Favourites.hpp"

// clang-format off
#include <glaze/glaze.hpp>

#include <algorithm> // std::ranges::find_if
#include <fstream>   // std::{ifstream, ofstream}
#include <iterator>  // std::istreambuf_iterator
#include <utility>   // std::move

#include "Nimbus/Utils/Logging.hpp"
#include "Nimbus/Utils/Strings.hpp"
// clang-format on

namespace fs = std::filesystem;

using namespace nimbus::utils::types;
using nimbus::core::FavouritesStore;
using nimbus::services::weather::Location;
using nimbus::utils::error::NimbusError;
using enum nimbus::utils::error::NimbusErrorCode;
using nimbus::utils::strings::StrEqualsIgnoreCase;

namespace {
  // On-disk shape: {"favourites": [...]}.
  struct FavouritesFile {
    Vec<Location> favourites;
  };

  fn RemoveQuietly(const fs::path& path) -> Unit {
    std::error_code removeEc;
    fs::remove(path, removeEc);

    if (removeEc)
      debug_log("Failed to remove temporary file '{}': {}", path.string(), removeEc.message());
  }
} // namespace

template <>
struct glz::meta<FavouritesFile> {
  static constexpr detail::Object value = object("favourites", &FavouritesFile::favourites);
};

FavouritesStore::FavouritesStore(fs::path path)
  : m_path(std::move(path)) {}

fn FavouritesStore::load() -> Result<> {
  if (std::error_code existsEc; !fs::exists(m_path, existsEc)) {
    if (existsEc)
      return Err(NimbusError(existsEc));

    debug_log("Favourites file not found, starting with an empty list: {}", m_path.string());
    m_entries.clear();
    return {};
  }

  std::ifstream ifs(m_path, std::ios::binary);
  if (!ifs.is_open())
    ERR_FMT(IoError, "Failed to open favourites file for reading: {}", m_path.string());

  const String content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());

  if (ifs.bad())
    ERR_FMT(IoError, "Failed to read favourites file: {}", m_path.string());

  FavouritesFile file {};

  if (!content.empty())
    if (const glz::error_ctx glazeErr = glz::read<glz::opts { .error_on_unknown_keys = false }>(file, content); glazeErr.ec != glz::error_code::none)
      ERR_FMT(ParseError, "Failed to parse favourites file '{}': {}", m_path.string(), glz::format_error(glazeErr, content));

  m_entries = std::move(file.favourites);

  debug_log("Loaded {} favourite(s) from {}", m_entries.size(), m_path.string());

  return {};
}

fn FavouritesStore::save() const -> Result<> {
  fs::path tempPath = m_path;
  tempPath += ".tmp";

  String buffer;

  if (const glz::error_ctx glazeErr = glz::write<glz::opts { .prettify = true }>(FavouritesFile { .favourites = m_entries }, buffer); glazeErr)
    ERR_FMT(PersistenceError, "Failed to serialize favourites: {}", glz::format_error(glazeErr, buffer));

  if (m_path.has_parent_path()) {
    std::error_code dirEc;
    fs::create_directories(m_path.parent_path(), dirEc);

    if (dirEc)
      ERR_FMT(PersistenceError, "Failed to create directory '{}': {}", m_path.parent_path().string(), dirEc.message());
  }

  {
    std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open())
      ERR_FMT(PersistenceError, "Failed to open temporary favourites file: {}", tempPath.string());

    ofs.write(buffer.data(), static_cast<isize>(buffer.size()));

    if (!ofs) {
      RemoveQuietly(tempPath);
      ERR_FMT(PersistenceError, "Failed to write temporary favourites file: {}", tempPath.string());
    }
  }

  std::error_code renameEc;
  fs::rename(tempPath, m_path, renameEc);

  if (renameEc) {
    RemoveQuietly(tempPath);
    ERR_FMT(PersistenceError, "Failed to replace favourites file '{}': {}", m_path.string(), renameEc.message());
  }

  debug_log("Saved {} favourite(s) to {}", m_entries.size(), m_path.string());

  return {};
}

fn FavouritesStore::add(Location location) -> Result<> {
  if (contains(location.city))
    ERR_FMT(DuplicateFavourite, "{} already exists in favourites", location.city);

  m_entries.push_back(std::move(location));

  return {};
}

fn FavouritesStore::remove(const StringView city) -> Result<Location> {
  const auto iter = std::ranges::find_if(m_entries, [city](const Location& entry) { return StrEqualsIgnoreCase(entry.city, city); });

  if (iter == m_entries.end())
    ERR_FMT(NotFound, "City {} does not exist in favourites", city);

  Location removed = std::move(*iter);
  m_entries.erase(iter);

  return removed;
}

fn FavouritesStore::find(const StringView city) const -> Option<Location> {
  const auto iter = std::ranges::find_if(m_entries, [city](const Location& entry) { return StrEqualsIgnoreCase(entry.city, city); });

  if (iter == m_entries.end())
    return None;

  return *iter;
}

fn FavouritesStore::contains(const StringView city) const -> bool {
  return find(city).has_value();
}
