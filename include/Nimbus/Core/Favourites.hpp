#pragma once

#include <filesystem> // std::filesystem::path

#include "../Services/Weather.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace nimbus::core {
  namespace {
    using services::weather::Location;

    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::usize;
    using utils::types::Vec;
  } // namespace

  /**
   * @brief Ordered list of favourite locations, persisted as JSON.
   *
   * City names are unique, compared case-insensitively. The store is not
   * synchronized; only the dispatcher thread may touch it.
   */
  class FavouritesStore {
   public:
    explicit FavouritesStore(std::filesystem::path path);

    /**
     * @brief Replaces the in-memory list with the file's contents.
     * @return Nothing on success. A missing file yields an empty list; an
     *         unreadable or malformed file is an IoError or ParseError.
     */
    fn load() -> Result<>;

    /**
     * @brief Writes the list to a temporary file and renames it over the target.
     * @return Nothing on success, PersistenceError otherwise.
     */
    [[nodiscard]] fn save() const -> Result<>;

    /**
     * @brief Appends a location.
     * @return DuplicateFavourite if a favourite with the same city already exists.
     */
    fn add(Location location) -> Result<>;

    /**
     * @brief Removes the favourite whose city matches @p city.
     * @return The removed location, or NotFound.
     */
    fn remove(StringView city) -> Result<Location>;

    [[nodiscard]] fn find(StringView city) const -> Option<Location>;
    [[nodiscard]] fn contains(StringView city) const -> bool;

    [[nodiscard]] fn entries() const -> const Vec<Location>& {
      return m_entries;
    }

    [[nodiscard]] fn size() const -> usize {
      return m_entries.size();
    }

    [[nodiscard]] fn empty() const -> bool {
      return m_entries.empty();
    }

    [[nodiscard]] fn path() const -> const std::filesystem::path& {
      return m_path;
    }

   private:
    std::filesystem::path m_path;
    Vec<Location>         m_entries;
  };
} // namespace nimbus::core
