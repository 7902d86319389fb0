/**
 * @file sprite_cache.hpp
 * @brief Load-once cache of cursor sprite images
 *
 * @details Sprites are decoded with libavformat/libavcodec (the png decoder)
 *          and converted to straight-alpha RGBA with libswscale. Each style
 *          is loaded at most once per process; a missing asset is cached as
 *          an "unavailable" entry so the per-frame path never touches the
 *          filesystem again for it.
 */

#ifndef CURSOR_FX_SPRITE_CACHE_HPP
#define CURSOR_FX_SPRITE_CACHE_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cursor_fx {

/**
 * @struct Sprite
 * @brief A decoded RGBA image (straight alpha, tightly packed rows).
 */
struct Sprite {
  std::vector<uint8_t> pixels;
  int width = 0;
  int height = 0;
};

/**
 * @brief Decode an image file into an RGBA sprite.
 * @param path Path to the image (normally a PNG)
 * @return The sprite, or nullptr if the file is missing or undecodable
 */
std::shared_ptr<const Sprite> load_sprite(const std::string &path);

/**
 * @brief Map a requested style onto an available sprite: "hand" stays
 *        "hand", everything else becomes "normal".
 */
std::string normalize_cursor_style(const std::string &style);

/**
 * @class SpriteCache
 * @brief Thread-safe, append-only map from style name to sprite.
 *
 * @attention CONCURRENCY:
 *
 * - get() may be called from any thread; the first call for a style
 *   performs the load while holding the cache lock
 *
 * - Entries are never evicted or replaced by get(), so a returned
 *   shared_ptr stays valid for as long as the caller holds it
 */
class SpriteCache {
public:
  explicit SpriteCache(std::string asset_dir);

  /// Process-wide cache rooted at Config::sprite_dir()
  static SpriteCache &shared();

  /**
   * @brief Look up (loading on first use) the sprite for a style.
   * @note The style is normalized first, so unknown names share the
   *       "normal" entry and never reach the filesystem path as given.
   * @return nullptr if the asset is unavailable
   */
  std::shared_ptr<const Sprite> get(const std::string &style);

  /**
   * @brief Preload a sprite under a (normalized) style name, bypassing the
   *        filesystem.
   */
  void put(const std::string &style, std::shared_ptr<const Sprite> sprite);

  /// File a normalized style resolves to: <asset_dir>/cursor_<style>.png
  std::string asset_path(const std::string &style) const;

  /// Number of filesystem loads attempted so far
  size_t load_attempts() const;

private:
  std::string asset_dir_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<const Sprite>> sprites_;
  size_t load_attempts_ = 0;
};

} // namespace cursor_fx

#endif // CURSOR_FX_SPRITE_CACHE_HPP
