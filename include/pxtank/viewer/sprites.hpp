#pragma once
#include <array>
#include <string>
#include <vector>
#include <raylib.h>
#include <pxtank/geometry.hpp>
#include <pxtank/snap.hpp>

namespace pxtank {

// Rows of palette keys; '.' (or any key missing from the palette) is transparent.
using PixelPattern = std::vector<std::string>;

struct PaletteEntry {
  char key;
  Color color;
};
using Palette = std::vector<PaletteEntry>;

// CPU image of a pattern, one pixel_size square per cell. Caller unloads.
Image make_pixel_image(const PixelPattern& pattern, const Palette& palette, int pixel_size);

// GPU textures for every entity kind and facing. Needs a live window.
class SpriteSet {
public:
  SpriteSet() = default;
  ~SpriteSet() { unload(); }
  SpriteSet(const SpriteSet&) = delete;
  SpriteSet& operator=(const SpriteSet&) = delete;

  void load(int pixel_size);
  void unload();

  const Texture2D& texture(EntityKind kind, Facing facing) const;

private:
  using Rotations = std::array<Texture2D, 4>; // indexed by Facing

  static Rotations load_rotations_(const PixelPattern& pattern, const Palette& palette, int pixel_size);
  static void unload_rotations_(Rotations& r);

  Rotations player_{};
  Rotations enemy_{};
  Rotations bullet_{};
  Texture2D obstacle_{};
  bool loaded_{false};
};

} // namespace pxtank
