#include <pxtank/viewer/sprites.hpp>
#include <algorithm>
#include <cstddef>
#include <pxtank/config.hpp>

namespace pxtank {

namespace {

static const PixelPattern kTankPattern = {
  "...11..11....",
  "...11..11....",
  "...111111....",
  "..111333111..",
  ".11133333111.",
  ".11223332211.",
  ".11223332211.",
  ".11233332211.",
  ".11233332211.",
  ".11223332211.",
  ".11133333111.",
  "..111333111..",
  ".11133333111.",
  "..111333111..",
};

static const Palette kPlayerPalette = {
  {'1', Color{38, 142, 73, 255}},
  {'2', Color{54, 168, 88, 255}},
  {'3', Color{92, 196, 118, 255}},
};

static const Palette kEnemyPalette = {
  {'1', Color{150, 62, 64, 255}},
  {'2', Color{184, 90, 70, 255}},
  {'3', Color{214, 132, 92, 255}},
};

static const PixelPattern kBulletPattern = {
  "..1..",
  ".111.",
  "11111",
  ".111.",
  "..1..",
};

static const Palette kBulletPalette = {
  {'1', Color{240, 222, 120, 255}},
};

static const PixelPattern kObstaclePattern(kObstacleCells.h, std::string(kObstacleCells.w, '1'));

static const Palette kObstaclePalette = {
  {'1', Color{94, 84, 142, 255}},
};

static const Color* lookup(const Palette& palette, char key) {
  for (const auto& e : palette) if (e.key == key) return &e.color;
  return nullptr;
}

static std::size_t facing_index(Facing f) { return static_cast<std::size_t>(f); }

} // namespace

Image make_pixel_image(const PixelPattern& pattern, const Palette& palette, int pixel_size) {
  const int rows = static_cast<int>(pattern.size());
  int cols = 0;
  for (const auto& r : pattern) cols = std::max(cols, static_cast<int>(r.size()));
  const int px = std::max(1, pixel_size);

  Image img = GenImageColor(std::max(1, cols * px), std::max(1, rows * px), BLANK);
  for (int y = 0; y < rows; ++y) {
    const auto& row = pattern[static_cast<std::size_t>(y)];
    for (int x = 0; x < static_cast<int>(row.size()); ++x) {
      if (const Color* c = lookup(palette, row[static_cast<std::size_t>(x)])) {
        ImageDrawRectangle(&img, x * px, y * px, px, px, *c);
      }
    }
  }
  return img;
}

SpriteSet::Rotations SpriteSet::load_rotations_(const PixelPattern& pattern, const Palette& palette,
                                                int pixel_size) {
  Rotations out{};
  Image up = make_pixel_image(pattern, palette, pixel_size);

  Image right = ImageCopy(up);
  ImageRotateCW(&right);
  Image down = ImageCopy(right);
  ImageRotateCW(&down);
  Image left = ImageCopy(up);
  ImageRotateCCW(&left);

  out[facing_index(Facing::Up)]    = LoadTextureFromImage(up);
  out[facing_index(Facing::Right)] = LoadTextureFromImage(right);
  out[facing_index(Facing::Down)]  = LoadTextureFromImage(down);
  out[facing_index(Facing::Left)]  = LoadTextureFromImage(left);

  UnloadImage(up);
  UnloadImage(right);
  UnloadImage(down);
  UnloadImage(left);
  return out;
}

void SpriteSet::unload_rotations_(Rotations& r) {
  for (auto& t : r) {
    if (t.id != 0) UnloadTexture(t);
    t = Texture2D{};
  }
}

void SpriteSet::load(int pixel_size) {
  unload();
  player_ = load_rotations_(kTankPattern, kPlayerPalette, pixel_size);
  enemy_  = load_rotations_(kTankPattern, kEnemyPalette, pixel_size);
  bullet_ = load_rotations_(kBulletPattern, kBulletPalette, pixel_size);

  Image obstacle = make_pixel_image(kObstaclePattern, kObstaclePalette, pixel_size);
  obstacle_ = LoadTextureFromImage(obstacle);
  UnloadImage(obstacle);
  loaded_ = true;
}

void SpriteSet::unload() {
  if (!loaded_) return;
  unload_rotations_(player_);
  unload_rotations_(enemy_);
  unload_rotations_(bullet_);
  if (obstacle_.id != 0) UnloadTexture(obstacle_);
  obstacle_ = Texture2D{};
  loaded_ = false;
}

const Texture2D& SpriteSet::texture(EntityKind kind, Facing facing) const {
  const std::size_t i = facing_index(facing);
  switch (kind) {
    case EntityKind::Player:       return player_[i];
    case EntityKind::Enemy:        return enemy_[i];
    case EntityKind::PlayerBullet:
    case EntityKind::EnemyBullet:  return bullet_[i];
    case EntityKind::Obstacle:     return obstacle_;
  }
  return obstacle_;
}

} // namespace pxtank
