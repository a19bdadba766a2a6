#include <podium/viewer/texture_cache.hpp>
#include <algorithm>
#include <chrono>

namespace podium {

// Square-crop and alpha-mask to a circle so the texture draws as a round avatar.
static Image decode_avatar(const std::string& path) {
  Image img = LoadImage(path.c_str());
  if (img.data == nullptr || img.width <= 0 || img.height <= 0) return img;

  const int side = std::min(img.width, img.height);
  ImageCrop(&img, Rectangle{ static_cast<float>((img.width - side) / 2),
                             static_cast<float>((img.height - side) / 2),
                             static_cast<float>(side), static_cast<float>(side) });
  Image mask = GenImageColor(side, side, BLANK);
  ImageDrawCircle(&mask, side / 2, side / 2, side / 2, WHITE);
  ImageAlphaMask(&img, mask);
  UnloadImage(mask);
  return img;
}

void TextureCache::request(const std::string& ref) {
  if (ref.empty() || entries_.count(ref)) return;
  Entry e{};
  e.decode = std::async(std::launch::async, decode_avatar, ref);
  ++decodes_;
  entries_.emplace(ref, std::move(e));
}

ImageStatus TextureCache::status(const std::string& ref) {
  if (ref.empty()) return ImageStatus::None;
  auto it = entries_.find(ref);
  if (it == entries_.end()) {
    request(ref);
    return ImageStatus::Pending;
  }

  Entry& e = it->second;
  if (e.status != ImageStatus::Pending) return e.status;
  if (e.decode.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
    return ImageStatus::Pending;
  }

  Image img = e.decode.get();
  if (img.data == nullptr) {
    TraceLog(LOG_WARNING, "PODIUM: avatar '%s' failed to load, using badge", ref.c_str());
    e.status = ImageStatus::Failed;
    return e.status;
  }
  e.texture = LoadTextureFromImage(img);
  UnloadImage(img);
  if (e.texture.id == 0) {
    TraceLog(LOG_WARNING, "PODIUM: avatar '%s' upload failed, using badge", ref.c_str());
    e.status = ImageStatus::Failed;
    return e.status;
  }
  SetTextureFilter(e.texture, TEXTURE_FILTER_BILINEAR);
  e.status = ImageStatus::Ready;
  return e.status;
}

const Texture2D* TextureCache::texture(const std::string& ref) const {
  auto it = entries_.find(ref);
  if (it == entries_.end() || it->second.status != ImageStatus::Ready) return nullptr;
  return &it->second.texture;
}

void TextureCache::clear() {
  for (auto& [ref, e] : entries_) {
    if (e.status == ImageStatus::Pending && e.decode.valid()) {
      Image img = e.decode.get();
      if (img.data != nullptr) UnloadImage(img);
    }
    if (e.status == ImageStatus::Ready) UnloadTexture(e.texture);
  }
  entries_.clear();
}

} // namespace podium
