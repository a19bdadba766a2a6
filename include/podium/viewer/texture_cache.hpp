#pragma once
#include <cstddef>
#include <future>
#include <string>
#include <unordered_map>
#include <raylib.h>
#include <podium/surface.hpp>

namespace podium {

// Avatar textures decoded off the render thread. Decoding and circular
// masking run in std::async; the GPU upload happens in status() on the
// render thread once the decode is done. Failures are never retried.
class TextureCache : public ImageSource {
public:
  TextureCache() = default;
  ~TextureCache() { clear(); }
  TextureCache(const TextureCache&) = delete;
  TextureCache& operator=(const TextureCache&) = delete;

  void request(const std::string& ref);
  ImageStatus status(const std::string& ref) override;
  const Texture2D* texture(const std::string& ref) const;
  std::size_t decodes_started() const { return decodes_; }

  // Unloads every texture; call before CloseWindow().
  void clear();

private:
  struct Entry {
    ImageStatus status = ImageStatus::Pending;
    std::future<Image> decode;
    Texture2D texture{};
  };

  std::unordered_map<std::string, Entry> entries_;
  std::size_t decodes_{0};
};

} // namespace podium
