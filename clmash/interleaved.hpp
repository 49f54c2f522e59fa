#pragma once

#include <algorithm>
#include <cassert>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ranges>
#include <span>
#include <utility>
#include <vector>

namespace clmash {

template<std::floating_point T>
[[nodiscard]] constexpr T dbamp(T db) noexcept
{ return std::pow(T(10.0), db * T(0.05)); }

template<std::floating_point T>
[[nodiscard]] constexpr T ampdb(T amp) noexcept
{ return T(20.0) * std::log10(amp); }

// Interleaved multichannel sample buffer tagged with its sample rate.
template<typename T>
class interleaved {
  std::vector<T> storage;
  size_t frames_   = 0;
  size_t channels_ = 0;

public:
  uint32_t sample_rate = 0;

  interleaved() = default;

  interleaved(uint32_t sr, size_t ch, size_t frames)
  : storage(frames * ch), frames_(frames), channels_(ch), sample_rate(sr)
  { assert(ch > 0); }

  // move-only
  interleaved(const interleaved&) = delete;
  interleaved& operator=(const interleaved&) = delete;

  // A moved-from buffer is empty, with no frames and no channels.
  interleaved(interleaved&& other) noexcept
  : storage(std::exchange(other.storage, {}))
  , frames_(std::exchange(other.frames_, 0))
  , channels_(std::exchange(other.channels_, 0))
  , sample_rate(std::exchange(other.sample_rate, 0))
  {}

  interleaved& operator=(interleaved&& other) noexcept
  {
    storage     = std::exchange(other.storage, {});
    frames_     = std::exchange(other.frames_, 0);
    channels_   = std::exchange(other.channels_, 0);
    sample_rate = std::exchange(other.sample_rate, 0);
    return *this;
  }

  // Explicit deep copy, for the few places that need one.
  [[nodiscard]] interleaved clone() const
  {
    interleaved copy;
    copy.storage     = storage;
    copy.frames_     = frames_;
    copy.channels_   = channels_;
    copy.sample_rate = sample_rate;
    return copy;
  }

  [[nodiscard]] size_t   frames()   const noexcept { return frames_; }
  [[nodiscard]] double   duration() const noexcept { return double(frames()) / sample_rate; }
  [[nodiscard]] size_t   channels() const noexcept { return channels_; }
  [[nodiscard]] size_t   samples()  const noexcept { return storage.size(); }
  [[nodiscard]] bool     empty()    const noexcept { return frames_ == 0; }
  [[nodiscard]] T*       data()       noexcept     { return storage.data(); }
  [[nodiscard]] const T* data() const noexcept     { return storage.data(); }

  template<typename Elem>
  class frame_view {
    std::span<Elem> row;

  public:
    frame_view(Elem* row, size_t ch) : row(row, ch) {}

    [[nodiscard]] T average() const noexcept {
      return std::ranges::fold_left(row, T(0), std::plus<T>{}) / row.size();
    }

    frame_view& operator*=(T gain) noexcept
    {
      for (T &sample: row) sample *= gain;
      return *this;
    }
  };

  // 2D element access via multi-arg operator[]
  T& operator[](size_t frame, size_t ch) noexcept {
    assert(frame < frames_ && ch < channels_);
    return storage[frame * channels_ + ch];
  }
  const T& operator[](size_t frame, size_t ch) const noexcept
  {
    assert(frame < frames_ && ch < channels_);
    return storage[frame * channels_ + ch];
  }

  // 1D frame view
  frame_view<T> operator[](size_t frame) noexcept
  {
    assert(frame < frames_);
    return { storage.data() + frame * channels_, channels_ };
  }
  const frame_view<const T> operator[](size_t frame) const noexcept
  {
    assert(frame < frames_);
    return { storage.data() + frame * channels_, channels_ };
  }

  [[nodiscard]] T peak() const noexcept
  {
    return std::ranges::fold_left(
      storage | std::views::transform([](T v) { return std::abs(v); }),
      T(0), [](T a, T b) { return std::max(a, b); }
    );
  }

  void resize(size_t new_frames)
  {
    storage.resize(new_frames * channels_);
    frames_ = new_frames;
  }

  // Scale all samples in-place by gain.
  interleaved &operator*=(T gain) noexcept
  {
    for (T &sample: storage) sample *= gain;
    return *this;
  }
};

using track_audio = interleaved<float>;

}
