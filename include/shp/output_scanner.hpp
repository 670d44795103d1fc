/**
 * @file output_scanner.hpp
 * @brief Streaming detection of missing-runtime markers in process output.
 *
 * Feed() accepts output chunks as they arrive; a marker split across two
 * chunks is still found. When several markers match, the one earliest in
 * the pattern table wins, independent of where it appeared in the stream.
 */

#ifndef SHP_OUTPUT_SCANNER_HPP_
#define SHP_OUTPUT_SCANNER_HPP_

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

namespace shp {

struct ComponentPattern {
  const char* marker;     ///< Lower-case substring to look for
  const char* component;  ///< Runtime component the caller may install
};

/// Default marker table, in priority order.
inline const ComponentPattern* DefaultComponentPatterns(uint32_t& count) noexcept {
  static const ComponentPattern kPatterns[] = {
      {"directx 11", "directx11"},
      {"directx 12", "directx12"},
      {"vcruntime140", "vcrun2015"},
      {"vcruntime", "vcrun2015"},
      {"d3dcompiler", "d3dcompiler_47"},
      {"dotnet", "dotnet48"},
      {"dxgi", "dxvk"},
      {"vulkan", "vulkan"},
  };
  count = static_cast<uint32_t>(sizeof(kPatterns) / sizeof(kPatterns[0]));
  return kPatterns;
}

class OutputScanner final {
 public:
  static constexpr uint32_t kMaxPatterns = 32;

  OutputScanner() { patterns_ = DefaultComponentPatterns(count_); Init(); }

  /// @param patterns Not copied; must outlive the scanner.
  OutputScanner(const ComponentPattern* patterns, uint32_t count)
      : patterns_(patterns), count_(count > kMaxPatterns ? kMaxPatterns : count) {
    Init();
  }

  void Feed(const char* data, size_t len) {
    if (len == 0U || count_ == 0U || AllMatched())
      return;

    std::string window;
    window.reserve(carry_.size() + len);
    window += carry_;
    for (size_t i = 0; i < len; ++i) {
      const char c = data[i];
      window.push_back((c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c);
    }

    for (uint32_t i = 0; i < count_; ++i) {
      if ((matched_ & (1U << i)) == 0U && window.find(patterns_[i].marker) != std::string::npos) {
        matched_ |= (1U << i);
      }
    }

    const size_t keep = (max_marker_len_ > 1U) ? max_marker_len_ - 1U : 0U;
    carry_ = (window.size() > keep) ? window.substr(window.size() - keep) : window;
  }

  /// @return Highest-priority detected component, or nullptr.
  const char* Detected() const noexcept {
    for (uint32_t i = 0; i < count_; ++i) {
      if ((matched_ & (1U << i)) != 0U)
        return patterns_[i].component;
    }
    return nullptr;
  }

  void Reset() {
    matched_ = 0;
    carry_.clear();
  }

 private:
  const ComponentPattern* patterns_;
  uint32_t count_ = 0;
  uint32_t matched_ = 0;
  size_t max_marker_len_ = 0;
  std::string carry_;

  void Init() {
    for (uint32_t i = 0; i < count_; ++i) {
      const size_t n = std::strlen(patterns_[i].marker);
      if (n > max_marker_len_)
        max_marker_len_ = n;
    }
  }

  bool AllMatched() const noexcept {
    const uint32_t all = (count_ >= 32U) ? 0xFFFFFFFFU : ((1U << count_) - 1U);
    return matched_ == all;
  }
};

}  // namespace shp

#endif  // SHP_OUTPUT_SCANNER_HPP_
