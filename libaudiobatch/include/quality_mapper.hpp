/**
 * @file quality_mapper.hpp
 * @brief Maps the user-facing 30..100 quality score to ffmpeg's -q:a scale.
 */

#ifndef AUDIOBATCH_QUALITY_MAPPER_HPP
#define AUDIOBATCH_QUALITY_MAPPER_HPP

namespace audiobatch {

inline constexpr int kMinQualityPercent = 30;
inline constexpr int kMaxQualityPercent = 100;
inline constexpr int kDefaultQualityPercent = 70;

/**
 * @brief Step function from a quality percentage to the transcoder's
 * variable-bitrate quality value. Lower results mean higher fidelity.
 *
 * @param percent Score in [kMinQualityPercent, kMaxQualityPercent]; range
 * checking belongs to whoever collected the value.
 */
[[nodiscard]] constexpr int map_quality(const int percent) noexcept {
    if (percent >= 90) return 0;
    if (percent >= 75) return 2;
    if (percent >= 60) return 3;
    if (percent >= 50) return 4;
    if (percent >= 40) return 5;
    return 6;
}

/// @return true if @p quality is a value map_quality() can produce (0..6).
[[nodiscard]] constexpr bool is_valid_transcoder_quality(const int quality) noexcept {
    return quality >= map_quality(kMaxQualityPercent) && quality <= map_quality(kMinQualityPercent);
}

[[nodiscard]] constexpr bool is_valid_quality_percent(const int percent) noexcept {
    return percent >= kMinQualityPercent && percent <= kMaxQualityPercent;
}

} // namespace audiobatch

#endif // AUDIOBATCH_QUALITY_MAPPER_HPP
