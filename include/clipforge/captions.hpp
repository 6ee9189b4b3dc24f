/**
 * @file captions.hpp
 * @brief Caption presets, boundary validation and subtitle script rendering
 *
 * @details Provides:
 *          - CaptionStyle: closed enumeration of the nine presets
 *
 *          - CaptionPreset: default-colors table entry per preset
 *
 *          - validate_caption_settings(): fail-fast check run before a job
 *            exists and again before the first clip is cut
 *
 *          - CaptionRenderer: writes an Advanced SubStation Alpha (ASS)
 *            script for one clip; the encoder burns it into the frames
 *
 * @note Colors are accepted as "#RGB" or "#RRGGBB" and nothing else.
 */

#ifndef CLIPFORGE_CAPTIONS_HPP
#define CLIPFORGE_CAPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "types.hpp"

namespace clipforge {

// **----- PRESETS -----**

enum class CaptionStyle : std::uint8_t {
  None,
  Classic,
  Boxed,
  Yellow,
  Minimal,
  Bold,
  Karaoke,
  Neon,
  Gradient
};

/**
 * @struct RgbColor
 * @brief 8-bit RGB triple.
 */
struct RgbColor {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;

  bool operator==(const RgbColor &o) const {
    return r == o.r && g == o.g && b == o.b;
  }
};

enum class TextCase : std::uint8_t { AsIs, Upper, Lower };

/**
 * @struct CaptionPreset
 * @brief Default look of one preset.
 */
struct CaptionPreset {
  CaptionStyle style;
  const char *name;
  double font_scale;       //< Relative to a 1080px wide frame
  RgbColor text;           //< Primary text color
  RgbColor outline;        //< Outline (or glow) color
  int outline_width;       //< 0 = no outline
  bool has_background;     //< Opaque box behind the text
  std::uint8_t bg_alpha;   //< Box opacity (255 = opaque)
  bool bold;
  TextCase text_case;
  bool per_word_timing;    //< Karaoke highlight needs word timestamps
  RgbColor highlight;      //< Active word color (karaoke)
  bool glow;               //< Blurred outline (neon)
  bool gradient;           //< Per-word color ramp (gradient)
  RgbColor gradient_from;
  RgbColor gradient_to;
};

/// Preset table lookup, never null
const CaptionPreset &caption_preset(CaptionStyle style);

/// All preset names, in declaration order ("none" first)
std::vector<std::string> caption_style_names();

const char *to_string(CaptionStyle style);

/**
 * @brief Parse a preset name (case-sensitive, lowercase).
 * @return false for unknown names; out is left untouched
 */
bool parse_caption_style(const std::string &name, CaptionStyle &out);

/**
 * @brief Parse "#RGB" or "#RRGGBB".
 * @return false when malformed; out is left untouched
 */
bool parse_hex_color(const std::string &text, RgbColor &out);

// **----- SETTINGS -----**

/**
 * @struct CaptionSettings
 * @brief Caption options carried by a submission.
 */
struct CaptionSettings {
  bool include_captions = true;
  CaptionStyle style = CaptionStyle::None;
  std::string color;         //< Optional text color override (hex)
  std::string outline_color; //< Optional outline color override (hex)

  /// true when captions will actually be rendered
  bool enabled() const {
    return include_captions && style != CaptionStyle::None;
  }
};

/**
 * @brief Validate caption options against the chosen style.
 * @return Empty string when valid, otherwise the reason
 */
std::string validate_caption_settings(const CaptionSettings &settings);

// **----- RENDERING -----**

/**
 * @struct CaptionRenderReport
 * @brief What the renderer produced.
 */
struct CaptionRenderReport {
  bool ok = false;
  bool degraded = false; //< Word timing missing, fell back to segment lines
  int events = 0;        //< Dialogue lines written
  std::string error;
};

/**
 * @class CaptionRenderer
 * @brief Turns word-level timed text into an ASS script for one clip.
 *
 * @attention TIMING:
 *
 *   - Input times are source seconds; output times are relative to the
 *     clip start and clipped to [0, clip duration]
 *
 *   - Words are grouped into short lines of at most max_words_per_line
 *
 *   - Karaoke uses \k tags per word; without word timestamps every preset
 *     falls back to one line per transcript segment
 */
class CaptionRenderer {
public:
  CaptionRenderer(const CaptionSettings &settings, int frame_width,
                  int frame_height, int max_words_per_line = 4);

  /**
   * @brief Build the script text for the clip range.
   * @param transcript Full transcript of the source
   * @param clip Clip range in source seconds
   * @param report Output: degradation flag and event count
   */
  std::string build_script(const Transcript &transcript,
                           const TimeSegment &clip,
                           CaptionRenderReport &report) const;

  /**
   * @brief Build and write the script to path.
   */
  CaptionRenderReport render_to_file(const Transcript &transcript,
                                     const TimeSegment &clip,
                                     const std::string &path) const;

  /// ASS colour literal (&HAABBGGRR) for a color and opacity (255 = opaque)
  static std::string ass_color(const RgbColor &c, std::uint8_t alpha = 255);

  /// ASS timestamp (H:MM:SS.cc)
  static std::string ass_time(double seconds);

private:
  std::string header() const;
  std::string apply_case(const std::string &text) const;
  std::string word_line(const std::vector<TimedWord> &words) const;
  std::string segment_line(const std::string &text) const;
  std::string escape(const std::string &text) const;
  RgbColor gradient_at(std::size_t i, std::size_t n) const;

  CaptionPreset preset_;
  int width_;
  int height_;
  int max_words_;
};

} // namespace clipforge

#endif // CLIPFORGE_CAPTIONS_HPP
