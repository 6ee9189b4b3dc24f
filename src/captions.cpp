/**
 * @file captions.cpp
 * @brief Caption preset table, validation and ASS script rendering
 */

#include "clipforge/captions.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

#include <fmt/core.h>

#include "clipforge/logging.hpp"

namespace clipforge {

// **----- PRESET TABLE -----**

namespace {

constexpr RgbColor WHITE{255, 255, 255};
constexpr RgbColor BLACK{0, 0, 0};
constexpr RgbColor YELLOW{255, 255, 0};
constexpr RgbColor MAGENTA{255, 0, 255};
constexpr RgbColor PINK_GLOW{255, 100, 255};
constexpr RgbColor GRAD_RED{255, 100, 100};
constexpr RgbColor GRAD_BLUE{100, 100, 255};

// clang-format off
const std::array<CaptionPreset, 9> PRESETS = {{
  // style                  name        scale text     outline    ow  box    alpha bold   case           words  highlight glow   grad   from      to
  {CaptionStyle::None,     "none",     1.0, WHITE,   BLACK,     0, false, 0,   false, TextCase::AsIs,  false, WHITE,   false, false, WHITE,    WHITE},
  {CaptionStyle::Classic,  "classic",  1.2, WHITE,   BLACK,     3, false, 0,   false, TextCase::AsIs,  false, WHITE,   false, false, WHITE,    WHITE},
  {CaptionStyle::Boxed,    "boxed",    1.0, WHITE,   BLACK,     0, true,  180, false, TextCase::AsIs,  false, WHITE,   false, false, WHITE,    WHITE},
  {CaptionStyle::Yellow,   "yellow",   1.2, YELLOW,  BLACK,     3, false, 0,   false, TextCase::AsIs,  false, YELLOW,  false, false, WHITE,    WHITE},
  {CaptionStyle::Minimal,  "minimal",  0.9, WHITE,   BLACK,     0, false, 0,   false, TextCase::Lower, false, WHITE,   false, false, WHITE,    WHITE},
  {CaptionStyle::Bold,     "bold",     1.5, WHITE,   BLACK,     5, false, 0,   true,  TextCase::Upper, false, WHITE,   false, false, WHITE,    WHITE},
  {CaptionStyle::Karaoke,  "karaoke",  1.2, WHITE,   BLACK,     2, false, 0,   false, TextCase::AsIs,  true,  YELLOW,  false, false, WHITE,    WHITE},
  {CaptionStyle::Neon,     "neon",     1.2, MAGENTA, PINK_GLOW, 4, false, 0,   false, TextCase::AsIs,  false, MAGENTA, true,  false, WHITE,    WHITE},
  {CaptionStyle::Gradient, "gradient", 1.3, WHITE,   BLACK,     2, false, 0,   false, TextCase::AsIs,  false, WHITE,   false, true,  GRAD_RED, GRAD_BLUE},
}};
// clang-format on

/// Font size at font_scale 1.0 on a 1080px wide frame
constexpr double BASE_FONT_PX = 64.0;

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  return -1;
}

} // anonymous namespace

const CaptionPreset &caption_preset(CaptionStyle style) {
  for (const auto &p : PRESETS) {
    if (p.style == style)
      return p;
  }
  return PRESETS[0];
}

std::vector<std::string> caption_style_names() {
  std::vector<std::string> names;
  names.reserve(PRESETS.size());
  for (const auto &p : PRESETS) {
    names.emplace_back(p.name);
  }
  return names;
}

const char *to_string(CaptionStyle style) { return caption_preset(style).name; }

bool parse_caption_style(const std::string &name, CaptionStyle &out) {
  for (const auto &p : PRESETS) {
    if (name == p.name) {
      out = p.style;
      return true;
    }
  }
  return false;
}

bool parse_hex_color(const std::string &text, RgbColor &out) {
  if (text.size() != 4 && text.size() != 7)
    return false;
  if (text[0] != '#')
    return false;

  std::array<int, 6> nibbles{};
  const std::size_t digits = text.size() - 1;
  for (std::size_t i = 0; i < digits; ++i) {
    int v = hex_value(text[i + 1]);
    if (v < 0)
      return false;
    nibbles[i] = v;
  }

  if (digits == 3) {
    /// #RGB expands each nibble (#f80 == #ff8800)
    out.r = static_cast<std::uint8_t>(nibbles[0] * 17);
    out.g = static_cast<std::uint8_t>(nibbles[1] * 17);
    out.b = static_cast<std::uint8_t>(nibbles[2] * 17);
  } else {
    out.r = static_cast<std::uint8_t>(nibbles[0] * 16 + nibbles[1]);
    out.g = static_cast<std::uint8_t>(nibbles[2] * 16 + nibbles[3]);
    out.b = static_cast<std::uint8_t>(nibbles[4] * 16 + nibbles[5]);
  }
  return true;
}

// **----- VALIDATION -----**

std::string validate_caption_settings(const CaptionSettings &settings) {
  RgbColor scratch;
  if (!settings.color.empty() && !parse_hex_color(settings.color, scratch)) {
    return fmt::format("invalid caption color '{}' (expected #RGB or #RRGGBB)",
                       settings.color);
  }
  if (!settings.outline_color.empty() &&
      !parse_hex_color(settings.outline_color, scratch)) {
    return fmt::format(
        "invalid caption outline color '{}' (expected #RGB or #RRGGBB)",
        settings.outline_color);
  }
  if (settings.style == CaptionStyle::None &&
      (!settings.color.empty() || !settings.outline_color.empty())) {
    return "caption color overrides require a caption style other than 'none'";
  }
  return {};
}

// **----- RENDERER -----**

CaptionRenderer::CaptionRenderer(const CaptionSettings &settings,
                                 int frame_width, int frame_height,
                                 int max_words_per_line)
    : preset_(caption_preset(settings.style)), width_(frame_width),
      height_(frame_height), max_words_(std::max(1, max_words_per_line)) {
  RgbColor c;
  if (!settings.color.empty() && parse_hex_color(settings.color, c)) {
    preset_.text = c;
    /// An explicit text color replaces the ramp
    preset_.gradient = false;
  }
  if (!settings.outline_color.empty() &&
      parse_hex_color(settings.outline_color, c)) {
    preset_.outline = c;
    if (preset_.outline_width == 0 && !preset_.has_background)
      preset_.outline_width = 2;
  }
}

std::string CaptionRenderer::ass_color(const RgbColor &c, std::uint8_t alpha) {
  /// ASS alpha is inverted: 00 = opaque
  return fmt::format("&H{:02X}{:02X}{:02X}{:02X}", 255 - alpha, c.b, c.g, c.r);
}

std::string CaptionRenderer::ass_time(double seconds) {
  if (seconds < 0)
    seconds = 0;
  long cs = std::lround(seconds * 100.0);
  long h = cs / 360000;
  long m = (cs / 6000) % 60;
  long s = (cs / 100) % 60;
  return fmt::format("{}:{:02d}:{:02d}.{:02d}", h, m, s, cs % 100);
}

std::string CaptionRenderer::header() const {
  const int font_px = static_cast<int>(
      std::lround(BASE_FONT_PX * preset_.font_scale * width_ / 1080.0));
  const int margin_v = height_ / 5;

  /// Karaoke: \k reveals Primary as each word is sung, Secondary before it
  RgbColor primary = preset_.per_word_timing ? preset_.highlight : preset_.text;
  RgbColor secondary = preset_.text;

  std::string outline_colour = ass_color(preset_.outline);
  int border_style = 1;
  int outline = preset_.outline_width;
  if (preset_.has_background) {
    /// BorderStyle 3 draws an opaque box in OutlineColour
    border_style = 3;
    outline_colour = ass_color(BLACK, preset_.bg_alpha);
    outline = std::max(outline, 8);
  }

  std::ostringstream out;
  out << "[Script Info]\n"
      << "ScriptType: v4.00+\n"
      << "PlayResX: " << width_ << "\n"
      << "PlayResY: " << height_ << "\n"
      << "WrapStyle: 0\n"
      << "ScaledBorderAndShadow: yes\n\n"
      << "[V4+ Styles]\n"
      << "Format: Name, Fontname, Fontsize, PrimaryColour, SecondaryColour, "
         "OutlineColour, BackColour, Bold, Italic, Underline, StrikeOut, "
         "ScaleX, ScaleY, Spacing, Angle, BorderStyle, Outline, Shadow, "
         "Alignment, MarginL, MarginR, MarginV, Encoding\n"
      << fmt::format("Style: Default,Arial,{},{},{},{},{},{},0,0,0,100,100,0,0,"
                     "{},{},0,2,60,60,{},1\n\n",
                     font_px, ass_color(primary), ass_color(secondary),
                     outline_colour, ass_color(BLACK, 0),
                     preset_.bold ? -1 : 0, border_style, outline, margin_v)
      << "[Events]\n"
      << "Format: Layer, Start, End, Style, Name, MarginL, MarginR, MarginV, "
         "Effect, Text\n";
  return out.str();
}

std::string CaptionRenderer::apply_case(const std::string &text) const {
  std::string out = text;
  switch (preset_.text_case) {
  case TextCase::Upper:
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
      return static_cast<char>(std::toupper(c));
    });
    break;
  case TextCase::Lower:
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    break;
  case TextCase::AsIs:
    break;
  }
  return out;
}

std::string CaptionRenderer::escape(const std::string &text) const {
  std::string out;
  out.reserve(text.size());
  for (char c : apply_case(text)) {
    switch (c) {
    case '{':
      out += '(';
      break;
    case '}':
      out += ')';
      break;
    case '\\':
      out += '/';
      break;
    case '\n':
    case '\r':
      out += ' ';
      break;
    default:
      out += c;
    }
  }
  return out;
}

RgbColor CaptionRenderer::gradient_at(std::size_t i, std::size_t n) const {
  if (n <= 1)
    return preset_.gradient_from;
  const double t = static_cast<double>(i) / static_cast<double>(n - 1);
  auto lerp = [t](std::uint8_t a, std::uint8_t b) {
    return static_cast<std::uint8_t>(std::lround(a + (b - a) * t));
  };
  return RgbColor{lerp(preset_.gradient_from.r, preset_.gradient_to.r),
                  lerp(preset_.gradient_from.g, preset_.gradient_to.g),
                  lerp(preset_.gradient_from.b, preset_.gradient_to.b)};
}

std::string CaptionRenderer::word_line(const std::vector<TimedWord> &words) const {
  std::string line = preset_.glow ? "{\\blur4}" : "";
  for (std::size_t i = 0; i < words.size(); ++i) {
    if (i > 0)
      line += ' ';
    if (preset_.per_word_timing) {
      /// Word duration plus the gap up to the next word, in centiseconds
      double until =
          (i + 1 < words.size()) ? words[i + 1].start : words[i].end;
      long k = std::max(1L, std::lround((until - words[i].start) * 100.0));
      line += fmt::format("{{\\k{}}}", k);
    } else if (preset_.gradient) {
      RgbColor c = gradient_at(i, words.size());
      line += fmt::format("{{\\c&H{:02X}{:02X}{:02X}&}}", c.b, c.g, c.r);
    }
    line += escape(words[i].text);
  }
  return line;
}

std::string CaptionRenderer::segment_line(const std::string &text) const {
  if (!preset_.gradient) {
    return (preset_.glow ? "{\\blur4}" : "") + escape(text);
  }
  std::vector<TimedWord> words;
  std::istringstream in(text);
  std::string token;
  while (in >> token) {
    words.push_back(TimedWord{token, 0.0, 0.0});
  }
  return word_line(words);
}

std::string CaptionRenderer::build_script(const Transcript &transcript,
                                          const TimeSegment &clip,
                                          CaptionRenderReport &report) const {
  report = CaptionRenderReport{};
  const double clip_len = clip.duration();
  if (preset_.style == CaptionStyle::None || clip_len <= 0) {
    report.ok = preset_.style == CaptionStyle::None;
    if (!report.ok)
      report.error = "empty clip range";
    return {};
  }

  std::string script = header();

  auto emit = [&](double start, double end, const std::string &text) {
    start = std::clamp(start - clip.start, 0.0, clip_len);
    end = std::clamp(end - clip.start, 0.0, clip_len);
    if (end <= start || text.empty())
      return;
    script += fmt::format("Dialogue: 0,{},{},Default,,0,0,0,,{}\n",
                          ass_time(start), ass_time(end), text);
    ++report.events;
  };

  if (transcript.has_word_timing()) {
    for (const auto &seg : transcript.segments) {
      std::vector<TimedWord> group;
      for (const auto &w : seg.words) {
        if (w.end <= clip.start || w.start >= clip.end)
          continue;
        group.push_back(w);
        if (static_cast<int>(group.size()) == max_words_) {
          emit(group.front().start, group.back().end, word_line(group));
          group.clear();
        }
      }
      if (!group.empty()) {
        emit(group.front().start, group.back().end, word_line(group));
      }
    }
  } else {
    /// Segment-level fallback; karaoke loses its per-word highlight
    report.degraded = preset_.per_word_timing;
    for (const auto &seg : transcript.segments) {
      if (seg.end <= clip.start || seg.start >= clip.end)
        continue;
      emit(seg.start, seg.end, segment_line(seg.text));
    }
  }

  report.ok = true;
  LOG_DEBUG("[captions] {} events for {:.2f}-{:.2f}s (style {}{})",
            report.events, clip.start, clip.end, preset_.name,
            report.degraded ? ", degraded" : "");
  return script;
}

CaptionRenderReport
CaptionRenderer::render_to_file(const Transcript &transcript,
                                const TimeSegment &clip,
                                const std::string &path) const {
  CaptionRenderReport report;
  std::string script = build_script(transcript, clip, report);
  if (!report.ok)
    return report;

  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    report.ok = false;
    report.error = fmt::format("cannot open {} for writing", path);
    return report;
  }
  out << script;
  out.close();
  if (!out) {
    report.ok = false;
    report.error = fmt::format("failed writing {}", path);
  }
  return report;
}

} // namespace clipforge
