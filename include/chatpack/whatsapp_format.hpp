#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace cp {

// Locale grammars of WhatsApp text exports.
enum class DateFormat {
  US,                // [1/15/24, 10:30:00 AM] Sender: text
  EuDotBracketed,    // [15.01.24, 10:30:00] Sender: text
  EuDotNoBracket,    // 15.01.2024, 10:30 - Sender: text
  EuSlash,           // 15/01/2024, 10:30 - Sender: text
  EuSlashBracketed   // [15/01/2024, 10:30:00] Sender: text
};

constexpr std::size_t kDateFormatCount = 5;
constexpr std::size_t kDetectSampleLines = 20;
// Header grammars only look at this many leading bytes of a line.
constexpr std::size_t kHeaderScanLimit = 512;

// Immutable grammar: line pattern plus date templates tried in order.
struct FormatDescriptor {
  DateFormat id;
  const char* name;
  std::regex pattern;                  // groups: date, time, sender; match ends before the text
  std::vector<const char*> templates;  // applied to "<date>, <time>"
};

const FormatDescriptor& descriptor(DateFormat f);
const char* date_format_name(DateFormat f) noexcept;

// Order used to break ties between grammars with equal match counts.
const std::array<DateFormat, kDateFormatCount>& detection_priority() noexcept;

struct FormatScore {
  std::size_t matches = 0;   // sample lines matching the pattern
  std::size_t parsed  = 0;   // of those, lines whose date/time parse
};

// Scores of the first kDetectSampleLines non-empty lines, indexed by DateFormat.
std::array<FormatScore, kDateFormatCount> score_lines(const std::vector<std::string>& sample);

// Grammar with the most matching lines; ties go to the one whose templates
// parse more timestamps, then to detection_priority() order. nullopt when
// no line matches any grammar.
std::optional<DateFormat> detect_date_format(const std::vector<std::string>& sample);

struct LineMatch {
  std::string date;
  std::string time;
  std::string sender;
  std::string text;
};

// Matches one record header line; the sender is trimmed and the text is
// everything after the header. Narrow no-break spaces before AM/PM
// must already have been replaced (see clean_line).
bool match_line(const FormatDescriptor& f, std::string_view line, LineMatch& out);

// Removes leading U+200E marks and turns U+202F into a plain space.
std::string clean_line(std::string_view line);

std::optional<std::int64_t> parse_timestamp(const FormatDescriptor& f,
                                            std::string_view date, std::string_view time);

// Service entries: encryption notice, joins, leaves, subject changes...
bool is_system_message(std::string_view sender, std::string_view content);

}
