#include "ingest/slowlog_parser.hpp"

#include <charconv>
#include <chrono>

namespace ingest {
namespace {

constexpr std::string_view source_tag = "source[";
constexpr std::string_view extra_source_tag = "extra_source[";

inline bool parse_uint(std::string_view s, unsigned& out) noexcept {
    if (s.empty()) return false;
    auto res = std::from_chars(s.data(), s.data() + s.size(), out);
    return res.ec == std::errc{} && res.ptr == s.data() + s.size();
}

inline std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

// Reads "[...]" at the start of s (after optional blanks). Returns false if
// s does not start with a bracketed field.
bool take_bracketed(std::string_view& s, std::string_view& field) noexcept {
    s = trim(s);
    if (s.empty() || s.front() != '[') return false;
    const auto close = s.find(']');
    if (close == std::string_view::npos) return false;
    field = s.substr(1, close - 1);
    s.remove_prefix(close + 1);
    return true;
}

bool parse_json_section(std::string_view text, nlohmann::json& out) {
    text = trim(text);
    if (text.empty()) {
        out = nlohmann::json::object();
        return true;
    }
    out = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    return !out.is_discarded() && out.is_object();
}

} // namespace

bool parse_slowlog_timestamp(std::string_view text, core::LogTime& out) noexcept {
    text = trim(text);
    const auto frac = text.find_first_of(",.");
    if (frac != std::string_view::npos) {
        text = text.substr(0, frac);
    }
    // YYYY-MM-DDxHH:MM:SS
    if (text.size() != 19 || text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ') ||
        text[13] != ':' || text[16] != ':') {
        return false;
    }
    unsigned year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!parse_uint(text.substr(0, 4), year) || !parse_uint(text.substr(5, 2), month) ||
        !parse_uint(text.substr(8, 2), day) || !parse_uint(text.substr(11, 2), hour) ||
        !parse_uint(text.substr(14, 2), minute) || !parse_uint(text.substr(17, 2), second)) {
        return false;
    }
    const std::chrono::year_month_day ymd{std::chrono::year{static_cast<int>(year)},
                                          std::chrono::month{month},
                                          std::chrono::day{day}};
    if (!ymd.ok() || hour > 23 || minute > 59 || second > 60) {
        return false;
    }
    out = core::LogTime{std::chrono::sys_days{ymd}} + std::chrono::hours{hour} + std::chrono::minutes{minute} +
          std::chrono::seconds{second};
    return true;
}

SlowlogParseResult parse_slowlog_line(std::string_view line, core::RequestEvent& out, std::string& error) {
    std::string_view rest = trim(line);
    if (rest.empty()) {
        return SlowlogParseResult::Skipped;
    }

    std::string_view ts_field;
    std::string_view level_field;
    std::string_view type_field;
    std::string_view index_field;
    if (!take_bracketed(rest, ts_field) || !take_bracketed(rest, level_field) || !take_bracketed(rest, type_field) ||
        !take_bracketed(rest, index_field)) {
        error = "line does not start with [timestamp][level][type] [index]";
        return SlowlogParseResult::Malformed;
    }

    // Both sections are located from the right; the source JSON may itself
    // contain brackets.
    const auto extra_pos = rest.rfind(extra_source_tag);
    const auto extra_close = rest.rfind(']');
    if (extra_pos == std::string_view::npos || extra_close == std::string_view::npos ||
        extra_close < extra_pos + extra_source_tag.size()) {
        error = "missing extra_source[...] section";
        return SlowlogParseResult::Malformed;
    }
    std::string_view before_extra = rest.substr(0, extra_pos);
    while (!before_extra.empty() && (before_extra.back() == ' ' || before_extra.back() == '\t')) {
        before_extra.remove_suffix(1);
    }
    if (before_extra.size() < 2 || before_extra.back() != ',' || before_extra[before_extra.size() - 2] != ']') {
        error = "missing source[...] section";
        return SlowlogParseResult::Malformed;
    }
    const std::size_t source_close = before_extra.size() - 2;
    const auto source_pos = before_extra.rfind(source_tag, source_close);
    if (source_pos == std::string_view::npos) {
        error = "missing source[...] section";
        return SlowlogParseResult::Malformed;
    }

    const auto dot = type_field.rfind('.');
    const std::string_view request_type = (dot == std::string_view::npos) ? type_field : type_field.substr(dot + 1);
    if (trim(request_type) != "query") {
        return SlowlogParseResult::Skipped;
    }

    core::LogTime ts{};
    if (!parse_slowlog_timestamp(ts_field, ts)) {
        error = "bad timestamp '" + std::string(ts_field) + "'";
        return SlowlogParseResult::Malformed;
    }

    const std::size_t source_begin = source_pos + source_tag.size();
    nlohmann::json body;
    if (!parse_json_section(before_extra.substr(source_begin, source_close - source_begin), body)) {
        error = "source[...] is not a JSON object";
        return SlowlogParseResult::Malformed;
    }
    const std::size_t extra_begin = extra_pos + extra_source_tag.size();
    nlohmann::json extra;
    if (!parse_json_section(rest.substr(extra_begin, extra_close - extra_begin), extra)) {
        error = "extra_source[...] is not a JSON object";
        return SlowlogParseResult::Malformed;
    }
    body.update(extra);

    out.timestamp = ts;
    out.method = "POST";
    out.path = "/" + std::string(trim(index_field)) + "/_search";
    out.body = std::move(body);
    return SlowlogParseResult::Ok;
}

} // namespace ingest
