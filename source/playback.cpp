// playback.cpp - Export of recorded observations as a Dart source file

#include <change_detect/playback.h>
#include <change_detect/logging.h>

#include <sstream>

namespace change_detect {

namespace {

// JSON string literal with `$` escaped for Dart
std::string quote_literal(std::string_view text)
{
    const std::string escaped = json_escape_string(text);

    std::string result;
    result.reserve(escaped.size() + 2);
    result += '"';
    for (char c : escaped) {
        if (c == '$') {
            result += '\\';
        }
        result += c;
    }
    result += '"';
    return result;
}

} // anonymous namespace

PlaybackRecorder::PlaybackRecorder(std::string library)
    : library_(std::move(library))
{
}

bool PlaybackRecorder::record(std::string key, std::string data)
{
    if (!seen_.insert(key).second) {
        detail::log_key_error("PlaybackRecorder::record", key, "already recorded");
        return false;
    }
    records_.emplace_back(std::move(key), std::move(data));
    return true;
}

bool PlaybackRecorder::record_value(std::string key, const Value& data)
{
    if (contains(key)) {
        return false;
    }
    return record(std::move(key), to_json(data, true));
}

std::string PlaybackRecorder::generate() const
{
    std::ostringstream oss;
    oss << "library " << library_ << ";\n"
        << "\n"
        << "import \"dart:json\" as json;\n"
        << "\n"
        << "// Auto-generated by record-playback\n"
        << "\n"
        << "Map<String, String> playbackData = {\n";

    for (const auto& [key, data] : records_) {
        oss << "  " << quote_literal(key) << ": json.parse(" << quote_literal(data) << "),\n";
    }

    oss << "};";
    return oss.str();
}

void PlaybackRecorder::clear()
{
    records_.clear();
    seen_.clear();
}

} // namespace change_detect
