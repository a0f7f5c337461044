// value.cpp - Value modification, printing and JSON output

#include <change_detect/value.h>
#include <change_detect/logging.h>

#include <cstdio>     // for std::snprintf
#include <iomanip>    // for std::setprecision
#include <iostream>
#include <sstream>    // for std::ostringstream

namespace change_detect {

// ============================================================
// Value modification
// ============================================================

Value Value::set(const std::string& key, Value val) const
{
    return set_box(key, ValueBox{std::move(val)});
}

Value Value::set_box(const std::string& key, ValueBox box) const
{
    if (auto* m = get_if<ValueMap>()) return m->set(key, std::move(box));
    if (auto* t = get_if<ValueTable>()) return t->insert(TableEntry{key, std::move(box)});
    if (is_null()) return ValueMap{}.set(key, std::move(box));
    detail::log_message("Value::set", "cannot set a key on a non-map value");
    return *this;
}

Value Value::set(std::size_t index, Value val) const
{
    if (auto* v = get_if<ValueVector>()) {
        if (index < v->size()) return v->set(index, ValueBox{std::move(val)});
    }
    if (auto* a = get_if<ValueArray>()) {
        if (index < a->size()) {
            return a->update(index, [&val](const ValueBox&) { return ValueBox{std::move(val)}; });
        }
    }
    detail::log_message("Value::set", "index out of range or non-sequence value");
    return *this;
}

Value Value::erase(const std::string& key) const
{
    if (auto* m = get_if<ValueMap>()) return m->erase(key);
    if (auto* t = get_if<ValueTable>()) return t->erase(key);
    return *this;
}

Value Value::push_back(Value val) const
{
    if (auto* v = get_if<ValueVector>()) return v->push_back(ValueBox{std::move(val)});
    if (auto* a = get_if<ValueArray>()) return a->push_back(ValueBox{std::move(val)});
    if (is_null()) return ValueVector{}.push_back(ValueBox{std::move(val)});
    detail::log_message("Value::push_back", "cannot append to a non-sequence value");
    return *this;
}

bool operator==(const Value& a, const Value& b)
{
    return a.data == b.data;
}

// ============================================================
// Printing
// ============================================================

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int32_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg) + "L";
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{map:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[vector:" + std::to_string(arg.size()) + "]";
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            return "[array:" + std::to_string(arg.size()) + "]";
        } else if constexpr (std::is_same_v<T, ValueTable>) {
            return "<table:" + std::to_string(arg.size()) + ">";
        } else {
            return "null";
        }
    }, val.data);
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, ValueMap>) {
            std::cout << indent << prefix << "{\n";
            for (const auto& [k, v] : arg) {
                print_value(*v, k + ": ", depth + 1);
            }
            std::cout << indent << "}\n";
        } else if constexpr (std::is_same_v<T, ValueTable>) {
            std::cout << indent << prefix << "<\n";
            for (const auto& entry : arg) {
                print_value(*entry.value, entry.id + ": ", depth + 1);
            }
            std::cout << indent << ">\n";
        } else if constexpr (std::is_same_v<T, ValueVector> || std::is_same_v<T, ValueArray>) {
            std::cout << indent << prefix << "[\n";
            for (std::size_t i = 0; i < arg.size(); ++i) {
                print_value(*arg[i], "[" + std::to_string(i) + "] ", depth + 1);
            }
            std::cout << indent << "]\n";
        } else {
            std::cout << indent << prefix << value_to_string(val) << "\n";
        }
    }, val.data);
}

// ============================================================
// JSON output
// ============================================================

std::string json_escape_string(std::string_view s)
{
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

namespace {

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level)
{
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    // Writes "{...}" for both maps and tables
    auto write_object = [&](const auto& entries, auto&& key_of, auto&& value_of) {
        if (entries.size() == 0) {
            oss << "{}";
            return;
        }
        oss << "{" << newline;
        bool first = true;
        for (const auto& entry : entries) {
            if (!first) oss << "," << newline;
            first = false;
            oss << child_indent << "\"" << json_escape_string(key_of(entry)) << "\":" << space_after_colon;
            to_json_impl(value_of(entry), oss, compact, indent_level + 1);
        }
        oss << newline << indent << "}";
    };

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, int64_t>) {
            oss << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            oss << std::setprecision(15) << arg;
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            write_object(arg,
                         [](const auto& kv) -> const std::string& { return kv.first; },
                         [](const auto& kv) -> const Value& { return *kv.second; });
        } else if constexpr (std::is_same_v<T, ValueTable>) {
            write_object(arg,
                         [](const TableEntry& e) -> const std::string& { return e.id; },
                         [](const TableEntry& e) -> const Value& { return *e.value; });
        } else if constexpr (std::is_same_v<T, ValueVector> || std::is_same_v<T, ValueArray>) {
            if (arg.size() == 0) {
                oss << "[]";
            } else {
                oss << "[" << newline;
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    if (i > 0) oss << "," << newline;
                    oss << child_indent;
                    to_json_impl(*arg[i], oss, compact, indent_level + 1);
                }
                oss << newline << indent << "]";
            }
        }
    }, val.data);
}

} // anonymous namespace

std::string to_json(const Value& val, bool compact)
{
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

} // namespace change_detect
