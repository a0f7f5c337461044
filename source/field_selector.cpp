// field_selector.cpp - FieldSelector parsing and shape validation

#include <change_detect/field_selector.h>
#include <change_detect/errors.h>
#include <change_detect/logging.h>

namespace change_detect {

FieldSelector FieldSelector::field(std::string name)
{
    if (name.empty()) {
        throw InvalidFieldSelector("field selector name must not be empty");
    }
    return FieldSelector{Kind::Field, std::move(name)};
}

FieldSelector FieldSelector::parse(std::string_view text)
{
    if (text == ".")  return identity();
    if (text == "[]") return items();
    if (text == "{}") return entries();
    return field(std::string{text});
}

bool FieldSelector::accepts(const Value& object) const noexcept
{
    switch (kind_) {
        case Kind::Field:
        case Kind::Entries:
            return object.is_map();
        case Kind::Items:
            return object.is_sequence();
        case Kind::Identity:
            return true;
    }
    return false;
}

void FieldSelector::validate(const Value& object) const
{
    if (accepts(object)) {
        return;
    }
    const std::string text = to_string();
    const char* expected = kind_ == Kind::Items ? "a vector or array" : "a map or table";
    detail::log_selector_error("FieldSelector::validate", text, "does not fit the watched object");
    throw InvalidFieldSelector("selector '" + text + "' requires " + expected +
                               ", got " + value_to_string(object));
}

std::string FieldSelector::to_string() const
{
    switch (kind_) {
        case Kind::Field:    return name_;
        case Kind::Items:    return "[]";
        case Kind::Entries:  return "{}";
        case Kind::Identity: return ".";
    }
    return {};
}

} // namespace change_detect
