#pragma once
#include <optional>
#include <string>
#include <utility>

// A per-field edit that is either "set to this value" or "leave unchanged".
// An empty string is a legitimate value, not a marker for "unchanged".
template <typename T>
class FieldUpdate {
public:
    FieldUpdate() = default;

    static FieldUpdate set(T value) {
        FieldUpdate update;
        update.new_value = std::move(value);
        return update;
    }

    static FieldUpdate fromOptional(const std::optional<T>& value) {
        return value ? set(*value) : FieldUpdate();
    }

    bool isSet() const { return new_value.has_value(); }
    const T& value() const { return *new_value; }

private:
    std::optional<T> new_value;
};

// Content edit for an Item (text and/or translation).
struct Correction {
    FieldUpdate<std::string> text;
    FieldUpdate<std::string> translation;

    bool empty() const { return !text.isSet() && !translation.isSet(); }
};
