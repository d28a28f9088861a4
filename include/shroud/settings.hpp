#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace shroud {

using SettingValue = std::variant<bool, double, std::string>;

enum class SettingType { Number, Boolean, Enum, String };

struct SettingDescriptor {
    std::string name;
    SettingType type{SettingType::Number};
    SettingValue default_value;
    std::optional<double> min;
    std::optional<double> max;
    std::vector<std::string> values; // Enum only
    std::string description;
};

using SettingsSchema = std::vector<SettingDescriptor>;

// Resolved settings of one step: every schema entry present, typed.
class Settings {
public:
    Settings() = default;
    explicit Settings(std::map<std::string, SettingValue> values) : values_(std::move(values)) {}

    double number(std::string_view name) const;
    bool boolean(std::string_view name) const;
    const std::string& text(std::string_view name) const;
    bool has(std::string_view name) const { return values_.count(std::string(name)) != 0; }
    const std::map<std::string, SettingValue>& values() const { return values_; }

private:
    const SettingValue& get(std::string_view name) const;
    std::map<std::string, SettingValue> values_;
};

// Raw overrides as written on the command line or in a preset ("0.5", "true", "base64").
using SettingOverrides = std::map<std::string, std::string>;

// Fills defaults and validates overrides. Unknown names, unparseable values, out-of-range
// numbers and unknown enum values are a config_error naming `owner`.
Settings resolve_settings(std::string_view owner, const SettingsSchema& schema, const SettingOverrides& overrides);

const char* setting_type_name(SettingType t);
std::string format_setting(const SettingValue& v);

} // namespace shroud
