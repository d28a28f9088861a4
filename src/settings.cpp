#include "shroud/settings.hpp"
#include "shroud/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace shroud {

const SettingValue& Settings::get(std::string_view name) const {
    auto it = values_.find(std::string(name));
    if(it == values_.end()) throw config_error("setting '" + std::string(name) + "' is not defined");
    return it->second;
}

double Settings::number(std::string_view name) const {
    if(auto* d = std::get_if<double>(&get(name))) return *d;
    throw config_error("setting '" + std::string(name) + "' is not a number");
}

bool Settings::boolean(std::string_view name) const {
    if(auto* b = std::get_if<bool>(&get(name))) return *b;
    throw config_error("setting '" + std::string(name) + "' is not a boolean");
}

const std::string& Settings::text(std::string_view name) const {
    if(auto* s = std::get_if<std::string>(&get(name))) return *s;
    throw config_error("setting '" + std::string(name) + "' is not a string");
}

const char* setting_type_name(SettingType t){
    switch(t){
    case SettingType::Number: return "number";
    case SettingType::Boolean: return "boolean";
    case SettingType::Enum: return "enum";
    case SettingType::String: return "string";
    }
    return "?";
}

std::string format_setting(const SettingValue& v){
    if(auto* b = std::get_if<bool>(&v)) return *b ? "true" : "false";
    if(auto* d = std::get_if<double>(&v)){
        if(*d == std::floor(*d) && std::fabs(*d) < 1e15) return std::to_string(static_cast<long long>(*d));
        return std::to_string(*d);
    }
    return std::get<std::string>(v);
}

namespace {

std::string lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

SettingValue parse_value(const std::string& where, const SettingDescriptor& d, const std::string& raw){
    switch(d.type){
    case SettingType::Number: {
        char* end = nullptr;
        double v = std::strtod(raw.c_str(), &end);
        if(raw.empty() || !end || *end != '\0' || std::isnan(v))
            throw config_error(where + ": expected a number, got '" + raw + "'");
        if(d.min && v < *d.min) throw config_error(where + ": " + raw + " is below the minimum " + format_setting(*d.min));
        if(d.max && v > *d.max) throw config_error(where + ": " + raw + " is above the maximum " + format_setting(*d.max));
        return v;
    }
    case SettingType::Boolean: {
        std::string s = lower(raw);
        if(s == "true" || s == "1" || s == "yes" || s == "on") return true;
        if(s == "false" || s == "0" || s == "no" || s == "off") return false;
        throw config_error(where + ": expected a boolean, got '" + raw + "'");
    }
    case SettingType::Enum: {
        for(auto& v : d.values) if(lower(v) == lower(raw)) return v;
        std::string allowed;
        for(auto& v : d.values) allowed += (allowed.empty() ? "" : ", ") + v;
        throw config_error(where + ": '" + raw + "' is not one of " + allowed);
    }
    case SettingType::String:
        return raw;
    }
    throw config_error(where + ": unsupported setting type");
}

} // namespace

Settings resolve_settings(std::string_view owner, const SettingsSchema& schema, const SettingOverrides& overrides){
    std::map<std::string, SettingValue> out;
    for(auto& d : schema) out[d.name] = d.default_value;
    for(auto& [name, raw] : overrides){
        auto it = std::find_if(schema.begin(), schema.end(), [&](const SettingDescriptor& d){ return lower(d.name) == lower(name); });
        if(it == schema.end()) throw config_error(std::string(owner) + ": unknown setting '" + name + "'");
        out[it->name] = parse_value(std::string(owner) + "." + it->name, *it, raw);
    }
    return Settings(std::move(out));
}

} // namespace shroud
