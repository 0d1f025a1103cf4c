#include "mdwf/schema.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>

#include <yaml-cpp/yaml.h>

namespace mdwf {

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_hex_digit(char c) {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// [-+]?[0-9]+ | 0o[0-7]+ | 0x[0-9a-fA-F]+
bool parse_core_int(const std::string& value, int64_t& out) {
    if (value.size() > 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'o')) {
        const bool hex = value[1] == 'x';
        for (size_t i = 2; i < value.size(); ++i) {
            char c = value[i];
            if (hex ? !is_hex_digit(c) : (c < '0' || c > '7')) return false;
        }
        errno = 0;
        unsigned long long parsed = std::strtoull(value.c_str() + 2, nullptr, hex ? 16 : 8);
        if (errno != 0 ||
            parsed > static_cast<unsigned long long>(std::numeric_limits<int64_t>::max())) {
            return false;
        }
        out = static_cast<int64_t>(parsed);
        return true;
    }

    size_t i = (value[0] == '-' || value[0] == '+') ? 1 : 0;
    if (i == value.size()) return false;
    for (size_t k = i; k < value.size(); ++k) {
        if (!is_digit(value[k])) return false;
    }
    errno = 0;
    long long parsed = std::strtoll(value.c_str(), nullptr, 10);
    if (errno != 0) return false;
    out = static_cast<int64_t>(parsed);
    return true;
}

// [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?
bool is_core_float(const std::string& value) {
    size_t i = 0;
    if (value[i] == '-' || value[i] == '+') ++i;

    size_t int_digits = 0;
    while (i < value.size() && is_digit(value[i])) { ++i; ++int_digits; }

    size_t frac_digits = 0;
    if (i < value.size() && value[i] == '.') {
        ++i;
        while (i < value.size() && is_digit(value[i])) { ++i; ++frac_digits; }
    }
    if (int_digits == 0 && frac_digits == 0) return false;

    if (i < value.size() && (value[i] == 'e' || value[i] == 'E')) {
        ++i;
        if (i < value.size() && (value[i] == '-' || value[i] == '+')) ++i;
        size_t exp_digits = 0;
        while (i < value.size() && is_digit(value[i])) { ++i; ++exp_digits; }
        if (exp_digits == 0) return false;
    }
    return i == value.size();
}

bool parse_core_float(const std::string& value, double& out) {
    static const char* const kInf[] = {".inf", ".Inf", ".INF"};
    static const char* const kNan[] = {".nan", ".NaN", ".NAN"};

    std::string body = value;
    bool negative = false;
    if (!body.empty() && (body[0] == '-' || body[0] == '+')) {
        negative = body[0] == '-';
        body.erase(0, 1);
    }
    for (const char* inf : kInf) {
        if (body == inf) {
            out = negative ? -std::numeric_limits<double>::infinity()
                           : std::numeric_limits<double>::infinity();
            return true;
        }
    }
    for (const char* nan : kNan) {
        if (value == nan) {
            out = std::numeric_limits<double>::quiet_NaN();
            return true;
        }
    }

    if (!is_core_float(value)) return false;
    errno = 0;
    out = std::strtod(value.c_str(), nullptr);
    return errno == 0;
}

// Plain scalars are typed the way YAML 1.2 core schema types them; anything
// outside its int and float grammar stays a string. Integers that overflow
// int64 fall through to float. Quoted scalars carry the "!" tag and always
// stay strings.
nlohmann::json yaml_to_json(const YAML::Node& node) {
    if (!node.IsDefined() || node.IsNull()) {
        return nullptr;
    }
    if (node.IsScalar()) {
        const std::string scalar = node.Scalar();
        if (node.Tag() == "!") {
            return scalar;
        }
        if (scalar == "true" || scalar == "True" || scalar == "TRUE") return true;
        if (scalar == "false" || scalar == "False" || scalar == "FALSE") return false;
        if (scalar.empty()) return scalar;
        int64_t as_int = 0;
        if (parse_core_int(scalar, as_int)) {
            return as_int;
        }
        double as_double = 0.0;
        if (parse_core_float(scalar, as_double)) {
            return as_double;
        }
        return scalar;
    }
    if (node.IsSequence()) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& item : node) {
            arr.push_back(yaml_to_json(item));
        }
        return arr;
    }
    if (node.IsMap()) {
        nlohmann::json obj = nlohmann::json::object();
        for (const auto& pair : node) {
            obj[pair.first.as<std::string>()] = yaml_to_json(pair.second);
        }
        return obj;
    }
    return nullptr;
}

} // namespace

Result<nlohmann::json> parse_yaml_document(const std::string& text,
                                           const std::string& source_name) {
    std::string where = source_name.empty() ? std::string("document") : source_name;
    try {
        YAML::Node root = YAML::Load(text);
        return Result<nlohmann::json>::ok(yaml_to_json(root));
    } catch (const YAML::Exception& e) {
        return Result<nlohmann::json>::err(
            Error::validation("invalid YAML in " + where + ": " + e.what()));
    }
}

} // namespace mdwf
