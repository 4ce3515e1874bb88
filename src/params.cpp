/**
 * @file params.cpp
 * @brief 参数解析与类型转换
 */

#include "lbt/params.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace lbt {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool parseLong(const std::string& s, long& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = v;
    return true;
}

bool parseDouble(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = v;
    return true;
}

bool isNumeric(const ParamValue& v) {
    return std::holds_alternative<int>(v) ||
           std::holds_alternative<long>(v) ||
           std::holds_alternative<double>(v);
}

double numericValue(const ParamValue& v) {
    if (const int* i = std::get_if<int>(&v)) return static_cast<double>(*i);
    if (const long* l = std::get_if<long>(&v)) return static_cast<double>(*l);
    return std::get<double>(v);
}

} // namespace

double Params::getNumber(const std::string& name) const {
    const ParamValue& v = raw(name);
    if (!isNumeric(v)) {
        throw std::invalid_argument("Parameter is not numeric: " + name);
    }
    return numericValue(v);
}

long Params::getInteger(const std::string& name) const {
    const ParamValue& v = raw(name);
    if (const int* i = std::get_if<int>(&v)) return *i;
    if (const long* l = std::get_if<long>(&v)) return *l;
    if (const double* d = std::get_if<double>(&v)) {
        if (std::floor(*d) == *d) return static_cast<long>(*d);
    }
    throw std::invalid_argument("Parameter is not an integer: " + name);
}

Size Params::getCount(const std::string& name) const {
    long n = getInteger(name);
    if (n < 0) {
        throw std::invalid_argument("Parameter must not be negative: " + name +
                                    " = " + std::to_string(n));
    }
    return static_cast<Size>(n);
}

std::vector<double> Params::getList(const std::string& name) const {
    const ParamValue& v = raw(name);
    if (const auto* list = std::get_if<std::vector<double>>(&v)) {
        return *list;
    }
    if (isNumeric(v)) {
        return {numericValue(v)};
    }
    throw std::invalid_argument("Parameter is not a list: " + name);
}

std::vector<std::string> Params::keys() const {
    std::vector<std::string> result;
    result.reserve(params_.size());
    for (const auto& [key, _] : params_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

ParamValue Params::parseValue(const std::string& text) {
    std::string s = trim(text);
    if (s == "true") return true;
    if (s == "false") return false;

    long l = 0;
    if (parseLong(s, l)) {
        if (l >= std::numeric_limits<int>::min() && l <= std::numeric_limits<int>::max()) {
            return static_cast<int>(l);
        }
        return l;
    }

    double d = 0;
    if (parseDouble(s, d)) return d;

    if (s.find(',') != std::string::npos) {
        std::vector<double> list;
        std::stringstream ss(s);
        std::string item;
        bool allNumbers = true;
        while (std::getline(ss, item, ',')) {
            double x = 0;
            if (!parseDouble(trim(item), x)) {
                allNumbers = false;
                break;
            }
            list.push_back(x);
        }
        if (allNumbers) return list;
    }
    return s;
}

void Params::parseAssignment(const std::string& assignment) {
    auto eq = assignment.find('=');
    if (eq == std::string::npos) {
        throw std::invalid_argument("Expected key=value, got: " + assignment);
    }
    std::string key = trim(assignment.substr(0, eq));
    if (key.empty()) {
        throw std::invalid_argument("Empty parameter name in: " + assignment);
    }
    params_[key] = parseValue(assignment.substr(eq + 1));
}

void Params::overrideChecked(const Params& overrides) {
    for (const auto& [key, value] : overrides.params_) {
        auto it = params_.find(key);
        if (it == params_.end()) {
            throw std::invalid_argument("Unknown parameter: " + key);
        }
        ParamValue& current = it->second;
        if (current.index() == value.index()) {
            current = value;
        } else if (std::holds_alternative<double>(current) && isNumeric(value)) {
            current = numericValue(value);
        } else if (std::holds_alternative<std::vector<double>>(current) && isNumeric(value)) {
            current = std::vector<double>{numericValue(value)};
        } else if ((std::holds_alternative<int>(current) || std::holds_alternative<long>(current)) &&
                   isNumeric(value) && std::floor(numericValue(value)) == numericValue(value)) {
            if (std::holds_alternative<int>(current)) {
                current = static_cast<int>(numericValue(value));
            } else {
                current = static_cast<long>(numericValue(value));
            }
        } else {
            throw std::invalid_argument("Incompatible type for parameter: " + key);
        }
    }
}

std::string toString(const ParamValue& value) {
    std::ostringstream oss;
    if (const bool* b = std::get_if<bool>(&value)) {
        oss << (*b ? "true" : "false");
    } else if (const int* i = std::get_if<int>(&value)) {
        oss << *i;
    } else if (const long* l = std::get_if<long>(&value)) {
        oss << *l;
    } else if (const double* d = std::get_if<double>(&value)) {
        oss << *d;
    } else if (const std::string* s = std::get_if<std::string>(&value)) {
        oss << *s;
    } else {
        const auto& list = std::get<std::vector<double>>(value);
        for (size_t i = 0; i < list.size(); ++i) {
            if (i > 0) oss << ",";
            oss << list[i];
        }
    }
    return oss.str();
}

Params loadParamsFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open parameter file: " + path);
    }

    Params params;
    std::string line;
    int lineNo = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        std::string s = trim(line);
        if (s.empty() || s[0] == '#') continue;
        try {
            params.parseAssignment(s);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(path + ":" + std::to_string(lineNo) + ": " + e.what());
        }
    }
    return params;
}

} // namespace lbt
