#include "consolebar/bar/percentage_format.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>
#include <vector>

namespace consolebar {
namespace bar {

namespace {

constexpr int DEFAULT_STANDARD_PRECISION = 2;
constexpr int MAX_PRECISION = 15;
constexpr const char* PER_MILLE = "\xE2\x80\xB0";

struct CustomSection {
    std::string prefix;
    std::string suffix;
    int min_integer_digits = 0;
    int min_fraction_digits = 0;
    int max_fraction_digits = 0;
    int scale_divisions = 0;
    int percent_count = 0;
    int permille_count = 0;
    bool grouping = false;
    bool has_placeholders = false;
};

std::string groupThousands(const std::string& digits) {
    std::string result;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            result.push_back(',');
        }
        result.push_back(*it);
        ++count;
    }
    std::reverse(result.begin(), result.end());
    return result;
}

// Normalise to 15 significant digits, then round half away from zero.
double roundTo(double value, int decimals) {
    double normalised = std::strtod(fmt::format("{:.14e}", value).c_str(), nullptr);
    double factor = std::pow(10.0, decimals);
    return std::round(normalised * factor) / factor;
}

std::string fixed(double magnitude, int decimals, bool grouping) {
    std::string text = fmt::format("{:.{}f}", roundTo(magnitude, decimals), decimals);
    if (!grouping) {
        return text;
    }
    auto dot = text.find('.');
    std::string integer = text.substr(0, dot);
    std::string rest = dot == std::string::npos ? "" : text.substr(dot);
    return groupThousands(integer) + rest;
}

bool isZeroText(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](char c) {
        return !std::isdigit(static_cast<unsigned char>(c)) || c == '0';
    });
}

bool tryStandardFormat(double value, const std::string& pattern, std::string& out) {
    if (pattern.empty() || pattern.size() > 3 || !std::isalpha(static_cast<unsigned char>(pattern[0]))) {
        return false;
    }
    for (size_t i = 1; i < pattern.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(pattern[i]))) {
            return false;
        }
    }
    
    char specifier = static_cast<char>(std::toupper(static_cast<unsigned char>(pattern[0])));
    bool has_precision = pattern.size() > 1;
    int precision = has_precision ? std::min(std::atoi(pattern.c_str() + 1), MAX_PRECISION)
                                  : DEFAULT_STANDARD_PRECISION;
    
    std::string body;
    double magnitude = std::fabs(value);
    switch (specifier) {
        case 'P':
            body = fixed(magnitude * 100.0, precision, true) + " %";
            break;
        case 'F':
            body = fixed(magnitude, precision, false);
            break;
        case 'N':
            body = fixed(magnitude, precision, true);
            break;
        case 'G':
            body = has_precision && precision > 0
                ? fmt::format("{:.{}g}", magnitude, precision)
                : fmt::format("{}", magnitude);
            break;
        default:
            return false;
    }
    
    out = (value < 0 && !isZeroText(body)) ? "-" + body : body;
    return true;
}

std::vector<std::string> splitSections(const std::string& pattern) {
    std::vector<std::string> sections(1);
    char quote = 0;
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '\\' && i + 1 < pattern.size()) {
            sections.back().push_back(c);
            c = pattern[++i];
        } else if (c == ';') {
            sections.emplace_back();
            continue;
        }
        sections.back().push_back(c);
    }
    return sections;
}

CustomSection parseSection(const std::string& pattern) {
    CustomSection section;
    bool in_fraction = false;
    int pending_commas = 0;
    
    auto literal = [&section](const std::string& text) {
        (section.has_placeholders ? section.suffix : section.prefix) += text;
    };
    auto settleCommas = [&section, &pending_commas]() {
        section.scale_divisions += pending_commas;
        pending_commas = 0;
    };
    
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        
        if (c == '0' || c == '#') {
            if (in_fraction) {
                section.max_fraction_digits++;
                if (c == '0') {
                    section.min_fraction_digits = section.max_fraction_digits;
                }
            } else {
                if (pending_commas > 0 && section.has_placeholders) {
                    section.grouping = true;
                }
                pending_commas = 0;
                if (c == '0') {
                    section.min_integer_digits++;
                }
            }
            section.has_placeholders = true;
        } else if (c == '.' && !in_fraction) {
            settleCommas();
            in_fraction = true;
            section.has_placeholders = true;
        } else if (c == ',' && !in_fraction && section.has_placeholders) {
            pending_commas++;
        } else if (c == '%') {
            section.percent_count++;
            literal("%");
        } else if (pattern.compare(i, 3, PER_MILLE) == 0) {
            section.permille_count++;
            literal(PER_MILLE);
            i += 2;
        } else if (c == '\\' && i + 1 < pattern.size()) {
            literal(std::string(1, pattern[++i]));
        } else if (c == '\'' || c == '"') {
            auto end = pattern.find(c, i + 1);
            if (end == std::string::npos) {
                end = pattern.size();
            }
            literal(pattern.substr(i + 1, end - i - 1));
            i = end;
        } else {
            literal(std::string(1, c));
        }
    }
    settleCommas();
    
    return section;
}

std::string applySection(const CustomSection& section, double magnitude) {
    double scaled = magnitude
        * std::pow(100.0, section.percent_count)
        * std::pow(1000.0, section.permille_count)
        / std::pow(1000.0, section.scale_divisions);
    
    if (!section.has_placeholders) {
        return section.prefix + section.suffix;
    }
    
    int decimals = std::min(section.max_fraction_digits, MAX_PRECISION);
    std::string text = fmt::format("{:.{}f}", roundTo(scaled, decimals), decimals);
    
    auto dot = text.find('.');
    std::string integer = text.substr(0, dot);
    std::string fraction = dot == std::string::npos ? "" : text.substr(dot + 1);
    
    while (static_cast<int>(fraction.size()) > section.min_fraction_digits && !fraction.empty() &&
           fraction.back() == '0') {
        fraction.pop_back();
    }
    
    if (integer == "0" && section.min_integer_digits == 0) {
        integer.clear();
    }
    if (static_cast<int>(integer.size()) < section.min_integer_digits) {
        integer.insert(0, section.min_integer_digits - integer.size(), '0');
    }
    if (section.grouping && !integer.empty()) {
        integer = groupThousands(integer);
    }
    
    std::string number = fraction.empty() ? integer : integer + "." + fraction;
    return section.prefix + number + section.suffix;
}

std::string formatCustom(double value, const std::string& pattern) {
    auto sections = splitSections(pattern);
    double magnitude = std::fabs(value);
    
    const CustomSection primary = parseSection(sections[0]);
    std::string rendered = applySection(primary, magnitude);
    bool rounds_to_zero = isZeroText(rendered.substr(primary.prefix.size(),
        rendered.size() - primary.prefix.size() - primary.suffix.size()));
    
    if (rounds_to_zero && sections.size() > 2 && !sections[2].empty()) {
        return applySection(parseSection(sections[2]), magnitude);
    }
    if (value < 0 && !rounds_to_zero) {
        if (sections.size() > 1 && !sections[1].empty()) {
            return applySection(parseSection(sections[1]), magnitude);
        }
        return "-" + rendered;
    }
    return rendered;
}

}

std::string formatPercentage(double value, const std::string& pattern) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }
    
    std::string out;
    if (tryStandardFormat(value, pattern, out)) {
        return out;
    }
    return formatCustom(value, pattern);
}

}}
