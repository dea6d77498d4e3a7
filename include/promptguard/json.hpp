#pragma once

#include "promptguard/policy.hpp"
#include "promptguard/result.hpp"

#include <cstdio>
#include <iomanip>
#include <sstream>
#include <string>

namespace promptguard {

namespace json_detail {

inline std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

inline std::string quoted(const std::string& s) {
    return "\"" + escape(s) + "\"";
}

inline std::string number(double v) {
    std::ostringstream os;
    os << std::setprecision(4) << v;
    return os.str();
}

inline std::string string_array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += quoted(items[i]);
    }
    return out + "]";
}

} // namespace json_detail

inline std::string to_json(const Finding& f) {
    std::ostringstream os;
    os << "{ \"detector\": "   << json_detail::quoted(f.detector_id)
       << ", \"begin\": "      << f.begin
       << ", \"end\": "        << f.end
       << ", \"confidence\": " << json_detail::number(f.confidence)
       << ", \"rationale\": "  << json_detail::quoted(f.rationale)
       << " }";
    return os.str();
}

inline std::string to_json(const Decision& d) {
    std::ostringstream os;
    os << "{ \"category\": "  << json_detail::quoted(to_string(d.category))
       << ", \"score\": "     << json_detail::number(d.score)
       << ", \"threshold\": " << json_detail::number(d.threshold)
       << ", \"triggered\": " << (d.triggered ? "true" : "false")
       << ", \"action\": "    << json_detail::quoted(to_string(d.action));
    if (d.faulted()) {
        os << ", \"fault\": " << json_detail::quoted(d.fault);
    }
    os << ", \"findings\": [";
    for (std::size_t i = 0; i < d.findings.size(); ++i) {
        if (i > 0) os << ", ";
        os << to_json(d.findings[i]);
    }
    os << "] }";
    return os.str();
}

inline std::string to_json(const Success& s) {
    std::ostringstream os;
    os << "{\n"
       << "  \"success\": true,\n"
       << "  \"text\": "  << json_detail::quoted(s.text) << ",\n"
       << "  \"notes\": " << json_detail::string_array(s.notes) << ",\n"
       << "  \"warnings\": [";
    for (std::size_t i = 0; i < s.warnings.size(); ++i) {
        os << "\n    " << to_json(s.warnings[i]);
        if (i + 1 < s.warnings.size()) os << ",";
    }
    os << "\n  ]\n"
       << "}";
    return os.str();
}

inline std::string to_json(const Rejection& r) {
    std::ostringstream os;
    os << "{\n"
       << "  \"success\": false,\n"
       << "  \"kind\": "      << json_detail::quoted(r.kind == RejectionKind::Threat ? "threat" : "inputTooLong") << ",\n"
       << "  \"category\": "  << (r.category ? json_detail::quoted(to_string(*r.category)) : "null") << ",\n"
       << "  \"score\": "     << json_detail::number(r.score) << ",\n"
       << "  \"threshold\": " << json_detail::number(r.threshold) << ",\n"
       << "  \"notes\": "     << json_detail::string_array(r.notes) << ",\n"
       << "  \"decisions\": [";
    for (std::size_t i = 0; i < r.decisions.size(); ++i) {
        os << "\n    " << to_json(r.decisions[i]);
        if (i + 1 < r.decisions.size()) os << ",";
    }
    os << "\n  ]\n"
       << "}";
    return os.str();
}

inline std::string to_json(const ValidationResult& result) {
    if (const auto* ok = std::get_if<Success>(&result)) return to_json(*ok);
    return to_json(std::get<Rejection>(result));
}

inline std::string to_json(const ConfigError& e) {
    std::ostringstream os;
    os << "{ \"error\": " << json_detail::quoted(to_string(e.code))
       << ", \"message\": " << json_detail::quoted(e.message) << " }";
    return os.str();
}

} // namespace promptguard
