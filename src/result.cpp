#include "promptguard/result.hpp"

#include <iomanip>
#include <sstream>

namespace promptguard {

namespace {

std::string fixed2(double v) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << v;
    return os.str();
}

std::string padded(const char* s, std::size_t width) {
    std::string out(s);
    if (out.size() < width) out.append(width - out.size(), ' ');
    return out;
}

} // namespace

std::string Rejection::debug_summary() const {
    std::ostringstream os;
    if (kind == RejectionKind::InputTooLong) {
        os << "Input rejected: exceeds maximum length\n";
    } else {
        os << "Prompt injection detected\n";
    }
    os << "  cause     : " << (category ? to_string(*category) : "input-length") << "\n"
       << "  score     : " << fixed2(score) << "\n"
       << "  threshold : " << fixed2(threshold) << "\n";

    for (const auto& note : notes) {
        os << "  note      : " << note << "\n";
    }

    if (!decisions.empty()) {
        os << "Decisions:\n";
    }
    for (const auto& d : decisions) {
        os << "  [" << padded(to_string(d.action), 8) << "] "
           << padded(to_string(d.category), 19)
           << " score=" << fixed2(d.score)
           << " threshold=" << fixed2(d.threshold)
           << " findings=" << d.finding_count();
        if (d.triggered) os << " TRIGGERED";
        os << "\n";
        if (d.faulted()) {
            os << "      ! detector fault: " << d.fault << "\n";
        }
        for (const auto& f : d.findings) {
            os << "      - " << f.detector_id
               << " [" << f.begin << "," << f.end << ")"
               << " " << fixed2(f.confidence)
               << " -- " << f.rationale << "\n";
        }
    }
    return os.str();
}

std::string Rejection::user_message() const {
    if (kind == RejectionKind::InputTooLong) {
        return "Your input is too long. Please shorten it and try again.";
    }
    return "Your input could not be processed because it contains content that "
           "resembles an attempt to manipulate the assistant.";
}

} // namespace promptguard
