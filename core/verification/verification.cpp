#include "verification/verification.hpp"

#include <algorithm>

namespace dagstore {

bool allPassed(const std::vector<VerificationResult>& results) {
    return std::all_of(results.begin(), results.end(),
                       [](const VerificationResult& r) { return r.passed; });
}

std::string formatFailures(const std::vector<VerificationResult>& results) {
    std::string report;
    for (const auto& r : results) {
        if (r.passed) continue;
        report += r.check_name + ": " + r.message + "\n";
    }
    return report;
}

} // namespace dagstore
