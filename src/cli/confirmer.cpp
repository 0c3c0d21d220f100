#include "cli/confirmer.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>

StreamConfirmer::StreamConfirmer(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
}

bool StreamConfirmer::confirm(const std::string& prompt) {
    out_ << prompt << " [y/N]: " << std::flush;

    std::string answer;
    if (!std::getline(in_, answer)) {
        out_ << std::endl;
        return false;
    }

    answer.erase(std::remove_if(answer.begin(), answer.end(),
                                [](unsigned char c) { return std::isspace(c); }),
                 answer.end());
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer == "y" || answer == "yes";
}

bool confirmUnlessOverridden(Confirmer& confirmer, bool overridden, const std::string& prompt) {
    if (overridden) {
        Logger::debug("Confirmation skipped: " + prompt);
        return true;
    }
    bool accepted = confirmer.confirm(prompt);
    Logger::info(std::string("Confirmation ") + (accepted ? "accepted" : "declined") + ": " + prompt);
    return accepted;
}
