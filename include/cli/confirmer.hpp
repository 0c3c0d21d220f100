#pragma once

#include <istream>
#include <ostream>
#include <string>

class Confirmer {
public:
    virtual ~Confirmer() = default;
    virtual bool confirm(const std::string& prompt) = 0;
};

// Asks on `out` and reads one line from `in`. Only "y" or "yes" (any case)
// count as agreement; end of input is a refusal.
class StreamConfirmer : public Confirmer {
public:
    StreamConfirmer(std::istream& in, std::ostream& out);
    bool confirm(const std::string& prompt) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

// Gate in front of destructive calls. Returns true when the call may proceed.
bool confirmUnlessOverridden(Confirmer& confirmer, bool overridden, const std::string& prompt);
