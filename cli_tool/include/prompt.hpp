#pragma once

#include <iostream>
#include <string>

// Operator interaction used by the pipelines.
class Prompter {
   public:
    virtual ~Prompter() = default;

    // Reads a line without echoing it. An empty string means no answer.
    virtual std::string read_secret(const std::string& prompt) = 0;
    // Yes/no question; an empty answer takes default_yes.
    virtual bool confirm(const std::string& prompt, bool default_yes = true) = 0;
};

class TerminalPrompter : public Prompter {
   public:
    TerminalPrompter(std::istream& in = std::cin, std::ostream& out = std::cerr) : m_in(in), m_out(out) {}

    std::string read_secret(const std::string& prompt) override;
    bool confirm(const std::string& prompt, bool default_yes = true) override;

   private:
    std::istream& m_in;
    std::ostream& m_out;
};

// Accepts an answer of "y"/"Y"; anything else is a no. Empty falls back to default_yes.
bool is_yes(const std::string& answer, bool default_yes);
