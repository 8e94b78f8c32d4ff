#pragma once

#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include <replxx.hxx>

using Words = std::vector<std::string>;

enum class Outcome
{
    CONTINUE,
    QUIT
};

struct CommandSpec
{
    Words m_names;        // Primary name first, then abbreviations
    Words m_arg_choices;  // Offered by tab completion for the first argument
    size_t m_min_args;
    size_t m_max_args;
    std::string m_usage;  // e.g. "<hexaddr> [<hexcount>]"
    std::string m_summary;
    replxx::Replxx::Color m_colour;
    std::function<Outcome(const Words& args)> m_handler; // args excludes the command name
};

// The shell's commands, looked up by any of their names
class CommandTable final
{
public:
    void add(CommandSpec spec);

    // Runs one line of input.  Failures of the command itself are reported and don't end the session.
    Outcome dispatch(const std::string& line) const;

    [[nodiscard]] replxx::Replxx::completions_t complete(const std::string& input, int context_len) const;

    void print_help(std::ostream& os) const;

private:
    [[nodiscard]] const CommandSpec* find(const std::string& name) const;

    std::vector<CommandSpec> m_specs;
};

// "  dir   0 " gives {"dir","0"}
Words split_words(const std::string& line);
