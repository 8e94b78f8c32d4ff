#include "commands.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

#include <boost/algorithm/string.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <xcbm/core/error.hpp>

void CommandTable::add(CommandSpec spec)
{
    m_specs.push_back(std::move(spec));
}

Outcome CommandTable::dispatch(const std::string& line) const
{
    const auto words = split_words(line);
    if (words.empty())
    {
        return Outcome::CONTINUE;
    }

    const auto* p_spec = find(words.front());
    if (!p_spec)
    {
        std::cout << fmt::format("No such command '{}'; try 'help'", words.front()) << std::endl;
        return Outcome::CONTINUE;
    }

    const Words args(words.begin() + 1, words.end());
    if ((args.size() < p_spec->m_min_args) || (args.size() > p_spec->m_max_args))
    {
        std::cout << "Usage: " << p_spec->m_names.front() << ' ' << p_spec->m_usage << std::endl;
        return Outcome::CONTINUE;
    }

    try
    {
        return p_spec->m_handler(args);
    }
    catch (const xcbm::Error& e)
    {
        spdlog::error("{} failed: {}", p_spec->m_names.front(), e.what());
    }
    catch (const std::exception& e)
    {
        spdlog::error("{} failed unexpectedly: {}", p_spec->m_names.front(), e.what());
    }
    return Outcome::CONTINUE;
}

replxx::Replxx::completions_t CommandTable::complete(const std::string& input, int context_len) const
{
    replxx::Replxx::completions_t result;
    const auto context = std::min(static_cast<size_t>(std::max(context_len, 0)), input.size());
    const auto prefix = input.substr(input.size() - context);

    const auto words = split_words(input);
    const auto completing_name = (context == input.size());
    if (completing_name)
    {
        for (const auto& spec : m_specs)
        {
            if (boost::starts_with(spec.m_names.front(), prefix))
            {
                result.emplace_back(spec.m_names.front(), spec.m_colour);
            }
        }
        return result;
    }

    // Only the first argument is completed
    const auto first_arg = (words.size() == 1) || ((words.size() == 2) && !prefix.empty());
    const auto* p_spec = words.empty() ? nullptr : find(words.front());
    if (p_spec && first_arg)
    {
        for (const auto& choice : p_spec->m_arg_choices)
        {
            if (boost::starts_with(choice, prefix))
            {
                result.emplace_back(choice, p_spec->m_colour);
            }
        }
    }
    return result;
}

void CommandTable::print_help(std::ostream& os) const
{
    for (const auto& spec : m_specs)
    {
        const auto synopsis = spec.m_usage.empty() ? boost::join(spec.m_names, "|")
                                                   : boost::join(spec.m_names, "|") + ' ' + spec.m_usage;
        os << fmt::format("  {:<32} {}", synopsis, spec.m_summary) << std::endl;
    }
}

const CommandSpec* CommandTable::find(const std::string& name) const
{
    const auto it = std::find_if(m_specs.begin(),
                                 m_specs.end(),
                                 [&name](const CommandSpec& spec) {
                                     return std::find(spec.m_names.begin(), spec.m_names.end(), name) !=
                                            spec.m_names.end();
                                 });
    return (it == m_specs.end()) ? nullptr : &*it;
}

Words split_words(const std::string& line)
{
    Words result;
    const auto trimmed = boost::trim_copy(line);
    if (trimmed.empty())
    {
        return result;
    }
    boost::split(result, trimmed, boost::is_any_of(" \t"), boost::token_compress_on);
    return result;
}
