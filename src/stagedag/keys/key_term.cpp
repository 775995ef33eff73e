/**
 * @file key_term.cpp
 */
#include "stagedag/keys/key_term.hpp"
#include "stagedag/common/log.hpp"

namespace stagedag
{

namespace
{

bool starts_with(const std::string& s, const std::string& prefix)
{
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

/// An argument that is itself an option rather than a value.
bool looks_like_option(const std::string& arg)
{
    return arg.size() > 1 && arg[0] == '-' && !(arg[1] >= '0' && arg[1] <= '9');
}

struct Occurrence
{
    std::string flag;
    std::optional<std::string> value;
};

} // namespace

ArgList make_arg_list(int argc, const char* const* argv, int skip)
{
    ArgList args;
    for (int i = skip; i < argc; ++i)
    {
        args.emplace_back(argv[i]);
    }
    return args;
}

// ============================================================================
// KeyTerm
// ============================================================================

KeyTerm::KeyTerm(AnyKey key)
    : m_key(std::move(key))
{
}

KeyTermResult KeyTerm::run(const ArgList& args) const
{
    const std::vector<std::string>& names = m_key.info().doc().names();
    std::vector<Occurrence> occurrences;

    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        if (arg == "--")
        {
            break;
        }
        for (const auto& name : names)
        {
            std::string flag = Doc::flag_spelling(name);
            bool is_short = name.size() == 1;
            if (arg == flag)
            {
                Occurrence occ{flag, std::nullopt};
                if (i + 1 < args.size() && !looks_like_option(args[i + 1]))
                {
                    occ.value = args[i + 1];
                    ++i;
                }
                occurrences.push_back(std::move(occ));
                break;
            }
            if (is_short && arg.size() > 2 && starts_with(arg, flag) && arg[1] != '-')
            {
                occurrences.push_back(Occurrence{flag, arg.substr(2)});
                break;
            }
            if (!is_short && starts_with(arg, flag + "="))
            {
                occurrences.push_back(Occurrence{flag, arg.substr(flag.size() + 1)});
                break;
            }
        }
    }

    auto fail = [this](std::string input, std::string message)
    {
        STAGEDAG_LOG_WARN("term", message);
        return KeyTermResult{m_key, TermStatus::Failed, ValueCell{},
                             ParseFailure{m_key.name(), std::move(input), std::move(message)}};
    };

    if (occurrences.empty())
    {
        return KeyTermResult{m_key, TermStatus::Defaulted, m_key.info().default_cell(),
                             std::nullopt};
    }
    if (occurrences.size() > 1)
    {
        return fail(occurrences[1].value.value_or(""),
                    "option '" + occurrences[1].flag + "' cannot be repeated");
    }

    const Occurrence& occ = occurrences.front();
    if (!occ.value)
    {
        return fail("", "option '" + occ.flag + "' needs an argument");
    }

    auto parsed = m_key.info().parse_cell(*occ.value);
    if (!parsed)
    {
        return fail(*occ.value, "option '" + occ.flag + "': " + parsed.error());
    }
    STAGEDAG_LOG_DEBUG("term", "Key '" << m_key.name() << "' given as '" << *occ.value << "'");
    return KeyTermResult{m_key, TermStatus::Provided, parsed.value(), std::nullopt};
}

// ============================================================================
// TermOutcome
// ============================================================================

void TermOutcome::add(KeyTermResult result)
{
    m_results.push_back(std::move(result));
}

bool TermOutcome::ok() const noexcept
{
    for (const auto& result : m_results)
    {
        if (result.status == TermStatus::Failed)
        {
            return false;
        }
    }
    return true;
}

std::vector<ParseFailure> TermOutcome::failures() const
{
    std::vector<ParseFailure> result;
    for (const auto& r : m_results)
    {
        if (r.failure)
        {
            result.push_back(*r.failure);
        }
    }
    return result;
}

size_t TermOutcome::apply(EvalContext& ctx, bool include_defaults) const
{
    size_t bound = 0;
    for (const auto& result : m_results)
    {
        switch (result.status)
        {
        case TermStatus::Provided:
            ctx.bind(result.key, result.value, Provenance::CommandLine);
            ++bound;
            break;
        case TermStatus::Defaulted:
            if (include_defaults && !ctx.is_bound(result.key))
            {
                ctx.bind(result.key, result.value, Provenance::Default);
                ++bound;
            }
            break;
        case TermStatus::Failed:
            break;
        }
    }
    return bound;
}

// ============================================================================
// Term
// ============================================================================

std::vector<ArgSpec> Term::arg_specs() const
{
    std::vector<ArgSpec> specs;
    specs.reserve(m_key_terms.size());
    for (const auto& kt : m_key_terms)
    {
        specs.push_back(kt.arg_spec());
    }
    return specs;
}

TermOutcome Term::run(const ArgList& args) const
{
    TermOutcome outcome;
    for (const auto& kt : m_key_terms)
    {
        outcome.add(kt.run(args));
    }
    return outcome;
}

KeyTerm term_key(const AnyKey& key)
{
    return KeyTerm{key};
}

Term term(std::optional<Stage> stage_filter, const KeySet& keys)
{
    KeySet selected = stage_filter ? filter_stage(*stage_filter, keys) : keys;
    std::vector<KeyTerm> key_terms;
    key_terms.reserve(selected.size());
    for (const auto& key : selected)
    {
        key_terms.push_back(term_key(key));
    }
    return Term{std::move(key_terms)};
}

} // namespace stagedag
