/**
 * @file key_term.hpp
 * @brief Command-line parsing of keys, as pure functions from arguments to values.
 */
#pragma once
#include "stagedag/common/common.hpp"
#include "stagedag/keys/eval_context.hpp"
#include "stagedag/keys/key.hpp"

namespace stagedag
{

using ArgList = std::vector<std::string>;

/**
 * @brief Copy process arguments, skipping the first @p skip entries.
 */
ArgList make_arg_list(int argc, const char* const* argv, int skip = 1);

/**
 * @brief A key's raw command-line input that could not be used.
 */
struct ParseFailure
{
    std::string key;
    std::string input;
    std::string message;
};

enum class TermStatus
{
    Provided,   ///< A value was given on the command line.
    Defaulted,  ///< The key was absent; the result carries the default.
    Failed      ///< The key was given but its input was unusable.
};

struct KeyTermResult
{
    AnyKey key;
    TermStatus status;
    ValueCell value;                     ///< Empty when status is Failed.
    std::optional<ParseFailure> failure; ///< Set when status is Failed.
};

/**
 * @brief Parser for one key's command-line option.
 *
 * @details
 * Spellings come from the key's Doc. One-letter names accept `-x VALUE` and
 * `-xVALUE`; longer names accept `--name=VALUE` and `--name VALUE`. Parsing
 * stops at `--`. Arguments that do not spell this key are ignored, so
 * several terms can read the same argument list.
 */
class KeyTerm
{
public:
    explicit KeyTerm(AnyKey key);

    const AnyKey& key() const noexcept
    {
        return m_key;
    }

    ArgSpec arg_spec() const
    {
        return m_key.info().doc().to_arg_spec();
    }

    /**
     * @brief Read this key's value from @p args.
     * @details Never throws for malformed input; see `TermStatus::Failed`.
     */
    KeyTermResult run(const ArgList& args) const;

private:
    AnyKey m_key;
};

/**
 * @brief Results of running a Term over an argument list.
 */
class TermOutcome
{
public:
    void add(KeyTermResult result);

    const std::vector<KeyTermResult>& results() const noexcept
    {
        return m_results;
    }

    /// True if no key failed to parse.
    bool ok() const noexcept;

    std::vector<ParseFailure> failures() const;

    /**
     * @brief Insert the parsed values into @p ctx.
     *
     * @details
     * Provided values are bound with `CommandLine` provenance. When
     * @p include_defaults is set, absent keys that are still unbound get
     * their default with `Default` provenance. Failed keys stay unbound.
     *
     * @return The number of bindings made.
     * @throws KeyError with `AlreadyBound` if a provided key is bound already.
     */
    size_t apply(EvalContext& ctx, bool include_defaults) const;

private:
    std::vector<KeyTermResult> m_results;
};

/**
 * @brief A batch of key terms forming one command-line surface.
 */
class Term
{
public:
    explicit Term(std::vector<KeyTerm> key_terms)
        : m_key_terms(std::move(key_terms))
    {
    }

    const std::vector<KeyTerm>& key_terms() const noexcept
    {
        return m_key_terms;
    }

    std::vector<ArgSpec> arg_specs() const;

    /**
     * @brief Run every key term, collecting all failures.
     */
    TermOutcome run(const ArgList& args) const;

private:
    std::vector<KeyTerm> m_key_terms;
};

KeyTerm term_key(const AnyKey& key);

/**
 * @brief Build the command-line surface for @p keys.
 * @param stage_filter If set, keep only the keys needed at that stage
 *        (see `filter_stage`).
 */
Term term(std::optional<Stage> stage_filter, const KeySet& keys);

} // namespace stagedag
