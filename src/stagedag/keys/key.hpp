/**
 * @file key.hpp
 * @brief Typed, staged configuration keys and the registry session that creates them.
 * @see key.inline.hpp for implementations of type-parameterized methods.
 */
#pragma once
#include "stagedag/common/common.hpp"
#include "stagedag/common/value_cell.inline.hpp"
#include "stagedag/keys/descriptor.hpp"
#include "stagedag/keys/doc.hpp"
#include "stagedag/keys/key_errors.hpp"

namespace stagedag
{

/**
 * @brief When a key's value is needed.
 */
enum class Stage
{
    Configure,  ///< While building the graph and generating source.
    Run,        ///< When the generated artifact runs.
    Both
};

const char* stage_name(Stage stage) noexcept;

/**
 * @brief Turn a key or component name into a C++ identifier.
 *
 * @details
 * Drops every character outside `[A-Za-z0-9_-]` and replaces `-` with `_`.
 *
 * @throws KeyError with `IllegalKeyName` if the result is empty or starts
 *         with a digit.
 */
std::string to_identifier(const std::string& name);

// ============================================================================
// Type-erased key information
// ============================================================================

/**
 * @brief Everything known about a key, independent of its value type.
 *
 * @details
 * The typed subclass `TypedKeyInfo<T>` carries the `Descriptor<T>` and
 * implements the cell-level operations by unwrapping cells as T. Code that
 * handles keys of mixed types (key sets, terms, the evaluation context,
 * source generation) works through this interface only.
 */
class KeyInfo
{
public:
    virtual ~KeyInfo() = default;

    const std::string& name() const noexcept
    {
        return m_name;
    }

    Stage stage() const noexcept
    {
        return m_stage;
    }

    const Doc& doc() const noexcept
    {
        return m_doc;
    }

    /// Cell holding the default value.
    const ValueCell& default_cell() const noexcept
    {
        return m_default_cell;
    }

    virtual std::type_index value_type() const noexcept = 0;

    virtual const std::string& description() const noexcept = 0;

    virtual const std::string& type_name() const noexcept = 0;

    /// Parse raw text into a cell of the key's type.
    virtual ParseResult<ValueCell> parse_cell(const std::string& text) const = 0;

    /**
     * @throws ValueCellTypeError if @p cell does not hold the key's type.
     */
    virtual std::string print_cell(const ValueCell& cell) const = 0;

    /**
     * @throws ValueCellTypeError if @p cell does not hold the key's type.
     */
    virtual std::string serialize_cell(const ValueCell& cell) const = 0;

protected:
    KeyInfo(std::string name, Stage stage, Doc doc, ValueCell default_cell)
        : m_name(std::move(name))
        , m_stage(stage)
        , m_doc(std::move(doc))
        , m_default_cell(std::move(default_cell))
    {
    }

private:
    std::string m_name;
    Stage m_stage;
    Doc m_doc;
    ValueCell m_default_cell;
};

template <typename T>
class TypedKeyInfo final : public KeyInfo
{
public:
    TypedKeyInfo(std::string name, Stage stage, Doc doc, T default_value,
                 DescriptorPtr<T> descriptor);

    const T& default_value() const
    {
        return default_cell().template as<T>();
    }

    const DescriptorPtr<T>& descriptor() const noexcept
    {
        return m_descriptor;
    }

    std::type_index value_type() const noexcept override
    {
        return std::type_index{typeid(T)};
    }

    const std::string& description() const noexcept override
    {
        return m_descriptor->description();
    }

    const std::string& type_name() const noexcept override
    {
        return m_descriptor->type_name();
    }

    ParseResult<ValueCell> parse_cell(const std::string& text) const override;

    std::string print_cell(const ValueCell& cell) const override;

    std::string serialize_cell(const ValueCell& cell) const override;

private:
    DescriptorPtr<T> m_descriptor;
};

// ============================================================================
// Key handles
// ============================================================================

/**
 * @brief Type-erased handle to a key.
 *
 * @details
 * Identity, equality and ordering are defined by the key name alone.
 */
class AnyKey
{
public:
    explicit AnyKey(std::shared_ptr<const KeyInfo> info);

    const std::string& name() const noexcept
    {
        return m_info->name();
    }

    Stage stage() const noexcept
    {
        return m_info->stage();
    }

    bool is_runtime() const noexcept
    {
        return stage() == Stage::Run || stage() == Stage::Both;
    }

    bool is_configure() const noexcept
    {
        return stage() == Stage::Configure || stage() == Stage::Both;
    }

    const KeyInfo& info() const noexcept
    {
        return *m_info;
    }

    friend bool operator==(const AnyKey& a, const AnyKey& b) noexcept
    {
        return a.name() == b.name();
    }

    friend bool operator!=(const AnyKey& a, const AnyKey& b) noexcept
    {
        return !(a == b);
    }

    friend bool operator<(const AnyKey& a, const AnyKey& b) noexcept
    {
        return a.name() < b.name();
    }

private:
    std::shared_ptr<const KeyInfo> m_info;
};

/**
 * @brief Set of keys in canonical (name) order.
 */
using KeySet = std::set<AnyKey>;

/**
 * @brief Keep the keys needed at @p stage.
 *
 * @details `Configure` keeps Configure and Both keys, `Run` keeps Run and
 * Both keys, `Both` keeps everything.
 */
KeySet filter_stage(Stage stage, const KeySet& keys);

/**
 * @brief Typed handle to a key of value type T.
 */
template <typename T>
class Key
{
public:
    using value_type = T;

    const std::string& name() const noexcept
    {
        return m_info->name();
    }

    Stage stage() const noexcept
    {
        return m_info->stage();
    }

    bool is_runtime() const noexcept
    {
        return stage() == Stage::Run || stage() == Stage::Both;
    }

    bool is_configure() const noexcept
    {
        return stage() == Stage::Configure || stage() == Stage::Both;
    }

    const Doc& doc() const noexcept
    {
        return m_info->doc();
    }

    const T& default_value() const
    {
        return m_info->default_value();
    }

    const DescriptorPtr<T>& descriptor() const noexcept
    {
        return m_info->descriptor();
    }

    AnyKey erase() const
    {
        return AnyKey{m_info};
    }

    operator AnyKey() const
    {
        return erase();
    }

    friend bool operator==(const Key& a, const Key& b) noexcept
    {
        return a.name() == b.name();
    }

    friend bool operator!=(const Key& a, const Key& b) noexcept
    {
        return !(a == b);
    }

private:
    friend class KeyRegistry;

    explicit Key(std::shared_ptr<const TypedKeyInfo<T>> info)
        : m_info(std::move(info))
    {
    }

    std::shared_ptr<const TypedKeyInfo<T>> m_info;
};

// ============================================================================
// KeyRegistry
// ============================================================================

/**
 * @brief Creates keys and enforces name uniqueness for one configuration session.
 *
 * Names must also be unique after `to_identifier()`, since generated source
 * declares one binding per identifier.
 *
 * @details
 * A registry lives for one configuration-build session. Two registries are
 * independent: the same name may exist in both.
 *
 * @par Thread safety
 * - No internal synchronization.
 */
class KeyRegistry
{
public:
    KeyRegistry() = default;
    KeyRegistry(const KeyRegistry&) = delete;
    KeyRegistry& operator=(const KeyRegistry&) = delete;

    /**
     * @brief Create a key whose Doc has @p name as its only flag.
     * @throws KeyError with `DuplicateKeyName` or `IllegalKeyName`.
     */
    template <typename T>
    Key<T> create(const std::string& name, const std::string& doc_text, Stage stage,
                  T default_value, DescriptorPtr<T> descriptor);

    /**
     * @brief Create a key from a fully-built Doc.
     * @throws KeyError with `DuplicateKeyName` or `IllegalKeyName`.
     */
    template <typename T>
    Key<T> create_raw(Doc doc, Stage stage, T default_value, const std::string& name,
                      DescriptorPtr<T> descriptor);

    size_t size() const noexcept
    {
        return m_keys.size();
    }

    bool contains(const std::string& name) const
    {
        return m_keys.count(name) > 0;
    }

    std::optional<AnyKey> find(const std::string& name) const;

    /// All registered keys.
    KeySet keys() const;

private:
    void register_key(const AnyKey& key);

    std::map<std::string, AnyKey> m_keys;
    std::map<std::string, std::string> m_identifiers; ///< identifier -> key name
};

} // namespace stagedag
