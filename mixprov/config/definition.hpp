#pragma once

#include <mixprov/util/fs.hpp>

#include <fmt/core.h>

#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace mixprov
{
  namespace config
  {
    namespace flag
    {
      // Base class for the following option flag types
      struct opt
      {};

      struct REQUIRED : opt
      {};
      struct HIDDEN : opt
      {};
    }  // namespace flag

    /// Value to pass for an OptionDefinition to indicate that the option is required
    inline constexpr flag::REQUIRED Required{};
    /// Value to pass for an OptionDefinition to indicate that the option should be hidden from the
    /// generated config file if it is unset (and has no comment).  Used for internal dev options
    /// that aren't usefully exposed.
    inline constexpr flag::HIDDEN Hidden{};

    /// Wrapper to specify a default value to an OptionDefinition
    template <typename T>
    struct Default
    {
      T val;
      constexpr explicit Default(T val) : val{std::move(val)}
      {}
    };

    /// Adds one or more comment lines to the option definition.
    struct Comment
    {
      std::vector<std::string> comments;
      explicit Comment(std::initializer_list<std::string> comments) : comments{std::move(comments)}
      {}
    };

    /// A convenience function that returns an acceptor which assigns to a reference.
    ///
    /// Note that this holds on to the reference; it must only be used when this is safe to do. In
    /// particular, a reference to a local variable may be problematic.
    template <typename T>
    auto
    assignment_acceptor(T& ref)
    {
      return [&ref](T arg) { ref = std::move(arg); };
    }

    // C++20 backport:
    template <typename T>
    using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

    template <typename T>
    constexpr bool is_default = false;
    template <typename T>
    constexpr bool is_default<Default<T>> = true;
    template <typename U>
    constexpr bool is_default<U&> = is_default<remove_cvref_t<U>>;

    template <typename T, typename Option>
    constexpr bool is_option = std::is_base_of_v<flag::opt, remove_cvref_t<Option>>
        or std::is_same_v<Comment, remove_cvref_t<Option>> or is_default<Option>
        or std::is_invocable_v<remove_cvref_t<Option>, T>;
  }  // namespace config

  /// A base class for specifying config options and their constraints. The basic to/from string
  /// type functions are provided pure-virtual; the type-aware implementations are templated
  /// classes, which all fit into the same containers through this base.
  struct OptionDefinitionBase
  {
    template <typename... T>
    OptionDefinitionBase(std::string section_, std::string name_, const T&...)
        : section(std::move(section_))
        , name(std::move(name_))
        , required{(std::is_same_v<T, config::flag::REQUIRED> || ...)}
        , hidden{(std::is_same_v<T, config::flag::HIDDEN> || ...)}
    {}

    virtual ~OptionDefinitionBase() = default;

    /// @return the option's default value represented as a string, if it has one
    virtual std::optional<std::string>
    default_value_as_string() const = 0;

    /// Subclasses should parse and store the provided input
    ///
    /// @param input is the string input to interpret
    virtual void
    parse_value(const std::string& input) = 0;

    /// @return number of values found
    virtual size_t
    get_number_found() const = 0;

    /// @return the option's parsed value as a string, if it was given
    virtual std::optional<std::string>
    value_as_string() const = 0;

    /// Subclasses should call their acceptor, if present. See OptionDefinition for more details.
    ///
    /// @throws if the acceptor throws or the option is required but missing
    virtual void
    try_accept() const = 0;

    std::string section;
    std::string name;
    bool required = false;
    bool hidden = false;
    // Temporarily holds comments given during construction until the option is actually added to
    // the owning ConfigDefinition.
    std::vector<std::string> comments;
  };

  /// The type-aware implementation of OptionDefinitionBase: values are rendered with fmt::format
  /// and parsed with std::istringstream.
  ///
  /// Note that types (T) used as template parameters here must be used verbatim when calling
  /// ConfigDefinition::get_config_value(). Similar types such as uint32_t and int32_t cannot be
  /// mixed.
  template <typename T>
  struct OptionDefinition : public OptionDefinitionBase
  {
    /// @param opts - 0 or more of config::Required, config::Hidden, config::Default{...},
    /// config::Comment{...}, or an invocable acceptor that validates and internalizes the value.
    /// The acceptor should throw an exception with a useful message if the value is not
    /// acceptable.  Parameters may be passed in any order.
    template <
        typename... Options,
        std::enable_if_t<(config::is_option<T, Options> && ...), int> = 0>
    OptionDefinition(std::string section_, std::string name_, Options&&... opts)
        : OptionDefinitionBase(section_, name_, opts...)
    {
      constexpr bool has_default = (config::is_default<Options> || ...);
      constexpr bool has_required =
          (std::is_same_v<config::remove_cvref_t<Options>, config::flag::REQUIRED> || ...);
      constexpr bool has_hidden =
          (std::is_same_v<config::remove_cvref_t<Options>, config::flag::HIDDEN> || ...);
      static_assert(
          not(has_default and has_required), "Default{...} and Required are mutually exclusive");
      static_assert(not(has_hidden and has_required), "Hidden and Required are mutually exclusive");

      (extract_default(std::forward<Options>(opts)), ...);
      (extract_acceptor(std::forward<Options>(opts)), ...);
      (extract_comments(std::forward<Options>(opts)), ...);
    }

    template <typename U>
    void
    extract_default(U&& defaultValue_)
    {
      if constexpr (config::is_default<U>)
      {
        static_assert(
            std::is_convertible_v<decltype(std::forward<U>(defaultValue_).val), T>,
            "Cannot convert given mixprov::config::Default to the required value type");
        default_value = std::forward<U>(defaultValue_).val;
      }
    }

    template <typename U>
    void
    extract_acceptor(U&& acceptor_)
    {
      if constexpr (std::is_invocable_v<U, T>)
        acceptor = std::forward<U>(acceptor_);
    }

    template <typename U>
    void
    extract_comments(U&& comment)
    {
      if constexpr (std::is_same_v<config::remove_cvref_t<U>, config::Comment>)
        comments = std::forward<U>(comment).comments;
    }

    /// Returns the parsed value, if available. Otherwise, provides the default value if the option
    /// is not required. Otherwise, returns an empty optional.
    std::optional<T>
    get_value() const
    {
      if (parsed_value)
        return parsed_value;
      if (required)
        return std::nullopt;
      return default_value;
    }

    size_t
    get_number_found() const override
    {
      return parsed_value ? 1 : 0;
    }

    std::optional<std::string>
    default_value_as_string() const override
    {
      if (not default_value)
        return std::nullopt;
      return to_string(*default_value);
    }

    std::optional<std::string>
    value_as_string() const override
    {
      if (not parsed_value)
        return std::nullopt;
      return to_string(*parsed_value);
    }

    void
    parse_value(const std::string& input) override
    {
      if (parsed_value)
        throw std::invalid_argument{fmt::format("duplicate value for {}", name)};

      parsed_value = from_string(input);
    }

    T
    from_string(const std::string& input)
    {
      if constexpr (std::is_same_v<T, std::string>)
      {
        return input;
      }
      else
      {
        std::istringstream iss(input);
        T t;
        iss >> t;
        if (iss.fail() or not iss.eof())
          throw std::invalid_argument{fmt::format("{} is not a valid value for {}", input, name)};
        return t;
      }
    }

    static std::string
    to_string(const T& v)
    {
      if constexpr (std::is_same_v<fs::path, T>)
        return v.u8string();
      else if constexpr (std::is_same_v<bool, T>)
        return v ? "true" : "false";
      else
        return fmt::format("{}", v);
    }

    /// Calls the acceptor, if present, with the parsed or default value.
    ///
    /// @throws if required and no value present or if the acceptor throws
    void
    try_accept() const override
    {
      if (required and not parsed_value)
      {
        throw std::runtime_error{fmt::format(
            "cannot call try_accept() on [{}]:{} when required but no value available",
            section,
            name)};
      }

      if (acceptor)
      {
        if (auto maybe = get_value())
          acceptor(*maybe);
      }
    }

    std::optional<T> default_value;
    std::optional<T> parsed_value;
    std::function<void(T)> acceptor;
  };

  /// Specialization for bool types. We don't want to use stringstream parsing in this
  /// case because we want to accept "truthy" and "falsy" string values (e.g. "off" == false)
  template <>
  bool
  OptionDefinition<bool>::from_string(const std::string& input);

  // map of k:v pairs
  using DefinitionMap = std::unordered_map<std::string, std::unique_ptr<OptionDefinitionBase>>;

  // map of section-name to map-of-definitions
  using SectionMap = std::unordered_map<std::string, DefinitionMap>;

  /// A ConfigDefinition holds an ordered set of OptionDefinitions defining the allowable values
  /// and their constraints.
  ///
  /// The layout follows the INI file format; each option has a name and is grouped under a
  /// section. Duplicate option names are allowed only if they exist in a different section.
  /// Values encountered when parsing a file are provided through add_config_value(), which parses
  /// them into the option's type; unknown sections and options are rejected.
  struct ConfigDefinition
  {
    /// Specify the parameters and type of a configuration option.
    ///
    /// @return `*this` for chaining calls
    /// @throws std::invalid_argument if the option already exists
    ConfigDefinition&
    define_option(std::unique_ptr<OptionDefinitionBase> def);

    /// Convenience function which calls define_option with a OptionDefinition of the specified
    /// type and with parameters passed through to OptionDefinition's constructor.
    template <typename T, typename... Params>
    ConfigDefinition&
    define_option(Params&&... args)
    {
      return define_option(std::make_unique<OptionDefinition<T>>(std::forward<Params>(args)...));
    }

    /// Specify a config value for the given section and name, parsed into the option's type.
    ///
    /// @return `*this` for chaining calls
    /// @throws if the option doesn't exist or the provided string isn't parseable
    ConfigDefinition&
    add_config_value(std::string_view section, std::string_view name, std::string_view value);

    /// Get a config value: the parsed value, else the default, else an empty optional.
    ///
    /// @throws std::invalid_argument if there is no such config option or the wrong type T was
    ///         provided
    template <typename T>
    std::optional<T>
    get_config_value(std::string_view section, std::string_view name) const
    {
      const auto& definition = lookup_definition_or_throw(section, name);

      auto derived = dynamic_cast<const OptionDefinition<T>*>(definition.get());
      if (not derived)
        throw std::invalid_argument{
            fmt::format("{} is the incorrect type for [{}]:{}", typeid(T).name(), section, name)};

      return derived->get_value();
    }

    /// Validate that all required fields are present.
    ///
    /// @throws std::invalid_argument if configuration constraints are not met
    void
    validate_required_fields() const;

    /// Accept all options. This will call the acceptor (if present) on each option.
    ///
    /// @throws if any option's acceptor throws
    void
    accept_all_options() const;

    /// validates and accept all parsed options
    inline void
    process() const
    {
      validate_required_fields();
      accept_all_options();
    }

    /// Add comments for a given section. Comments are replayed in-order during config file
    /// generation.
    void
    add_section_comments(const std::string& section, std::vector<std::string> comments);

    /// Add comments for a given [section]:name pair.
    void
    add_option_comments(
        const std::string& section, const std::string& name, std::vector<std::string> comments);

    /// Generate a config string from the current config definition. Sections and options keep
    /// their insertion order.
    ///
    /// Definitions which are required or have a given value (and useValues == true) are written
    /// normally; everything else is written commented-out, documenting the whole file.
    std::string
    generate_ini_config(bool useValues = false) const;

   private:
    const std::unique_ptr<OptionDefinitionBase>&
    lookup_definition_or_throw(std::string_view section, std::string_view name) const;

    using SectionVisitor = std::function<void(const std::string&, const DefinitionMap&)>;
    void
    visit_sections(SectionVisitor visitor) const;

    using DefVisitor =
        std::function<void(const std::string&, const std::unique_ptr<OptionDefinitionBase>&)>;
    void
    visit_definitions(const std::string& section, DefVisitor visitor) const;

    SectionMap definitions;

    // track insertion order. the vector<string>s are ordered list of section/option names.
    std::vector<std::string> section_ordering;
    std::unordered_map<std::string, std::vector<std::string>> definition_ordering;

    // comments for config file generation
    using CommentList = std::vector<std::string>;
    using CommentsMap = std::unordered_map<std::string, CommentList>;
    CommentsMap section_comments;
    std::unordered_map<std::string, CommentsMap> definition_comments;
  };

}  // namespace mixprov
