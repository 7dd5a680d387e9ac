#include "definition.hpp"

#include <iterator>
#include <stdexcept>

namespace mixprov
{
  template <>
  bool
  OptionDefinition<bool>::from_string(const std::string& input)
  {
    if (input == "false" || input == "off" || input == "0" || input == "no")
      return false;
    if (input == "true" || input == "on" || input == "1" || input == "yes")
      return true;
    throw std::invalid_argument{fmt::format("{} is not a valid bool", input)};
  }

  ConfigDefinition&
  ConfigDefinition::define_option(std::unique_ptr<OptionDefinitionBase> def)
  {
    auto [sectionItr, newSect] = definitions.try_emplace(def->section);
    if (newSect)
      section_ordering.push_back(def->section);
    auto& section = sectionItr->first;

    auto name = def->name;
    auto [it, added] = sectionItr->second.try_emplace(name, std::move(def));
    if (!added)
      throw std::invalid_argument{
          fmt::format("definition for [{}]:{} already exists", section, name)};

    definition_ordering[section].push_back(it->first);

    if (!it->second->comments.empty())
      add_option_comments(section, it->first, std::move(it->second->comments));

    return *this;
  }

  ConfigDefinition&
  ConfigDefinition::add_config_value(
      std::string_view section, std::string_view name, std::string_view value)
  {
    auto secItr = definitions.find(std::string(section));
    if (secItr == definitions.end())
      throw std::invalid_argument{fmt::format("unrecognized section [{}]", section)};

    auto& sectionDefinitions = secItr->second;
    auto defItr = sectionDefinitions.find(std::string(name));
    if (defItr == sectionDefinitions.end())
      throw std::invalid_argument{fmt::format("unrecognized option [{}]: {}", section, name)};

    defItr->second->parse_value(std::string(value));
    return *this;
  }

  void
  ConfigDefinition::validate_required_fields() const
  {
    visit_sections([&](const std::string& section, const DefinitionMap&) {
      visit_definitions(
          section, [&](const std::string&, const std::unique_ptr<OptionDefinitionBase>& def) {
            if (def->required and def->get_number_found() < 1)
            {
              throw std::invalid_argument{
                  fmt::format("[{}]:{} is required but missing", section, def->name)};
            }
          });
    });
  }

  void
  ConfigDefinition::accept_all_options() const
  {
    visit_sections([this](const std::string& section, const DefinitionMap&) {
      visit_definitions(
          section, [](const std::string&, const std::unique_ptr<OptionDefinitionBase>& def) {
            def->try_accept();
          });
    });
  }

  void
  ConfigDefinition::add_section_comments(
      const std::string& section, std::vector<std::string> comments)
  {
    auto& sectionComments = section_comments[section];
    for (auto& c : comments)
      sectionComments.emplace_back(std::move(c));
  }

  void
  ConfigDefinition::add_option_comments(
      const std::string& section, const std::string& name, std::vector<std::string> comments)
  {
    auto& defComments = definition_comments[section][name];
    if (defComments.empty())
      defComments = std::move(comments);
    else
      defComments.insert(
          defComments.end(),
          std::make_move_iterator(comments.begin()),
          std::make_move_iterator(comments.end()));
  }

  std::string
  ConfigDefinition::generate_ini_config(bool useValues) const
  {
    std::string ini;
    auto ini_append = std::back_inserter(ini);

    int sectionsVisited = 0;

    visit_sections([&](const std::string& section, const DefinitionMap&) {
      std::string sect_str;
      auto sect_append = std::back_inserter(sect_str);

      const CommentsMap* defComments = nullptr;
      if (auto itr = definition_comments.find(section); itr != definition_comments.end())
        defComments = &itr->second;

      visit_definitions(
          section,
          [&](const std::string& name, const std::unique_ptr<OptionDefinitionBase>& def) {
            bool has_comment = false;
            if (defComments)
            {
              if (auto itr = defComments->find(name); itr != defComments->end())
              {
                for (const std::string& comment : itr->second)
                {
                  fmt::format_to(sect_append, "\n# {}", comment);
                  has_comment = true;
                }
              }
            }

            if (auto val = def->value_as_string(); useValues and val)
            {
              fmt::format_to(sect_append, "\n{}={}\n", name, *val);
            }
            else if (not def->hidden)
            {
              if (auto dflt = def->default_value_as_string())
                fmt::format_to(sect_append, "\n#{}={}\n", name, *dflt);
              else
                // No default: show "opt-name=" so that the option is simple to fill in; required
                // options are left uncommented so the generated file fails until they are set.
                fmt::format_to(sect_append, "\n{}{}=\n", def->required ? "" : "#", name);
            }
            else if (has_comment)
              *sect_append = '\n';
          });

      if (sect_str.empty())
        return;  // Skip sections with no options

      if (sectionsVisited > 0)
        ini += "\n\n";

      fmt::format_to(ini_append, "[{}]\n", section);

      if (auto itr = section_comments.find(section); itr != section_comments.end())
        for (const std::string& comment : itr->second)
          fmt::format_to(ini_append, "# {}\n", comment);
      ini += sect_str;

      sectionsVisited++;
    });

    return ini;
  }

  const std::unique_ptr<OptionDefinitionBase>&
  ConfigDefinition::lookup_definition_or_throw(
      std::string_view section, std::string_view name) const
  {
    const auto sectionItr = definitions.find(std::string(section));
    if (sectionItr == definitions.end())
      throw std::invalid_argument{fmt::format("No config section [{}]", section)};

    auto& sectionDefinitions = sectionItr->second;
    const auto definitionItr = sectionDefinitions.find(std::string(name));
    if (definitionItr == sectionDefinitions.end())
      throw std::invalid_argument{
          fmt::format("No config item {} within section {}", name, section)};

    return definitionItr->second;
  }

  void
  ConfigDefinition::visit_sections(SectionVisitor visitor) const
  {
    for (const std::string& section : section_ordering)
      visitor(section, definitions.at(section));
  }

  void
  ConfigDefinition::visit_definitions(const std::string& section, DefVisitor visitor) const
  {
    const auto& defs = definitions.at(section);
    for (const std::string& name : definition_ordering.at(section))
      visitor(name, defs.at(name));
  }

}  // namespace mixprov
