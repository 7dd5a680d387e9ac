#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mixprov
{
  struct ConfigParser
  {
    using SectionValues = std::unordered_multimap<std::string, std::string>;
    using ConfigMap = std::unordered_map<std::string, SectionValues>;

    /// clear parser
    void
    clear();

    /// load from string; `source` names the origin in error messages
    /// return true on success
    /// throws on a malformed line
    bool
    load_from_str(std::string_view str, std::string source = "<string>");

    /// iterate all sections and their values
    void
    iter_all_sections(std::function<void(std::string_view, const SectionValues&)> visit) const;

    /// visit a section in config read only by name
    /// return false if no section or value propagated from visitor
    bool
    visit_section(const char* name, std::function<bool(const SectionValues&)> visit) const;

   private:
    bool
    parse();

    std::string _data;
    ConfigMap _config;
    std::string _source;
  };

}  // namespace mixprov
