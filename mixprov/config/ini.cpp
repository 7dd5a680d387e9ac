#include "ini.hpp"

#include <mixprov/util/logging.hpp>
#include <mixprov/util/str.hpp>
#include <mixprov/util/types.hpp>

#include <stdexcept>
#include <vector>

namespace mixprov
{
  static auto logcat = log::Cat("config");

  bool
  ConfigParser::load_from_str(std::string_view str, std::string source)
  {
    _data.assign(str.begin(), str.end());
    _source = std::move(source);
    return parse();
  }

  void
  ConfigParser::clear()
  {
    _config.clear();
    _data.clear();
  }

  bool
  ConfigParser::parse()
  {
    std::vector<std::string_view> lines;
    {
      std::string_view data{_data};
      // split into lines
      while (not data.empty())
      {
        auto end = data.find_first_of("\r\n");
        lines.push_back(data.substr(0, end));
        if (end == std::string_view::npos)
          break;
        data.remove_prefix(end + 1);
      }
    }

    std::string_view sectName;
    size_t lineno = 0;
    for (auto line : lines)
    {
      lineno++;
      line = TrimWhitespace(line);

      // Skip blank lines and comments
      if (line.empty() or line.front() == ';' or line.front() == '#')
        continue;

      if (line.front() == '[' and line.back() == ']')
      {
        // section header
        line.remove_prefix(1);
        line.remove_suffix(1);
        sectName = TrimWhitespace(line);
      }
      else if (auto kvDelim = line.find('='); kvDelim != std::string_view::npos)
      {
        // key value pair
        auto k = TrimWhitespace(line.substr(0, kvDelim));
        auto v = TrimWhitespace(line.substr(kvDelim + 1));

        if (k.empty())
          throw std::runtime_error{"{} invalid line ({}): '{}'"_format(_source, lineno, line)};
        log::trace(logcat, "{}: [{}]:{}={}", _source, sectName, k, v);
        _config[std::string{sectName}].emplace(k, v);
      }
      else  // malformed?
      {
        throw std::runtime_error{"{} invalid line ({}): '{}'"_format(_source, lineno, line)};
      }
    }
    return true;
  }

  void
  ConfigParser::iter_all_sections(
      std::function<void(std::string_view, const SectionValues&)> visit) const
  {
    for (const auto& item : _config)
      visit(item.first, item.second);
  }

  bool
  ConfigParser::visit_section(
      const char* name, std::function<bool(const SectionValues& sect)> visit) const
  {
    auto itr = _config.find(name);
    if (itr == _config.end())
      return false;
    return visit(itr->second);
  }

}  // namespace mixprov
