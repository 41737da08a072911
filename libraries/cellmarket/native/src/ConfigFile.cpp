#include <cellmarket/ConfigFile.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <istream>
#include <stdexcept>
#include <string_view>
#include <tuple>
#include <vector>

using namespace cellmarket;

namespace
{
   constexpr std::string_view ws(" \t\r\n");

   std::string fullKey(std::string_view section, std::string_view key)
   {
      if (section.empty())
      {
         return std::string(key);
      }
      else
      {
         return std::string(section) + "." + std::string(key);
      }
   }

   std::string_view trim(std::string_view s)
   {
      auto start = s.find_first_not_of(ws);
      if (start == std::string::npos)
      {
         return "";
      }
      else
      {
         auto end = s.find_last_not_of(ws) + 1;
         return s.substr(start, end - start);
      }
   }

   std::string_view trimLine(std::string_view s)
   {
      auto commentStart = s.find('#');
      if (commentStart != std::string::npos)
      {
         s = s.substr(0, commentStart);
      }
      return trim(s);
   }

   bool isSection(std::string_view line)
   {
      line = trimLine(line);
      return !line.empty() && line.front() == '[' && line.back() == ']';
   }

   std::string_view parseSection(std::string_view line)
   {
      line = trimLine(line);
      line = line.substr(1, line.size() - 2);
      if (line.ends_with('.'))
      {
         line.remove_suffix(1);
      }
      return line;
   }

   // - removes "
   // - evaluates \ escapes
   // - expands $VAR
   std::string expand(std::string_view s)
   {
      std::string result;
      for (std::size_t i = 0; i < s.size(); ++i)
      {
         if (s[i] == '"')
         {
            continue;
         }
         else if (s[i] == '\\')
         {
            ++i;
            if (i == s.size())
            {
               break;
            }
            if (s[i] == 'n')
            {
               result.push_back('\n');
            }
            else
            {
               result.push_back(s[i]);
            }
         }
         else if (s[i] == '$')
         {
            std::string name;
            for (std::size_t j = i + 1; j < s.size(); ++j)
            {
               if (!std::isalnum(static_cast<unsigned char>(s[j])) && s[j] != '_')
               {
                  break;
               }
               name.push_back(s[j]);
               i = j;
            }
            if (name.empty())
            {
               result += '$';
            }
            else if (auto value = std::getenv(name.c_str()))
            {
               result += value;
            }
         }
         else
         {
            result.push_back(s[i]);
         }
      }
      return result;
   }

   // Returns key, value. The value has its comment removed but is not expanded.
   std::tuple<std::string_view, std::string_view> parseLine(std::string_view s)
   {
      auto pos = s.find_first_not_of(ws);
      if (pos == std::string::npos || s[pos] == '#')
      {
         return {};
      }
      pos = s.find('=');
      if (pos == std::string::npos)
      {
         throw std::runtime_error("expected key = value");
      }
      auto        k       = s.substr(0, pos);
      auto        v       = s.substr(pos + 1);
      bool        quoted  = false;
      std::size_t comment = v.size();
      for (std::size_t i = 0; i < v.size(); ++i)
      {
         if (v[i] == '\"')
         {
            quoted = !quoted;
         }
         else if (quoted && v[i] == '\\')
         {
            if (++i == v.size())
            {
               break;
            }
         }
         else if (!quoted && v[i] == '#')
         {
            comment = i;
            break;
         }
      }
      return {trim(k), trim(v.substr(0, comment))};
   }
}  // namespace

boost::program_options::parsed_options cellmarket::parse_config_file(
    std::istream&                                      file,
    const boost::program_options::options_description& opts,
    const std::string&                                 filename)
{
   boost::program_options::parsed_options result{&opts};
   std::string                            line;
   std::string                            section;
   std::size_t                            line_number = 0;
   std::vector<std::string_view>          exact_options;
   std::vector<std::string_view>          prefix_options;
   for (const auto& opt : opts.options())
   {
      std::string_view name = opt->long_name();
      if (!name.empty())
      {
         if (name.ends_with("*"))
         {
            prefix_options.push_back(name.substr(0, name.size() - 1));
         }
         else
         {
            exact_options.push_back(name);
         }
      }
   }
   std::sort(exact_options.begin(), exact_options.end());
   std::sort(prefix_options.begin(), prefix_options.end());
   auto allowedOption = [&](std::string_view key)
   {
      if (std::binary_search(exact_options.begin(), exact_options.end(), key))
      {
         return true;
      }
      auto next = std::upper_bound(prefix_options.begin(), prefix_options.end(), key);
      if (next != prefix_options.begin())
      {
         --next;
         if (key.starts_with(*next))
         {
            return true;
         }
      }
      return false;
   };
   auto error = [&](const std::string& msg)
   { return std::runtime_error(filename + ":" + std::to_string(line_number) + ": " + msg); };
   while (!std::getline(file, line).fail())
   {
      ++line_number;
      if (isSection(line))
      {
         section = parseSection(line);
         continue;
      }
      std::string_view key, value;
      try
      {
         std::tie(key, value) = parseLine(line);
      }
      catch (std::runtime_error& e)
      {
         throw error(e.what());
      }
      if (key.empty())
      {
         continue;
      }
      auto k = fullKey(section, key);
      if (!allowedOption(k))
      {
         throw error("Unknown option " + k);
      }
      boost::program_options::option opt{k, {expand(value)}};
      opt.original_tokens = {k, std::string(value)};
      result.options.push_back(std::move(opt));
   }
   return result;
}
