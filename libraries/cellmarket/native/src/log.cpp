#include <cellmarket/log.hpp>

#include <boost/core/null_deleter.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/log/attributes/function.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/make_shared.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace cellmarket::loggers
{
   BOOST_LOG_GLOBAL_LOGGER_DEFAULT(generic, common_logger)
   BOOST_LOG_GLOBAL_LOGGER_CTOR_ARGS(script,
                                     channel_logger,
                                     (boost::log::keywords::channel = "script"))
   BOOST_LOG_GLOBAL_LOGGER_CTOR_ARGS(verifier,
                                     channel_logger,
                                     (boost::log::keywords::channel = "verify"))

   // Available attributes: TimeStamp, Severity, Channel, Message
   // Script records also carry ScriptHash.

   namespace
   {
      using time_point   = std::chrono::system_clock::time_point;
      using backend_type = boost::log::sinks::text_ostream_backend;
      using sink_type    = boost::log::sinks::synchronous_sink<backend_type>;

      template <typename S, typename T>
      void format_timestamp(S& os, const T& timestamp)
      {
         auto date = std::chrono::floor<std::chrono::days>(timestamp);
         auto ymd  = std::chrono::year_month_day(date);
         auto time = std::chrono::hh_mm_ss(
             std::chrono::duration_cast<std::chrono::milliseconds>(timestamp - date));
         os << std::setfill('0');
         os << std::setw(4) << (int)ymd.year() << '-' << std::setw(2) << (unsigned)ymd.month()
            << '-' << std::setw(2) << (unsigned)ymd.day();
         os << 'T' << std::setw(2) << time.hours().count() << ':' << std::setw(2)
            << time.minutes().count() << ':' << std::setw(2) << time.seconds().count() << '.'
            << std::setw(3) << time.subseconds().count() << 'Z';
         os << std::setfill(' ');
      }

      template <typename S>
      void write_json_string(S& os, std::string_view s)
      {
         os << '"';
         for (char ch : s)
         {
            if (ch == '"' || ch == '\\')
               os << '\\' << ch;
            else if (ch == '\n')
               os << "\\n";
            else if (static_cast<unsigned char>(ch) < 0x20)
               os << "\\u" << std::hex << std::setw(4) << std::setfill('0') << (int)ch
                  << std::dec << std::setfill(' ');
            else
               os << ch;
         }
         os << '"';
      }

      void text_formatter(const boost::log::record_view& rec, boost::log::formatting_ostream& os)
      {
         if (auto t = boost::log::extract<time_point>("TimeStamp", rec))
         {
            os << '[';
            format_timestamp(os, *t);
            os << "] ";
         }
         if (auto l = boost::log::extract<level>("Severity", rec))
            os << '[' << *l << "] ";
         if (auto c = boost::log::extract<std::string>("Channel", rec))
            os << '[' << *c << "] ";
         if (auto h = boost::log::extract<std::string>("ScriptHash", rec))
            os << h->substr(0, 16) << ": ";
         if (auto m = boost::log::extract<std::string>("Message", rec))
            os << *m;
      }

      void json_formatter(const boost::log::record_view& rec, boost::log::formatting_ostream& os)
      {
         os << '{';
         bool first = true;
         auto field = [&](std::string_view name)
         {
            if (!first)
               os << ',';
            first = false;
            write_json_string(os, name);
            os << ':';
         };
         if (auto t = boost::log::extract<time_point>("TimeStamp", rec))
         {
            field("TimeStamp");
            os << '"';
            format_timestamp(os, *t);
            os << '"';
         }
         if (auto l = boost::log::extract<level>("Severity", rec))
         {
            field("Severity");
            os << '"' << *l << '"';
         }
         if (auto c = boost::log::extract<std::string>("Channel", rec))
         {
            field("Channel");
            write_json_string(os, *c);
         }
         if (auto h = boost::log::extract<std::string>("ScriptHash", rec))
         {
            field("ScriptHash");
            write_json_string(os, *h);
         }
         if (auto m = boost::log::extract<std::string>("Message", rec))
         {
            field("Message");
            write_json_string(os, *m);
         }
         os << '}';
      }

      void init_core()
      {
         static std::once_flag once;
         std::call_once(once,
                        []
                        {
                           boost::log::core::get()->add_global_attribute(
                               "TimeStamp", boost::log::attributes::function<time_point>(
                                                []() { return std::chrono::system_clock::now(); }));
                        });
      }
   }  // namespace

   void configure(level minimum, format fmt)
   {
      init_core();
      auto core = boost::log::core::get();
      core->remove_all_sinks();
      core->reset_filter();

      auto backend = boost::make_shared<backend_type>();
      backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      backend->auto_flush(true);

      auto sink = boost::make_shared<sink_type>(backend);
      if (fmt == format::json)
         sink->set_formatter(&json_formatter);
      else
         sink->set_formatter(&text_formatter);
      sink->set_filter(
          [minimum](const boost::log::attribute_value_set& attrs)
          {
             auto l = boost::log::extract<level>("Severity", attrs);
             return !l || *l >= minimum;
          });
      core->add_sink(sink);
   }

   void configure(const boost::program_options::variables_map& map)
   {
      level  minimum = level::info;
      format fmt     = format::text;
      try
      {
         if (auto iter = map.find("logger.level"); iter != map.end())
            minimum = boost::lexical_cast<level>(iter->second.as<std::string>());
         if (auto iter = map.find("logger.format"); iter != map.end())
            fmt = boost::lexical_cast<format>(iter->second.as<std::string>());
      }
      catch (boost::bad_lexical_cast&)
      {
         throw std::runtime_error("Invalid logger configuration");
      }
      configure(minimum, fmt);
   }

   void configure_default()
   {
      configure(level::info, format::text);
   }

   void disable()
   {
      boost::log::core::get()->remove_all_sinks();
      boost::log::core::get()->set_filter([](const boost::log::attribute_value_set&)
                                          { return false; });
   }

   std::ostream& operator<<(std::ostream& os, const level& l)
   {
      switch (l)
      {
         case level::debug:
            os << "debug";
            break;
         case level::info:
            os << "info";
            break;
         case level::notice:
            os << "notice";
            break;
         case level::warning:
            os << "warning";
            break;
         case level::error:
            os << "error";
            break;
         case level::critical:
            os << "critical";
            break;
      }
      return os;
   }

   std::istream& operator>>(std::istream& is, level& l)
   {
      std::string s;
      if (is >> s)
      {
         if (s == "debug")
         {
            l = level::debug;
         }
         else if (s == "info")
         {
            l = level::info;
         }
         else if (s == "notice")
         {
            l = level::notice;
         }
         else if (s == "warning")
         {
            l = level::warning;
         }
         else if (s == "error")
         {
            l = level::error;
         }
         else if (s == "critical")
         {
            l = level::critical;
         }
         else
         {
            is.setstate(std::ios_base::failbit);
         }
      }
      return is;
   }

   std::ostream& operator<<(std::ostream& os, const format& f)
   {
      return os << (f == format::json ? "json" : "text");
   }

   std::istream& operator>>(std::istream& is, format& f)
   {
      std::string s;
      if (is >> s)
      {
         if (s == "text")
            f = format::text;
         else if (s == "json")
            f = format::json;
         else
            is.setstate(std::ios_base::failbit);
      }
      return is;
   }
}  // namespace cellmarket::loggers
