#pragma once

#include <boost/log/expressions/keyword.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>
#include <boost/program_options/variables_map.hpp>

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace cellmarket
{
   namespace loggers
   {
      enum class level : std::uint32_t
      {
         debug,
         info,
         notice,
         warning,
         error,
         critical,
      };
      std::ostream& operator<<(std::ostream&, const level&);
      std::istream& operator>>(std::istream& is, level& l);
      using common_logger  = boost::log::sources::severity_logger_mt<level>;
      using channel_logger = boost::log::sources::severity_channel_logger_mt<level, std::string>;
      BOOST_LOG_GLOBAL_LOGGER(generic, common_logger)
      // Validation programs
      BOOST_LOG_GLOBAL_LOGGER(script, channel_logger)
      // The verifier that dispatches transactions to programs
      BOOST_LOG_GLOBAL_LOGGER(verifier, channel_logger)

      namespace keyword
      {
         BOOST_LOG_ATTRIBUTE_KEYWORD(ScriptHash, "ScriptHash", std::string)
      }  // namespace keyword

      enum class format
      {
         text,
         json,
      };
      std::ostream& operator<<(std::ostream&, const format&);
      std::istream& operator>>(std::istream& is, format& f);

      // Replaces all sinks with a single stderr sink
      void configure(level minimum, format fmt = format::text);
      // Reads logger.level and logger.format
      void configure(const boost::program_options::variables_map&);
      // stderr, info and above, text
      void configure_default();
      // Removes all sinks. Records are discarded.
      void disable();
   }  // namespace loggers

#define CELLMARKET_LOG(logger, log_level) \
   BOOST_LOG_SEV(logger, ::cellmarket::loggers::level::log_level)
#define CELLMARKET_LOG_SCRIPT(logger, log_level, hash) \
   CELLMARKET_LOG(logger, log_level) << ::boost::log::add_value(  \
       ::cellmarket::loggers::keyword::ScriptHash, (hash))
}  // namespace cellmarket
