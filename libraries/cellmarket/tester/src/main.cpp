#include <cellmarket/log.hpp>

#include <boost/lexical_cast.hpp>

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <iostream>

using namespace cellmarket;

int main(int argc, const char* const* argv)
{
   std::string logLevel;

   Catch::Session session;

   using Catch::clara::Opt;
   auto cli = session.cli() |
              Opt(logLevel, "level")["--log-level"](
                  "Minimum severity of script and verifier logs. Logging is off by default.");
   session.cli(cli);

   if (int res = session.applyCommandLine(argc, argv))
      return res;

   if (logLevel.empty())
   {
      loggers::disable();
   }
   else
   {
      try
      {
         loggers::configure(boost::lexical_cast<loggers::level>(logLevel));
      }
      catch (boost::bad_lexical_cast&)
      {
         std::cerr << "Invalid log level: " << logLevel << "\n";
         return 1;
      }
   }

   return session.run();
}
