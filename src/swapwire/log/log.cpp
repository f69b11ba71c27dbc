#include <swapwire/log/log.hpp>

#include <chrono>
#include <string>

#include <quill/Backend.h>
#include <quill/backend/BackendOptions.h>
#include <quill/core/LogLevel.h>
#include <quill/core/QuillError.h>
#include <quill/sinks/ConsoleSink.h>

namespace swapwire::log {

std::error_code initialize( std::string_view level ) noexcept
{
  quill::BackendOptions options;
  options.sleep_duration = std::chrono::milliseconds{ 10 };
  options.error_notifier = []( const std::string& err ) noexcept
  {
    LOG_ERROR( swapwire::log::instance(), "Logging backend error: {}", err );
  };

  quill::Backend::start( options );

  return set_level( level );
}

logger* instance() noexcept
{
  static auto logger = frontend::create_or_get_logger(
    "swapwire",
    frontend::create_or_get_sink< quill::ConsoleSink >( "swapwire_console" ),
    quill::PatternFormatterOptions{ "%(time) %(log_level:<8) %(logger) %(short_source_location:<24) %(message)",
                                    "%H:%M:%S.%Qus",
                                    quill::Timezone::LocalTime } );
  return logger;
}

std::error_code set_level( std::string_view level ) noexcept
{
  quill::LogLevel parsed;

  try
  {
    parsed = quill::loglevel_from_string( std::string( level ) );
  }
  catch( const quill::QuillError& )
  {
    return std::make_error_code( std::errc::invalid_argument );
  }

  instance()->set_log_level( parsed );
  return {};
}

} // namespace swapwire::log
