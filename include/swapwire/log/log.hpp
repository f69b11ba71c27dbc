#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>

#include <swapwire/log/formatter.hpp>

namespace swapwire::log {

// Small initial queue that drops messages once full
struct frontend_options
{
  static constexpr quill::QueueType queue_type                    = quill::QueueType::UnboundedDropping;
  static constexpr std::size_t initial_queue_capacity             = 4'096;
  static constexpr std::uint32_t blocking_queue_retry_interval_ns = 800;
  static constexpr std::size_t unbounded_queue_max_capacity       = 16ull * 1'024u * 1'024u;
  static constexpr quill::HugePagesPolicy huge_pages_policy       = quill::HugePagesPolicy::Never;
};

using frontend = quill::FrontendImpl< frontend_options >;
using logger   = quill::LoggerImpl< frontend_options >;

/**
 * Starts the logging backend and applies the named level to the
 * "swapwire" logger. An unknown level leaves the default (info) in place
 * and is reported through the returned code.
 */
std::error_code initialize( std::string_view level = "info" ) noexcept;

logger* instance() noexcept;

/**
 * Sets the logger level from its name (trace_l1 ... critical).
 *
 * Returns std::errc::invalid_argument for an unknown name and leaves the
 * current level untouched.
 */
std::error_code set_level( std::string_view level ) noexcept;

} // namespace swapwire::log
