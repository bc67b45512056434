#ifndef INCLUDE_SIGID_CORE_ERRORS_HPP
#define INCLUDE_SIGID_CORE_ERRORS_HPP

#include <stdexcept>

namespace sigid::core
{

// Registry construction rejected its input: oversized mapping, out-of-range key or signature width.
class ConfigError final : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

// generate() was asked for a type id that is neither registered nor the untyped sentinel.
class InvalidTypeError final : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace sigid::core

#endif // INCLUDE_SIGID_CORE_ERRORS_HPP
