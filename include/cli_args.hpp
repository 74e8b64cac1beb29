/**
 * @file cli_args.hpp
 * @brief Command-line value parsing for ccota
 */

#ifndef CLI_ARGS_HPP
#define CLI_ARGS_HPP

#include <string>

/**
 * @brief Parse a decimal version or board number
 * @param text Argument as typed ("46", "010" -> 10)
 * @param value Output value (masked to 8 bits later, in the header)
 * @return false if the text is empty or not entirely decimal digits
 */
bool parseVersionNumber(const std::string& text, unsigned int& value);

#endif // CLI_ARGS_HPP
