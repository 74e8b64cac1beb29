/**
 * @file block_padding.hpp
 * @brief Zero padding to the cipher block boundary
 *
 * There is no unpad counterpart: decoded archives keep their trailing
 * zeros and zip readers locate content from the end-of-central-directory
 * record instead.
 */

#ifndef BLOCK_PADDING_HPP
#define BLOCK_PADDING_HPP

#include <vector>
#include <cstdint>
#include <cstddef>

#define CIPHER_BLOCK_SIZE   16      // AES block size

/**
 * @brief Pad in place with zero bytes to a multiple of block_size
 *
 * Already aligned input (including empty input) is left untouched.
 * @return Number of zero bytes appended
 */
size_t padToBlock(std::vector<uint8_t>& data, size_t block_size = CIPHER_BLOCK_SIZE);

/**
 * @brief Size after padding, without touching any data
 */
size_t paddedSize(size_t size, size_t block_size = CIPHER_BLOCK_SIZE);

#endif // BLOCK_PADDING_HPP
